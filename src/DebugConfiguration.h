#pragma once

// -----------------------------------------------------------------------------
// DEBUG
// -----------------------------------------------------------------------------

#define LEDBADGE_LOG_LEVEL_DEBUG "DEBUG"
#define LEDBADGE_LOG_LEVEL_INFO "INFO "
#define LEDBADGE_LOG_LEVEL_WARN "WARN "
#define LEDBADGE_LOG_LEVEL_ERROR "ERROR"
#define LEDBADGE_LOG_LEVEL_CRIT "CRIT "
#define LEDBADGE_LOG_LEVEL_TRACE "TRACE"

#include "RedirectablePrint.h"

#define DEBUG_PORT (*console) // debug console

#if defined(DEBUG_PORT) && !defined(DEBUG_MUTE) && !LEDBADGE_EXCLUDE_LOGGING
#define LOG_DEBUG(...) DEBUG_PORT.log(LEDBADGE_LOG_LEVEL_DEBUG, __VA_ARGS__)
#define LOG_INFO(...) DEBUG_PORT.log(LEDBADGE_LOG_LEVEL_INFO, __VA_ARGS__)
#define LOG_WARN(...) DEBUG_PORT.log(LEDBADGE_LOG_LEVEL_WARN, __VA_ARGS__)
#define LOG_ERROR(...) DEBUG_PORT.log(LEDBADGE_LOG_LEVEL_ERROR, __VA_ARGS__)
#define LOG_CRIT(...) DEBUG_PORT.log(LEDBADGE_LOG_LEVEL_CRIT, __VA_ARGS__)
#define LOG_TRACE(...) DEBUG_PORT.log(LEDBADGE_LOG_LEVEL_TRACE, __VA_ARGS__)
#else
#define LOG_DEBUG(...)
#define LOG_INFO(...)
#define LOG_WARN(...)
#define LOG_ERROR(...)
#define LOG_CRIT(...)
#define LOG_TRACE(...)
#endif
