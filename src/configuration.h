#pragma once

#include <stdint.h>

// -----------------------------------------------------------------------------
// Version
// -----------------------------------------------------------------------------

// If app version is not specified we assume we are not being invoked by the build script
#ifndef APP_VERSION
#define APP_VERSION 0.1.0
#endif

// -----------------------------------------------------------------------------
// Configuration
// -----------------------------------------------------------------------------

/// Convert a preprocessor name into a quoted string
#define xstr(s) ystr(s)
#define ystr(s) #s

/// Convert a preprocessor name into a quoted string and if that string is empty use "unset"
#define optstr(s) (xstr(s)[0] ? xstr(s) : "unset")

// -----------------------------------------------------------------------------
// Badge protocol defaults
// -----------------------------------------------------------------------------

/// How long we wait for DATSOK / DATCPOK before giving up on an upload
#ifndef LEDBADGE_DEFAULT_ACK_TIMEOUT_MS
#define LEDBADGE_DEFAULT_ACK_TIMEOUT_MS 3000
#endif

/// Display settings applied after an upload when neither the config file nor the command line say otherwise
#define LEDBADGE_DEFAULT_MODE 3 // scroll left
#define LEDBADGE_DEFAULT_SPEED 50
#define LEDBADGE_DEFAULT_BRIGHTNESS 128

/// Seconds to listen for advertisements when scanning
#define LEDBADGE_DEFAULT_SCAN_SECS 10

/// Give the badge a moment between image chunks, it has a tiny receive buffer
#ifndef LEDBADGE_CHUNK_GAP_MS
#define LEDBADGE_CHUNK_GAP_MS 10
#endif

// -----------------------------------------------------------------------------
// Feature Excludes
// -----------------------------------------------------------------------------

#ifndef LEDBADGE_EXCLUDE_BLUEZ
#define LEDBADGE_EXCLUDE_BLUEZ 0
#endif

#include "DebugConfiguration.h"
