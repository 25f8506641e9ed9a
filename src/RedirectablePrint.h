#pragma once

#include "concurrency/Lock.h"
#include <fstream>
#include <stdarg.h>
#include <stdint.h>
#include <stdio.h>
#include <string>

enum ledbadge_log_level { level_error, level_warn, level_info, level_debug, level_trace };

/**
 * A log sink that can be switched to squirt its bytes to a different stdio stream.
 * This class is mostly useful to allow debug printing to be redirected away from stdout
 * when stdout is being used for command output (scan results, rendered bitmaps).
 */
class RedirectablePrint
{
    FILE *dest;

    ledbadge_log_level logLevel = level_info;

    /// When set we skip the ANSI colour escapes
    bool asciiLogs = false;

    /// Optional file that receives a copy of every TRACE record (one per wire packet)
    std::ofstream traceFile;

    concurrency::Lock printLock;

  public:
    explicit RedirectablePrint(FILE *_dest) : dest(_dest) {}

    void setLogLevel(ledbadge_log_level level) { logLevel = level; }
    ledbadge_log_level getLogLevel() const { return logLevel; }

    void setAsciiLogs(bool ascii) { asciiLogs = ascii; }

    /// Start copying TRACE records to the named file, returns false if it could not be opened
    bool openTraceFile(const std::string &filename);

    /**
     * Debug logging print message
     *
     * A newline is appended to the format, each call produces exactly one log line.
     */
    void log(const char *logLevel, const char *format, ...) __attribute__((format(printf, 3, 4)));

    /** like printf but va_list based */
    size_t vprintf(const char *logLevel, const char *format, va_list arg);

    void hexDump(const char *logLevel, const uint8_t *buf, uint16_t len);

  protected:
    /// Subclasses can override if they need to change how we format over the console
    virtual void log_to_console(const char *logLevel, const char *format, va_list arg);

  private:
    void log_to_trace(const char *format, va_list arg);

    /// Is this level enabled by the current logLevel setting
    bool isEnabled(const char *logLevel) const;
};

extern RedirectablePrint *console;

/// Create the process wide console (idempotent)
void consoleInit();

