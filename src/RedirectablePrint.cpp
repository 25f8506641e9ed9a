#include "RedirectablePrint.h"
#include "DebugConfiguration.h"
#include "badgeUtils.h"
#include "concurrency/LockGuard.h"
#include <cctype>
#include <cstring>
#include <memory>
#include <time.h>

#define SEC_PER_DAY 86400
#define SEC_PER_HOUR 3600
#define SEC_PER_MIN 60

RedirectablePrint *console;

void consoleInit()
{
    if (!console)
        console = new RedirectablePrint(stderr); // stdout is reserved for command output
}

bool RedirectablePrint::openTraceFile(const std::string &filename)
{
    if (traceFile.is_open())
        traceFile.close();
    traceFile.open(filename, std::ios::out | std::ios::app);
    return traceFile.is_open();
}

bool RedirectablePrint::isEnabled(const char *level) const
{
    if (strcmp(level, LEDBADGE_LOG_LEVEL_TRACE) == 0)
        return logLevel >= level_trace;
    if (strcmp(level, LEDBADGE_LOG_LEVEL_DEBUG) == 0)
        return logLevel >= level_debug;
    if (strcmp(level, LEDBADGE_LOG_LEVEL_INFO) == 0)
        return logLevel >= level_info;
    if (strcmp(level, LEDBADGE_LOG_LEVEL_WARN) == 0)
        return logLevel >= level_warn;
    return true; // errors and criticals always go out
}

size_t RedirectablePrint::vprintf(const char *logLevel, const char *format, va_list arg)
{
    va_list copy;
    static char printBuf[512];

    va_copy(copy, arg);
    size_t len = vsnprintf(printBuf, sizeof(printBuf), format, copy);
    va_end(copy);

    // If the resulting string is longer than sizeof(printBuf)-1 characters, the remaining characters are still counted for the
    // return value

    if (len > sizeof(printBuf) - 1) {
        len = sizeof(printBuf) - 1;
        printBuf[sizeof(printBuf) - 2] = '\n';
    }
    for (size_t f = 0; f < len; f++) {
        if (!std::isprint(static_cast<unsigned char>(printBuf[f])) && printBuf[f] != '\n')
            printBuf[f] = '#';
    }
    bool color = !asciiLogs;
    if (color && logLevel != nullptr) {
        if (strcmp(logLevel, LEDBADGE_LOG_LEVEL_DEBUG) == 0)
            fputs("\u001b[34m", dest);
        if (strcmp(logLevel, LEDBADGE_LOG_LEVEL_INFO) == 0)
            fputs("\u001b[32m", dest);
        if (strcmp(logLevel, LEDBADGE_LOG_LEVEL_WARN) == 0)
            fputs("\u001b[33m", dest);
        if (strcmp(logLevel, LEDBADGE_LOG_LEVEL_ERROR) == 0)
            fputs("\u001b[31m", dest);
    }
    len = fwrite(printBuf, 1, len, dest);
    if (color && logLevel != nullptr) {
        fputs("\u001b[0m", dest);
    }
    fflush(dest);
    return len;
}

void RedirectablePrint::log_to_console(const char *logLevel, const char *format, va_list arg)
{
    bool color = !asciiLogs;

    // include the header
    if (color) {
        if (strcmp(logLevel, LEDBADGE_LOG_LEVEL_DEBUG) == 0)
            fputs("\u001b[34m", dest);
        if (strcmp(logLevel, LEDBADGE_LOG_LEVEL_INFO) == 0)
            fputs("\u001b[32m", dest);
        if (strcmp(logLevel, LEDBADGE_LOG_LEVEL_WARN) == 0)
            fputs("\u001b[33m", dest);
        if (strcmp(logLevel, LEDBADGE_LOG_LEVEL_ERROR) == 0)
            fputs("\u001b[31m", dest);
        if (strcmp(logLevel, LEDBADGE_LOG_LEVEL_TRACE) == 0)
            fputs("\u001b[35m", dest);
    }

    time_t now = time(NULL);
    struct tm local;
    localtime_r(&now, &local);
    long hms = (local.tm_hour * SEC_PER_HOUR + local.tm_min * SEC_PER_MIN + local.tm_sec) % SEC_PER_DAY;

    // Tear apart hms into h:m:s
    int hour = hms / SEC_PER_HOUR;
    int min = (hms % SEC_PER_HOUR) / SEC_PER_MIN;
    int sec = (hms % SEC_PER_HOUR) % SEC_PER_MIN;

    fprintf(dest, "%s ", logLevel);
    if (color) {
        fputs("\u001b[0m", dest);
    }
    fprintf(dest, "| %02d:%02d:%02d %u ", hour, min, sec, monotonicMillis() / 1000);

    vprintf(logLevel, format, arg);
}

void RedirectablePrint::log_to_trace(const char *format, va_list arg)
{
    if (!traceFile.is_open())
        return;

    char line[512];
    vsnprintf(line, sizeof(line), format, arg);
    traceFile << monotonicMillis() << " " << line;
    traceFile.flush();
}

void RedirectablePrint::log(const char *logLevel, const char *format, ...)
{
    // append \n to format
    size_t len = strlen(format);
    std::unique_ptr<char[]> newFormat(new char[len + 2]);
    strcpy(newFormat.get(), format);
    newFormat[len] = '\n';
    newFormat[len + 1] = '\0';

    concurrency::LockGuard guard(&printLock);

    // level trace is special, the trace file gets every record even when the console is quieter
    if (strcmp(logLevel, LEDBADGE_LOG_LEVEL_TRACE) == 0) {
        va_list arg;
        va_start(arg, format);
        log_to_trace(newFormat.get(), arg);
        va_end(arg);
    }

    if (!isEnabled(logLevel))
        return;

    va_list arg;
    va_start(arg, format);
    log_to_console(logLevel, newFormat.get(), arg);
    va_end(arg);
}

void RedirectablePrint::hexDump(const char *logLevel, const uint8_t *buf, uint16_t len)
{
    const char alphabet[17] = "0123456789abcdef";
    log(logLevel, "    +------------------------------------------------+ +----------------+");
    log(logLevel, "    |.0 .1 .2 .3 .4 .5 .6 .7 .8 .9 .a .b .c .d .e .f | |      ASCII     |");
    for (uint16_t i = 0; i < len; i += 16) {
        if (i % 128 == 0)
            log(logLevel, "    +------------------------------------------------+ +----------------+");
        char s[] = "|                                                | |                |";
        uint8_t ix = 1, iy = 52;
        for (uint8_t j = 0; j < 16; j++) {
            if (i + j < len) {
                uint8_t c = buf[i + j];
                s[ix++] = alphabet[(c >> 4) & 0x0F];
                s[ix++] = alphabet[c & 0x0F];
                ix++;
                if (c > 31 && c < 128)
                    s[iy++] = c;
                else
                    s[iy++] = '.';
            }
        }
        uint8_t index = i / 16;
        log(logLevel, "%03x.%s", index, s);
    }
    log(logLevel, "    +------------------------------------------------+ +----------------+");
}
