#include "badgeUtils.h"
#include <cctype>
#include <errno.h>
#include <string.h>
#include <time.h>

void printBytes(const char *label, const uint8_t *p, size_t numbytes)
{
    int labelSize = strlen(label);
    char *messageBuffer = new char[labelSize + (numbytes * 3) + 2];
    strncpy(messageBuffer, label, labelSize);
    for (size_t i = 0; i < numbytes; i++)
        snprintf(messageBuffer + labelSize + i * 3, 4, " %02x", p[i]);
    messageBuffer[labelSize + numbytes * 3] = '\0';
    LOG_DEBUG("%s", messageBuffer);
    delete[] messageBuffer;
}

bool memfll(const uint8_t *mem, uint8_t find, size_t numbytes)
{
    for (size_t i = 0; i < numbytes; i++) {
        if (mem[i] != find)
            return false;
    }
    return true;
}

static int hexNibble(char c)
{
    if (c >= '0' && c <= '9')
        return c - '0';
    if (c >= 'a' && c <= 'f')
        return c - 'a' + 10;
    if (c >= 'A' && c <= 'F')
        return c - 'A' + 10;
    return -1;
}

int hexToBytes(const std::string &hex, uint8_t *dest, size_t destLen)
{
    size_t count = 0;
    int high = -1;
    for (char c : hex) {
        if (std::isspace(static_cast<unsigned char>(c)) || c == ':')
            continue;
        int nibble = hexNibble(c);
        if (nibble < 0)
            return -1;
        if (high < 0) {
            high = nibble;
            continue;
        }
        if (count >= destLen)
            return -1;
        dest[count++] = (uint8_t)((high << 4) | nibble);
        high = -1;
    }
    if (high >= 0)
        return -1; // odd number of digits
    return (int)count;
}

std::string bytesToHex(const uint8_t *p, size_t numbytes)
{
    static const char alphabet[] = "0123456789abcdef";
    std::string out;
    out.reserve(numbytes * 2);
    for (size_t i = 0; i < numbytes; i++) {
        out += alphabet[p[i] >> 4];
        out += alphabet[p[i] & 0x0F];
    }
    return out;
}

uint32_t monotonicMillis()
{
    struct timespec ts;
    clock_gettime(CLOCK_MONOTONIC, &ts);
    return (uint32_t)(ts.tv_sec * 1000ULL + ts.tv_nsec / 1000000);
}

void delay(uint32_t msec)
{
    struct timespec ts;
    ts.tv_sec = msec / 1000;
    ts.tv_nsec = (long)(msec % 1000) * 1000000L;
    while (nanosleep(&ts, &ts) == -1 && errno == EINTR)
        ;
}
