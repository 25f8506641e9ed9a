#pragma once
#include "DebugConfiguration.h"
#include <stddef.h>
#include <stdint.h>
#include <string>

void printBytes(const char *label, const uint8_t *p, size_t numbytes);

// is the memory region filled with a single character?
bool memfll(const uint8_t *mem, uint8_t find, size_t numbytes);

/**
 * Parse a string of hex digits (whitespace and ':' separators allowed) into dest.
 * @return the number of bytes written, or -1 if the string is not valid hex or does not fit
 */
int hexToBytes(const std::string &hex, uint8_t *dest, size_t destLen);

/// Lower case hex rendering of a buffer, no separators
std::string bytesToHex(const uint8_t *p, size_t numbytes);

/// Milliseconds since some arbitrary point, never goes backwards
uint32_t monotonicMillis();

void delay(uint32_t msec);
