#pragma once

#include <stddef.h>
#include <stdint.h>
#include <string>
#include <vector>

// Initialize testing environment.
void initializeTestEnvironment();

// Fill result from a hex string, zeroing len bytes first when len is given
void HexToBytes(uint8_t *result, const std::string hex, size_t len = 0);

std::vector<uint8_t> HexToVector(const std::string &hex);
