#pragma once

#include "BadgeTypes.h"
#include <stdint.h>
#include <string>
#include <vector>

/**
 * Read the editor's JSON export, {"width": W, "height": 12, "segments": N, "bytes": [...]},
 * into an upload payload.
 *
 * bytes must be non empty and every entry 0-255. When segments is present bytes must hold
 * exactly 9 * segments entries, when height is present it must be 12.
 * @return INVALID_FILE on any violation, payload is left empty then
 */
BadgeError loadImageJson(const std::string &jsonText, std::vector<uint8_t> &payload);

/// As loadImageJson, reading the text from path first
BadgeError loadImageFile(const std::string &path, std::vector<uint8_t> &payload);
