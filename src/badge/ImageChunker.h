#pragma once

#include "BadgeCipher.h"
#include "BadgeTypes.h"
#include <stddef.h>
#include <stdint.h>
#include <vector>

/// One piece of an upload, at most 15 raw bytes
struct ImageChunk {
    size_t index = 0;
    std::vector<uint8_t> data;

    /// Only the last chunk may be shorter than 15 bytes
    bool last = false;

    /// [len][data][zero pad]
    BadgeBlock plaintext() const;
};

/**
 * Split payload into ceil(len/15) chunks, in order. An empty payload gives no chunks.
 */
std::vector<ImageChunk> splitPayload(const std::vector<uint8_t> &payload);

/**
 * Split and encrypt in one go, producing the packets for the IMAGE_UPLOAD characteristic.
 */
BadgeError encryptChunks(const BadgeCipher &cipher, const std::vector<uint8_t> &payload, std::vector<BadgeBlock> &packets);
