#include "ImageChunker.h"
#include "DebugConfiguration.h"
#include <algorithm>

BadgeBlock ImageChunk::plaintext() const
{
    BadgeBlock block = {};
    block[0] = (uint8_t)data.size();
    std::copy(data.begin(), data.end(), block.begin() + 1);
    return block;
}

std::vector<ImageChunk> splitPayload(const std::vector<uint8_t> &payload)
{
    std::vector<ImageChunk> chunks;
    for (size_t off = 0; off < payload.size(); off += BADGE_MAX_PAYLOAD) {
        size_t n = std::min((size_t)BADGE_MAX_PAYLOAD, payload.size() - off);
        ImageChunk c;
        c.index = chunks.size();
        c.data.assign(payload.begin() + off, payload.begin() + off + n);
        chunks.push_back(c);
    }
    if (!chunks.empty())
        chunks.back().last = true;
    return chunks;
}

BadgeError encryptChunks(const BadgeCipher &cipher, const std::vector<uint8_t> &payload, std::vector<BadgeBlock> &packets)
{
    packets.clear();
    for (const ImageChunk &c : splitPayload(payload)) {
        BadgeBlock wire;
        BadgeError err = cipher.encrypt(c.plaintext(), wire);
        if (err != BadgeError::NONE) {
            packets.clear();
            return err;
        }
        packets.push_back(wire);
    }
    LOG_DEBUG("Split %u bytes into %u chunks", (unsigned)payload.size(), (unsigned)packets.size());
    return BadgeError::NONE;
}
