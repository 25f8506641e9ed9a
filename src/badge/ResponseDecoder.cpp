#include "ResponseDecoder.h"
#include "DebugConfiguration.h"
#include "badgeUtils.h"
#include <algorithm>

const char *ackKindName(AckKind kind)
{
    switch (kind) {
    case AckKind::DATSOK:
        return "DATSOK";
    case AckKind::DATCPOK:
        return "DATCPOK";
    default:
        return "NONE";
    }
}

std::string tokenFromPlaintext(const BadgeBlock &plain)
{
    uint8_t len = plain[0];
    if (len >= 1 && len <= BADGE_MAX_PAYLOAD && memfll(plain.data() + 1 + len, 0, BADGE_BLOCK_SIZE - 1 - len))
        return std::string((const char *)&plain[1], len);

    size_t end = plain.size();
    while (end > 0 && plain[end - 1] == 0)
        end--;
    return std::string((const char *)plain.data(), end);
}

BadgeError ResponseDecoder::decode(const uint8_t *frame, size_t len, BadgeResponse &out) const
{
    const uint8_t *ciphertext;
    if (len == BADGE_BLOCK_SIZE) {
        ciphertext = frame;
    } else if (len == BADGE_WRAPPED_FRAME_SIZE) {
        if (frame[0] != BADGE_WRAPPED_FRAME_SIZE - 1) {
            LOG_WARN("Notification says it is %u bytes but carries %u", frame[0], (unsigned)(len - 1));
            return BadgeError::MALFORMED_FRAME;
        }
        ciphertext = frame + 2;
    } else {
        LOG_WARN("Notification of %u bytes is not a badge frame", (unsigned)len);
        console->hexDump(LEDBADGE_LOG_LEVEL_DEBUG, frame, (uint16_t)std::min<size_t>(len, 0xFFFF));
        return BadgeError::MALFORMED_FRAME;
    }

    BadgeBlock plain;
    BadgeError err = cipher.decrypt(ciphertext, BADGE_BLOCK_SIZE, plain);
    if (err != BadgeError::NONE)
        return err;

    out.token = tokenFromPlaintext(plain);
    if (out.token == "DATSOK")
        out.ack = AckKind::DATSOK;
    else if (out.token == "DATCPOK")
        out.ack = AckKind::DATCPOK;
    else
        out.ack = AckKind::NONE;

    LOG_DEBUG("Badge said '%s'", out.token.c_str());
    return BadgeError::NONE;
}
