#pragma once

#include "BadgeCipher.h"
#include "BadgeTypes.h"
#include <stddef.h>
#include <stdint.h>
#include <string>
#include <vector>

/// Bytes in a notification that still carries its link layer wrapper
#define BADGE_WRAPPED_FRAME_SIZE (BADGE_BLOCK_SIZE + 3)

enum class AckKind { NONE, DATSOK, DATCPOK };

/// What a notification turned out to say
struct BadgeResponse {
    /// NONE if the token is not one of the acknowledgements we know
    AckKind ack = AckKind::NONE;

    /// Decrypted text with padding removed
    std::string token;

    bool isAck(AckKind kind) const { return ack == kind; }
};

const char *ackKindName(AckKind kind);

/**
 * Decrypts and classifies badge notifications.
 *
 * Accepts the bare 16 byte ciphertext or [frameLength][type][ciphertext][trailer],
 * where frameLength must count the 18 bytes after it. type and trailer are ignored.
 */
class ResponseDecoder
{
  public:
    explicit ResponseDecoder(const BadgeCipher &cipher) : cipher(cipher) {}

    /// @return MALFORMED_FRAME if the frame can't be sliced
    BadgeError decode(const uint8_t *frame, size_t len, BadgeResponse &out) const;

    BadgeError decode(const std::vector<uint8_t> &frame, BadgeResponse &out) const
    {
        return decode(frame.data(), frame.size(), out);
    }

  private:
    const BadgeCipher &cipher;
};

/**
 * Recover the token from a decrypted block.
 *
 * A block that looks like [len 1..15][payload][zero pad] gives its payload, anything
 * else gives the whole block with trailing zeros stripped.
 */
std::string tokenFromPlaintext(const BadgeBlock &plain);
