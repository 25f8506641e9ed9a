#pragma once

#include "BadgeCipher.h"
#include "BadgeTypes.h"
#include <stddef.h>
#include <stdint.h>
#include <string>
#include <vector>

/// Every command the badge is known to understand, sent as ASCII name + argument bytes
enum class BadgeCommandId { LEDON, LEDOFF, MODE, SPEED, LIGHT, DATS, DATCP, ANIM, IMAG, PLAY, DELE, CHEC };

/// Values for the MODE command. Other numbers are passed through untouched.
enum class ScrollMode : uint8_t { STATIC = 1, LEFT = 3, RIGHT = 4, UP = 5, DOWN = 6, SNOW = 7 };

/// PLAY and DELE take a count byte and then this many image slots at most
#define BADGE_MAX_IMAGE_IDS 10

/// The ASCII name that goes on the wire
const char *badgeCommandName(BadgeCommandId cmd);

/**
 * Accepts "static", "left", "right", "up", "down", "snow" (any case) or a decimal 0-255.
 * @return false for anything else
 */
bool parseScrollMode(const std::string &text, uint8_t &mode);

/// Name of a known scroll mode or "custom"
const char *scrollModeName(uint8_t mode);

/**
 * Build the 16 byte plaintext block [len][name ++ args][zero pad].
 * @return PAYLOAD_TOO_LARGE if name + args is longer than 15 bytes, out is untouched then
 */
BadgeError buildCommandBlock(BadgeCommandId cmd, const uint8_t *args, size_t argLen, BadgeBlock &out);

/**
 * Turns commands into encrypted wire packets.
 *
 * Each builder validates its own argument shape and fails before any byte is produced.
 */
class CommandEncoder
{
  public:
    explicit CommandEncoder(const BadgeCipher &cipher) : cipher(cipher) {}

    /// Build and encrypt an arbitrary command
    BadgeError encode(BadgeCommandId cmd, const std::vector<uint8_t> &args, BadgeBlock &wire) const;

    BadgeError ledOn(BadgeBlock &wire) const { return encode(BadgeCommandId::LEDON, {}, wire); }
    BadgeError ledOff(BadgeBlock &wire) const { return encode(BadgeCommandId::LEDOFF, {}, wire); }
    BadgeError mode(uint8_t mode, BadgeBlock &wire) const { return encode(BadgeCommandId::MODE, {mode}, wire); }
    BadgeError speed(uint8_t speed, BadgeBlock &wire) const { return encode(BadgeCommandId::SPEED, {speed}, wire); }
    BadgeError light(uint8_t level, BadgeBlock &wire) const { return encode(BadgeCommandId::LIGHT, {level}, wire); }

    /// Announce an upload of totalLength bytes: [len hi][len lo][0][0]
    BadgeError dats(uint32_t totalLength, BadgeBlock &wire) const;

    BadgeError datcp(BadgeBlock &wire) const { return encode(BadgeCommandId::DATCP, {}, wire); }
    BadgeError anim(uint8_t id, BadgeBlock &wire) const { return encode(BadgeCommandId::ANIM, {id}, wire); }
    BadgeError imag(uint8_t id, BadgeBlock &wire) const { return encode(BadgeCommandId::IMAG, {id}, wire); }

    /// Play stored images in order, 1..10 ids
    BadgeError play(const std::vector<uint8_t> &ids, BadgeBlock &wire) const { return idList(BadgeCommandId::PLAY, ids, wire); }

    /// Delete stored images, 1..10 ids
    BadgeError dele(const std::vector<uint8_t> &ids, BadgeBlock &wire) const { return idList(BadgeCommandId::DELE, ids, wire); }

    BadgeError chec(BadgeBlock &wire) const { return encode(BadgeCommandId::CHEC, {}, wire); }

  private:
    BadgeError idList(BadgeCommandId cmd, const std::vector<uint8_t> &ids, BadgeBlock &wire) const;

    const BadgeCipher &cipher;
};
