#pragma once

#include "BadgeTypes.h"
#include <stddef.h>
#include <stdint.h>
#include <string>

/**
 * The 16 byte AES-128 key a badge family uses for its command channel.
 *
 * Immutable once built, pass it by value to whoever needs to encrypt.
 */
struct BadgeKey {
    uint8_t bytes[16];

    /// Key used by the idealLED style badges (the default)
    static BadgeKey idealLED();

    /// Key used by the "Shining Masks" family
    static BadgeKey shiningMasks();

    /**
     * Accepts a preset name ("idealled", "shiningmasks", any case) or 32 hex digits.
     * @return false if the text is neither
     */
    static bool parse(const std::string &text, BadgeKey &out);
};

/**
 * AES-128-ECB over single 16 byte blocks. No chaining, no IV.
 *
 * Stateless apart from the key, so one instance can be shared by any number of encoders.
 */
class BadgeCipher
{
  public:
    explicit BadgeCipher(const BadgeKey &key) : key(key) {}

    /**
     * Encrypt exactly one block.
     * @return INVALID_BLOCK_LENGTH if len != 16, out is untouched in that case
     */
    BadgeError encrypt(const uint8_t *in, size_t len, BadgeBlock &out) const;

    BadgeError decrypt(const uint8_t *in, size_t len, BadgeBlock &out) const;

    BadgeError encrypt(const BadgeBlock &in, BadgeBlock &out) const { return encrypt(in.data(), in.size(), out); }
    BadgeError decrypt(const BadgeBlock &in, BadgeBlock &out) const { return decrypt(in.data(), in.size(), out); }

    const BadgeKey &getKey() const { return key; }

  private:
    const BadgeKey key;
};
