#include "BadgeCipher.h"
#include "AES.h"
#include "DebugConfiguration.h"
#include "badgeUtils.h"
#include <algorithm>
#include <cctype>
#include <string.h>

static const uint8_t idealLEDKey[16] = {0x34, 0x52, 0x2A, 0x5B, 0x7A, 0x6E, 0x49, 0x2C,
                                        0x08, 0x09, 0x0A, 0x9D, 0x8D, 0x2A, 0x23, 0xF8};

static const uint8_t shiningMasksKey[16] = {0x32, 0x67, 0x2f, 0x79, 0x74, 0xad, 0x43, 0x45,
                                            0x1d, 0x9c, 0x6c, 0x89, 0x4a, 0x0e, 0x87, 0x64};

BadgeKey BadgeKey::idealLED()
{
    BadgeKey k;
    memcpy(k.bytes, idealLEDKey, sizeof(k.bytes));
    return k;
}

BadgeKey BadgeKey::shiningMasks()
{
    BadgeKey k;
    memcpy(k.bytes, shiningMasksKey, sizeof(k.bytes));
    return k;
}

bool BadgeKey::parse(const std::string &text, BadgeKey &out)
{
    std::string name = text;
    std::transform(name.begin(), name.end(), name.begin(), [](unsigned char c) { return std::tolower(c); });
    if (name == "idealled") {
        out = idealLED();
        return true;
    }
    if (name == "shiningmasks") {
        out = shiningMasks();
        return true;
    }

    BadgeKey k;
    if (hexToBytes(text, k.bytes, sizeof(k.bytes)) != (int)sizeof(k.bytes)) {
        LOG_ERROR("Badge key must be a preset name or 32 hex digits");
        return false;
    }
    out = k;
    return true;
}

BadgeError BadgeCipher::encrypt(const uint8_t *in, size_t len, BadgeBlock &out) const
{
    if (len != BADGE_BLOCK_SIZE) {
        LOG_ERROR("Refusing to encrypt a %u byte block", (unsigned)len);
        return BadgeError::INVALID_BLOCK_LENGTH;
    }

    AES128 aes;
    aes.setKey(key.bytes, sizeof(key.bytes));
    aes.encryptBlock(out.data(), in);
    aes.clear();
    return BadgeError::NONE;
}

BadgeError BadgeCipher::decrypt(const uint8_t *in, size_t len, BadgeBlock &out) const
{
    if (len != BADGE_BLOCK_SIZE) {
        LOG_ERROR("Refusing to decrypt a %u byte block", (unsigned)len);
        return BadgeError::INVALID_BLOCK_LENGTH;
    }

    AES128 aes;
    aes.setKey(key.bytes, sizeof(key.bytes));
    aes.decryptBlock(out.data(), in);
    aes.clear();
    return BadgeError::NONE;
}
