#include "BadgeCommand.h"
#include "DebugConfiguration.h"
#include "badgeUtils.h"
#include <algorithm>
#include <cctype>
#include <stdlib.h>
#include <string.h>

const char *badgeCommandName(BadgeCommandId cmd)
{
    switch (cmd) {
    case BadgeCommandId::LEDON:
        return "LEDON";
    case BadgeCommandId::LEDOFF:
        return "LEDOFF";
    case BadgeCommandId::MODE:
        return "MODE";
    case BadgeCommandId::SPEED:
        return "SPEED";
    case BadgeCommandId::LIGHT:
        return "LIGHT";
    case BadgeCommandId::DATS:
        return "DATS";
    case BadgeCommandId::DATCP:
        return "DATCP";
    case BadgeCommandId::ANIM:
        return "ANIM";
    case BadgeCommandId::IMAG:
        return "IMAG";
    case BadgeCommandId::PLAY:
        return "PLAY";
    case BadgeCommandId::DELE:
        return "DELE";
    case BadgeCommandId::CHEC:
        return "CHEC";
    }
    return "?";
}

static const struct {
    const char *name;
    ScrollMode mode;
} scrollModes[] = {
    {"static", ScrollMode::STATIC}, {"left", ScrollMode::LEFT}, {"right", ScrollMode::RIGHT},
    {"up", ScrollMode::UP},         {"down", ScrollMode::DOWN}, {"snow", ScrollMode::SNOW},
};

bool parseScrollMode(const std::string &text, uint8_t &mode)
{
    std::string lower = text;
    std::transform(lower.begin(), lower.end(), lower.begin(), [](unsigned char c) { return std::tolower(c); });
    for (auto &m : scrollModes) {
        if (lower == m.name) {
            mode = static_cast<uint8_t>(m.mode);
            return true;
        }
    }

    auto isDigit = [](unsigned char c) { return std::isdigit(c) != 0; };
    if (lower.empty() || lower.size() > 3 || !std::all_of(lower.begin(), lower.end(), isDigit))
        return false;
    int v = atoi(lower.c_str());
    if (v > 255)
        return false;
    mode = (uint8_t)v;
    return true;
}

const char *scrollModeName(uint8_t mode)
{
    for (auto &m : scrollModes)
        if (static_cast<uint8_t>(m.mode) == mode)
            return m.name;
    return "custom";
}

BadgeError buildCommandBlock(BadgeCommandId cmd, const uint8_t *args, size_t argLen, BadgeBlock &out)
{
    const char *name = badgeCommandName(cmd);
    size_t nameLen = strlen(name);
    if (nameLen + argLen > BADGE_MAX_PAYLOAD) {
        LOG_ERROR("%s with %u argument bytes does not fit in one block", name, (unsigned)argLen);
        return BadgeError::PAYLOAD_TOO_LARGE;
    }

    out.fill(0);
    out[0] = (uint8_t)(nameLen + argLen);
    memcpy(&out[1], name, nameLen);
    if (argLen)
        memcpy(&out[1 + nameLen], args, argLen);
    return BadgeError::NONE;
}

BadgeError CommandEncoder::encode(BadgeCommandId cmd, const std::vector<uint8_t> &args, BadgeBlock &wire) const
{
    BadgeBlock plain;
    BadgeError err = buildCommandBlock(cmd, args.data(), args.size(), plain);
    if (err != BadgeError::NONE)
        return err;

    if (console && console->getLogLevel() >= level_debug)
        printBytes(badgeCommandName(cmd), plain.data(), plain.size());

    return cipher.encrypt(plain, wire);
}

BadgeError CommandEncoder::dats(uint32_t totalLength, BadgeBlock &wire) const
{
    if (totalLength > 0xFFFF) {
        LOG_ERROR("Upload of %u bytes is too large for DATS", (unsigned)totalLength);
        return BadgeError::PAYLOAD_TOO_LARGE;
    }
    // Last two bytes are reserved, always zero
    return encode(BadgeCommandId::DATS, {(uint8_t)(totalLength >> 8), (uint8_t)(totalLength & 0xFF), 0, 0}, wire);
}

BadgeError CommandEncoder::idList(BadgeCommandId cmd, const std::vector<uint8_t> &ids, BadgeBlock &wire) const
{
    if (ids.empty()) {
        LOG_ERROR("%s needs at least one image id", badgeCommandName(cmd));
        return BadgeError::INVALID_ARGUMENT;
    }
    if (ids.size() > BADGE_MAX_IMAGE_IDS) {
        LOG_ERROR("%s takes at most %d image ids", badgeCommandName(cmd), BADGE_MAX_IMAGE_IDS);
        return BadgeError::PAYLOAD_TOO_LARGE;
    }

    std::vector<uint8_t> args;
    args.push_back((uint8_t)ids.size());
    args.insert(args.end(), ids.begin(), ids.end());
    return encode(cmd, args, wire);
}
