#include "DebugConfiguration.h"
#include "badge/BadgeController.h"
#include "badge/DefaultFont.h"
#include "badge/ImageFile.h"
#include "configuration.h"
#include "platform/linux/BluezTransport.h"
#include "platform/linux/LinuxGlue.h"
#include <iostream>
#include <signal.h>
#include <stdlib.h>

static BadgeController *activeController;

static void onSignal(int)
{
    if (activeController)
        activeController->cancel();
}

/// Image slot numbers on the command line, 0-255 each
static bool parseIds(const std::vector<std::string> &args, std::vector<uint8_t> &ids)
{
    for (auto &a : args) {
        char *end = nullptr;
        long v = strtol(a.c_str(), &end, 10);
        if (a.empty() || *end != '\0' || v < 0 || v > 255) {
            LOG_ERROR("'%s' is not an image id", a.c_str());
            return false;
        }
        ids.push_back((uint8_t)v);
    }
    return true;
}

/// All remaining arguments joined by spaces, so quoting is optional
static std::string joinArgs(const std::vector<std::string> &args)
{
    std::string s;
    for (size_t i = 0; i < args.size(); i++) {
        if (i)
            s += ' ';
        s += args[i];
    }
    return s;
}

static bool needArgs(const std::string &cmd, size_t have, size_t want)
{
    if (have >= want)
        return true;
    LOG_ERROR("'%s' needs an argument", cmd.c_str());
    return false;
}

static bool isBadgeCommand(const std::string &cmd)
{
    static const char *commands[] = {"on",   "off",  "mode", "speed", "brightness", "text",
                                      "image", "anim", "show", "play",  "delete",     "check"};
    for (const char *c : commands)
        if (cmd == c)
            return true;
    return false;
}

static int exitCode(BadgeError err)
{
    if (err == BadgeError::NONE)
        return EXIT_SUCCESS;
    LOG_ERROR("%s", badgeErrorName(err));
    return EXIT_FAILURE;
}

static int runScan()
{
#if !LEDBADGE_EXCLUDE_BLUEZ
    std::vector<BadgeAdvert> found;
    if (!scanForBadges(ledbadge_config.scan_seconds, ledbadge_config.scan_name_filter, found))
        return EXIT_FAILURE;
    for (auto &adv : found)
        printf("%s %-6s %4d %s\n", adv.address.c_str(), adv.randomAddress ? "random" : "public", adv.rssi, adv.name.c_str());
    return EXIT_SUCCESS;
#else
    LOG_ERROR("Built without Bluetooth support");
    return EXIT_FAILURE;
#endif
}

static int runController(BadgeController &badge, const std::string &cmd, const std::vector<std::string> &args)
{
    const DisplaySettings &display = ledbadge_config.display;

    if (cmd == "on")
        return exitCode(badge.powerOn());
    if (cmd == "off")
        return exitCode(badge.powerOff());
    if (cmd == "check") {
        std::string token;
        BadgeError err = badge.checkImages(token);
        if (err == BadgeError::NONE)
            printf("%s\n", token.c_str());
        return exitCode(err);
    }

    if (cmd == "mode") {
        uint8_t mode;
        if (!needArgs(cmd, args.size(), 1) || !parseScrollMode(args[0], mode)) {
            LOG_ERROR("Scroll mode must be static, left, right, up, down, snow or a number");
            return EXIT_FAILURE;
        }
        return exitCode(badge.setMode(mode));
    }

    if (cmd == "speed" || cmd == "brightness" || cmd == "anim" || cmd == "show") {
        std::vector<uint8_t> v;
        if (!needArgs(cmd, args.size(), 1) || !parseIds({args[0]}, v))
            return EXIT_FAILURE;
        if (cmd == "speed")
            return exitCode(badge.setSpeed(v[0]));
        if (cmd == "brightness")
            return exitCode(badge.setBrightness(v[0]));
        if (cmd == "anim")
            return exitCode(badge.playAnimation(v[0]));
        return exitCode(badge.showImage(v[0]));
    }

    if (cmd == "play" || cmd == "delete") {
        std::vector<uint8_t> ids;
        if (!needArgs(cmd, args.size(), 1) || !parseIds(args, ids))
            return EXIT_FAILURE;
        return exitCode(cmd == "play" ? badge.playSequence(ids) : badge.deleteImages(ids));
    }

    if (cmd == "text") {
        if (!needArgs(cmd, args.size(), 1))
            return EXIT_FAILURE;
        return exitCode(badge.sendText(joinArgs(args), display));
    }

    if (cmd == "image") {
        std::vector<uint8_t> payload;
        if (!needArgs(cmd, args.size(), 1))
            return EXIT_FAILURE;
        BadgeError err = loadImageFile(args[0], payload);
        if (err != BadgeError::NONE)
            return exitCode(err);
        return exitCode(badge.uploadAndDisplay(payload, display));
    }

    LOG_ERROR("Unknown command '%s', see --help", cmd.c_str());
    return EXIT_FAILURE;
}

int main(int argc, char **argv)
{
    // Force stdout to be line buffered
    static char stdoutBuffer[512];
    setvbuf(stdout, stdoutBuffer, _IOLBF, sizeof(stdoutBuffer));

    consoleInit();
    if (!parseArguments(argc, argv) || !linuxSetup())
        return EXIT_FAILURE;

    if (cli_options.yamlOnly) {
        std::cout << ledbadge_config.emit_yaml() << std::endl;
        return EXIT_SUCCESS;
    }

    LOG_DEBUG("ledbadge %s", optstr(APP_VERSION));

    const std::string &cmd = cli_options.command;
    if (cmd == "scan")
        return runScan();

    Font font = defaultFont();
    if (ledbadge_config.font_file != "" && loadFontFile(ledbadge_config.font_file, font) != BadgeError::NONE)
        return EXIT_FAILURE;

    if (cmd == "render") {
        std::vector<GlyphSegment> segments;
        uint32_t bad = 0;
        if (renderText(joinArgs(cli_options.args), font, segments, &bad) != BadgeError::NONE) {
            LOG_ERROR("No glyph for U+%04X", (unsigned)bad);
            return EXIT_FAILURE;
        }
        fputs(renderAsciiArt(flattenSegments(segments)).c_str(), stdout);
        return EXIT_SUCCESS;
    }

    if (!isBadgeCommand(cmd)) {
        LOG_ERROR("Unknown command '%s', see --help", cmd.c_str());
        return EXIT_FAILURE;
    }

#if !LEDBADGE_EXCLUDE_BLUEZ
    if (ledbadge_config.address == "") {
        LOG_ERROR("No badge address, use --address or Badge.Address in config.yaml (try 'scan')");
        return EXIT_FAILURE;
    }

    BluezTransport transport;
    if (!transport.connect(ledbadge_config.address, ledbadge_config.address_type == address_random,
                           ledbadge_config.ack_timeout_ms))
        return EXIT_FAILURE;

    BadgeController badge(ledbadge_config.key, transport, font);
    badge.setAckTimeout(ledbadge_config.ack_timeout_ms);

    activeController = &badge;
    signal(SIGINT, onSignal);
    signal(SIGTERM, onSignal);

    int rc = runController(badge, cmd, cli_options.args);
    activeController = nullptr;
    if (rc != EXIT_SUCCESS && !badge.getLastFailure().detail.empty())
        LOG_ERROR("%s", badge.getLastFailure().detail.c_str());
    return rc;
#else
    LOG_ERROR("Built without Bluetooth support");
    return EXIT_FAILURE;
#endif
}
