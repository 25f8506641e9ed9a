#include "LinuxGlue.h"
#include "DebugConfiguration.h"
#include "badgeUtils.h"
#include <argp.h>
#include <iostream>
#include <stdlib.h>

ledbadge_config_struct ledbadge_config;
ledbadge_cli_options cli_options;

const char *argp_program_version = optstr(APP_VERSION);

static error_t parse_opt(int key, char *arg, struct argp_state *state)
{
    switch (key) {
    case 'c':
        cli_options.configPath = arg;
        break;
    case 'a':
        cli_options.address = arg;
        break;
    case 'r':
        cli_options.randomAddress = true;
        break;
    case 'k':
        cli_options.key = arg;
        break;
    case 't':
        cli_options.timeout = arg;
        break;
    case 'm':
        cli_options.mode = arg;
        break;
    case 's':
        cli_options.speed = arg;
        break;
    case 'b':
        cli_options.brightness = arg;
        break;
    case 'f':
        cli_options.fontFile = arg;
        break;
    case 'v':
        cli_options.verbose = true;
        break;
    case 'y':
        cli_options.yamlOnly = true;
        break;
    case ARGP_KEY_ARG:
        if (cli_options.command.empty())
            cli_options.command = arg;
        else
            cli_options.args.push_back(arg);
        break;
    case ARGP_KEY_END:
        if (cli_options.command.empty() && !cli_options.yamlOnly)
            argp_error(state, "missing COMMAND");
        break;
    default:
        return ARGP_ERR_UNKNOWN;
    }
    return 0;
}

bool parseArguments(int argc, char **argv)
{
    static struct argp_option options[] = {
        {"config", 'c', "CONFIG_PATH", 0, "Full path of the .yaml config file to use."},
        {"address", 'a', "ADDRESS", 0, "Bluetooth address of the badge."},
        {"random-address", 'r', 0, 0, "The badge uses a random (not public) address."},
        {"key", 'k', "KEY", 0, "idealled, shiningmasks or 32 hex digits."},
        {"timeout", 't', "MS", 0, "How long to wait for each acknowledgement."},
        {"mode", 'm', "MODE", 0, "Scroll mode after an upload: static, left, right, up, down, snow or a number."},
        {"speed", 's', "SPEED", 0, "Scroll speed after an upload, 0-255."},
        {"brightness", 'b', "LEVEL", 0, "Brightness after an upload, 0-255."},
        {"font", 'f', "FONT_PATH", 0, "YAML font file merged over the built in font."},
        {"verbose", 'v', 0, 0, "Set log level to full debug"},
        {"output-yaml", 'y', 0, 0, "Output config yaml and exit"},
        {0}};
    static char doc[] = "Control a Bluetooth LED name badge.\v"
                        "Commands: scan, on, off, mode MODE, speed N, brightness N, text TEXT, image FILE.json, "
                        "anim ID, show ID, play ID..., delete ID..., check, render TEXT";
    static char args_doc[] = "COMMAND [ARG...]";
    static struct argp argp = {options, parse_opt, args_doc, doc, 0, 0, 0};

    return argp_parse(&argp, argc, argv, 0, 0, 0) == 0;
}

void resetConfig()
{
    ledbadge_config = ledbadge_config_struct();
    cli_options = ledbadge_cli_options();
}

static bool parseLogLevel(const std::string &name, ledbadge_log_level &level)
{
    if (name == "trace")
        level = level_trace;
    else if (name == "debug")
        level = level_debug;
    else if (name == "info")
        level = level_info;
    else if (name == "warn")
        level = level_warn;
    else if (name == "error")
        level = level_error;
    else
        return false;
    return true;
}

static bool parseByte(const std::string &text, uint8_t &out)
{
    char *end = nullptr;
    long v = strtol(text.c_str(), &end, 10);
    if (text.empty() || *end != '\0' || v < 0 || v > 255)
        return false;
    out = (uint8_t)v;
    return true;
}

static bool parseAddressType(const std::string &text, address_type_enum &out)
{
    if (text == "public")
        out = address_public;
    else if (text == "random")
        out = address_random;
    else
        return false;
    return true;
}

static bool applyConfigNode(const YAML::Node &yamlConfig)
{
    if (yamlConfig["Badge"]) {
        ledbadge_config.address = yamlConfig["Badge"]["Address"].as<std::string>(ledbadge_config.address);
        if (yamlConfig["Badge"]["AddressType"] &&
            !parseAddressType(yamlConfig["Badge"]["AddressType"].as<std::string>(""), ledbadge_config.address_type)) {
            std::cerr << "Badge.AddressType must be public or random" << std::endl;
            return false;
        }
        if (yamlConfig["Badge"]["Key"]) {
            std::string keyName = yamlConfig["Badge"]["Key"].as<std::string>("");
            if (!BadgeKey::parse(keyName, ledbadge_config.key)) {
                std::cerr << "Badge.Key is not a known preset or 32 hex digits" << std::endl;
                return false;
            }
            ledbadge_config.key_name = keyName;
        }
        if (yamlConfig["Badge"]["AckTimeoutMs"]) {
            int ms = yamlConfig["Badge"]["AckTimeoutMs"].as<int>(0);
            if (ms <= 0) {
                std::cerr << "Badge.AckTimeoutMs must be a positive number of milliseconds" << std::endl;
                return false;
            }
            ledbadge_config.ack_timeout_ms = ms;
        }
    }

    if (yamlConfig["Display"]) {
        if (yamlConfig["Display"]["Mode"] &&
            !parseScrollMode(yamlConfig["Display"]["Mode"].as<std::string>(""), ledbadge_config.display.mode)) {
            std::cerr << "Display.Mode is not a scroll mode" << std::endl;
            return false;
        }
        if (yamlConfig["Display"]["Speed"] &&
            !parseByte(yamlConfig["Display"]["Speed"].as<std::string>(""), ledbadge_config.display.speed)) {
            std::cerr << "Display.Speed must be 0-255" << std::endl;
            return false;
        }
        if (yamlConfig["Display"]["Brightness"] &&
            !parseByte(yamlConfig["Display"]["Brightness"].as<std::string>(""), ledbadge_config.display.brightness)) {
            std::cerr << "Display.Brightness must be 0-255" << std::endl;
            return false;
        }
    }

    if (yamlConfig["Font"]) {
        ledbadge_config.font_file = yamlConfig["Font"]["File"].as<std::string>("");
    }

    if (yamlConfig["Logging"]) {
        if (!parseLogLevel(yamlConfig["Logging"]["LogLevel"].as<std::string>("info"), ledbadge_config.logoutputlevel)) {
            std::cerr << "Logging.LogLevel must be one of error, warn, info, debug, trace" << std::endl;
            return false;
        }
        ledbadge_config.traceFilename = yamlConfig["Logging"]["TraceFile"].as<std::string>("");
        if (yamlConfig["Logging"]["AsciiLogs"]) {
            // Default is !isatty(2) but can be set explicitly in config.yaml
            ledbadge_config.ascii_logs = yamlConfig["Logging"]["AsciiLogs"].as<bool>();
            ledbadge_config.ascii_logs_explicit = true;
        }
    }

    if (yamlConfig["Scan"]) {
        ledbadge_config.scan_seconds = yamlConfig["Scan"]["Seconds"].as<int>(LEDBADGE_DEFAULT_SCAN_SECS);
        ledbadge_config.scan_name_filter = yamlConfig["Scan"]["NameFilter"].as<std::string>("");
    }
    return true;
}

bool loadConfig(const char *configPath)
{
    try {
        return applyConfigNode(YAML::LoadFile(configPath));
    } catch (YAML::Exception &e) {
        std::cerr << "*** Exception " << e.what() << std::endl;
        return false;
    }
}

bool loadConfigYaml(const std::string &yamlText)
{
    try {
        return applyConfigNode(YAML::Load(yamlText));
    } catch (YAML::Exception &e) {
        std::cerr << "*** Exception " << e.what() << std::endl;
        return false;
    }
}

static bool applyCommandLine()
{
    if (cli_options.address != "")
        ledbadge_config.address = cli_options.address;
    if (cli_options.randomAddress)
        ledbadge_config.address_type = address_random;
    if (cli_options.key != "") {
        if (!BadgeKey::parse(cli_options.key, ledbadge_config.key)) {
            std::cerr << "--key is not a known preset or 32 hex digits" << std::endl;
            return false;
        }
        ledbadge_config.key_name = cli_options.key;
    }
    if (cli_options.timeout != "") {
        char *end = nullptr;
        long v = strtol(cli_options.timeout.c_str(), &end, 10);
        if (*end != '\0' || v <= 0) {
            std::cerr << "--timeout must be a positive number of milliseconds" << std::endl;
            return false;
        }
        ledbadge_config.ack_timeout_ms = (int)v;
    }
    if (cli_options.mode != "" && !parseScrollMode(cli_options.mode, ledbadge_config.display.mode)) {
        std::cerr << "--mode is not a scroll mode" << std::endl;
        return false;
    }
    if (cli_options.speed != "" && !parseByte(cli_options.speed, ledbadge_config.display.speed)) {
        std::cerr << "--speed must be 0-255" << std::endl;
        return false;
    }
    if (cli_options.brightness != "" && !parseByte(cli_options.brightness, ledbadge_config.display.brightness)) {
        std::cerr << "--brightness must be 0-255" << std::endl;
        return false;
    }
    if (cli_options.fontFile != "")
        ledbadge_config.font_file = cli_options.fontFile;
    if (cli_options.verbose)
        ledbadge_config.logoutputlevel = level_debug;
    return true;
}

bool linuxSetup()
{
    const char *configPath = nullptr;
    if (cli_options.configPath != "") {
        configPath = cli_options.configPath.c_str();
    } else if (access("config.yaml", R_OK) == 0) {
        configPath = "config.yaml";
    } else if (access("/etc/ledbadge/config.yaml", R_OK) == 0) {
        configPath = "/etc/ledbadge/config.yaml";
    }

    if (configPath != nullptr) {
        if (loadConfig(configPath)) {
            if (!cli_options.yamlOnly)
                std::cerr << "Using " << configPath << " as config file" << std::endl;
        } else {
            std::cerr << "Unable to use " << configPath << " as config file" << std::endl;
            return false;
        }
    } else if (!cli_options.yamlOnly) {
        std::cerr << "No 'config.yaml' found..." << std::endl;
    }

    if (!applyCommandLine())
        return false;

    consoleInit();
    console->setLogLevel(ledbadge_config.logoutputlevel);
    console->setAsciiLogs(ledbadge_config.ascii_logs);
    if (ledbadge_config.traceFilename != "") {
        if (!console->openTraceFile(ledbadge_config.traceFilename))
            LOG_WARN("Unable to open trace file %s", ledbadge_config.traceFilename.c_str());
        else if (ledbadge_config.logoutputlevel < level_trace)
            LOG_INFO("Tracing wire packets to %s", ledbadge_config.traceFilename.c_str());
    }
    return true;
}
