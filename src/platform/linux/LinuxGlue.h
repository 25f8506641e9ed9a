#pragma once
#include <fstream>
#include <map>
#include <string>
#include <unistd.h>
#include <vector>

#include "RedirectablePrint.h"
#include "badge/BadgeCipher.h"
#include "badge/BadgeCommand.h"
#include "badge/TransferFSM.h"
#include "configuration.h"
#include "yaml-cpp/yaml.h"

enum address_type_enum { address_public, address_random };

bool loadConfig(const char *configPath);

/// Load YAML text already in memory, same rules as loadConfig
bool loadConfigYaml(const std::string &yamlText);

/**
 * Parse the command line into cli_options. argp exits by itself on --help / --version.
 * @return false on a usage error
 */
bool parseArguments(int argc, char **argv);

/**
 * Find and load the config file, apply command line overrides and set up the console.
 * @return false if a config file was found but could not be used
 */
bool linuxSetup();

/// Reset ledbadge_config and cli_options to their defaults
void resetConfig();

/// Things given on the command line, they win over the config file
extern struct ledbadge_cli_options {
    std::string configPath;
    std::string address;
    bool randomAddress = false;
    std::string key;
    std::string timeout;
    std::string mode;
    std::string speed;
    std::string brightness;
    std::string fontFile;
    bool verbose = false;
    bool yamlOnly = false;

    std::string command;
    std::vector<std::string> args;
} cli_options;

extern struct ledbadge_config_struct {
    // Badge
    std::string address;
    address_type_enum address_type = address_public;
    std::string key_name = "idealled";
    BadgeKey key = BadgeKey::idealLED();
    int ack_timeout_ms = LEDBADGE_DEFAULT_ACK_TIMEOUT_MS;

    // Display
    DisplaySettings display = {LEDBADGE_DEFAULT_MODE, LEDBADGE_DEFAULT_SPEED, LEDBADGE_DEFAULT_BRIGHTNESS};

    // Font
    std::string font_file;

    // Logging
    ledbadge_log_level logoutputlevel = level_info;
    std::string traceFilename;
    bool ascii_logs = !isatty(2);
    bool ascii_logs_explicit = false;

    // Scan
    int scan_seconds = LEDBADGE_DEFAULT_SCAN_SECS;
    std::string scan_name_filter;

    std::string emit_yaml()
    {
        YAML::Emitter out;
        out << YAML::BeginMap;

        out << YAML::Key << "Badge" << YAML::Value << YAML::BeginMap;
        if (address != "")
            out << YAML::Key << "Address" << YAML::Value << address;
        out << YAML::Key << "AddressType" << YAML::Value << (address_type == address_random ? "random" : "public");
        out << YAML::Key << "Key" << YAML::Value << key_name;
        out << YAML::Key << "AckTimeoutMs" << YAML::Value << ack_timeout_ms;
        out << YAML::EndMap; // Badge

        out << YAML::Key << "Display" << YAML::Value << YAML::BeginMap;
        std::string modeName = scrollModeName(display.mode);
        if (modeName == "custom")
            out << YAML::Key << "Mode" << YAML::Value << (int)display.mode;
        else
            out << YAML::Key << "Mode" << YAML::Value << modeName;
        out << YAML::Key << "Speed" << YAML::Value << (int)display.speed;
        out << YAML::Key << "Brightness" << YAML::Value << (int)display.brightness;
        out << YAML::EndMap; // Display

        if (font_file != "") {
            out << YAML::Key << "Font" << YAML::Value << YAML::BeginMap;
            out << YAML::Key << "File" << YAML::Value << font_file;
            out << YAML::EndMap; // Font
        }

        out << YAML::Key << "Logging" << YAML::Value << YAML::BeginMap;
        out << YAML::Key << "LogLevel" << YAML::Value;
        switch (logoutputlevel) {
        case level_error:
            out << "error";
            break;
        case level_warn:
            out << "warn";
            break;
        case level_info:
            out << "info";
            break;
        case level_debug:
            out << "debug";
            break;
        case level_trace:
            out << "trace";
            break;
        }
        if (traceFilename != "")
            out << YAML::Key << "TraceFile" << YAML::Value << traceFilename;
        if (ascii_logs_explicit) {
            out << YAML::Key << "AsciiLogs" << YAML::Value << ascii_logs;
        }
        out << YAML::EndMap; // Logging

        out << YAML::Key << "Scan" << YAML::Value << YAML::BeginMap;
        out << YAML::Key << "Seconds" << YAML::Value << scan_seconds;
        if (scan_name_filter != "")
            out << YAML::Key << "NameFilter" << YAML::Value << scan_name_filter;
        out << YAML::EndMap; // Scan

        out << YAML::EndMap;
        return out.c_str();
    }
} ledbadge_config;
