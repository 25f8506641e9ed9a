#include "platform/linux/LinuxGlue.h"

#include "../TestUtil.h"
#include <unity.h>

void setUp(void)
{
    resetConfig();
}

void tearDown(void)
{
    // clean stuff up here
}

void test_defaults(void)
{
    TEST_ASSERT_EQUAL_STRING("", ledbadge_config.address.c_str());
    TEST_ASSERT_EQUAL(address_public, ledbadge_config.address_type);
    TEST_ASSERT_EQUAL(3000, ledbadge_config.ack_timeout_ms);
    TEST_ASSERT_EQUAL(3, ledbadge_config.display.mode);
    TEST_ASSERT_EQUAL(50, ledbadge_config.display.speed);
    TEST_ASSERT_EQUAL(128, ledbadge_config.display.brightness);
    TEST_ASSERT_EQUAL(level_info, ledbadge_config.logoutputlevel);

    BadgeKey ideal = BadgeKey::idealLED();
    TEST_ASSERT_EQUAL_HEX8_ARRAY(ideal.bytes, ledbadge_config.key.bytes, 16);
}

void test_full_config(void)
{
    const char *yaml = "Badge:\n"
                       "  Address: 'AA:BB:CC:DD:EE:FF'\n"
                       "  AddressType: random\n"
                       "  Key: shiningmasks\n"
                       "  AckTimeoutMs: 5000\n"
                       "Display:\n"
                       "  Mode: static\n"
                       "  Speed: 96\n"
                       "  Brightness: 200\n"
                       "Font:\n"
                       "  File: /tmp/font.yaml\n"
                       "Logging:\n"
                       "  LogLevel: trace\n"
                       "  TraceFile: /tmp/badge.trace\n"
                       "  AsciiLogs: true\n"
                       "Scan:\n"
                       "  Seconds: 4\n"
                       "  NameFilter: LSLED\n";
    TEST_ASSERT_TRUE(loadConfigYaml(yaml));

    TEST_ASSERT_EQUAL_STRING("AA:BB:CC:DD:EE:FF", ledbadge_config.address.c_str());
    TEST_ASSERT_EQUAL(address_random, ledbadge_config.address_type);
    TEST_ASSERT_EQUAL_STRING("shiningmasks", ledbadge_config.key_name.c_str());
    BadgeKey masks = BadgeKey::shiningMasks();
    TEST_ASSERT_EQUAL_HEX8_ARRAY(masks.bytes, ledbadge_config.key.bytes, 16);
    TEST_ASSERT_EQUAL(5000, ledbadge_config.ack_timeout_ms);
    TEST_ASSERT_EQUAL(1, ledbadge_config.display.mode);
    TEST_ASSERT_EQUAL(96, ledbadge_config.display.speed);
    TEST_ASSERT_EQUAL(200, ledbadge_config.display.brightness);
    TEST_ASSERT_EQUAL_STRING("/tmp/font.yaml", ledbadge_config.font_file.c_str());
    TEST_ASSERT_EQUAL(level_trace, ledbadge_config.logoutputlevel);
    TEST_ASSERT_EQUAL_STRING("/tmp/badge.trace", ledbadge_config.traceFilename.c_str());
    TEST_ASSERT_TRUE(ledbadge_config.ascii_logs);
    TEST_ASSERT_TRUE(ledbadge_config.ascii_logs_explicit);
    TEST_ASSERT_EQUAL(4, ledbadge_config.scan_seconds);
    TEST_ASSERT_EQUAL_STRING("LSLED", ledbadge_config.scan_name_filter.c_str());
}

void test_emitted_yaml_reloads(void)
{
    TEST_ASSERT_TRUE(loadConfigYaml("Badge:\n  Address: 'AA:BB:CC:DD:EE:FF'\n  Key: 000102030405060708090a0b0c0d0e0f\n"
                                    "Display:\n  Mode: 42\n  Speed: 7\n"));
    std::string emitted = ledbadge_config.emit_yaml();

    resetConfig();
    TEST_ASSERT_TRUE(loadConfigYaml(emitted));
    TEST_ASSERT_EQUAL_STRING("AA:BB:CC:DD:EE:FF", ledbadge_config.address.c_str());
    TEST_ASSERT_EQUAL(42, ledbadge_config.display.mode);
    TEST_ASSERT_EQUAL(7, ledbadge_config.display.speed);
    TEST_ASSERT_EQUAL(128, ledbadge_config.display.brightness);
    TEST_ASSERT_EQUAL_HEX8(0x0f, ledbadge_config.key.bytes[15]);
}

void test_named_mode_emitted(void)
{
    TEST_ASSERT_TRUE(loadConfigYaml("Display:\n  Mode: snow\n"));
    YAML::Node node = YAML::Load(ledbadge_config.emit_yaml());
    TEST_ASSERT_EQUAL_STRING("snow", node["Display"]["Mode"].as<std::string>().c_str());
    TEST_ASSERT_EQUAL_STRING("idealled", node["Badge"]["Key"].as<std::string>().c_str());
    TEST_ASSERT_FALSE(node["Font"].IsDefined());
}

void test_rejects_bad_values(void)
{
    TEST_ASSERT_FALSE(loadConfigYaml("Badge:\n  AddressType: sideways\n"));
    TEST_ASSERT_FALSE(loadConfigYaml("Badge:\n  Key: 1234\n"));
    TEST_ASSERT_FALSE(loadConfigYaml("Badge:\n  AckTimeoutMs: 0\n"));
    TEST_ASSERT_FALSE(loadConfigYaml("Badge:\n  AckTimeoutMs: -5\n"));
    TEST_ASSERT_FALSE(loadConfigYaml("Badge:\n  AckTimeoutMs: soon\n"));
    TEST_ASSERT_FALSE(loadConfigYaml("Display:\n  Mode: zigzag\n"));
    TEST_ASSERT_FALSE(loadConfigYaml("Display:\n  Speed: 300\n"));
    TEST_ASSERT_FALSE(loadConfigYaml("Display:\n  Brightness: -1\n"));
    TEST_ASSERT_FALSE(loadConfigYaml("Logging:\n  LogLevel: chatty\n"));
    TEST_ASSERT_FALSE(loadConfigYaml("Badge: [unclosed\n"));
}

void test_command_line(void)
{
    char *argv[] = {(char *)"ledbadge", (char *)"-a", (char *)"11:22:33:44:55:66", (char *)"--mode",
                    (char *)"up",      (char *)"-v", (char *)"play",             (char *)"1",
                    (char *)"2",       NULL};
    TEST_ASSERT_TRUE(parseArguments(9, argv));
    TEST_ASSERT_EQUAL_STRING("11:22:33:44:55:66", cli_options.address.c_str());
    TEST_ASSERT_EQUAL_STRING("up", cli_options.mode.c_str());
    TEST_ASSERT_TRUE(cli_options.verbose);
    TEST_ASSERT_EQUAL_STRING("play", cli_options.command.c_str());
    TEST_ASSERT_EQUAL(2, cli_options.args.size());
    TEST_ASSERT_EQUAL_STRING("2", cli_options.args[1].c_str());
}

int main(int argc, char **argv)
{
    initializeTestEnvironment();

    UNITY_BEGIN();
    RUN_TEST(test_defaults);
    RUN_TEST(test_full_config);
    RUN_TEST(test_emitted_yaml_reloads);
    RUN_TEST(test_named_mode_emitted);
    RUN_TEST(test_rejects_bad_values);
    RUN_TEST(test_command_line);
    return UNITY_END();
}
