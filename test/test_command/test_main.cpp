#include "badge/BadgeCommand.h"

#include "../TestUtil.h"
#include <unity.h>

static const BadgeCipher cipher(BadgeKey::idealLED());
static const CommandEncoder encoder(cipher);

void setUp(void)
{
    // set stuff up here
}

void tearDown(void)
{
    // clean stuff up here
}

static void assertWire(const char *cipherHex, const BadgeBlock &wire)
{
    uint8_t expected[16];
    HexToBytes(expected, cipherHex, sizeof(expected));
    TEST_ASSERT_EQUAL_HEX8_ARRAY(expected, wire.data(), 16);
}

void test_plain_layout(void)
{
    BadgeBlock block;
    block.fill(0xAA);
    const uint8_t args[] = {0x00, 0x36, 0x00, 0x00};
    TEST_ASSERT_EQUAL(BadgeError::NONE, buildCommandBlock(BadgeCommandId::DATS, args, sizeof(args), block));

    uint8_t expected[16];
    HexToBytes(expected, "084441545300360000", sizeof(expected));
    TEST_ASSERT_EQUAL_HEX8_ARRAY(expected, block.data(), 16);
}

void test_plain_too_large(void)
{
    BadgeBlock block;
    block.fill(0xAA);
    const uint8_t args[11] = {};
    // "PLAY" + 11 bytes is 15, the limit
    TEST_ASSERT_EQUAL(BadgeError::NONE, buildCommandBlock(BadgeCommandId::PLAY, args, 11, block));
    TEST_ASSERT_EQUAL_HEX8(15, block[0]);

    block.fill(0xAA);
    const uint8_t more[12] = {};
    TEST_ASSERT_EQUAL(BadgeError::PAYLOAD_TOO_LARGE, buildCommandBlock(BadgeCommandId::PLAY, more, 12, block));
    TEST_ASSERT_EQUAL_HEX8(0xAA, block[0]);
}

void test_power(void)
{
    BadgeBlock wire;
    TEST_ASSERT_EQUAL(BadgeError::NONE, encoder.ledOn(wire));
    assertWire("ebd372ed98857317f2f54cd2130fdc9c", wire);
    TEST_ASSERT_EQUAL(BadgeError::NONE, encoder.ledOff(wire));
    assertWire("cbb1fdbfc560d5e453c2cbd928b53fab", wire);
}

void test_display_settings(void)
{
    BadgeBlock wire;
    TEST_ASSERT_EQUAL(BadgeError::NONE, encoder.mode(1, wire));
    assertWire("c525a8e825a9f13b6c5ee00b48fa1d52", wire);
    TEST_ASSERT_EQUAL(BadgeError::NONE, encoder.mode((uint8_t)ScrollMode::LEFT, wire));
    assertWire("0adbfdd9e856e54e61f3c9d35452d5d0", wire);
    TEST_ASSERT_EQUAL(BadgeError::NONE, encoder.speed(50, wire));
    assertWire("4e9ae0e7d5e04af7491651e2e57610a7", wire);
    TEST_ASSERT_EQUAL(BadgeError::NONE, encoder.speed(96, wire));
    assertWire("7fac1269170d8885458fa51cfe710841", wire);
    TEST_ASSERT_EQUAL(BadgeError::NONE, encoder.light(128, wire));
    assertWire("9ea72be6b666e290d7ee1ee0d5cdec8e", wire);
    TEST_ASSERT_EQUAL(BadgeError::NONE, encoder.light(200, wire));
    assertWire("0e1f5fd1f54422668a849b7bea3cc29c", wire);
}

void test_dats(void)
{
    BadgeBlock wire;
    TEST_ASSERT_EQUAL(BadgeError::NONE, encoder.dats(9, wire));
    assertWire("361d18ea05dc95e06047553f10edb8e9", wire);
    TEST_ASSERT_EQUAL(BadgeError::NONE, encoder.dats(54, wire));
    assertWire("1e5d8435b17b37e01cb9a328c53d9afa", wire);
    TEST_ASSERT_EQUAL(BadgeError::NONE, encoder.dats(72, wire));
    assertWire("3c6ded12bdaf7a4be3fba9628c989a83", wire);
    TEST_ASSERT_EQUAL(BadgeError::NONE, encoder.dats(0, wire));
    assertWire("fcb7fb997b54372b0bc979a11eeb8258", wire);
    TEST_ASSERT_EQUAL(BadgeError::NONE, encoder.dats(0xFFFF, wire));
    assertWire("6b7787fa430ef28a7db796923c439c93", wire);

    TEST_ASSERT_EQUAL(BadgeError::PAYLOAD_TOO_LARGE, encoder.dats(0x10000, wire));
}

void test_datcp(void)
{
    BadgeBlock wire;
    TEST_ASSERT_EQUAL(BadgeError::NONE, encoder.datcp(wire));
    assertWire("8ac86ae07a1436224437d4d2c1cf4503", wire);
}

void test_stored_images(void)
{
    BadgeBlock wire;
    TEST_ASSERT_EQUAL(BadgeError::NONE, encoder.anim(2, wire));
    assertWire("c013d1b5ce18c35d396433690ceff2c1", wire);
    TEST_ASSERT_EQUAL(BadgeError::NONE, encoder.imag(1, wire));
    assertWire("0945198d18061fda7c5d4896e5e9df8c", wire);
    TEST_ASSERT_EQUAL(BadgeError::NONE, encoder.chec(wire));
    assertWire("ce2bf21147e1b29f4792f12b7fc99f2d", wire);
}

void test_play_and_delete(void)
{
    BadgeBlock wire;
    TEST_ASSERT_EQUAL(BadgeError::NONE, encoder.play({1, 2, 3}, wire));
    assertWire("7bd71ebea34befdd8aaae88ee3cb0751", wire);
    TEST_ASSERT_EQUAL(BadgeError::NONE, encoder.play({1, 2, 3, 4, 5}, wire));
    assertWire("42f1488b48a30c103bb18c508946487f", wire);
    TEST_ASSERT_EQUAL(BadgeError::NONE, encoder.dele({1, 2}, wire));
    assertWire("078173e27e69534e9baa204d3f4385e7", wire);
}

void test_id_list_limits(void)
{
    BadgeBlock wire;
    TEST_ASSERT_EQUAL(BadgeError::INVALID_ARGUMENT, encoder.play({}, wire));
    TEST_ASSERT_EQUAL(BadgeError::INVALID_ARGUMENT, encoder.dele({}, wire));

    std::vector<uint8_t> ten = {1, 2, 3, 4, 5, 6, 7, 8, 9, 10};
    TEST_ASSERT_EQUAL(BadgeError::NONE, encoder.play(ten, wire));
    ten.push_back(11);
    TEST_ASSERT_EQUAL(BadgeError::PAYLOAD_TOO_LARGE, encoder.play(ten, wire));
    TEST_ASSERT_EQUAL(BadgeError::PAYLOAD_TOO_LARGE, encoder.dele(ten, wire));
}

void test_scroll_mode_names(void)
{
    uint8_t mode = 0;
    TEST_ASSERT_TRUE(parseScrollMode("left", mode));
    TEST_ASSERT_EQUAL(3, mode);
    TEST_ASSERT_TRUE(parseScrollMode("SNOW", mode));
    TEST_ASSERT_EQUAL(7, mode);
    TEST_ASSERT_TRUE(parseScrollMode("Static", mode));
    TEST_ASSERT_EQUAL(1, mode);
    TEST_ASSERT_TRUE(parseScrollMode("42", mode));
    TEST_ASSERT_EQUAL(42, mode);

    TEST_ASSERT_FALSE(parseScrollMode("256", mode));
    TEST_ASSERT_FALSE(parseScrollMode("sideways", mode));
    TEST_ASSERT_FALSE(parseScrollMode("", mode));
    TEST_ASSERT_FALSE(parseScrollMode("-1", mode));

    TEST_ASSERT_EQUAL_STRING("down", scrollModeName(6));
    TEST_ASSERT_EQUAL_STRING("custom", scrollModeName(42));
}

void test_command_names(void)
{
    TEST_ASSERT_EQUAL_STRING("LEDON", badgeCommandName(BadgeCommandId::LEDON));
    TEST_ASSERT_EQUAL_STRING("DATCP", badgeCommandName(BadgeCommandId::DATCP));
    TEST_ASSERT_EQUAL_STRING("CHEC", badgeCommandName(BadgeCommandId::CHEC));
}

int main(int argc, char **argv)
{
    initializeTestEnvironment();

    UNITY_BEGIN();
    RUN_TEST(test_plain_layout);
    RUN_TEST(test_plain_too_large);
    RUN_TEST(test_power);
    RUN_TEST(test_display_settings);
    RUN_TEST(test_dats);
    RUN_TEST(test_datcp);
    RUN_TEST(test_stored_images);
    RUN_TEST(test_play_and_delete);
    RUN_TEST(test_id_list_limits);
    RUN_TEST(test_scroll_mode_names);
    RUN_TEST(test_command_names);
    return UNITY_END();
}
