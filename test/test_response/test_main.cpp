#include "badge/ResponseDecoder.h"

#include "../TestUtil.h"
#include <unity.h>

static const BadgeCipher cipher(BadgeKey::idealLED());
static const ResponseDecoder decoder(cipher);

static const char *datsOkHex = "b964c683a6f0dda61efa71cffb93340f";
static const char *datcpOkHex = "236abf6a143921aae27a7a56b34804d3";

void setUp(void)
{
    // set stuff up here
}

void tearDown(void)
{
    // clean stuff up here
}

// [frameLength][type][ciphertext][trailer]
static std::vector<uint8_t> wrap(const char *cipherHex, uint8_t frameLength = 18)
{
    std::vector<uint8_t> frame;
    frame.push_back(frameLength);
    frame.push_back(0x1b);
    std::vector<uint8_t> ct = HexToVector(cipherHex);
    frame.insert(frame.end(), ct.begin(), ct.end());
    frame.push_back(0x5a);
    return frame;
}

void test_bare_datsok(void)
{
    BadgeResponse r;
    TEST_ASSERT_EQUAL(BadgeError::NONE, decoder.decode(HexToVector(datsOkHex), r));
    TEST_ASSERT_EQUAL_STRING("DATSOK", r.token.c_str());
    TEST_ASSERT_TRUE(r.isAck(AckKind::DATSOK));
    TEST_ASSERT_FALSE(r.isAck(AckKind::DATCPOK));
}

void test_wrapped_datcpok(void)
{
    BadgeResponse r;
    std::vector<uint8_t> frame = wrap(datcpOkHex);
    TEST_ASSERT_EQUAL(19, frame.size());
    TEST_ASSERT_EQUAL(BadgeError::NONE, decoder.decode(frame, r));
    TEST_ASSERT_EQUAL_STRING("DATCPOK", r.token.c_str());
    TEST_ASSERT_TRUE(r.isAck(AckKind::DATCPOK));
}

void test_unpadded_token(void)
{
    // some firmware answers without the length byte
    BadgeResponse r;
    TEST_ASSERT_EQUAL(BadgeError::NONE, decoder.decode(HexToVector("41411b81b962da6dba32ed58a1880480"), r));
    TEST_ASSERT_EQUAL_STRING("DATSOK", r.token.c_str());
    TEST_ASSERT_TRUE(r.isAck(AckKind::DATSOK));
}

void test_error_token(void)
{
    BadgeResponse r;
    TEST_ASSERT_EQUAL(BadgeError::NONE, decoder.decode(wrap("41bf7cb29b5887cf7d9ee216b3368e3e"), r));
    TEST_ASSERT_EQUAL_STRING("ERROR", r.token.c_str());
    TEST_ASSERT_EQUAL(AckKind::NONE, r.ack);
    TEST_ASSERT_EQUAL_STRING("NONE", ackKindName(r.ack));
}

void test_malformed_frames(void)
{
    BadgeResponse r;
    TEST_ASSERT_EQUAL(BadgeError::MALFORMED_FRAME, decoder.decode(std::vector<uint8_t>(), r));
    TEST_ASSERT_EQUAL(BadgeError::MALFORMED_FRAME, decoder.decode(std::vector<uint8_t>(15, 0), r));
    TEST_ASSERT_EQUAL(BadgeError::MALFORMED_FRAME, decoder.decode(std::vector<uint8_t>(17, 0), r));
    TEST_ASSERT_EQUAL(BadgeError::MALFORMED_FRAME, decoder.decode(std::vector<uint8_t>(20, 0), r));

    // right size, wrong length byte
    TEST_ASSERT_EQUAL(BadgeError::MALFORMED_FRAME, decoder.decode(wrap(datsOkHex, 17), r));
}

void test_token_from_plaintext(void)
{
    BadgeBlock plain = {};
    plain[0] = 2;
    plain[1] = 'O';
    plain[2] = 'K';
    TEST_ASSERT_EQUAL_STRING("OK", tokenFromPlaintext(plain).c_str());

    // a non zero byte after the declared length means there is no length byte
    plain[5] = 'X';
    TEST_ASSERT_EQUAL(6, tokenFromPlaintext(plain).size());

    BadgeBlock zero = {};
    TEST_ASSERT_EQUAL(0, tokenFromPlaintext(zero).size());
}

int main(int argc, char **argv)
{
    initializeTestEnvironment();

    UNITY_BEGIN();
    RUN_TEST(test_bare_datsok);
    RUN_TEST(test_wrapped_datcpok);
    RUN_TEST(test_unpadded_token);
    RUN_TEST(test_error_token);
    RUN_TEST(test_malformed_frames);
    RUN_TEST(test_token_from_plaintext);
    return UNITY_END();
}
