#include "badge/ImageChunker.h"

#include "../TestUtil.h"
#include <unity.h>

static const BadgeCipher cipher(BadgeKey::idealLED());

static const char *badgerHex = "204c3f2444241b8000"
                               "00080205440503c400"
                               "0008030444243fc400"
                               "000e02055505065204"
                               "000803054405034000"
                               "044c07024004040000";

void setUp(void)
{
    // set stuff up here
}

void tearDown(void)
{
    // clean stuff up here
}

static std::vector<uint8_t> counting(size_t len)
{
    std::vector<uint8_t> v(len);
    for (size_t i = 0; i < len; i++)
        v[i] = (uint8_t)(i + 1);
    return v;
}

void test_empty_payload(void)
{
    TEST_ASSERT_EQUAL(0, splitPayload(std::vector<uint8_t>()).size());

    std::vector<BadgeBlock> packets(3);
    TEST_ASSERT_EQUAL(BadgeError::NONE, encryptChunks(cipher, std::vector<uint8_t>(), packets));
    TEST_ASSERT_EQUAL(0, packets.size());
}

void test_exactly_one_block(void)
{
    std::vector<ImageChunk> chunks = splitPayload(counting(15));
    TEST_ASSERT_EQUAL(1, chunks.size());
    TEST_ASSERT_EQUAL(15, chunks[0].data.size());
    TEST_ASSERT_TRUE(chunks[0].last);

    BadgeBlock plain = chunks[0].plaintext();
    TEST_ASSERT_EQUAL_HEX8(15, plain[0]);
    TEST_ASSERT_EQUAL_HEX8(15, plain[15]);
}

void test_one_byte_over(void)
{
    std::vector<ImageChunk> chunks = splitPayload(counting(16));
    TEST_ASSERT_EQUAL(2, chunks.size());
    TEST_ASSERT_EQUAL(15, chunks[0].data.size());
    TEST_ASSERT_FALSE(chunks[0].last);
    TEST_ASSERT_EQUAL(1, chunks[1].data.size());
    TEST_ASSERT_EQUAL(1, chunks[1].index);
    TEST_ASSERT_TRUE(chunks[1].last);

    BadgeBlock plain = chunks[1].plaintext();
    uint8_t expected[16] = {0x01, 0x10};
    TEST_ASSERT_EQUAL_HEX8_ARRAY(expected, plain.data(), 16);
}

void test_chunks_reassemble(void)
{
    std::vector<uint8_t> payload = counting(54);
    std::vector<ImageChunk> chunks = splitPayload(payload);
    TEST_ASSERT_EQUAL(4, chunks.size());

    const size_t sizes[] = {15, 15, 15, 9};
    std::vector<uint8_t> joined;
    for (size_t i = 0; i < chunks.size(); i++) {
        TEST_ASSERT_EQUAL(i, chunks[i].index);
        TEST_ASSERT_EQUAL(sizes[i], chunks[i].data.size());
        joined.insert(joined.end(), chunks[i].data.begin(), chunks[i].data.end());
    }
    TEST_ASSERT_TRUE(joined == payload);
}

void test_captured_badger_upload(void)
{
    std::vector<BadgeBlock> packets;
    TEST_ASSERT_EQUAL(BadgeError::NONE, encryptChunks(cipher, HexToVector(badgerHex), packets));
    TEST_ASSERT_EQUAL(4, packets.size());

    const char *expected[] = {"75d9307b730cd85c69bf0187c9c82ab6", "1f4e5c00b5d28182b3b6e69dcfa713f3",
                              "8f8f6313de11b1b62263ce9fa958db0f", "fef47c4c1cb36e3cf0aa2ba47d368656"};
    for (size_t i = 0; i < 4; i++) {
        uint8_t want[16];
        HexToBytes(want, expected[i], sizeof(want));
        TEST_ASSERT_EQUAL_HEX8_ARRAY(want, packets[i].data(), 16);
    }
}

void test_captured_magician_upload(void)
{
    std::vector<uint8_t> payload = HexToVector("3fc03c03c03c3fc000"
                                               "00080205440503c400"
                                               "000e02055505065204"
                                               "00040427c400000000"
                                               "000803044404064000"
                                               "00040427c400000000"
                                               "00080205440503c400"
                                               "044c0704400403c400");
    std::vector<BadgeBlock> packets;
    TEST_ASSERT_EQUAL(BadgeError::NONE, encryptChunks(cipher, payload, packets));
    TEST_ASSERT_EQUAL(5, packets.size());

    const char *expected[] = {"79e078251a259de8f071834f36c8b6b6", "57c94f81af1a5fe6ddd891888c881f2b",
                              "9a24f2ce133f53795ae95631eb5210d7", "a0f9af8081682f1d21d188cff8407d61",
                              "51a1023a2fc89411df75bbccd6ad96d8"};
    for (size_t i = 0; i < 5; i++) {
        uint8_t want[16];
        HexToBytes(want, expected[i], sizeof(want));
        TEST_ASSERT_EQUAL_HEX8_ARRAY(want, packets[i].data(), 16);
    }
}

int main(int argc, char **argv)
{
    initializeTestEnvironment();

    UNITY_BEGIN();
    RUN_TEST(test_empty_payload);
    RUN_TEST(test_exactly_one_block);
    RUN_TEST(test_one_byte_over);
    RUN_TEST(test_chunks_reassemble);
    RUN_TEST(test_captured_badger_upload);
    RUN_TEST(test_captured_magician_upload);
    return UNITY_END();
}
