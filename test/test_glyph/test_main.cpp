#include "badge/DefaultFont.h"
#include "badge/GlyphCodec.h"

#include "../TestUtil.h"
#include <stdlib.h>
#include <unity.h>

void setUp(void)
{
    // set stuff up here
}

void tearDown(void)
{
    // clean stuff up here
}

static Glyph glyphFromRows(const char *const rows[BADGE_GLYPH_HEIGHT])
{
    Glyph g;
    for (int r = 0; r < BADGE_GLYPH_HEIGHT; r++)
        for (int c = 0; c < BADGE_GLYPH_WIDTH; c++)
            g.pixels[r][c] = rows[r][c] == '#';
    return g;
}

void test_encode_single_pixels(void)
{
    // Top left pixel is bit 7 of byte 0
    Glyph g;
    g.pixels[0][0] = true;
    GlyphSegment s = encodeGlyph(g);
    TEST_ASSERT_EQUAL_HEX8(0x80, s[0]);
    for (int i = 1; i < 9; i++)
        TEST_ASSERT_EQUAL_HEX8(0, s[i]);

    // Row 7 of column 5 is bit 0 of byte 8
    g = Glyph();
    g.pixels[7][5] = true;
    s = encodeGlyph(g);
    TEST_ASSERT_EQUAL_HEX8(0x01, s[8]);

    // Row 8 of column 2 is the top of the upper nibble of byte 4
    g = Glyph();
    g.pixels[8][2] = true;
    s = encodeGlyph(g);
    TEST_ASSERT_EQUAL_HEX8(0x80, s[4]);

    // Row 11 of column 1 is the bottom of the lower nibble of byte 1
    g = Glyph();
    g.pixels[11][1] = true;
    s = encodeGlyph(g);
    TEST_ASSERT_EQUAL_HEX8(0x01, s[1]);
}

void test_encode_column_bytes(void)
{
    Glyph g;
    for (int r = 0; r < 8; r++) {
        g.pixels[r][1] = true; // column 1 lives in byte 2
        g.pixels[r][3] = true; // column 3 lives in byte 5
    }
    for (int r = 8; r < 12; r++)
        g.pixels[r][4] = true; // column 4, rows 8-11 in the upper nibble of byte 7
    GlyphSegment s = encodeGlyph(g);

    uint8_t expected[9] = {0x00, 0x00, 0xFF, 0x00, 0x00, 0xFF, 0x00, 0xF0, 0x00};
    TEST_ASSERT_EQUAL_HEX8_ARRAY(expected, s.data(), 9);
}

void test_encode_captured_B(void)
{
    static const char *const rows[] = {"......", "......", "####..", ".#..#.", ".#..#.", ".###..",
                                       ".#..#.", ".#..#.", ".#..#.", "####..", "......", "......"};
    uint8_t expected[9];
    HexToBytes(expected, "204c3f2444241b8000");

    GlyphSegment s = encodeGlyph(glyphFromRows(rows));
    TEST_ASSERT_EQUAL_HEX8_ARRAY(expected, s.data(), 9);
}

void test_round_trip_sample(void)
{
    srand(1234);
    for (int n = 0; n < 500; n++) {
        Glyph g;
        for (int r = 0; r < BADGE_GLYPH_HEIGHT; r++)
            for (int c = 0; c < BADGE_GLYPH_WIDTH; c++)
                g.pixels[r][c] = (rand() & 1) != 0;
        TEST_ASSERT_TRUE(decodeGlyph(encodeGlyph(g)) == g);
    }

    // every bit set
    GlyphSegment all;
    all.fill(0xFF);
    TEST_ASSERT_TRUE(encodeGlyph(decodeGlyph(all)) == all);
}

void test_render_badger(void)
{
    Font font = defaultFont();
    std::vector<GlyphSegment> segments;
    TEST_ASSERT_EQUAL(BadgeError::NONE, renderText("Badger", font, segments));
    TEST_ASSERT_EQUAL(6, segments.size());
    TEST_ASSERT_EQUAL(54, totalByteLength(segments));

    std::vector<uint8_t> expected = HexToVector("204c3f2444241b8000"
                                                "00080205440503c400"
                                                "0008030444243fc400"
                                                "000e02055505065204"
                                                "000803054405034000"
                                                "044c07024004040000");
    std::vector<uint8_t> payload = flattenSegments(segments);
    TEST_ASSERT_EQUAL(expected.size(), payload.size());
    TEST_ASSERT_EQUAL_HEX8_ARRAY(expected.data(), payload.data(), expected.size());
}

void test_render_magician(void)
{
    Font font = defaultFont();
    std::vector<GlyphSegment> segments;
    TEST_ASSERT_EQUAL(BadgeError::NONE, renderText("Magician", font, segments));
    TEST_ASSERT_EQUAL(72, totalByteLength(segments));

    std::vector<uint8_t> expected = HexToVector("3fc03c03c03c3fc000"
                                                "00080205440503c400"
                                                "000e02055505065204"
                                                "00040427c400000000"
                                                "000803044404064000"
                                                "00040427c400000000"
                                                "00080205440503c400"
                                                "044c0704400403c400");
    std::vector<uint8_t> payload = flattenSegments(segments);
    TEST_ASSERT_EQUAL_HEX8_ARRAY(expected.data(), payload.data(), expected.size());
}

void test_render_wide_glyph(void)
{
    Font font = defaultFont();
    std::vector<GlyphSegment> segments;
    TEST_ASSERT_EQUAL(BadgeError::NONE, renderText("I\xe2\x99\xa5U", font, segments)); // I heart U
    TEST_ASSERT_EQUAL(4, segments.size());
    TEST_ASSERT_TRUE(segments[0] == (*font.find('I'))[0]);
    TEST_ASSERT_TRUE(segments[3] == (*font.find('U'))[0]);
}

void test_render_unsupported(void)
{
    Font font = defaultFont();
    std::vector<GlyphSegment> segments;
    uint32_t bad = 0;
    TEST_ASSERT_EQUAL(BadgeError::UNSUPPORTED_CHARACTER, renderText("caf\xc3\xa9", font, segments, &bad));
    TEST_ASSERT_EQUAL_HEX32(0xE9, bad);
    TEST_ASSERT_TRUE(segments.empty());

    TEST_ASSERT_EQUAL(BadgeError::UNSUPPORTED_CHARACTER, renderText("\t", font, segments, &bad));
    TEST_ASSERT_EQUAL_HEX32(0x09, bad);

    // truncated UTF-8 sequence
    TEST_ASSERT_EQUAL(BadgeError::UNSUPPORTED_CHARACTER, renderText("ab\xe2\x99", font, segments));
}

void test_render_empty(void)
{
    Font font = defaultFont();
    std::vector<GlyphSegment> segments;
    TEST_ASSERT_EQUAL(BadgeError::NONE, renderText("", font, segments));
    TEST_ASSERT_EQUAL(0, totalByteLength(segments));
}

void test_default_font_coverage(void)
{
    Font font = defaultFont();
    for (uint32_t c = 0x20; c < 0x7F; c++) {
        const std::vector<GlyphSegment> *g = font.find(c);
        TEST_ASSERT_NOT_NULL(g);
        TEST_ASSERT_EQUAL(1, g->size());
    }
    TEST_ASSERT_EQUAL(2, font.find(0x2665)->size());
    TEST_ASSERT_EQUAL(2, font.find(0x263A)->size());
    TEST_ASSERT_NULL(font.find(0x7F));
}

void test_ascii_art(void)
{
    Font font = defaultFont();
    std::vector<GlyphSegment> segments;
    TEST_ASSERT_EQUAL(BadgeError::NONE, renderText("B", font, segments));
    std::string art = renderAsciiArt(flattenSegments(segments));
    TEST_ASSERT_EQUAL_STRING("......\n......\n####..\n.#..#.\n.#..#.\n.###..\n"
                             ".#..#.\n.#..#.\n.#..#.\n####..\n......\n......\n",
                             art.c_str());
}

void test_font_yaml(void)
{
    Font font = defaultFont();
    const char *yaml = "Glyphs:\n"
                       "  \"B\": ['......', '......', '######', '......', '......', '......',\n"
                       "         '......', '......', '......', '......', '......', '#.....']\n"
                       "  \"\xc3\xa9\": ['............', '............', '............', '............',\n"
                       "         '............', '............', '............', '............',\n"
                       "         '............', '............', '............', '...........#']\n";
    TEST_ASSERT_EQUAL(BadgeError::NONE, loadFontYaml(yaml, font));

    const std::vector<GlyphSegment> *b = font.find('B');
    TEST_ASSERT_NOT_NULL(b);
    uint8_t expectedB[9] = {0x20, 0x10, 0x20, 0x20, 0x00, 0x20, 0x20, 0x00, 0x20};
    TEST_ASSERT_EQUAL_HEX8_ARRAY(expectedB, (*b)[0].data(), 9);

    const std::vector<GlyphSegment> *e = font.find(0xE9);
    TEST_ASSERT_NOT_NULL(e);
    TEST_ASSERT_EQUAL(2, e->size());
    TEST_ASSERT_EQUAL_HEX8(0x01, (*e)[1][7]);

    // untouched glyphs survive the merge
    TEST_ASSERT_NOT_NULL(font.find('a'));
}

void test_font_yaml_rejects_bad_glyphs(void)
{
    Font font;
    TEST_ASSERT_EQUAL(BadgeError::INVALID_FILE, loadFontYaml("Glyphs:\n  A: ['......']\n", font));
    TEST_ASSERT_EQUAL(BadgeError::INVALID_FILE,
                      loadFontYaml("Glyphs:\n  A: ['.....', '.....', '.....', '.....', '.....', '.....',\n"
                                   "      '.....', '.....', '.....', '.....', '.....', '.....']\n",
                                   font));
    TEST_ASSERT_EQUAL(BadgeError::INVALID_FILE,
                      loadFontYaml("Glyphs:\n  AB: ['......', '......', '......', '......', '......', '......',\n"
                                   "       '......', '......', '......', '......', '......', '......']\n",
                                   font));
    TEST_ASSERT_EQUAL(BadgeError::INVALID_FILE, loadFontYaml("Glyphs: [unclosed\n", font));
    TEST_ASSERT_EQUAL(BadgeError::INVALID_FILE, loadFontYaml("Other: 1\n", font));
    TEST_ASSERT_EQUAL(0, font.size());
}

int main(int argc, char **argv)
{
    initializeTestEnvironment();

    UNITY_BEGIN();
    RUN_TEST(test_encode_single_pixels);
    RUN_TEST(test_encode_column_bytes);
    RUN_TEST(test_encode_captured_B);
    RUN_TEST(test_round_trip_sample);
    RUN_TEST(test_render_badger);
    RUN_TEST(test_render_magician);
    RUN_TEST(test_render_wide_glyph);
    RUN_TEST(test_render_unsupported);
    RUN_TEST(test_render_empty);
    RUN_TEST(test_default_font_coverage);
    RUN_TEST(test_ascii_art);
    RUN_TEST(test_font_yaml);
    RUN_TEST(test_font_yaml_rejects_bad_glyphs);
    return UNITY_END();
}
