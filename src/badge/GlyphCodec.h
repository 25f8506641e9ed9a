#pragma once

#include "BadgeTypes.h"
#include <array>
#include <map>
#include <stddef.h>
#include <stdint.h>
#include <string>
#include <vector>

/// One 6x12 pixel cell, pixels[row][col], row 0 at the top
struct Glyph {
    bool pixels[BADGE_GLYPH_HEIGHT][BADGE_GLYPH_WIDTH] = {};

    bool operator==(const Glyph &other) const;
    bool operator!=(const Glyph &other) const { return !(*this == other); }
};

/// The badge's 9 byte packing of one Glyph
typedef std::array<uint8_t, BADGE_SEGMENT_BYTES> GlyphSegment;

/**
 * Pack a glyph into the badge layout.
 *
 * Columns 0..5 keep rows 0-7 in bytes 0,2,3,5,6,8 (bit 7 is row 0). Rows 8-11 of
 * each column pair share byte 1, 4 or 7: even column in the upper nibble, odd column
 * in the lower nibble, top row in the high bit.
 */
GlyphSegment encodeGlyph(const Glyph &glyph);

/// Exact inverse of encodeGlyph
Glyph decodeGlyph(const GlyphSegment &segment);

/**
 * A mapping from unicode code point to the 1..K segments that draw it, left to right.
 */
class Font
{
  public:
    /// Adds or replaces a character. Empty segment lists are rejected.
    bool addGlyph(uint32_t codepoint, const std::vector<GlyphSegment> &segments);

    /// @return nullptr if the font has nothing for this code point
    const std::vector<GlyphSegment> *find(uint32_t codepoint) const;

    /// Copies every glyph of other into this font, other wins on conflicts
    void merge(const Font &other);

    size_t size() const { return glyphs.size(); }

  private:
    std::map<uint32_t, std::vector<GlyphSegment>> glyphs;
};

/**
 * Decode UTF-8 into code points.
 * @return false on a malformed sequence
 */
bool decodeUtf8(const std::string &text, std::vector<uint32_t> &codepoints);

/**
 * Look up every character of text in font and emit their segments in order.
 *
 * @param badCodepoint if non null, receives the first character we had no glyph for
 * @return UNSUPPORTED_CHARACTER if any character (or malformed UTF-8) is missing, segments is then left empty
 */
BadgeError renderText(const std::string &text, const Font &font, std::vector<GlyphSegment> &segments,
                      uint32_t *badCodepoint = nullptr);

/// 9 bytes per segment, this is the length DATS announces
size_t totalByteLength(const std::vector<GlyphSegment> &segments);

/// Concatenate segments into the upload payload
std::vector<uint8_t> flattenSegments(const std::vector<GlyphSegment> &segments);

/**
 * Draw a payload as 12 lines of '#' and '.', one 6 pixel wide block per segment.
 * A trailing partial segment is ignored.
 */
std::string renderAsciiArt(const std::vector<uint8_t> &payload);
