#include "GlyphCodec.h"
#include "DebugConfiguration.h"
#include <algorithm>

// Byte that holds rows 0-7 of each column
static const uint8_t columnByte[BADGE_GLYPH_WIDTH] = {0, 2, 3, 5, 6, 8};

// Byte that holds rows 8-11 of column pair 0/1, 2/3 and 4/5
static const uint8_t lowRowsByte[BADGE_GLYPH_WIDTH / 2] = {1, 4, 7};

bool Glyph::operator==(const Glyph &other) const
{
    for (int r = 0; r < BADGE_GLYPH_HEIGHT; r++)
        for (int c = 0; c < BADGE_GLYPH_WIDTH; c++)
            if (pixels[r][c] != other.pixels[r][c])
                return false;
    return true;
}

GlyphSegment encodeGlyph(const Glyph &glyph)
{
    GlyphSegment out = {};

    for (int c = 0; c < BADGE_GLYPH_WIDTH; c++) {
        uint8_t v = 0;
        for (int r = 0; r < 8; r++)
            if (glyph.pixels[r][c])
                v |= 0x80 >> r;
        out[columnByte[c]] = v;
    }

    for (int pair = 0; pair < BADGE_GLYPH_WIDTH / 2; pair++) {
        uint8_t v = 0;
        for (int r = 0; r < 4; r++) {
            if (glyph.pixels[8 + r][2 * pair])
                v |= 0x80 >> r;
            if (glyph.pixels[8 + r][2 * pair + 1])
                v |= 0x08 >> r;
        }
        out[lowRowsByte[pair]] = v;
    }

    return out;
}

Glyph decodeGlyph(const GlyphSegment &segment)
{
    Glyph g;

    for (int c = 0; c < BADGE_GLYPH_WIDTH; c++) {
        uint8_t v = segment[columnByte[c]];
        for (int r = 0; r < 8; r++)
            g.pixels[r][c] = (v & (0x80 >> r)) != 0;
    }

    for (int pair = 0; pair < BADGE_GLYPH_WIDTH / 2; pair++) {
        uint8_t v = segment[lowRowsByte[pair]];
        for (int r = 0; r < 4; r++) {
            g.pixels[8 + r][2 * pair] = (v & (0x80 >> r)) != 0;
            g.pixels[8 + r][2 * pair + 1] = (v & (0x08 >> r)) != 0;
        }
    }

    return g;
}

bool Font::addGlyph(uint32_t codepoint, const std::vector<GlyphSegment> &segments)
{
    if (segments.empty())
        return false;
    glyphs[codepoint] = segments;
    return true;
}

const std::vector<GlyphSegment> *Font::find(uint32_t codepoint) const
{
    auto it = glyphs.find(codepoint);
    return it == glyphs.end() ? nullptr : &it->second;
}

void Font::merge(const Font &other)
{
    for (auto &kv : other.glyphs)
        glyphs[kv.first] = kv.second;
}

bool decodeUtf8(const std::string &text, std::vector<uint32_t> &codepoints)
{
    codepoints.clear();
    size_t i = 0;
    while (i < text.size()) {
        uint8_t lead = (uint8_t)text[i];
        uint32_t cp;
        int extra;
        if (lead < 0x80) {
            cp = lead;
            extra = 0;
        } else if ((lead & 0xE0) == 0xC0) {
            cp = lead & 0x1F;
            extra = 1;
        } else if ((lead & 0xF0) == 0xE0) {
            cp = lead & 0x0F;
            extra = 2;
        } else if ((lead & 0xF8) == 0xF0) {
            cp = lead & 0x07;
            extra = 3;
        } else {
            return false;
        }
        if (text.size() - i <= (size_t)extra)
            return false;
        for (int k = 1; k <= extra; k++) {
            uint8_t cont = (uint8_t)text[i + k];
            if ((cont & 0xC0) != 0x80)
                return false;
            cp = (cp << 6) | (cont & 0x3F);
        }
        codepoints.push_back(cp);
        i += extra + 1;
    }
    return true;
}

BadgeError renderText(const std::string &text, const Font &font, std::vector<GlyphSegment> &segments, uint32_t *badCodepoint)
{
    segments.clear();

    std::vector<uint32_t> codepoints;
    if (!decodeUtf8(text, codepoints)) {
        LOG_WARN("Text is not valid UTF-8");
        if (badCodepoint)
            *badCodepoint = 0xFFFD;
        return BadgeError::UNSUPPORTED_CHARACTER;
    }

    for (uint32_t cp : codepoints) {
        const std::vector<GlyphSegment> *glyph = font.find(cp);
        if (!glyph) {
            LOG_WARN("No glyph for U+%04X", (unsigned)cp);
            if (badCodepoint)
                *badCodepoint = cp;
            segments.clear();
            return BadgeError::UNSUPPORTED_CHARACTER;
        }
        segments.insert(segments.end(), glyph->begin(), glyph->end());
    }

    return BadgeError::NONE;
}

size_t totalByteLength(const std::vector<GlyphSegment> &segments)
{
    return segments.size() * BADGE_SEGMENT_BYTES;
}

std::vector<uint8_t> flattenSegments(const std::vector<GlyphSegment> &segments)
{
    std::vector<uint8_t> out;
    out.reserve(totalByteLength(segments));
    for (auto &s : segments)
        out.insert(out.end(), s.begin(), s.end());
    return out;
}

std::string renderAsciiArt(const std::vector<uint8_t> &payload)
{
    std::vector<Glyph> cells;
    for (size_t off = 0; off + BADGE_SEGMENT_BYTES <= payload.size(); off += BADGE_SEGMENT_BYTES) {
        GlyphSegment s;
        std::copy(payload.begin() + off, payload.begin() + off + BADGE_SEGMENT_BYTES, s.begin());
        cells.push_back(decodeGlyph(s));
    }

    std::string out;
    for (int r = 0; r < BADGE_GLYPH_HEIGHT; r++) {
        for (auto &g : cells)
            for (int c = 0; c < BADGE_GLYPH_WIDTH; c++)
                out += g.pixels[r][c] ? '#' : '.';
        out += '\n';
    }
    return out;
}
