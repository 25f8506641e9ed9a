#include "DebugConfiguration.h"
#include "DefaultFont.h"
#include <yaml-cpp/yaml.h>

// Turn one '#'/'.' picture (12 rows, width a multiple of 6) into its segments
static bool parseGlyphRows(const std::string &name, const YAML::Node &rows, std::vector<GlyphSegment> &segments)
{
    if (!rows.IsSequence() || rows.size() != BADGE_GLYPH_HEIGHT) {
        LOG_ERROR("Glyph '%s' needs exactly %d rows", name.c_str(), BADGE_GLYPH_HEIGHT);
        return false;
    }

    std::vector<std::string> lines;
    for (size_t r = 0; r < rows.size(); r++)
        lines.push_back(rows[r].as<std::string>());

    size_t width = lines[0].size();
    if (width == 0 || width % BADGE_GLYPH_WIDTH != 0) {
        LOG_ERROR("Glyph '%s' is %u pixels wide, must be a multiple of %d", name.c_str(), (unsigned)width, BADGE_GLYPH_WIDTH);
        return false;
    }

    segments.clear();
    for (size_t s = 0; s < width / BADGE_GLYPH_WIDTH; s++) {
        Glyph g;
        for (int r = 0; r < BADGE_GLYPH_HEIGHT; r++) {
            if (lines[r].size() != width) {
                LOG_ERROR("Glyph '%s' row %d has the wrong width", name.c_str(), r);
                return false;
            }
            for (int c = 0; c < BADGE_GLYPH_WIDTH; c++) {
                char px = lines[r][s * BADGE_GLYPH_WIDTH + c];
                if (px != '#' && px != '.') {
                    LOG_ERROR("Glyph '%s' has unexpected pixel '%c'", name.c_str(), px);
                    return false;
                }
                g.pixels[r][c] = px == '#';
            }
        }
        segments.push_back(encodeGlyph(g));
    }
    return true;
}

static BadgeError loadFontNode(const YAML::Node &root, Font &font)
{
    const YAML::Node glyphs = root["Glyphs"];
    if (!glyphs || !glyphs.IsMap()) {
        LOG_ERROR("Font has no Glyphs map");
        return BadgeError::INVALID_FILE;
    }

    Font loaded;
    for (auto it = glyphs.begin(); it != glyphs.end(); ++it) {
        std::string name = it->first.as<std::string>();
        std::vector<uint32_t> codepoints;
        if (!decodeUtf8(name, codepoints) || codepoints.size() != 1) {
            LOG_ERROR("Font key '%s' must be a single character", name.c_str());
            return BadgeError::INVALID_FILE;
        }

        std::vector<GlyphSegment> segments;
        if (!parseGlyphRows(name, it->second, segments))
            return BadgeError::INVALID_FILE;
        loaded.addGlyph(codepoints[0], segments);
    }

    font.merge(loaded);
    LOG_DEBUG("Loaded %u glyphs", (unsigned)loaded.size());
    return BadgeError::NONE;
}

BadgeError loadFontYaml(const std::string &yamlText, Font &font)
{
    try {
        return loadFontNode(YAML::Load(yamlText), font);
    } catch (YAML::Exception &e) {
        LOG_ERROR("Font parse failed: %s", e.what());
        return BadgeError::INVALID_FILE;
    }
}

BadgeError loadFontFile(const std::string &path, Font &font)
{
    try {
        BadgeError err = loadFontNode(YAML::LoadFile(path), font);
        if (err == BadgeError::NONE)
            LOG_INFO("Using font file %s", path.c_str());
        return err;
    } catch (YAML::Exception &e) {
        LOG_ERROR("Unable to use font file %s: %s", path.c_str(), e.what());
        return BadgeError::INVALID_FILE;
    }
}
