#pragma once

#include "GlyphCodec.h"

/// The built in 6x12 font: printable ASCII plus a two segment heart (U+2665) and smiley (U+263A)
Font defaultFont();

/**
 * Load a YAML font file and merge it over font.
 *
 * The file has a single "Glyphs" map from a one character key to 12 strings of '#'
 * and '.', all the same width, a multiple of 6 pixels.
 * @return INVALID_FILE if the file can't be read or a glyph is malformed, font is unchanged then
 */
BadgeError loadFontFile(const std::string &path, Font &font);

/// As loadFontFile but from YAML text already in memory
BadgeError loadFontYaml(const std::string &yamlText, Font &font);
