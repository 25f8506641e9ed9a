#include "DefaultFont.h"
#include <algorithm>

namespace
{

struct BuiltinGlyph {
    uint32_t codepoint;
    uint8_t segments;
    uint8_t bytes[2 * BADGE_SEGMENT_BYTES];
};

// 6x12 cells: two blank rows on top, eight rows for the body, two rows for descenders
const BuiltinGlyph builtinGlyphs[] = {
    {0x0020, 1, {0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00}}, // ' '
    {0x0021, 1, {0x00, 0x00, 0x00, 0x3f, 0x40, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00}}, // '!'
    {0x0022, 1, {0x00, 0x00, 0x30, 0x00, 0x00, 0x30, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00}}, // '"'
    {0x0023, 1, {0x09, 0x0c, 0x3f, 0x09, 0x0c, 0x3f, 0x09, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00}}, // '#'
    {0x0024, 1, {0x08, 0x88, 0x14, 0x3f, 0xc8, 0x14, 0x13, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00}}, // '$'
    {0x0025, 1, {0x31, 0x00, 0x32, 0x04, 0x08, 0x09, 0x11, 0x80, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00}}, // '%'
    {0x0026, 1, {0x1b, 0x84, 0x24, 0x26, 0x48, 0x19, 0x02, 0x84, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00}}, // '&'
    {0x0027, 1, {0x00, 0x00, 0x00, 0x30, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00}}, // '''
    {0x0028, 1, {0x00, 0x00, 0x0f, 0x10, 0x84, 0x20, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00}}, // '('
    {0x0029, 1, {0x00, 0x04, 0x20, 0x10, 0x80, 0x0f, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00}}, // ')'
    {0x002a, 1, {0x0a, 0x00, 0x04, 0x1f, 0x00, 0x04, 0x0a, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00}}, // '*'
    {0x002b, 1, {0x04, 0x00, 0x04, 0x1f, 0x00, 0x04, 0x04, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00}}, // '+'
    {0x002c, 1, {0x00, 0x0d, 0x00, 0x00, 0xe0, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00}}, // ','
    {0x002d, 1, {0x04, 0x00, 0x04, 0x04, 0x00, 0x04, 0x04, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00}}, // '-'
    {0x002e, 1, {0x00, 0x0c, 0x00, 0x00, 0xc0, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00}}, // '.'
    {0x002f, 1, {0x00, 0xc0, 0x01, 0x06, 0x00, 0x08, 0x30, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00}}, // '/'
    {0x0030, 1, {0x1f, 0x84, 0x21, 0x26, 0x44, 0x28, 0x1f, 0x80, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00}}, // '0'
    {0x0031, 1, {0x00, 0x04, 0x10, 0x3f, 0xc4, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00}}, // '1'
    {0x0032, 1, {0x10, 0xc4, 0x21, 0x22, 0x44, 0x24, 0x18, 0x40, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00}}, // '2'
    {0x0033, 1, {0x10, 0x84, 0x20, 0x24, 0x44, 0x24, 0x1b, 0x80, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00}}, // '3'
    {0x0034, 1, {0x06, 0x00, 0x0a, 0x12, 0x0c, 0x3f, 0x02, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00}}, // '4'
    {0x0035, 1, {0x38, 0x84, 0x28, 0x28, 0x44, 0x28, 0x27, 0x80, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00}}, // '5'
    {0x0036, 1, {0x0f, 0x84, 0x14, 0x24, 0x44, 0x24, 0x03, 0x80, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00}}, // '6'
    {0x0037, 1, {0x20, 0x0c, 0x20, 0x23, 0x00, 0x2c, 0x30, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00}}, // '7'
    {0x0038, 1, {0x1b, 0x84, 0x24, 0x24, 0x44, 0x24, 0x1b, 0x80, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00}}, // '8'
    {0x0039, 1, {0x1c, 0x04, 0x22, 0x22, 0x48, 0x22, 0x1f, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00}}, // '9'
    {0x003a, 1, {0x00, 0x08, 0x0d, 0x0d, 0x80, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00}}, // ':'
    {0x003b, 1, {0x00, 0x0a, 0x0d, 0x0d, 0xc0, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00}}, // ';'
    {0x003c, 1, {0x02, 0x00, 0x05, 0x08, 0x84, 0x10, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00}}, // '<'
    {0x003d, 1, {0x0a, 0x00, 0x0a, 0x0a, 0x00, 0x0a, 0x0a, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00}}, // '='
    {0x003e, 1, {0x00, 0x04, 0x10, 0x08, 0x80, 0x05, 0x02, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00}}, // '>'
    {0x003f, 1, {0x10, 0x00, 0x20, 0x23, 0x40, 0x24, 0x18, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00}}, // '?'
    {0x0040, 1, {0x1f, 0x84, 0x20, 0x2e, 0x44, 0x2a, 0x1e, 0x80, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00}}, // '@'
    {0x0041, 1, {0x0f, 0xc0, 0x12, 0x22, 0x00, 0x12, 0x0f, 0xc0, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00}}, // 'A'
    {0x0042, 1, {0x20, 0x4c, 0x3f, 0x24, 0x44, 0x24, 0x1b, 0x80, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00}}, // 'B'
    {0x0043, 1, {0x1f, 0x84, 0x20, 0x20, 0x44, 0x20, 0x10, 0x80, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00}}, // 'C'
    {0x0044, 1, {0x3f, 0xc4, 0x20, 0x20, 0x48, 0x10, 0x0f, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00}}, // 'D'
    {0x0045, 1, {0x3f, 0xc4, 0x24, 0x24, 0x44, 0x24, 0x20, 0x40, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00}}, // 'E'
    {0x0046, 1, {0x3f, 0xc0, 0x24, 0x24, 0x00, 0x24, 0x20, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00}}, // 'F'
    {0x0047, 1, {0x1f, 0x84, 0x20, 0x22, 0x44, 0x22, 0x13, 0xc0, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00}}, // 'G'
    {0x0048, 1, {0x3f, 0xc0, 0x04, 0x04, 0x00, 0x04, 0x3f, 0xc0, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00}}, // 'H'
    {0x0049, 1, {0x00, 0x04, 0x20, 0x3f, 0xc4, 0x20, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00}}, // 'I'
    {0x004a, 1, {0x01, 0x84, 0x00, 0x20, 0x48, 0x3f, 0x20, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00}}, // 'J'
    {0x004b, 1, {0x3f, 0xc0, 0x04, 0x0a, 0x00, 0x11, 0x20, 0xc0, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00}}, // 'K'
    {0x004c, 1, {0x3f, 0xc4, 0x00, 0x00, 0x44, 0x00, 0x00, 0x40, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00}}, // 'L'
    {0x004d, 1, {0x3f, 0xc0, 0x3c, 0x03, 0xc0, 0x3c, 0x3f, 0xc0, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00}}, // 'M'
    {0x004e, 1, {0x3f, 0xc0, 0x18, 0x06, 0x08, 0x01, 0x3f, 0xc0, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00}}, // 'N'
    {0x004f, 1, {0x1f, 0x84, 0x20, 0x20, 0x44, 0x20, 0x1f, 0x80, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00}}, // 'O'
    {0x0050, 1, {0x3f, 0xc0, 0x24, 0x24, 0x00, 0x24, 0x18, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00}}, // 'P'
    {0x0051, 1, {0x1f, 0x84, 0x20, 0x21, 0x48, 0x20, 0x1f, 0x40, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00}}, // 'Q'
    {0x0052, 1, {0x3f, 0xc0, 0x24, 0x26, 0x00, 0x25, 0x18, 0xc0, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00}}, // 'R'
    {0x0053, 1, {0x18, 0x84, 0x24, 0x24, 0x44, 0x24, 0x13, 0x80, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00}}, // 'S'
    {0x0054, 1, {0x20, 0x00, 0x20, 0x3f, 0xc0, 0x20, 0x20, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00}}, // 'T'
    {0x0055, 1, {0x3f, 0x84, 0x00, 0x00, 0x44, 0x00, 0x3f, 0x80, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00}}, // 'U'
    {0x0056, 1, {0x3e, 0x08, 0x01, 0x00, 0x48, 0x01, 0x3e, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00}}, // 'V'
    {0x0057, 1, {0x3f, 0xc8, 0x00, 0x07, 0x08, 0x00, 0x3f, 0xc0, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00}}, // 'W'
    {0x0058, 1, {0x30, 0xc0, 0x09, 0x06, 0x00, 0x09, 0x30, 0xc0, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00}}, // 'X'
    {0x0059, 1, {0x30, 0x00, 0x08, 0x07, 0xc0, 0x08, 0x30, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00}}, // 'Y'
    {0x005a, 1, {0x20, 0xc4, 0x21, 0x26, 0x44, 0x28, 0x30, 0x40, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00}}, // 'Z'
    {0x005b, 1, {0x00, 0x0c, 0x3f, 0x20, 0x44, 0x20, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00}}, // '['
    {0x005c, 1, {0x30, 0x00, 0x08, 0x06, 0x00, 0x01, 0x00, 0xc0, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00}}, // backslash
    {0x005d, 1, {0x00, 0x04, 0x20, 0x20, 0x4c, 0x3f, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00}}, // ']'
    {0x005e, 1, {0x08, 0x00, 0x10, 0x20, 0x00, 0x10, 0x08, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00}}, // '^'
    {0x005f, 1, {0x00, 0x22, 0x00, 0x00, 0x22, 0x00, 0x00, 0x20, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00}}, // '_'
    {0x0060, 1, {0x00, 0x00, 0x20, 0x10, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00}}, // '`'
    {0x0061, 1, {0x00, 0x08, 0x02, 0x05, 0x44, 0x05, 0x03, 0xc4, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00}}, // 'a'
    {0x0062, 1, {0x3f, 0xc4, 0x04, 0x04, 0x44, 0x04, 0x03, 0x80, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00}}, // 'b'
    {0x0063, 1, {0x00, 0x08, 0x03, 0x04, 0x44, 0x04, 0x06, 0x40, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00}}, // 'c'
    {0x0064, 1, {0x00, 0x08, 0x03, 0x04, 0x44, 0x24, 0x3f, 0xc4, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00}}, // 'd'
    {0x0065, 1, {0x00, 0x08, 0x03, 0x05, 0x44, 0x05, 0x03, 0x40, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00}}, // 'e'
    {0x0066, 1, {0x04, 0x0c, 0x1f, 0x24, 0x00, 0x20, 0x10, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00}}, // 'f'
    {0x0067, 1, {0x00, 0x0e, 0x02, 0x05, 0x55, 0x05, 0x06, 0x52, 0x04, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00}}, // 'g'
    {0x0068, 1, {0x3f, 0xc0, 0x04, 0x04, 0x00, 0x04, 0x03, 0xc0, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00}}, // 'h'
    {0x0069, 1, {0x00, 0x04, 0x04, 0x27, 0xc4, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00}}, // 'i'
    {0x006a, 1, {0x00, 0x21, 0x00, 0x04, 0x1e, 0x27, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00}}, // 'j'
    {0x006b, 1, {0x3f, 0xc0, 0x02, 0x05, 0x08, 0x08, 0x00, 0x40, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00}}, // 'k'
    {0x006c, 1, {0x00, 0x04, 0x20, 0x3f, 0xc4, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00}}, // 'l'
    {0x006d, 1, {0x07, 0xc0, 0x04, 0x03, 0xc0, 0x04, 0x03, 0xc0, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00}}, // 'm'
    {0x006e, 1, {0x04, 0x4c, 0x07, 0x04, 0x40, 0x04, 0x03, 0xc4, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00}}, // 'n'
    {0x006f, 1, {0x03, 0x84, 0x04, 0x04, 0x44, 0x04, 0x03, 0x80, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00}}, // 'o'
    {0x0070, 1, {0x07, 0xf4, 0x04, 0x04, 0x44, 0x04, 0x03, 0x80, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00}}, // 'p'
    {0x0071, 1, {0x03, 0x84, 0x04, 0x04, 0x44, 0x04, 0x07, 0xf0, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00}}, // 'q'
    {0x0072, 1, {0x04, 0x4c, 0x07, 0x02, 0x40, 0x04, 0x04, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00}}, // 'r'
    {0x0073, 1, {0x02, 0x44, 0x05, 0x05, 0x44, 0x05, 0x04, 0x80, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00}}, // 's'
    {0x0074, 1, {0x04, 0x08, 0x3f, 0x04, 0x44, 0x04, 0x00, 0x80, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00}}, // 't'
    {0x0075, 1, {0x07, 0x84, 0x00, 0x00, 0x48, 0x00, 0x07, 0xc0, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00}}, // 'u'
    {0x0076, 1, {0x07, 0x08, 0x00, 0x00, 0x48, 0x00, 0x07, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00}}, // 'v'
    {0x0077, 1, {0x07, 0x84, 0x00, 0x03, 0x84, 0x00, 0x07, 0x80, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00}}, // 'w'
    {0x0078, 1, {0x04, 0x48, 0x02, 0x01, 0x08, 0x02, 0x04, 0x40, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00}}, // 'x'
    {0x0079, 1, {0x07, 0x85, 0x00, 0x00, 0x59, 0x00, 0x07, 0xe0, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00}}, // 'y'
    {0x007a, 1, {0x04, 0x4c, 0x04, 0x05, 0x44, 0x06, 0x04, 0x40, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00}}, // 'z'
    {0x007b, 1, {0x00, 0x00, 0x04, 0x1b, 0x84, 0x20, 0x20, 0x40, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00}}, // '{'
    {0x007c, 1, {0x00, 0x00, 0x00, 0x3f, 0xc0, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00}}, // '|'
    {0x007d, 1, {0x20, 0x44, 0x20, 0x1b, 0x80, 0x04, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00}}, // '}'
    {0x007e, 1, {0x04, 0x00, 0x08, 0x08, 0x00, 0x04, 0x04, 0x00, 0x08, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00}}, // '~'
    {0x2665, 2, {0x1c, 0x00, 0x3e, 0x3f, 0x08, 0x3f, 0x1f, 0xce, 0x0f, 0x1f, 0xc8, 0x3f, 0x3f, 0x00, 0x3e, 0x1c, 0x00, 0x00}}, // heart
    {0x263a, 2, {0x00, 0x00, 0x0f, 0x10, 0x84, 0x22, 0x29, 0x44, 0x21, 0x21, 0x44, 0x29, 0x22, 0x48, 0x10, 0x0f, 0x00, 0x00}}, // smiley
};

} // namespace

Font defaultFont()
{
    Font font;
    for (const BuiltinGlyph &g : builtinGlyphs) {
        std::vector<GlyphSegment> segments(g.segments);
        for (uint8_t s = 0; s < g.segments; s++)
            std::copy(g.bytes + s * BADGE_SEGMENT_BYTES, g.bytes + (s + 1) * BADGE_SEGMENT_BYTES, segments[s].begin());
        font.addGlyph(g.codepoint, segments);
    }
    return font;
}
