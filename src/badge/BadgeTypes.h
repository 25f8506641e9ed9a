#pragma once

#include <array>
#include <stdint.h>
#include <string>
#include <vector>

/// Size of every block that goes over the air, both directions
#define BADGE_BLOCK_SIZE 16

/// A plaintext block is [len][payload][pad], so at most this many meaningful bytes
#define BADGE_MAX_PAYLOAD (BADGE_BLOCK_SIZE - 1)

/// Bytes per 6x12 glyph segment
#define BADGE_SEGMENT_BYTES 9

#define BADGE_GLYPH_WIDTH 6
#define BADGE_GLYPH_HEIGHT 12

// GATT characteristics exposed by the badge
#define BADGE_COMMAND_UUID "d44bc439-abfd-45a2-b575-925416129600"
#define BADGE_IMAGE_UPLOAD_UUID "d44bc439-abfd-45a2-b575-92541612960a"
#define BADGE_NOTIFY_UUID "d44bc439-abfd-45a2-b575-925416129601"

/// One 16 byte AES block, either plaintext or ciphertext
typedef std::array<uint8_t, BADGE_BLOCK_SIZE> BadgeBlock;

/// Everything that can go wrong between the caller and the badge
enum class BadgeError {
    NONE = 0,
    PAYLOAD_TOO_LARGE,     // command name + args (or a DATS length) does not fit
    INVALID_ARGUMENT,      // argument shape rejected before encoding
    INVALID_BLOCK_LENGTH,  // cipher input was not exactly one block
    UNSUPPORTED_CHARACTER, // text contains a character the font has no glyph for
    MALFORMED_FRAME,       // notification could not be sliced into a ciphertext block
    UNEXPECTED_RESPONSE,   // badge answered with something other than the awaited ack
    TRANSPORT,
    TIMEOUT,
    CANCELLED,
    BUSY, // another transfer is already in flight
    NOT_CONNECTED,
    INVALID_FILE,
};

/// Stable printable name, for logs and the CLI
const char *badgeErrorName(BadgeError err);

/// Why an upload session ended in FAILED, plus whatever detail we have
struct TransferFailure {
    BadgeError reason = BadgeError::NONE;

    /// The unrecognized token for UNEXPECTED_RESPONSE, the transport's text for TRANSPORT
    std::string detail;
};
