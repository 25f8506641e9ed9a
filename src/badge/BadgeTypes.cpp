#include "BadgeTypes.h"

const char *badgeErrorName(BadgeError err)
{
    switch (err) {
    case BadgeError::NONE:
        return "NONE";
    case BadgeError::PAYLOAD_TOO_LARGE:
        return "PAYLOAD_TOO_LARGE";
    case BadgeError::INVALID_ARGUMENT:
        return "INVALID_ARGUMENT";
    case BadgeError::INVALID_BLOCK_LENGTH:
        return "INVALID_BLOCK_LENGTH";
    case BadgeError::UNSUPPORTED_CHARACTER:
        return "UNSUPPORTED_CHARACTER";
    case BadgeError::MALFORMED_FRAME:
        return "MALFORMED_FRAME";
    case BadgeError::UNEXPECTED_RESPONSE:
        return "UNEXPECTED_RESPONSE";
    case BadgeError::TRANSPORT:
        return "TRANSPORT";
    case BadgeError::TIMEOUT:
        return "TIMEOUT";
    case BadgeError::CANCELLED:
        return "CANCELLED";
    case BadgeError::BUSY:
        return "BUSY";
    case BadgeError::NOT_CONNECTED:
        return "NOT_CONNECTED";
    case BadgeError::INVALID_FILE:
        return "INVALID_FILE";
    }
    return "UNKNOWN";
}
