#include "BadgeTransport.h"

const char *badgeCharacteristicName(BadgeCharacteristic c)
{
    return c == BadgeCharacteristic::COMMAND ? "COMMAND" : "IMAGE_UPLOAD";
}
