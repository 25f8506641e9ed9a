#pragma once

#include <stddef.h>
#include <stdint.h>
#include <string>
#include <vector>

/// The two characteristics we write to
enum class BadgeCharacteristic { COMMAND, IMAGE_UPLOAD };

enum class TransportStatus { OK, TIMEOUT, ERROR };

const char *badgeCharacteristicName(BadgeCharacteristic c);

/**
 * A connection to one badge.
 *
 * Implementations serialize writes per connection and own reconnection, the protocol
 * code above only ever sees the calls below.
 */
class BadgeTransport
{
  public:
    virtual ~BadgeTransport() {}

    virtual bool isConnected() const = 0;

    /**
     * Write one packet to a characteristic.
     * @return false on failure, lastError() then describes it
     */
    virtual bool write(BadgeCharacteristic characteristic, const uint8_t *bytes, size_t len) = 0;

    /**
     * Block until the next notification arrives or timeoutMsec passes.
     *
     * Notifications that arrived while nobody was waiting are queued and returned first.
     */
    virtual TransportStatus waitForNotification(std::vector<uint8_t> &frame, uint32_t timeoutMsec) = 0;

    /**
     * Throw away every notification that has already arrived, without waiting for more.
     * Called before each command that expects an answer, so a late or duplicate reply
     * can't be taken for the new one.
     * @return how many were dropped
     */
    virtual size_t flushNotifications() = 0;

    /// Human readable description of the last failure
    virtual std::string lastError() const = 0;
};
