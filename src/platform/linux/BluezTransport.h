#pragma once

#include "badge/BadgeTransport.h"
#include "concurrency/Lock.h"
#include "configuration.h"
#include <deque>
#include <stdint.h>
#include <string>
#include <vector>

#if !LEDBADGE_EXCLUDE_BLUEZ

/// One advertiser heard during a scan
struct BadgeAdvert {
    std::string address;
    std::string name;
    bool randomAddress = false;
    int8_t rssi = 0;
};

/**
 * LE scan on the default HCI adapter for the given number of seconds.
 * Only advertisers whose name contains nameFilter are kept (empty keeps everything).
 * @return false if the adapter could not be opened or the scan could not be started
 */
bool scanForBadges(int seconds, const std::string &nameFilter, std::vector<BadgeAdvert> &found);

/**
 * Talks ATT directly over an L2CAP LE socket, no D-Bus.
 *
 * On connect we discover the COMMAND, IMAGE_UPLOAD and NOTIFY characteristic value handles
 * by UUID and switch notifications on. COMMAND writes wait for the write response,
 * IMAGE_UPLOAD writes are write-without-response. Notifications that show up while a
 * response is awaited are queued for waitForNotification().
 */
class BluezTransport : public BadgeTransport
{
  public:
    BluezTransport() {}
    virtual ~BluezTransport();

    BluezTransport(const BluezTransport &) = delete;
    BluezTransport &operator=(const BluezTransport &) = delete;

    /**
     * Connect, discover and subscribe.
     * @return false on any failure, lastError() says which step
     */
    bool connect(const std::string &address, bool randomAddress, uint32_t timeoutMsec);

    void disconnect();

    virtual bool isConnected() const override { return sock >= 0; }
    virtual bool write(BadgeCharacteristic characteristic, const uint8_t *bytes, size_t len) override;
    virtual TransportStatus waitForNotification(std::vector<uint8_t> &frame, uint32_t timeoutMsec) override;
    virtual size_t flushNotifications() override;
    virtual std::string lastError() const override { return errorText; }

  private:
    /// Send a request and wait for its response PDU, queueing notifications seen meanwhile
    bool request(const std::vector<uint8_t> &pdu, uint8_t expectedOpcode, std::vector<uint8_t> &response);

    /// Read one PDU, 0 on timeout, -1 on error
    int readPdu(std::vector<uint8_t> &pdu, uint32_t timeoutMsec);

    /// Queue a notification PDU if it is for us, returns true if pdu was a notification/indication
    bool handleServerPdu(const std::vector<uint8_t> &pdu);

    bool discoverHandles();
    bool enableNotifications();
    bool setError(const std::string &what);

    int sock = -1;
    uint32_t requestTimeoutMsec = LEDBADGE_DEFAULT_ACK_TIMEOUT_MS;

    uint16_t commandHandle = 0;
    uint16_t imageHandle = 0;
    uint16_t notifyHandle = 0;
    uint16_t notifyEndHandle = 0xFFFF;

    std::deque<std::vector<uint8_t>> notifications;
    std::string errorText;

    concurrency::Lock writeLock;
};

#endif
