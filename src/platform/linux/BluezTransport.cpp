#include "BluezTransport.h"

#if !LEDBADGE_EXCLUDE_BLUEZ

#include "DebugConfiguration.h"
#include "badge/BadgeTypes.h"
#include "badgeUtils.h"
#include "concurrency/LockGuard.h"
#include <algorithm>
#include <bluetooth/bluetooth.h>
#include <bluetooth/hci.h>
#include <bluetooth/hci_lib.h>
#include <bluetooth/l2cap.h>
#include <errno.h>
#include <map>
#include <poll.h>
#include <string.h>
#include <sys/socket.h>
#include <unistd.h>

// ATT runs on this fixed L2CAP channel
#define ATT_CID 4

// The only MTU we can count on without an exchange
#define ATT_DEFAULT_MTU 23

#define ATT_OP_ERROR 0x01
#define ATT_OP_FIND_INFO_REQ 0x04
#define ATT_OP_FIND_INFO_RESP 0x05
#define ATT_OP_READ_BY_TYPE_REQ 0x08
#define ATT_OP_READ_BY_TYPE_RESP 0x09
#define ATT_OP_WRITE_REQ 0x12
#define ATT_OP_WRITE_RESP 0x13
#define ATT_OP_HANDLE_NOTIFY 0x1B
#define ATT_OP_HANDLE_IND 0x1D
#define ATT_OP_HANDLE_CNF 0x1E
#define ATT_OP_WRITE_CMD 0x52

#define ATT_ECODE_ATTR_NOT_FOUND 0x0A

// Oldest notifications are dropped beyond this, nobody is reading them anyway
#define MAX_QUEUED_NOTIFICATIONS 32

#define GATT_CHARAC_UUID 0x2803
#define GATT_CLIENT_CHARAC_CFG_UUID 0x2902

static uint16_t getLe16(const uint8_t *p)
{
    return (uint16_t)(p[0] | (p[1] << 8));
}

static void putLe16(std::vector<uint8_t> &v, uint16_t x)
{
    v.push_back(x & 0xFF);
    v.push_back(x >> 8);
}

/// "d44bc439-abfd-..." into the little endian byte order ATT uses on the wire
static bool uuidToAtt(const char *uuid, uint8_t out[16])
{
    std::string digits;
    for (const char *p = uuid; *p; p++)
        if (*p != '-')
            digits += *p;

    uint8_t be[16];
    if (hexToBytes(digits, be, sizeof(be)) != 16)
        return false;
    for (int i = 0; i < 16; i++)
        out[i] = be[15 - i];
    return true;
}

BluezTransport::~BluezTransport()
{
    disconnect();
}

bool BluezTransport::setError(const std::string &what)
{
    errorText = what;
    LOG_ERROR("Bluetooth: %s", what.c_str());
    return false;
}

void BluezTransport::disconnect()
{
    if (sock >= 0) {
        LOG_INFO("Disconnecting from badge");
        close(sock);
        sock = -1;
    }
    notifications.clear();
}

bool BluezTransport::connect(const std::string &address, bool randomAddress, uint32_t timeoutMsec)
{
    disconnect();
    requestTimeoutMsec = timeoutMsec;

    struct sockaddr_l2 local;
    memset(&local, 0, sizeof(local));
    local.l2_family = AF_BLUETOOTH;
    local.l2_cid = htobs(ATT_CID);
    local.l2_bdaddr_type = BDADDR_LE_PUBLIC;

    struct sockaddr_l2 remote;
    memset(&remote, 0, sizeof(remote));
    remote.l2_family = AF_BLUETOOTH;
    remote.l2_cid = htobs(ATT_CID);
    remote.l2_bdaddr_type = randomAddress ? BDADDR_LE_RANDOM : BDADDR_LE_PUBLIC;
    if (str2ba(address.c_str(), &remote.l2_bdaddr) < 0)
        return setError("bad address " + address);

    sock = socket(PF_BLUETOOTH, SOCK_SEQPACKET, BTPROTO_L2CAP);
    if (sock < 0)
        return setError(std::string("socket: ") + strerror(errno));

    if (bind(sock, (struct sockaddr *)&local, sizeof(local)) < 0) {
        setError(std::string("bind: ") + strerror(errno));
        disconnect();
        return false;
    }

    struct bt_security sec;
    memset(&sec, 0, sizeof(sec));
    sec.level = BT_SECURITY_LOW;
    if (setsockopt(sock, SOL_BLUETOOTH, BT_SECURITY, &sec, sizeof(sec)) < 0)
        LOG_WARN("Unable to set security level: %s", strerror(errno));

    LOG_INFO("Connecting to %s (%s)", address.c_str(), randomAddress ? "random" : "public");
    if (::connect(sock, (struct sockaddr *)&remote, sizeof(remote)) < 0) {
        setError("connect " + address + ": " + strerror(errno));
        disconnect();
        return false;
    }

    if (!discoverHandles() || !enableNotifications()) {
        disconnect();
        return false;
    }

    LOG_INFO("Connected, command 0x%04x image 0x%04x notify 0x%04x", commandHandle, imageHandle, notifyHandle);
    return true;
}

int BluezTransport::readPdu(std::vector<uint8_t> &pdu, uint32_t timeoutMsec)
{
    struct pollfd pfd;
    pfd.fd = sock;
    pfd.events = POLLIN;
    pfd.revents = 0;

    int rc = poll(&pfd, 1, (int)timeoutMsec);
    if (rc == 0)
        return 0;
    if (rc < 0) {
        if (errno == EINTR)
            return 0;
        setError(std::string("poll: ") + strerror(errno));
        return -1;
    }
    if (pfd.revents & (POLLERR | POLLHUP)) {
        setError("connection lost");
        return -1;
    }

    uint8_t buf[512];
    ssize_t n = read(sock, buf, sizeof(buf));
    if (n <= 0) {
        setError(n == 0 ? "connection closed" : std::string("read: ") + strerror(errno));
        return -1;
    }
    pdu.assign(buf, buf + n);
    return 1;
}

bool BluezTransport::handleServerPdu(const std::vector<uint8_t> &pdu)
{
    if (pdu.empty() || (pdu[0] != ATT_OP_HANDLE_NOTIFY && pdu[0] != ATT_OP_HANDLE_IND))
        return false;

    if (pdu[0] == ATT_OP_HANDLE_IND) {
        uint8_t cnf = ATT_OP_HANDLE_CNF;
        if (::write(sock, &cnf, 1) != 1)
            LOG_WARN("Unable to confirm indication: %s", strerror(errno));
    }

    if (pdu.size() < 3)
        return true;
    uint16_t handle = getLe16(&pdu[1]);
    if (handle != notifyHandle) {
        LOG_DEBUG("Ignoring notification on handle 0x%04x", handle);
        return true;
    }
    if (notifications.size() >= MAX_QUEUED_NOTIFICATIONS) {
        LOG_WARN("Notification queue full, dropping the oldest");
        notifications.pop_front();
    }
    notifications.emplace_back(pdu.begin() + 3, pdu.end());
    return true;
}

bool BluezTransport::request(const std::vector<uint8_t> &pdu, uint8_t expectedOpcode, std::vector<uint8_t> &response)
{
    if (::write(sock, pdu.data(), pdu.size()) != (ssize_t)pdu.size())
        return setError(std::string("write: ") + strerror(errno));

    uint32_t deadline = monotonicMillis() + requestTimeoutMsec;
    for (;;) {
        int32_t remaining = (int32_t)(deadline - monotonicMillis());
        if (remaining <= 0)
            return setError("no response to ATT request");

        int rc = readPdu(response, remaining);
        if (rc < 0)
            return false;
        if (rc == 0)
            continue;
        if (handleServerPdu(response))
            continue;
        if (response[0] == expectedOpcode || response[0] == ATT_OP_ERROR)
            return true;
        LOG_DEBUG("Unexpected ATT opcode 0x%02x", response[0]);
    }
}

bool BluezTransport::discoverHandles()
{
    uint8_t commandUuid[16], imageUuid[16], notifyUuid[16];
    if (!uuidToAtt(BADGE_COMMAND_UUID, commandUuid) || !uuidToAtt(BADGE_IMAGE_UPLOAD_UUID, imageUuid) ||
        !uuidToAtt(BADGE_NOTIFY_UUID, notifyUuid))
        return setError("bad characteristic uuid");

    // declaration handle -> value handle of every characteristic, to bound the NOTIFY descriptors
    std::map<uint16_t, uint16_t> declarations;

    uint16_t start = 0x0001;
    while (start != 0) {
        std::vector<uint8_t> req = {ATT_OP_READ_BY_TYPE_REQ};
        putLe16(req, start);
        putLe16(req, 0xFFFF);
        putLe16(req, GATT_CHARAC_UUID);

        std::vector<uint8_t> resp;
        if (!request(req, ATT_OP_READ_BY_TYPE_RESP, resp))
            return false;
        if (resp[0] == ATT_OP_ERROR) {
            if (resp.size() >= 5 && resp[4] == ATT_ECODE_ATTR_NOT_FOUND)
                break;
            return setError("characteristic discovery refused");
        }
        if (resp.size() < 2 || resp[1] < 7)
            return setError("bad characteristic discovery response");

        size_t entryLen = resp[1];
        uint16_t last = start;
        for (size_t off = 2; off + entryLen <= resp.size(); off += entryLen) {
            const uint8_t *e = &resp[off];
            uint16_t declHandle = getLe16(e);
            uint16_t valueHandle = getLe16(e + 3);
            declarations[declHandle] = valueHandle;
            last = declHandle;

            if (entryLen == 21) {
                const uint8_t *uuid = e + 5;
                if (memcmp(uuid, commandUuid, 16) == 0)
                    commandHandle = valueHandle;
                else if (memcmp(uuid, imageUuid, 16) == 0)
                    imageHandle = valueHandle;
                else if (memcmp(uuid, notifyUuid, 16) == 0)
                    notifyHandle = valueHandle;
            }
        }
        start = last == 0xFFFF ? 0 : last + 1;
    }

    if (!commandHandle || !imageHandle || !notifyHandle)
        return setError("badge characteristics not found, is this a supported badge?");

    notifyEndHandle = 0xFFFF;
    for (auto &d : declarations) {
        if (d.first > notifyHandle) {
            notifyEndHandle = d.first - 1;
            break;
        }
    }
    return true;
}

bool BluezTransport::enableNotifications()
{
    // Look for the CCCD between the NOTIFY value and the next characteristic
    uint16_t cccd = notifyHandle + 1;
    std::vector<uint8_t> req = {ATT_OP_FIND_INFO_REQ};
    putLe16(req, notifyHandle + 1);
    putLe16(req, notifyEndHandle);

    std::vector<uint8_t> resp;
    if (!request(req, ATT_OP_FIND_INFO_RESP, resp))
        return false;
    if (resp[0] == ATT_OP_FIND_INFO_RESP && resp.size() >= 2 && resp[1] == 0x01) {
        for (size_t off = 2; off + 4 <= resp.size(); off += 4) {
            if (getLe16(&resp[off + 2]) == GATT_CLIENT_CHARAC_CFG_UUID) {
                cccd = getLe16(&resp[off]);
                break;
            }
        }
    } else {
        LOG_DEBUG("No descriptor list, assuming CCCD at 0x%04x", cccd);
    }

    req = {ATT_OP_WRITE_REQ};
    putLe16(req, cccd);
    putLe16(req, 0x0001); // notifications on
    if (!request(req, ATT_OP_WRITE_RESP, resp))
        return false;
    if (resp[0] == ATT_OP_ERROR)
        return setError("badge refused to enable notifications");
    return true;
}

bool BluezTransport::write(BadgeCharacteristic characteristic, const uint8_t *bytes, size_t len)
{
    concurrency::LockGuard guard(&writeLock);
    if (!isConnected())
        return setError("not connected");
    if (len + 3 > ATT_DEFAULT_MTU)
        return setError("packet too large for the ATT MTU");

    bool withResponse = characteristic == BadgeCharacteristic::COMMAND;
    std::vector<uint8_t> pdu = {(uint8_t)(withResponse ? ATT_OP_WRITE_REQ : ATT_OP_WRITE_CMD)};
    putLe16(pdu, withResponse ? commandHandle : imageHandle);
    pdu.insert(pdu.end(), bytes, bytes + len);

    if (!withResponse) {
        if (::write(sock, pdu.data(), pdu.size()) != (ssize_t)pdu.size())
            return setError(std::string("write: ") + strerror(errno));
        return true;
    }

    std::vector<uint8_t> resp;
    if (!request(pdu, ATT_OP_WRITE_RESP, resp))
        return false;
    if (resp[0] == ATT_OP_ERROR) {
        char text[48];
        snprintf(text, sizeof(text), "write refused, ATT error 0x%02x", resp.size() >= 5 ? resp[4] : 0);
        return setError(text);
    }
    return true;
}

TransportStatus BluezTransport::waitForNotification(std::vector<uint8_t> &frame, uint32_t timeoutMsec)
{
    uint32_t deadline = monotonicMillis() + timeoutMsec;
    for (;;) {
        if (!notifications.empty()) {
            frame = std::move(notifications.front());
            notifications.pop_front();
            return TransportStatus::OK;
        }
        if (!isConnected()) {
            setError("not connected");
            return TransportStatus::ERROR;
        }

        int32_t remaining = (int32_t)(deadline - monotonicMillis());
        if (remaining <= 0)
            return TransportStatus::TIMEOUT;

        std::vector<uint8_t> pdu;
        int rc = readPdu(pdu, remaining);
        if (rc < 0)
            return TransportStatus::ERROR;
        if (rc > 0 && !handleServerPdu(pdu))
            LOG_DEBUG("Stray ATT opcode 0x%02x", pdu[0]);
    }
}

size_t BluezTransport::flushNotifications()
{
    // Pull in whatever the kernel has already buffered for us
    while (isConnected()) {
        std::vector<uint8_t> pdu;
        if (readPdu(pdu, 0) <= 0)
            break;
        if (!handleServerPdu(pdu))
            LOG_DEBUG("Stray ATT opcode 0x%02x", pdu[0]);
    }

    size_t dropped = notifications.size();
    for (auto &n : notifications)
        LOG_DEBUG("Dropping stale notification %s", bytesToHex(n.data(), n.size()).c_str());
    notifications.clear();
    return dropped;
}

bool scanForBadges(int seconds, const std::string &nameFilter, std::vector<BadgeAdvert> &found)
{
    found.clear();

    int devId = hci_get_route(NULL);
    int dd = devId < 0 ? -1 : hci_open_dev(devId);
    if (dd < 0) {
        LOG_ERROR("No Bluetooth adapter: %s", strerror(errno));
        return false;
    }

    if (hci_le_set_scan_parameters(dd, 0x01, htobs(0x0010), htobs(0x0010), 0x00, 0x00, 1000) < 0 ||
        hci_le_set_scan_enable(dd, 0x01, 0x01, 1000) < 0) {
        LOG_ERROR("Unable to start LE scan: %s", strerror(errno));
        hci_close_dev(dd);
        return false;
    }

    struct hci_filter oldFilter, filter;
    socklen_t olen = sizeof(oldFilter);
    bool restoreFilter = getsockopt(dd, SOL_HCI, HCI_FILTER, &oldFilter, &olen) == 0;
    hci_filter_clear(&filter);
    hci_filter_set_ptype(HCI_EVENT_PKT, &filter);
    hci_filter_set_event(EVT_LE_META_EVENT, &filter);
    if (setsockopt(dd, SOL_HCI, HCI_FILTER, &filter, sizeof(filter)) < 0)
        LOG_WARN("Unable to set HCI filter: %s", strerror(errno));

    LOG_INFO("Scanning for %d seconds", seconds);
    std::map<std::string, BadgeAdvert> seen;
    uint32_t deadline = monotonicMillis() + (uint32_t)seconds * 1000;
    for (;;) {
        int32_t remaining = (int32_t)(deadline - monotonicMillis());
        if (remaining <= 0)
            break;

        struct pollfd pfd = {dd, POLLIN, 0};
        if (poll(&pfd, 1, remaining) <= 0)
            continue;

        uint8_t buf[HCI_MAX_EVENT_SIZE];
        ssize_t len = read(dd, buf, sizeof(buf));
        if (len < (ssize_t)(1 + HCI_EVENT_HDR_SIZE + 2))
            continue;

        evt_le_meta_event *meta = (evt_le_meta_event *)(buf + 1 + HCI_EVENT_HDR_SIZE);
        if (meta->subevent != EVT_LE_ADVERTISING_REPORT)
            continue;

        uint8_t reports = meta->data[0];
        uint8_t *p = meta->data + 1;
        uint8_t *end = buf + len;
        for (uint8_t r = 0; r < reports && p + sizeof(le_advertising_info) <= end; r++) {
            le_advertising_info *info = (le_advertising_info *)p;
            if (info->data + info->length + 1 > end)
                break;

            char addr[18];
            ba2str(&info->bdaddr, addr);
            BadgeAdvert &adv = seen[addr];
            adv.address = addr;
            adv.randomAddress = info->bdaddr_type == LE_RANDOM_ADDRESS;
            adv.rssi = (int8_t)info->data[info->length];

            // AD structures: [len][type][data...]
            for (uint8_t off = 0; off + 1 < info->length;) {
                uint8_t fieldLen = info->data[off];
                if (fieldLen == 0 || off + 1 + fieldLen > info->length)
                    break;
                uint8_t type = info->data[off + 1];
                if (type == 0x08 || type == 0x09) // shortened or complete local name
                    adv.name.assign((const char *)&info->data[off + 2], fieldLen - 1);
                off += fieldLen + 1;
            }
            p = info->data + info->length + 1;
        }
    }

    if (restoreFilter && setsockopt(dd, SOL_HCI, HCI_FILTER, &oldFilter, sizeof(oldFilter)) < 0)
        LOG_WARN("Unable to restore HCI filter: %s", strerror(errno));
    if (hci_le_set_scan_enable(dd, 0x00, 0x01, 1000) < 0)
        LOG_WARN("Unable to stop LE scan: %s", strerror(errno));
    hci_close_dev(dd);

    for (auto &kv : seen) {
        if (nameFilter.empty() || kv.second.name.find(nameFilter) != std::string::npos)
            found.push_back(kv.second);
    }
    LOG_INFO("Scan found %u devices", (unsigned)found.size());
    return true;
}

#endif
