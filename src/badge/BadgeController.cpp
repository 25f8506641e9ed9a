#include "BadgeController.h"
#include "DebugConfiguration.h"
#include "badgeUtils.h"
#include "concurrency/LockGuard.h"
#include "configuration.h"
#include <algorithm>

// Upper bound on one blocking wait, so a cancel is noticed while an ack is outstanding
#define ACK_POLL_SLICE_MSEC 100

BadgeController::BadgeController(const BadgeKey &key, BadgeTransport &transport, const Font &font)
    : cipher(key), transport(transport), font(font), encoder(cipher), decoder(cipher), fsm(cipher, transport),
      ackTimeoutMsec(LEDBADGE_DEFAULT_ACK_TIMEOUT_MS), chunkGapMsec(LEDBADGE_CHUNK_GAP_MS)
{
}

BadgeError BadgeController::sendPacket(const char *what, const BadgeBlock &packet)
{
    concurrency::TryLockGuard guard(&flightLock);
    if (!guard.owns()) {
        LOG_WARN("%s refused, badge is busy", what);
        return BadgeError::BUSY;
    }
    if (!transport.isConnected())
        return BadgeError::NOT_CONNECTED;

    LOG_TRACE("tx COMMAND %s %s", what, bytesToHex(packet.data(), packet.size()).c_str());
    if (!transport.write(BadgeCharacteristic::COMMAND, packet.data(), packet.size())) {
        lastFailure.reason = BadgeError::TRANSPORT;
        lastFailure.detail = transport.lastError();
        LOG_ERROR("%s write failed: %s", what, lastFailure.detail.c_str());
        return BadgeError::TRANSPORT;
    }
    LOG_INFO("Sent %s", what);
    return BadgeError::NONE;
}

BadgeError BadgeController::powerOn()
{
    BadgeBlock packet;
    BadgeError err = encoder.ledOn(packet);
    return err != BadgeError::NONE ? err : sendPacket("LEDON", packet);
}

BadgeError BadgeController::powerOff()
{
    BadgeBlock packet;
    BadgeError err = encoder.ledOff(packet);
    return err != BadgeError::NONE ? err : sendPacket("LEDOFF", packet);
}

BadgeError BadgeController::setMode(uint8_t mode)
{
    BadgeBlock packet;
    BadgeError err = encoder.mode(mode, packet);
    if (err != BadgeError::NONE)
        return err;
    LOG_DEBUG("Scroll mode %u (%s)", mode, scrollModeName(mode));
    return sendPacket("MODE", packet);
}

BadgeError BadgeController::setSpeed(uint8_t speed)
{
    BadgeBlock packet;
    BadgeError err = encoder.speed(speed, packet);
    return err != BadgeError::NONE ? err : sendPacket("SPEED", packet);
}

BadgeError BadgeController::setBrightness(uint8_t brightness)
{
    BadgeBlock packet;
    BadgeError err = encoder.light(brightness, packet);
    return err != BadgeError::NONE ? err : sendPacket("LIGHT", packet);
}

BadgeError BadgeController::playAnimation(uint8_t id)
{
    BadgeBlock packet;
    BadgeError err = encoder.anim(id, packet);
    return err != BadgeError::NONE ? err : sendPacket("ANIM", packet);
}

BadgeError BadgeController::showImage(uint8_t id)
{
    BadgeBlock packet;
    BadgeError err = encoder.imag(id, packet);
    return err != BadgeError::NONE ? err : sendPacket("IMAG", packet);
}

BadgeError BadgeController::playSequence(const std::vector<uint8_t> &ids)
{
    BadgeBlock packet;
    BadgeError err = encoder.play(ids, packet);
    return err != BadgeError::NONE ? err : sendPacket("PLAY", packet);
}

BadgeError BadgeController::deleteImages(const std::vector<uint8_t> &ids)
{
    BadgeBlock packet;
    BadgeError err = encoder.dele(ids, packet);
    return err != BadgeError::NONE ? err : sendPacket("DELE", packet);
}

BadgeError BadgeController::checkImages(std::string &token)
{
    BadgeBlock packet;
    BadgeError err = encoder.chec(packet);
    if (err != BadgeError::NONE)
        return err;

    concurrency::TryLockGuard guard(&flightLock);
    if (!guard.owns())
        return BadgeError::BUSY;
    if (!transport.isConnected())
        return BadgeError::NOT_CONNECTED;

    size_t stale = transport.flushNotifications();
    if (stale)
        LOG_DEBUG("Dropped %u stale notifications before CHEC", (unsigned)stale);

    if (!transport.write(BadgeCharacteristic::COMMAND, packet.data(), packet.size())) {
        lastFailure.reason = BadgeError::TRANSPORT;
        lastFailure.detail = transport.lastError();
        return BadgeError::TRANSPORT;
    }

    std::vector<uint8_t> frame;
    switch (transport.waitForNotification(frame, ackTimeoutMsec)) {
    case TransportStatus::OK:
        break;
    case TransportStatus::TIMEOUT:
        LOG_WARN("No answer to CHEC");
        return BadgeError::TIMEOUT;
    case TransportStatus::ERROR:
        lastFailure.reason = BadgeError::TRANSPORT;
        lastFailure.detail = transport.lastError();
        return BadgeError::TRANSPORT;
    }

    BadgeResponse response;
    err = decoder.decode(frame, response);
    if (err != BadgeError::NONE)
        return err;
    token = response.token;
    LOG_INFO("CHEC answered '%s'", token.c_str());
    return BadgeError::NONE;
}

BadgeError BadgeController::uploadAndDisplay(const std::vector<uint8_t> &payload, const DisplaySettings &settings)
{
    concurrency::TryLockGuard guard(&flightLock);
    if (!guard.owns()) {
        LOG_WARN("Upload refused, another transfer is in flight");
        return BadgeError::BUSY;
    }
    if (!transport.isConnected())
        return BadgeError::NOT_CONNECTED;

    lastFailure = TransferFailure();
    BadgeError err = fsm.beginUpload(payload, settings, ackTimeoutMsec);
    if (err != BadgeError::NONE) {
        if (fsm.getState() == TransferState::FAILED)
            lastFailure = fsm.getFailure();
        else
            lastFailure.reason = err;
        return err;
    }

    return runTransfer();
}

BadgeError BadgeController::runTransfer()
{
    while (!fsm.isFinished()) {
        if (fsm.wantsToSend()) {
            bool wasChunk = fsm.getState() == TransferState::SENDING_CHUNKS && fsm.getChunksSent() < fsm.getChunkCount();
            fsm.onSendRequested();
            if (wasChunk && chunkGapMsec)
                delay(chunkGapMsec);
            continue;
        }

        int32_t remaining = (int32_t)(fsm.getDeadline() - monotonicMillis());
        if (remaining <= 0) {
            fsm.onTimeoutFired();
            continue;
        }

        std::vector<uint8_t> frame;
        TransportStatus status = transport.waitForNotification(frame, std::min<int32_t>(remaining, ACK_POLL_SLICE_MSEC));
        if (fsm.applyPendingCancel())
            break;
        if (status == TransportStatus::OK)
            fsm.onAckReceived(frame);
        else if (status == TransportStatus::ERROR)
            fsm.onTransportError(transport.lastError());
    }

    if (fsm.getState() == TransferState::DONE)
        return BadgeError::NONE;

    lastFailure = fsm.getFailure();
    LOG_ERROR("Upload failed: %s", badgeErrorName(lastFailure.reason));
    return lastFailure.reason;
}

BadgeError BadgeController::sendText(const std::string &text, const DisplaySettings &settings)
{
    std::vector<GlyphSegment> segments;
    uint32_t bad = 0;
    BadgeError err = renderText(text, font, segments, &bad);
    if (err != BadgeError::NONE) {
        LOG_ERROR("Can't render U+%04X with this font", (unsigned)bad);
        lastFailure.reason = err;
        lastFailure.detail.clear();
        return err;
    }

    LOG_INFO("Sending '%s' as %u segments", text.c_str(), (unsigned)segments.size());
    return uploadAndDisplay(flattenSegments(segments), settings);
}
