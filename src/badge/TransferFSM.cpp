#include "TransferFSM.h"
#include "DebugConfiguration.h"
#include "ImageChunker.h"
#include "badgeUtils.h"

const char *transferStateName(TransferState state)
{
    switch (state) {
    case TransferState::IDLE:
        return "IDLE";
    case TransferState::AWAITING_DATS_ACK:
        return "AWAITING_DATS_ACK";
    case TransferState::SENDING_CHUNKS:
        return "SENDING_CHUNKS";
    case TransferState::AWAITING_DATCP_ACK:
        return "AWAITING_DATCP_ACK";
    case TransferState::SETTLING:
        return "SETTLING";
    case TransferState::DONE:
        return "DONE";
    case TransferState::FAILED:
        return "FAILED";
    }
    return "?";
}

TransferFSM::TransferFSM(const BadgeCipher &cipher, BadgeTransport &transport)
    : encoder(cipher), decoder(cipher), transport(transport), chunkCipher(cipher)
{
}

void TransferFSM::setState(TransferState newState)
{
    if (newState != state)
        LOG_DEBUG("Transfer %s -> %s", transferStateName(state), transferStateName(newState));
    state = newState;

    // A cancel only ever applies to the session it arrived in
    if (state == TransferState::DONE || state == TransferState::FAILED)
        cancelRequested = false;
}

void TransferFSM::dropStaleNotifications(const char *what)
{
    size_t n = transport.flushNotifications();
    if (n)
        LOG_DEBUG("Dropped %u stale notifications before %s", (unsigned)n, what);
}

void TransferFSM::fail(BadgeError reason, const std::string &detail)
{
    failure.reason = reason;
    failure.detail = detail;
    if (detail.empty())
        LOG_WARN("Transfer failed in %s: %s", transferStateName(state), badgeErrorName(reason));
    else
        LOG_WARN("Transfer failed in %s: %s (%s)", transferStateName(state), badgeErrorName(reason), detail.c_str());
    setState(TransferState::FAILED);
}

bool TransferFSM::send(BadgeCharacteristic characteristic, const BadgeBlock &packet, const char *what)
{
    LOG_TRACE("tx %s %s %s", badgeCharacteristicName(characteristic), what, bytesToHex(packet.data(), packet.size()).c_str());
    if (!transport.write(characteristic, packet.data(), packet.size())) {
        fail(BadgeError::TRANSPORT, transport.lastError());
        return false;
    }
    return true;
}

void TransferFSM::armDeadline()
{
    deadline = monotonicMillis() + ackTimeoutMsec;
}

bool TransferFSM::applyPendingCancel()
{
    if (!cancelRequested.exchange(false))
        return false;
    if (isFinished())
        return false;
    fail(BadgeError::CANCELLED);
    return true;
}

BadgeError TransferFSM::beginUpload(const std::vector<uint8_t> &payload, const DisplaySettings &settings,
                                    uint32_t _ackTimeoutMsec)
{
    if (!isFinished()) {
        LOG_WARN("Upload requested while %s", transferStateName(state));
        return BadgeError::BUSY;
    }

    // Build every packet up front so encoding problems surface before any I/O
    if (payload.size() > 0xFFFF) {
        LOG_ERROR("Upload of %u bytes is too large for DATS", (unsigned)payload.size());
        return BadgeError::PAYLOAD_TOO_LARGE;
    }
    BadgeBlock dats;
    BadgeError err = encoder.dats((uint32_t)payload.size(), dats);
    if (err != BadgeError::NONE)
        return err;

    std::vector<BadgeBlock> newChunks;
    err = encryptChunks(chunkCipher, payload, newChunks);
    if (err != BadgeError::NONE)
        return err;

    std::vector<BadgeBlock> newSettings(3);
    if ((err = encoder.mode(settings.mode, newSettings[0])) != BadgeError::NONE ||
        (err = encoder.speed(settings.speed, newSettings[1])) != BadgeError::NONE ||
        (err = encoder.light(settings.brightness, newSettings[2])) != BadgeError::NONE)
        return err;

    chunks = std::move(newChunks);
    settingsCommands = std::move(newSettings);
    nextChunk = 0;
    nextSetting = 0;
    failure = TransferFailure();
    ackTimeoutMsec = _ackTimeoutMsec;

    setState(TransferState::IDLE);
    // Cancelled after the caller committed to the upload but before anything went out
    if (cancelRequested.exchange(false)) {
        fail(BadgeError::CANCELLED);
        return BadgeError::CANCELLED;
    }

    LOG_INFO("Uploading %u bytes in %u chunks", (unsigned)payload.size(), (unsigned)chunks.size());
    dropStaleNotifications("DATS");
    if (!send(BadgeCharacteristic::COMMAND, dats, "DATS"))
        return failure.reason;

    setState(TransferState::AWAITING_DATS_ACK);
    armDeadline();
    return BadgeError::NONE;
}

void TransferFSM::onSendRequested()
{
    if (applyPendingCancel())
        return;

    switch (state) {
    case TransferState::SENDING_CHUNKS:
        if (nextChunk < chunks.size()) {
            if (send(BadgeCharacteristic::IMAGE_UPLOAD, chunks[nextChunk], "chunk"))
                nextChunk++;
        } else {
            BadgeBlock datcp;
            BadgeError err = encoder.datcp(datcp);
            if (err != BadgeError::NONE) {
                fail(err);
                return;
            }
            dropStaleNotifications("DATCP");
            if (send(BadgeCharacteristic::COMMAND, datcp, "DATCP")) {
                setState(TransferState::AWAITING_DATCP_ACK);
                armDeadline();
            }
        }
        break;

    case TransferState::SETTLING:
        if (send(BadgeCharacteristic::COMMAND, settingsCommands[nextSetting], "setting")) {
            nextSetting++;
            if (nextSetting == settingsCommands.size()) {
                LOG_INFO("Upload complete");
                setState(TransferState::DONE);
            }
        }
        break;

    default:
        LOG_DEBUG("Nothing to send in %s", transferStateName(state));
        break;
    }
}

void TransferFSM::onAckReceived(const uint8_t *frame, size_t len)
{
    if (applyPendingCancel())
        return;

    LOG_TRACE("rx %s", bytesToHex(frame, len).c_str());

    if (!awaitingAck()) {
        // Settings commands are fire and forget, and chunks are never acked individually
        LOG_DEBUG("Ignoring notification in %s", transferStateName(state));
        return;
    }

    BadgeResponse response;
    BadgeError err = decoder.decode(frame, len, response);
    if (err != BadgeError::NONE) {
        fail(err);
        return;
    }

    if (state == TransferState::AWAITING_DATS_ACK) {
        if (response.isAck(AckKind::DATSOK))
            setState(TransferState::SENDING_CHUNKS);
        else
            fail(BadgeError::UNEXPECTED_RESPONSE, response.token);
    } else {
        if (response.isAck(AckKind::DATCPOK))
            setState(TransferState::SETTLING);
        else
            fail(BadgeError::UNEXPECTED_RESPONSE, response.token);
    }
}

void TransferFSM::onTimeoutFired()
{
    if (applyPendingCancel())
        return;

    if (awaitingAck())
        fail(BadgeError::TIMEOUT);
}

void TransferFSM::onTransportError(const std::string &detail)
{
    if (applyPendingCancel())
        return;

    if (!isFinished())
        fail(BadgeError::TRANSPORT, detail);
}
