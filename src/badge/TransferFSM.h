#pragma once

#include "BadgeCipher.h"
#include "BadgeCommand.h"
#include "BadgeTransport.h"
#include "BadgeTypes.h"
#include "ResponseDecoder.h"
#include <atomic>
#include <stddef.h>
#include <stdint.h>
#include <vector>

enum class TransferState { IDLE, AWAITING_DATS_ACK, SENDING_CHUNKS, AWAITING_DATCP_ACK, SETTLING, DONE, FAILED };

const char *transferStateName(TransferState state);

/// What the badge should do with the upload once it has it
struct DisplaySettings {
    uint8_t mode = static_cast<uint8_t>(ScrollMode::LEFT);
    uint8_t speed = 50;
    uint8_t brightness = 128;
};

/**
 * The upload handshake as an event driven state machine.
 *
 *   IDLE -> AWAITING_DATS_ACK -> SENDING_CHUNKS -> AWAITING_DATCP_ACK -> SETTLING -> DONE
 *
 * with FAILED reachable from every non terminal state. Whoever drives it feeds events in:
 * onSendRequested() while wantsToSend(), onAckReceived() / onTimeoutFired() while awaitingAck().
 * Nothing here blocks or retries, a failed session is simply started again with beginUpload().
 *
 * Not thread safe apart from onCancelRequested(), which may be called from anywhere and is
 * honored at the next event, including a beginUpload() that has not sent DATS yet. The latch
 * is cleared when a session ends.
 */
class TransferFSM
{
  public:
    TransferFSM(const BadgeCipher &cipher, BadgeTransport &transport);

    /**
     * Start a new session: sends DATS and starts the ack deadline.
     *
     * @return BUSY if a session is already running, PAYLOAD_TOO_LARGE if the payload can't be
     * announced (no I/O happens in either case), CANCELLED if a cancel was already pending
     * (nothing is sent), TRANSPORT if the DATS write failed.
     */
    BadgeError beginUpload(const std::vector<uint8_t> &payload, const DisplaySettings &settings, uint32_t ackTimeoutMsec);

    /// Send the next chunk, DATCP or settings command
    void onSendRequested();

    /// A notification arrived from the badge
    void onAckReceived(const uint8_t *frame, size_t len);
    void onAckReceived(const std::vector<uint8_t> &frame) { onAckReceived(frame.data(), frame.size()); }

    /// The deadline for the awaited ack has passed
    void onTimeoutFired();

    /// The transport broke while we were waiting on it
    void onTransportError(const std::string &detail);

    void onCancelRequested() { cancelRequested = true; }

    /// Move to FAILED(CANCELLED) if a cancel is pending, returns true if that happened
    bool applyPendingCancel();

    TransferState getState() const { return state; }
    const TransferFailure &getFailure() const { return failure; }

    bool isFinished() const { return state == TransferState::IDLE || state == TransferState::DONE || state == TransferState::FAILED; }
    bool wantsToSend() const { return state == TransferState::SENDING_CHUNKS || state == TransferState::SETTLING; }
    bool awaitingAck() const { return state == TransferState::AWAITING_DATS_ACK || state == TransferState::AWAITING_DATCP_ACK; }

    /// monotonicMillis() value at which the awaited ack times out
    uint32_t getDeadline() const { return deadline; }

    size_t getChunkCount() const { return chunks.size(); }
    size_t getChunksSent() const { return nextChunk; }

  private:
    void setState(TransferState newState);
    void fail(BadgeError reason, const std::string &detail = "");
    bool send(BadgeCharacteristic characteristic, const BadgeBlock &packet, const char *what);
    void armDeadline();

    /// Anything the badge said before we ask must not count as the answer
    void dropStaleNotifications(const char *what);

    CommandEncoder encoder;
    ResponseDecoder decoder;
    BadgeTransport &transport;
    const BadgeCipher &chunkCipher;

    TransferState state = TransferState::IDLE;
    TransferFailure failure;
    std::atomic<bool> cancelRequested{false};

    std::vector<BadgeBlock> chunks;
    size_t nextChunk = 0;

    /// MODE, SPEED, LIGHT in the order they go out
    std::vector<BadgeBlock> settingsCommands;
    size_t nextSetting = 0;

    uint32_t ackTimeoutMsec = 0;
    uint32_t deadline = 0;
};
