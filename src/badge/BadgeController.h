#pragma once

#include "BadgeCipher.h"
#include "BadgeCommand.h"
#include "BadgeTransport.h"
#include "GlyphCodec.h"
#include "TransferFSM.h"
#include "concurrency/Lock.h"
#include <stdint.h>
#include <string>
#include <vector>

/**
 * Everything a caller can ask of a badge, on top of one transport.
 *
 * Only one operation runs at a time, a second caller gets BUSY rather than queueing
 * behind the first. cancel() may be called from any thread.
 */
class BadgeController
{
  public:
    BadgeController(const BadgeKey &key, BadgeTransport &transport, const Font &font);

    BadgeError powerOn();
    BadgeError powerOff();
    BadgeError setMode(uint8_t mode);
    BadgeError setSpeed(uint8_t speed);
    BadgeError setBrightness(uint8_t brightness);

    /**
     * Run a whole upload: DATS, chunks, DATCP, then the display settings.
     * Blocks until the session is DONE or FAILED, getLastFailure() has the detail.
     */
    BadgeError uploadAndDisplay(const std::vector<uint8_t> &payload, const DisplaySettings &settings);

    /// Render text with the font and upload it
    BadgeError sendText(const std::string &text, const DisplaySettings &settings);

    BadgeError playAnimation(uint8_t id);
    BadgeError showImage(uint8_t id);
    BadgeError playSequence(const std::vector<uint8_t> &ids);
    BadgeError deleteImages(const std::vector<uint8_t> &ids);

    /// Send CHEC and return whatever the badge answers with
    BadgeError checkImages(std::string &token);

    /// Abort the running upload at its next suspension point
    void cancel() { fsm.onCancelRequested(); }

    void setAckTimeout(uint32_t msec) { ackTimeoutMsec = msec; }
    uint32_t getAckTimeout() const { return ackTimeoutMsec; }

    /// Pause between image chunks, 0 to send them back to back
    void setChunkGap(uint32_t msec) { chunkGapMsec = msec; }

    const TransferFailure &getLastFailure() const { return lastFailure; }
    TransferState getTransferState() const { return fsm.getState(); }

  private:
    /// Write one already encoded fire and forget command
    BadgeError sendPacket(const char *what, const BadgeBlock &packet);

    /// Drive the state machine until it finishes, caller holds flightLock
    BadgeError runTransfer();

    const BadgeCipher cipher;
    BadgeTransport &transport;
    const Font &font;
    CommandEncoder encoder;
    ResponseDecoder decoder;
    TransferFSM fsm;

    concurrency::Lock flightLock;

    uint32_t ackTimeoutMsec;
    uint32_t chunkGapMsec;
    TransferFailure lastFailure;
};
