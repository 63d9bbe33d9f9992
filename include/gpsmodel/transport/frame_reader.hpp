#pragma once

#include <vector>
#include <chrono>
#include <stdint.h>

#include "common/types.hpp"
#include "common/protocol.hpp"
#include "transport/channel.hpp"
#include "transport/ubx_frame.hpp"

namespace gpsmodel {

// Pulls UBX frames out of a byte stream that may carry NMEA or other noise
// and may deliver data in arbitrarily small pieces.
//
// Every blocking call (sync_to_frame, read_exact) is bounded twice: by a
// number of channel reads and by a wall-clock timeout, whichever runs out
// first. Both bounds restart with each call.
class FrameReader
{
public:
    enum class State
    {
        SEEKING_SYNC,
        READING_HEADER,
        READING_LENGTH,
        READING_PAYLOAD,
        READING_CHECKSUM,
        DONE,
        FAILED
    };

    explicit FrameReader(ByteChannel& channel,
                         int read_budget = Protocol::READ_BUDGET,
                         std::chrono::milliseconds timeout = std::chrono::milliseconds(Protocol::REPLY_TIMEOUT_MS));

    // Consumes bytes until SYNC_CHAR1 SYNC_CHAR2 has been seen in order.
    // A mismatching byte is dropped and matching restarts from the first
    // sync character.
    bool sync_to_frame();

    Result<std::vector<uint8_t>> read_exact(size_t n);

    // Reads the remainder of a frame once sync_to_frame() has succeeded.
    Result<UbxFrame> read_frame();

    // sync_to_frame() followed by read_frame()
    Result<UbxFrame> next_frame();

    State state() const { return state_; }
    int sync_matched() const { return sync_matched_; }
    Error last_error() const { return last_error_; }

private:
    ByteChannel& channel_;
    int read_budget_;
    std::chrono::milliseconds timeout_;

    State state_{State::SEEKING_SYNC};
    int sync_matched_{0};
    Error last_error_{Error::SYNC_TIMEOUT};

    Result<UbxFrame> fail(Error error);
};

} // namespace gpsmodel
