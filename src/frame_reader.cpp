#include "transport/frame_reader.hpp"
#include "common/endian.hpp"

namespace gpsmodel {

FrameReader::FrameReader(ByteChannel& channel, int read_budget, std::chrono::milliseconds timeout)
    : channel_(channel), read_budget_(read_budget), timeout_(timeout) {}

bool FrameReader::sync_to_frame()
{
    static constexpr uint8_t SYNC[] = {Protocol::SYNC_CHAR1, Protocol::SYNC_CHAR2};

    state_ = State::SEEKING_SYNC;
    sync_matched_ = 0;

    auto deadline = std::chrono::steady_clock::now() + timeout_;

    for (int reads = 0; reads < read_budget_ && std::chrono::steady_clock::now() < deadline; reads++)
    {
        auto result = channel_.read(1);
        if (!result.ok()) {
            last_error_ = result.error();
            state_ = State::FAILED;
            return false;
        }
        if (result.value().empty()) {
            continue;
        }

        uint8_t byte = result.value()[0];
        if (byte == SYNC[sync_matched_]) {
            sync_matched_++;
            if (sync_matched_ == 2) {
                state_ = State::READING_HEADER;
                return true;
            }
        } else {
            sync_matched_ = 0;
        }
    }

    last_error_ = Error::SYNC_TIMEOUT;
    state_ = State::FAILED;
    return false;
}

Result<std::vector<uint8_t>> FrameReader::read_exact(size_t n)
{
    std::vector<uint8_t> buffer;
    buffer.reserve(n);

    auto deadline = std::chrono::steady_clock::now() + timeout_;

    for (int reads = 0; buffer.size() < n; reads++)
    {
        if (reads >= read_budget_ || std::chrono::steady_clock::now() >= deadline) {
            return Result<std::vector<uint8_t>>::failure(Error::READ_TIMEOUT);
        }

        auto result = channel_.read(n - buffer.size());
        if (!result.ok()) {
            return Result<std::vector<uint8_t>>::failure(result.error());
        }

        auto& chunk = result.value();
        buffer.insert(buffer.end(), chunk.begin(), chunk.end());
    }

    return Result<std::vector<uint8_t>>::success(std::move(buffer));
}

Result<UbxFrame> FrameReader::fail(Error error)
{
    last_error_ = error;
    state_ = State::FAILED;
    return Result<UbxFrame>::failure(error);
}

Result<UbxFrame> FrameReader::read_frame()
{
    state_ = State::READING_HEADER;
    auto header = read_exact(2);
    if (!header.ok())
        return fail(header.error());

    uint8_t msg_class = header.value()[0];
    uint8_t msg_id = header.value()[1];

    state_ = State::READING_LENGTH;
    auto length = read_exact(2);
    if (!length.ok())
        return fail(length.error());

    uint16_t payload_len = read_le16(length.value().data());

    state_ = State::READING_PAYLOAD;
    auto payload = read_exact(payload_len);
    if (!payload.ok())
        return fail(payload.error());

    state_ = State::READING_CHECKSUM;
    auto ck = read_exact(Protocol::CHECKSUM_LEN);
    if (!ck.ok())
        return fail(ck.error());

    Checksum expected = UbxFrame::checksum(msg_class, msg_id, payload.value());
    if (!expected.matches(ck.value()[0], ck.value()[1]))
        return fail(Error::CHECKSUM_MISMATCH);

    auto frame = UbxFrame::make(msg_class, msg_id, payload.value());
    if (!frame.ok())
        return fail(frame.error());

    state_ = State::DONE;
    return frame;
}

Result<UbxFrame> FrameReader::next_frame()
{
    if (!sync_to_frame()) {
        return Result<UbxFrame>::failure(last_error_);
    }
    return read_frame();
}

} // namespace gpsmodel
