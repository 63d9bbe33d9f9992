#include "transport/ubx_frame.hpp"
#include "common/protocol.hpp"
#include "common/endian.hpp"

namespace gpsmodel {

Result<UbxFrame> UbxFrame::make(uint8_t msg_class, uint8_t msg_id, std::vector<uint8_t> payload)
{
    if (payload.size() > Protocol::MAX_PAYLOAD_LEN)
        return Result<UbxFrame>::failure(Error::PARSE_ERROR);

    return Result<UbxFrame>::success(UbxFrame(msg_class, msg_id, std::move(payload)));
}

Checksum UbxFrame::checksum(uint8_t msg_class, uint8_t msg_id, const std::vector<uint8_t>& payload)
{
    uint8_t header[Protocol::HEADER_LEN];
    header[0] = msg_class;
    header[1] = msg_id;
    write_le16(&header[2], static_cast<uint16_t>(payload.size()));

    Checksum ck;
    ck.update(header, sizeof(header));
    ck.update(payload.data(), payload.size());
    return ck;
}

std::vector<uint8_t> UbxFrame::serialize() const
{
    std::vector<uint8_t> frame;
    frame.reserve(2 + Protocol::HEADER_LEN + payload_.size() + Protocol::CHECKSUM_LEN);

    frame.push_back(Protocol::SYNC_CHAR1);
    frame.push_back(Protocol::SYNC_CHAR2);
    frame.push_back(msg_class_);
    frame.push_back(msg_id_);

    uint8_t len[2];
    write_le16(len, static_cast<uint16_t>(payload_.size()));
    frame.insert(frame.end(), len, len + 2);

    frame.insert(frame.end(), payload_.begin(), payload_.end());

    Checksum ck = checksum(msg_class_, msg_id_, payload_);
    frame.push_back(ck.ck_a());
    frame.push_back(ck.ck_b());

    return frame;
}

UbxFrame UbxFrame::ack_for(uint8_t msg_class, uint8_t msg_id)
{
    return UbxFrame(Protocol::Class::ACK, Protocol::Ack::ACK, {msg_class, msg_id});
}

bool UbxFrame::is_ack_for(uint8_t msg_class, uint8_t msg_id) const
{
    return *this == ack_for(msg_class, msg_id);
}

bool UbxFrame::is_nak_for(uint8_t msg_class, uint8_t msg_id) const
{
    return msg_class_ == Protocol::Class::ACK && msg_id_ == Protocol::Ack::NAK &&
           payload_.size() == 2 && payload_[0] == msg_class && payload_[1] == msg_id;
}

} // namespace gpsmodel
