#pragma once

#include <vector>
#include <stdint.h>
#include <utility>

#include "common/checksum.hpp"
#include "common/types.hpp"

namespace gpsmodel {

class UbxFrame
{
public:
    // PARSE_ERROR when the payload does not fit the 16-bit length field
    static Result<UbxFrame> make(uint8_t msg_class, uint8_t msg_id, std::vector<uint8_t> payload = {});

    uint8_t msg_class() const { return msg_class_; }
    uint8_t msg_id() const { return msg_id_; }
    const std::vector<uint8_t>& payload() const { return payload_; }

    std::vector<uint8_t> serialize() const;

    // ACK-ACK whose payload names the given class and id
    static UbxFrame ack_for(uint8_t msg_class, uint8_t msg_id);
    bool is_ack_for(uint8_t msg_class, uint8_t msg_id) const;
    bool is_nak_for(uint8_t msg_class, uint8_t msg_id) const;

    // Over class, id, little-endian length and payload
    static Checksum checksum(uint8_t msg_class, uint8_t msg_id, const std::vector<uint8_t>& payload);

    bool operator==(const UbxFrame& other) const
    {
        return msg_class_ == other.msg_class_ && msg_id_ == other.msg_id_ && payload_ == other.payload_;
    }

    bool operator!=(const UbxFrame& other) const { return !(*this == other); }

private:
    UbxFrame(uint8_t msg_class, uint8_t msg_id, std::vector<uint8_t> payload)
        : msg_class_(msg_class), msg_id_(msg_id), payload_(std::move(payload)) {}

    uint8_t msg_class_;
    uint8_t msg_id_;
    std::vector<uint8_t> payload_;
};

} // namespace gpsmodel
