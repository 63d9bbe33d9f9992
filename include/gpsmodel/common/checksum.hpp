#pragma once
#include <stdint.h>
#include <stddef.h>

namespace gpsmodel {

// 8-bit Fletcher checksum used by UBX. Covers class, id, length and payload,
// never the sync characters.
class Checksum
{
public:
    void update(uint8_t byte)
    {
        ck_a_ = static_cast<uint8_t>(ck_a_ + byte);
        ck_b_ = static_cast<uint8_t>(ck_b_ + ck_a_);
    }

    void update(const uint8_t* data, size_t len)
    {
        for (size_t i = 0; i < len; i++)
            update(data[i]);
    }

    uint8_t ck_a() const { return ck_a_; }
    uint8_t ck_b() const { return ck_b_; }

    bool matches(uint8_t ck_a, uint8_t ck_b) const
    {
        return ck_a_ == ck_a && ck_b_ == ck_b;
    }

    static Checksum calculate(const uint8_t* data, size_t len)
    {
        Checksum ck;
        ck.update(data, len);
        return ck;
    }

private:
    uint8_t ck_a_ = 0;
    uint8_t ck_b_ = 0;
};

} // namespace gpsmodel
