#pragma once

#include <vector>
#include <stdint.h>
#include <stddef.h>

#include "common/types.hpp"

namespace gpsmodel {

// Blocking byte channel to the receiver. read() may hand back fewer bytes
// than asked for, including none at all, without that being an error.
class ByteChannel
{
public:
    virtual ~ByteChannel() = default;

    virtual Result<size_t> write(const uint8_t* data, size_t len) = 0;
    virtual Result<std::vector<uint8_t>> read(size_t max_bytes) = 0;
    virtual Result<bool> close() = 0;
};

} // namespace gpsmodel
