#pragma once

#include <vector>
#include <string>
#include <cstdint>
#include "types.hpp"

namespace gpsmodel {

struct FieldOverride
{
    std::string name;
    int64_t value = 0;
};

std::string bytesToHex(const std::vector<uint8_t>& data);

std::string to_string(Error error);
std::string to_string(ConfigError error);

// Decimal or 0x-prefixed hex, with an optional sign.
Result<int64_t, ConfigError> parseInteger(const std::string& text);

// A positive integer that fits an int; whether the port supports it is the
// caller's check.
Result<int, ConfigError> parseBaud(const std::string& text);

// Splits "name=value"; the value goes through parseInteger.
Result<FieldOverride, ConfigError> parseOverride(const std::string& token);

} // namespace gpsmodel
