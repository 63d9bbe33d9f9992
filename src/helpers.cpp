#include "common/helpers.hpp"
#include <sstream>
#include <iomanip>
#include <cerrno>
#include <cstdlib>
#include <cctype>
#include <climits>

namespace gpsmodel {

std::string bytesToHex(const std::vector<uint8_t>& data)
{
    std::ostringstream oss;
    oss << std::uppercase << std::hex << std::setfill('0');
    for (size_t i = 0; i < data.size(); ++i) {
        if (i > 0) {
            oss << ' ';
        }
        oss << std::setw(2) << static_cast<int>(data[i]);
    }
    return oss.str();
}

std::string to_string(Error error)
{
    switch (error) {
        case Error::SYNC_TIMEOUT:      return "no sync marker before timeout";
        case Error::READ_TIMEOUT:      return "frame truncated before timeout";
        case Error::CHECKSUM_MISMATCH: return "checksum mismatch";
        case Error::UNEXPECTED_REPLY:  return "unexpected reply";
        case Error::NACK:              return "request rejected (ACK-NAK)";
        case Error::WRITE_ERROR:       return "write error";
        case Error::READ_ERROR:        return "read error";
        case Error::PORT_ERROR:        return "serial port error";
        case Error::PARSE_ERROR:       return "malformed payload";
    }
    return "unknown error";
}

std::string to_string(ConfigError error)
{
    switch (error) {
        case ConfigError::FIELD_OVERFLOW:      return "value does not fit the field";
        case ConfigError::INVALID_FIELD_NAME:  return "field cannot be overridden";
        case ConfigError::UNKNOWN_PROFILE:     return "unknown profile";
        case ConfigError::BAD_OVERRIDE_SYNTAX: return "override must be field=value";
    }
    return "unknown error";
}

Result<int64_t, ConfigError> parseInteger(const std::string& text)
{
    size_t pos = 0;
    bool negative = false;
    if (pos < text.size() && (text[pos] == '-' || text[pos] == '+')) {
        negative = text[pos] == '-';
        ++pos;
    }

    int base = 10;
    if (text.size() - pos > 2 && text[pos] == '0' && (text[pos + 1] == 'x' || text[pos + 1] == 'X')) {
        base = 16;
        pos += 2;
    }

    // strtoull would accept its own sign and whitespace; only digits may follow.
    if (pos >= text.size() || !std::isxdigit(static_cast<unsigned char>(text[pos]))) {
        return Result<int64_t, ConfigError>::failure(ConfigError::BAD_OVERRIDE_SYNTAX);
    }

    const char* begin = text.c_str() + pos;
    char* end = nullptr;
    errno = 0;
    unsigned long long magnitude = std::strtoull(begin, &end, base);
    if (errno == ERANGE || end == begin || *end != '\0') {
        return Result<int64_t, ConfigError>::failure(ConfigError::BAD_OVERRIDE_SYNTAX);
    }

    // Past int64 nothing fits a field of five bytes or fewer
    if (magnitude > static_cast<unsigned long long>(INT64_MAX)) {
        return Result<int64_t, ConfigError>::failure(ConfigError::FIELD_OVERFLOW);
    }

    int64_t value = static_cast<int64_t>(magnitude);
    return Result<int64_t, ConfigError>::success(negative ? -value : value);
}

Result<int, ConfigError> parseBaud(const std::string& text)
{
    auto value = parseInteger(text);
    if (!value.ok()) {
        return Result<int, ConfigError>::failure(value.error());
    }
    if (value.value() <= 0 || value.value() > INT_MAX) {
        return Result<int, ConfigError>::failure(ConfigError::FIELD_OVERFLOW);
    }
    return Result<int, ConfigError>::success(static_cast<int>(value.value()));
}

Result<FieldOverride, ConfigError> parseOverride(const std::string& token)
{
    size_t eq = token.find('=');
    if (eq == std::string::npos || eq == 0 || eq + 1 >= token.size()) {
        return Result<FieldOverride, ConfigError>::failure(ConfigError::BAD_OVERRIDE_SYNTAX);
    }

    auto value = parseInteger(token.substr(eq + 1));
    if (!value.ok()) {
        return Result<FieldOverride, ConfigError>::failure(value.error());
    }

    FieldOverride ov;
    ov.name = token.substr(0, eq);
    ov.value = value.value();
    return Result<FieldOverride, ConfigError>::success(ov);
}

} // namespace gpsmodel
