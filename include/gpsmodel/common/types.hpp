#pragma once

#include <variant>
#include <utility>

namespace gpsmodel {

// Transport and in-protocol failures. All of these are absorbed by the
// exchange retry loop; PORT_ERROR from SerialPort::open is fatal at the CLI.
enum class Error
{
    SYNC_TIMEOUT,
    READ_TIMEOUT,
    CHECKSUM_MISMATCH,
    UNEXPECTED_REPLY,
    NACK,
    WRITE_ERROR,
    READ_ERROR,
    PORT_ERROR,
    PARSE_ERROR
};

// Pre-flight validation failures, reported before any wire interaction.
enum class ConfigError
{
    FIELD_OVERFLOW,
    INVALID_FIELD_NAME,
    UNKNOWN_PROFILE,
    BAD_OVERRIDE_SYNTAX
};

template<typename T, typename E = Error>
class Result
{
public:
    bool ok() const
    {
        return std::holds_alternative<T>(data_);
    }

    const T& value() const
    {
        return std::get<T>(data_);
    }

    const T* value_if() const
    {
        return std::get_if<T>(&data_);
    }

    E error() const
    {
        return std::get<E>(data_);
    }

    static Result success(T value)
    {
        return Result(std::move(value));
    }

    static Result failure(E error)
    {
        return Result(error);
    }

private:
    std::variant<T, E> data_;

    explicit Result(T value) : data_(std::move(value)) {}
    explicit Result(E error) : data_(error) {}
};

} // namespace gpsmodel
