#pragma once

#include <iostream>
#include <string>
#include <cstring>
#include <vector>
#include <fcntl.h>
#include <unistd.h>
#include <termios.h>
#include <errno.h>

#include "common/types.hpp"
#include "common/protocol.hpp"
#include "transport/channel.hpp"

namespace gpsmodel {

class SerialPort : public ByteChannel
{
public:

    SerialPort() : fd_(-1), baud_(Protocol::DEFAULT_BAUD), open_(false), poll_ms_(Protocol::POLL_INTERVAL_MS) {}
    ~SerialPort() override
    {
        close();
    }

    SerialPort(const SerialPort&) = delete;
    SerialPort& operator=(const SerialPort&) = delete;

    Result<bool> open(const std::string& port, int baud = Protocol::DEFAULT_BAUD);
    Result<bool> close() override;
    Result<size_t> write(const uint8_t* data, size_t len) override;
    Result<std::vector<uint8_t>> read(size_t max_bytes) override;

    bool is_open() const;
    std::string get_port() const;
    int get_baud() const;
    void set_poll_ms(int poll_ms);

    static bool is_supported_baud(int baud);

private:

    int fd_;
    std::string port_;
    int baud_;
    struct termios original_tty_;
    bool open_;
    int poll_ms_;

    void set_8N1(termios& tty);
};

} // namespace gpsmodel
