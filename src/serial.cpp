#include "transport/serial.hpp"
#include <poll.h>

namespace gpsmodel {

namespace {

speed_t to_speed(int baud)
{
    switch (baud) {
        case 4800:   return B4800;
        case 9600:   return B9600;
        case 19200:  return B19200;
        case 38400:  return B38400;
        case 57600:  return B57600;
        case 115200: return B115200;
        case 230400: return B230400;
        case 460800: return B460800;
        default:     return B0;
    }
}

} // anonymous namespace

bool SerialPort::is_supported_baud(int baud)
{
    return to_speed(baud) != B0;
}

Result<bool> SerialPort::open(const std::string& port, int baud)
{
    port_ = port;
    baud_ = baud;

    if (!is_supported_baud(baud)) {
        std::cerr << "Unsupported baud rate " << baud << " for " << port << "\n";
        return Result<bool>::failure(Error::PORT_ERROR);
    }

    fd_ = ::open(port_.c_str(), O_RDWR | O_NOCTTY);
    if(fd_ < 0)
    {
        std::cerr << "Error opening " << port << ": " << strerror(errno) << "\n";
        return Result<bool>::failure(Error::PORT_ERROR);
    }

    if(tcgetattr(fd_, &original_tty_) != 0)
    {
        std::cerr << "Error getting port attributes: " << strerror(errno) << "\n";
        ::close(fd_);
        fd_ = -1;
        return Result<bool>::failure(Error::PORT_ERROR);
    }

    struct termios tty = original_tty_;

    cfsetispeed(&tty, to_speed(baud_));
    cfsetospeed(&tty, to_speed(baud_));
    cfmakeraw(&tty);
    set_8N1(tty);

    tty.c_cc[VMIN] = 0;
    tty.c_cc[VTIME] = 0;

    if(tcsetattr(fd_, TCSANOW, &tty) != 0)
    {
        std::cerr << "Error setting port attributes: " << strerror(errno) << "\n";
        ::close(fd_);
        fd_ = -1;
        return Result<bool>::failure(Error::PORT_ERROR);
    }

    // Drop whatever the receiver streamed before we were listening
    if(tcflush(fd_, TCIFLUSH) != 0)
    {
        std::cerr << "Error flushing " << port << ": " << strerror(errno) << "\n";
        tcsetattr(fd_, TCSANOW, &original_tty_);
        ::close(fd_);
        fd_ = -1;
        return Result<bool>::failure(Error::PORT_ERROR);
    }

    open_ = true;
    return Result<bool>::success(true);
}

Result<bool> SerialPort::close()
{
    if(fd_ >= 0)
    {
        tcsetattr(fd_, TCSANOW, &original_tty_);
        ::close(fd_);
        fd_ = -1;
        open_ = false;
        return Result<bool>::success(true);
    }
    return Result<bool>::success(false);
}

Result<size_t> SerialPort::write(const uint8_t* data, size_t len)
{
    if(fd_ < 0)
        return Result<size_t>::failure(Error::PORT_ERROR);

    size_t total = 0;
    while (total < len)
    {
        ssize_t written = ::write(fd_, data + total, len - total);
        if(written < 0)
        {
            if (errno == EINTR)
                continue;
            return Result<size_t>::failure(Error::WRITE_ERROR);
        }
        total += static_cast<size_t>(written);
    }

    if (tcdrain(fd_) < 0)
    {
        std::cerr << "Error draining output: " << strerror(errno) << "\n";
        return Result<size_t>::failure(Error::WRITE_ERROR);
    }
    return Result<size_t>::success(total);
}

Result<std::vector<uint8_t>> SerialPort::read(size_t max_bytes)
{
    std::vector<uint8_t> buffer;

    if (fd_ < 0)
        return Result<std::vector<uint8_t>>::failure(Error::PORT_ERROR);

    struct pollfd pfd = {fd_, POLLIN, 0};
    int ret = poll(&pfd, 1, poll_ms_);

    if (ret < 0) {
        if (errno == EINTR)
            return Result<std::vector<uint8_t>>::success(std::move(buffer));
        return Result<std::vector<uint8_t>>::failure(Error::READ_ERROR);
    }

    if (ret > 0 && max_bytes > 0)
    {
        buffer.resize(max_bytes);
        ssize_t n = ::read(fd_, buffer.data(), max_bytes);
        if (n < 0) {
            if (errno != EAGAIN && errno != EINTR)
                return Result<std::vector<uint8_t>>::failure(Error::READ_ERROR);
            n = 0;
        }
        buffer.resize(static_cast<size_t>(n));
    }

    return Result<std::vector<uint8_t>>::success(std::move(buffer));
}

bool SerialPort::is_open() const
{
    return open_;
}

std::string SerialPort::get_port() const
{
    return port_;
}

int SerialPort::get_baud() const
{
    return baud_;
}

void SerialPort::set_poll_ms(int poll_ms)
{
    poll_ms_ = poll_ms;
}

void SerialPort::set_8N1(termios& tty)
{
    tty.c_cflag = (tty.c_cflag & ~CSIZE) | CS8;
    tty.c_cflag &= ~PARENB;
    tty.c_cflag &= ~CSTOPB;
    tty.c_cflag &= ~CRTSCTS;
    tty.c_cflag |= CREAD | CLOCAL;

    tty.c_iflag |= IGNPAR;
    tty.c_iflag &= ~(IXON | IXOFF | IXANY);
}

} // namespace gpsmodel
