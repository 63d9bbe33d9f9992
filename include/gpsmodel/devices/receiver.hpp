#pragma once

#include "transport/channel.hpp"
#include "transport/ubx_frame.hpp"
#include "common/types.hpp"
#include "common/protocol.hpp"
#include "devices/nav_profile.hpp"

#include <chrono>
#include <functional>
#include <iostream>
#include <optional>

namespace gpsmodel {

struct ExchangeReport
{
    bool ok = false;
    int attempts = 0;
    Error last_error = Error::SYNC_TIMEOUT;    // only meaningful when !ok
    std::optional<UbxFrame> reply;
};

struct ConfigureReport
{
    ExchangeReport config;
    ExchangeReport save;

    bool ok() const { return config.ok && save.ok; }
};

// Request/response driver for a u-blox receiver. Every operation re-sends
// its full request up to max_attempts times; no failure past the serial
// open is fatal, the caller gets a report instead.
class Receiver
{
public:
    explicit Receiver(ByteChannel& channel, int max_attempts = Protocol::MAX_ATTEMPTS);

    // CFG-NAV5 with the profile payload, acknowledged by ACK-ACK
    ExchangeReport set_profile(const NavProfile& profile);

    // Empty CFG-NAV5; the receiver answers with its current block
    ExchangeReport poll_profile();

    // CFG-CFG saving every section to every non-volatile device
    ExchangeReport save_config();

    // Set (or poll, for the poll profile), then save when asked to and the
    // first step succeeded. A skipped save reports ok with zero attempts.
    ConfigureReport configure(const NavProfile& profile, bool save);

    static UbxFrame save_request();

    // nullptr silences per-attempt messages
    void set_log(std::ostream* log) { log_ = log; }
    void set_read_budget(int reads, std::chrono::milliseconds timeout);

private:
    using ReplyCheck = std::function<std::optional<Error>(const UbxFrame& reply)>;

    ByteChannel& channel_;
    int max_attempts_;
    int read_budget_ = Protocol::READ_BUDGET;
    std::chrono::milliseconds read_timeout_{Protocol::REPLY_TIMEOUT_MS};
    std::ostream* log_ = &std::cerr;
    std::optional<UbxFrame> trailing_ack_;     // skipped once by the next exchange

    ExchangeReport transact(const char* name, const UbxFrame& request, const ReplyCheck& check);
    ExchangeReport await_ack(const char* name, const UbxFrame& request);
};

} // namespace gpsmodel
