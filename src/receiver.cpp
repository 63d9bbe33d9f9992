#include "devices/receiver.hpp"
#include "transport/frame_reader.hpp"
#include "common/helpers.hpp"

namespace gpsmodel {

Receiver::Receiver(ByteChannel& channel, int max_attempts)
    : channel_(channel), max_attempts_(max_attempts) {}

void Receiver::set_read_budget(int reads, std::chrono::milliseconds timeout)
{
    read_budget_ = reads;
    read_timeout_ = timeout;
}

ExchangeReport Receiver::transact(const char* name, const UbxFrame& request, const ReplyCheck& check)
{
    ExchangeReport report;
    std::vector<uint8_t> frame = request.serialize();

    // A poll leaves its ACK-ACK queued behind the echoed block
    std::optional<UbxFrame> stale = std::move(trailing_ack_);
    trailing_ack_.reset();

    for (int attempt = 1; attempt <= max_attempts_; attempt++)
    {
        report.attempts = attempt;

        Error error = Error::WRITE_ERROR;
        auto write_result = channel_.write(frame.data(), frame.size());
        if (write_result.ok() && write_result.value() == frame.size())
        {
            FrameReader reader(channel_, read_budget_, read_timeout_);
            auto reply = reader.next_frame();
            if (reply.ok() && stale && reply.value() == *stale) {
                stale.reset();
                reply = reader.next_frame();
            }
            if (!reply.ok()) {
                error = reply.error();
            } else if (auto mismatch = check(reply.value())) {
                error = *mismatch;
                if (log_) {
                    *log_ << "[" << name << "] got " << bytesToHex(reply.value().serialize()) << "\n";
                }
            } else {
                report.ok = true;
                report.reply = reply.value();
                return report;
            }
        }
        else if (!write_result.ok())
        {
            error = write_result.error();
        }

        report.last_error = error;
        if (log_) {
            *log_ << "[" << name << "] attempt " << attempt << "/" << max_attempts_
                  << " failed: " << to_string(error) << "\n";
        }
    }

    return report;
}

ExchangeReport Receiver::await_ack(const char* name, const UbxFrame& request)
{
    const uint8_t msg_class = request.msg_class();
    const uint8_t msg_id = request.msg_id();

    return transact(name, request, [msg_class, msg_id](const UbxFrame& reply) -> std::optional<Error> {
        if (reply.is_ack_for(msg_class, msg_id))
            return std::nullopt;
        if (reply.is_nak_for(msg_class, msg_id))
            return Error::NACK;
        return Error::UNEXPECTED_REPLY;
    });
}

ExchangeReport Receiver::set_profile(const NavProfile& profile)
{
    auto request = UbxFrame::make(Protocol::Class::CFG, Protocol::Cfg::NAV5, ProfileCatalog::payload_for(profile));
    if (!request.ok()) {
        ExchangeReport report;
        report.last_error = request.error();
        return report;
    }
    return await_ack("CFG-NAV5", request.value());
}

ExchangeReport Receiver::poll_profile()
{
    UbxFrame request = UbxFrame::make(Protocol::Class::CFG, Protocol::Cfg::NAV5).value();

    ExchangeReport report = transact("CFG-NAV5 poll", request, [](const UbxFrame& reply) -> std::optional<Error> {
        if (reply.msg_class() == Protocol::Class::CFG && reply.msg_id() == Protocol::Cfg::NAV5)
            return std::nullopt;
        return Error::UNEXPECTED_REPLY;
    });

    if (report.ok)
        trailing_ack_ = UbxFrame::ack_for(Protocol::Class::CFG, Protocol::Cfg::NAV5);
    return report;
}

UbxFrame Receiver::save_request()
{
    std::vector<uint8_t> payload;
    payload.reserve(Protocol::Cfg::CFG_PAYLOAD_LEN);

    auto append_u32 = [&payload](uint32_t v) {
        for (int i = 0; i < 4; i++)
            payload.push_back(static_cast<uint8_t>((v >> (8 * i)) & 0xFF));
    };

    append_u32(0);                                  // clearMask
    append_u32(Protocol::Cfg::SAVE_ALL_SECTIONS);   // saveMask
    append_u32(0);                                  // loadMask
    payload.push_back(Protocol::Cfg::ALL_DEVICES);  // deviceMask

    return UbxFrame::make(Protocol::Class::CFG, Protocol::Cfg::CFG, std::move(payload)).value();
}

ExchangeReport Receiver::save_config()
{
    return await_ack("CFG-CFG", save_request());
}

ConfigureReport Receiver::configure(const NavProfile& profile, bool save)
{
    ConfigureReport report;

    report.config = profile.is_poll() ? poll_profile() : set_profile(profile);

    if (save && report.config.ok) {
        report.save = save_config();
    } else {
        report.save.ok = true;
        report.save.attempts = 0;
    }

    return report;
}

} // namespace gpsmodel
