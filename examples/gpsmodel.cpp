#include <iostream>
#include <iomanip>
#include <string>
#include <vector>
#include <getopt.h>

#include "transport/serial.hpp"
#include "devices/receiver.hpp"
#include "devices/nav_profile.hpp"
#include "common/helpers.hpp"

using namespace gpsmodel;

namespace {

constexpr int EXIT_EXCHANGE_FAILED = 1;
constexpr int EXIT_USAGE = 2;
constexpr int EXIT_PORT = 3;

void usage(const char* argv0)
{
    std::cerr << "Usage: " << argv0 << " [-d DEVICE] [-b BAUD] [-s] [-q] PROFILE [field=value ...]\n"
              << "       " << argv0 << " -l\n\n"
              << "  -d, --device DEVICE  serial device (default " << Protocol::DEFAULT_DEVICE << ")\n"
              << "  -b, --baud BAUD      baud rate (default " << Protocol::DEFAULT_BAUD << ")\n"
              << "  -s, --save           save the configuration to non-volatile memory\n"
              << "  -q, --quiet          do not report individual retries\n"
              << "  -l, --list           list profiles and overridable fields\n";
}

void list_catalog()
{
    std::cout << "Profiles:\n";
    for (const auto& name : ProfileCatalog::profile_names())
        std::cout << "  " << name << "\n";

    std::cout << "Overridable fields:\n";
    for (const auto& name : ProfileCatalog::overridable_fields())
        std::cout << "  " << name << "\n";
}

void print_fields(const std::vector<ProfileField>& fields)
{
    for (const auto& f : fields) {
        std::cout << "  " << std::left << std::setw(18) << f.name << std::right << f.value << "\n";
    }
}

} // anonymous namespace

int main(int argc, char** argv)
{
    std::string device = Protocol::DEFAULT_DEVICE;
    int baud = Protocol::DEFAULT_BAUD;
    bool save = false;
    bool quiet = false;

    static const option long_options[] = {
        {"device", required_argument, nullptr, 'd'},
        {"baud",   required_argument, nullptr, 'b'},
        {"save",   no_argument,       nullptr, 's'},
        {"quiet",  no_argument,       nullptr, 'q'},
        {"list",   no_argument,       nullptr, 'l'},
        {"help",   no_argument,       nullptr, 'h'},
        {nullptr,  0,                 nullptr, 0}
    };

    int opt;
    while ((opt = getopt_long(argc, argv, "d:b:sqlh", long_options, nullptr)) != -1)
    {
        switch (opt) {
            case 'd':
                device = optarg;
                break;
            case 'b': {
                auto parsed = parseBaud(optarg);
                if (!parsed.ok() || !SerialPort::is_supported_baud(parsed.value())) {
                    std::cerr << "Unsupported baud rate: " << optarg << "\n";
                    return EXIT_USAGE;
                }
                baud = parsed.value();
                break;
            }
            case 's':
                save = true;
                break;
            case 'q':
                quiet = true;
                break;
            case 'l':
                list_catalog();
                return 0;
            case 'h':
                usage(argv[0]);
                return 0;
            default:
                usage(argv[0]);
                return EXIT_USAGE;
        }
    }

    if (optind >= argc) {
        usage(argv[0]);
        return EXIT_USAGE;
    }

    auto found = ProfileCatalog::find_profile(argv[optind]);
    if (!found.ok()) {
        std::cerr << argv[optind] << ": " << to_string(found.error()) << "\n";
        return EXIT_USAGE;
    }
    NavProfile profile = found.value();

    // Every override is checked before the port is touched
    for (int i = optind + 1; i < argc; i++)
    {
        auto ov = parseOverride(argv[i]);
        if (!ov.ok()) {
            std::cerr << argv[i] << ": " << to_string(ov.error()) << "\n";
            return EXIT_USAGE;
        }

        auto updated = ProfileCatalog::apply_override(profile, ov.value().name, ov.value().value);
        if (!updated.ok()) {
            std::cerr << argv[i] << ": " << to_string(updated.error()) << "\n";
            return EXIT_USAGE;
        }
        profile = updated.value();
    }

    SerialPort serial;
    if (!serial.open(device, baud).ok()) {
        std::cerr << "[FAIL] Cannot open " << device << "\n";
        return EXIT_PORT;
    }

    Receiver receiver(serial);
    if (quiet)
        receiver.set_log(nullptr);

    ConfigureReport report = receiver.configure(profile, save);
    serial.close();

    const char* step = profile.is_poll() ? "Poll" : "Set";
    if (report.config.ok) {
        std::cout << "[OK] " << step << " " << profile.name << " after "
                  << report.config.attempts << " attempt(s)\n";
    } else {
        std::cout << "[FAIL] " << step << " " << profile.name << ": "
                  << to_string(report.config.last_error) << "\n";
    }

    if (report.config.ok && profile.is_poll() && report.config.reply)
    {
        const auto& payload = report.config.reply->payload();
        auto decoded = ProfileCatalog::decode_payload(payload);
        if (decoded.ok()) {
            print_fields(decoded.value());
        } else {
            std::cout << "  " << bytesToHex(payload) << "\n";
        }
    }

    if (save && report.config.ok) {
        if (report.save.ok) {
            std::cout << "[OK] Configuration saved\n";
        } else {
            std::cout << "[FAIL] Save: " << to_string(report.save.last_error) << "\n";
        }
    } else if (save) {
        std::cout << "[SKIP] Save not attempted\n";
    }

    return report.ok() ? 0 : EXIT_EXCHANGE_FAILED;
}
