#pragma once

#include <string>
#include <vector>
#include <variant>
#include <cstdint>

#include "common/types.hpp"

namespace gpsmodel {

struct ProfileField
{
    std::string name;
    int64_t value = 0;
    uint8_t width = 1;      // bytes on the wire
    bool is_signed = false;
};

// "poll" sends CFG-NAV5 without a payload and asks the receiver for its
// current block.
struct PollProfile {};

// Fields in CFG-NAV5 wire order
struct ConfiguredProfile
{
    std::vector<ProfileField> fields;
};

struct NavProfile
{
    std::string name;
    std::variant<PollProfile, ConfiguredProfile> data;

    bool is_poll() const { return std::holds_alternative<PollProfile>(data); }
    const ProfileField* field(const std::string& field_name) const;
};

class ProfileCatalog
{
public:
    static std::vector<std::string> profile_names();
    static Result<NavProfile, ConfigError> find_profile(const std::string& name);

    static bool is_overridable(const std::string& field_name);
    static std::vector<std::string> overridable_fields();

    // Fixed-width little-endian encoding; width and signedness come from
    // the CFG-NAV5 field table.
    static Result<std::vector<uint8_t>, ConfigError> encode_field(const std::string& field_name, int64_t value);

    // Empty for the poll profile
    static std::vector<uint8_t> payload_for(const NavProfile& profile);

    // Returns a copy of profile with one field replaced. The field order
    // and widths never change.
    static Result<NavProfile, ConfigError> apply_override(const NavProfile& profile, const std::string& field_name, int64_t value);

    // Inverse of payload_for for a CFG-NAV5 block read back from the receiver
    static Result<std::vector<ProfileField>> decode_payload(const std::vector<uint8_t>& payload);
};

} // namespace gpsmodel
