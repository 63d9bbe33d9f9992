#include "devices/nav_profile.hpp"
#include "common/protocol.hpp"

#include <algorithm>

namespace gpsmodel {

namespace {

struct FieldSpec
{
    const char* name;
    uint8_t width;
    bool is_signed;
    bool overridable;
    int64_t default_value;
};

// UBX-CFG-NAV5, u-blox 8 / M8 receiver description. The order is the wire
// order.
constexpr FieldSpec NAV5_FIELDS[] = {
    {"mask",              2, false, true,  0x05FF},
    {"dynModel",          1, false, false, 0},
    {"fixMode",           1, false, true,  3},
    {"fixedAlt",          4, true,  true,  0},
    {"fixedAltVar",       4, false, true,  10000},
    {"minElev",           1, true,  true,  5},
    {"drLimit",           1, false, true,  0},
    {"pDop",              2, false, true,  250},
    {"tDop",              2, false, true,  250},
    {"pAcc",              2, false, true,  100},
    {"tAcc",              2, false, true,  300},
    {"staticHoldThresh",  1, false, true,  0},
    {"dgnssTimeOut",      1, false, true,  60},
    {"cnoThreshNumSVs",   1, false, true,  0},
    {"cnoThresh",         1, false, true,  0},
    {"reserved1",         2, false, false, 0},
    {"staticHoldMaxDist", 2, false, true,  0},
    {"utcStandard",       1, false, true,  0},
    {"reserved2",         5, false, false, 0},
};

struct ProfileSpec
{
    const char* name;
    int dyn_model;      // -1 for poll
};

constexpr ProfileSpec PROFILES[] = {
    {"portable",        0},
    {"stationary",      2},
    {"pedestrian",      3},
    {"automotive",      4},
    {"sea",             5},
    {"airborne_lt_1g",  6},
    {"airborne_lt_2g",  7},
    {"airborne_lt_4g",  8},
    {"wrist",           9},
    {"poll",           -1},
};

const FieldSpec* find_spec(const std::string& name)
{
    for (const auto& spec : NAV5_FIELDS) {
        if (name == spec.name)
            return &spec;
    }
    return nullptr;
}

bool fits(int64_t value, uint8_t width, bool is_signed)
{
    const int bits = width * 8;
    if (is_signed) {
        const int64_t min = -(int64_t(1) << (bits - 1));
        const int64_t max = (int64_t(1) << (bits - 1)) - 1;
        return value >= min && value <= max;
    }
    const int64_t max = (int64_t(1) << bits) - 1;
    return value >= 0 && value <= max;
}

void append_le(std::vector<uint8_t>& out, int64_t value, uint8_t width)
{
    uint64_t raw = static_cast<uint64_t>(value);
    for (uint8_t i = 0; i < width; i++) {
        out.push_back(static_cast<uint8_t>((raw >> (8 * i)) & 0xFF));
    }
}

int64_t read_le(const uint8_t* data, uint8_t width, bool is_signed)
{
    uint64_t raw = 0;
    for (uint8_t i = 0; i < width; i++) {
        raw |= static_cast<uint64_t>(data[i]) << (8 * i);
    }
    const int bits = width * 8;
    if (is_signed && (raw & (uint64_t(1) << (bits - 1)))) {
        raw |= ~uint64_t(0) << bits;
    }
    return static_cast<int64_t>(raw);
}

} // anonymous namespace

const ProfileField* NavProfile::field(const std::string& field_name) const
{
    const auto* configured = std::get_if<ConfiguredProfile>(&data);
    if (!configured)
        return nullptr;

    for (const auto& f : configured->fields) {
        if (f.name == field_name)
            return &f;
    }
    return nullptr;
}

std::vector<std::string> ProfileCatalog::profile_names()
{
    std::vector<std::string> names;
    for (const auto& p : PROFILES)
        names.push_back(p.name);
    return names;
}

Result<NavProfile, ConfigError> ProfileCatalog::find_profile(const std::string& name)
{
    for (const auto& p : PROFILES)
    {
        if (name != p.name)
            continue;

        NavProfile profile;
        profile.name = p.name;

        if (p.dyn_model < 0) {
            profile.data = PollProfile{};
            return Result<NavProfile, ConfigError>::success(std::move(profile));
        }

        ConfiguredProfile configured;
        for (const auto& spec : NAV5_FIELDS) {
            ProfileField f;
            f.name = spec.name;
            f.width = spec.width;
            f.is_signed = spec.is_signed;
            f.value = (f.name == "dynModel") ? p.dyn_model : spec.default_value;
            configured.fields.push_back(std::move(f));
        }
        profile.data = std::move(configured);
        return Result<NavProfile, ConfigError>::success(std::move(profile));
    }

    return Result<NavProfile, ConfigError>::failure(ConfigError::UNKNOWN_PROFILE);
}

bool ProfileCatalog::is_overridable(const std::string& field_name)
{
    const FieldSpec* spec = find_spec(field_name);
    return spec && spec->overridable;
}

std::vector<std::string> ProfileCatalog::overridable_fields()
{
    std::vector<std::string> names;
    for (const auto& spec : NAV5_FIELDS) {
        if (spec.overridable)
            names.push_back(spec.name);
    }
    return names;
}

Result<std::vector<uint8_t>, ConfigError> ProfileCatalog::encode_field(const std::string& field_name, int64_t value)
{
    const FieldSpec* spec = find_spec(field_name);
    if (!spec) {
        return Result<std::vector<uint8_t>, ConfigError>::failure(ConfigError::INVALID_FIELD_NAME);
    }
    if (!fits(value, spec->width, spec->is_signed)) {
        return Result<std::vector<uint8_t>, ConfigError>::failure(ConfigError::FIELD_OVERFLOW);
    }

    std::vector<uint8_t> bytes;
    append_le(bytes, value, spec->width);
    return Result<std::vector<uint8_t>, ConfigError>::success(std::move(bytes));
}

std::vector<uint8_t> ProfileCatalog::payload_for(const NavProfile& profile)
{
    std::vector<uint8_t> payload;

    const auto* configured = std::get_if<ConfiguredProfile>(&profile.data);
    if (!configured)
        return payload;

    // Values were range checked when the profile was built or overridden
    for (const auto& f : configured->fields) {
        append_le(payload, f.value, f.width);
    }
    return payload;
}

Result<NavProfile, ConfigError> ProfileCatalog::apply_override(const NavProfile& profile, const std::string& field_name, int64_t value)
{
    if (!is_overridable(field_name) || profile.is_poll()) {
        return Result<NavProfile, ConfigError>::failure(ConfigError::INVALID_FIELD_NAME);
    }

    auto encoded = encode_field(field_name, value);
    if (!encoded.ok()) {
        return Result<NavProfile, ConfigError>::failure(encoded.error());
    }

    NavProfile updated = profile;
    auto& fields = std::get<ConfiguredProfile>(updated.data).fields;
    auto it = std::find_if(fields.begin(), fields.end(),
                           [&](const ProfileField& f) { return f.name == field_name; });
    if (it == fields.end()) {
        return Result<NavProfile, ConfigError>::failure(ConfigError::INVALID_FIELD_NAME);
    }
    it->value = value;

    return Result<NavProfile, ConfigError>::success(std::move(updated));
}

Result<std::vector<ProfileField>> ProfileCatalog::decode_payload(const std::vector<uint8_t>& payload)
{
    if (payload.size() != Protocol::Cfg::NAV5_PAYLOAD_LEN) {
        return Result<std::vector<ProfileField>>::failure(Error::PARSE_ERROR);
    }

    std::vector<ProfileField> fields;
    size_t pos = 0;
    for (const auto& spec : NAV5_FIELDS) {
        ProfileField f;
        f.name = spec.name;
        f.width = spec.width;
        f.is_signed = spec.is_signed;
        f.value = read_le(payload.data() + pos, spec.width, spec.is_signed);
        pos += spec.width;
        fields.push_back(std::move(f));
    }

    return Result<std::vector<ProfileField>>::success(std::move(fields));
}

} // namespace gpsmodel
