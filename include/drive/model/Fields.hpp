#pragma once

#include <cstdint>

namespace dt::drive::model {

// Which node metadata a store call should return. Id is always returned.
enum class Field : uint16_t {
    Id       = 1 << 0,
    Name     = 1 << 1,
    Kind     = 1 << 2,
    Size     = 1 << 3,
    Times    = 1 << 4,
    Parents  = 1 << 5,
    Checksum = 1 << 6,
    Trashed  = 1 << 7,
};

struct Fields {
    uint16_t bits = static_cast<uint16_t>(Field::Id);

    constexpr Fields() = default;
    constexpr Fields(const Field f) : bits(static_cast<uint16_t>(f) | static_cast<uint16_t>(Field::Id)) {}

    [[nodiscard]] constexpr bool has(const Field f) const { return (bits & static_cast<uint16_t>(f)) != 0; }

    constexpr Fields operator|(const Fields o) const { Fields r; r.bits = bits | o.bits; return r; }
    constexpr bool operator==(const Fields&) const = default;
};

constexpr Fields operator|(const Field a, const Field b) { return Fields(a) | Fields(b); }

namespace fields {
inline constexpr Fields ID{};
inline constexpr Fields KIND = Field::Name | Field::Kind;
inline constexpr Fields INFO = Field::Name | Field::Kind | Field::Size | Field::Times;
inline constexpr Fields INFO_WITH_PARENTS = INFO | Field::Parents;
inline constexpr Fields ANCESTRY = Field::Name | Field::Parents;
inline constexpr Fields HASH = Field::Name | Field::Kind | Field::Checksum;
}

}
