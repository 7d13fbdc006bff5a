#pragma once

#include <tid/result.hpp>
#include <array>
#include <cstdint>
#include <string>

namespace tid {

struct Uuid {
    enum class Variant { NCS, RFC4122, Microsoft, Future };

    std::array<uint8_t, 16> bytes{};

    static Uuid nil();
    static Uuid max();
    static Uuid v4();
    // Unix-millisecond timestamp in the top 48 bits, then random bits
    static Uuid v7();
    static Uuid from_bytes(const std::array<uint8_t, 16>& b);

    int version() const;
    Variant variant() const;

    std::string to_string() const;
    static Result<Uuid> from_string(const std::string& s);

    bool operator==(const Uuid& other) const;
    bool operator!=(const Uuid& other) const;
    bool operator<(const Uuid& other) const;
};

const char* variant_name(Uuid::Variant v);

} // namespace tid
