#pragma once

#include <tid/base32.hpp>
#include <tid/result.hpp>
#include <tid/uuid.hpp>
#include <cstddef>
#include <functional>
#include <string>
#include <string_view>

namespace tid {

// The 26-character, sortable base32 suffix of a TypeID. Holds exactly the
// 128-bit payload; the text form is derived on demand and always re-encodes
// to the string it was parsed from.
class Suffix {
public:
    // All-zero suffix, "00000000000000000000000000"
    Suffix() = default;
    explicit Suffix(const Bytes128& bytes) : bytes_(bytes) {}

    static Suffix from_uuid(const Uuid& uuid);

    // New suffix from a time-ordered (version 7) UUID
    static Suffix generate();

    // Decode untrusted text. Fails with InvalidSuffix and one of
    // InvalidLength, InvalidCharacter or InvalidFirstCharacter.
    static Result<Suffix> parse(std::string_view text, Observer* observer = nullptr);

    std::string to_string(Observer* observer = nullptr) const;

    // Payload as a UUID. The version and variant bits are not inspected.
    Uuid to_uuid() const;

    // Payload as a UUID that must carry `version` and the RFC 4122 variant
    Result<Uuid> to_uuid_checked(int version) const;

    const Bytes128& bytes() const { return bytes_; }
    bool is_nil() const;

    bool operator==(const Suffix& other) const { return bytes_ == other.bytes_; }
    bool operator!=(const Suffix& other) const { return bytes_ != other.bytes_; }
    bool operator<(const Suffix& other) const { return bytes_ < other.bytes_; }
    bool operator<=(const Suffix& other) const { return bytes_ <= other.bytes_; }
    bool operator>(const Suffix& other) const { return bytes_ > other.bytes_; }
    bool operator>=(const Suffix& other) const { return bytes_ >= other.bytes_; }

private:
    Bytes128 bytes_{};
};

} // namespace tid

namespace std {

template<>
struct hash<tid::Suffix> {
    size_t operator()(const tid::Suffix& s) const noexcept;
};

} // namespace std
