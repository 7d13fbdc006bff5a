#include <tid/suffix.hpp>
#include <tid/diagnostics.hpp>
#include <algorithm>

namespace tid {

Suffix Suffix::from_uuid(const Uuid& uuid) {
    return Suffix(uuid.bytes);
}

Suffix Suffix::generate() {
    return from_uuid(Uuid::v7());
}

Result<Suffix> Suffix::parse(std::string_view text, Observer* observer) {
    return decode_base32(text, observer ? observer : default_observer())
        .map([](Bytes128& b) { return Suffix(b); });
}

std::string Suffix::to_string(Observer* observer) const {
    return encode_base32(bytes_, observer ? observer : default_observer());
}

Uuid Suffix::to_uuid() const {
    return Uuid::from_bytes(bytes_);
}

Result<Uuid> Suffix::to_uuid_checked(int version) const {
    Uuid u = to_uuid();
    if (u.version() != version) {
        return TidError{TidError::InvalidUuid, TidError::InvalidVersion,
            "UUID version is not valid for this TypeID",
            "expected version " + std::to_string(version) +
                ", got " + std::to_string(u.version())};
    }
    if (u.variant() != Uuid::Variant::RFC4122) {
        return TidError{TidError::InvalidUuid, TidError::InvalidVariant,
            "UUID variant is not RFC4122",
            std::string("got variant ") + variant_name(u.variant())};
    }
    return Result<Uuid>::ok(u);
}

bool Suffix::is_nil() const {
    return std::all_of(bytes_.begin(), bytes_.end(),
                       [](uint8_t b) { return b == 0; });
}

} // namespace tid

std::size_t std::hash<tid::Suffix>::operator()(const tid::Suffix& s) const noexcept {
    // FNV-1a over the payload
    uint64_t h = 14695981039346656037ull;
    for (uint8_t b : s.bytes()) {
        h ^= b;
        h *= 1099511628211ull;
    }
    return static_cast<std::size_t>(h);
}
