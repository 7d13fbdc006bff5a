#include <tid/uuid.hpp>
#include <chrono>
#include <fstream>
#include <random>

namespace tid {

// ---- RNG: /dev/urandom with mt19937_64 fallback ----

static void fill_random_bytes(uint8_t* buf, size_t len) {
    std::ifstream urandom("/dev/urandom", std::ios::binary);
    if (urandom.is_open()) {
        urandom.read(reinterpret_cast<char*>(buf), static_cast<std::streamsize>(len));
        if (static_cast<size_t>(urandom.gcount()) == len) return;
    }
    std::random_device rd;
    std::mt19937_64 gen(rd());
    std::uniform_int_distribution<unsigned> dist(0, 255);
    for (size_t i = 0; i < len; ++i) {
        buf[i] = static_cast<uint8_t>(dist(gen));
    }
}

static void set_version_and_variant(Uuid& u, int version) {
    // bytes[6] high nibble = version
    u.bytes[6] = static_cast<uint8_t>((u.bytes[6] & 0x0F) | (version << 4));
    // bytes[8] top two bits = 10 (RFC 4122)
    u.bytes[8] = static_cast<uint8_t>((u.bytes[8] & 0x3F) | 0x80);
}

// ---- Hex helpers ----

static const char hex_chars[] = "0123456789abcdef";

static int hex_val(char c) {
    if (c >= '0' && c <= '9') return c - '0';
    if (c >= 'a' && c <= 'f') return c - 'a' + 10;
    if (c >= 'A' && c <= 'F') return c - 'A' + 10;
    return -1;
}

// ---- Constructors ----

Uuid Uuid::nil() {
    return Uuid{};
}

Uuid Uuid::max() {
    Uuid u;
    u.bytes.fill(0xFF);
    return u;
}

Uuid Uuid::from_bytes(const std::array<uint8_t, 16>& b) {
    Uuid u;
    u.bytes = b;
    return u;
}

Uuid Uuid::v4() {
    Uuid u;
    fill_random_bytes(u.bytes.data(), 16);
    set_version_and_variant(u, 4);
    return u;
}

Uuid Uuid::v7() {
    using namespace std::chrono;
    auto ms = static_cast<uint64_t>(
        duration_cast<milliseconds>(system_clock::now().time_since_epoch()).count());

    Uuid u;
    fill_random_bytes(u.bytes.data() + 6, 10);
    for (int i = 0; i < 6; ++i) {
        u.bytes[i] = static_cast<uint8_t>(ms >> (40 - 8 * i));
    }
    set_version_and_variant(u, 7);
    return u;
}

// ---- Version / variant ----

int Uuid::version() const {
    return bytes[6] >> 4;
}

Uuid::Variant Uuid::variant() const {
    uint8_t b = bytes[8];
    if ((b & 0x80) == 0x00) return Variant::NCS;
    if ((b & 0xC0) == 0x80) return Variant::RFC4122;
    if ((b & 0xE0) == 0xC0) return Variant::Microsoft;
    return Variant::Future;
}

const char* variant_name(Uuid::Variant v) {
    switch (v) {
        case Uuid::Variant::NCS:       return "NCS";
        case Uuid::Variant::RFC4122:   return "RFC4122";
        case Uuid::Variant::Microsoft: return "Microsoft";
        case Uuid::Variant::Future:    return "Future";
    }
    return "Unknown";
}

// ---- to_string: xxxxxxxx-xxxx-xxxx-xxxx-xxxxxxxxxxxx ----

std::string Uuid::to_string() const {
    std::string out;
    out.reserve(36);
    for (int i = 0; i < 16; ++i) {
        out += hex_chars[bytes[i] >> 4];
        out += hex_chars[bytes[i] & 0x0F];
        if (i == 3 || i == 5 || i == 7 || i == 9) {
            out += '-';
        }
    }
    return out;
}

// ---- from_string ----

Result<Uuid> Uuid::from_string(const std::string& s) {
    if (s.size() != 36) {
        return TidError(TidError::Parse,
            "UUID string must be 36 characters",
            "Expected format: xxxxxxxx-xxxx-xxxx-xxxx-xxxxxxxxxxxx, got " +
                std::to_string(s.size()) + " characters");
    }
    if (s[8] != '-' || s[13] != '-' || s[18] != '-' || s[23] != '-') {
        return TidError(TidError::Parse,
            "UUID string has invalid dash positions",
            "Expected dashes at positions 8, 13, 18, 23");
    }

    Uuid u;
    int byte_idx = 0;
    for (int i = 0; i < 36; ) {
        if (s[i] == '-') { ++i; continue; }
        int hi = hex_val(s[i]);
        int lo = hex_val(s[i + 1]);
        if (hi < 0 || lo < 0) {
            TidError e(TidError::Parse,
                "UUID string contains invalid hex character",
                std::string("Invalid char at position ") + std::to_string(hi < 0 ? i : i + 1));
            e.position = hi < 0 ? i : i + 1;
            return e;
        }
        u.bytes[byte_idx++] = static_cast<uint8_t>((hi << 4) | lo);
        i += 2;
    }
    return Result<Uuid>::ok(u);
}

// ---- Comparison ----

bool Uuid::operator==(const Uuid& other) const {
    return bytes == other.bytes;
}

bool Uuid::operator!=(const Uuid& other) const {
    return bytes != other.bytes;
}

bool Uuid::operator<(const Uuid& other) const {
    return bytes < other.bytes;
}

} // namespace tid
