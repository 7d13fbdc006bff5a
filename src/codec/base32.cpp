#include <tid/base32.hpp>
#include <tid/alphabet.hpp>
#include <tid/diagnostics.hpp>
#include <cstdio>

namespace tid {

// ---- Helpers ----

// Printable description of one input byte for error hints
static std::string describe_byte(char c) {
    auto u = static_cast<unsigned char>(c);
    if (u >= 0x20 && u < 0x7F) {
        return std::string("'") + c + "'";
    }
    char buf[8];
    std::snprintf(buf, sizeof(buf), "0x%02X", u);
    return buf;
}

static TidError length_error(std::size_t actual) {
    return TidError{TidError::InvalidSuffix, TidError::InvalidLength,
        "suffix must be exactly 26 characters",
        "got " + std::to_string(actual) + " characters"};
}

static TidError character_error(char c, std::size_t pos) {
    std::string hint = "invalid character " + describe_byte(c) +
        " at position " + std::to_string(pos);
    if (static_cast<unsigned char>(c) >= 0x80) {
        hint += " (non-ASCII)";
    }
    TidError e{TidError::InvalidSuffix, TidError::InvalidCharacter,
        "suffix contains characters not in the base32 alphabet",
        hint + "; allowed: " + alphabet::symbols};
    e.position = static_cast<int>(pos);
    return e;
}

static TidError first_character_error(char c) {
    TidError e{TidError::InvalidSuffix, TidError::InvalidFirstCharacter,
        "first character of suffix must be '7' or less",
        "got " + describe_byte(c) + ", which would overflow 128 bits"};
    e.position = 0;
    return e;
}

// ---- Encode ----
// The payload is held as two 64-bit halves and consumed 5 bits at a time
// from the least significant end; the last symbol written (index 0) only
// receives the top 3 payload bits, so it is always <= 7.

static uint64_t load_be64(const uint8_t* p) {
    uint64_t v = 0;
    for (int i = 0; i < 8; ++i) v = (v << 8) | p[i];
    return v;
}

std::string encode_base32(const Bytes128& bytes, Observer* observer) {
    uint64_t hi = load_be64(bytes.data());
    uint64_t lo = load_be64(bytes.data() + 8);

    std::string out(suffix_length, '0');
    for (std::size_t i = suffix_length; i-- > 0; ) {
        out[i] = alphabet::value_to_symbol(static_cast<uint8_t>(lo & 0x1F));
        lo = (lo >> 5) | (hi << 59);
        hi >>= 5;
    }
    if (observer) observer->on_encode(bytes, out);
    return out;
}

// ---- Decode ----

static Result<Bytes128> decode_checked(std::string_view encoded) {
    if (encoded.size() != suffix_length) {
        return length_error(encoded.size());
    }

    std::array<uint8_t, suffix_length> values{};
    for (std::size_t i = 0; i < suffix_length; ++i) {
        auto v = alphabet::symbol_to_value(encoded[i]);
        if (!v) return character_error(encoded[i], i);
        values[i] = *v;
    }

    if (values[0] > max_first_value) {
        return first_character_error(encoded[0]);
    }

    // Shift the 130-bit field through a byte accumulator; the first two bits
    // are the zero padding confirmed above and are dropped.
    Bytes128 out{};
    uint32_t acc = values[0] & 0x07;
    int acc_bits = 3;
    std::size_t byte_idx = 0;
    for (std::size_t i = 1; i < suffix_length; ++i) {
        acc = (acc << 5) | values[i];
        acc_bits += 5;
        if (acc_bits >= 8) {
            acc_bits -= 8;
            out[byte_idx++] = static_cast<uint8_t>(acc >> acc_bits);
            acc &= (1u << acc_bits) - 1;
        }
    }
    return Result<Bytes128>::ok(out);
}

Result<Bytes128> decode_base32(std::string_view encoded, Observer* observer) {
    if (observer) observer->on_decode_begin(encoded);
    auto r = decode_checked(encoded);
    if (observer) {
        if (r.is_ok()) {
            observer->on_decode_ok(encoded, r.value());
        } else {
            observer->on_decode_error(encoded, r.error());
        }
    }
    return r;
}

} // namespace tid
