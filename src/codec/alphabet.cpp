#include <tid/alphabet.hpp>
#include <array>

namespace tid::alphabet {

namespace {

constexpr uint8_t kInvalid = 0xFF;

// Inverse of `symbols`, indexed by unsigned byte value
constexpr std::array<uint8_t, 256> build_decode_table() {
    std::array<uint8_t, 256> table{};
    for (auto& entry : table) entry = kInvalid;
    for (std::size_t i = 0; i < size; ++i) {
        table[static_cast<unsigned char>(symbols[i])] = static_cast<uint8_t>(i);
    }
    return table;
}

constexpr std::array<uint8_t, 256> decode_table = build_decode_table();

static_assert(decode_table['0'] == 0, "'0' must decode to 0");
static_assert(decode_table['7'] == 7, "'7' must decode to 7");
static_assert(decode_table['z'] == 31, "'z' must decode to 31");
static_assert(decode_table['i'] == kInvalid && decode_table['l'] == kInvalid &&
              decode_table['o'] == kInvalid && decode_table['u'] == kInvalid,
              "ambiguous letters must stay out of the alphabet");

} // namespace

std::optional<uint8_t> symbol_to_value(char c) {
    uint8_t v = decode_table[static_cast<unsigned char>(c)];
    if (v == kInvalid) return std::nullopt;
    return v;
}

char value_to_symbol(uint8_t value) {
    return symbols[value & 0x1F];
}

} // namespace tid::alphabet
