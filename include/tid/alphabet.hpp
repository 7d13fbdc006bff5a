#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>

namespace tid::alphabet {

// Crockford's base32 symbols in lower case. The order is part of the
// format: symbol order equals value order, so encoded strings sort like
// the numbers they encode. Never reorder.
inline constexpr char symbols[] = "0123456789abcdefghjkmnpqrstvwxyz";
inline constexpr std::size_t size = sizeof(symbols) - 1;

static_assert(size == 32, "base32 alphabet must hold exactly 32 symbols");

// 5-bit value of `c`, or nullopt when `c` is not one of the 32 symbols.
// Upper case letters and the excluded i, l, o, u are rejected.
std::optional<uint8_t> symbol_to_value(char c);

// Symbol for the low 5 bits of `value`
char value_to_symbol(uint8_t value);

} // namespace tid::alphabet
