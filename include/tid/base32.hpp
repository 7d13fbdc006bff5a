#pragma once

#include <tid/result.hpp>
#include <array>
#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>

namespace tid {

class Observer;

// 128-bit payload, most significant byte first
using Bytes128 = std::array<uint8_t, 16>;

// 26 symbols x 5 bits = 130 bits; the top 2 are always zero
constexpr std::size_t suffix_length = 26;

// Largest value the first symbol may take (its top 2 bits are padding)
constexpr uint8_t max_first_value = 7;

// Encode 128 bits as 26 base32 symbols, most significant group first.
// Total and injective; numeric order of `bytes` equals string order of
// the result.
std::string encode_base32(const Bytes128& bytes, Observer* observer = nullptr);

// Validate and decode a 26-symbol string. Checks run in order and the
// first failure is returned:
//   1. length is exactly 26              -> InvalidSuffix/InvalidLength
//   2. every byte is an alphabet symbol  -> InvalidSuffix/InvalidCharacter
//   3. first symbol value is <= 7        -> InvalidSuffix/InvalidFirstCharacter
// Safe for any input, including empty, non-ASCII and oversized strings.
Result<Bytes128> decode_base32(std::string_view encoded, Observer* observer = nullptr);

} // namespace tid
