#pragma once

#include <tid/result.hpp>
#include <tid/suffix.hpp>
#include <toml++/toml.hpp>
#include <string_view>

namespace tid {

// A suffix serializes as its 26-character string and deserializes through
// Suffix::parse(), so malformed strings fail with the same InvalidSuffix
// reasons. Non-string nodes fail with a Parse error.
toml::value<std::string> to_toml(const Suffix& suffix);
Result<Suffix> from_toml(const toml::node& node);

// Field helpers for suffixes embedded in a document
Result<Suffix> read_suffix(const toml::table& tbl, std::string_view key);
void write_suffix(toml::table& tbl, std::string_view key, const Suffix& suffix);

} // namespace tid
