#pragma once

#include <optional>
#include <string>
#include <string_view>

// Bitcoin-alphabet base58, as used by the multibase “z” prefix.
std::string base58Encode(std::string_view data);
// Returns nullopt if “s” contains a character outside the alphabet.
std::optional<std::string> base58Decode(std::string_view s);
