#pragma once

#include <chrono>
#include <optional>
#include <string>

#include "types.hpp"

namespace http_utils
{
std::string getHttpDate(Time t = Clock::now());
// Parse an IMF-fixdate, e.g. “Sun, 06 Nov 1994 08:49:37 GMT”.
std::optional<Time> parseHttpDate(const std::string& date_str);
bool checkDateSkew(const std::string& date_str,
                   std::chrono::seconds max_skew = std::chrono::seconds(60),
                   Time now = Clock::now());
} // namespace http_utils
