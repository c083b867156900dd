#include "http_utils.hpp"

#include <ctime>
#include <iomanip>
#include <locale>
#include <sstream>

namespace http_utils {

std::string getHttpDate(Time t)
{
    std::time_t tt = Clock::to_time_t(t);
    std::tm tm = {};
    gmtime_r(&tt, &tm);
    std::stringstream ss;
    ss.imbue(std::locale::classic());
    ss << std::put_time(&tm, "%a, %d %b %Y %H:%M:%S GMT");
    return ss.str();
}

std::optional<Time> parseHttpDate(const std::string& date_str)
{
    std::tm tm = {};
    std::stringstream ss(date_str);
    ss.imbue(std::locale::classic());
    ss >> std::get_time(&tm, "%a, %d %b %Y %H:%M:%S GMT");
    if(ss.fail())
    {
        return std::nullopt;
    }
    return Clock::from_time_t(timegm(&tm));
}

bool checkDateSkew(const std::string& date_str, std::chrono::seconds max_skew,
                   Time now)
{
    std::optional<Time> t = parseHttpDate(date_str);
    if(!t.has_value())
    {
        return false;
    }
    auto diff = std::chrono::abs(
        std::chrono::duration_cast<std::chrono::seconds>(now - *t));
    return diff <= max_skew;
}

} // namespace http_utils
