#include "base58.hpp"

#include <array>
#include <cstdint>
#include <vector>

namespace {

constexpr char ALPHABET[] =
    "123456789ABCDEFGHJKLMNPQRSTUVWXYZabcdefghijkmnopqrstuvwxyz";

constexpr std::array<int8_t, 128> makeReverseTable()
{
    std::array<int8_t, 128> table{};
    for(auto& v : table)
    {
        v = -1;
    }
    for(int8_t i = 0; i < 58; i++)
    {
        table[static_cast<size_t>(ALPHABET[i])] = i;
    }
    return table;
}

constexpr std::array<int8_t, 128> REVERSE = makeReverseTable();

} // namespace

std::string base58Encode(std::string_view data)
{
    size_t zeros = 0;
    while(zeros < data.size() && data[zeros] == '\0')
    {
        zeros++;
    }

    // log(256) / log(58) ≈ 1.37
    std::vector<uint8_t> digits((data.size() - zeros) * 138 / 100 + 1, 0);
    size_t length = 0;
    for(size_t i = zeros; i < data.size(); i++)
    {
        int carry = static_cast<uint8_t>(data[i]);
        size_t j = 0;
        for(auto it = digits.rbegin();
            (carry != 0 || j < length) && it != digits.rend(); it++, j++)
        {
            carry += 256 * (*it);
            *it = static_cast<uint8_t>(carry % 58);
            carry /= 58;
        }
        length = j;
    }

    auto it = digits.begin() + (digits.size() - length);
    while(it != digits.end() && *it == 0)
    {
        it++;
    }

    std::string result(zeros, '1');
    for(; it != digits.end(); it++)
    {
        result += ALPHABET[*it];
    }
    return result;
}

std::optional<std::string> base58Decode(std::string_view s)
{
    size_t ones = 0;
    while(ones < s.size() && s[ones] == '1')
    {
        ones++;
    }

    // log(58) / log(256) ≈ 0.733
    std::vector<uint8_t> bytes((s.size() - ones) * 733 / 1000 + 1, 0);
    size_t length = 0;
    for(size_t i = ones; i < s.size(); i++)
    {
        const auto c = static_cast<unsigned char>(s[i]);
        if(c >= REVERSE.size() || REVERSE[c] < 0)
        {
            return std::nullopt;
        }
        int carry = REVERSE[c];
        size_t j = 0;
        for(auto it = bytes.rbegin();
            (carry != 0 || j < length) && it != bytes.rend(); it++, j++)
        {
            carry += 58 * (*it);
            *it = static_cast<uint8_t>(carry % 256);
            carry /= 256;
        }
        length = j;
    }

    auto it = bytes.begin() + (bytes.size() - length);
    while(it != bytes.end() && *it == 0)
    {
        it++;
    }

    std::string result(ones, '\0');
    for(; it != bytes.end(); it++)
    {
        result += static_cast<char>(*it);
    }
    return result;
}
