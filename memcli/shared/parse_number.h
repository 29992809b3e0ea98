#pragma once
#include <charconv>
#include <cstddef>
#include <cstdint>
#include <string_view>

namespace memcli {

// Allocation-free unsigned parsing; the whole view must be digits
template <typename T>
inline bool parse_unsigned(std::string_view sv, T& out)
{
    if (sv.empty())
        return false;
    auto [ptr, ec] = std::from_chars(sv.data(), sv.data() + sv.size(), out);
    return ec == std::errc{} && ptr == sv.data() + sv.size();
}

inline bool parse_uint32(std::string_view sv, uint32_t& out) { return parse_unsigned(sv, out); }
inline bool parse_uint64(std::string_view sv, uint64_t& out) { return parse_unsigned(sv, out); }

// Size with optional K/M/G suffix (e.g. "2M" -> 2097152)
inline bool parse_size_suffix(std::string_view sv, size_t& out)
{
    if (sv.empty()) return false;
    uint64_t multiplier = 1;
    std::string_view num_part = sv;
    char last = sv.back();
    if (last == 'K' || last == 'k') { multiplier = 1024; num_part = sv.substr(0, sv.size()-1); }
    else if (last == 'M' || last == 'm') { multiplier = 1024*1024; num_part = sv.substr(0, sv.size()-1); }
    else if (last == 'G' || last == 'g') { multiplier = 1024ULL*1024*1024; num_part = sv.substr(0, sv.size()-1); }
    uint64_t val;
    if (!parse_unsigned(num_part, val))
        return false;
    if (val > UINT64_MAX / multiplier)
        return false;
    out = static_cast<size_t>(val * multiplier);
    return true;
}

// Seconds with an optional fractional part ("1", "0.5", "2.25") -> ms
inline bool parse_seconds_ms(std::string_view sv, uint64_t& ms)
{
    size_t dot = sv.find('.');
    std::string_view whole = sv.substr(0, dot);
    std::string_view frac = dot == std::string_view::npos ? std::string_view{} : sv.substr(dot + 1);

    uint64_t secs = 0;
    if (!whole.empty() && !parse_unsigned(whole, secs))
        return false;
    if (whole.empty() && frac.empty())
        return false;
    if (secs > UINT64_MAX / 1000)
        return false;

    uint64_t part = 0;
    uint64_t scale = 100;
    for (char c : frac)
    {
        if (c < '0' || c > '9')
            return false;
        part += static_cast<uint64_t>(c - '0') * scale;
        scale /= 10;
    }
    ms = secs * 1000 + part;
    return true;
}

} // namespace memcli
