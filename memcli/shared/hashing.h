#pragma once
#include <cstdint>
#include <string_view>

namespace memcli {

// FNV-1a, usable in case labels: switch (fnv1a(word)) { case fnv1a("get"): ... }
constexpr uint32_t fnv1a(std::string_view sv)
{
    uint32_t hash = 2166136261u;
    for (char c : sv)
        hash = (hash ^ static_cast<uint8_t>(c)) * 16777619u;
    return hash;
}

} // namespace memcli
