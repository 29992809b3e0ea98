#pragma once
#include <cstdint>
#include <cstddef>
#include <string_view>

#include "../shared/hashing.h"

namespace memcli {

constexpr size_t MAX_ARGS = 32;

// Whitespace-split view over a command line or over argv, with the FNV-1a
// hash of every word precomputed for switch dispatch. Views borrow from the
// source line/argv, which must outlive this object.
struct parsed_args
{
    std::string_view args[MAX_ARGS];
    uint32_t hashes[MAX_ARGS];
    size_t count = 0;
    bool truncated = false;

    void parse(std::string_view line)
    {
        count = 0;
        truncated = false;
        size_t i = 0;
        while (i < line.size())
        {
            while (i < line.size() && is_space(line[i]))
                ++i;
            if (i >= line.size()) break;

            if (count == MAX_ARGS)
            {
                truncated = true;
                break;
            }

            size_t start = i;
            while (i < line.size() && !is_space(line[i]))
                ++i;

            push(line.substr(start, i - start));
        }
    }

    void assign(int argc, char** argv, int first = 1)
    {
        count = 0;
        truncated = false;
        for (int i = first; i < argc; ++i)
        {
            if (count == MAX_ARGS)
            {
                truncated = true;
                break;
            }
            push(argv[i]);
        }
    }

    std::string_view at(size_t idx) const { return idx < count ? args[idx] : std::string_view{}; }
    bool has(size_t idx) const { return idx < count; }

private:
    static bool is_space(char c)
    {
        return c == ' ' || c == '\t' || c == '\r' || c == '\n' || c == '\v' || c == '\f';
    }

    void push(std::string_view word)
    {
        args[count] = word;
        hashes[count] = fnv1a(word);
        ++count;
    }
};

} // namespace memcli
