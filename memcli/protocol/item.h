#pragma once
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

#include "mc_error.h"

namespace memcli {

// Header of a VALUE line: VALUE <key> <flags> <bytes> [<cas>]
struct value_header
{
    std::string key;
    uint32_t flags{0};
    size_t bytes{0};
    std::optional<uint64_t> cas;
};

// One cache entry. Built from a get/gets reply or by a caller about to
// store it; a plain value object with no ties to the connection.
class item
{
public:
    static constexpr size_t DISPLAY_LENGTH = 320;
    static constexpr std::string_view TRUNCATION_MARKER = "...(the rest is skipped)";
    static constexpr std::string_view NOT_ASCII = "(Not ASCII)";

    item() = default;

    // data must hold exactly header.bytes bytes; anything else is a framing
    // error and leaves `out` untouched
    static bool from_get_reply(const value_header& header, std::string data,
                               item& out, mc_error& err);
    static item build_for_set(std::string key, std::string value,
                              uint32_t expire = 0, uint32_t flags = 0);

    const std::string& key() const { return m_key; }
    const std::string& value() const { return m_value; }
    uint32_t flags() const { return m_flags; }
    uint32_t expire() const { return m_expire; }
    const std::optional<uint64_t>& cas() const { return m_cas; }
    size_t length() const { return m_value.size(); }

    void set_value(std::string value) { m_value = std::move(value); }
    void set_flags(uint32_t flags) { m_flags = flags; }
    void set_expire(uint32_t expire) { m_expire = expire; }
    void set_cas(uint64_t cas) { m_cas = cas; }

    // False when the leading byte is neither printable ASCII nor whitespace;
    // such values are shown as NOT_ASCII instead of raw bytes.
    bool is_display_safe() const;

    // Display text for the value, bounded to DISPLAY_LENGTH bytes
    std::string display_value() const;

    // The "    key:    value" block printed by get/gets
    std::string describe() const;

private:
    std::string m_key;
    std::string m_value;
    uint32_t m_flags{0};
    uint32_t m_expire{0};
    std::optional<uint64_t> m_cas;
};

} // namespace memcli
