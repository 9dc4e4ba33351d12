/**
 * @file auth_string_utils.hpp
 * @brief String and address utilities for the authorization core
 * @author Bennie Shearer
 * @version 1.0.0
 * @date 2025-01-06
 *
 * This header provides:
 * - whitespace trimming and blank checks
 * - ASCII case folding, joining and substring replacement
 * - strict integer parsing
 * - dotted-quad IPv4 and CIDR parsing into host-order integers
 */

#ifndef AUTHCORE_STRING_UTILS_HPP
#define AUTHCORE_STRING_UTILS_HPP

#include <cctype>
#include <charconv>
#include <cstdint>
#include <iterator>
#include <optional>
#include <string>
#include <string_view>
#include <utility>

namespace authcore {
namespace string_utils {

namespace detail {

inline bool isSpace(char c) noexcept { return std::isspace(static_cast<unsigned char>(c)) != 0; }

inline std::string_view stripView(std::string_view s) noexcept {
    while (!s.empty() && isSpace(s.front())) s.remove_prefix(1);
    while (!s.empty() && isSpace(s.back())) s.remove_suffix(1);
    return s;
}

/** @brief Whole-string unsigned decimal, no sign and no whitespace */
template<typename T>
std::optional<T> digitsOnly(std::string_view s) noexcept {
    T value{};
    if (s.empty() || !std::isdigit(static_cast<unsigned char>(s.front()))) return std::nullopt;
    auto [ptr, ec] = std::from_chars(s.data(), s.data() + s.size(), value);
    if (ec != std::errc() || ptr != s.data() + s.size()) return std::nullopt;
    return value;
}

} // namespace detail

// ============================================================================
// Whitespace and case
// ============================================================================

[[nodiscard]] inline std::string trim(std::string_view s) { return std::string(detail::stripView(s)); }

[[nodiscard]] inline bool isBlank(std::string_view s) noexcept { return detail::stripView(s).empty(); }

[[nodiscard]] inline std::string toUpper(std::string_view s) {
    std::string out;
    out.reserve(s.size());
    for (char c : s) out += static_cast<char>(std::toupper(static_cast<unsigned char>(c)));
    return out;
}

[[nodiscard]] inline std::string toLower(std::string_view s) {
    std::string out;
    out.reserve(s.size());
    for (char c : s) out += static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    return out;
}

// ============================================================================
// Joining and replacing
// ============================================================================

/** @brief Concatenate the elements of @p parts (strings) with @p glue between them */
template<typename Container>
[[nodiscard]] std::string join(const Container& parts, std::string_view glue) {
    std::string out;
    for (auto it = std::begin(parts); it != std::end(parts); ++it) {
        if (it != std::begin(parts)) out += glue;
        out += *it;
    }
    return out;
}

[[nodiscard]] inline std::string replaceAll(std::string_view s, std::string_view from, std::string_view to) {
    if (from.empty()) return std::string(s);
    std::string out;
    std::size_t pos = 0;
    for (std::size_t hit = s.find(from); hit != std::string_view::npos; hit = s.find(from, pos)) {
        out.append(s.substr(pos, hit - pos)).append(to);
        pos = hit + from.size();
    }
    out.append(s.substr(pos));
    return out;
}

[[nodiscard]] inline std::string removeAll(std::string_view s, char c) {
    std::string out;
    for (char ch : s) {
        if (ch != c) out += ch;
    }
    return out;
}

// ============================================================================
// Numbers
// ============================================================================

/**
 * @brief Whole decimal integer with optional sign; surrounding whitespace is allowed
 * @return nullopt unless the entire string is a number in range
 */
[[nodiscard]] inline std::optional<int64_t> toInt64(std::string_view s) noexcept {
    s = detail::stripView(s);
    bool negative = false;
    if (!s.empty() && (s.front() == '+' || s.front() == '-')) {
        negative = s.front() == '-';
        s.remove_prefix(1);
    }
    auto magnitude = detail::digitsOnly<uint64_t>(s);
    if (!magnitude) return std::nullopt;
    constexpr uint64_t limit = static_cast<uint64_t>(INT64_MAX);
    if (!negative && *magnitude > limit) return std::nullopt;
    if (negative && *magnitude > limit + 1) return std::nullopt;
    if (negative) return *magnitude == limit + 1 ? INT64_MIN : -static_cast<int64_t>(*magnitude);
    return static_cast<int64_t>(*magnitude);
}

// ============================================================================
// IPv4
// ============================================================================

/** @brief "a.b.c.d" with each part 0-255 and at most three digits */
[[nodiscard]] inline std::optional<uint32_t> parseIpv4(std::string_view s) noexcept {
    uint32_t address = 0;
    for (int octet = 0; octet < 4; ++octet) {
        std::size_t dot = s.find('.');
        if ((octet < 3) != (dot != std::string_view::npos)) return std::nullopt;
        std::string_view part = s.substr(0, dot);
        auto value = detail::digitsOnly<unsigned>(part);
        if (!value || part.size() > 3 || *value > 255) return std::nullopt;
        address = (address << 8) | *value;
        s = dot == std::string_view::npos ? std::string_view() : s.substr(dot + 1);
    }
    return address;
}

/**
 * @brief "10.0.0.0/8" into its inclusive first and last addresses
 *
 * A missing prefix length means /32. Host bits set in the address part are
 * rejected.
 */
[[nodiscard]] inline std::optional<std::pair<uint32_t, uint32_t>> parseIpv4Network(std::string_view cidr) noexcept {
    std::size_t slash = cidr.find('/');
    auto first = parseIpv4(cidr.substr(0, slash));
    if (!first) return std::nullopt;

    unsigned bits = 32;
    if (slash != std::string_view::npos) {
        auto parsed = detail::digitsOnly<unsigned>(cidr.substr(slash + 1));
        if (!parsed || *parsed > 32) return std::nullopt;
        bits = *parsed;
    }
    const uint32_t hostPart = bits == 0 ? ~uint32_t{0} : (uint32_t{1} << (32 - bits)) - 1;
    if ((*first & hostPart) != 0) return std::nullopt;
    return std::make_pair(*first, *first | hostPart);
}

} // namespace string_utils
} // namespace authcore

#endif // AUTHCORE_STRING_UTILS_HPP
