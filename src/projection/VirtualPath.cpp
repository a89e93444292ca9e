#include "projection/VirtualPath.hpp"

#include <charconv>
#include <cmath>
#include <cstdlib>
#include <limits>
#include <string>

namespace rw::projection {

static bool isDigit(const char c) { return c >= '0' && c <= '9'; }

// [+-]? (digits [. digits?] | . digits) ([eE] [+-]? digits)?
static bool isDecimalLiteral(const std::string_view token) {
    size_t i = 0;
    if (i < token.size() && (token[i] == '+' || token[i] == '-')) ++i;

    size_t mantissaDigits = 0;
    while (i < token.size() && isDigit(token[i])) { ++i; ++mantissaDigits; }
    if (i < token.size() && token[i] == '.') {
        ++i;
        while (i < token.size() && isDigit(token[i])) { ++i; ++mantissaDigits; }
    }
    if (mantissaDigits == 0) return false;

    if (i < token.size() && (token[i] == 'e' || token[i] == 'E')) {
        ++i;
        if (i < token.size() && (token[i] == '+' || token[i] == '-')) ++i;
        size_t exponentDigits = 0;
        while (i < token.size() && isDigit(token[i])) { ++i; ++exponentDigits; }
        if (exponentDigits == 0) return false;
    }

    return i == token.size();
}

std::optional<Timestamp> parseTimestampToken(std::string_view token) {
    if (!isDecimalLiteral(token)) return std::nullopt;

    // from_chars rejects an explicit plus sign
    if (token.front() == '+') token.remove_prefix(1);

    double value = 0;
    const auto* end = token.data() + token.size();
    const auto [ptr, ec] = std::from_chars(token.data(), end, value);
    if (ptr != end) return std::nullopt;

    // out of range covers underflow too; strtod gives 0 (or a denormal) there and HUGE_VAL on overflow
    if (ec == std::errc::result_out_of_range) value = std::strtod(std::string(token).c_str(), nullptr);
    else if (ec != std::errc()) return std::nullopt;

    if (!std::isfinite(value)) return std::nullopt;

    const double truncated = std::trunc(value);
    if (truncated < 0) return std::nullopt;
    if (truncated >= static_cast<double>(std::numeric_limits<Timestamp>::max())) return std::nullopt;

    return static_cast<Timestamp>(truncated);
}

std::optional<VirtualPath> parseVirtualPath(const std::string_view path) {
    if (path.empty() || path.front() != '/' || path.back() == '/') return std::nullopt;

    const auto separator = path.find('/', 1);
    const auto token = separator == std::string_view::npos ? path.substr(1) : path.substr(1, separator - 1);
    const auto rest = separator == std::string_view::npos ? std::string_view{} : path.substr(separator + 1);

    const auto timestamp = parseTimestampToken(token);
    if (!timestamp) return std::nullopt;

    if (!rest.empty() && rest.front() == '/') return std::nullopt;

    return VirtualPath{*timestamp, std::string(rest)};
}

}
