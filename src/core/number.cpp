#include <csvutil/core/number.hpp>

#include <fmt/format.h>

#include <charconv>
#include <cctype>
#include <cmath>
#include <cstdlib>

namespace csvutil {

namespace {

// strtod also reads C99 hex floats ("0x10", "-0x1p3"); those are not decimal
// numbers in a delimited file.
auto has_hex_prefix(std::string_view text) -> bool {
    std::size_t i = 0;
    while (i < text.size() && std::isspace(static_cast<unsigned char>(text[i]))) {
        ++i;
    }
    if (i < text.size() && (text[i] == '+' || text[i] == '-')) {
        ++i;
    }
    return i + 1 < text.size() && text[i] == '0' && (text[i + 1] == 'x' || text[i + 1] == 'X');
}

}  // namespace

auto parse_number(const std::string& text) -> std::optional<double> {
    if (has_hex_prefix(text)) {
        return std::nullopt;
    }
    char* end = nullptr;
    double value = std::strtod(text.c_str(), &end);
    if (end == text.c_str() || *end != '\0') {
        return std::nullopt;
    }
    return value;
}

auto parse_integer(std::string_view text) -> std::optional<std::int64_t> {
    if (text.size() > 1 && text.front() == '+') {
        text.remove_prefix(1);
        if (text.front() == '-') {
            return std::nullopt;
        }
    }
    std::int64_t value = 0;
    const char* end = text.data() + text.size();
    auto result = std::from_chars(text.data(), end, value);
    if (result.ec != std::errc() || result.ptr != end) {
        return std::nullopt;
    }
    return value;
}

auto format_number(double value) -> std::string {
    if (std::isnan(value)) {
        return "nan";
    }
    if (std::isinf(value)) {
        return value > 0 ? "inf" : "-inf";
    }
    return fmt::format("{}", value);
}

}  // namespace csvutil
