#include "quest_bench/primitives.hpp"

#include <cctype>
#include <string>
#include <string_view>

namespace quest::bench {

namespace {

constexpr unsigned kWordHexChars = 64;
constexpr unsigned kAddressHexChars = 40;
constexpr unsigned kSelectorHexChars = 8;

int hex_digit(char ch) {
    if (ch >= '0' && ch <= '9') return ch - '0';
    if (ch >= 'a' && ch <= 'f') return ch - 'a' + 10;
    if (ch >= 'A' && ch <= 'F') return ch - 'A' + 10;
    return -1;
}

bool has_hex_prefix(std::string_view text) {
    return text.size() >= 2 && text[0] == '0' && (text[1] == 'x' || text[1] == 'X');
}

std::string lower(std::string_view text) {
    std::string out;
    out.reserve(text.size());
    for (unsigned char ch : text) out.push_back(static_cast<char>(std::tolower(ch)));
    return out;
}

std::string left_pad(std::string text, std::size_t width, char fill) {
    if (text.size() < width) text.insert(0, width - text.size(), fill);
    return text;
}

}  // namespace

std::optional<Address> parse_address(std::string_view text) {
    if (!has_hex_prefix(text) || text.size() != 2 + kAddressHexChars) {
        return std::nullopt;
    }
    for (char ch : text.substr(2)) {
        if (hex_digit(ch) < 0) return std::nullopt;
    }
    return Address{lower(text)};
}

std::optional<Wei> parse_wei(std::string_view text) {
    if (text.empty()) return std::nullopt;
    const Wei max = ~Wei{0};
    Wei value{0};

    if (has_hex_prefix(text)) {
        const auto digits = text.substr(2);
        if (digits.empty()) return std::nullopt;
        for (char ch : digits) {
            const int d = hex_digit(ch);
            if (d < 0) return std::nullopt;
            if ((value >> 252) != 0) return std::nullopt;
            value = (value << 4) | Wei{static_cast<unsigned>(d)};
        }
        return value;
    }

    for (char ch : text) {
        if (ch < '0' || ch > '9') return std::nullopt;
        const Wei d{static_cast<unsigned>(ch - '0')};
        if (value > (max - d) / 10) return std::nullopt;
        value = value * 10 + d;
    }
    return value;
}

std::optional<Wei> parse_units(std::string_view text, unsigned decimals) {
    if (text.empty() || has_hex_prefix(text)) return std::nullopt;

    std::string_view whole = text;
    std::string_view frac;
    if (const auto dot = text.find('.'); dot != std::string_view::npos) {
        whole = text.substr(0, dot);
        frac = text.substr(dot + 1);
        if (whole.empty() && frac.empty()) return std::nullopt;
    }
    if (frac.size() > decimals) return std::nullopt;

    const auto whole_value = whole.empty() ? std::optional<Wei>{Wei{0}} : parse_wei(whole);
    const auto frac_value = frac.empty() ? std::optional<Wei>{Wei{0}} : parse_wei(frac);
    if (!whole_value || !frac_value) return std::nullopt;

    const Wei scale = pow10(decimals);
    const Wei max = ~Wei{0};
    if (*whole_value > max / scale) return std::nullopt;
    const Wei scaled_frac = *frac_value * pow10(decimals - static_cast<unsigned>(frac.size()));
    const Wei scaled_whole = *whole_value * scale;
    if (scaled_whole > max - scaled_frac) return std::nullopt;
    return scaled_whole + scaled_frac;
}

std::string to_decimal(const Wei& value) { return intx::to_string(value); }

std::string to_quantity(const Wei& value) { return "0x" + intx::to_string(value, 16); }

std::string to_quantity(std::uint64_t value) { return to_quantity(Wei{value}); }

std::string format_units(const Wei& value, unsigned decimals) {
    if (decimals == 0) return to_decimal(value);
    const Wei scale = pow10(decimals);
    const std::string whole = to_decimal(value / scale);
    std::string frac = left_pad(to_decimal(value % scale), decimals, '0');
    while (!frac.empty() && frac.back() == '0') frac.pop_back();
    return frac.empty() ? whole : whole + "." + frac;
}

Wei pow10(unsigned exponent) {
    Wei out{1};
    for (unsigned i = 0; i < exponent; ++i) out *= 10;
    return out;
}

Wei abs_diff(const Wei& a, const Wei& b) { return a > b ? a - b : b - a; }

std::string strip_hex_prefix(std::string_view text) {
    return has_hex_prefix(text) ? std::string{text.substr(2)} : std::string{text};
}

bool is_hex_data(std::string_view text) {
    if (!has_hex_prefix(text)) return false;
    const auto body = text.substr(2);
    if (body.size() % 2 != 0) return false;
    for (char ch : body) {
        if (hex_digit(ch) < 0) return false;
    }
    return true;
}

std::string abi_word(const Address& address) {
    return left_pad(strip_hex_prefix(address.hex), kWordHexChars, '0');
}

std::string abi_word(const Wei& value) {
    return left_pad(intx::to_string(value, 16), kWordHexChars, '0');
}

std::optional<std::string> calldata_word(std::string_view data, std::size_t index) {
    const std::string body = lower(strip_hex_prefix(data));
    const std::size_t offset = kSelectorHexChars + index * kWordHexChars;
    if (body.size() < offset + kWordHexChars) return std::nullopt;
    return body.substr(offset, kWordHexChars);
}

std::optional<std::string> calldata_selector(std::string_view data) {
    const std::string body = lower(strip_hex_prefix(data));
    if (body.size() < kSelectorHexChars) return std::nullopt;
    return "0x" + body.substr(0, kSelectorHexChars);
}

std::optional<Wei> word_to_wei(std::string_view word) {
    if (word.empty()) return std::nullopt;
    return parse_wei("0x" + strip_hex_prefix(word));
}

std::optional<Address> word_to_address(std::string_view word) {
    const std::string body = strip_hex_prefix(word);
    if (body.size() < kAddressHexChars) return std::nullopt;
    return parse_address("0x" + body.substr(body.size() - kAddressHexChars));
}

}  // namespace quest::bench
