#include "quest_bench/tolerance.hpp"

#include <string>

namespace quest::bench {

namespace {
constexpr std::uint64_t kPpmScale = 1'000'000;
constexpr unsigned kPercentDigits = 4;  // 0.0001% == 1 ppm
}  // namespace

std::optional<Tolerance> Tolerance::parse_percent(std::string_view text) {
    if (text.empty() || text.back() != '%') return std::nullopt;
    const auto parsed = parse_units(text.substr(0, text.size() - 1), kPercentDigits);
    if (!parsed || *parsed > Wei{kPpmScale}) return std::nullopt;
    Tolerance tol;
    tol.ppm = static_cast<std::uint64_t>(*parsed);
    return tol;
}

Wei Tolerance::band_for(const Wei& expected) const {
    // Split to keep expected * ppm within 256 bits.
    const Wei scale{kPpmScale};
    const Wei relative = (expected / scale) * ppm + ((expected % scale) * ppm) / scale;
    return relative > absolute ? relative : absolute;
}

bool Tolerance::accepts(const Wei& actual, const Wei& expected) const {
    return abs_diff(actual, expected) <= band_for(expected);
}

std::string Tolerance::describe() const {
    if (ppm == 0 && absolute == 0) return "exact";
    std::string out;
    if (ppm != 0) out = format_units(Wei{ppm}, kPercentDigits) + "%";
    if (absolute != 0) {
        if (!out.empty()) out += " or ";
        out += to_decimal(absolute) + " base units";
    }
    return out;
}

}  // namespace quest::bench
