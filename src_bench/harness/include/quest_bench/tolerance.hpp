#pragma once

#include "primitives.hpp"

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace quest::bench {

/**
 * \brief Acceptance band for monetary comparisons.
 *
 * A relative band is expressed in parts per million of the expected value
 * (0.1% == 1000 ppm); an absolute band in base units. When both are set the
 * wider one applies. Boundaries are inclusive: a deviation exactly equal to
 * the band is accepted.
 */
struct Tolerance {
    std::uint64_t ppm{0};
    Wei absolute{0};

    [[nodiscard]] static Tolerance exact() { return {}; }

    /// Parses "0.1%" (up to four fractional digits of a percent).
    [[nodiscard]] static std::optional<Tolerance> parse_percent(std::string_view text);

    [[nodiscard]] Wei band_for(const Wei& expected) const;
    [[nodiscard]] bool accepts(const Wei& actual, const Wei& expected) const;
    [[nodiscard]] std::string describe() const;
};

}  // namespace quest::bench
