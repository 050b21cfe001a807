#pragma once

#include <compare>
#include <cstddef>
#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <string_view>

#include <intx/intx.hpp>

namespace quest::bench {

/// Monetary quantity in base units (wei for the native asset).
using Wei = intx::uint256;

/**
 * \brief 20-byte account address, stored as lowercase `0x`-prefixed hex.
 *
 * Construct through parse_address() so that the representation stays canonical;
 * comparison is then a plain string comparison.
 */
struct Address {
    std::string hex;

    [[nodiscard]] bool empty() const noexcept { return hex.empty(); }

    auto operator<=>(const Address&) const = default;
};

/// Named fixture contracts available to candidates (name -> deployed address).
using FixtureRegistry = std::map<std::string, Address>;

[[nodiscard]] std::optional<Address> parse_address(std::string_view text);

/**
 * Parses an unsigned integer in decimal or `0x` hexadecimal form.
 * Returns nullopt for signs, fractions, empty input and anything wider than 256 bits.
 */
[[nodiscard]] std::optional<Wei> parse_wei(std::string_view text);

/**
 * Converts a decimal amount in whole units ("0.05") into base units using
 * \a decimals fractional digits. More fractional digits than \a decimals is rejected.
 */
[[nodiscard]] std::optional<Wei> parse_units(std::string_view text, unsigned decimals);

[[nodiscard]] std::string to_decimal(const Wei& value);

/// Minimal `0x`-prefixed hex quantity as used on the JSON-RPC wire ("0x0" for zero).
[[nodiscard]] std::string to_quantity(const Wei& value);
[[nodiscard]] std::string to_quantity(std::uint64_t value);

/// Renders base units as a decimal string in whole units, trailing zeros trimmed ("1.5").
[[nodiscard]] std::string format_units(const Wei& value, unsigned decimals);

[[nodiscard]] Wei pow10(unsigned exponent);
[[nodiscard]] Wei abs_diff(const Wei& a, const Wei& b);

// ABI word helpers (32-byte big-endian words rendered as 64 hex chars, no prefix)
[[nodiscard]] std::string strip_hex_prefix(std::string_view text);
[[nodiscard]] bool is_hex_data(std::string_view text);
[[nodiscard]] std::string abi_word(const Address& address);
[[nodiscard]] std::string abi_word(const Wei& value);

/**
 * Extracts argument word \a index from calldata (selector excluded).
 * Returns nullopt when the data is too short.
 */
[[nodiscard]] std::optional<std::string> calldata_word(std::string_view data, std::size_t index);

/// First four bytes of calldata as `0x` + 8 lowercase hex chars.
[[nodiscard]] std::optional<std::string> calldata_selector(std::string_view data);

[[nodiscard]] std::optional<Wei> word_to_wei(std::string_view word);
[[nodiscard]] std::optional<Address> word_to_address(std::string_view word);

}  // namespace quest::bench
