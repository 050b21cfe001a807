#pragma once

#include "problem.hpp"
#include "validation.hpp"

#include <optional>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

namespace quest::bench {

/**
 * \brief Builds pure check predicates from catalogue declarations.
 *
 * Every kind validates its options when the check is built, so a broken
 * catalogue fails at startup rather than halfway through a run. Evaluation
 * never throws; an unresolvable reference fails the check with a message.
 *
 * References accepted by `expect=` and address options:
 *   - a parameter name,
 *   - `identity`, `fixture:<name>`,
 *   - a literal `0x` address or an unsigned integer (decimal or `0x` hex),
 *   - `intent.<field>` (numeric field of the submitted intent),
 *   - `state.<label>` (value of a declared target before execution).
 */
class CheckFactory {
public:
    /// Throws std::runtime_error for unknown kinds and invalid options.
    [[nodiscard]] static Check build(const CheckDecl& decl, const ProblemSpec& problem);

    [[nodiscard]] static const std::vector<std::string>& known_kinds();
};

// Shared helpers, exposed for the result classifier and tests.

/// Query payload root: the `query_result` object when present, else the payload itself.
[[nodiscard]] const nlohmann::json& query_root(const nlohmann::json& payload);

/// Looks up a dotted path under \a root, falling back to `root.data.<path>`.
[[nodiscard]] const nlohmann::json* find_field(const nlohmann::json& root, const std::string& path);

/// Unsigned integer from a JSON number or decimal/hex string.
[[nodiscard]] std::optional<Wei> json_to_wei(const nlohmann::json& value);

}  // namespace quest::bench
