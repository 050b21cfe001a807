#pragma once

#include "primitives.hpp"
#include "problem.hpp"

#include <cstdint>
#include <map>
#include <optional>
#include <random>
#include <string>
#include <variant>

#include <nlohmann/json.hpp>

namespace quest::bench {

/// Monetary parameter: exact base units plus the whole-unit rendering shown in prompts.
struct Amount {
    Wei base_units{0};
    std::string display;
    unsigned unit_decimals{18};
};

using ParamValue = std::variant<Address, Amount, std::int64_t, std::string, bool>;

/**
 * \brief Concrete parameter values for one problem attempt.
 *
 * The typed accessors return nullopt when the parameter is absent or holds
 * another type; at() throws std::out_of_range naming the missing parameter.
 */
class ParameterInstance {
public:
    ParameterInstance() = default;
    explicit ParameterInstance(std::map<std::string, ParamValue> values);

    [[nodiscard]] bool contains(const std::string& name) const;
    [[nodiscard]] const ParamValue& at(const std::string& name) const;

    [[nodiscard]] std::optional<Address> address(const std::string& name) const;
    /// Amount parameters yield their base units; non-negative integers are accepted as well.
    [[nodiscard]] std::optional<Wei> amount(const std::string& name) const;
    [[nodiscard]] std::optional<std::int64_t> integer(const std::string& name) const;
    [[nodiscard]] std::optional<std::string> text(const std::string& name) const;
    [[nodiscard]] std::optional<bool> boolean(const std::string& name) const;

    /// Prompt rendering of a value (amounts in whole units, addresses as hex).
    [[nodiscard]] std::string display(const std::string& name) const;

    [[nodiscard]] const std::map<std::string, ParamValue>& values() const noexcept { return values_; }
    [[nodiscard]] nlohmann::json to_json() const;

private:
    std::map<std::string, ParamValue> values_;
};

/// Inputs a generator needs to bind references that are not random.
struct GenerationContext {
    Address identity;
    FixtureRegistry fixtures;
};

/**
 * \brief Deterministic parameter source.
 *
 * Two generators built from the same seed produce identical instances for the
 * same sequence of problems.
 */
class ParameterGenerator {
public:
    explicit ParameterGenerator(std::uint64_t seed);

    /// Throws std::runtime_error when a fixture reference cannot be bound.
    [[nodiscard]] ParameterInstance generate(const ProblemSpec& problem, const GenerationContext& context);

private:
    ParamValue draw(const ParamSpec& spec, const GenerationContext& context);
    ParamValue from_text(const ParamSpec& spec, const std::string& text) const;

    std::mt19937_64 rng_;
};

/// Replaces `{name}` placeholders with ParameterInstance::display(); unknown names are left intact.
[[nodiscard]] std::string render_template(const std::string& text, const ParameterInstance& params);

}  // namespace quest::bench
