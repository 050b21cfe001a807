#pragma once

#include <map>
#include <optional>
#include <string>
#include <vector>

namespace quest::bench {

enum class ProblemKind { Atomic, Composite };

enum class ParamType { Address, Amount, Integer, String, Boolean };

/**
 * \brief How a parameter value is drawn.
 *
 * `method` is one of `random`, `fixed`, `from_list`, `fixture`, `identity`.
 * `args` carries the colon- or comma-separated method arguments verbatim.
 */
struct GenerationRule {
    std::string method;
    std::vector<std::string> args;
};

struct ParamSpec {
    std::string name;
    ParamType type{ParamType::String};
    GenerationRule rule;
    unsigned decimals{3};        ///< granularity of random amounts, in whole-unit fractional digits
    unsigned unit_decimals{18};  ///< base-unit exponent of the asset the amount is denominated in
};

enum class StateKind { Native, Nonce, CodeSize, TokenBalance, Allowance, Storage, Call };

/**
 * \brief Unresolved state target as declared in the catalogue.
 *
 * Arguments are references (a parameter name, `fixture:<name>`, `identity`, or a
 * literal) that are bound to addresses once parameters have been generated.
 */
struct StateDecl {
    std::string label;
    StateKind kind{StateKind::Native};
    std::vector<std::string> args;
};

/**
 * \brief One weighted validation check as declared in the catalogue.
 *
 * The interpretation of `options` is owned by the check kind; the loader only
 * separates the common fields.
 */
struct CheckDecl {
    std::string name;
    std::string kind;
    double weight{0.0};
    bool critical{false};
    std::map<std::string, std::string> options;
};

struct CompositeConfig {
    unsigned optimal_steps{0};
    unsigned max_rounds_multiplier{2};
    bool planning{true};
};

/**
 * \brief Immutable problem definition.
 *
 * Loaded once from the catalogue and treated as read-only for the rest of the run.
 */
struct ProblemSpec {
    std::string id;
    std::string category;
    std::string difficulty;
    std::string description;
    ProblemKind kind{ProblemKind::Atomic};
    std::vector<std::string> templates;
    std::vector<ParamSpec> params;
    std::vector<StateDecl> state;
    std::vector<CheckDecl> checks;       ///< terminal checks (atomic: the only checks)
    std::vector<CheckDecl> step_checks;  ///< composite only, run after every step
    double pass_ratio{0.6};              ///< composite pass threshold as a fraction of max score
    std::optional<CompositeConfig> composite;
    std::string source_file;
};

struct Catalogue {
    std::vector<std::string> source_files;
    std::vector<ProblemSpec> problems;

    [[nodiscard]] const ProblemSpec* find(const std::string& id) const {
        for (const auto& problem : problems) {
            if (problem.id == id) return &problem;
        }
        return nullptr;
    }
};

[[nodiscard]] inline const char* to_string(ProblemKind kind) {
    return kind == ProblemKind::Composite ? "composite" : "atomic";
}

}  // namespace quest::bench
