#pragma once

#include "problem.hpp"
#include "validation.hpp"

#include <map>
#include <string>
#include <vector>

namespace quest::bench {

struct ProblemChecks {
    std::vector<Check> terminal;
    std::vector<Check> per_step;  ///< composite problems only
};

/**
 * \brief Problem id -> ordered checks.
 *
 * Populated once at startup and read-only afterwards. When a problem marks none
 * of its checks critical, every check of that list becomes critical.
 */
class ValidatorRegistry {
public:
    ValidatorRegistry() = default;

    /// Builds checks for every problem; throws std::runtime_error on the first invalid declaration.
    [[nodiscard]] static ValidatorRegistry from_catalogue(const Catalogue& catalogue);

    void add(const ProblemSpec& problem);

    [[nodiscard]] bool contains(const std::string& problem_id) const;

    /// Throws std::out_of_range for an unregistered problem.
    [[nodiscard]] const ProblemChecks& at(const std::string& problem_id) const;

    [[nodiscard]] std::size_t size() const noexcept { return entries_.size(); }

private:
    std::map<std::string, ProblemChecks> entries_;
};

}  // namespace quest::bench
