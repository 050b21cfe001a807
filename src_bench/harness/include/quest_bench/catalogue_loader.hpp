#pragma once

#include "problem.hpp"

#include <filesystem>
#include <vector>

namespace quest::bench {

/**
 * \brief Loads the problem catalogue from disk.
 *
 * The loader understands a line-oriented syntax that is easy to author by hand and
 * friendly to version control. Each file holds one or more problem blocks separated
 * by a line containing three dashes (`---`). Within a block, entries take the form
 * `key=value` with leading/trailing whitespace ignored.
 *
 * Recognised keys:
 *   - `id`: Problem identifier. Falls back to `<file-stem>#<index>`.
 *   - `category`: Logical grouping. Falls back to the file stem.
 *   - `kind`: `atomic` (default) or `composite`.
 *   - `difficulty`, `description`: Free text.
 *   - `template`: Prompt template with `{param}` placeholders; repeatable.
 *   - `param.<name>`: `<type> <rule> [decimals=<d>] [unit=<token-decimals>]`.
 *   - `state.<label>`: `<kind> <args...>` naming a ledger value read before and after.
 *   - `check.<name>`: `<kind> weight=<points> [critical] [key=value ...]`.
 *   - `step_check.<name>`: same syntax, run after every step of a composite problem.
 *   - `optimal_steps`, `max_rounds_multiplier`, `planning`, `pass_ratio`: composite knobs.
 *
 * Example:
 * \code{.txt}
 * id=bnb_transfer
 * category=native_transfer
 * template=Send {amount} BNB to {recipient}
 * param.recipient=address random
 * param.amount=amount random:0.001:0.1 decimals=3
 * state.recipient_balance=native recipient
 * check.tx_success=tx_success weight=30 critical
 * check.recipient_delta=state_delta weight=25 state=recipient_balance expect=amount tolerance=0.1%
 * \endcode
 *
 * Lines starting with `#` or empty lines are ignored. Unknown keys are rejected.
 * Every error carries `file:line` context.
 */
class CatalogueLoader {
public:
    CatalogueLoader() = default;

    [[nodiscard]] Catalogue load(const std::filesystem::path& file) const;

    /// Loads every `*.qst` file below \a root (or \a root itself when it is a file).
    [[nodiscard]] Catalogue load_directory(const std::filesystem::path& root) const;

    /// Merges catalogues in order; duplicate problem ids are rejected.
    [[nodiscard]] static Catalogue merge(std::vector<Catalogue> parts);
};

}  // namespace quest::bench
