#pragma once

#include "quest_bench/execution_result.hpp"
#include "quest_bench/process.hpp"

#include <chrono>
#include <string>

#include <nlohmann/json.hpp>

namespace quest::bench::node_bridge {

/**
 * Classifies a candidate's raw return value.
 *
 * Order: a string is first parsed as JSON (ParseError on failure); a non-object is
 * NotAnObject; an object with a `query_result` key, `type == "QUERY_RESULT"`, a truthy
 * `balances`, or `success == true` without `to`/`data` is a QueryResult; an object with
 * a `to` key is a TransactionIntent; anything else is UnrecognizedShape.
 *
 * Warnings about missing conventional intent fields are appended to \a diag_out.
 */
[[nodiscard]] ExecutionResult classify_value(const nlohmann::json& raw, std::string& diag_out);

/**
 * Interprets a finished runner process: the last non-empty stdout line is the
 * runner's envelope (`{"ok":true,"value":...}` or `{"ok":false,...}`); stderr is
 * attached to failures verbatim and never parsed.
 */
[[nodiscard]] ExecutionResult classify_process(const ProcessResult& process,
                                               std::chrono::milliseconds timeout,
                                               std::string& diag_out);

/**
 * Re-encodes numeric transaction fields as decimal strings: JSON numbers, `0x`
 * quantities and integral floats alike. Unparseable values are left untouched
 * for the executor to reject.
 */
[[nodiscard]] nlohmann::json normalize_intent_numbers(nlohmann::json fields);

}  // namespace quest::bench::node_bridge
