#include "quest_bench/execution_result.hpp"

namespace quest::bench {

const char* to_string(FailureKind kind) {
    switch (kind) {
        case FailureKind::Timeout: return "timeout";
        case FailureKind::RuntimeError: return "runtime_error";
        case FailureKind::ParseError: return "parse_error";
        case FailureKind::NotAnObject: return "not_an_object";
        case FailureKind::UnrecognizedShape: return "unrecognized_shape";
        case FailureKind::MissingEntryPoint: return "missing_entry_point";
        case FailureKind::SpawnError: return "spawn_error";
        case FailureKind::MalformedIntent: return "malformed_intent";
    }
    return "unknown";
}

const char* result_kind(const ExecutionResult& result) {
    if (std::holds_alternative<TransactionIntent>(result)) return "transaction";
    if (std::holds_alternative<QueryResult>(result)) return "query";
    return "failure";
}

}  // namespace quest::bench
