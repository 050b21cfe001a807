#pragma once

#include "primitives.hpp"

#include <chrono>
#include <filesystem>
#include <stdexcept>
#include <string>
#include <variant>
#include <vector>

#include <nlohmann/json.hpp>

namespace quest::bench {

/**
 * \brief Raised when the ledger environment cannot serve the run.
 *
 * Covers a simulator that does not become ready, an unreachable fork source,
 * and a snapshot that can no longer be reverted. Candidate code never causes it.
 */
class EnvironmentError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

enum class FailureKind {
    Timeout,
    RuntimeError,
    ParseError,
    NotAnObject,
    UnrecognizedShape,
    MissingEntryPoint,
    SpawnError,
    MalformedIntent,
};

[[nodiscard]] const char* to_string(FailureKind kind);

/**
 * \brief Unsigned transaction proposed by candidate code.
 *
 * `fields` is the candidate's object with numeric fields normalised to
 * decimal strings; `warnings` lists recoverable omissions (no value, no gas).
 */
struct TransactionIntent {
    nlohmann::json fields = nlohmann::json::object();
    std::vector<std::string> warnings;
};

/// Read-only answer returned by candidate code; checked directly, never submitted.
struct QueryResult {
    nlohmann::json payload = nlohmann::json::object();
};

struct Failure {
    FailureKind kind{FailureKind::RuntimeError};
    std::string message;
    std::string diagnostics;  ///< verbatim runtime output, kept for debugging
};

using ExecutionResult = std::variant<TransactionIntent, QueryResult, Failure>;

[[nodiscard]] const char* result_kind(const ExecutionResult& result);

/// Everything one execution needs; the executor copies nothing back into it.
struct ExecutionRequest {
    std::string source;
    std::string source_extension{".ts"};
    std::string endpoint;
    Address identity;
    FixtureRegistry fixtures;
    std::chrono::milliseconds timeout{60000};
    std::filesystem::path artifact_dir;  ///< optional; receives runner stdout/stderr when set
};

/**
 * \brief Runs one externally supplied source unit and classifies its result.
 *
 * Implementations never throw for candidate misbehaviour; everything the
 * candidate does wrong comes back as a Failure. Diagnostics are appended to
 * \a diag_out.
 */
class CodeExecutor {
public:
    virtual ~CodeExecutor() = default;

    virtual ExecutionResult execute(const ExecutionRequest& request, std::string& diag_out) = 0;
};

}  // namespace quest::bench
