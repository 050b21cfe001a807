#include "quest_bench/result_classifier.hpp"
#include "quest_bench/primitives.hpp"

#include <array>
#include <cmath>
#include <cstdio>
#include <string>
#include <utility>

namespace quest::bench::node_bridge {

namespace {

constexpr std::array<const char*, 9> kNumericFields = {
    "value", "gas", "gasLimit", "gasPrice", "maxFeePerGas", "maxPriorityFeePerGas", "nonce", "chainId", "type"};

constexpr std::size_t kMessageExcerpt = 200;

bool truthy(const nlohmann::json& value) {
    if (value.is_null()) return false;
    if (value.is_boolean()) return value.get<bool>();
    if (value.is_number()) return value.get<double>() != 0.0;
    if (value.is_string()) return !value.get<std::string>().empty();
    return true;  // objects and arrays, even empty ones
}

bool looks_like_query(const nlohmann::json& obj) {
    if (obj.contains("query_result")) return true;
    if (const auto it = obj.find("type"); it != obj.end() && it->is_string() && it->get<std::string>() == "QUERY_RESULT") {
        return true;
    }
    if (const auto it = obj.find("balances"); it != obj.end() && truthy(*it)) return true;
    const auto success = obj.find("success");
    return success != obj.end() && success->is_boolean() && success->get<bool>() && !obj.contains("to") &&
           !obj.contains("data");
}

// Cuts on a code point boundary so the excerpt stays valid UTF-8 when the input is.
std::string excerpt(const std::string& text) {
    if (text.size() <= kMessageExcerpt) return text;
    std::size_t cut = kMessageExcerpt;
    while (cut > 0 && (static_cast<unsigned char>(text[cut]) & 0xC0U) == 0x80U) --cut;
    return text.substr(0, cut) + "...";
}

// Envelope fields come from candidate code and may hold any JSON type.
std::string envelope_text(const nlohmann::json& envelope, const char* key, const std::string& fallback) {
    const auto it = envelope.find(key);
    if (it == envelope.end() || it->is_null()) return fallback;
    if (it->is_string()) return it->get<std::string>();
    return it->dump(-1, ' ', false, nlohmann::json::error_handler_t::replace);
}

std::string last_nonempty_line(const std::string& text) {
    std::size_t end = text.size();
    while (end > 0) {
        const auto start = text.rfind('\n', end - 1);
        const auto begin = start == std::string::npos ? 0 : start + 1;
        auto line = text.substr(begin, end - begin);
        if (!line.empty() && line.back() == '\r') line.pop_back();
        if (line.find_first_not_of(" \t") != std::string::npos) return line;
        if (start == std::string::npos) break;
        end = start;
    }
    return {};
}

FailureKind failure_kind_from(const std::string& kind) {
    if (kind == "timeout") return FailureKind::Timeout;
    if (kind == "missing_entry_point") return FailureKind::MissingEntryPoint;
    return FailureKind::RuntimeError;
}

Failure make_failure(FailureKind kind, std::string message, const ProcessResult& process) {
    Failure failure;
    failure.kind = kind;
    failure.message = std::move(message);
    failure.diagnostics = process.stderr_text;
    if (!process.stdout_text.empty()) {
        failure.diagnostics += "\n--- stdout ---\n" + process.stdout_text;
    }
    return failure;
}

}  // namespace

nlohmann::json normalize_intent_numbers(nlohmann::json fields) {
    if (!fields.is_object()) return fields;
    for (const char* key : kNumericFields) {
        const auto it = fields.find(key);
        if (it == fields.end() || it->is_null()) continue;
        auto& value = *it;
        if (value.is_number_unsigned()) {
            value = std::to_string(value.get<std::uint64_t>());
        } else if (value.is_number_integer()) {
            const auto v = value.get<std::int64_t>();
            if (v >= 0) value = std::to_string(v);
        } else if (value.is_number_float()) {
            const double v = value.get<double>();
            if (std::isfinite(v) && v >= 0 && std::floor(v) == v) {
                char buf[400];
                std::snprintf(buf, sizeof(buf), "%.0f", v);
                value = std::string{buf};
            }
        } else if (value.is_string()) {
            const auto text = value.get<std::string>();
            if (text.rfind("0x", 0) == 0 || text.rfind("0X", 0) == 0) {
                if (const auto parsed = parse_wei(text)) value = to_decimal(*parsed);
            }
        }
    }
    return fields;
}

ExecutionResult classify_value(const nlohmann::json& raw, std::string& diag_out) {
    nlohmann::json value = raw;
    if (raw.is_string()) {
        value = nlohmann::json::parse(raw.get<std::string>(), nullptr, false);
        if (value.is_discarded()) {
            return Failure{FailureKind::ParseError,
                           "Returned string is not valid JSON: " + excerpt(raw.get<std::string>()), {}};
        }
    }

    if (!value.is_object()) {
        return Failure{FailureKind::NotAnObject,
                       std::string{"executeSkill must return an object or a JSON string, got "} + value.type_name(), {}};
    }

    if (looks_like_query(value)) {
        return QueryResult{std::move(value)};
    }

    if (value.contains("to")) {
        TransactionIntent intent;
        for (const char* field : {"value", "data", "gas"}) {
            const bool present = value.contains(field) || (std::string{field} == "gas" && value.contains("gasLimit"));
            if (!present) {
                intent.warnings.push_back(std::string{"transaction is missing '"} + field + "'");
                diag_out += "warning: transaction is missing '" + std::string{field} + "'\n";
            }
        }
        value.erase("from");
        intent.fields = normalize_intent_numbers(std::move(value));
        return intent;
    }

    std::string keys;
    for (const auto& [key, item] : value.items()) {
        (void)item;
        keys += (keys.empty() ? "" : ", ") + key;
    }
    return Failure{FailureKind::UnrecognizedShape,
                   "Result is neither a transaction (no 'to') nor a query result; keys: [" + keys + "]", {}};
}

ExecutionResult classify_process(const ProcessResult& process, std::chrono::milliseconds timeout, std::string& diag_out) {
    if (process.spawn_failed || process.exit_code == kExecFailedStatus) {
        return make_failure(FailureKind::SpawnError, "Runtime could not be started", process);
    }
    if (process.timed_out) {
        return make_failure(FailureKind::Timeout,
                            "Execution timeout after " + std::to_string(timeout.count()) + "ms", process);
    }

    const auto line = last_nonempty_line(process.stdout_text);
    if (line.empty()) {
        const std::string how = process.term_signal != 0 ? "killed by signal " + std::to_string(process.term_signal)
                                                         : "exit code " + std::to_string(process.exit_code);
        return make_failure(FailureKind::RuntimeError, "Runner produced no result (" + how + ")", process);
    }

    const auto envelope = nlohmann::json::parse(line, nullptr, false);
    if (envelope.is_discarded() || !envelope.is_object() || !envelope.contains("ok")) {
        return make_failure(FailureKind::RuntimeError, "Runner output is not a result envelope: " + excerpt(line), process);
    }

    const auto ok = envelope.find("ok");
    if (!ok->is_boolean() || !ok->get<bool>()) {
        const auto kind = envelope_text(envelope, "kind", "runtime_error");
        auto message = envelope_text(envelope, "error", "unknown error");
        auto failure = make_failure(failure_kind_from(kind), std::move(message), process);
        if (const auto stack = envelope.find("stack"); stack != envelope.end() && stack->is_string()) {
            failure.diagnostics += "\n--- stack ---\n" + stack->get<std::string>();
        }
        return failure;
    }

    const auto value = envelope.contains("value") ? envelope.at("value") : nlohmann::json{};
    auto result = classify_value(value, diag_out);
    if (auto* failure = std::get_if<Failure>(&result)) {
        failure->diagnostics = process.stderr_text;
    }
    return result;
}

}  // namespace quest::bench::node_bridge
