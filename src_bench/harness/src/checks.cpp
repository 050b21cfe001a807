#include "quest_bench/checks.hpp"
#include "quest_bench/tolerance.hpp"

#include <algorithm>
#include <cctype>
#include <cmath>
#include <cstdlib>
#include <functional>
#include <initializer_list>
#include <map>
#include <stdexcept>
#include <string>
#include <utility>

namespace quest::bench {

namespace {

using CheckBuilder = std::function<CheckFn(const CheckDecl&, const ProblemSpec&)>;

std::string lower(std::string text) {
    std::transform(text.begin(), text.end(), text.begin(),
                   [](unsigned char ch) { return static_cast<char>(std::tolower(ch)); });
    return text;
}

[[noreturn]] void reject(const CheckDecl& decl, const ProblemSpec& problem, const std::string& why) {
    throw std::runtime_error("Check '" + decl.name + "' (" + decl.kind + ") in problem '" + problem.id + "': " + why);
}

std::optional<std::string> option(const CheckDecl& decl, const std::string& key) {
    const auto it = decl.options.find(key);
    if (it == decl.options.end()) return std::nullopt;
    return it->second;
}

std::string required(const CheckDecl& decl, const ProblemSpec& problem, const std::string& key) {
    auto value = option(decl, key);
    if (!value || value->empty()) reject(decl, problem, "missing option '" + key + "'");
    return *value;
}

bool has_state_label(const ProblemSpec& problem, const std::string& label) {
    return std::any_of(problem.state.begin(), problem.state.end(), [&](const auto& s) { return s.label == label; });
}

bool has_param(const ProblemSpec& problem, const std::string& name) {
    return std::any_of(problem.params.begin(), problem.params.end(), [&](const auto& p) { return p.name == name; });
}

void validate_ref(const CheckDecl& decl, const ProblemSpec& problem, const std::string& ref) {
    if (ref == "identity" || ref.rfind("fixture:", 0) == 0 || ref.rfind("intent.", 0) == 0) return;
    if (ref.rfind("state.", 0) == 0) {
        if (!has_state_label(problem, ref.substr(6))) reject(decl, problem, "unknown state label in '" + ref + "'");
        return;
    }
    if (parse_address(ref) || parse_wei(ref) || has_param(problem, ref)) return;
    reject(decl, problem, "unresolvable reference '" + ref + "'");
}

std::string state_option(const CheckDecl& decl, const ProblemSpec& problem) {
    auto label = required(decl, problem, "state");
    if (!has_state_label(problem, label)) reject(decl, problem, "unknown state label '" + label + "'");
    return label;
}

Tolerance tolerance_option(const CheckDecl& decl, const ProblemSpec& problem) {
    Tolerance tol;
    if (const auto pct = option(decl, "tolerance")) {
        const auto parsed = Tolerance::parse_percent(*pct);
        if (!parsed) reject(decl, problem, "invalid tolerance '" + *pct + "' (expected e.g. 0.1%)");
        tol = *parsed;
    }
    if (const auto abs = option(decl, "tolerance_wei")) {
        const auto parsed = parse_wei(*abs);
        if (!parsed) reject(decl, problem, "invalid tolerance_wei '" + *abs + "'");
        tol.absolute = *parsed;
    }
    return tol;
}

std::size_t index_option(const CheckDecl& decl, const ProblemSpec& problem) {
    const auto raw = required(decl, problem, "index");
    char* end = nullptr;
    const unsigned long value = std::strtoul(raw.c_str(), &end, 10);
    if (end != raw.c_str() + raw.size() || raw.front() == '-') reject(decl, problem, "invalid index '" + raw + "'");
    return value;
}

std::uint64_t u64_option(const CheckDecl& decl, const ProblemSpec& problem, const std::string& key, std::uint64_t def) {
    const auto raw = option(decl, key);
    if (!raw) return def;
    char* end = nullptr;
    const unsigned long long value = std::strtoull(raw->c_str(), &end, 10);
    if (raw->empty() || end != raw->c_str() + raw->size() || raw->front() == '-') {
        reject(decl, problem, "invalid " + key + " '" + *raw + "'");
    }
    return value;
}

bool bool_option(const CheckDecl& decl, const ProblemSpec& problem, const std::string& key, bool def) {
    const auto raw = option(decl, key);
    if (!raw) return def;
    if (*raw == "true" || *raw == "yes" || *raw == "1") return true;
    if (*raw == "false" || *raw == "no" || *raw == "0") return false;
    reject(decl, problem, "invalid boolean " + key + " '" + *raw + "'");
}

// --- evaluation-time resolution -------------------------------------------------

std::optional<Wei> intent_number(const TransactionIntent& intent, const std::string& field) {
    const auto it = intent.fields.find(field);
    if (it == intent.fields.end() || it->is_null()) return Wei{0};
    return json_to_wei(*it);
}

const StateTarget* target_for(const CheckContext& ctx, const std::string& label) {
    const auto it = ctx.targets.find(label);
    return it == ctx.targets.end() ? nullptr : &it->second;
}

std::optional<Address> resolve_address(const std::string& ref, const CheckContext& ctx) {
    if (ref == "identity") return ctx.identity;
    if (ref.rfind("fixture:", 0) == 0) {
        const auto it = ctx.fixtures.find(ref.substr(8));
        if (it == ctx.fixtures.end()) return std::nullopt;
        return it->second;
    }
    if (auto literal = parse_address(ref)) return literal;
    return ctx.params.address(ref);
}

std::optional<Wei> resolve_amount(const std::string& ref, const CheckContext& ctx) {
    if (ref.rfind("intent.", 0) == 0) {
        const auto* intent = ctx.intent();
        if (!intent) return std::nullopt;
        return intent_number(*intent, ref.substr(7));
    }
    if (ref.rfind("state.", 0) == 0) {
        const auto* target = target_for(ctx, ref.substr(6));
        return target ? ctx.before.value(*target) : std::nullopt;
    }
    if (auto literal = parse_wei(ref)) return literal;
    return ctx.params.amount(ref);
}

CheckOutcome compare_amount(const std::string& what,
                            const std::optional<Wei>& actual,
                            const std::optional<Wei>& expected,
                            const Tolerance& tol) {
    if (!expected) return {false, what + ": expected value could not be resolved"};
    if (!actual) return {false, what + ": actual value unavailable (expected " + to_decimal(*expected) + ")"};
    const bool ok = tol.accepts(*actual, *expected);
    return {ok, what + ": expected " + to_decimal(*expected) + ", actual " + to_decimal(*actual) +
                    " (tolerance " + tol.describe() + ")"};
}

CheckOutcome no_intent(const CheckContext& ctx) {
    if (ctx.query()) return {false, "Result is a query, not a transaction intent"};
    return {false, "No transaction intent was produced"};
}

CheckOutcome no_query(const CheckContext& ctx) {
    if (ctx.intent()) return {false, "Result is a transaction intent, not a query result"};
    return {false, "No query result was produced"};
}

std::string intent_text(const TransactionIntent& intent, const std::string& field) {
    const auto it = intent.fields.find(field);
    if (it == intent.fields.end() || !it->is_string()) return {};
    return it->get<std::string>();
}

// --- kinds ----------------------------------------------------------------------

CheckFn make_tx_success(const CheckDecl&, const ProblemSpec&) {
    return [](const CheckContext& ctx) -> CheckOutcome {
        if (!ctx.receipt) {
            return {false, ctx.query() ? "Query results are not submitted" : "No transaction was submitted"};
        }
        if (ctx.receipt->success) return {true, "Transaction executed successfully"};
        if (ctx.receipt->timed_out) return {false, "Transaction failed: no receipt before the submission timeout"};
        return {false, "Transaction failed: " + (ctx.receipt->error.empty() ? std::string{"reverted"} : ctx.receipt->error)};
    };
}

CheckFn make_tx_reverted(const CheckDecl&, const ProblemSpec&) {
    return [](const CheckContext& ctx) -> CheckOutcome {
        if (!ctx.receipt) return {false, "No transaction was submitted"};
        if (ctx.receipt->timed_out) return {false, "No receipt before the submission timeout"};
        if (ctx.receipt->success) return {false, "Transaction succeeded but was expected to revert"};
        return {true, "Transaction reverted as expected"};
    };
}

CheckFn make_intent_address(const CheckDecl& decl, const ProblemSpec& problem) {
    const auto field = option(decl, "field").value_or("to");
    const auto ref = required(decl, problem, "expect");
    validate_ref(decl, problem, ref);
    return [field, ref](const CheckContext& ctx) -> CheckOutcome {
        const auto* intent = ctx.intent();
        if (!intent) return no_intent(ctx);
        const auto expected = resolve_address(ref, ctx);
        if (!expected) return {false, "Expected address '" + ref + "' could not be resolved"};
        const auto raw = intent_text(*intent, field);
        const auto actual = parse_address(raw);
        return {actual == expected, "Expected: " + expected->hex + ", Actual: " + (raw.empty() ? "<missing>" : lower(raw))};
    };
}

CheckFn make_intent_amount(const CheckDecl& decl, const ProblemSpec& problem) {
    const auto field = option(decl, "field").value_or("value");
    const auto ref = required(decl, problem, "expect");
    validate_ref(decl, problem, ref);
    const auto tol = tolerance_option(decl, problem);
    return [field, ref, tol](const CheckContext& ctx) -> CheckOutcome {
        const auto* intent = ctx.intent();
        if (!intent) return no_intent(ctx);
        return compare_amount("Intent " + field, intent_number(*intent, field), resolve_amount(ref, ctx), tol);
    };
}

CheckFn make_intent_selector(const CheckDecl& decl, const ProblemSpec& problem) {
    const auto field = option(decl, "field").value_or("data");
    const auto selector = lower(required(decl, problem, "selector"));
    if (selector.size() != 10 || !is_hex_data(selector)) reject(decl, problem, "selector must be 0x + 8 hex chars");
    return [field, selector](const CheckContext& ctx) -> CheckOutcome {
        const auto* intent = ctx.intent();
        if (!intent) return no_intent(ctx);
        const auto actual = calldata_selector(intent_text(*intent, field));
        return {actual == selector, "Expected selector " + selector + ", Actual: " + actual.value_or("<none>")};
    };
}

CheckFn make_calldata_address(const CheckDecl& decl, const ProblemSpec& problem) {
    const auto index = index_option(decl, problem);
    const auto ref = required(decl, problem, "expect");
    validate_ref(decl, problem, ref);
    return [index, ref](const CheckContext& ctx) -> CheckOutcome {
        const auto* intent = ctx.intent();
        if (!intent) return no_intent(ctx);
        const auto expected = resolve_address(ref, ctx);
        if (!expected) return {false, "Expected address '" + ref + "' could not be resolved"};
        const auto word = calldata_word(intent_text(*intent, "data"), index);
        if (!word) return {false, "Calldata has no argument " + std::to_string(index)};
        const auto actual = word_to_address(*word);
        return {actual == expected,
                "Argument " + std::to_string(index) + ": expected " + expected->hex + ", actual " +
                    (actual ? actual->hex : std::string{"<invalid>"})};
    };
}

CheckFn make_calldata_amount(const CheckDecl& decl, const ProblemSpec& problem) {
    const auto index = index_option(decl, problem);
    const auto ref = required(decl, problem, "expect");
    validate_ref(decl, problem, ref);
    const auto tol = tolerance_option(decl, problem);
    return [index, ref, tol](const CheckContext& ctx) -> CheckOutcome {
        const auto* intent = ctx.intent();
        if (!intent) return no_intent(ctx);
        const auto word = calldata_word(intent_text(*intent, "data"), index);
        if (!word) return {false, "Calldata has no argument " + std::to_string(index)};
        return compare_amount("Argument " + std::to_string(index), word_to_wei(*word), resolve_amount(ref, ctx), tol);
    };
}

CheckFn make_gas_reasonable(const CheckDecl& decl, const ProblemSpec& problem) {
    const auto min_used = u64_option(decl, problem, "min_used", 21000);
    const auto max_limit = u64_option(decl, problem, "max_limit", 500000);
    return [min_used, max_limit](const CheckContext& ctx) -> CheckOutcome {
        if (!ctx.receipt) return {false, "No transaction was submitted"};
        const auto used = ctx.receipt->gas_used;
        const auto limit = ctx.receipt->gas_limit;
        const bool ok = used >= min_used && limit >= used && limit <= max_limit;
        return {ok, "Gas Used: " + std::to_string(used) + ", Gas Limit: " + std::to_string(limit)};
    };
}

CheckFn make_state_delta(const CheckDecl& decl, const ProblemSpec& problem) {
    const auto label = state_option(decl, problem);
    const auto ref = required(decl, problem, "expect");
    validate_ref(decl, problem, ref);
    const auto direction = option(decl, "direction").value_or("increase");
    if (direction != "increase" && direction != "decrease") reject(decl, problem, "direction must be increase or decrease");
    const bool include_gas = bool_option(decl, problem, "include_gas", false);
    const auto tol = tolerance_option(decl, problem);
    return [label, ref, direction, include_gas, tol](const CheckContext& ctx) -> CheckOutcome {
        const auto* target = target_for(ctx, label);
        if (!target) return {false, "State '" + label + "' is not bound"};
        const auto before = ctx.before.value(*target);
        const auto after = ctx.after.value(*target);
        if (!before || !after) return {false, "State '" + label + "' was not captured"};

        const bool increase = direction == "increase";
        if (increase ? *after < *before : *after > *before) {
            return {false, label + " moved the wrong way: before " + to_decimal(*before) + ", after " + to_decimal(*after)};
        }
        const Wei delta = abs_diff(*after, *before);
        auto expected = resolve_amount(ref, ctx);
        if (expected && include_gas && ctx.receipt) *expected += ctx.receipt->gas_cost();
        return compare_amount(label + " " + direction, delta, expected, tol);
    };
}

CheckFn make_state_equals(const CheckDecl& decl, const ProblemSpec& problem) {
    const auto label = state_option(decl, problem);
    const auto ref = required(decl, problem, "expect");
    validate_ref(decl, problem, ref);
    const auto tol = tolerance_option(decl, problem);
    return [label, ref, tol](const CheckContext& ctx) -> CheckOutcome {
        const auto* target = target_for(ctx, label);
        if (!target) return {false, "State '" + label + "' is not bound"};
        std::optional<Wei> expected;
        if (const auto address = resolve_address(ref, ctx)) {
            // Address-valued state (e.g. an owner slot) compares as a 160-bit integer.
            expected = word_to_wei(abi_word(*address));
        } else {
            expected = resolve_amount(ref, ctx);
        }
        return compare_amount(label, ctx.after.value(*target), expected, tol);
    };
}

CheckFn make_state_unchanged(const CheckDecl& decl, const ProblemSpec& problem) {
    const auto label = state_option(decl, problem);
    return [label](const CheckContext& ctx) -> CheckOutcome {
        const auto* target = target_for(ctx, label);
        if (!target) return {false, "State '" + label + "' is not bound"};
        const auto before = ctx.before.value(*target);
        const auto after = ctx.after.value(*target);
        if (!before || !after) return {false, "State '" + label + "' was not captured"};
        return {*before == *after, label + ": before " + to_decimal(*before) + ", after " + to_decimal(*after)};
    };
}

CheckFn make_event_emitted(const CheckDecl& decl, const ProblemSpec& problem) {
    const auto topic = lower(required(decl, problem, "topic"));
    if (topic.size() != 66 || !is_hex_data(topic)) reject(decl, problem, "topic must be 0x + 64 hex chars");
    const auto emitter = option(decl, "emitter");
    if (emitter) validate_ref(decl, problem, *emitter);
    const auto min_count = u64_option(decl, problem, "min_count", 1);
    return [topic, emitter, min_count](const CheckContext& ctx) -> CheckOutcome {
        if (!ctx.receipt) return {false, "No transaction was submitted"};
        std::optional<Address> expected_emitter;
        if (emitter) {
            expected_emitter = resolve_address(*emitter, ctx);
            if (!expected_emitter) return {false, "Emitter '" + *emitter + "' could not be resolved"};
        }
        std::uint64_t count = 0;
        for (const auto& log : ctx.receipt->logs) {
            if (log.topics.empty() || lower(log.topics.front()) != topic) continue;
            if (expected_emitter && log.address != *expected_emitter) continue;
            ++count;
        }
        return {count >= min_count, "Found " + std::to_string(count) + " matching log(s), need " + std::to_string(min_count)};
    };
}

CheckFn make_query_success(const CheckDecl&, const ProblemSpec&) {
    return [](const CheckContext& ctx) -> CheckOutcome {
        const auto* query = ctx.query();
        if (!query) return no_query(ctx);
        const auto& root = query_root(query->payload);
        const auto success = root.find("success");
        const auto error = root.find("error");
        const std::string reason = error != root.end() && error->is_string() ? error->get<std::string>() : "";
        // A candidate may report its own failure instead of throwing, beside or inside query_result.
        for (const auto* scope : {&query->payload, &root}) {
            const auto detected = scope->find("error_detected");
            if (detected == scope->end() || !detected->is_boolean() || !detected->get<bool>()) continue;
            const auto message = scope->find("error_message");
            const bool has_message = message != scope->end() && message->is_string();
            return {false, "Query reported an error: " + (has_message ? message->get<std::string>() : reason)};
        }
        if (success != root.end()) {
            const bool ok = success->is_boolean() && success->get<bool>();
            return {ok, ok ? "Query executed successfully" : "Query failed: " + reason};
        }
        if (error != root.end()) return {false, "Query failed: " + reason};
        return {true, "Query returned a result"};
    };
}

CheckFn make_query_field(const CheckDecl& decl, const ProblemSpec& problem) {
    const auto path = required(decl, problem, "path");
    return [path](const CheckContext& ctx) -> CheckOutcome {
        const auto* query = ctx.query();
        if (!query) return no_query(ctx);
        const auto* field = find_field(query_root(query->payload), path);
        if (field && !field->is_null()) return {true, "Field '" + path + "' present"};
        std::string keys;
        for (const auto& [key, value] : query_root(query->payload).items()) {
            (void)value;
            keys += (keys.empty() ? "" : ", ") + key;
        }
        return {false, "Expected field '" + path + "'. Got: [" + keys + "]"};
    };
}

CheckFn make_query_matches_state(const CheckDecl& decl, const ProblemSpec& problem) {
    const auto path = required(decl, problem, "path");
    const auto label = state_option(decl, problem);
    const auto tol = tolerance_option(decl, problem);
    return [path, label, tol](const CheckContext& ctx) -> CheckOutcome {
        const auto* query = ctx.query();
        if (!query) return no_query(ctx);
        const auto* target = target_for(ctx, label);
        if (!target) return {false, "State '" + label + "' is not bound"};
        const auto* field = find_field(query_root(query->payload), path);
        if (!field) return {false, "Field '" + path + "' missing"};
        return compare_amount("'" + path + "' vs " + label, json_to_wei(*field), ctx.before.value(*target), tol);
    };
}

CheckFn make_query_matches_param(const CheckDecl& decl, const ProblemSpec& problem) {
    const auto path = required(decl, problem, "path");
    const auto ref = required(decl, problem, "expect");
    validate_ref(decl, problem, ref);
    const auto tol = tolerance_option(decl, problem);
    return [path, ref, tol](const CheckContext& ctx) -> CheckOutcome {
        const auto* query = ctx.query();
        if (!query) return no_query(ctx);
        const auto* field = find_field(query_root(query->payload), path);
        if (!field) return {false, "Field '" + path + "' missing"};

        if (const auto text = ctx.params.text(ref)) {
            const bool ok = field->is_string() && field->get<std::string>() == *text;
            return {ok, "'" + path + "': expected '" + *text + "', actual " + field->dump()};
        }
        if (const auto address = resolve_address(ref, ctx)) {
            const auto actual = field->is_string() ? parse_address(field->get<std::string>()) : std::nullopt;
            return {actual == address, "'" + path + "': expected " + address->hex + ", actual " + field->dump()};
        }
        return compare_amount("'" + path + "'", json_to_wei(*field), resolve_amount(ref, ctx), tol);
    };
}

const std::map<std::string, CheckBuilder>& builders() {
    static const std::map<std::string, CheckBuilder> table = {
        {"tx_success", make_tx_success},
        {"tx_reverted", make_tx_reverted},
        {"intent_address", make_intent_address},
        {"intent_amount", make_intent_amount},
        {"intent_selector", make_intent_selector},
        {"calldata_address", make_calldata_address},
        {"calldata_amount", make_calldata_amount},
        {"gas_reasonable", make_gas_reasonable},
        {"state_delta", make_state_delta},
        {"state_equals", make_state_equals},
        {"state_unchanged", make_state_unchanged},
        {"event_emitted", make_event_emitted},
        {"query_success", make_query_success},
        {"query_field", make_query_field},
        {"query_matches_state", make_query_matches_state},
        {"query_matches_param", make_query_matches_param},
    };
    return table;
}

}  // namespace

Check CheckFactory::build(const CheckDecl& decl, const ProblemSpec& problem) {
    const auto& table = builders();
    const auto it = table.find(decl.kind);
    if (it == table.end()) {
        reject(decl, problem, "unknown check kind");
    }
    return Check{decl.name, decl.weight, decl.critical, it->second(decl, problem)};
}

const std::vector<std::string>& CheckFactory::known_kinds() {
    static const std::vector<std::string> kinds = [] {
        std::vector<std::string> out;
        for (const auto& [name, builder] : builders()) {
            (void)builder;
            out.push_back(name);
        }
        return out;
    }();
    return kinds;
}

const nlohmann::json& query_root(const nlohmann::json& payload) {
    const auto it = payload.find("query_result");
    if (it != payload.end() && it->is_object()) return *it;
    return payload;
}

const nlohmann::json* find_field(const nlohmann::json& root, const std::string& path) {
    auto walk = [&path](const nlohmann::json& start) -> const nlohmann::json* {
        const nlohmann::json* node = &start;
        std::size_t pos = 0;
        while (pos <= path.size()) {
            const auto dot = path.find('.', pos);
            const auto key = path.substr(pos, dot == std::string::npos ? std::string::npos : dot - pos);
            if (!node->is_object()) return nullptr;
            const auto it = node->find(key);
            if (it == node->end()) return nullptr;
            node = &*it;
            if (dot == std::string::npos) return node;
            pos = dot + 1;
        }
        return nullptr;
    };
    if (const auto* direct = walk(root)) return direct;
    const auto data = root.find("data");
    if (data != root.end() && data->is_object()) return walk(*data);
    return nullptr;
}

std::optional<Wei> json_to_wei(const nlohmann::json& value) {
    if (value.is_number_unsigned()) return Wei{value.get<std::uint64_t>()};
    if (value.is_number_integer()) {
        const auto v = value.get<std::int64_t>();
        if (v < 0) return std::nullopt;
        return Wei{static_cast<std::uint64_t>(v)};
    }
    if (value.is_number_float()) {
        const double v = value.get<double>();
        // Beyond 2^53 a double no longer identifies a single integer.
        if (v < 0 || v > 9007199254740992.0 || std::floor(v) != v) return std::nullopt;
        return Wei{static_cast<std::uint64_t>(v)};
    }
    if (value.is_string()) return parse_wei(value.get<std::string>());
    return std::nullopt;
}

}  // namespace quest::bench
