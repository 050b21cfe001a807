#include "quest_bench/parameters.hpp"

#include <cinttypes>
#include <cstdio>
#include <cstdlib>
#include <limits>
#include <stdexcept>
#include <string>
#include <utility>

namespace quest::bench {

namespace {

constexpr std::size_t kDefaultStringLength = 8;
constexpr std::string_view kAlphabet = "abcdefghijklmnopqrstuvwxyz0123456789";

std::uint64_t to_u64(const Wei& value, const std::string& name) {
    if (value > Wei{std::numeric_limits<std::uint64_t>::max()}) {
        throw std::runtime_error("Amount range of parameter '" + name + "' is too wide to sample");
    }
    return static_cast<std::uint64_t>(value);
}

bool parse_bool_text(const std::string& text) {
    return text == "true" || text == "yes" || text == "1";
}

}  // namespace

ParameterInstance::ParameterInstance(std::map<std::string, ParamValue> values) : values_(std::move(values)) {}

bool ParameterInstance::contains(const std::string& name) const { return values_.count(name) != 0; }

const ParamValue& ParameterInstance::at(const std::string& name) const {
    const auto it = values_.find(name);
    if (it == values_.end()) {
        throw std::out_of_range("Unknown parameter '" + name + "'");
    }
    return it->second;
}

std::optional<Address> ParameterInstance::address(const std::string& name) const {
    const auto it = values_.find(name);
    if (it == values_.end()) return std::nullopt;
    if (const auto* value = std::get_if<Address>(&it->second)) return *value;
    return std::nullopt;
}

std::optional<Wei> ParameterInstance::amount(const std::string& name) const {
    const auto it = values_.find(name);
    if (it == values_.end()) return std::nullopt;
    if (const auto* value = std::get_if<Amount>(&it->second)) return value->base_units;
    if (const auto* value = std::get_if<std::int64_t>(&it->second); value && *value >= 0) {
        return Wei{static_cast<std::uint64_t>(*value)};
    }
    return std::nullopt;
}

std::optional<std::int64_t> ParameterInstance::integer(const std::string& name) const {
    const auto it = values_.find(name);
    if (it == values_.end()) return std::nullopt;
    if (const auto* value = std::get_if<std::int64_t>(&it->second)) return *value;
    return std::nullopt;
}

std::optional<std::string> ParameterInstance::text(const std::string& name) const {
    const auto it = values_.find(name);
    if (it == values_.end()) return std::nullopt;
    if (const auto* value = std::get_if<std::string>(&it->second)) return *value;
    return std::nullopt;
}

std::optional<bool> ParameterInstance::boolean(const std::string& name) const {
    const auto it = values_.find(name);
    if (it == values_.end()) return std::nullopt;
    if (const auto* value = std::get_if<bool>(&it->second)) return *value;
    return std::nullopt;
}

std::string ParameterInstance::display(const std::string& name) const {
    const auto& value = at(name);
    if (const auto* a = std::get_if<Address>(&value)) return a->hex;
    if (const auto* a = std::get_if<Amount>(&value)) return a->display;
    if (const auto* i = std::get_if<std::int64_t>(&value)) return std::to_string(*i);
    if (const auto* s = std::get_if<std::string>(&value)) return *s;
    return std::get<bool>(value) ? "true" : "false";
}

nlohmann::json ParameterInstance::to_json() const {
    nlohmann::json out = nlohmann::json::object();
    for (const auto& [name, value] : values_) {
        if (const auto* a = std::get_if<Address>(&value)) {
            out[name] = a->hex;
        } else if (const auto* a = std::get_if<Amount>(&value)) {
            out[name] = {{"display", a->display}, {"base_units", to_decimal(a->base_units)}};
        } else if (const auto* i = std::get_if<std::int64_t>(&value)) {
            out[name] = *i;
        } else if (const auto* s = std::get_if<std::string>(&value)) {
            out[name] = *s;
        } else {
            out[name] = std::get<bool>(value);
        }
    }
    return out;
}

ParameterGenerator::ParameterGenerator(std::uint64_t seed) : rng_(seed) {}

ParameterInstance ParameterGenerator::generate(const ProblemSpec& problem, const GenerationContext& context) {
    std::map<std::string, ParamValue> values;
    for (const auto& spec : problem.params) {
        values.emplace(spec.name, draw(spec, context));
    }
    return ParameterInstance{std::move(values)};
}

ParamValue ParameterGenerator::draw(const ParamSpec& spec, const GenerationContext& context) {
    const auto& rule = spec.rule;

    if (rule.method == "identity") {
        return context.identity;
    }
    if (rule.method == "fixture") {
        const auto it = context.fixtures.find(rule.args.at(0));
        if (it == context.fixtures.end()) {
            throw std::runtime_error("Parameter '" + spec.name + "' references unknown fixture '" + rule.args.at(0) + "'");
        }
        return it->second;
    }
    if (rule.method == "fixed") {
        return from_text(spec, rule.args.at(0));
    }
    if (rule.method == "from_list") {
        std::uniform_int_distribution<std::size_t> pick(0, rule.args.size() - 1);
        return from_text(spec, rule.args[pick(rng_)]);
    }

    switch (spec.type) {
        case ParamType::Address: {
            char buf[41];
            const std::uint64_t hi = rng_();
            const std::uint64_t mid = rng_();
            const std::uint32_t lo = static_cast<std::uint32_t>(rng_());
            std::snprintf(buf, sizeof(buf), "%016" PRIx64 "%016" PRIx64 "%08" PRIx32, hi, mid, lo);
            return Address{std::string{"0x"} + buf};
        }
        case ParamType::Amount: {
            const auto lo = to_u64(*parse_units(rule.args.at(0), spec.decimals), spec.name);
            const auto hi = to_u64(*parse_units(rule.args.at(1), spec.decimals), spec.name);
            std::uniform_int_distribution<std::uint64_t> dist(lo, hi);
            const Wei drawn{dist(rng_)};
            Amount amount;
            amount.unit_decimals = spec.unit_decimals;
            amount.base_units = drawn * pow10(spec.unit_decimals - spec.decimals);
            amount.display = format_units(drawn, spec.decimals);
            return amount;
        }
        case ParamType::Integer: {
            std::uniform_int_distribution<std::int64_t> dist(std::strtoll(rule.args.at(0).c_str(), nullptr, 10),
                                                              std::strtoll(rule.args.at(1).c_str(), nullptr, 10));
            return dist(rng_);
        }
        case ParamType::String: {
            const std::size_t length = rule.args.empty() ? kDefaultStringLength
                                                         : std::strtoul(rule.args[0].c_str(), nullptr, 10);
            std::uniform_int_distribution<std::size_t> pick(0, kAlphabet.size() - 1);
            std::string out;
            out.reserve(length);
            for (std::size_t i = 0; i < length; ++i) out.push_back(kAlphabet[pick(rng_)]);
            return out;
        }
        case ParamType::Boolean:
            return (rng_() & 1U) != 0;
    }
    throw std::runtime_error("Unsupported parameter type for '" + spec.name + "'");
}

ParamValue ParameterGenerator::from_text(const ParamSpec& spec, const std::string& text) const {
    switch (spec.type) {
        case ParamType::Address:
            if (const auto address = parse_address(text)) return *address;
            break;
        case ParamType::Amount:
            if (const auto units = parse_units(text, spec.unit_decimals)) {
                return Amount{*units, format_units(*units, spec.unit_decimals), spec.unit_decimals};
            }
            break;
        case ParamType::Integer: {
            char* end = nullptr;
            const long long value = std::strtoll(text.c_str(), &end, 10);
            if (!text.empty() && end == text.c_str() + text.size()) return static_cast<std::int64_t>(value);
            break;
        }
        case ParamType::String:
            return text;
        case ParamType::Boolean:
            return parse_bool_text(text);
    }
    throw std::runtime_error("Value '" + text + "' is not valid for parameter '" + spec.name + "'");
}

std::string render_template(const std::string& text, const ParameterInstance& params) {
    std::string out;
    out.reserve(text.size());
    std::size_t pos = 0;
    while (pos < text.size()) {
        const auto open = text.find('{', pos);
        if (open == std::string::npos) break;
        const auto close = text.find('}', open + 1);
        if (close == std::string::npos) break;
        out.append(text, pos, open - pos);
        const auto name = text.substr(open + 1, close - open - 1);
        if (params.contains(name)) {
            out += params.display(name);
        } else {
            out.append(text, open, close - open + 1);
        }
        pos = close + 1;
    }
    out.append(text, pos, std::string::npos);
    return out;
}

}  // namespace quest::bench
