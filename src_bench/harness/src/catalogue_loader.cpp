#include "quest_bench/catalogue_loader.hpp"
#include "quest_bench/primitives.hpp"

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <set>
#include <sstream>
#include <stdexcept>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace {

using namespace quest::bench;

constexpr std::string_view kWhitespace = " \t\n\r\f\v";
constexpr std::string_view kCatalogueExtension = ".qst";

std::string trim_copy(std::string_view input) {
    const auto begin = input.find_first_not_of(kWhitespace);
    if (begin == std::string_view::npos) {
        return {};
    }
    const auto end = input.find_last_not_of(kWhitespace);
    return std::string{input.substr(begin, end - begin + 1)};
}

std::string to_lower_copy(std::string_view input) {
    std::string result;
    result.reserve(input.size());
    for (unsigned char ch : input) {
        result.push_back(static_cast<char>(std::tolower(ch)));
    }
    return result;
}

std::vector<std::string> split_words(std::string_view input) {
    std::vector<std::string> words;
    std::istringstream is{std::string{input}};
    std::string word;
    while (is >> word) words.emplace_back(std::move(word));
    return words;
}

std::vector<std::string> split_on(std::string_view input, char delimiter) {
    std::vector<std::string> parts;
    std::size_t start = 0;
    while (true) {
        const auto pos = input.find(delimiter, start);
        parts.emplace_back(trim_copy(input.substr(start, pos - start)));
        if (pos == std::string_view::npos) break;
        start = pos + 1;
    }
    return parts;
}

/// Error context for one line of one file.
struct Where {
    const std::filesystem::path& file;
    std::size_t line;

    [[noreturn]] void fail(const std::string& message) const {
        throw std::runtime_error(message + " at " + file.string() + ":" + std::to_string(line));
    }
};

bool parse_boolean(std::string_view raw, const Where& where) {
    const auto lowered = to_lower_copy(raw);
    if (lowered == "true" || lowered == "yes" || lowered == "1") {
        return true;
    }
    if (lowered == "false" || lowered == "no" || lowered == "0") {
        return false;
    }
    where.fail("Invalid boolean value '" + std::string{raw} + "'");
}

unsigned parse_unsigned(std::string_view raw, const Where& where) {
    const std::string text{raw};
    char* end = nullptr;
    const unsigned long value = std::strtoul(text.c_str(), &end, 10);
    if (text.empty() || end != text.c_str() + text.size() || text.front() == '-') {
        where.fail("Invalid unsigned integer '" + text + "'");
    }
    return static_cast<unsigned>(value);
}

long long parse_integer(std::string_view raw, const Where& where) {
    const std::string text{raw};
    char* end = nullptr;
    const long long value = std::strtoll(text.c_str(), &end, 10);
    if (text.empty() || end != text.c_str() + text.size()) {
        where.fail("Invalid integer '" + text + "'");
    }
    return value;
}

double parse_number(std::string_view raw, const Where& where) {
    const std::string text{raw};
    char* end = nullptr;
    const double value = std::strtod(text.c_str(), &end);
    if (text.empty() || end != text.c_str() + text.size() || value < 0.0) {
        where.fail("Invalid non-negative number '" + text + "'");
    }
    return value;
}

ParamType parse_param_type(std::string_view raw, const Where& where) {
    if (raw == "address") return ParamType::Address;
    if (raw == "amount") return ParamType::Amount;
    if (raw == "integer") return ParamType::Integer;
    if (raw == "string") return ParamType::String;
    if (raw == "boolean") return ParamType::Boolean;
    where.fail("Unknown parameter type '" + std::string{raw} + "'");
}

GenerationRule parse_rule(std::string_view raw) {
    GenerationRule rule;
    const auto colon = raw.find(':');
    rule.method = std::string{raw.substr(0, colon)};
    if (colon == std::string_view::npos) return rule;

    const auto rest = raw.substr(colon + 1);
    if (rule.method == "from_list") {
        rule.args = split_on(rest, ',');
    } else if (rule.method == "random") {
        rule.args = split_on(rest, ':');
    } else {
        rule.args.emplace_back(rest);
    }
    return rule;
}

void validate_param(const ParamSpec& param, const Where& where) {
    const auto& rule = param.rule;
    const auto argc = rule.args.size();
    const bool is_address = param.type == ParamType::Address;

    if (rule.method == "identity" || rule.method == "fixture") {
        if (!is_address) where.fail("Rule '" + rule.method + "' requires an address parameter");
        if (rule.method == "fixture" && (argc != 1 || rule.args[0].empty())) {
            where.fail("Rule 'fixture' requires a fixture name");
        }
        return;
    }
    if (rule.method == "fixed") {
        if (argc != 1) where.fail("Rule 'fixed' requires a value");
        const auto& value = rule.args[0];
        bool ok = true;
        switch (param.type) {
            case ParamType::Address: ok = parse_address(value).has_value(); break;
            case ParamType::Amount: ok = parse_units(value, param.unit_decimals).has_value(); break;
            case ParamType::Integer: parse_integer(value, where); break;
            case ParamType::Boolean: parse_boolean(value, where); break;
            case ParamType::String: break;
        }
        if (!ok) where.fail("Fixed value '" + value + "' does not match the parameter type");
        return;
    }
    if (rule.method == "from_list") {
        if (argc == 0 || std::any_of(rule.args.begin(), rule.args.end(), [](const auto& a) { return a.empty(); })) {
            where.fail("Rule 'from_list' requires a non-empty list");
        }
        return;
    }
    if (rule.method == "random") {
        switch (param.type) {
            case ParamType::Address:
            case ParamType::Boolean:
                if (argc != 0) where.fail("Rule 'random' takes no arguments for this type");
                break;
            case ParamType::String:
                if (argc > 1) where.fail("Rule 'random' takes at most a length for strings");
                if (argc == 1) parse_unsigned(rule.args[0], where);
                break;
            case ParamType::Integer:
                if (argc != 2) where.fail("Rule 'random' requires <min>:<max> for integers");
                if (parse_integer(rule.args[0], where) > parse_integer(rule.args[1], where)) where.fail("Empty integer range");
                break;
            case ParamType::Amount: {
                if (argc != 2) where.fail("Rule 'random' requires <min>:<max> for amounts");
                const auto lo = parse_units(rule.args[0], param.decimals);
                const auto hi = parse_units(rule.args[1], param.decimals);
                if (!lo || !hi) where.fail("Amount bounds must have at most " + std::to_string(param.decimals) + " decimals");
                if (*lo > *hi) where.fail("Empty amount range");
                if (param.decimals > param.unit_decimals) where.fail("decimals exceeds unit");
                break;
            }
        }
        return;
    }
    where.fail("Unknown generation rule '" + rule.method + "'");
}

ParamSpec parse_param(const std::string& name, std::string_view value, const Where& where) {
    const auto words = split_words(value);
    if (words.size() < 2) where.fail("Expected '<type> <rule>' for parameter '" + name + "'");

    ParamSpec param;
    param.name = name;
    param.type = parse_param_type(words[0], where);
    param.rule = parse_rule(words[1]);
    for (std::size_t i = 2; i < words.size(); ++i) {
        const auto eq = words[i].find('=');
        const auto key = words[i].substr(0, eq);
        if (eq == std::string::npos) where.fail("Expected option 'key=value', got '" + words[i] + "'");
        const auto opt = words[i].substr(eq + 1);
        if (key == "decimals") {
            param.decimals = parse_unsigned(opt, where);
        } else if (key == "unit") {
            param.unit_decimals = parse_unsigned(opt, where);
        } else {
            where.fail("Unknown parameter option '" + key + "'");
        }
    }
    validate_param(param, where);
    return param;
}

std::pair<StateKind, std::size_t> parse_state_kind(std::string_view raw, const Where& where) {
    if (raw == "native") return {StateKind::Native, 1};
    if (raw == "nonce") return {StateKind::Nonce, 1};
    if (raw == "code_size") return {StateKind::CodeSize, 1};
    if (raw == "token") return {StateKind::TokenBalance, 2};
    if (raw == "allowance") return {StateKind::Allowance, 3};
    if (raw == "storage") return {StateKind::Storage, 2};
    if (raw == "call") return {StateKind::Call, 2};
    where.fail("Unknown state kind '" + std::string{raw} + "'");
}

StateDecl parse_state(const std::string& label, std::string_view value, const Where& where) {
    auto words = split_words(value);
    if (words.empty()) where.fail("Empty state declaration '" + label + "'");
    const auto [kind, arity] = parse_state_kind(words[0], where);
    if (words.size() != arity + 1) {
        where.fail("State kind '" + words[0] + "' takes " + std::to_string(arity) + " argument(s)");
    }
    StateDecl decl;
    decl.label = label;
    decl.kind = kind;
    decl.args.assign(words.begin() + 1, words.end());
    if (kind == StateKind::Storage && !parse_wei(decl.args[1])) where.fail("Invalid storage slot '" + decl.args[1] + "'");
    if (kind == StateKind::Call && !is_hex_data(decl.args[1])) where.fail("Invalid calldata '" + decl.args[1] + "'");
    return decl;
}

CheckDecl parse_check(const std::string& name, std::string_view value, const Where& where) {
    const auto words = split_words(value);
    if (words.empty()) where.fail("Empty check declaration '" + name + "'");

    CheckDecl check;
    check.name = name;
    check.kind = words[0];
    bool has_weight = false;
    for (std::size_t i = 1; i < words.size(); ++i) {
        const auto& word = words[i];
        if (word == "critical") {
            check.critical = true;
            continue;
        }
        const auto eq = word.find('=');
        if (eq == std::string::npos || eq == 0) where.fail("Expected option 'key=value', got '" + word + "'");
        const auto key = word.substr(0, eq);
        const auto opt = word.substr(eq + 1);
        if (key == "weight") {
            check.weight = parse_number(opt, where);
            has_weight = true;
        } else {
            check.options[key] = opt;
        }
    }
    if (!has_weight) where.fail("Check '" + name + "' is missing weight=<points>");
    return check;
}

bool is_address_ref(const std::string& arg, const std::set<std::string>& params) {
    return arg == "identity" || arg.rfind("fixture:", 0) == 0 || parse_address(arg).has_value() ||
           params.count(arg) != 0;
}

/// Whole-block validation; runs once the block is complete so line order does not matter.
void validate_problem(const ProblemSpec& problem, const std::filesystem::path& file, std::size_t line_no) {
    const Where where{file, line_no};
    std::set<std::string> param_names;
    for (const auto& param : problem.params) {
        if (!param_names.insert(param.name).second) where.fail("Duplicate parameter '" + param.name + "' in " + problem.id);
    }

    std::set<std::string> labels;
    for (const auto& decl : problem.state) {
        if (!labels.insert(decl.label).second) where.fail("Duplicate state label '" + decl.label + "' in " + problem.id);
        std::size_t address_args = decl.args.size();
        if (decl.kind == StateKind::Storage || decl.kind == StateKind::Call) address_args = 1;
        for (std::size_t i = 0; i < address_args; ++i) {
            if (!is_address_ref(decl.args[i], param_names)) {
                where.fail("State '" + decl.label + "' references unknown address '" + decl.args[i] + "' in " + problem.id);
            }
        }
    }

    if (problem.checks.empty()) where.fail("Problem '" + problem.id + "' declares no checks");

    if (problem.kind == ProblemKind::Composite) {
        if (!problem.composite || problem.composite->optimal_steps == 0) {
            where.fail("Composite problem '" + problem.id + "' requires optimal_steps >= 1");
        }
        if (problem.composite->max_rounds_multiplier == 0) {
            where.fail("max_rounds_multiplier must be >= 1 in " + problem.id);
        }
    } else if (problem.composite || !problem.step_checks.empty()) {
        where.fail("Atomic problem '" + problem.id + "' carries composite settings");
    }
    if (problem.pass_ratio > 1.0) where.fail("pass_ratio must be within [0, 1] in " + problem.id);
}

}  // namespace

namespace quest::bench {

Catalogue CatalogueLoader::load(const std::filesystem::path& file) const {
    if (!std::filesystem::exists(file)) {
        throw std::runtime_error("Catalogue file does not exist: " + file.string());
    }
    if (!std::filesystem::is_regular_file(file)) {
        throw std::runtime_error("Catalogue path is not a regular file: " + file.string());
    }

    std::ifstream input(file);
    if (!input.is_open()) {
        throw std::runtime_error("Unable to open catalogue file: " + file.string());
    }

    Catalogue catalogue;
    catalogue.source_files.push_back(file.string());

    std::string default_category = file.stem().string();
    if (default_category.empty()) {
        default_category = file.filename().string();
    }
    const std::string id_prefix = default_category;

    ProblemSpec current;
    bool touched = false;
    std::size_t block_start = 0;

    auto reset_current = [&]() {
        current = ProblemSpec{};
        current.category = default_category;
        current.source_file = file.string();
        touched = false;
    };
    reset_current();

    auto composite_config = [&]() -> CompositeConfig& {
        if (!current.composite) current.composite.emplace();
        return *current.composite;
    };

    auto push_current = [&]() {
        if (!touched) {
            reset_current();
            return;
        }
        if (current.id.empty()) {
            current.id = id_prefix + "#" + std::to_string(catalogue.problems.size() + 1);
        }
        validate_problem(current, file, block_start);
        catalogue.problems.emplace_back(std::move(current));
        reset_current();
    };

    std::string raw_line;
    std::size_t line_no = 0;
    while (std::getline(input, raw_line)) {
        ++line_no;
        const Where where{file, line_no};

        const auto trimmed = trim_copy(raw_line);
        if (trimmed.empty() || trimmed.front() == '#') {
            continue;
        }

        if (trimmed == "---") {
            push_current();
            continue;
        }

        const auto delimiter = trimmed.find('=');
        if (delimiter == std::string::npos) {
            where.fail("Expected 'key=value' entry");
        }

        auto key = trim_copy(trimmed.substr(0, delimiter));
        auto value = trim_copy(trimmed.substr(delimiter + 1));

        if (key.empty()) {
            where.fail("Empty key");
        }

        if (!touched) block_start = line_no;
        touched = true;

        if (key == "id") {
            current.id = std::move(value);
        } else if (key == "category") {
            current.category = std::move(value);
        } else if (key == "kind") {
            if (value == "atomic") {
                current.kind = ProblemKind::Atomic;
            } else if (value == "composite") {
                current.kind = ProblemKind::Composite;
                (void)composite_config();
            } else {
                where.fail("Unknown problem kind '" + value + "'");
            }
        } else if (key == "difficulty") {
            current.difficulty = std::move(value);
        } else if (key == "description") {
            current.description = std::move(value);
        } else if (key == "template") {
            current.templates.emplace_back(std::move(value));
        } else if (key.rfind("param.", 0) == 0) {
            const auto name = key.substr(6);
            if (name.empty()) where.fail("Empty parameter name");
            current.params.emplace_back(parse_param(name, value, where));
        } else if (key.rfind("state.", 0) == 0) {
            const auto label = key.substr(6);
            if (label.empty()) where.fail("Empty state label");
            current.state.emplace_back(parse_state(label, value, where));
        } else if (key.rfind("check.", 0) == 0) {
            const auto name = key.substr(6);
            if (name.empty()) where.fail("Empty check name");
            current.checks.emplace_back(parse_check(name, value, where));
        } else if (key.rfind("step_check.", 0) == 0) {
            const auto name = key.substr(11);
            if (name.empty()) where.fail("Empty check name");
            current.step_checks.emplace_back(parse_check(name, value, where));
        } else if (key == "optimal_steps") {
            composite_config().optimal_steps = parse_unsigned(value, where);
        } else if (key == "max_rounds_multiplier") {
            composite_config().max_rounds_multiplier = parse_unsigned(value, where);
        } else if (key == "planning") {
            composite_config().planning = parse_boolean(value, where);
        } else if (key == "pass_ratio") {
            current.pass_ratio = parse_number(value, where);
        } else {
            where.fail("Unknown key '" + key + "'");
        }
    }

    push_current();
    return catalogue;
}

Catalogue CatalogueLoader::load_directory(const std::filesystem::path& root) const {
    if (!std::filesystem::exists(root)) {
        throw std::runtime_error("Catalogue root does not exist: " + root.string());
    }

    if (!std::filesystem::is_directory(root)) {
        return load(root);
    }

    std::vector<std::filesystem::path> files;
    for (const auto& entry : std::filesystem::recursive_directory_iterator(root)) {
        if (entry.is_regular_file() && entry.path().extension() == kCatalogueExtension) {
            files.emplace_back(entry.path());
        }
    }

    std::sort(files.begin(), files.end());

    std::vector<Catalogue> parts;
    parts.reserve(files.size());
    for (const auto& path : files) {
        parts.emplace_back(load(path));
    }
    return merge(std::move(parts));
}

Catalogue CatalogueLoader::merge(std::vector<Catalogue> parts) {
    Catalogue merged;
    std::set<std::string> seen;
    for (auto& part : parts) {
        for (auto& file : part.source_files) merged.source_files.emplace_back(std::move(file));
        for (auto& problem : part.problems) {
            if (!seen.insert(problem.id).second) {
                throw std::runtime_error("Duplicate problem id '" + problem.id + "' in " + problem.source_file);
            }
            merged.problems.emplace_back(std::move(problem));
        }
    }
    return merged;
}

}  // namespace quest::bench
