#include "quest_bench/state.hpp"

#include <stdexcept>

namespace quest::bench {

const char* to_string(StateKind kind) {
    switch (kind) {
        case StateKind::Native: return "native";
        case StateKind::Nonce: return "nonce";
        case StateKind::CodeSize: return "code_size";
        case StateKind::TokenBalance: return "token";
        case StateKind::Allowance: return "allowance";
        case StateKind::Storage: return "storage";
        case StateKind::Call: return "call";
    }
    return "unknown";
}

std::string StateTarget::describe() const {
    std::string out = std::string{to_string(kind)} + " " + address.hex;
    if (holder) out += " " + holder->hex;
    if (spender) out += " " + spender->hex;
    if (!data.empty()) out += " " + data;
    return out;
}

namespace {

Address bind_address(const std::string& ref,
                     const ProblemSpec& problem,
                     const ParameterInstance& params,
                     const Address& identity,
                     const FixtureRegistry& fixtures) {
    if (ref == "identity") return identity;
    if (ref.rfind("fixture:", 0) == 0) {
        const auto it = fixtures.find(ref.substr(8));
        if (it == fixtures.end()) {
            throw std::runtime_error("Problem '" + problem.id + "' references unknown fixture '" + ref.substr(8) + "'");
        }
        return it->second;
    }
    if (auto literal = parse_address(ref)) return *literal;
    if (auto bound = params.address(ref)) return *bound;
    throw std::runtime_error("Problem '" + problem.id + "' references '" + ref + "', which is not an address parameter");
}

}  // namespace

std::map<std::string, StateTarget> bind_targets(const ProblemSpec& problem,
                                                const ParameterInstance& params,
                                                const Address& identity,
                                                const FixtureRegistry& fixtures) {
    std::map<std::string, StateTarget> out;
    for (const auto& decl : problem.state) {
        auto address = [&](std::size_t i) { return bind_address(decl.args.at(i), problem, params, identity, fixtures); };

        StateTarget target;
        target.kind = decl.kind;
        target.address = address(0);
        switch (decl.kind) {
            case StateKind::TokenBalance:
                target.holder = address(1);
                break;
            case StateKind::Allowance:
                target.holder = address(1);
                target.spender = address(2);
                break;
            case StateKind::Storage:
                target.data = to_quantity(*parse_wei(decl.args.at(1)));
                break;
            case StateKind::Call:
                target.data = decl.args.at(1);
                break;
            case StateKind::Native:
            case StateKind::Nonce:
            case StateKind::CodeSize:
                break;
        }
        out.emplace(decl.label, std::move(target));
    }
    return out;
}

std::vector<StateTarget> target_list(const std::map<std::string, StateTarget>& targets) {
    std::vector<StateTarget> out;
    out.reserve(targets.size());
    for (const auto& [label, target] : targets) {
        (void)label;
        out.push_back(target);
    }
    return out;
}

}  // namespace quest::bench
