#include <chrono>
#include <cstdint>
#include <cstdlib>
#include <filesystem>
#include <iostream>
#include <optional>
#include <set>
#include <stdexcept>
#include <string>
#include <string_view>
#include <vector>

#include "quest_bench/attempt.hpp"
#include "quest_bench/candidates.hpp"
#include "quest_bench/catalogue_loader.hpp"
#include "quest_bench/engine.hpp"
#include "quest_bench/fork_controller.hpp"
#include "quest_bench/node_bridge.hpp"
#include "quest_bench/result_writer.hpp"
#include "quest_bench/tx_executor.hpp"
#include "quest_bench/validator_registry.hpp"

using quest::bench::Address;
using quest::bench::AttemptRunner;
using quest::bench::Catalogue;
using quest::bench::CatalogueLoader;
using quest::bench::DirectoryCandidates;
using quest::bench::Engine;
using quest::bench::EnvironmentError;
using quest::bench::ProblemOutcome;
using quest::bench::ResultWriter;
using quest::bench::ValidatorRegistry;
using quest::bench::Wei;
using quest::bench::ledger::ForkController;
using quest::bench::ledger::TokenGrant;
using quest::bench::ledger::TransactionExecutor;

namespace {

constexpr const char* kDefaultForkUrl = "https://bsc-dataseed.binance.org";
constexpr const char* kDefaultIdentity = "0x7e5f4552091a69125d5dfcb7b8c2659029395bdf";
constexpr std::uint64_t kBscMainnet = 56;

struct Args {
    std::vector<std::filesystem::path> catalogue_paths;
    std::filesystem::path solutions{"src_bench/resources/solutions"};
    std::string fork_url;
    std::optional<std::uint64_t> chain_id;
    std::string anvil_exe{"anvil"};
    std::string runtime{"bun"};
    std::filesystem::path runner_script;
    std::filesystem::path fixture_dir;
    quest::bench::FixtureRegistry fixtures;
    Address identity;
    std::string fund{"100"};
    std::vector<TokenGrant> grants;
    std::uint64_t timeout_ms{60000};
    std::uint64_t submit_timeout_ms{30000};
    std::uint64_t seed{42};
    std::filesystem::path artifact_root{"build/quest_bench"};
    std::filesystem::path summary_path{};
    std::filesystem::path html_path{};
    std::set<std::string> only;
    bool emit_html{true};
    bool help{false};
};

void print_usage(const char* argv0) {
    std::cerr
        << "quest-bench: blockchain code-generation benchmark\n"
        << "Usage:\n"
        << "  " << argv0 << " --catalogue <file-or-dir> [--catalogue <file-or-dir> ...] --solutions <dir>\n"
        << "                 [--fork-url <url>] [--artifact-dir <dir>] [--summary <path>] [--html <path>] [--ci]\n"
        << "\n"
        << "Options:\n"
        << "  --catalogue         Problem catalogue file or directory (*.qst), repeatable.\n"
        << "  --solutions         Candidate directory (default: src_bench/resources/solutions).\n"
        << "  --fork-url          Network to fork (default: $QUEST_BENCH_FORK_URL, else " << kDefaultForkUrl << ").\n"
        << "  --chain-id          Chain id the simulator reports.\n"
        << "  --anvil             Simulator executable (default: anvil).\n"
        << "  --runtime           JavaScript runtime for candidates (default: bun).\n"
        << "  --runner            Runner script (default: <project>/src_bench/bridges/node/runner/run_candidate.mjs).\n"
        << "  --fixtures          Directory of fixture contract artifacts (<name>.json) to deploy.\n"
        << "  --fixture           Existing contract as <name>=<address>, repeatable.\n"
        << "  --identity          Test identity address (default: " << kDefaultIdentity << ").\n"
        << "  --fund              Native balance of the identity in whole units (default: 100).\n"
        << "  --grant             Token balance as <token>:<balance-slot>:<base-units>, repeatable.\n"
        << "  --timeout-ms        Code execution timeout (default: 60000).\n"
        << "  --submit-timeout-ms Receipt wait per transaction (default: 30000).\n"
        << "  --seed              Parameter generation seed (default: 42).\n"
        << "  --only              Run only this problem id, repeatable.\n"
        << "  --artifact-dir      Root directory for outputs (default: build/quest_bench).\n"
        << "  --summary           Write JSON summary to this path (default: <artifact-dir>/summary.json).\n"
        << "  --html              Write HTML report to this path (default: <artifact-dir>/report.html).\n"
        << "  --ci                CI mode: suppress HTML generation (JSON only).\n"
        << "  -h, --help          Show this help message.\n"
        << "\n"
        << "Default: Without --catalogue, scans src_bench/resources/catalogue for all *.qst recursively.\n"
        << std::endl;
}

bool arg_eq(std::string_view a, std::string_view b) {
    return a == b;
}

const char* take_value(int argc, char** argv, int& i, std::string_view flag) {
    if (i + 1 >= argc) {
        throw std::runtime_error(std::string(flag) + " expects a value");
    }
    return argv[++i];
}

std::uint64_t parse_count(std::string_view flag, const std::string& text) {
    const auto value = quest::bench::parse_wei(text);
    if (!value || *value > Wei{UINT64_MAX}) {
        throw std::runtime_error(std::string(flag) + ": not an unsigned integer: " + text);
    }
    return static_cast<std::uint64_t>(*value);
}

Address parse_address_arg(std::string_view flag, const std::string& text) {
    const auto address = quest::bench::parse_address(text);
    if (!address) {
        throw std::runtime_error(std::string(flag) + ": not an address: " + text);
    }
    return *address;
}

TokenGrant parse_grant(const std::string& text) {
    const auto first = text.find(':');
    const auto second = first == std::string::npos ? std::string::npos : text.find(':', first + 1);
    if (second == std::string::npos) {
        throw std::runtime_error("--grant expects <token>:<balance-slot>:<base-units>, got " + text);
    }
    TokenGrant grant;
    grant.token = parse_address_arg("--grant", text.substr(0, first));
    grant.balance_slot = parse_count("--grant", text.substr(first + 1, second - first - 1));
    const auto amount = quest::bench::parse_wei(text.substr(second + 1));
    if (!amount) {
        throw std::runtime_error("--grant: not an amount: " + text.substr(second + 1));
    }
    grant.amount = *amount;
    return grant;
}

// Well-known BSC mainnet tokens and the slot of their balances mapping.
std::vector<TokenGrant> bsc_default_grants() {
    const Wei unit = quest::bench::pow10(18);
    return {
        {*quest::bench::parse_address("0x55d398326f99059ff775485246999027b3197955"), unit * Wei{1000}, 1},  // USDT
        {*quest::bench::parse_address("0xbb4cdb9cbd36b01bd1cbaebf2de08d9173bc095c"), unit * Wei{100}, 3},   // WBNB
        {*quest::bench::parse_address("0x0e09fabb73bd3ade0a17ecc321fd13a19e81ce82"), unit * Wei{200}, 1},   // CAKE
        {*quest::bench::parse_address("0xe9e7cea3dedca5984780bafc599bd69add087d56"), unit * Wei{1000}, 1},  // BUSD
    };
}

quest::bench::FixtureRegistry bsc_known_contracts() {
    return {
        {"usdt", *quest::bench::parse_address("0x55d398326f99059ff775485246999027b3197955")},
        {"wbnb", *quest::bench::parse_address("0xbb4cdb9cbd36b01bd1cbaebf2de08d9173bc095c")},
        {"cake", *quest::bench::parse_address("0x0e09fabb73bd3ade0a17ecc321fd13a19e81ce82")},
        {"busd", *quest::bench::parse_address("0xe9e7cea3dedca5984780bafc599bd69add087d56")},
        {"pancake_router", *quest::bench::parse_address("0x10ed43c718714eb63d5aa57b78b54704e256024e")},
    };
}

Args parse_args(int argc, char** argv) {
    Args args;
    for (int i = 1; i < argc; ++i) {
        std::string_view tok = argv[i];
        if (arg_eq(tok, "-h") || arg_eq(tok, "--help")) {
            args.help = true;
            break;
        } else if (arg_eq(tok, "--catalogue")) {
            args.catalogue_paths.emplace_back(take_value(argc, argv, i, tok));
        } else if (arg_eq(tok, "--solutions")) {
            args.solutions = take_value(argc, argv, i, tok);
        } else if (arg_eq(tok, "--fork-url")) {
            args.fork_url = take_value(argc, argv, i, tok);
        } else if (arg_eq(tok, "--chain-id")) {
            args.chain_id = parse_count(tok, take_value(argc, argv, i, tok));
        } else if (arg_eq(tok, "--anvil")) {
            args.anvil_exe = take_value(argc, argv, i, tok);
        } else if (arg_eq(tok, "--runtime")) {
            args.runtime = take_value(argc, argv, i, tok);
        } else if (arg_eq(tok, "--runner")) {
            args.runner_script = take_value(argc, argv, i, tok);
        } else if (arg_eq(tok, "--fixtures")) {
            args.fixture_dir = take_value(argc, argv, i, tok);
        } else if (arg_eq(tok, "--fixture")) {
            const std::string spec = take_value(argc, argv, i, tok);
            const auto eq = spec.find('=');
            if (eq == std::string::npos || eq == 0) {
                throw std::runtime_error("--fixture expects <name>=<address>, got " + spec);
            }
            args.fixtures[spec.substr(0, eq)] = parse_address_arg(tok, spec.substr(eq + 1));
        } else if (arg_eq(tok, "--identity")) {
            args.identity = parse_address_arg(tok, take_value(argc, argv, i, tok));
        } else if (arg_eq(tok, "--fund")) {
            args.fund = take_value(argc, argv, i, tok);
        } else if (arg_eq(tok, "--grant")) {
            args.grants.push_back(parse_grant(take_value(argc, argv, i, tok)));
        } else if (arg_eq(tok, "--timeout-ms")) {
            args.timeout_ms = parse_count(tok, take_value(argc, argv, i, tok));
        } else if (arg_eq(tok, "--submit-timeout-ms")) {
            args.submit_timeout_ms = parse_count(tok, take_value(argc, argv, i, tok));
        } else if (arg_eq(tok, "--seed")) {
            args.seed = parse_count(tok, take_value(argc, argv, i, tok));
        } else if (arg_eq(tok, "--only")) {
            args.only.insert(take_value(argc, argv, i, tok));
        } else if (arg_eq(tok, "--artifact-dir")) {
            args.artifact_root = std::filesystem::path(take_value(argc, argv, i, tok));
        } else if (arg_eq(tok, "--summary")) {
            args.summary_path = std::filesystem::path(take_value(argc, argv, i, tok));
        } else if (arg_eq(tok, "--html")) {
            args.html_path = std::filesystem::path(take_value(argc, argv, i, tok));
        } else if (arg_eq(tok, "--ci")) {
            args.emit_html = false;
        } else {
            throw std::runtime_error("Unknown argument: " + std::string(tok));
        }
    }

    if (args.catalogue_paths.empty()) {
        const auto fallback_root = std::filesystem::path("src_bench/resources/catalogue");
        if (std::filesystem::is_directory(fallback_root)) {
            args.catalogue_paths.push_back(fallback_root);
        } else {
            throw std::runtime_error("No catalogue specified and none found under src_bench/resources/catalogue");
        }
    }

    if (args.fork_url.empty()) {
        const char* env = std::getenv("QUEST_BENCH_FORK_URL");
        args.fork_url = (env != nullptr && *env != '\0') ? env : kDefaultForkUrl;
    }
    if (args.identity.empty()) {
        args.identity = *quest::bench::parse_address(kDefaultIdentity);
    }
    if (args.runner_script.empty()) {
        const std::filesystem::path project_root =
#ifdef QUEST_BENCH_PROJECT_ROOT
            std::filesystem::path(QUEST_BENCH_PROJECT_ROOT);
#else
            std::filesystem::current_path();
#endif
        args.runner_script = project_root / "src_bench/bridges/node/runner/run_candidate.mjs";
    }
    if (args.summary_path.empty()) {
        args.summary_path = args.artifact_root / "summary.json";
    }
    if (args.html_path.empty()) {
        args.html_path = args.artifact_root / "report.html";
    }

    return args;
}

int aggregate_exit_code(const std::vector<ProblemOutcome>& outcomes) {
    for (const auto& o : outcomes) {
        if (o.status != "PASS") return 1;
    }
    return 0;
}

}  // namespace

int main(int argc, char** argv) {
    try {
        const auto args = parse_args(argc, argv);
        if (args.help) {
            print_usage(argv[0]);
            return 0;
        }

        // Load the catalogue and build validators before touching the ledger
        CatalogueLoader loader;
        std::vector<Catalogue> parts;
        for (const auto& path : args.catalogue_paths) {
            parts.push_back(loader.load_directory(path));
        }
        const Catalogue catalogue = CatalogueLoader::merge(std::move(parts));
        const ValidatorRegistry registry = ValidatorRegistry::from_catalogue(catalogue);

        std::filesystem::create_directories(args.artifact_root);

        quest::bench::node_bridge::Session::Config bridge_cfg;
        bridge_cfg.runtime = args.runtime;
        bridge_cfg.runner_script = args.runner_script;
        bridge_cfg.work_dir = args.artifact_root / "tmp_exec";
        quest::bench::node_bridge::Session bridge(bridge_cfg);
        std::string bridge_diag;
        if (!bridge.init(bridge_diag)) {
            throw std::runtime_error("Execution bridge unavailable:\n" + bridge_diag);
        }

        ForkController::Config ledger_cfg;
        ledger_cfg.anvil_exe = args.anvil_exe;
        ledger_cfg.chain_id = args.chain_id;
        ledger_cfg.identity = args.identity;
        ledger_cfg.fixture_dir = args.fixture_dir;
        ledger_cfg.receipt_timeout = std::chrono::milliseconds{args.submit_timeout_ms};
        ForkController ledger(ledger_cfg);

        std::cout << "Starting ledger fork of " << args.fork_url << " ..." << std::endl;
        const auto handle = ledger.start(args.fork_url);
        std::cout << "  endpoint " << handle.endpoint << ", chain " << handle.chain_id << ", block "
                  << handle.block_number << std::endl;

        const auto native = quest::bench::parse_units(args.fund, 18);
        if (!native) {
            throw std::runtime_error("--fund: not an amount: " + args.fund);
        }
        auto grants = args.grants;
        if (grants.empty() && handle.chain_id == kBscMainnet) {
            grants = bsc_default_grants();
        }
        ledger.fund_account(args.identity, *native, grants);

        // Preset contracts are known before deployment; explicit --fixture entries win
        auto presets = handle.chain_id == kBscMainnet ? bsc_known_contracts() : quest::bench::FixtureRegistry{};
        for (const auto& [name, address] : args.fixtures) presets[name] = address;
        ledger.add_preset_fixtures(presets);
        const auto& fixtures = ledger.deploy_fixtures();
        std::cout << "  fixtures: " << fixtures.size() << std::endl;

        TransactionExecutor transactions(
            ledger, TransactionExecutor::Config{.submit_timeout = std::chrono::milliseconds{args.submit_timeout_ms}});
        AttemptRunner runner(AttemptRunner::Config{.code_timeout = std::chrono::milliseconds{args.timeout_ms}},
                             ledger, bridge, transactions);
        Engine engine(Engine::Config{.artifact_root = args.artifact_root, .seed = args.seed, .only = args.only},
                      runner, registry);

        DirectoryCandidates candidates(args.solutions);
        const auto outcomes = engine.run(catalogue, candidates);
        ledger.stop();

        // Emit artifacts
        ResultWriter writer;
        writer.write_summary(args.summary_path, outcomes);
        if (args.emit_html) {
            writer.write_detailed(args.html_path, outcomes);
        }

        // Console summary
        std::size_t pass_cnt = 0, fail_cnt = 0, err_cnt = 0;
        double score = 0.0, max_score = 0.0;
        for (const auto& o : outcomes) {
            if (o.status == "PASS") ++pass_cnt;
            else if (o.status == "FAIL") ++fail_cnt;
            else ++err_cnt;
            score += o.score;
            max_score += o.max_score;
        }

        std::cout << "quest-bench\n"
                  << "  Problems: " << outcomes.size() << "\n"
                  << "  PASS: " << pass_cnt << "  FAIL: " << fail_cnt << "  ERROR: " << err_cnt << "\n"
                  << "  Points: " << score << " / " << max_score << "\n"
                  << "Artifacts:\n"
                  << "  JSON: " << args.summary_path << "\n";
        if (args.emit_html) {
            std::cout << "  HTML: " << args.html_path << "\n";
        }

        return aggregate_exit_code(outcomes);
    } catch (const EnvironmentError& ex) {
        std::cerr << "ENVIRONMENT ERROR: " << ex.what() << "\n";
        return 2;
    } catch (const std::exception& ex) {
        std::cerr << "ERROR: " << ex.what() << "\n";
        print_usage(argv[0]);
        return 2; // configuration issue
    } catch (...) {
        std::cerr << "ERROR: Unknown exception\n";
        return 3; // internal error
    }
}
