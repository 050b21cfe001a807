#include "quest_bench/fork_controller.hpp"
#include "quest_bench/eth.hpp"

#include <algorithm>
#include <cerrno>
#include <cstring>
#include <filesystem>
#include <fstream>
#include <stdexcept>
#include <thread>
#include <utility>

#include <arpa/inet.h>
#include <netinet/in.h>
#include <sys/socket.h>
#include <sys/wait.h>
#include <unistd.h>

namespace fs = std::filesystem;
using nlohmann::json;

namespace quest::bench::ledger {

namespace {

// Gas handed to fixture deployments unless the artifact names its own.
constexpr std::uint64_t kDeployGas = 5'000'000;

std::string describe_exit(const ChildProcess& process) {
    const auto status = process.exit_status();
    if (!status) return "still running";
    if (WIFEXITED(*status)) return "exit code " + std::to_string(WEXITSTATUS(*status));
    if (WIFSIGNALED(*status)) return "signal " + std::to_string(WTERMSIG(*status));
    return "status " + std::to_string(*status);
}

std::string artifact_bytecode(const json& artifact) {
    const auto it = artifact.find("bytecode");
    if (it == artifact.end()) return {};
    if (it->is_string()) return it->get<std::string>();
    if (it->is_object()) return it->value("object", std::string{});
    return {};
}

}  // namespace

unsigned short find_free_port(const std::string& host) {
    const int fd = ::socket(AF_INET, SOCK_STREAM, 0);
    if (fd < 0) {
        throw EnvironmentError(std::string("socket() failed: ") + std::strerror(errno));
    }

    sockaddr_in addr{};
    addr.sin_family = AF_INET;
    addr.sin_port = 0;
    if (::inet_pton(AF_INET, host.c_str(), &addr.sin_addr) != 1) {
        ::close(fd);
        throw EnvironmentError("Not an IPv4 host: " + host);
    }
    if (::bind(fd, reinterpret_cast<sockaddr*>(&addr), sizeof(addr)) != 0) {
        const int err = errno;
        ::close(fd);
        throw EnvironmentError("bind() on " + host + " failed: " + std::strerror(err));
    }
    socklen_t len = sizeof(addr);
    if (::getsockname(fd, reinterpret_cast<sockaddr*>(&addr), &len) != 0) {
        const int err = errno;
        ::close(fd);
        throw EnvironmentError(std::string("getsockname() failed: ") + std::strerror(err));
    }
    ::close(fd);
    return ntohs(addr.sin_port);
}

std::string mapping_slot(RpcTransport& rpc, const Address& holder, std::uint64_t slot) {
    const std::string preimage = "0x" + abi_word(holder) + abi_word(Wei{slot});
    const auto key = rpc.call("web3_sha3", json::array({preimage}));
    if (!key.is_string() || strip_hex_prefix(key.get<std::string>()).size() != 64) {
        throw TransportError("web3_sha3 returned " + key.dump());
    }
    return key.get<std::string>();
}

ForkController::ForkController(Config cfg) : cfg_(std::move(cfg)) {}

ForkController::ForkController(Config cfg, std::shared_ptr<RpcTransport> transport)
    : cfg_(std::move(cfg)), owned_(false), transport_(std::move(transport)) {
    if (!transport_) {
        throw std::invalid_argument("ForkController: attached mode needs a transport");
    }
}

ForkController::~ForkController() { stop(); }

RpcTransport& ForkController::rpc() {
    if (!transport_) {
        throw EnvironmentError("Ledger simulator is not running");
    }
    return *transport_;
}

std::string ForkController::endpoint() const { return transport_ ? transport_->endpoint() : std::string{}; }

void ForkController::launch() {
    bound_port_ = cfg_.port != 0 ? cfg_.port : find_free_port(cfg_.host);

    ProcessSpec spec;
    spec.executable = cfg_.anvil_exe;
    spec.args = {"--fork-url", fork_url_, "--port", std::to_string(bound_port_), "--host", cfg_.host,
                 "--timeout", "60000", "--retries", "3"};
    if (cfg_.chain_id) {
        spec.args.push_back("--chain-id");
        spec.args.push_back(std::to_string(*cfg_.chain_id));
    }

    try {
        process_ = ChildProcess::spawn(spec);
    } catch (const std::runtime_error& e) {
        throw EnvironmentError("Failed to launch " + cfg_.anvil_exe + ": " + e.what());
    }

    CurlTransport::Config tc;
    tc.endpoint = "http://" + cfg_.host + ":" + std::to_string(bound_port_);
    tc.timeout = cfg_.rpc_timeout;
    transport_ = std::make_shared<CurlTransport>(std::move(tc));
}

void ForkController::fail_start(const std::string& reason) {
    std::string message = "Ledger simulator did not start: " + reason;
    if (process_) {
        const auto tail = process_->stderr_tail();
        message += "\n  fork url: " + fork_url_;
        message += "\n  port: " + std::to_string(bound_port_);
        message += tail.empty() ? "\n  (no stderr output)" : "\n  stderr tail:\n" + tail;
    }
    stop();
    throw EnvironmentError(message);
}

ForkController::Handle ForkController::wait_ready() {
    const auto started = std::chrono::steady_clock::now();
    const auto deadline = started + cfg_.deploy_timeout;
    auto interval = cfg_.initial_poll_interval;
    std::string last_error = "no poll attempted";

    for (unsigned poll = 0; poll < cfg_.max_polls; ++poll) {
        if (process_ && !process_->running()) {
            fail_start("process exited (" + describe_exit(*process_) + ")");
        }
        try {
            Handle handle;
            handle.endpoint = transport_->endpoint();
            handle.chain_id = eth::to_u64(transport_->call("eth_chainId", json::array()));
            handle.block_number = eth::to_u64(transport_->call("eth_blockNumber", json::array()));
            handle.pid = process_ ? process_->pid() : -1;
            return handle;
        } catch (const TransportError& e) {
            last_error = e.what();
        } catch (const RpcError& e) {
            last_error = e.what();
        }

        const auto now = std::chrono::steady_clock::now();
        if (now >= deadline) break;
        const auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(deadline - now);
        std::this_thread::sleep_for(std::min(interval, remaining));
        interval = std::min(interval * 2, cfg_.max_poll_interval);
    }

    const auto waited =
        std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::steady_clock::now() - started);
    fail_start("RPC not responsive after " + std::to_string(waited.count()) + "ms (last error: " + last_error + ")");
}

void ForkController::impersonate(const Address& account) {
    if (account.empty()) return;
    try {
        (void)rpc().call("anvil_impersonateAccount", json::array({account.hex}));
    } catch (const RpcError& e) {
        throw EnvironmentError("anvil_impersonateAccount(" + account.hex + ") failed: " + e.what());
    } catch (const TransportError& e) {
        throw EnvironmentError("anvil_impersonateAccount(" + account.hex + ") failed: " + e.what());
    }
}

ForkController::Handle ForkController::start(const std::string& fork_url) {
    fork_url_ = fork_url;
    if (owned_) {
        if (fork_url_.empty()) {
            throw EnvironmentError("No fork URL configured");
        }
        stop();
        launch();
    }
    Handle handle = wait_ready();
    impersonate(cfg_.identity);
    return handle;
}

void ForkController::stop() {
    if (process_) {
        process_->terminate();
        process_.reset();
    }
    if (owned_) {
        transport_.reset();
    }
}

void ForkController::apply_funding(const Funding& funding) {
    auto& node = rpc();
    (void)node.call("anvil_setBalance", json::array({funding.account.hex, to_quantity(funding.native)}));

    for (const auto& grant : funding.grants) {
        const auto key = mapping_slot(node, funding.account, grant.balance_slot);
        (void)node.call("anvil_setStorageAt",
                        json::array({grant.token.hex, key, "0x" + abi_word(grant.amount)}));

        StateTarget balance;
        balance.kind = StateKind::TokenBalance;
        balance.address = grant.token;
        balance.holder = funding.account;
        const auto read = eth::read_call(balance);
        const Wei actual = eth::decode_read(balance, node.call(read.method, read.params));
        if (actual != grant.amount) {
            throw EnvironmentError("Token " + grant.token.hex + ": balance slot " +
                                   std::to_string(grant.balance_slot) + " did not take effect (balanceOf returned " +
                                   to_decimal(actual) + ", expected " + to_decimal(grant.amount) + ")");
        }
    }
}

void ForkController::fund_account(const Address& account, const Wei& native, const std::vector<TokenGrant>& grants) {
    Funding funding{account, native, grants};
    try {
        apply_funding(funding);
    } catch (const RpcError& e) {
        throw EnvironmentError("Funding " + account.hex + " failed: " + e.what());
    } catch (const TransportError& e) {
        throw EnvironmentError("Funding " + account.hex + " failed: " + e.what());
    }

    const auto it = std::find_if(fundings_.begin(), fundings_.end(),
                                 [&](const Funding& f) { return f.account == account; });
    if (it != fundings_.end()) {
        *it = std::move(funding);
    } else {
        fundings_.push_back(std::move(funding));
    }
}

std::optional<json> ForkController::wait_for_receipt(const std::string& tx_hash,
                                                     std::chrono::milliseconds timeout,
                                                     std::chrono::milliseconds interval) {
    const auto deadline = std::chrono::steady_clock::now() + timeout;
    while (true) {
        auto receipt = rpc().call("eth_getTransactionReceipt", json::array({tx_hash}));
        if (!receipt.is_null()) return receipt;
        const auto now = std::chrono::steady_clock::now();
        if (now >= deadline) return std::nullopt;
        const auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(deadline - now);
        std::this_thread::sleep_for(std::min(interval, remaining));
    }
}

FixtureRegistry ForkController::deploy_artifacts() {
    FixtureRegistry deployed;
    if (cfg_.fixture_dir.empty()) return deployed;

    std::error_code ec;
    if (!fs::is_directory(cfg_.fixture_dir, ec)) {
        throw EnvironmentError("Fixture directory not found: " + cfg_.fixture_dir.string());
    }
    if (cfg_.identity.empty()) {
        throw EnvironmentError("Fixture deployment needs an identity to deploy from");
    }

    std::vector<fs::path> artifacts;
    for (const auto& entry : fs::directory_iterator(cfg_.fixture_dir)) {
        if (entry.is_regular_file() && entry.path().extension() == ".json") {
            artifacts.push_back(entry.path());
        }
    }
    std::sort(artifacts.begin(), artifacts.end());

    for (const auto& path : artifacts) {
        std::ifstream in(path);
        if (!in) {
            throw EnvironmentError("Unable to open fixture artifact: " + path.string());
        }
        const json artifact = json::parse(in, nullptr, false);
        if (artifact.is_discarded() || !artifact.is_object()) {
            throw EnvironmentError("Fixture artifact is not a JSON object: " + path.string());
        }

        const std::string name = artifact.value("name", path.stem().string());
        std::string code = "0x" + strip_hex_prefix(artifact_bytecode(artifact));
        if (const auto args = artifact.find("constructor_args"); args != artifact.end() && args->is_string()) {
            code += strip_hex_prefix(args->get<std::string>());
        }
        if (code.size() <= 2 || !is_hex_data(code)) {
            throw EnvironmentError("Fixture " + name + ": missing or malformed bytecode in " + path.string());
        }

        const std::uint64_t gas = artifact.value("gas", kDeployGas);
        const json tx = {{"from", cfg_.identity.hex}, {"data", code}, {"gas", to_quantity(gas)}};

        try {
            const auto hash = rpc().call("eth_sendTransaction", json::array({tx}));
            if (!hash.is_string()) {
                throw EnvironmentError("Fixture " + name + ": eth_sendTransaction returned " + hash.dump());
            }
            const auto receipt = wait_for_receipt(hash.get<std::string>(), cfg_.receipt_timeout,
                                                  cfg_.initial_poll_interval);
            if (!receipt) {
                throw EnvironmentError("Fixture " + name + ": deployment not mined within " +
                                       std::to_string(cfg_.receipt_timeout.count()) + "ms");
            }
            const auto info = eth::decode_receipt(*receipt, gas);
            if (!info.success || !info.contract_address) {
                throw EnvironmentError("Fixture " + name + ": deployment reverted");
            }
            deployed[name] = *info.contract_address;
        } catch (const RpcError& e) {
            throw EnvironmentError("Fixture " + name + ": " + e.what());
        } catch (const TransportError& e) {
            throw EnvironmentError("Fixture " + name + ": " + e.what());
        }
    }
    return deployed;
}

const FixtureRegistry& ForkController::deploy_fixtures() {
    if (fixtures_deployed_) return fixtures_;

    FixtureRegistry merged = cfg_.preset_fixtures;
    for (auto& [name, address] : deploy_artifacts()) {
        merged[name] = address;
    }
    fixtures_ = std::move(merged);
    fixtures_deployed_ = true;
    return fixtures_;
}

void ForkController::add_preset_fixtures(const FixtureRegistry& presets) {
    if (fixtures_deployed_) {
        throw std::logic_error("Preset fixtures must be registered before deploy_fixtures()");
    }
    for (const auto& [name, address] : presets) {
        cfg_.preset_fixtures[name] = address;
    }
}

std::string ForkController::snapshot() {
    if (process_ && !process_->running()) {
        throw EnvironmentError("Ledger simulator exited (" + describe_exit(*process_) + ")\n  stderr tail:\n" +
                               process_->stderr_tail());
    }
    try {
        const auto id = rpc().call("evm_snapshot", json::array());
        if (!id.is_string()) {
            throw EnvironmentError("evm_snapshot returned " + id.dump());
        }
        return id.get<std::string>();
    } catch (const RpcError& e) {
        throw EnvironmentError(std::string("evm_snapshot failed: ") + e.what());
    } catch (const TransportError& e) {
        throw EnvironmentError(std::string("evm_snapshot failed: ") + e.what());
    }
}

void ForkController::revert(const std::string& snapshot_id) {
    std::string why;
    try {
        const auto reverted = rpc().call("evm_revert", json::array({snapshot_id}));
        if (reverted.is_boolean() && reverted.get<bool>()) return;
        why = "evm_revert returned " + reverted.dump();
    } catch (const RpcError& e) {
        why = e.what();
    } catch (const TransportError& e) {
        why = e.what();
    }

    const std::string head = "Revert to snapshot " + snapshot_id + " failed (" + why + ")";
    try {
        restart();
    } catch (const EnvironmentError& e) {
        throw EnvironmentError(head + "; restart failed: " + e.what());
    }
    throw EnvironmentError(head + "; the simulator was restarted");
}

void ForkController::restart() {
    try {
        if (owned_) {
            stop();
            launch();
            (void)wait_ready();
        } else {
            json params = json::array();
            if (!fork_url_.empty()) {
                params.push_back({{"forking", {{"jsonRpcUrl", fork_url_}}}});
            }
            (void)rpc().call("anvil_reset", params);
        }

        impersonate(cfg_.identity);
        for (const auto& funding : fundings_) {
            apply_funding(funding);
        }
        if (fixtures_deployed_) {
            FixtureRegistry redeployed = cfg_.preset_fixtures;
            for (auto& [name, address] : deploy_artifacts()) {
                redeployed[name] = address;
            }
            if (redeployed != fixtures_) {
                throw EnvironmentError("Fixture addresses changed across restart");
            }
        }
    } catch (const RpcError& e) {
        throw EnvironmentError(std::string("Restart failed: ") + e.what());
    } catch (const TransportError& e) {
        throw EnvironmentError(std::string("Restart failed: ") + e.what());
    }
}

StateSnapshot ForkController::read_state(const std::vector<StateTarget>& targets) {
    std::vector<RpcCall> calls;
    calls.reserve(targets.size() + 1);
    calls.push_back({"eth_blockNumber", json::array()});
    for (const auto& target : targets) {
        calls.push_back(eth::read_call(target));
    }

    StateSnapshot snap;
    try {
        const auto replies = rpc().batch(calls);
        snap.block_number = eth::to_u64(replies.at(0));
        for (std::size_t i = 0; i < targets.size(); ++i) {
            snap.values[targets[i]] = eth::decode_read(targets[i], replies.at(i + 1));
        }
    } catch (const RpcError& e) {
        throw EnvironmentError(std::string("State read failed: ") + e.what());
    } catch (const TransportError& e) {
        throw EnvironmentError(std::string("State read failed: ") + e.what());
    }
    return snap;
}

}  // namespace quest::bench::ledger
