#pragma once

#include "quest_bench/execution_result.hpp"
#include "quest_bench/primitives.hpp"
#include "quest_bench/process.hpp"
#include "quest_bench/state.hpp"
#include "rpc_client.hpp"

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include <sys/types.h>

namespace quest::bench::ledger {

/// ERC-20 balance written straight into the token's storage.
struct TokenGrant {
    Address token;
    Wei amount{0};
    std::uint64_t balance_slot{0};  ///< index of the `balances` mapping in the token's layout
};

/**
 * \brief Lifecycle of the local forked ledger.
 *
 * Owned mode launches `anvil --fork-url ...` on a free local port and talks to it
 * over libcurl. Attached mode wraps an existing transport and never spawns
 * anything; restart() then falls back to `anvil_reset`.
 *
 * The identity is impersonated on the simulator, so intents are submitted with
 * eth_sendTransaction and signed by the node. Everything that leaves the ledger
 * unusable is reported as EnvironmentError.
 *
 * Not thread-safe: one attempt at a time per controller.
 */
class ForkController {
public:
    struct Config {
        std::string anvil_exe{"anvil"};
        std::optional<std::uint64_t> chain_id;
        std::string host{"127.0.0.1"};
        // 0 picks a free port.
        unsigned short port{0};

        std::chrono::milliseconds deploy_timeout{30000};
        std::chrono::milliseconds initial_poll_interval{250};
        std::chrono::milliseconds max_poll_interval{2000};
        unsigned max_polls{40};
        std::chrono::milliseconds rpc_timeout{60000};
        std::chrono::milliseconds receipt_timeout{30000};

        Address identity;

        // `<name>.json` contract artifacts deployed by deploy_fixtures().
        std::filesystem::path fixture_dir;
        // Contracts that already exist on the forked network.
        FixtureRegistry preset_fixtures;
    };

    struct Handle {
        std::string endpoint;
        std::uint64_t chain_id{0};
        std::uint64_t block_number{0};
        pid_t pid{-1};  ///< -1 in attached mode
    };

    /// Owned mode; nothing runs until start().
    explicit ForkController(Config cfg);

    /// Attached mode over \a transport.
    ForkController(Config cfg, std::shared_ptr<RpcTransport> transport);

    ~ForkController();
    ForkController(const ForkController&) = delete;
    ForkController& operator=(const ForkController&) = delete;

    /**
     * Launches the simulator forked from \a fork_url and waits until it answers.
     * Polls with exponential backoff; throws EnvironmentError with the simulator's
     * stderr tail when it exits early or misses deploy_timeout.
     */
    Handle start(const std::string& fork_url);

    /// Terminates an owned simulator. Idempotent.
    void stop();

    /**
     * Sets the native balance and token balances of \a account through privileged
     * simulator calls. Token grants are read back with balanceOf and must match.
     * Remembered so restart() can replay them.
     */
    void fund_account(const Address& account, const Wei& native, const std::vector<TokenGrant>& grants = {});

    /**
     * Deploys every artifact in fixture_dir once and merges preset_fixtures.
     * Later calls return the registry built by the first one.
     */
    const FixtureRegistry& deploy_fixtures();

    /// Registers contracts that already exist on the fork. Throws std::logic_error after deploy_fixtures().
    void add_preset_fixtures(const FixtureRegistry& presets);

    [[nodiscard]] std::string snapshot();

    /**
     * Restores the state captured by snapshot(). An unknown or failed revert
     * restarts the simulator and then throws EnvironmentError.
     */
    void revert(const std::string& snapshot_id);

    /// One batched read of \a targets plus the current block number. Never writes.
    [[nodiscard]] StateSnapshot read_state(const std::vector<StateTarget>& targets);

    /// Fresh simulator with funding and fixtures replayed.
    void restart();

    [[nodiscard]] RpcTransport& rpc();
    [[nodiscard]] const FixtureRegistry& fixtures() const noexcept { return fixtures_; }
    [[nodiscard]] bool fixtures_deployed() const noexcept { return fixtures_deployed_; }
    [[nodiscard]] std::string endpoint() const;
    [[nodiscard]] const Config& config() const noexcept { return cfg_; }
    [[nodiscard]] const Address& identity() const noexcept { return cfg_.identity; }

    /// Polls eth_getTransactionReceipt until it appears or \a timeout passes.
    [[nodiscard]] std::optional<nlohmann::json> wait_for_receipt(const std::string& tx_hash,
                                                                 std::chrono::milliseconds timeout,
                                                                 std::chrono::milliseconds interval);

private:
    struct Funding {
        Address account;
        Wei native{0};
        std::vector<TokenGrant> grants;
    };

    void launch();
    Handle wait_ready();
    void impersonate(const Address& account);
    void apply_funding(const Funding& funding);
    FixtureRegistry deploy_artifacts();
    [[noreturn]] void fail_start(const std::string& reason);

    Config cfg_;
    std::string fork_url_;
    bool owned_{true};
    unsigned short bound_port_{0};
    std::unique_ptr<ChildProcess> process_;
    std::shared_ptr<RpcTransport> transport_;
    std::vector<Funding> fundings_;
    FixtureRegistry fixtures_;
    bool fixtures_deployed_{false};
};

/// Asks the kernel for an unused TCP port on \a host. Throws EnvironmentError.
[[nodiscard]] unsigned short find_free_port(const std::string& host);

/// Storage key of `mapping(address => uint256)` entry \a holder at \a slot, hashed by the node.
[[nodiscard]] std::string mapping_slot(RpcTransport& rpc, const Address& holder, std::uint64_t slot);

}  // namespace quest::bench::ledger
