#pragma once

#include <chrono>
#include <memory>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

#include <nlohmann/json.hpp>

namespace quest::bench::ledger {

/// JSON-RPC error object returned by the node (`{"code":..,"message":..}`).
class RpcError : public std::runtime_error {
public:
    RpcError(int code, const std::string& message, nlohmann::json data = nullptr)
        : std::runtime_error(message), code_(code), data_(std::move(data)) {}

    [[nodiscard]] int code() const noexcept { return code_; }
    [[nodiscard]] const nlohmann::json& data() const noexcept { return data_; }

private:
    int code_;
    nlohmann::json data_;
};

/// The request never produced a JSON-RPC response (connection refused, timeout, bad HTTP status).
class TransportError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

struct RpcCall {
    std::string method;
    nlohmann::json params = nlohmann::json::array();
};

/**
 * \brief Ledger JSON-RPC endpoint.
 *
 * call() returns the `result` member or throws RpcError / TransportError.
 * batch() returns results in call order and throws on the first error entry.
 */
class RpcTransport {
public:
    virtual ~RpcTransport() = default;

    virtual nlohmann::json call(const std::string& method, const nlohmann::json& params) = 0;

    /// Default implementation issues the calls one by one.
    virtual std::vector<nlohmann::json> batch(const std::vector<RpcCall>& calls);

    [[nodiscard]] virtual std::string endpoint() const = 0;
};

/**
 * \brief HTTP transport over libcurl.
 *
 * One easy handle per transport, reused across requests; not thread-safe.
 * Proxies are bypassed: the endpoint is always a local simulator or an explicit URL.
 */
class CurlTransport final : public RpcTransport {
public:
    struct Config {
        std::string endpoint;
        std::chrono::milliseconds timeout{60000};
        std::chrono::milliseconds connect_timeout{5000};
    };

    explicit CurlTransport(Config cfg);
    ~CurlTransport() override;

    CurlTransport(const CurlTransport&) = delete;
    CurlTransport& operator=(const CurlTransport&) = delete;

    nlohmann::json call(const std::string& method, const nlohmann::json& params) override;
    std::vector<nlohmann::json> batch(const std::vector<RpcCall>& calls) override;

    [[nodiscard]] std::string endpoint() const override { return cfg_.endpoint; }

private:
    nlohmann::json post(const nlohmann::json& body);

    Config cfg_;
    void* handle_{nullptr};  ///< CURL*, kept opaque so callers need not include curl.h
    unsigned long long next_id_{1};
};

/// Extracts `result` from one response object, throwing RpcError for an `error` member.
[[nodiscard]] nlohmann::json unwrap_response(const nlohmann::json& response);

}  // namespace quest::bench::ledger
