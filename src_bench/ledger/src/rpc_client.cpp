#include "quest_bench/rpc_client.hpp"

#include <map>
#include <mutex>
#include <string>
#include <utility>

#include <curl/curl.h>

namespace quest::bench::ledger {

namespace {

std::once_flag g_curl_init;

std::size_t append_body(char* data, std::size_t size, std::size_t count, void* user) {
    auto* sink = static_cast<std::string*>(user);
    sink->append(data, size * count);
    return size * count;
}

CURL* as_curl(void* handle) { return static_cast<CURL*>(handle); }

}  // namespace

std::vector<nlohmann::json> RpcTransport::batch(const std::vector<RpcCall>& calls) {
    std::vector<nlohmann::json> results;
    results.reserve(calls.size());
    for (const auto& c : calls) {
        results.push_back(call(c.method, c.params));
    }
    return results;
}

nlohmann::json unwrap_response(const nlohmann::json& response) {
    if (!response.is_object()) {
        throw TransportError("Malformed JSON-RPC response: " + response.dump());
    }
    if (const auto err = response.find("error"); err != response.end() && !err->is_null()) {
        const int code = err->value("code", 0);
        const auto message = err->value("message", std::string{"unknown error"});
        throw RpcError(code, message, err->value("data", nlohmann::json{}));
    }
    const auto result = response.find("result");
    if (result == response.end()) {
        throw TransportError("JSON-RPC response carries neither result nor error");
    }
    return *result;
}

CurlTransport::CurlTransport(Config cfg) : cfg_(std::move(cfg)) {
    std::call_once(g_curl_init, [] { curl_global_init(CURL_GLOBAL_DEFAULT); });
    handle_ = curl_easy_init();
    if (handle_ == nullptr) {
        throw TransportError("curl_easy_init failed");
    }
}

CurlTransport::~CurlTransport() {
    if (handle_ != nullptr) curl_easy_cleanup(as_curl(handle_));
}

nlohmann::json CurlTransport::post(const nlohmann::json& body) {
    CURL* curl = as_curl(handle_);
    curl_easy_reset(curl);

    const std::string payload = body.dump();
    std::string response;
    char error_buffer[CURL_ERROR_SIZE] = {0};

    curl_slist* headers = nullptr;
    headers = curl_slist_append(headers, "Content-Type: application/json");

    curl_easy_setopt(curl, CURLOPT_URL, cfg_.endpoint.c_str());
    curl_easy_setopt(curl, CURLOPT_HTTPHEADER, headers);
    curl_easy_setopt(curl, CURLOPT_POSTFIELDS, payload.c_str());
    curl_easy_setopt(curl, CURLOPT_POSTFIELDSIZE, static_cast<long>(payload.size()));
    curl_easy_setopt(curl, CURLOPT_WRITEFUNCTION, append_body);
    curl_easy_setopt(curl, CURLOPT_WRITEDATA, &response);
    curl_easy_setopt(curl, CURLOPT_ERRORBUFFER, error_buffer);
    curl_easy_setopt(curl, CURLOPT_TIMEOUT_MS, static_cast<long>(cfg_.timeout.count()));
    curl_easy_setopt(curl, CURLOPT_CONNECTTIMEOUT_MS, static_cast<long>(cfg_.connect_timeout.count()));
    curl_easy_setopt(curl, CURLOPT_NOPROXY, "*");
    curl_easy_setopt(curl, CURLOPT_NOSIGNAL, 1L);

    const CURLcode rc = curl_easy_perform(curl);
    long status = 0;
    curl_easy_getinfo(curl, CURLINFO_RESPONSE_CODE, &status);
    curl_slist_free_all(headers);

    if (rc != CURLE_OK) {
        const std::string detail = error_buffer[0] != '\0' ? error_buffer : curl_easy_strerror(rc);
        throw TransportError(cfg_.endpoint + ": " + detail);
    }
    if (status < 200 || status >= 300) {
        throw TransportError(cfg_.endpoint + ": HTTP " + std::to_string(status) + " " + response.substr(0, 200));
    }

    auto parsed = nlohmann::json::parse(response, nullptr, false);
    if (parsed.is_discarded()) {
        throw TransportError(cfg_.endpoint + ": response is not JSON: " + response.substr(0, 200));
    }
    return parsed;
}

nlohmann::json CurlTransport::call(const std::string& method, const nlohmann::json& params) {
    const nlohmann::json body = {{"jsonrpc", "2.0"}, {"id", next_id_++}, {"method", method}, {"params", params}};
    return unwrap_response(post(body));
}

std::vector<nlohmann::json> CurlTransport::batch(const std::vector<RpcCall>& calls) {
    if (calls.empty()) return {};

    nlohmann::json body = nlohmann::json::array();
    const auto first_id = next_id_;
    for (const auto& c : calls) {
        body.push_back({{"jsonrpc", "2.0"}, {"id", next_id_++}, {"method", c.method}, {"params", c.params}});
    }

    const auto response = post(body);
    if (!response.is_array()) {
        // Some nodes answer a batch with a single error object.
        (void)unwrap_response(response);
        throw TransportError("Batch response is not an array");
    }

    std::map<unsigned long long, const nlohmann::json*> by_id;
    for (const auto& item : response) {
        if (item.is_object() && item.contains("id") && item["id"].is_number_unsigned()) {
            by_id[item["id"].get<unsigned long long>()] = &item;
        }
    }

    std::vector<nlohmann::json> results;
    results.reserve(calls.size());
    for (std::size_t i = 0; i < calls.size(); ++i) {
        const auto it = by_id.find(first_id + i);
        if (it == by_id.end()) {
            throw TransportError("Batch response is missing the reply to " + calls[i].method);
        }
        results.push_back(unwrap_response(*it->second));
    }
    return results;
}

}  // namespace quest::bench::ledger
