// Crossfeed - JSON-RPC Transport
// Ethereum JSON-RPC over HTTP (cpr) and ABI word decoding

#pragma once

#include <crossfeed/types.hpp>
#include <nlohmann/json.hpp>
#include <string>
#include <string_view>
#include <vector>

namespace crossfeed {

struct RpcRequest {
    std::string method;
    nlohmann::json params;
};

// Stateless JSON-RPC 2.0 client for one endpoint.
// Safe for concurrent use: each call opens its own request.
class RpcClient {
public:
    RpcClient(std::string url, int timeout_ms);

    /// Single call, returns the "result" member.
    /// Throws SourceUnavailableError on transport, HTTP, JSON or RPC errors.
    nlohmann::json call(const std::string& method, const nlohmann::json& params) const;

    /// Batch call, results in request order
    std::vector<nlohmann::json> batch(const std::vector<RpcRequest>& requests) const;

    /// Current gas price in wei
    I128 gas_price() const;

    [[nodiscard]] const std::string& url() const noexcept { return url_; }
    [[nodiscard]] int timeout_ms() const noexcept { return timeout_ms_; }

private:
    nlohmann::json post(const nlohmann::json& body) const;

    std::string url_;
    int timeout_ms_;
};

namespace abi {

inline constexpr const char* LATEST_ROUND_DATA = "0xfeaf968c";  // latestRoundData()
inline constexpr const char* DECIMALS = "0x313ce567";           // decimals()

/// Split "0x"-prefixed return data into 32-byte words (64 hex chars each).
/// Throws SourceUnavailableError on malformed data.
std::vector<std::string> split_words(std::string_view data);

/// Two's complement int256 word. Throws when it does not fit 128 bits.
I128 decode_int(std::string_view word);

/// uint256 word. Throws when it does not fit 64 bits.
uint64_t decode_uint(std::string_view word);

/// "0x"-prefixed JSON-RPC quantity. Throws when it does not fit 127 bits.
I128 decode_quantity(std::string_view quantity);

}  // namespace abi

}  // namespace crossfeed
