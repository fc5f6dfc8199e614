// Crossfeed - JSON-RPC Transport Implementation

#include <crossfeed/rpc.hpp>
#include <crossfeed/errors.hpp>
#include <cpr/cpr.h>
#include <nlohmann/json.hpp>

namespace crossfeed {

using json = nlohmann::json;

namespace {

int hex_value(char c) {
    if (c >= '0' && c <= '9') return c - '0';
    if (c >= 'a' && c <= 'f') return c - 'a' + 10;
    if (c >= 'A' && c <= 'F') return c - 'A' + 10;
    return -1;
}

std::string_view strip_prefix(std::string_view data) {
    if (data.size() >= 2 && data[0] == '0' && (data[1] == 'x' || data[1] == 'X')) {
        return data.substr(2);
    }
    return data;
}

// Up to 32 hex digits into an unsigned 128-bit value
unsigned __int128 parse_hex128(std::string_view hex) {
    if (hex.size() > 32) {
        throw SourceUnavailableError("Hex value wider than 128 bits");
    }
    unsigned __int128 value = 0;
    for (char c : hex) {
        int v = hex_value(c);
        if (v < 0) {
            throw SourceUnavailableError("Invalid hex digit in response");
        }
        value = (value << 4) | static_cast<unsigned>(v);
    }
    return value;
}

bool all_of_digit(std::string_view hex, char digit) {
    for (char c : hex) {
        if (c != digit && !(digit == 'f' && c == 'F')) return false;
    }
    return true;
}

void check_rpc_error(const json& reply) {
    if (reply.contains("error") && !reply["error"].is_null()) {
        const auto& err = reply["error"];
        std::string message = err.is_object() ? err.value("message", err.dump()) : err.dump();
        throw SourceUnavailableError("RPC error: " + message);
    }
    if (!reply.contains("result")) {
        throw SourceUnavailableError("RPC reply without result");
    }
}

}  // namespace

RpcClient::RpcClient(std::string url, int timeout_ms)
    : url_(std::move(url)), timeout_ms_(timeout_ms) {}

json RpcClient::post(const json& body) const {
    auto response = cpr::Post(
        cpr::Url{url_},
        cpr::Header{{"Content-Type", "application/json"}},
        cpr::Body{body.dump()},
        cpr::Timeout{timeout_ms_});

    if (response.error) {
        throw SourceUnavailableError(url_ + ": " + response.error.message);
    }

    if (response.status_code != 200) {
        throw SourceUnavailableError("HTTP " + std::to_string(response.status_code) +
                                     ": " + response.text);
    }

    auto reply = json::parse(response.text, nullptr, false);
    if (reply.is_discarded()) {
        throw SourceUnavailableError("Malformed JSON from " + url_);
    }
    return reply;
}

json RpcClient::call(const std::string& method, const json& params) const {
    json body = {
        {"jsonrpc", "2.0"},
        {"id", 1},
        {"method", method},
        {"params", params}
    };

    auto reply = post(body);
    if (!reply.is_object()) {
        throw SourceUnavailableError("Unexpected JSON-RPC reply for " + method);
    }
    check_rpc_error(reply);
    return reply["result"];
}

std::vector<json> RpcClient::batch(const std::vector<RpcRequest>& requests) const {
    json body = json::array();
    for (size_t i = 0; i < requests.size(); ++i) {
        body.push_back({
            {"jsonrpc", "2.0"},
            {"id", i},
            {"method", requests[i].method},
            {"params", requests[i].params}
        });
    }

    auto reply = post(body);
    if (!reply.is_array() || reply.size() != requests.size()) {
        throw SourceUnavailableError("Unexpected batch reply from " + url_);
    }

    // Replies may arrive in any order
    std::vector<json> results(requests.size());
    std::vector<bool> seen(requests.size(), false);
    for (const auto& item : reply) {
        if (!item.is_object() || !item.contains("id") || !item["id"].is_number_unsigned()) {
            throw SourceUnavailableError("Batch reply without id");
        }
        auto id = item["id"].get<size_t>();
        if (id >= requests.size() || seen[id]) {
            throw SourceUnavailableError("Unexpected batch reply id");
        }
        check_rpc_error(item);
        results[id] = item["result"];
        seen[id] = true;
    }
    return results;
}

I128 RpcClient::gas_price() const {
    auto result = call("eth_gasPrice", json::array());
    if (!result.is_string()) {
        throw SourceUnavailableError("eth_gasPrice returned non-string result");
    }
    return abi::decode_quantity(result.get<std::string>());
}

namespace abi {

std::vector<std::string> split_words(std::string_view data) {
    auto hex = strip_prefix(data);
    if (hex.empty() || hex.size() % 64 != 0) {
        throw SourceUnavailableError("Return data is not a whole number of words");
    }

    std::vector<std::string> words;
    words.reserve(hex.size() / 64);
    for (size_t i = 0; i < hex.size(); i += 64) {
        words.emplace_back(hex.substr(i, 64));
    }
    return words;
}

I128 decode_int(std::string_view word) {
    if (word.size() != 64) {
        throw SourceUnavailableError("ABI word must be 64 hex digits");
    }

    auto high = word.substr(0, 32);
    unsigned __int128 low = parse_hex128(word.substr(32));
    bool low_negative = (low >> 127) != 0;

    // Upper half must be pure sign extension of the lower half
    if (all_of_digit(high, '0') && !low_negative) {
        return static_cast<I128>(low);
    }
    if (all_of_digit(high, 'f') && low_negative) {
        return static_cast<I128>(low);
    }
    throw SourceUnavailableError("int256 value does not fit 128 bits");
}

uint64_t decode_uint(std::string_view word) {
    if (word.size() != 64) {
        throw SourceUnavailableError("ABI word must be 64 hex digits");
    }
    if (!all_of_digit(word.substr(0, 48), '0')) {
        throw SourceUnavailableError("uint256 value does not fit 64 bits");
    }
    return static_cast<uint64_t>(parse_hex128(word.substr(48)));
}

I128 decode_quantity(std::string_view quantity) {
    auto hex = strip_prefix(quantity);
    if (hex.empty()) {
        throw SourceUnavailableError("Empty quantity");
    }
    unsigned __int128 value = parse_hex128(hex);
    if ((value >> 127) != 0) {
        throw SourceUnavailableError("Quantity does not fit 127 bits");
    }
    return static_cast<I128>(value);
}

}  // namespace abi

}  // namespace crossfeed
