// Crossfeed - Configuration Implementation

#include <crossfeed/config.hpp>
#include <crossfeed/errors.hpp>
#include <algorithm>
#include <fstream>
#include <sstream>

namespace crossfeed {

// Simple TOML parser (handles basic cases)
namespace {

std::string trim(const std::string& s) {
    size_t start = s.find_first_not_of(" \t\r\n");
    if (start == std::string::npos) return "";
    size_t end = s.find_last_not_of(" \t\r\n");
    return s.substr(start, end - start + 1);
}

std::string unquote(const std::string& s) {
    if (s.size() >= 2 && s[0] == '"' && s.back() == '"') {
        return s.substr(1, s.size() - 2);
    }
    return s;
}

// Drop a trailing "# comment" that is not inside a quoted string
std::string strip_comment(const std::string& s) {
    bool quoted = false;
    for (size_t i = 0; i < s.size(); ++i) {
        if (s[i] == '"') quoted = !quoted;
        if (s[i] == '#' && !quoted) return s.substr(0, i);
    }
    return s;
}

std::vector<std::string> parse_list(const std::string& value) {
    std::vector<std::string> items;
    if (value.size() < 2 || value.front() != '[' || value.back() != ']') {
        items.push_back(unquote(value));
        return items;
    }

    std::istringstream stream{value.substr(1, value.size() - 2)};
    std::string item;
    while (std::getline(stream, item, ',')) {
        item = unquote(trim(item));
        if (!item.empty()) items.push_back(item);
    }
    return items;
}

int64_t parse_int(const std::string& key, const std::string& value) {
    try {
        size_t pos = 0;
        int64_t v = std::stoll(value, &pos);
        if (pos != value.size()) throw std::invalid_argument(value);
        return v;
    } catch (const std::exception&) {
        throw ConfigError("Invalid integer for " + key + ": " + value);
    }
}

Decimal parse_decimal(const std::string& key, const std::string& value) {
    bool valid = !value.empty() &&
        std::all_of(value.begin(), value.end(), [](char c) {
            return (c >= '0' && c <= '9') || c == '.' || c == '-';
        }) &&
        std::count(value.begin(), value.end(), '.') <= 1 &&
        value.find('-', 1) == std::string::npos;
    if (!valid) {
        throw ConfigError("Invalid decimal for " + key + ": " + value);
    }
    return Decimal::from_string(value);
}

MissingCostPolicy parse_policy(const std::string& value) {
    if (value == "zero") return MissingCostPolicy::Zero;
    if (value == "exclude") return MissingCostPolicy::Exclude;
    throw ConfigError("Unknown missing_cost_policy: " + value);
}

CostSource parse_cost_source(const std::string& value) {
    if (value == "static") return CostSource::Static;
    if (value == "gas") return CostSource::Gas;
    throw ConfigError("Unknown cost_source: " + value);
}

}  // namespace

Config Config::from_file(std::string_view path) {
    std::string path_str{path};
    std::ifstream file{path_str};
    if (!file.is_open()) {
        throw ConfigError("Cannot open config file: " + path_str);
    }

    std::stringstream buffer;
    buffer << file.rdbuf();
    return from_toml(buffer.str());
}

Config Config::from_toml(std::string_view content) {
    Config config;
    std::string current_section;
    std::string current_subsection;

    std::string content_str{content};
    std::istringstream stream{content_str};
    std::string line;

    while (std::getline(stream, line)) {
        line = trim(strip_comment(line));

        // Skip empty lines and comments
        if (line.empty()) continue;

        // Section header
        if (line[0] == '[') {
            size_t end = line.find(']');
            if (end == std::string::npos) {
                throw ConfigError("Unterminated section header: " + line);
            }
            std::string section = line.substr(1, end - 1);

            // Check for subsection [section.name]
            auto dot = section.find('.');
            if (dot != std::string::npos) {
                current_section = section.substr(0, dot);
                current_subsection = section.substr(dot + 1);
            } else {
                current_section = section;
                current_subsection.clear();
            }
            continue;
        }

        // Key-value pair
        auto eq = line.find('=');
        if (eq == std::string::npos) {
            throw ConfigError("Expected key = value: " + line);
        }

        std::string key = trim(line.substr(0, eq));
        std::string raw = trim(line.substr(eq + 1));
        std::string value = unquote(raw);

        // Parse based on section
        if (current_section == "general") {
            if (key == "log_level") config.general.log_level = value;
            else if (key == "timeout_ms") config.general.timeout_ms = static_cast<int>(parse_int(key, value));
            else if (key == "retries") config.general.retries = static_cast<int>(parse_int(key, value));
        }
        else if (current_section == "monitor") {
            if (key == "assets") config.monitor.assets = parse_list(raw);
            else if (key == "threshold_percent") config.monitor.threshold_percent = parse_decimal(key, value);
            else if (key == "interval_ms") config.monitor.interval_ms = parse_int(key, value);
            else if (key == "max_staleness_ms") config.monitor.max_staleness_ms = parse_int(key, value);
            else if (key == "missing_cost_policy") config.monitor.missing_cost_policy = parse_policy(value);
            else if (key == "cost_source") config.monitor.cost_source = parse_cost_source(value);
        }
        else if (current_section == "networks" && !current_subsection.empty()) {
            auto& net = config.networks[current_subsection];
            if (key == "name") net.name = value;
            else if (key == "rpc_url") net.rpc_url = value;
            else if (key == "api_key") net.api_key = value;
            else if (key == "chain_id") net.chain_id = parse_int(key, value);
            else if (key == "gas_limit") net.gas_limit = static_cast<uint64_t>(parse_int(key, value));
            else if (key == "native_price") net.native_price = parse_decimal(key, value);
        }
        else if (current_section == "feeds" && !current_subsection.empty()) {
            config.networks[current_subsection].feeds[key] = value;
        }
        else if (current_section == "costs") {
            config.costs[key] = parse_decimal(key, value);
        }
    }

    return config;
}

Config Config::defaults() {
    Config config;

    config.with_network("mainnet",
        NetworkConfig::create("Ethereum Mainnet", "https://eth-mainnet.alchemyapi.io/v2/", 1)
            .with_feed("ETH_USD", "0x5f4eC3Df9cbd43714FE2740f5E3616155c5b8419")
            .with_feed("BTC_USD", "0xF4030086522a5bEEa4988F8cA5B36dbC97BeE88c")
            .with_feed("LINK_USD", "0x2c1d072e956AFFC0D435Cb7AC38EF18d24d9127c"));

    config.with_network("polygon",
        NetworkConfig::create("Polygon", "https://polygon-rpc.com", 137)
            .with_feed("ETH_USD", "0xF9680D99D6C9589e2a93a78A04A279e509205945")
            .with_feed("BTC_USD", "0xc907E116054Ad103354f2D350FD2514433D57F6f")
            .with_feed("LINK_USD", "0xd9FFdb71EbE7496cC440152d43986Aae0AB76665"));

    config.with_network("optimism",
        NetworkConfig::create("Optimism", "https://mainnet.optimism.io", 10)
            .with_feed("ETH_USD", "0x13e3Ee699D1909E989722E753853AE30b17e08c5")
            .with_feed("BTC_USD", "0xD702DD976Fb76Fffc2D3963D037dfDae5b04E593")
            .with_feed("LINK_USD", "0x6d5689Ad4C1806D1BA095AEc89fE5f5e5EF5b5E1"));

    config.watch("ETH_USD");
    return config;
}

void Config::validate() const {
    if (networks.empty()) {
        throw ConfigError("No networks configured");
    }

    for (const auto& [id, net] : networks) {
        if (net.rpc_url.empty()) {
            throw ConfigError("Network " + id + " has no rpc_url");
        }
    }

    if (general.timeout_ms <= 0) {
        throw ConfigError("timeout_ms must be positive");
    }
    if (general.retries < 0) {
        throw ConfigError("retries must not be negative");
    }
    if (monitor.interval_ms <= 0) {
        throw ConfigError("interval_ms must be positive");
    }
    if (monitor.threshold_percent.is_negative()) {
        throw ConfigError("threshold_percent must not be negative");
    }
    if (monitor.max_staleness_ms < 0) {
        throw ConfigError("max_staleness_ms must not be negative");
    }

    for (const auto& [network, cost] : costs) {
        if (cost.is_negative()) {
            throw ConfigError("Negative cost for " + network);
        }
    }
}

}  // namespace crossfeed
