// cpamm - Configuration Implementation

#include "cpamm/config.hpp"
#include "cpamm/pool.hpp"
#include <nlohmann/json.hpp>
#include <fstream>
#include <limits>
#include <sstream>
#include <stdexcept>

namespace cpamm {

namespace {

using json = nlohmann::json;

Amount amount_from_json(const json& value, const std::string& key) {
    if (value.is_string()) {
        auto parsed = parse_amount(value.get<std::string>());
        if (!parsed) {
            throw std::runtime_error("Invalid amount for '" + key + "': " + value.get<std::string>());
        }
        return *parsed;
    }
    if (value.is_number_unsigned()) {
        return static_cast<Amount>(value.get<uint64_t>());
    }
    throw std::runtime_error("Invalid amount for '" + key + "': expected decimal string");
}

uint32_t fee_part_from_json(const json& value, const std::string& key) {
    if (!value.is_number_unsigned() ||
        value.get<uint64_t>() > std::numeric_limits<uint32_t>::max()) {
        throw std::runtime_error("Invalid amount for '" + key + "': expected unsigned 32-bit integer");
    }
    return static_cast<uint32_t>(value.get<uint64_t>());
}

}  // namespace

PoolConfig PoolConfig::from_file(std::string_view path) {
    std::string path_str{path};
    std::ifstream file{path_str};
    if (!file.is_open()) {
        throw std::runtime_error("Cannot open config file: " + path_str);
    }

    std::stringstream buffer;
    buffer << file.rdbuf();
    return from_json(buffer.str());
}

PoolConfig PoolConfig::from_json(std::string_view content) {
    PoolConfig config;

    try {
        json doc = json::parse(content.begin(), content.end());
        if (!doc.is_object()) {
            throw std::runtime_error("Config root must be a JSON object");
        }

        if (doc.contains("name")) config.name = doc["name"].get<std::string>();
        if (doc.contains("log_level")) config.log_level = doc["log_level"].get<std::string>();
        if (doc.contains("min_bootstrap_base")) {
            config.min_bootstrap_base = amount_from_json(doc["min_bootstrap_base"], "min_bootstrap_base");
        }

        if (doc.contains("fee")) {
            const json& fee = doc["fee"];
            if (!fee.is_object()) {
                throw std::runtime_error("Invalid amount for 'fee': expected object");
            }
            if (fee.contains("numerator")) {
                config.fee.numerator = fee_part_from_json(fee["numerator"], "fee.numerator");
            }
            if (fee.contains("denominator")) {
                config.fee.denominator = fee_part_from_json(fee["denominator"], "fee.denominator");
            }
        }
    } catch (const json::exception& e) {
        throw std::runtime_error(std::string("Invalid config JSON: ") + e.what());
    }

    return config;
}

std::string PoolConfig::to_json() const {
    json doc;
    doc["name"] = name;
    doc["log_level"] = log_level;
    doc["min_bootstrap_base"] = to_string(min_bootstrap_base);
    doc["fee"] = {{"numerator", fee.numerator}, {"denominator", fee.denominator}};
    return doc.dump(2);
}

int32_t PoolConfig::validate() const {
    if (!fee.valid()) return errors::INVALID_FEE;
    return errors::OK;
}

std::string snapshot_to_json(const PoolSnapshot& snapshot) {
    json doc;
    doc["base_reserve"] = to_string(snapshot.base_reserve);
    doc["token_reserve"] = to_string(snapshot.token_reserve);
    doc["total_shares"] = to_string(snapshot.total_shares);
    return doc.dump();
}

}  // namespace cpamm
