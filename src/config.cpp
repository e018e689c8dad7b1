// =============================================================================
// config.cpp - HookConfig JSON loading
// =============================================================================

#include "vox/config.hpp"
#include <nlohmann/json.hpp>
#include <fstream>
#include <sstream>
#include <limits>

namespace vox {

using json = nlohmann::json;

namespace {

[[noreturn]] void bad_field(const std::string& field, const std::string& what) {
    throw std::runtime_error("Invalid field '" + field + "': " + what);
}

U256 read_u256(const json& j, const std::string& field) {
    try {
        if (j.is_string()) return U256::from_string(j.get<std::string>());
        if (j.is_number_unsigned()) return U256(j.get<uint64_t>());
    } catch (const std::exception& e) {
        bad_field(field, e.what());
    }
    bad_field(field, "expected an unsigned integer or numeric string");
}

uint64_t read_u64(const json& j, const std::string& field) {
    if (!j.is_number_unsigned()) {
        bad_field(field, "expected an unsigned integer");
    }
    return j.get<uint64_t>();
}

uint32_t read_u32(const json& j, const std::string& field) {
    uint64_t v = read_u64(j, field);
    if (v > std::numeric_limits<uint32_t>::max()) {
        bad_field(field, "value exceeds 32 bits");
    }
    return static_cast<uint32_t>(v);
}

int32_t read_i32(const json& j, const std::string& field) {
    if (!j.is_number_integer()) {
        bad_field(field, "expected an integer");
    }
    int64_t v = j.get<int64_t>();
    if (v < std::numeric_limits<int32_t>::min() || v > std::numeric_limits<int32_t>::max()) {
        bad_field(field, "value exceeds 32 bits");
    }
    return static_cast<int32_t>(v);
}

Address read_address(const json& j, const std::string& field) {
    if (!j.is_string()) {
        bad_field(field, "expected a 0x-prefixed address");
    }
    try {
        return addresses::from_hex(j.get<std::string>());
    } catch (const std::invalid_argument& e) {
        bad_field(field, e.what());
    }
}

std::string read_file(std::string_view path, const char* what) {
    std::string path_str{path};
    std::ifstream file{path_str};
    if (!file.is_open()) {
        throw std::runtime_error(std::string("Cannot open ") + what + ": " + path_str);
    }

    std::stringstream buffer;
    buffer << file.rdbuf();
    return buffer.str();
}

json parse_document(std::string_view content, const char* what) {
    try {
        return json::parse(std::string(content));
    } catch (const json::parse_error& e) {
        throw std::runtime_error(std::string("Malformed ") + what + ": " + e.what());
    }
}

const json& require(const json& obj, const std::string& key, const std::string& prefix) {
    auto it = obj.find(key);
    if (it == obj.end()) {
        bad_field(prefix + key, "missing");
    }
    return *it;
}

}  // namespace

HookConfig HookConfig::from_file(std::string_view path) {
    return from_json(read_file(path, "config file"));
}

HookConfig HookConfig::from_json(std::string_view content) {
    json root = parse_document(content, "config");
    if (!root.is_object()) {
        throw std::runtime_error("Malformed config: top level must be an object");
    }

    HookConfig config;

    if (root.contains("admin")) config.admin = read_address(root["admin"], "admin");
    if (root.contains("hook_address")) {
        config.hook_address = read_address(root["hook_address"], "hook_address");
    }

    if (root.contains("strike")) {
        const json& s = root["strike"];
        if (!s.is_object()) bad_field("strike", "expected an object");
        if (s.contains("min_multiplier")) {
            config.strike.min_multiplier = read_u32(s["min_multiplier"], "strike.min_multiplier");
        }
        if (s.contains("max_multiplier")) {
            config.strike.max_multiplier = read_u32(s["max_multiplier"], "strike.max_multiplier");
        }
        if (s.contains("threshold")) {
            config.strike.threshold = read_u256(s["threshold"], "strike.threshold").to_u128();
        }
    }

    if (root.contains("factor")) config.factor = read_u256(root["factor"], "factor");
    if (root.contains("total_duration")) {
        config.total_duration = read_u64(root["total_duration"], "total_duration");
    }
    if (root.contains("time_to_expiry")) {
        config.time_to_expiry = read_u64(root["time_to_expiry"], "time_to_expiry");
    }
    if (root.contains("risk_free_rate")) {
        config.risk_free_rate = read_u256(root["risk_free_rate"], "risk_free_rate");
    }

    if (root.contains("pool")) {
        const json& p = root["pool"];
        if (!p.is_object()) bad_field("pool", "expected an object");
        if (p.contains("max_seconds_ago")) {
            config.metadata.max_seconds_ago = read_u32(p["max_seconds_ago"], "pool.max_seconds_ago");
        }
        if (p.contains("base_fee")) {
            config.metadata.base_fee = read_u32(p["base_fee"], "pool.base_fee");
        }
        if (p.contains("tick_spacing")) {
            config.metadata.tick_spacing = read_i32(p["tick_spacing"], "pool.tick_spacing");
        }
    }

    int32_t rc = StrikePricer::validate(config.strike);
    if (rc != errors::OK) {
        throw VoxError(rc, "strike configuration");
    }
    return config;
}

std::string HookConfig::to_json() const {
    json j = {
        {"admin", addresses::to_hex(admin)},
        {"hook_address", addresses::to_hex(hook_address)},
        {"strike", {
            {"min_multiplier", strike.min_multiplier},
            {"max_multiplier", strike.max_multiplier},
            {"threshold", U256(strike.threshold).to_string()},
        }},
        {"factor", factor.to_string()},
        {"total_duration", total_duration},
        {"time_to_expiry", time_to_expiry},
        {"risk_free_rate", risk_free_rate.to_string()},
        {"pool", {
            {"max_seconds_ago", metadata.max_seconds_ago},
            {"base_fee", metadata.base_fee},
            {"tick_spacing", metadata.tick_spacing},
        }},
    };
    return j.dump(2);
}

// =============================================================================
// Observations
// =============================================================================

std::vector<Observation> observations_from_json(std::string_view content) {
    json root = parse_document(content, "observations");
    if (!root.is_array()) {
        throw std::runtime_error("Malformed observations: expected an array");
    }

    std::vector<Observation> out;
    out.reserve(root.size());
    for (size_t i = 0; i < root.size(); ++i) {
        const json& o = root[i];
        std::string prefix = "observations[" + std::to_string(i) + "].";
        if (!o.is_object()) bad_field(prefix, "expected an object");

        Observation obs{};
        obs.timestamp = read_u64(require(o, "timestamp", prefix), prefix + "timestamp");
        obs.sqrt_price_x96 = read_u256(require(o, "sqrt_price_x96", prefix),
                                       prefix + "sqrt_price_x96");
        obs.tick = read_i32(require(o, "tick", prefix), prefix + "tick");
        obs.liquidity = read_u256(require(o, "liquidity", prefix), prefix + "liquidity").to_u128();

        // Accumulators default to zero when absent
        const char* accumulators[] = {"seconds_per_liquidity_cumulative_x128",
                                      "fee_growth_global0_x128", "fee_growth_global1_x128"};
        U256* targets[] = {&obs.seconds_per_liquidity_cumulative_x128,
                           &obs.fee_growth_global0_x128, &obs.fee_growth_global1_x128};
        for (size_t k = 0; k < 3; ++k) {
            if (o.contains(accumulators[k])) {
                *targets[k] = read_u256(o[accumulators[k]], prefix + accumulators[k]);
            }
        }
        out.push_back(obs);
    }
    return out;
}

std::vector<Observation> load_observations(std::string_view path) {
    return observations_from_json(read_file(path, "observations file"));
}

} // namespace vox
