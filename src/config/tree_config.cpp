#include "config/tree_config.hpp"
#include "tree/tree_layout.hpp"
#include <fstream>
#include <stdexcept>

namespace authtree {

Scheme scheme_from_string(const std::string& s) {
    if (s == "merkle") return Scheme::Merkle;
    if (s == "merkle++") return Scheme::MerklePlusPlus;
    if (s == "verkle") return Scheme::Verkle;
    throw std::invalid_argument("Unknown tree scheme: " + s);
}

std::string to_string(Scheme scheme) {
    switch (scheme) {
        case Scheme::Merkle: return "merkle";
        case Scheme::MerklePlusPlus: return "merkle++";
        case Scheme::Verkle: return "verkle";
    }
    return "unknown";
}

TreeConfig TreeConfig::from_json(const nlohmann::json& j) {
    if (!j.is_object()) {
        throw std::invalid_argument("Tree config must be a JSON object");
    }
    if (!j.contains("scheme")) {
        throw std::invalid_argument("Tree config missing 'scheme' field");
    }
    if (!j.contains("arity")) {
        throw std::invalid_argument("Tree config missing 'arity' field");
    }
    if (j.contains("num_leaves") == j.contains("height")) {
        throw std::invalid_argument("Tree config needs exactly one of 'num_leaves' and 'height'");
    }

    TreeConfig config;
    try {
        config.scheme = scheme_from_string(j["scheme"].get<std::string>());
        config.arity = j["arity"].get<size_t>();
        if (j.contains("height")) {
            config.height = j["height"].get<size_t>();
        } else {
            config.num_leaves = j["num_leaves"].get<size_t>();
        }
        if (j.contains("hash")) {
            config.hash = hash_function_from_string(j["hash"].get<std::string>());
        }
        if (j.contains("serial_cutoff")) {
            config.serial_cutoff = j["serial_cutoff"].get<size_t>();
        }
    } catch (const nlohmann::json::exception& e) {
        throw std::invalid_argument(std::string("Invalid tree config: ") + e.what());
    }

    if (config.height) {
        if (config.arity < 2) {
            throw std::invalid_argument("Tree arity must be at least 2");
        }
        try {
            config.num_leaves = max_leaves(config.arity, *config.height);
        } catch (const std::overflow_error& e) {
            throw std::invalid_argument(std::string("Invalid tree config: ") + e.what());
        }
    }
    config.validate();
    return config;
}

TreeConfig TreeConfig::load(const std::string& path) {
    std::ifstream f(path);
    if (!f) {
        throw std::runtime_error("Could not open tree config: " + path);
    }

    nlohmann::json j;
    try {
        j = nlohmann::json::parse(f);
    } catch (const nlohmann::json::parse_error& e) {
        throw std::runtime_error("Could not parse tree config " + path + ": " + e.what());
    }
    return from_json(j);
}

nlohmann::json TreeConfig::to_json() const {
    nlohmann::json j;
    j["scheme"] = to_string(scheme);
    j["arity"] = arity;
    if (height) {
        j["height"] = *height;
    } else {
        j["num_leaves"] = num_leaves;
    }
    if (scheme == Scheme::Merkle) {
        j["hash"] = to_string(hash);
    }
    if (scheme == Scheme::Verkle) {
        j["serial_cutoff"] = serial_cutoff;
    }
    return j;
}

void TreeConfig::validate() const {
    if (arity < 2) {
        throw std::invalid_argument("Tree arity must be at least 2");
    }
    if (num_leaves == 0) {
        throw std::invalid_argument("Tree must have at least one leaf");
    }
    if (scheme == Scheme::Merkle && digest_size(hash) != HashValue::LEN) {
        throw std::invalid_argument("Merkle trees need a 32-byte hash function, got " + to_string(hash));
    }
}

} // namespace authtree
