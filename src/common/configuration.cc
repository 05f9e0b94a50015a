#include "configuration.h"
#include "env_flags.h"
#include <algorithm>
#include <cctype>
#include <climits>
#include <cstdlib>
#include <glog/logging.h>
#include <yaml-cpp/yaml.h>

namespace Occbench {

// Template specializations for environment variable parsing
template<>
std::optional<int> ConfigValue<int>::getEnvValue(const std::string& name) const {
    const char* env_val = std::getenv(name.c_str());
    if (env_val) {
        EnvInt parsed = ParseIntAtLeast(env_val, INT_MIN, 0);
        if (!parsed.defaulted && parsed.value <= INT_MAX) {
            return static_cast<int>(parsed.value);
        }
        LOG(WARNING) << "Failed to parse env var " << name << "='" << env_val
                     << "', using default " << value_;
    }
    return std::nullopt;
}

template<>
std::optional<size_t> ConfigValue<size_t>::getEnvValue(const std::string& name) const {
    const char* env_val = std::getenv(name.c_str());
    if (env_val) {
        EnvInt parsed = ParseIntAtLeast(env_val, 0, 0);
        if (!parsed.defaulted) {
            return static_cast<size_t>(parsed.value);
        }
        LOG(WARNING) << "Failed to parse env var " << name << "='" << env_val
                     << "', using default " << value_;
    }
    return std::nullopt;
}

template<>
std::optional<std::string> ConfigValue<std::string>::getEnvValue(const std::string& name) const {
    const char* env_val = std::getenv(name.c_str());
    if (env_val && env_val[0]) {
        return std::string(env_val);
    }
    return std::nullopt;
}

template<>
std::optional<bool> ConfigValue<bool>::getEnvValue(const std::string& name) const {
    const char* env_val = std::getenv(name.c_str());
    if (env_val) {
        std::string val(env_val);
        std::transform(val.begin(), val.end(), val.begin(),
                       [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
        if (val == "true" || val == "1" || val == "yes" || val == "on") {
            return true;
        } else if (val == "false" || val == "0" || val == "no" || val == "off") {
            return false;
        }
        LOG(WARNING) << "Invalid boolean value for env var " << name << ": " << env_val;
    }
    return std::nullopt;
}

Configuration& Configuration::getInstance() {
    static Configuration instance;
    return instance;
}

void Configuration::applyYAML(const YAML::Node& yaml) {
    if (!yaml["occbench"]) {
        LOG(WARNING) << "Configuration has no top-level 'occbench' key, nothing applied";
        return;
    }
    auto root = yaml["occbench"];

    // Load generation
    if (root["load"]) {
        auto load = root["load"];
        if (load["retry_count"]) config_.load.retry_count.set(load["retry_count"].as<int>());
        if (load["retry_backoff_max"]) config_.load.retry_backoff_max.set(load["retry_backoff_max"].as<int>());
        if (load["backoff_policy"]) config_.load.backoff_policy.set(load["backoff_policy"].as<std::string>());
        if (load["threads"]) config_.load.threads.set(load["threads"].as<int>());
        if (load["id_pool_size"]) config_.load.id_pool_size.set(load["id_pool_size"].as<int>());
        if (load["update_types"]) {
            auto types = load["update_types"];
            if (types.IsSequence()) {
                std::string joined;
                for (const auto& t : types) {
                    if (!joined.empty()) joined += ",";
                    joined += t.as<std::string>();
                }
                config_.load.update_types.set(joined);
            } else {
                config_.load.update_types.set(types.as<std::string>());
            }
        }
        if (load["variant"]) config_.load.variant.set(load["variant"].as<std::string>());
        if (load["duration_seconds"]) config_.load.duration_seconds.set(load["duration_seconds"].as<int>());
        if (load["max_requests_per_worker"]) config_.load.max_requests_per_worker.set(load["max_requests_per_worker"].as<size_t>());
        if (load["target_rps"]) config_.load.target_rps.set(load["target_rps"].as<int>());
        if (load["count_fallback_toward_rate"]) config_.load.count_fallback_toward_rate.set(load["count_fallback_toward_rate"].as<bool>());
        if (load["seed"]) config_.load.seed.set(load["seed"].as<size_t>());
    }

    // Target API
    if (root["target"]) {
        auto target = root["target"];
        if (target["url"]) config_.target.url.set(target["url"].as<std::string>());
        if (target["resource_path"]) config_.target.resource_path.set(target["resource_path"].as<std::string>());
        if (target["fallback_path"]) config_.target.fallback_path.set(target["fallback_path"].as<std::string>());
        if (target["ids_file"]) config_.target.ids_file.set(target["ids_file"].as<std::string>());
    }

    // Network
    if (root["network"]) {
        auto network = root["network"];
        if (network["connect_timeout_ms"]) config_.network.connect_timeout_ms.set(network["connect_timeout_ms"].as<int>());
        if (network["request_timeout_ms"]) config_.network.request_timeout_ms.set(network["request_timeout_ms"].as<int>());
    }

    // Output
    if (root["output"]) {
        auto output = root["output"];
        if (output["record_results"]) config_.output.record_results.set(output["record_results"].as<bool>());
        if (output["data_dir"]) config_.output.data_dir.set(output["data_dir"].as<std::string>());
    }
}

bool Configuration::loadFromFile(const std::string& filename) {
    try {
        applyYAML(YAML::LoadFile(filename));
        return validate();
    } catch (const YAML::Exception& e) {
        LOG(ERROR) << "Failed to parse configuration file " << filename << ": " << e.what();
        return false;
    }
}

bool Configuration::loadFromString(const std::string& yaml_content) {
    try {
        applyYAML(YAML::Load(yaml_content));
        return validate();
    } catch (const YAML::Exception& e) {
        LOG(ERROR) << "Failed to parse configuration string: " << e.what();
        return false;
    }
}

std::vector<std::string> ValidateConfig(const OccbenchConfig& config) {
    std::vector<std::string> errors;

    const std::string variant = config.load.variant.get();
    if (variant != "field" && variant != "status") {
        errors.push_back("Update variant must be 'field' or 'status', got '" + variant + "'");
    }

    const std::string policy = config.load.backoff_policy.get();
    if (policy != "full_jitter" && policy != "fixed") {
        errors.push_back("Backoff policy must be 'full_jitter' or 'fixed', got '" + policy + "'");
    }

    if (config.load.duration_seconds.get() < 1 && config.load.max_requests_per_worker.get() == 0) {
        errors.push_back("Either duration_seconds or max_requests_per_worker must bound the run");
    }

    if (config.load.target_rps.get() < 0) {
        errors.push_back("Target RPS cannot be negative");
    }

    const std::string url = config.target.url.get();
    if (url.rfind("http://", 0) != 0) {
        errors.push_back("Target URL must start with http:// (TLS is not supported): " + url);
    }

    const std::string resource_path = config.target.resource_path.get();
    if (resource_path.empty() || resource_path[0] != '/') {
        errors.push_back("Resource path must start with '/'");
    }

    const std::string fallback_path = config.target.fallback_path.get();
    if (fallback_path.empty() || fallback_path[0] != '/') {
        errors.push_back("Fallback path must start with '/'");
    }

    if (config.network.connect_timeout_ms.get() < 1 || config.network.request_timeout_ms.get() < 1) {
        errors.push_back("Network timeouts must be at least 1ms");
    }

    return errors;
}

bool Configuration::validate() const {
    validation_errors_ = ValidateConfig(config_);
    return validation_errors_.empty();
}

std::vector<std::string> Configuration::getValidationErrors() const {
    return validation_errors_;
}

} // namespace Occbench
