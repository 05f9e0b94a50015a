#ifndef OCCBENCH_CONFIGURATION_H_
#define OCCBENCH_CONFIGURATION_H_

#include <string>
#include <optional>
#include <vector>
#include <cstdint>

namespace YAML {
class Node;
}

namespace Occbench {

/**
 * Configuration value that can be overridden by environment variables.
 * An explicit set() (YAML file or command line) wins over the environment.
 */
template<typename T>
class ConfigValue {
public:
    ConfigValue() = default;
    ConfigValue(T default_value, const std::string& env_var = "", const std::string& env_alias = "")
        : value_(default_value), env_var_(env_var), env_alias_(env_alias) {}

    T get() const {
        if (!explicitly_set_) {
            if (!env_var_.empty()) {
                auto env_value = getEnvValue(env_var_);
                if (env_value.has_value()) {
                    return env_value.value();
                }
            }
            if (!env_alias_.empty()) {
                auto env_value = getEnvValue(env_alias_);
                if (env_value.has_value()) {
                    return env_value.value();
                }
            }
        }
        return value_;
    }

    void set(T value) {
        value_ = value;
        explicitly_set_ = true;
    }
    const std::string& env_var() const { return env_var_; }

private:
    T value_;
    std::string env_var_;
    std::string env_alias_;
    bool explicitly_set_ = false;

    std::optional<T> getEnvValue(const std::string& name) const;
};

/**
 * Raw configuration tree. Values are validated and clamped when a run is
 * resolved from it, not here.
 */
struct OccbenchConfig {
    struct Load {
        // -1 selects the variant default (0 for field updates, 1 for status transitions).
        ConfigValue<int> retry_count{-1, "RETRY_COUNT"};
        ConfigValue<int> retry_backoff_max{16, "RETRY_BACKOFF_MAX"};
        // full_jitter or fixed
        ConfigValue<std::string> backoff_policy{"full_jitter", "RETRY_BACKOFF_POLICY"};
        ConfigValue<int> threads{1, "WRK_THREADS", "THREADS"};
        ConfigValue<int> id_pool_size{10, "ID_POOL_SIZE"};
        ConfigValue<std::string> update_types{"priority,status,description,title,full", "UPDATE_TYPES"};
        // field (PUT) or status (PATCH .../status)
        ConfigValue<std::string> variant{"field", "UPDATE_VARIANT"};
        ConfigValue<int> duration_seconds{30, "DURATION_SECONDS"};
        ConfigValue<size_t> max_requests_per_worker{0, "MAX_REQUESTS_PER_WORKER"};
        ConfigValue<int> target_rps{0, "TARGET_RPS"};
        ConfigValue<bool> count_fallback_toward_rate{true, "COUNT_FALLBACK_TOWARD_RATE"};
        ConfigValue<size_t> seed{0, "SEED"};
    } load;

    struct Target {
        ConfigValue<std::string> url{"http://127.0.0.1:3002", "API_URL"};
        ConfigValue<std::string> resource_path{"/resources", "RESOURCE_PATH"};
        ConfigValue<std::string> fallback_path{"/health", "FALLBACK_PATH"};
        ConfigValue<std::string> ids_file{"", "IDS_FILE"};
    } target;

    struct Network {
        ConfigValue<int> connect_timeout_ms{5000, "OCCBENCH_CONNECT_TIMEOUT_MS"};
        ConfigValue<int> request_timeout_ms{30000, "REQUEST_TIMEOUT_MS"};
    } network;

    struct Output {
        ConfigValue<bool> record_results{false, "OCCBENCH_RECORD_RESULTS"};
        ConfigValue<std::string> data_dir{"./data/", "OCCBENCH_DATA_DIR"};
    } output;
};

/**
 * Configuration manager singleton
 */
class Configuration {
public:
    static Configuration& getInstance();

    // Load configuration from file
    bool loadFromFile(const std::string& filename);

    // Load configuration from YAML string
    bool loadFromString(const std::string& yaml_content);

    // Get the configuration
    const OccbenchConfig& config() const { return config_; }
    OccbenchConfig& config() { return config_; }

    // Validation
    bool validate() const;
    std::vector<std::string> getValidationErrors() const;

private:
    Configuration() = default;
    Configuration(const Configuration&) = delete;
    Configuration& operator=(const Configuration&) = delete;

    OccbenchConfig config_;
    mutable std::vector<std::string> validation_errors_;

    void applyYAML(const YAML::Node& root);
};

// Checks a config tree without the singleton. Returns human-readable errors.
std::vector<std::string> ValidateConfig(const OccbenchConfig& config);

// Template specializations for getEnvValue
template<>
std::optional<int> ConfigValue<int>::getEnvValue(const std::string& name) const;

template<>
std::optional<size_t> ConfigValue<size_t>::getEnvValue(const std::string& name) const;

template<>
std::optional<std::string> ConfigValue<std::string>::getEnvValue(const std::string& name) const;

template<>
std::optional<bool> ConfigValue<bool>::getEnvValue(const std::string& name) const;

} // namespace Occbench

#endif // OCCBENCH_CONFIGURATION_H_
