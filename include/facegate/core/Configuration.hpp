#pragma once

#include <yaml-cpp/yaml.h>
#include <string>
#include <vector>
#include <mutex>

namespace facegate {
namespace core {

/**
 * Configuration management class
 *
 * Holds a YAML document and exposes its scalars through dot-separated keys
 * ("liveness.blur_min_single"). Lookups never throw: a missing key or a value
 * that cannot be converted to the requested type yields the default.
 */
class Configuration {
public:
    /**
     * Get singleton instance
     */
    static Configuration& getInstance();

    /**
     * Load configuration from a YAML file
     */
    bool load(const std::string& filename);

    /**
     * Load configuration from YAML text
     */
    bool loadFromString(const std::string& yaml);

    /**
     * Reload the last loaded file
     */
    bool reload();

    /**
     * Clear all configuration
     */
    void clear();

    /**
     * Get value
     */
    template<typename T>
    T get(const std::string& key, const T& defaultValue = T{}) const {
        std::lock_guard<std::mutex> lock(mutex_);
        YAML::Node node = findNode(key);
        if (!node.IsDefined() || !node.IsScalar()) {
            return defaultValue;
        }
        try {
            return node.as<T>();
        } catch (const YAML::Exception&) {
            return defaultValue;
        }
    }

    /**
     * Check if key exists
     */
    bool has(const std::string& key) const;

    int getInt(const std::string& key, int defaultValue = 0) const;
    double getDouble(const std::string& key, double defaultValue = 0.0) const;
    bool getBool(const std::string& key, bool defaultValue = false) const;
    std::string getString(const std::string& key, const std::string& defaultValue = "") const;

    /**
     * Get configuration filename
     */
    std::string getFilename() const;

private:
    Configuration() = default;
    ~Configuration() = default;

    // Delete copy/move
    Configuration(const Configuration&) = delete;
    Configuration& operator=(const Configuration&) = delete;

    // Caller must hold mutex_
    YAML::Node findNode(const std::string& key) const;

    static std::vector<std::string> splitKey(const std::string& key);

    mutable std::mutex mutex_;
    YAML::Node root_;
    std::string currentFile_;
};

} // namespace core
} // namespace facegate
