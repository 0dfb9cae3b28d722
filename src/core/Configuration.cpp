#include "facegate/core/Configuration.hpp"
#include "facegate/core/Logger.hpp"
#include <sstream>

namespace facegate {
namespace core {

Configuration& Configuration::getInstance() {
    static Configuration instance;
    return instance;
}

bool Configuration::load(const std::string& filename) {
    YAML::Node parsed;
    try {
        parsed = YAML::LoadFile(filename);
    } catch (const YAML::Exception& e) {
        LOG_ERROR("Failed to load configuration " + filename + ": " + e.what());
        return false;
    }

    std::lock_guard<std::mutex> lock(mutex_);
    root_ = parsed;
    currentFile_ = filename;
    return true;
}

bool Configuration::loadFromString(const std::string& yaml) {
    YAML::Node parsed;
    try {
        parsed = YAML::Load(yaml);
    } catch (const YAML::Exception& e) {
        LOG_ERROR(std::string("Failed to parse configuration: ") + e.what());
        return false;
    }

    std::lock_guard<std::mutex> lock(mutex_);
    root_ = parsed;
    currentFile_.clear();
    return true;
}

bool Configuration::reload() {
    std::string filename = getFilename();
    if (filename.empty()) {
        LOG_WARNING("Configuration reload requested but no file was loaded");
        return false;
    }
    return load(filename);
}

void Configuration::clear() {
    std::lock_guard<std::mutex> lock(mutex_);
    root_ = YAML::Node();
    currentFile_.clear();
}

bool Configuration::has(const std::string& key) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return findNode(key).IsDefined();
}

int Configuration::getInt(const std::string& key, int defaultValue) const {
    return get<int>(key, defaultValue);
}

double Configuration::getDouble(const std::string& key, double defaultValue) const {
    return get<double>(key, defaultValue);
}

bool Configuration::getBool(const std::string& key, bool defaultValue) const {
    return get<bool>(key, defaultValue);
}

std::string Configuration::getString(const std::string& key, const std::string& defaultValue) const {
    return get<std::string>(key, defaultValue);
}

std::string Configuration::getFilename() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return currentFile_;
}

YAML::Node Configuration::findNode(const std::string& key) const {
    const std::vector<std::string> parts = splitKey(key);
    if (parts.empty() || !root_.IsMap()) {
        return YAML::Node(YAML::NodeType::Undefined);
    }

    // Walk through a chain of copies; assigning one Node to another would
    // rebind the underlying document.
    std::vector<YAML::Node> chain;
    chain.reserve(parts.size() + 1);
    chain.push_back(root_);

    for (const auto& part : parts) {
        const YAML::Node& parent = chain.back();
        if (!parent.IsMap()) {
            return YAML::Node(YAML::NodeType::Undefined);
        }
        const YAML::Node child = parent[part];
        if (!child.IsDefined()) {
            return YAML::Node(YAML::NodeType::Undefined);
        }
        chain.push_back(child);
    }

    return chain.back();
}

std::vector<std::string> Configuration::splitKey(const std::string& key) {
    std::vector<std::string> parts;
    std::stringstream ss(key);
    std::string part;
    while (std::getline(ss, part, '.')) {
        if (!part.empty()) {
            parts.push_back(part);
        }
    }
    return parts;
}

} // namespace core
} // namespace facegate
