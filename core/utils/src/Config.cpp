#include "Config.h"
#include <fstream>
#include <algorithm>
#include <cctype>
#include <map>

namespace QuietSync {

    namespace {

        std::string trim(const std::string& value) {
            auto start = value.find_first_not_of(" \t\r\n");
            if (start == std::string::npos) return "";
            auto end = value.find_last_not_of(" \t\r\n");
            return value.substr(start, end - start + 1);
        }

    }

    std::optional<bool> parseBool(const std::string& value) {
        std::string lower = value;
        std::transform(lower.begin(), lower.end(), lower.begin(), [](unsigned char c){ return static_cast<char>(std::tolower(c)); });
        if (lower == "1" || lower == "true" || lower == "yes" || lower == "on") return true;
        if (lower == "0" || lower == "false" || lower == "no" || lower == "off") return false;
        return std::nullopt;
    }

    qsync::Result<void> Config::loadFromFile(const std::string& path) {
        std::ifstream file(path);
        if (!file.is_open()) {
            return qsync::Err(qsync::ErrorCode::MissingConfig, "Cannot read config file " + path);
        }

        std::map<std::string, std::string> parsed;
        std::string line;
        size_t lineNumber = 0;
        while (std::getline(file, line)) {
            ++lineNumber;
            auto trimmed = trim(line);
            if (trimmed.empty() || trimmed[0] == '#') continue;

            size_t delimiterPos = trimmed.find('=');
            std::string key = delimiterPos == std::string::npos ? "" : trim(trimmed.substr(0, delimiterPos));
            if (key.empty()) {
                return qsync::Err(qsync::ErrorCode::InvalidConfig,
                    path + ":" + std::to_string(lineNumber) + ": expected key=value, got '" + trimmed + "'");
            }
            parsed[key] = trim(trimmed.substr(delimiterPos + 1));
        }

        std::lock_guard<std::mutex> lock(mutex_);
        for (const auto& [key, value] : parsed) {
            settings_[key] = value;
        }
        return qsync::Ok();
    }

    qsync::Result<size_t> Config::loadLayered(const std::vector<std::string>& paths) {
        size_t loaded = 0;
        for (const auto& path : paths) {
            auto result = loadFromFile(path);
            if (result) {
                ++loaded;
            } else if (result.error().code != qsync::ErrorCode::MissingConfig) {
                return result.error();
            }
        }
        return loaded;
    }

    std::string Config::get(const std::string& key, const std::string& defaultValue) const {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = settings_.find(key);
        return it != settings_.end() ? it->second : defaultValue;
    }

    void Config::set(const std::string& key, const std::string& value) {
        std::lock_guard<std::mutex> lock(mutex_);
        settings_[key] = value;
    }

    size_t Config::getSize(const std::string& key, size_t defaultValue) const {
        std::string val = get(key);
        if (val.empty() || val[0] == '-') return defaultValue;
        try {
            return static_cast<size_t>(std::stoull(val));
        } catch (const std::exception&) {
            return defaultValue;
        }
    }

    void Config::setSize(const std::string& key, size_t value) {
        set(key, std::to_string(value));
    }

    bool Config::getBool(const std::string& key, bool defaultValue) const {
        return parseBool(get(key)).value_or(defaultValue);
    }

    qsync::Result<void> Config::validate(const std::unordered_map<std::string, Validator>& schema) const {
        std::lock_guard<std::mutex> lock(mutex_);
        // Checked in key order so the reported key does not depend on hashing
        std::map<std::string, Validator> ordered(schema.begin(), schema.end());
        for (const auto& [key, validator] : ordered) {
            auto it = settings_.find(key);
            if (it != settings_.end() && validator && !validator(it->second)) {
                return qsync::Err(qsync::ErrorCode::InvalidConfig,
                    "Invalid value for '" + key + "': " + it->second);
            }
        }
        return qsync::Ok();
    }

}
