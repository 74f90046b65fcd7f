#pragma once

#include "Result.h"
#include <string>
#include <vector>
#include <unordered_map>
#include <functional>
#include <mutex>

namespace QuietSync {

    /**
     * @brief key=value settings store
     *
     * Blank lines and lines starting with '#' are skipped; keys and values
     * are trimmed. Any other line without '=' or with an empty key makes
     * the whole file invalid, and nothing from it is stored.
     */
    class Config {
    public:
        using Validator = std::function<bool(const std::string& value)>;

        /// MissingConfig if the file cannot be opened, InvalidConfig on a malformed line
        qsync::Result<void> loadFromFile(const std::string& path);

        /**
         * @brief Load files in order, later files overriding earlier ones
         *
         * Files that cannot be opened are skipped. Returns how many were
         * loaded, or the first InvalidConfig error.
         */
        qsync::Result<size_t> loadLayered(const std::vector<std::string>& paths);

        std::string get(const std::string& key, const std::string& defaultValue = "") const;
        void set(const std::string& key, const std::string& value);

        size_t getSize(const std::string& key, size_t defaultValue = 0) const;
        void setSize(const std::string& key, size_t value);

        bool getBool(const std::string& key, bool defaultValue = false) const;

        /// InvalidConfig naming the first present key whose value its validator rejects
        qsync::Result<void> validate(const std::unordered_map<std::string, Validator>& schema) const;

    private:
        std::unordered_map<std::string, std::string> settings_;
        mutable std::mutex mutex_;
    };

    /// "1/true/yes/on" or "0/false/no/off", case-insensitive
    std::optional<bool> parseBool(const std::string& value);

}
