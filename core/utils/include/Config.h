#pragma once

#include "Result.h"

#include <functional>
#include <mutex>
#include <string>
#include <unordered_map>

namespace Ferry {

    /**
     * @brief Flat key=value settings store
     *
     * Files contain one "key = value" per line; blank lines and lines starting
     * with '#' are ignored. Values loaded from a file replace values already
     * present.
     */
    class Config {
    public:
        using Validator = std::function<bool(const std::string& key, const std::string& value)>;

        Config() = default;

        /**
         * @brief Merge a settings file
         *
         * Nothing is merged when the file cannot be read or a line is not a
         * key=value pair; both are INVALID_CONFIGURATION.
         */
        VoidResult loadFromFile(const std::string& path);

        std::string get(const std::string& key, const std::string& defaultValue = "") const;
        void set(const std::string& key, const std::string& value);

        /// Decimal value of key, or defaultValue when absent or not an unsigned integer
        size_t getSize(const std::string& key, size_t defaultValue = 0) const;

        /**
         * @brief Run validators against present keys
         * @return Name of the first key whose value is rejected, empty if all pass
         */
        std::string validate(const std::unordered_map<std::string, Validator>& schema) const;

        static bool isUnsignedInteger(const std::string& value);

    private:
        std::unordered_map<std::string, std::string> settings_;
        mutable std::mutex mutex_;
    };

}
