#include "Config.h"

#include <algorithm>
#include <cctype>
#include <fstream>
#include <utility>
#include <vector>

namespace Ferry {

    namespace {
        std::string stripWhitespace(const std::string& text) {
            auto first = text.find_first_not_of(" \t\r\n");
            if (first == std::string::npos) {
                return "";
            }
            auto last = text.find_last_not_of(" \t\r\n");
            return text.substr(first, last - first + 1);
        }
    }

    VoidResult Config::loadFromFile(const std::string& path) {
        std::ifstream in(path);
        if (!in) {
            return Err(ErrorCode::INVALID_CONFIGURATION, "Cannot read config file " + path, "Config");
        }

        std::vector<std::pair<std::string, std::string>> entries;
        std::string raw;
        int lineNumber = 0;
        while (std::getline(in, raw)) {
            ++lineNumber;
            std::string line = stripWhitespace(raw);
            if (line.empty() || line.front() == '#') {
                continue;
            }

            auto equals = line.find('=');
            std::string key = equals == std::string::npos ? "" : stripWhitespace(line.substr(0, equals));
            if (key.empty()) {
                return Err(ErrorCode::INVALID_CONFIGURATION,
                           path + ":" + std::to_string(lineNumber) + ": expected key = value", "Config");
            }
            entries.emplace_back(key, stripWhitespace(line.substr(equals + 1)));
        }

        std::lock_guard<std::mutex> lock(mutex_);
        for (auto& entry : entries) {
            settings_[entry.first] = std::move(entry.second);
        }
        return Ok();
    }

    std::string Config::get(const std::string& key, const std::string& defaultValue) const {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = settings_.find(key);
        return it == settings_.end() ? defaultValue : it->second;
    }

    void Config::set(const std::string& key, const std::string& value) {
        std::lock_guard<std::mutex> lock(mutex_);
        settings_[key] = value;
    }

    size_t Config::getSize(const std::string& key, size_t defaultValue) const {
        std::string value = get(key);
        if (!isUnsignedInteger(value)) {
            return defaultValue;
        }
        return static_cast<size_t>(std::stoull(value));
    }

    std::string Config::validate(const std::unordered_map<std::string, Validator>& schema) const {
        std::lock_guard<std::mutex> lock(mutex_);
        for (const auto& [key, validator] : schema) {
            auto it = settings_.find(key);
            if (it != settings_.end() && validator && !validator(key, it->second)) {
                return key;
            }
        }
        return "";
    }

    // 19 digits always fit in 64 bits
    bool Config::isUnsignedInteger(const std::string& value) {
        if (value.empty() || value.size() > 19) {
            return false;
        }
        return std::all_of(value.begin(), value.end(),
                           [](unsigned char c) { return std::isdigit(c) != 0; });
    }

}
