#include "lightbench/config/ConfigLoader.hpp"
#include "lightbench/core/Errors.hpp"

#include <algorithm>
#include <cctype>
#include <cerrno>
#include <cstdlib>
#include <fstream>
#include <iostream>

namespace lightbench {

static std::string trim(const std::string& s) {
    size_t start = s.find_first_not_of(" \t\r\n");
    if (start == std::string::npos) return "";
    size_t end = s.find_last_not_of(" \t\r\n");
    return s.substr(start, end - start + 1);
}

static std::string lower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return s;
}

long long parseIntValue(const std::string& what, const std::string& text) {
    const std::string t = trim(text);
    if (t.empty()) throw ConfigError(what + ": expected an integer, got an empty value");
    errno = 0;
    char* end = nullptr;
    long long v = std::strtoll(t.c_str(), &end, 10);
    if (errno == ERANGE || end == t.c_str() || *end != '\0') {
        throw ConfigError(what + ": expected an integer, got '" + text + "'");
    }
    return v;
}

double parseDoubleValue(const std::string& what, const std::string& text) {
    const std::string t = trim(text);
    if (t.empty()) throw ConfigError(what + ": expected a number, got an empty value");
    errno = 0;
    char* end = nullptr;
    double v = std::strtod(t.c_str(), &end);
    if (errno == ERANGE || end == t.c_str() || *end != '\0') {
        throw ConfigError(what + ": expected a number, got '" + text + "'");
    }
    return v;
}

bool parseBoolValue(const std::string& what, const std::string& text) {
    const std::string v = lower(trim(text));
    if (v == "1" || v == "true" || v == "yes" || v == "on") return true;
    if (v == "0" || v == "false" || v == "no" || v == "off") return false;
    throw ConfigError(what + ": expected a boolean, got '" + text + "'");
}

bool ConfigLoader::load(const std::string& path) {
    const std::vector<std::string> paths = {path, "../" + path};
    for (const auto& p : paths) {
        std::ifstream file(p);
        if (file.is_open()) {
            configPath_ = p;
            parse(file);
            std::cout << "[CONFIG] Loaded " << values_.size()
                      << " values from " << p << "\n";
            return true;
        }
    }
    return false;
}

void ConfigLoader::loadFile(const std::string& path) {
    std::ifstream file(path);
    if (!file.is_open()) {
        throw ConfigError("cannot open config file " + path);
    }
    configPath_ = path;
    parse(file);
    std::cout << "[CONFIG] Loaded " << values_.size()
              << " values from " << path << "\n";
}

void ConfigLoader::parse(std::istream& in) {
    std::string line;
    std::string currentSection;
    int lineno = 0;

    while (std::getline(in, line)) {
        ++lineno;
        line = trim(line);

        // Skip empty lines and comments
        if (line.empty() || line[0] == '#' || line[0] == ';') continue;

        // Section header
        if (line[0] == '[') {
            size_t closePos = line.find(']');
            if (closePos == std::string::npos) {
                throw ConfigError("line " + std::to_string(lineno) +
                                  ": unterminated section header");
            }
            currentSection = trim(line.substr(1, closePos - 1));
            continue;
        }

        // Key = Value
        size_t eqPos = line.find('=');
        if (eqPos == std::string::npos) {
            throw ConfigError("line " + std::to_string(lineno) +
                              ": expected key = value");
        }
        std::string key = trim(line.substr(0, eqPos));
        std::string value = trim(line.substr(eqPos + 1));
        if (key.empty()) {
            throw ConfigError("line " + std::to_string(lineno) + ": empty key");
        }
        values_[currentSection + "." + key] = value;
    }
}

bool ConfigLoader::has(const std::string& section, const std::string& key) const {
    return values_.count(section + "." + key) != 0;
}

std::string ConfigLoader::get(const std::string& section, const std::string& key,
                              const std::string& defaultVal) const {
    auto it = values_.find(section + "." + key);
    return it != values_.end() ? it->second : defaultVal;
}

long long ConfigLoader::getInt(const std::string& section, const std::string& key,
                               long long defaultVal) const {
    auto it = values_.find(section + "." + key);
    if (it == values_.end()) return defaultVal;
    return parseIntValue(it->first, it->second);
}

double ConfigLoader::getDouble(const std::string& section, const std::string& key,
                               double defaultVal) const {
    auto it = values_.find(section + "." + key);
    if (it == values_.end()) return defaultVal;
    return parseDoubleValue(it->first, it->second);
}

bool ConfigLoader::getBool(const std::string& section, const std::string& key,
                           bool defaultVal) const {
    auto it = values_.find(section + "." + key);
    if (it == values_.end()) return defaultVal;
    return parseBoolValue(it->first, it->second);
}

void ConfigLoader::set(const std::string& section, const std::string& key,
                       const std::string& value) {
    values_[section + "." + key] = value;
}

void ConfigLoader::dump() const {
    std::cout << "[CONFIG] Loaded from: "
              << (configPath_.empty() ? std::string("<none>") : configPath_) << "\n";
    for (const auto& kv : values_) {
        std::cout << "  " << kv.first << " = " << kv.second << "\n";
    }
}

} // namespace lightbench
