#pragma once
// =============================================================================
// ConfigLoader.hpp - INI file parser for lightbench settings
// =============================================================================
// [section]
// key = value        ; '#' and ';' start a comment line
// Values are stored as "section.key". Typed getters throw ConfigError on a
// value that does not parse.
// =============================================================================

#include <istream>
#include <map>
#include <string>
#include <vector>

namespace lightbench {

class ConfigLoader {
public:
    // Tries path, then ../path. Returns false if neither can be opened.
    bool load(const std::string& path = "lightbench.ini");

    // Throws ConfigError if the file cannot be opened.
    void loadFile(const std::string& path);

    void parse(std::istream& in);

    bool has(const std::string& section, const std::string& key) const;
    std::string get(const std::string& section, const std::string& key,
                    const std::string& defaultVal = "") const;
    long long getInt(const std::string& section, const std::string& key,
                     long long defaultVal = 0) const;
    double getDouble(const std::string& section, const std::string& key,
                     double defaultVal = 0.0) const;
    bool getBool(const std::string& section, const std::string& key,
                 bool defaultVal = false) const;

    void set(const std::string& section, const std::string& key, const std::string& value);

    const std::string& configPath() const { return configPath_; }
    size_t size() const { return values_.size(); }

    void dump() const;

private:
    std::map<std::string, std::string> values_;
    std::string configPath_;
};

// Strict scalar parsing shared by the INI, environment and CLI layers.
// `what` names the setting in the error message.
long long parseIntValue(const std::string& what, const std::string& text);
double parseDoubleValue(const std::string& what, const std::string& text);
bool parseBoolValue(const std::string& what, const std::string& text);

} // namespace lightbench
