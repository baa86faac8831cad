// STARDUST - Configuration File Parser
// Copyright (c) 2024 STARDUST Developers
// MIT License
//
// Parses INI-style configuration for the wallet engine.
//
// Configuration file format:
// - Lines starting with # or ; are comments
// - key=value pairs
// - Section headers: [section]; keys inside are addressed as "section.key"
// - Values can be quoted: key="value with spaces"
// - Boolean values: true/false, yes/no, on/off, 1/0

#ifndef STARDUST_UTIL_CONFIG_H
#define STARDUST_UTIL_CONFIG_H

#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace stardust {
namespace util {

/// Maximum config file size (1 MB)
constexpr size_t MAX_CONFIG_SIZE = 1024 * 1024;

/// Maximum line length
constexpr size_t MAX_LINE_LENGTH = 4096;

/// A single configuration entry
struct ConfigEntry {
    std::string key;
    std::string value;
    std::string section;   // Empty for global section
    std::string source;    // File path where this was defined
    int lineNumber{0};
};

/// Result of parsing a configuration file
struct ConfigParseResult {
    bool success{false};
    std::string errorMessage;
    std::string errorFile;
    int errorLine{0};

    static ConfigParseResult Success() {
        return {true, "", "", 0};
    }

    static ConfigParseResult Error(const std::string& msg,
                                   const std::string& file = "",
                                   int line = 0) {
        return {false, msg, file, line};
    }
};

/**
 * Key/value store filled from configuration files or strings.
 *
 * Later definitions of a key replace earlier ones. Typed getters return
 * nullopt both for missing keys and for values that do not parse; use
 * HasKey() to tell the two apart.
 */
class ConfigManager {
public:
    ConfigManager() = default;

    ConfigParseResult ParseFile(const std::string& filePath);

    ConfigParseResult ParseString(const std::string& content,
                                  const std::string& sourceName = "<string>");

    // ========================================================================
    // Value Retrieval
    // ========================================================================

    bool HasKey(const std::string& key) const;

    std::optional<std::string> TryGetString(const std::string& key) const;
    std::string GetString(const std::string& key, const std::string& defaultValue) const;

    /// Whole value must be a base-10 integer
    std::optional<int64_t> TryGetInt(const std::string& key) const;
    int64_t GetInt(const std::string& key, int64_t defaultValue) const;

    std::optional<uint64_t> TryGetUInt(const std::string& key) const;
    uint64_t GetUInt(const std::string& key, uint64_t defaultValue) const;

    std::optional<bool> TryGetBool(const std::string& key) const;
    bool GetBool(const std::string& key, bool defaultValue) const;

    std::optional<double> TryGetDouble(const std::string& key) const;
    double GetDouble(const std::string& key, double defaultValue) const;

    /// Entry with its source location, for error messages
    std::optional<ConfigEntry> GetEntry(const std::string& key) const;

    // ========================================================================
    // Value Setting
    // ========================================================================

    void Set(const std::string& key, const std::string& value);

    std::vector<std::string> GetSections() const;

    /// Fully qualified keys of a section (all keys for an empty section)
    std::vector<std::string> GetKeys(const std::string& section = "") const;

    void Clear() { entries_.clear(); }
    size_t Size() const { return entries_.size(); }

private:
    static std::string MakeKey(const std::string& key, const std::string& section);

    bool ParseLine(const std::string& line, const std::string& source, int lineNum,
                   std::string& currentSection, ConfigParseResult& result);

    static std::string Trim(const std::string& str);
    static std::string Unquote(const std::string& str);
    static std::optional<bool> ParseBool(const std::string& str);

    std::map<std::string, ConfigEntry> entries_;
};

} // namespace util
} // namespace stardust

#endif // STARDUST_UTIL_CONFIG_H
