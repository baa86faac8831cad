// STARDUST - Configuration File Parser Implementation
// Copyright (c) 2024 STARDUST Developers
// MIT License

#include "stardust/util/config.h"

#include <algorithm>
#include <cctype>
#include <cerrno>
#include <cstdlib>
#include <fstream>
#include <set>
#include <sstream>

namespace stardust {
namespace util {

// ============================================================================
// Static Helper Functions
// ============================================================================

std::string ConfigManager::Trim(const std::string& str) {
    const char* whitespace = " \t\r\n";
    size_t start = str.find_first_not_of(whitespace);
    if (start == std::string::npos) {
        return "";
    }
    size_t end = str.find_last_not_of(whitespace);
    return str.substr(start, end - start + 1);
}

std::string ConfigManager::Unquote(const std::string& str) {
    if (str.length() < 2) {
        return str;
    }

    char first = str.front();
    char last = str.back();
    if ((first != '"' || last != '"') && (first != '\'' || last != '\'')) {
        return str;
    }

    std::string inner = str.substr(1, str.length() - 2);
    if (first == '\'') {
        return inner;
    }

    std::string unescaped;
    unescaped.reserve(inner.length());
    for (size_t i = 0; i < inner.length(); ++i) {
        if (inner[i] == '\\' && i + 1 < inner.length()) {
            char next = inner[i + 1];
            switch (next) {
                case 'n': unescaped += '\n'; ++i; break;
                case 't': unescaped += '\t'; ++i; break;
                case '\\': unescaped += '\\'; ++i; break;
                case '"': unescaped += '"'; ++i; break;
                default: unescaped += inner[i]; break;
            }
        } else {
            unescaped += inner[i];
        }
    }
    return unescaped;
}

std::optional<bool> ConfigManager::ParseBool(const std::string& str) {
    std::string lower = str;
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    if (lower == "true" || lower == "yes" || lower == "on" || lower == "1") {
        return true;
    }
    if (lower == "false" || lower == "no" || lower == "off" || lower == "0") {
        return false;
    }
    return std::nullopt;
}

std::string ConfigManager::MakeKey(const std::string& key, const std::string& section) {
    if (section.empty()) {
        return key;
    }
    return section + "." + key;
}

// ============================================================================
// Parsing
// ============================================================================

bool ConfigManager::ParseLine(const std::string& line, const std::string& source,
                              int lineNum, std::string& currentSection,
                              ConfigParseResult& result) {
    std::string trimmed = Trim(line);

    if (trimmed.empty() || trimmed[0] == '#' || trimmed[0] == ';') {
        return true;
    }

    if (trimmed[0] == '[') {
        size_t end = trimmed.find(']');
        if (end == std::string::npos) {
            result = ConfigParseResult::Error(
                "Missing closing bracket in section header", source, lineNum);
            return false;
        }
        currentSection = Trim(trimmed.substr(1, end - 1));
        return true;
    }

    size_t eqPos = trimmed.find('=');
    if (eqPos == std::string::npos) {
        result = ConfigParseResult::Error("Expected key=value", source, lineNum);
        return false;
    }

    std::string key = Trim(trimmed.substr(0, eqPos));
    std::string value = Unquote(Trim(trimmed.substr(eqPos + 1)));

    if (key.empty()) {
        result = ConfigParseResult::Error("Empty key", source, lineNum);
        return false;
    }
    for (char c : key) {
        if (!std::isalnum(static_cast<unsigned char>(c)) && c != '_' && c != '-' && c != '.') {
            result = ConfigParseResult::Error(
                "Invalid character in key: " + std::string(1, c), source, lineNum);
            return false;
        }
    }

    ConfigEntry entry;
    entry.key = key;
    entry.value = value;
    entry.section = currentSection;
    entry.source = source;
    entry.lineNumber = lineNum;
    entries_[MakeKey(key, currentSection)] = entry;
    return true;
}

ConfigParseResult ConfigManager::ParseFile(const std::string& filePath) {
    std::ifstream file(filePath);
    if (!file.is_open()) {
        return ConfigParseResult::Error("Cannot open file: " + filePath);
    }

    file.seekg(0, std::ios::end);
    auto fileSize = file.tellg();
    file.seekg(0, std::ios::beg);
    if (fileSize > static_cast<std::streampos>(MAX_CONFIG_SIZE)) {
        return ConfigParseResult::Error(
            "Config file too large (max " + std::to_string(MAX_CONFIG_SIZE) + " bytes)",
            filePath);
    }

    std::ostringstream content;
    content << file.rdbuf();
    return ParseString(content.str(), filePath);
}

ConfigParseResult ConfigManager::ParseString(const std::string& content,
                                             const std::string& sourceName) {
    std::istringstream stream(content);
    std::string currentSection;
    std::string line;
    int lineNum = 0;

    ConfigParseResult result = ConfigParseResult::Success();
    while (std::getline(stream, line)) {
        ++lineNum;
        if (line.length() > MAX_LINE_LENGTH) {
            return ConfigParseResult::Error(
                "Line too long (max " + std::to_string(MAX_LINE_LENGTH) + " characters)",
                sourceName, lineNum);
        }
        if (!ParseLine(line, sourceName, lineNum, currentSection, result)) {
            return result;
        }
    }
    return result;
}

// ============================================================================
// Value Retrieval
// ============================================================================

bool ConfigManager::HasKey(const std::string& key) const {
    return entries_.find(key) != entries_.end();
}

std::optional<ConfigEntry> ConfigManager::GetEntry(const std::string& key) const {
    auto it = entries_.find(key);
    if (it == entries_.end()) {
        return std::nullopt;
    }
    return it->second;
}

std::optional<std::string> ConfigManager::TryGetString(const std::string& key) const {
    auto it = entries_.find(key);
    if (it != entries_.end()) {
        return it->second.value;
    }
    return std::nullopt;
}

std::string ConfigManager::GetString(const std::string& key,
                                     const std::string& defaultValue) const {
    return TryGetString(key).value_or(defaultValue);
}

std::optional<int64_t> ConfigManager::TryGetInt(const std::string& key) const {
    auto str = TryGetString(key);
    if (!str || str->empty()) {
        return std::nullopt;
    }
    errno = 0;
    char* end = nullptr;
    long long value = std::strtoll(str->c_str(), &end, 10);
    if (errno == ERANGE || end != str->c_str() + str->size()) {
        return std::nullopt;
    }
    return static_cast<int64_t>(value);
}

int64_t ConfigManager::GetInt(const std::string& key, int64_t defaultValue) const {
    return TryGetInt(key).value_or(defaultValue);
}

std::optional<uint64_t> ConfigManager::TryGetUInt(const std::string& key) const {
    auto str = TryGetString(key);
    if (!str || str->empty() || (*str)[0] == '-') {
        return std::nullopt;
    }
    errno = 0;
    char* end = nullptr;
    unsigned long long value = std::strtoull(str->c_str(), &end, 10);
    if (errno == ERANGE || end != str->c_str() + str->size()) {
        return std::nullopt;
    }
    return static_cast<uint64_t>(value);
}

uint64_t ConfigManager::GetUInt(const std::string& key, uint64_t defaultValue) const {
    return TryGetUInt(key).value_or(defaultValue);
}

std::optional<bool> ConfigManager::TryGetBool(const std::string& key) const {
    auto str = TryGetString(key);
    if (!str) {
        return std::nullopt;
    }
    return ParseBool(*str);
}

bool ConfigManager::GetBool(const std::string& key, bool defaultValue) const {
    return TryGetBool(key).value_or(defaultValue);
}

std::optional<double> ConfigManager::TryGetDouble(const std::string& key) const {
    auto str = TryGetString(key);
    if (!str || str->empty()) {
        return std::nullopt;
    }
    errno = 0;
    char* end = nullptr;
    double value = std::strtod(str->c_str(), &end);
    if (errno == ERANGE || end != str->c_str() + str->size()) {
        return std::nullopt;
    }
    return value;
}

double ConfigManager::GetDouble(const std::string& key, double defaultValue) const {
    return TryGetDouble(key).value_or(defaultValue);
}

// ============================================================================
// Value Setting
// ============================================================================

void ConfigManager::Set(const std::string& key, const std::string& value) {
    ConfigEntry entry;
    size_t dot = key.rfind('.');
    entry.key = dot == std::string::npos ? key : key.substr(dot + 1);
    entry.section = dot == std::string::npos ? "" : key.substr(0, dot);
    entry.value = value;
    entry.source = "<set>";
    entries_[key] = entry;
}

std::vector<std::string> ConfigManager::GetSections() const {
    std::set<std::string> sections;
    for (const auto& [name, entry] : entries_) {
        if (!entry.section.empty()) {
            sections.insert(entry.section);
        }
    }
    return std::vector<std::string>(sections.begin(), sections.end());
}

std::vector<std::string> ConfigManager::GetKeys(const std::string& section) const {
    std::vector<std::string> keys;
    for (const auto& [name, entry] : entries_) {
        if (section.empty() || entry.section == section) {
            keys.push_back(name);
        }
    }
    return keys;
}

} // namespace util
} // namespace stardust
