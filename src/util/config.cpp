// REFINDEX - Configuration File Parser Implementation
// Copyright (c) 2024 REFINDEX Developers
// MIT License

#include "refindex/util/config.h"

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <fstream>
#include <sstream>

#include <pwd.h>
#include <unistd.h>

namespace refindex {
namespace util {

namespace {

const char* const SOURCE_COMMAND_LINE = "<command-line>";
const char* const SOURCE_DEFAULT = "<default>";

} // namespace

std::string ConfigParseResult::ToString() const {
    if (success) {
        return "ok";
    }
    std::string out;
    if (!errorFile.empty()) {
        out = errorFile;
        if (errorLine > 0) {
            out += ":" + std::to_string(errorLine);
        }
        out += ": ";
    }
    return out + errorMessage;
}

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
    if (!((first == '"' && last == '"') || (first == '\'' && last == '\''))) {
        return str;
    }

    std::string inner = str.substr(1, str.length() - 2);
    if (first == '\'') {
        return inner;
    }

    // Double quotes honour a small set of escapes
    std::string out;
    out.reserve(inner.length());
    for (size_t i = 0; i < inner.length(); ++i) {
        if (inner[i] == '\\' && i + 1 < inner.length()) {
            switch (inner[i + 1]) {
                case 'n': out += '\n'; ++i; continue;
                case 't': out += '\t'; ++i; continue;
                case '\\': out += '\\'; ++i; continue;
                case '"': out += '"'; ++i; continue;
                default: break;
            }
        }
        out += inner[i];
    }
    return out;
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

bool ConfigManager::IsValidKey(const std::string& key) {
    if (key.empty()) {
        return false;
    }
    for (char c : key) {
        if (!std::isalnum(static_cast<unsigned char>(c)) &&
            c != '_' && c != '-' && c != '.') {
            return false;
        }
    }
    return true;
}

std::string ConfigManager::ExpandEnvVars(const std::string& value) {
    std::string result;
    result.reserve(value.length());

    size_t i = 0;
    while (i < value.length()) {
        if (value[i] == '$' && i + 1 < value.length() && value[i + 1] == '{') {
            size_t end = value.find('}', i + 2);
            if (end != std::string::npos) {
                std::string name = value.substr(i + 2, end - i - 2);
                if (const char* env = std::getenv(name.c_str())) {
                    result += env;
                }
                i = end + 1;
                continue;
            }
        }
        result += value[i];
        ++i;
    }
    return result;
}

std::string ConfigManager::ExpandTilde(const std::string& path) {
    if (path.empty() || path[0] != '~') {
        return path;
    }
    if (path.length() > 1 && path[1] != '/') {
        return path;  // ~user is not supported
    }

    std::string home;
    if (const char* env = std::getenv("HOME")) {
        home = env;
    } else if (struct passwd* pw = getpwuid(getuid())) {
        home = pw->pw_dir;
    }
    if (home.empty()) {
        return path;
    }
    return home + path.substr(1);
}

std::string ConfigManager::GetDefaultDataDir() {
    const char* home = std::getenv("HOME");
    if (!home) {
        return DEFAULT_DATADIR_NAME;
    }
    return std::string(home) + "/" + DEFAULT_DATADIR_NAME;
}

// ============================================================================
// Internal Key Management
// ============================================================================

std::string ConfigManager::MakeKey(const std::string& key, const std::string& section) const {
    if (section.empty()) {
        return key;
    }
    return section + ":" + key;
}

void ConfigManager::Store(ConfigEntry entry) {
    std::string fullKey = MakeKey(entry.key, entry.section);

    if (!entry.section.empty() &&
        std::find(sectionOrder_.begin(), sectionOrder_.end(), entry.section) ==
            sectionOrder_.end()) {
        sectionOrder_.push_back(entry.section);
    }

    auto it = entries_.find(fullKey);
    bool repeatInFile = it != entries_.end() && !it->second.isDefault &&
                        it->second.source != SOURCE_COMMAND_LINE &&
                        entry.source != SOURCE_COMMAND_LINE;
    if (repeatInFile) {
        // Repeated key: first value stays primary, every value is listed
        lists_[fullKey].push_back(entry.value);
        return;
    }

    if (it != entries_.end() && it->second.source == SOURCE_COMMAND_LINE &&
        entry.source != SOURCE_COMMAND_LINE) {
        return;  // command line wins over the file
    }

    lists_[fullKey] = {entry.value};
    entries_[fullKey] = std::move(entry);
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
        if (!IsValidKey(currentSection)) {
            result = ConfigParseResult::Error(
                "Invalid section name: " + currentSection, source, lineNum);
            return false;
        }
        if (std::find(sectionOrder_.begin(), sectionOrder_.end(), currentSection) ==
            sectionOrder_.end()) {
            sectionOrder_.push_back(currentSection);
        }
        return true;
    }

    ConfigEntry entry;
    entry.section = currentSection;
    entry.source = source;
    entry.lineNumber = lineNum;

    size_t eqPos = trimmed.find('=');
    if (eqPos == std::string::npos) {
        // Bare key is a boolean flag; "nokey" negates it
        entry.key = trimmed;
        entry.value = "true";
        if (entry.key.length() > 2 && entry.key.compare(0, 2, "no") == 0 &&
            std::islower(static_cast<unsigned char>(entry.key[2]))) {
            entry.key = entry.key.substr(2);
            entry.value = "false";
        }
    } else {
        entry.key = Trim(trimmed.substr(0, eqPos));
        entry.value = ExpandEnvVars(Unquote(Trim(trimmed.substr(eqPos + 1))));
    }

    if (!IsValidKey(entry.key)) {
        result = ConfigParseResult::Error(
            entry.key.empty() ? "Empty key" : "Invalid key: " + entry.key,
            source, lineNum);
        return false;
    }

    Store(std::move(entry));
    return true;
}

ConfigParseResult ConfigManager::ParseStream(std::istream& in, const std::string& source) {
    std::string currentSection;
    std::string line;
    std::string continuation;
    int lineNum = 0;

    ConfigParseResult result = ConfigParseResult::Success();

    while (std::getline(in, line)) {
        ++lineNum;

        if (line.length() > MAX_LINE_LENGTH) {
            return ConfigParseResult::Error(
                "Line too long (max " + std::to_string(MAX_LINE_LENGTH) + " characters)",
                source, lineNum);
        }

        if (!line.empty() && line.back() == '\\') {
            continuation += line.substr(0, line.length() - 1);
            continue;
        }
        if (!continuation.empty()) {
            line = continuation + line;
            continuation.clear();
        }

        if (!ParseLine(line, source, lineNum, currentSection, result)) {
            return result;
        }
    }

    if (!continuation.empty() &&
        !ParseLine(continuation, source, lineNum, currentSection, result)) {
        return result;
    }

    return ConfigParseResult::Success();
}

ConfigParseResult ConfigManager::ParseFile(const std::string& filePath) {
    std::string path = ExpandEnvVars(ExpandTilde(filePath));

    std::ifstream file(path);
    if (!file.is_open()) {
        return ConfigParseResult::Error("Cannot open file: " + path);
    }

    file.seekg(0, std::ios::end);
    auto fileSize = file.tellg();
    file.seekg(0, std::ios::beg);
    if (fileSize > static_cast<std::streampos>(MAX_CONFIG_SIZE)) {
        return ConfigParseResult::Error(
            "Config file too large (max " + std::to_string(MAX_CONFIG_SIZE) + " bytes)",
            path);
    }

    return ParseStream(file, path);
}

ConfigParseResult ConfigManager::ParseString(const std::string& content,
                                             const std::string& sourceName) {
    std::istringstream stream(content);
    return ParseStream(stream, sourceName);
}

ConfigParseResult ConfigManager::ParseCommandLine(int argc, const char* const argv[]) {
    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];

        if (arg.empty() || arg[0] != '-') {
            return ConfigParseResult::Error("Unexpected argument: " + arg,
                                            SOURCE_COMMAND_LINE);
        }
        while (!arg.empty() && arg[0] == '-') {
            arg = arg.substr(1);
        }

        ConfigEntry entry;
        entry.source = SOURCE_COMMAND_LINE;

        size_t eqPos = arg.find('=');
        if (eqPos != std::string::npos) {
            entry.key = arg.substr(0, eqPos);
            entry.value = arg.substr(eqPos + 1);
        } else if (arg.length() > 2 && arg.compare(0, 2, "no") == 0 &&
                   std::islower(static_cast<unsigned char>(arg[2]))) {
            entry.key = arg.substr(2);
            entry.value = "false";
        } else {
            entry.key = arg;
            entry.value = "true";
        }

        if (!IsValidKey(entry.key)) {
            return ConfigParseResult::Error("Invalid option: " + std::string(argv[i]),
                                            SOURCE_COMMAND_LINE);
        }
        Store(std::move(entry));
    }

    return ConfigParseResult::Success();
}

// ============================================================================
// Value Retrieval
// ============================================================================

bool ConfigManager::HasKey(const std::string& key, const std::string& section) const {
    return entries_.count(MakeKey(key, section)) > 0;
}

std::optional<std::string> ConfigManager::TryGetString(const std::string& key,
                                                       const std::string& section) const {
    auto it = entries_.find(MakeKey(key, section));
    if (it != entries_.end()) {
        return it->second.value;
    }
    return std::nullopt;
}

std::string ConfigManager::GetString(const std::string& key,
                                     const std::string& defaultValue,
                                     const std::string& section) const {
    return TryGetString(key, section).value_or(defaultValue);
}

std::optional<int64_t> ConfigManager::TryGetInt(const std::string& key,
                                                const std::string& section) const {
    auto str = TryGetString(key, section);
    if (!str) {
        return std::nullopt;
    }
    std::string value = Trim(*str);
    if (value.empty()) {
        return std::nullopt;
    }

    try {
        size_t pos = 0;
        int64_t parsed = std::stoll(value, &pos, 10);
        if (pos != value.length()) {
            return std::nullopt;
        }
        return parsed;
    } catch (const std::exception&) {
        return std::nullopt;
    }
}

int64_t ConfigManager::GetInt(const std::string& key,
                              int64_t defaultValue,
                              const std::string& section) const {
    return TryGetInt(key, section).value_or(defaultValue);
}

std::optional<uint64_t> ConfigManager::TryGetUInt(const std::string& key,
                                                  const std::string& section) const {
    auto value = TryGetInt(key, section);
    if (!value || *value < 0) {
        return std::nullopt;
    }
    return static_cast<uint64_t>(*value);
}

uint64_t ConfigManager::GetUInt(const std::string& key,
                                uint64_t defaultValue,
                                const std::string& section) const {
    return TryGetUInt(key, section).value_or(defaultValue);
}

std::optional<bool> ConfigManager::TryGetBool(const std::string& key,
                                              const std::string& section) const {
    auto str = TryGetString(key, section);
    if (!str) {
        return std::nullopt;
    }
    return ParseBool(*str);
}

bool ConfigManager::GetBool(const std::string& key,
                            bool defaultValue,
                            const std::string& section) const {
    return TryGetBool(key, section).value_or(defaultValue);
}

std::vector<std::string> ConfigManager::GetList(const std::string& key,
                                                const std::string& section) const {
    std::vector<std::string> result;

    auto it = lists_.find(MakeKey(key, section));
    if (it == lists_.end()) {
        return result;
    }

    // Each value may itself be comma-separated
    for (const auto& value : it->second) {
        std::istringstream ss(value);
        std::string item;
        while (std::getline(ss, item, ',')) {
            item = Trim(item);
            if (!item.empty()) {
                result.push_back(item);
            }
        }
    }
    return result;
}

std::string ConfigManager::GetPath(const std::string& key,
                                   const std::string& defaultValue,
                                   const std::string& section) const {
    return ExpandEnvVars(ExpandTilde(GetString(key, defaultValue, section)));
}

std::string ConfigManager::GetSource(const std::string& key,
                                     const std::string& section) const {
    auto it = entries_.find(MakeKey(key, section));
    return it != entries_.end() ? it->second.source : "";
}

// ============================================================================
// Value Setting
// ============================================================================

void ConfigManager::Set(const std::string& key, const std::string& value,
                        const std::string& section) {
    std::string fullKey = MakeKey(key, section);

    ConfigEntry entry;
    entry.key = key;
    entry.value = value;
    entry.section = section;
    entry.source = "<programmatic>";

    lists_[fullKey] = {value};
    entries_[fullKey] = std::move(entry);
}

void ConfigManager::SetDefault(const std::string& key, const std::string& value,
                               const std::string& section) {
    std::string fullKey = MakeKey(key, section);
    if (entries_.count(fullKey) > 0) {
        return;
    }

    ConfigEntry entry;
    entry.key = key;
    entry.value = value;
    entry.section = section;
    entry.source = SOURCE_DEFAULT;
    entry.isDefault = true;

    lists_[fullKey] = {value};
    entries_[fullKey] = std::move(entry);
}

// ============================================================================
// Sections
// ============================================================================

std::vector<std::string> ConfigManager::GetSections() const {
    return sectionOrder_;
}

std::vector<std::string> ConfigManager::GetKeys(const std::string& section) const {
    std::vector<std::string> keys;
    for (const auto& [fullKey, entry] : entries_) {
        if (entry.section == section) {
            keys.push_back(entry.key);
        }
    }
    return keys;
}

void ConfigManager::Clear() {
    entries_.clear();
    lists_.clear();
    sectionOrder_.clear();
}

} // namespace util
} // namespace refindex
