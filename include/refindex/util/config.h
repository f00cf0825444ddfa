// REFINDEX - Configuration File Parser
// Copyright (c) 2024 REFINDEX Developers
// MIT License
//
// Parses INI-style configuration for the indexer daemon.
//
// Configuration file format:
// - Lines starting with # or ; are comments
// - key=value pairs
// - Section headers: [section] (one section per network)
// - Values can be quoted: key="value with spaces"
// - A key may repeat; GetList() returns every value in file order
// - Boolean values: true/false, yes/no, on/off, 1/0
// - Environment variable expansion: ${VAR_NAME}

#ifndef REFINDEX_UTIL_CONFIG_H
#define REFINDEX_UTIL_CONFIG_H

#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace refindex {
namespace util {

// ============================================================================
// Configuration Constants
// ============================================================================

/// Default data directory name (under $HOME)
constexpr const char* DEFAULT_DATADIR_NAME = ".refindex";

/// Default config file name
constexpr const char* DEFAULT_CONFIG_FILENAME = "refindex.conf";

/// Maximum config file size (1 MB)
constexpr size_t MAX_CONFIG_SIZE = 1024 * 1024;

/// Maximum line length
constexpr size_t MAX_LINE_LENGTH = 4096;

// ============================================================================
// Configuration Entry
// ============================================================================

/**
 * A single configuration entry.
 */
struct ConfigEntry {
    std::string key;
    std::string value;
    std::string section;   // Empty for global section
    std::string source;    // File path where this was defined
    int lineNumber{0};
    bool isDefault{false};
};

// ============================================================================
// Configuration Parse Result
// ============================================================================

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

    /// "file:line: message" for startup diagnostics
    std::string ToString() const;
};

// ============================================================================
// Configuration Manager
// ============================================================================

/**
 * Holds configuration from a file and from command-line arguments.
 *
 * Command-line arguments always win over file values. File values win over
 * SetDefault() values.
 */
class ConfigManager {
public:
    ConfigManager() = default;

    // ========================================================================
    // Parsing
    // ========================================================================

    /// Parse a configuration file
    ConfigParseResult ParseFile(const std::string& filePath);

    /// Parse configuration text; sourceName appears in error messages
    ConfigParseResult ParseString(const std::string& content,
                                  const std::string& sourceName = "<string>");

    /**
     * Parse command-line arguments of the form -key, -key=value, -nokey.
     * Arguments always land in the global section.
     */
    ConfigParseResult ParseCommandLine(int argc, const char* const argv[]);

    // ========================================================================
    // Value Retrieval
    // ========================================================================

    bool HasKey(const std::string& key, const std::string& section = "") const;

    std::optional<std::string> TryGetString(const std::string& key,
                                            const std::string& section = "") const;

    std::string GetString(const std::string& key,
                          const std::string& defaultValue,
                          const std::string& section = "") const;

    /// Integer value; nullopt if missing or not an integer
    std::optional<int64_t> TryGetInt(const std::string& key,
                                     const std::string& section = "") const;

    int64_t GetInt(const std::string& key,
                   int64_t defaultValue,
                   const std::string& section = "") const;

    std::optional<uint64_t> TryGetUInt(const std::string& key,
                                       const std::string& section = "") const;

    uint64_t GetUInt(const std::string& key,
                     uint64_t defaultValue,
                     const std::string& section = "") const;

    std::optional<bool> TryGetBool(const std::string& key,
                                   const std::string& section = "") const;

    bool GetBool(const std::string& key,
                 bool defaultValue,
                 const std::string& section = "") const;

    /// Every value of a repeated key, in definition order
    std::vector<std::string> GetList(const std::string& key,
                                     const std::string& section = "") const;

    /// String value with ~ and ${VAR} expansion
    std::string GetPath(const std::string& key,
                        const std::string& defaultValue = "",
                        const std::string& section = "") const;

    /// Where a key was defined ("<default>", "<command-line>", file path)
    std::string GetSource(const std::string& key,
                          const std::string& section = "") const;

    // ========================================================================
    // Value Setting
    // ========================================================================

    void Set(const std::string& key, const std::string& value,
             const std::string& section = "");

    /// Only takes effect when the key is not already present
    void SetDefault(const std::string& key, const std::string& value,
                    const std::string& section = "");

    // ========================================================================
    // Sections
    // ========================================================================

    /// Section names in first-appearance order
    std::vector<std::string> GetSections() const;

    std::vector<std::string> GetKeys(const std::string& section = "") const;

    // ========================================================================
    // Utilities
    // ========================================================================

    void Clear();

    size_t Size() const { return entries_.size(); }

    static std::string GetDefaultDataDir();

    static std::string ExpandEnvVars(const std::string& value);

    static std::string ExpandTilde(const std::string& path);

private:
    std::string MakeKey(const std::string& key, const std::string& section) const;

    ConfigParseResult ParseStream(std::istream& in, const std::string& source);

    bool ParseLine(const std::string& line, const std::string& source, int lineNum,
                   std::string& currentSection, ConfigParseResult& result);

    void Store(ConfigEntry entry);

    static bool IsValidKey(const std::string& key);

    static std::string Trim(const std::string& str);

    static std::string Unquote(const std::string& str);

    static std::optional<bool> ParseBool(const std::string& str);

    std::map<std::string, ConfigEntry> entries_;
    std::map<std::string, std::vector<std::string>> lists_;  // Every value of a key
    std::vector<std::string> sectionOrder_;
};

} // namespace util
} // namespace refindex

#endif // REFINDEX_UTIL_CONFIG_H
