#pragma once

#include "../dependencies/language.hpp"
#include "command_line.hpp"

#include <cstddef>
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace ccc
{
    struct ConfigEntry
    {
        std::string key;
        std::string value;
        std::size_t line{0};
    };

    class ConfigFile
    {
    public:
        void add(ConfigEntry entry);

        [[nodiscard]] bool contains(std::string_view key) const;
        [[nodiscard]] std::size_t count(std::string_view key) const;
        [[nodiscard]] std::optional<std::string> value(std::string_view key) const;
        [[nodiscard]] std::vector<std::string> values(std::string_view key) const;
        [[nodiscard]] std::vector<std::string> keys() const;
        [[nodiscard]] const std::vector<ConfigEntry>& entries() const noexcept;

    private:
        std::vector<ConfigEntry> m_entries;
    };

    struct ConfigParseResult
    {
        ConfigFile config;
        bool hasError{false};
        std::string code;
        std::string errorMessage;
    };

    struct ConfigValidationResult
    {
        bool hasError{false};
        std::string code;
        std::string errorMessage;
    };

    inline constexpr std::string_view kDefaultConfigFileName = ".ccc.conf";

    [[nodiscard]] ConfigParseResult parseConfigText(std::string_view text);
    [[nodiscard]] ConfigParseResult parseConfigFile(const std::filesystem::path& path);

    [[nodiscard]] ConfigValidationResult validateConfig(const ConfigFile& config);

    // Fills options the command line left at their defaults.
    void applyConfigDefaults(CommandLineOptions& options, const ConfigFile& config);

    // "extensions.<language>" entries, in file order.
    [[nodiscard]] std::vector<std::pair<deps::Language, std::vector<std::string>>> extensionOverrides(const ConfigFile& config);
} // namespace ccc
