#include "config_file.hpp"

#include "value_parsing.hpp"

#include <algorithm>
#include <fstream>
#include <sstream>
#include <system_error>

namespace ccc
{
    namespace
    {
        constexpr std::string_view kExtensionsPrefix = "extensions.";

        std::vector<std::string> splitList(std::string_view text)
        {
            std::vector<std::string> items;
            while (!text.empty())
            {
                const std::size_t comma = text.find(',');
                std::string_view item = trimView(text.substr(0, comma));
                if (!item.empty())
                {
                    items.emplace_back(item);
                }
                if (comma == std::string_view::npos)
                {
                    break;
                }
                text.remove_prefix(comma + 1);
            }
            return items;
        }

        ConfigValidationResult validationError(std::string code, std::string message)
        {
            ConfigValidationResult result;
            result.hasError = true;
            result.code = std::move(code);
            result.errorMessage = std::move(message);
            return result;
        }
    } // namespace

    void ConfigFile::add(ConfigEntry entry)
    {
        m_entries.emplace_back(std::move(entry));
    }

    bool ConfigFile::contains(std::string_view key) const
    {
        return count(key) > 0;
    }

    std::size_t ConfigFile::count(std::string_view key) const
    {
        return static_cast<std::size_t>(std::count_if(m_entries.begin(), m_entries.end(), [key](const ConfigEntry& entry) {
            return entry.key == key;
        }));
    }

    std::optional<std::string> ConfigFile::value(std::string_view key) const
    {
        for (const auto& entry : m_entries)
        {
            if (entry.key == key)
            {
                return entry.value;
            }
        }
        return std::nullopt;
    }

    std::vector<std::string> ConfigFile::values(std::string_view key) const
    {
        std::vector<std::string> matching;
        for (const auto& entry : m_entries)
        {
            if (entry.key == key)
            {
                matching.push_back(entry.value);
            }
        }
        return matching;
    }

    std::vector<std::string> ConfigFile::keys() const
    {
        std::vector<std::string> distinct;
        for (const auto& entry : m_entries)
        {
            if (std::find(distinct.begin(), distinct.end(), entry.key) == distinct.end())
            {
                distinct.push_back(entry.key);
            }
        }
        return distinct;
    }

    const std::vector<ConfigEntry>& ConfigFile::entries() const noexcept
    {
        return m_entries;
    }

    ConfigParseResult parseConfigText(std::string_view text)
    {
        ConfigParseResult result;

        std::istringstream stream{std::string{text}};
        std::string rawLine;
        std::size_t lineNumber = 0;
        while (std::getline(stream, rawLine))
        {
            ++lineNumber;
            const std::string_view line = trimView(rawLine);
            if (line.empty() || line.front() == '#')
            {
                continue;
            }

            const std::size_t equals = line.find('=');
            if (equals == std::string_view::npos)
            {
                result.hasError = true;
                result.code = "CCC-E1100";
                result.errorMessage = "invalid config format at line " + std::to_string(lineNumber) + ": '"
                    + std::string{line} + "' (expected 'key = value').";
                return result;
            }

            const std::string_view key = trimView(line.substr(0, equals));
            if (key.empty())
            {
                result.hasError = true;
                result.code = "CCC-E1101";
                result.errorMessage = "empty key at line " + std::to_string(lineNumber) + ".";
                return result;
            }

            ConfigEntry entry;
            entry.key = std::string{key};
            entry.value = std::string{trimView(line.substr(equals + 1))};
            entry.line = lineNumber;
            result.config.add(std::move(entry));
        }

        return result;
    }

    ConfigParseResult parseConfigFile(const std::filesystem::path& path)
    {
        std::error_code statusError;
        if (!std::filesystem::exists(path, statusError) || statusError)
        {
            ConfigParseResult result;
            result.hasError = true;
            result.code = "CCC-E1102";
            result.errorMessage = "config file not found: '" + path.string() + "'.";
            return result;
        }

        std::ifstream stream(path, std::ios::binary);
        if (!stream)
        {
            ConfigParseResult result;
            result.hasError = true;
            result.code = "CCC-E1103";
            result.errorMessage = "unable to open config file '" + path.string() + "'.";
            return result;
        }

        std::ostringstream buffer;
        buffer << stream.rdbuf();
        return parseConfigText(buffer.str());
    }

    ConfigValidationResult validateConfig(const ConfigFile& config)
    {
        for (const auto& root : config.values("root"))
        {
            std::error_code statusError;
            if (!std::filesystem::exists(root, statusError) || statusError)
            {
                return validationError("CCC-E1200", "root path does not exist: '" + root + "'.");
            }
            if (!std::filesystem::is_directory(root, statusError) || statusError)
            {
                return validationError("CCC-E1200", "root path is not a directory: '" + root + "'.");
            }
        }

        for (std::string_view key : {"dep_depth_max", "sig_tokens"})
        {
            if (config.count(key) > 1)
            {
                return validationError("CCC-E1201", std::string{key} + " may only be set once.");
            }
            auto raw = config.value(key);
            if (raw.has_value() && !parseUnsigned(*raw).has_value())
            {
                return validationError("CCC-E1201", std::string{key} + " must be a non-negative integer, got: '" + *raw + "'.");
            }
        }

        for (std::string_view key : {"sig_only", "sig_detailed", "verbose"})
        {
            if (config.count(key) > 1)
            {
                return validationError("CCC-E1202", std::string{key} + " may only be set once.");
            }
            auto raw = config.value(key);
            if (raw.has_value() && !parseBoolean(*raw).has_value())
            {
                return validationError("CCC-E1202", std::string{key} + " must be true or false, got: '" + *raw + "'.");
            }
        }

        for (const auto& key : config.keys())
        {
            if (key.rfind(kExtensionsPrefix, 0) != 0)
            {
                continue;
            }

            const std::string languageName = key.substr(kExtensionsPrefix.size());
            if (deps::languageFromName(languageName) == deps::Language::Unknown)
            {
                return validationError("CCC-E1203", "unknown language in '" + key + "'.");
            }
        }

        return {};
    }

    void applyConfigDefaults(CommandLineOptions& options, const ConfigFile& config)
    {
        if (options.roots.empty())
        {
            options.roots = config.values("root");
        }

        if (!options.depthMax.has_value())
        {
            if (auto raw = config.value("dep_depth_max"))
            {
                options.depthMax = parseUnsigned(*raw);
            }
        }

        if (!options.sigTokens.has_value())
        {
            if (auto raw = config.value("sig_tokens"))
            {
                options.sigTokens = parseUnsigned(*raw);
            }
        }

        if (!options.outputPath.has_value())
        {
            options.outputPath = config.value("output");
        }

        if (!options.findBy.has_value())
        {
            options.findBy = config.value("find_by");
        }

        if (!options.verbose)
        {
            if (auto raw = config.value("verbose"))
            {
                options.verbose = parseBoolean(*raw).value_or(false);
            }
        }

        if (!options.sigOnly)
        {
            if (auto raw = config.value("sig_only"))
            {
                options.sigOnly = parseBoolean(*raw).value_or(false);
            }
        }

        if (!options.sigDetailed)
        {
            if (auto raw = config.value("sig_detailed"))
            {
                options.sigDetailed = parseBoolean(*raw).value_or(false);
            }
        }
    }

    std::vector<std::pair<deps::Language, std::vector<std::string>>> extensionOverrides(const ConfigFile& config)
    {
        std::vector<std::pair<deps::Language, std::vector<std::string>>> overrides;
        for (const auto& entry : config.entries())
        {
            if (entry.key.rfind(kExtensionsPrefix, 0) != 0)
            {
                continue;
            }

            const deps::Language language = deps::languageFromName(std::string_view{entry.key}.substr(kExtensionsPrefix.size()));
            if (language == deps::Language::Unknown)
            {
                continue;
            }

            overrides.emplace_back(language, splitList(entry.value));
        }
        return overrides;
    }
} // namespace ccc
