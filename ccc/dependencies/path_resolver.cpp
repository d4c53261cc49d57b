#include "path_resolver.hpp"

#include <string>
#include <system_error>

namespace ccc::deps
{
    namespace
    {
        bool startsWith(std::string_view text, std::string_view prefix)
        {
            return text.rfind(prefix, 0) == 0;
        }

        std::filesystem::path importToRelativePath(std::string_view importText, SeparatorStyle style)
        {
            if (style == SeparatorStyle::Verbatim)
            {
                return std::filesystem::path{std::string{importText}};
            }

            std::string normalized;
            normalized.reserve(importText.size());
            for (char ch : importText)
            {
                normalized.push_back(ch == '.' ? static_cast<char>(std::filesystem::path::preferred_separator) : ch);
            }
            return std::filesystem::path{normalized};
        }

        bool isRegularFile(const std::filesystem::path& candidate)
        {
            std::error_code error;
            return std::filesystem::is_regular_file(candidate, error) && !error;
        }

        bool isDirectory(const std::filesystem::path& candidate)
        {
            std::error_code error;
            return std::filesystem::is_directory(candidate, error) && !error;
        }

        std::optional<std::filesystem::path> canonicalize(const std::filesystem::path& candidate)
        {
            std::error_code error;
            std::filesystem::path canonical = std::filesystem::canonical(candidate, error);
            if (error)
            {
                return std::nullopt;
            }
            return canonical;
        }

        std::filesystem::path directoryOf(const std::filesystem::path& file)
        {
            std::error_code error;
            std::filesystem::path absolute = std::filesystem::absolute(file, error);
            if (error)
            {
                absolute = file;
            }
            return absolute.lexically_normal().parent_path();
        }
    } // namespace

    ImportMode classifyImport(std::string_view importText, const LanguageRules& rules)
    {
        if (startsWith(importText, "./") || startsWith(importText, "../") || importText == "." || importText == "..")
        {
            return ImportMode::Relative;
        }

        if (rules.pythonRelativeDots && startsWith(importText, "."))
        {
            return ImportMode::Relative;
        }

        if (std::filesystem::path{std::string{importText}}.is_absolute())
        {
            return ImportMode::Absolute;
        }

        return ImportMode::RootRelative;
    }

    PathResolver::PathResolver(const LanguageRegistry& registry)
        : m_registry(registry)
    {
    }

    std::optional<std::filesystem::path> PathResolver::resolve(std::string_view importText,
        const std::filesystem::path& currentFile,
        const std::vector<std::filesystem::path>& roots,
        Language language) const
    {
        if (importText.empty())
        {
            return std::nullopt;
        }

        const LanguageRules* rules = m_registry.find(language);
        if (rules == nullptr)
        {
            return std::nullopt;
        }

        switch (classifyImport(importText, *rules))
        {
        case ImportMode::Relative:
            return resolveRelative(importText, currentFile, *rules);
        case ImportMode::Absolute:
            return locateCandidate(std::filesystem::path{std::string{importText}}.lexically_normal(), *rules, false);
        case ImportMode::RootRelative:
            return resolveInRoots(importText, currentFile, roots, *rules);
        }

        return std::nullopt;
    }

    std::optional<std::filesystem::path> PathResolver::resolveRelative(std::string_view importText,
        const std::filesystem::path& currentFile,
        const LanguageRules& rules) const
    {
        std::filesystem::path directory = directoryOf(currentFile);

        if (rules.pythonRelativeDots && importText.front() == '.' && !startsWith(importText, "./")
            && !startsWith(importText, "../"))
        {
            // One dot is the current package; every further dot climbs one level.
            std::size_t dotCount = 0;
            while (dotCount < importText.size() && importText[dotCount] == '.')
            {
                ++dotCount;
            }
            for (std::size_t level = 1; level < dotCount; ++level)
            {
                directory = directory.parent_path();
            }

            const std::string_view remainder = importText.substr(dotCount);
            if (remainder.empty())
            {
                return locateCandidate(directory, rules, true);
            }

            return locateCandidate(directory / importToRelativePath(remainder, SeparatorStyle::Dotted), rules, false);
        }

        const std::filesystem::path base = (directory / std::filesystem::path{std::string{importText}}).lexically_normal();
        return locateCandidate(base, rules, false);
    }

    std::optional<std::filesystem::path> PathResolver::resolveInRoots(std::string_view importText,
        const std::filesystem::path& currentFile,
        const std::vector<std::filesystem::path>& roots,
        const LanguageRules& rules) const
    {
        const std::filesystem::path relative = importToRelativePath(importText, rules.separatorStyle);

        if (roots.empty())
        {
            return locateCandidate((directoryOf(currentFile) / relative).lexically_normal(), rules, false);
        }

        for (const auto& root : roots)
        {
            auto located = locateCandidate((root / relative).lexically_normal(), rules, false);
            if (located.has_value())
            {
                return located;
            }
        }

        return std::nullopt;
    }

    std::optional<std::filesystem::path> PathResolver::locateCandidate(const std::filesystem::path& base,
        const LanguageRules& rules,
        bool directoryOnly) const
    {
        if (!directoryOnly)
        {
            if (isRegularFile(base))
            {
                if (auto canonical = canonicalize(base))
                {
                    return canonical;
                }
            }

            for (const auto& extension : rules.candidateExtensions)
            {
                std::filesystem::path candidate = base;
                candidate += extension;
                if (isRegularFile(candidate))
                {
                    if (auto canonical = canonicalize(candidate))
                    {
                        return canonical;
                    }
                }
            }
        }

        if (!isDirectory(base))
        {
            return std::nullopt;
        }

        for (const auto& indexFile : rules.indexFiles)
        {
            const std::filesystem::path candidate = base / indexFile;
            if (isRegularFile(candidate))
            {
                if (auto canonical = canonicalize(candidate))
                {
                    return canonical;
                }
            }
        }

        return std::nullopt;
    }
} // namespace ccc::deps
