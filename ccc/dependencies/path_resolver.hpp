#pragma once

#include "language.hpp"

#include <filesystem>
#include <optional>
#include <string_view>
#include <vector>

namespace ccc::deps
{
    enum class ImportMode
    {
        Relative,
        Absolute,
        RootRelative
    };

    [[nodiscard]] ImportMode classifyImport(std::string_view importText, const LanguageRules& rules);

    class PathResolver
    {
    public:
        explicit PathResolver(const LanguageRegistry& registry);

        // Maps an import to the canonical path of the first existing candidate.
        // Roots are tried in order; an empty root list falls back to the
        // directory of currentFile.
        [[nodiscard]] std::optional<std::filesystem::path> resolve(std::string_view importText,
            const std::filesystem::path& currentFile,
            const std::vector<std::filesystem::path>& roots,
            Language language) const;

    private:
        [[nodiscard]] std::optional<std::filesystem::path> resolveRelative(std::string_view importText,
            const std::filesystem::path& currentFile,
            const LanguageRules& rules) const;
        [[nodiscard]] std::optional<std::filesystem::path> resolveInRoots(std::string_view importText,
            const std::filesystem::path& currentFile,
            const std::vector<std::filesystem::path>& roots,
            const LanguageRules& rules) const;
        [[nodiscard]] std::optional<std::filesystem::path> locateCandidate(const std::filesystem::path& base,
            const LanguageRules& rules,
            bool directoryOnly) const;

        const LanguageRegistry& m_registry;
    };
} // namespace ccc::deps
