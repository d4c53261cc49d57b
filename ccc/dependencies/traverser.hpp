#pragma once

#include "diagnostic.hpp"
#include "language.hpp"
#include "path_resolver.hpp"
#include "source_file.hpp"

#include <cstddef>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace ccc::deps
{
    struct ResolvedDependency
    {
        std::filesystem::path path;
        std::size_t depth{0};
        Language language{Language::Unknown};
        // Import text and canonical path of the file that first reached this
        // one. Both stay empty for primary files.
        std::string importText;
        std::filesystem::path importedBy;
    };

    struct UnresolvedImport
    {
        std::string importText;
        std::filesystem::path filePath;
    };

    struct TraversalResult
    {
        // Discovery order; depth never decreases along the vector.
        std::vector<ResolvedDependency> files;
        std::vector<UnresolvedImport> unresolvedImports;
        std::vector<Diagnostic> diagnostics;
        bool hasError{false};
        std::string errorMessage;

        [[nodiscard]] std::vector<ResolvedDependency> primaryFiles() const;
        [[nodiscard]] std::vector<ResolvedDependency> dependencyFiles() const;
        [[nodiscard]] std::size_t warningCount() const noexcept;
    };

    class Traverser
    {
    public:
        explicit Traverser(const LanguageRegistry& registry);

        // Breadth-first expansion from the primary files. The first round always
        // runs; every following round needs its depth to be within maxDepth.
        // An empty maxDepth expands until no new file is found.
        [[nodiscard]] TraversalResult traverse(const std::vector<std::filesystem::path>& primaryFiles,
            const std::vector<std::filesystem::path>& roots,
            std::optional<std::size_t> maxDepth) const;

    private:
        [[nodiscard]] std::vector<std::string> collectImports(SourceFile& source, TraversalResult& result) const;

        const LanguageRegistry& m_registry;
        PathResolver m_resolver;
    };
} // namespace ccc::deps
