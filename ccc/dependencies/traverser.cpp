#include "traverser.hpp"

#include "import_extractor.hpp"

#include <algorithm>
#include <iterator>
#include <system_error>
#include <unordered_set>
#include <utility>

namespace ccc::deps
{
    std::vector<ResolvedDependency> TraversalResult::primaryFiles() const
    {
        std::vector<ResolvedDependency> primaries;
        std::copy_if(files.begin(), files.end(), std::back_inserter(primaries), [](const ResolvedDependency& entry) {
            return entry.depth == 0;
        });
        return primaries;
    }

    std::vector<ResolvedDependency> TraversalResult::dependencyFiles() const
    {
        std::vector<ResolvedDependency> dependencies;
        std::copy_if(files.begin(), files.end(), std::back_inserter(dependencies), [](const ResolvedDependency& entry) {
            return entry.depth > 0;
        });
        return dependencies;
    }

    std::size_t TraversalResult::warningCount() const noexcept
    {
        return static_cast<std::size_t>(std::count_if(diagnostics.begin(), diagnostics.end(), [](const Diagnostic& diagnostic) {
            return diagnostic.isWarning;
        }));
    }

    Traverser::Traverser(const LanguageRegistry& registry)
        : m_registry(registry)
        , m_resolver(registry)
    {
    }

    TraversalResult Traverser::traverse(const std::vector<std::filesystem::path>& primaryFiles,
        const std::vector<std::filesystem::path>& roots,
        std::optional<std::size_t> maxDepth) const
    {
        TraversalResult result;

        if (primaryFiles.empty())
        {
            result.hasError = true;
            result.errorMessage = "at least one primary file is required.";
            return result;
        }

        std::unordered_set<std::string> visited;
        std::vector<std::size_t> frontier;

        for (const auto& primary : primaryFiles)
        {
            std::error_code error;
            std::filesystem::path canonical = std::filesystem::canonical(primary, error);
            if (error || !std::filesystem::is_regular_file(canonical, error) || error)
            {
                result.files.clear();
                result.hasError = true;
                result.errorMessage = "primary file '" + primary.string() + "' does not exist or is not a regular file.";
                return result;
            }

            if (!visited.insert(canonical.string()).second)
            {
                continue;
            }

            ResolvedDependency entry;
            entry.language = m_registry.languageForPath(canonical);
            entry.path = std::move(canonical);
            entry.depth = 0;
            frontier.push_back(result.files.size());
            result.files.emplace_back(std::move(entry));
        }

        std::size_t depth = 0;
        while (!frontier.empty())
        {
            if (maxDepth.has_value() && depth > *maxDepth)
            {
                break;
            }

            std::vector<std::size_t> nextFrontier;
            for (std::size_t index : frontier)
            {
                // Copy: result.files grows while this file is expanded.
                const ResolvedDependency current = result.files[index];

                SourceFile source{current.path, current.language};
                for (const auto& importText : collectImports(source, result))
                {
                    auto resolved = m_resolver.resolve(importText, current.path, roots, current.language);
                    if (!resolved.has_value())
                    {
                        result.unresolvedImports.push_back({importText, current.path});
                        continue;
                    }

                    if (!visited.insert(resolved->string()).second)
                    {
                        continue;
                    }

                    ResolvedDependency discovered;
                    discovered.language = m_registry.languageForPath(*resolved);
                    discovered.path = std::move(*resolved);
                    discovered.depth = depth + 1;
                    discovered.importText = importText;
                    discovered.importedBy = current.path;
                    nextFrontier.push_back(result.files.size());
                    result.files.emplace_back(std::move(discovered));
                }
            }

            frontier = std::move(nextFrontier);
            ++depth;
        }

        return result;
    }

    std::vector<std::string> Traverser::collectImports(SourceFile& source, TraversalResult& result) const
    {
        const LanguageRules* rules = m_registry.find(source.language());
        if (rules == nullptr || !rules->extract)
        {
            return {};
        }

        // readSourceFile has already rejected binary and malformed UTF-8 content.
        const SourceReadResult& content = source.read();
        switch (content.status)
        {
        case SourceReadStatus::Ok:
            return extractImports(content.content, rules);
        case SourceReadStatus::ReadFailed:
            result.diagnostics.push_back({"CCC-W2100", content.errorMessage, source.path(), true});
            return {};
        case SourceReadStatus::NotText:
            result.diagnostics.push_back({"CCC-W2101", content.errorMessage, source.path(), true});
            return {};
        }

        return {};
    }
} // namespace ccc::deps
