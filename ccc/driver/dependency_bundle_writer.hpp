#pragma once

#include "../dependencies/traverser.hpp"

#include <cstddef>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace ccc
{
    struct DependencyBundle
    {
        std::vector<std::filesystem::path> roots;
        std::optional<std::size_t> maxDepth;
        const deps::TraversalResult* traversal{nullptr};
    };

    [[nodiscard]] std::string renderDependencyBundle(const DependencyBundle& bundle);

    bool writeDependencyBundle(const std::filesystem::path& outputPath,
        const DependencyBundle& bundle,
        std::string& errorMessage);
} // namespace ccc
