#pragma once

#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace ccc
{
    struct FileCollectionResult
    {
        std::vector<std::filesystem::path> files;
        bool hasError{false};
        std::string code;
        std::string errorMessage;
    };

    struct FindCommandResult
    {
        std::vector<std::string> lines;
        bool hasError{false};
        std::string errorMessage;
    };

    // Runs the command through the shell and keeps its non-blank stdout lines.
    [[nodiscard]] FindCommandResult runFindCommand(const std::string& command);

    // Find-command output first, then positional inputs; duplicates keep their
    // first position and every path is made absolute.
    [[nodiscard]] FileCollectionResult collectInputFiles(const std::vector<std::string>& inputPaths,
        const std::optional<std::string>& findBy);
} // namespace ccc
