#pragma once

#include <filesystem>
#include <string>
#include <string_view>

namespace ccc
{
    // Creates missing parent directories and replaces the file's content.
    bool writeTextFile(const std::filesystem::path& outputPath, std::string_view text, std::string& errorMessage);
} // namespace ccc
