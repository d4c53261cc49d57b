#pragma once

#include <filesystem>
#include <string>

namespace ccc::deps
{
    struct Diagnostic
    {
        std::string code;
        std::string message;
        std::filesystem::path filePath;
        bool isWarning{false};
    };
} // namespace ccc::deps
