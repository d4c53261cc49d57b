#pragma once

#include <filesystem>
#include <string>
#include <string_view>
#include <vector>

namespace ccc
{
    struct PrimaryDocument
    {
        std::string displayPath;
        std::string fenceLanguage;
        std::string content;
    };

    struct ContextDocument
    {
        std::vector<PrimaryDocument> primaries;
        std::string signatures;
        bool signaturesOnly{false};
    };

    [[nodiscard]] std::string fenceLanguageFor(const std::filesystem::path& path);

    // Full content or "Error reading: <reason>" when the file cannot be read.
    [[nodiscard]] PrimaryDocument loadPrimaryDocument(const std::filesystem::path& path, std::string displayPath);

    [[nodiscard]] std::string renderContextDocument(const ContextDocument& document);
} // namespace ccc
