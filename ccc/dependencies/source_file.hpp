#pragma once

#include "language.hpp"

#include <filesystem>
#include <optional>
#include <string>

namespace ccc::deps
{
    enum class SourceReadStatus
    {
        Ok,
        ReadFailed,
        NotText
    };

    struct SourceReadResult
    {
        SourceReadStatus status{SourceReadStatus::Ok};
        std::string content;
        std::string errorMessage;
    };

    class SourceFile
    {
    public:
        SourceFile(std::filesystem::path path, Language language);

        [[nodiscard]] const std::filesystem::path& path() const noexcept;
        [[nodiscard]] Language language() const noexcept;

        // Reads the file on first use; later calls return the cached result.
        const SourceReadResult& read();

    private:
        std::filesystem::path m_path;
        Language m_language{Language::Unknown};
        std::optional<SourceReadResult> m_content;
    };

    [[nodiscard]] SourceReadResult readSourceFile(const std::filesystem::path& path);
} // namespace ccc::deps
