#pragma once

#include "../dependencies/language.hpp"

#include <cstddef>
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace ccc::signatures
{
    struct SignatureOptions
    {
        // Approximate token ceiling for the whole listing; empty means no limit.
        std::optional<std::size_t> tokenBudget;
        // Paths under this directory are shown relative to it.
        std::filesystem::path displayBase;
        // Also keep leading comments and the first body line of each declaration.
        bool detailed{false};
    };

    [[nodiscard]] std::vector<std::string> extractDeclarations(std::string_view content,
        deps::Language language,
        bool detailed = false);

    [[nodiscard]] std::string renderSignatures(const std::vector<std::filesystem::path>& files,
        const deps::LanguageRegistry& registry,
        const SignatureOptions& options);

    [[nodiscard]] std::size_t estimateTokens(std::string_view text) noexcept;

    [[nodiscard]] std::string displayPath(const std::filesystem::path& path, const std::filesystem::path& base);
} // namespace ccc::signatures
