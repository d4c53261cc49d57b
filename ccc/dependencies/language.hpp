#pragma once

#include <filesystem>
#include <functional>
#include <string>
#include <string_view>
#include <vector>

namespace ccc::deps
{
    enum class Language
    {
        Unknown,
        Python,
        JavaScript,
        TypeScript,
        Java,
        Json
    };

    enum class SeparatorStyle
    {
        // Root-relative import text is already a slash path ("src/utils").
        Verbatim,
        // Dots separate package components ("com.example.Util").
        Dotted
    };

    using ExtractFunction = std::function<std::vector<std::string>(std::string_view content)>;

    struct LanguageRules
    {
        Language language{Language::Unknown};
        std::vector<std::string> sourceExtensions;
        std::vector<std::string> candidateExtensions;
        std::vector<std::string> indexFiles;
        SeparatorStyle separatorStyle{SeparatorStyle::Verbatim};
        bool pythonRelativeDots{false};
        ExtractFunction extract;
    };

    class LanguageRegistry
    {
    public:
        LanguageRegistry() = default;

        void add(LanguageRules rules);
        [[nodiscard]] bool setCandidateExtensions(Language language, std::vector<std::string> extensions);

        [[nodiscard]] const LanguageRules* find(Language language) const noexcept;
        [[nodiscard]] Language languageForPath(const std::filesystem::path& path) const;

    private:
        std::vector<LanguageRules> m_rules;
    };

    [[nodiscard]] LanguageRegistry makeDefaultLanguageRegistry();

    const char* toString(Language language);
    [[nodiscard]] Language languageFromName(std::string_view name);
} // namespace ccc::deps
