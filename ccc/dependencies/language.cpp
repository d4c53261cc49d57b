#include "language.hpp"

#include "import_extractor.hpp"

#include <algorithm>
#include <cctype>
#include <utility>

namespace ccc::deps
{
    namespace
    {
        std::string toLower(std::string_view text)
        {
            std::string lowered;
            lowered.reserve(text.size());
            for (char ch : text)
            {
                lowered.push_back(static_cast<char>(std::tolower(static_cast<unsigned char>(ch))));
            }
            return lowered;
        }

        bool hasSuffix(std::string_view text, std::string_view suffix)
        {
            return text.size() >= suffix.size() && text.compare(text.size() - suffix.size(), suffix.size(), suffix) == 0;
        }
    } // namespace

    void LanguageRegistry::add(LanguageRules rules)
    {
        auto existing = std::find_if(m_rules.begin(), m_rules.end(), [&rules](const LanguageRules& entry) {
            return entry.language == rules.language;
        });

        if (existing != m_rules.end())
        {
            *existing = std::move(rules);
            return;
        }

        m_rules.emplace_back(std::move(rules));
    }

    bool LanguageRegistry::setCandidateExtensions(Language language, std::vector<std::string> extensions)
    {
        for (auto& rules : m_rules)
        {
            if (rules.language != language)
            {
                continue;
            }

            for (auto& extension : extensions)
            {
                if (!extension.empty() && extension.front() != '.')
                {
                    extension.insert(extension.begin(), '.');
                }
            }
            extensions.erase(std::remove(extensions.begin(), extensions.end(), std::string{}), extensions.end());

            rules.candidateExtensions = std::move(extensions);
            return true;
        }

        return false;
    }

    const LanguageRules* LanguageRegistry::find(Language language) const noexcept
    {
        for (const auto& rules : m_rules)
        {
            if (rules.language == language)
            {
                return &rules;
            }
        }
        return nullptr;
    }

    Language LanguageRegistry::languageForPath(const std::filesystem::path& path) const
    {
        const std::string fileName = toLower(path.filename().string());

        // Longest suffix wins so ".d.ts" style extensions stay unambiguous.
        Language best = Language::Unknown;
        std::size_t bestLength = 0;
        for (const auto& rules : m_rules)
        {
            for (const auto& extension : rules.sourceExtensions)
            {
                if (extension.size() > bestLength && hasSuffix(fileName, extension))
                {
                    best = rules.language;
                    bestLength = extension.size();
                }
            }
        }

        return best;
    }

    LanguageRegistry makeDefaultLanguageRegistry()
    {
        LanguageRegistry registry;

        LanguageRules python;
        python.language = Language::Python;
        python.sourceExtensions = {".py", ".pyi"};
        python.candidateExtensions = {".py", ".pyi"};
        python.indexFiles = {"__init__.py"};
        python.separatorStyle = SeparatorStyle::Dotted;
        python.pythonRelativeDots = true;
        python.extract = extractPythonImports;
        registry.add(std::move(python));

        LanguageRules javascript;
        javascript.language = Language::JavaScript;
        javascript.sourceExtensions = {".js", ".mjs", ".cjs", ".jsx"};
        javascript.candidateExtensions = {".js", ".mjs", ".cjs", ".jsx", ".json"};
        javascript.indexFiles = {"index.js", "index.mjs", "index.jsx"};
        javascript.extract = extractScriptImports;
        registry.add(std::move(javascript));

        LanguageRules typescript;
        typescript.language = Language::TypeScript;
        typescript.sourceExtensions = {".ts", ".tsx", ".mts", ".cts"};
        typescript.candidateExtensions = {".ts", ".tsx", ".d.ts", ".js", ".json"};
        typescript.indexFiles = {"index.ts", "index.tsx", "index.js"};
        typescript.extract = extractScriptImports;
        registry.add(std::move(typescript));

        LanguageRules java;
        java.language = Language::Java;
        java.sourceExtensions = {".java"};
        java.candidateExtensions = {".java"};
        java.separatorStyle = SeparatorStyle::Dotted;
        java.extract = extractJavaImports;
        registry.add(std::move(java));

        LanguageRules json;
        json.language = Language::Json;
        json.sourceExtensions = {".json"};
        registry.add(std::move(json));

        return registry;
    }

    const char* toString(Language language)
    {
        switch (language)
        {
        case Language::Unknown:
            return "unknown";
        case Language::Python:
            return "python";
        case Language::JavaScript:
            return "javascript";
        case Language::TypeScript:
            return "typescript";
        case Language::Java:
            return "java";
        case Language::Json:
            return "json";
        }
        return "unknown";
    }

    Language languageFromName(std::string_view name)
    {
        const std::string lowered = toLower(name);
        if (lowered == "python") return Language::Python;
        if (lowered == "javascript") return Language::JavaScript;
        if (lowered == "typescript") return Language::TypeScript;
        if (lowered == "java") return Language::Java;
        if (lowered == "json") return Language::Json;
        return Language::Unknown;
    }
} // namespace ccc::deps
