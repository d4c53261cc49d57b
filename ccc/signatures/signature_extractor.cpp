#include "signature_extractor.hpp"

#include "../dependencies/source_file.hpp"

#include <regex>
#include <utility>

namespace ccc::signatures
{
    namespace
    {
        constexpr std::size_t kCharactersPerToken = 4;
        constexpr std::string_view kGutter = "\xE2\x94\x82"; // U+2502

        std::string_view trimRight(std::string_view text)
        {
            while (!text.empty() && (text.back() == ' ' || text.back() == '\t' || text.back() == '\r'))
            {
                text.remove_suffix(1);
            }
            return text;
        }

        // Drops an opening brace and anything after it so only the header stays.
        std::string stripBody(std::string_view line)
        {
            const std::size_t brace = line.find('{');
            if (brace != std::string_view::npos)
            {
                line = line.substr(0, brace);
            }
            return std::string{trimRight(line)};
        }

        // Longer lines (minified bundles, generated tables) are never declarations.
        constexpr std::size_t kMaxDeclarationLineLength = 1000;
        constexpr std::size_t kMaxDocstringLines = 8;

        std::string_view trimLeft(std::string_view text)
        {
            while (!text.empty() && (text.front() == ' ' || text.front() == '\t'))
            {
                text.remove_prefix(1);
            }
            return text;
        }

        bool startsWith(std::string_view text, std::string_view prefix)
        {
            return text.substr(0, prefix.size()) == prefix;
        }

        bool matches(std::string_view line, const std::regex& pattern)
        {
            return std::regex_search(line.begin(), line.end(), pattern);
        }

        bool isPythonDeclaration(std::string_view line)
        {
            static const std::regex declaration{R"(^\s*(@[\w.]+|(async\s+)?def\s+\w+|class\s+\w+))"};
            return matches(line, declaration);
        }

        bool isScriptDeclaration(std::string_view line)
        {
            static const std::regex topLevel{
                R"(^\s*(export\s+)?(default\s+)?(declare\s+)?(async\s+)?(abstract\s+)?(function\*?|class|interface|type|enum|namespace)\s+[\w$]+)"};
            static const std::regex exportedBinding{R"(^\s*export\s+(const|let|var)\s+[\w$]+)"};
            static const std::regex member{
                R"(^\s+((public|private|protected|static|async|readonly|get|set|override)\s+)*[A-Za-z_$][\w$]*\s*\([^)]*\)\s*(:\s*[^{;=]+)?\{?\s*$)"};
            static const std::regex controlFlow{R"(^\s*(if|for|while|switch|catch|return|else|do|with)\b)"};

            return matches(line, topLevel) || matches(line, exportedBinding)
                || (matches(line, member) && !matches(line, controlFlow));
        }

        bool isJavaDeclaration(std::string_view line)
        {
            static const std::regex typeDeclaration{
                R"(^\s*((public|protected|private|abstract|final|static|sealed|strictfp)\s+)*(class|interface|enum|record|@interface)\s+\w+)"};
            static const std::regex methodDeclaration{
                R"(^\s*((public|protected|private|abstract|final|static|synchronized|native|default)\s+)+[\w<>\[\],.?\s]+\s+\w+\s*\()"};

            return matches(line, typeDeclaration) || matches(line, methodDeclaration);
        }

        struct DeclarationRules
        {
            bool (*isDeclaration)(std::string_view line);
            std::vector<std::string_view> commentMarkers;
            bool stripBodies{false};
            bool docstrings{false};
        };

        const DeclarationRules* rulesFor(deps::Language language)
        {
            static const DeclarationRules python{isPythonDeclaration, {"#"}, false, true};
            static const DeclarationRules script{isScriptDeclaration, {"//", "/*", "*"}, true, false};
            static const DeclarationRules java{isJavaDeclaration, {"//", "/*", "*"}, true, false};

            switch (language)
            {
            case deps::Language::Python:
                return &python;
            case deps::Language::JavaScript:
            case deps::Language::TypeScript:
                return &script;
            case deps::Language::Java:
                return &java;
            case deps::Language::Json:
            case deps::Language::Unknown:
                return nullptr;
            }
            return nullptr;
        }

        std::vector<std::string_view> splitLines(std::string_view content)
        {
            std::vector<std::string_view> lines;
            std::size_t lineStart = 0;
            while (lineStart < content.size())
            {
                std::size_t lineEnd = content.find('\n', lineStart);
                if (lineEnd == std::string_view::npos)
                {
                    lineEnd = content.size();
                }
                lines.push_back(trimRight(content.substr(lineStart, lineEnd - lineStart)));
                lineStart = lineEnd + 1;
            }
            return lines;
        }

        bool isDeclarationLine(const DeclarationRules& rules, std::string_view line)
        {
            return line.size() <= kMaxDeclarationLineLength && rules.isDeclaration(line);
        }

        bool isCommentLine(const DeclarationRules& rules, std::string_view line)
        {
            const std::string_view text = trimLeft(line);
            for (const auto marker : rules.commentMarkers)
            {
                if (startsWith(text, marker))
                {
                    return true;
                }
            }
            return false;
        }

        bool opensDocstring(std::string_view line)
        {
            const std::string_view text = trimLeft(line);
            return startsWith(text, "\"\"\"") || startsWith(text, "'''");
        }

        // One past the last line of the docstring opened at lines[first], capped.
        std::size_t docstringEnd(const std::vector<std::string_view>& lines, std::size_t first)
        {
            const std::string_view opening = trimLeft(lines[first]);
            const std::string_view quote = opening.substr(0, 3);
            if (opening.find(quote, 3) != std::string_view::npos)
            {
                return first + 1;
            }

            std::size_t index = first + 1;
            while (index < lines.size() && index - first < kMaxDocstringLines)
            {
                if (lines[index].find(quote) != std::string_view::npos)
                {
                    return index + 1;
                }
                ++index;
            }
            return index;
        }

        std::vector<std::string> collectDeclarations(std::string_view content, const DeclarationRules& rules, bool detailed)
        {
            const std::vector<std::string_view> lines = splitLines(content);
            std::vector<std::string> declarations;
            // Lines before this index are already part of the listing.
            std::size_t nextFree = 0;

            for (std::size_t index = 0; index < lines.size(); ++index)
            {
                if (index < nextFree || !isDeclarationLine(rules, lines[index]))
                {
                    continue;
                }

                if (detailed)
                {
                    std::size_t first = index;
                    while (first > nextFree && isCommentLine(rules, lines[first - 1]))
                    {
                        --first;
                    }
                    for (std::size_t comment = first; comment < index; ++comment)
                    {
                        declarations.emplace_back(lines[comment]);
                    }
                }

                declarations.push_back(rules.stripBodies ? stripBody(lines[index]) : std::string{lines[index]});
                nextFree = index + 1;
                if (!detailed)
                {
                    continue;
                }

                std::size_t body = index + 1;
                while (body < lines.size() && (trimLeft(lines[body]).empty() || trimLeft(lines[body]) == "{"))
                {
                    ++body;
                }
                if (body >= lines.size() || startsWith(trimLeft(lines[body]), "}")
                    || isDeclarationLine(rules, lines[body]))
                {
                    continue;
                }

                const std::size_t bodyEnd =
                    rules.docstrings && opensDocstring(lines[body]) ? docstringEnd(lines, body) : body + 1;
                for (std::size_t line = body; line < bodyEnd; ++line)
                {
                    declarations.emplace_back(lines[line]);
                }
                nextFree = bodyEnd;
            }

            return declarations;
        }

        std::string renderBlock(const std::string& shownPath, const std::vector<std::string>& declarations)
        {
            std::string block = shownPath + ":\n";
            for (const auto& declaration : declarations)
            {
                block.append(kGutter);
                block.append(declaration);
                block.push_back('\n');
            }
            return block;
        }
    } // namespace

    std::vector<std::string> extractDeclarations(std::string_view content, deps::Language language, bool detailed)
    {
        const DeclarationRules* rules = rulesFor(language);
        if (rules == nullptr)
        {
            return {};
        }
        return collectDeclarations(content, *rules, detailed);
    }

    std::string renderSignatures(const std::vector<std::filesystem::path>& files,
        const deps::LanguageRegistry& registry,
        const SignatureOptions& options)
    {
        std::string listing;
        std::size_t usedTokens = 0;
        bool budgetExhausted = false;

        for (const auto& file : files)
        {
            const std::string shownPath = displayPath(file, options.displayBase);

            if (budgetExhausted)
            {
                listing += shownPath + "\n";
                continue;
            }

            std::string block;
            const deps::SourceReadResult source = deps::readSourceFile(file);
            if (source.status != deps::SourceReadStatus::Ok)
            {
                block = renderBlock(shownPath, {"(unavailable: " + source.errorMessage + ")"});
            }
            else
            {
                block = renderBlock(shownPath,
                    extractDeclarations(source.content, registry.languageForPath(file), options.detailed));
            }

            const std::size_t blockTokens = estimateTokens(block);
            if (options.tokenBudget.has_value() && usedTokens + blockTokens > *options.tokenBudget)
            {
                budgetExhausted = true;
                listing += shownPath + "\n";
                continue;
            }

            usedTokens += blockTokens;
            listing += block;
            listing += "\n";
        }

        return listing;
    }

    std::size_t estimateTokens(std::string_view text) noexcept
    {
        return (text.size() + kCharactersPerToken - 1) / kCharactersPerToken;
    }

    std::string displayPath(const std::filesystem::path& path, const std::filesystem::path& base)
    {
        if (base.empty())
        {
            return path.generic_string();
        }

        const std::filesystem::path relative = path.lexically_relative(base);
        if (relative.empty() || *relative.begin() == "..")
        {
            return path.generic_string();
        }
        return relative.generic_string();
    }
} // namespace ccc::signatures
