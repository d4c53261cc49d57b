#include "import_extractor.hpp"

#include <algorithm>
#include <cctype>
#include <optional>
#include <unordered_set>
#include <utility>

namespace ccc::deps
{
    namespace
    {
        struct ImportMatch
        {
            std::size_t offset{0};
            std::string text;
        };

        bool isIdentifierStart(char ch)
        {
            return std::isalpha(static_cast<unsigned char>(ch)) || ch == '_';
        }

        bool isIdentifierPart(char ch)
        {
            return std::isalnum(static_cast<unsigned char>(ch)) || ch == '_';
        }

        bool isBlank(char ch)
        {
            return ch == ' ' || ch == '\t';
        }

        bool isSpace(char ch)
        {
            return std::isspace(static_cast<unsigned char>(ch)) != 0;
        }

        bool keywordAt(std::string_view text, std::size_t position, std::string_view keyword)
        {
            return position <= text.size() && text.compare(position, keyword.size(), keyword) == 0;
        }

        // Keyword followed by at least one whitespace character.
        bool keywordThenSpaceAt(std::string_view text, std::size_t position, std::string_view keyword)
        {
            const std::size_t after = position + keyword.size();
            return keywordAt(text, position, keyword) && after < text.size() && isSpace(text[after]);
        }

        std::size_t skipBlanks(std::string_view text, std::size_t position)
        {
            while (position < text.size() && isBlank(text[position]))
            {
                ++position;
            }
            return position;
        }

        std::size_t skipSpaces(std::string_view text, std::size_t position)
        {
            while (position < text.size() && isSpace(text[position]))
            {
                ++position;
            }
            return position;
        }

        std::string_view trim(std::string_view text)
        {
            while (!text.empty() && isSpace(text.front()))
            {
                text.remove_prefix(1);
            }
            while (!text.empty() && isSpace(text.back()))
            {
                text.remove_suffix(1);
            }
            return text;
        }

        template <typename Callback>
        void forEachLine(std::string_view content, Callback&& callback)
        {
            std::size_t lineStart = 0;
            while (lineStart <= content.size())
            {
                std::size_t lineEnd = content.find('\n', lineStart);
                if (lineEnd == std::string_view::npos)
                {
                    lineEnd = content.size();
                }

                std::string_view line = content.substr(lineStart, lineEnd - lineStart);
                if (!line.empty() && line.back() == '\r')
                {
                    line.remove_suffix(1);
                }
                callback(line);

                if (lineEnd == content.size())
                {
                    break;
                }
                lineStart = lineEnd + 1;
            }
        }

        std::vector<std::string> orderedUnique(std::vector<ImportMatch> matches)
        {
            std::stable_sort(matches.begin(), matches.end(), [](const ImportMatch& lhs, const ImportMatch& rhs) {
                return lhs.offset < rhs.offset;
            });

            std::vector<std::string> imports;
            std::unordered_set<std::string> seen;
            for (auto& match : matches)
            {
                if (match.text.empty())
                {
                    continue;
                }
                if (seen.insert(match.text).second)
                {
                    imports.emplace_back(std::move(match.text));
                }
            }
            return imports;
        }

        bool isDottedName(std::string_view text)
        {
            bool expectStart = true;
            for (char ch : text)
            {
                if (expectStart)
                {
                    if (!isIdentifierStart(ch))
                    {
                        return false;
                    }
                    expectStart = false;
                }
                else if (ch == '.')
                {
                    expectStart = true;
                }
                else if (!isIdentifierPart(ch))
                {
                    return false;
                }
            }
            return !expectStart;
        }

        // A non-empty string literal in either quote style on one line.
        std::optional<ImportMatch> readQuoted(std::string_view text, std::size_t position)
        {
            if (position >= text.size() || (text[position] != '\'' && text[position] != '"'))
            {
                return std::nullopt;
            }

            const std::size_t start = position + 1;
            const std::size_t end = text.find_first_of("'\"\n", start);
            if (end == std::string_view::npos || text[end] == '\n' || end == start)
            {
                return std::nullopt;
            }
            return ImportMatch{start, std::string{text.substr(start, end - start)}};
        }

        // From just after "import ": a binding clause up to " from 'X'".
        std::optional<ImportMatch> scanImportClause(std::string_view text, std::size_t position)
        {
            std::size_t cursor = position;
            while (cursor < text.size())
            {
                const char ch = text[cursor];
                if (ch == '{')
                {
                    const std::size_t close = text.find('}', cursor);
                    if (close == std::string_view::npos)
                    {
                        return std::nullopt;
                    }
                    cursor = close + 1;
                    continue;
                }

                if (isSpace(ch) && cursor > position && keywordAt(text, cursor + 1, "from"))
                {
                    if (auto module = readQuoted(text, skipSpaces(text, cursor + 5)))
                    {
                        return module;
                    }
                }

                if (!isIdentifierPart(ch) && ch != '$' && ch != '*' && ch != ',' && !isSpace(ch))
                {
                    return std::nullopt;
                }
                ++cursor;
            }
            return std::nullopt;
        }

        // From just after "export ": "* from", "* as name from" or "{...} from".
        std::optional<ImportMatch> scanExportFrom(std::string_view text, std::size_t position)
        {
            if (keywordAt(text, position, "type") && position + 4 < text.size() && isBlank(text[position + 4]))
            {
                position = skipBlanks(text, position + 4);
            }
            if (position >= text.size())
            {
                return std::nullopt;
            }

            std::size_t cursor = position;
            if (text[cursor] == '*')
            {
                ++cursor;
                const std::size_t alias = skipBlanks(text, cursor);
                if (alias > cursor && keywordAt(text, alias, "as") && alias + 2 < text.size() && isBlank(text[alias + 2]))
                {
                    cursor = skipBlanks(text, alias + 2);
                    const std::size_t nameStart = cursor;
                    while (cursor < text.size() && (isIdentifierPart(text[cursor]) || text[cursor] == '$'))
                    {
                        ++cursor;
                    }
                    if (cursor == nameStart)
                    {
                        return std::nullopt;
                    }
                }
            }
            else if (text[cursor] == '{')
            {
                const std::size_t close = text.find('}', cursor);
                if (close == std::string_view::npos)
                {
                    return std::nullopt;
                }
                cursor = close + 1;
            }
            else
            {
                return std::nullopt;
            }

            cursor = skipSpaces(text, cursor);
            if (!keywordAt(text, cursor, "from"))
            {
                return std::nullopt;
            }
            return readQuoted(text, skipSpaces(text, cursor + 4));
        }

        std::optional<std::string> pythonFromModule(std::string_view line)
        {
            if (!keywordThenSpaceAt(line, 0, "from"))
            {
                return std::nullopt;
            }

            std::size_t cursor = skipSpaces(line, 4);
            const std::size_t start = cursor;
            while (cursor < line.size() && line[cursor] == '.')
            {
                ++cursor;
            }
            if (cursor < line.size() && isIdentifierStart(line[cursor]))
            {
                while (cursor < line.size() && (isIdentifierPart(line[cursor]) || line[cursor] == '.'))
                {
                    ++cursor;
                }
            }
            if (cursor == start)
            {
                return std::nullopt;
            }

            const std::size_t moduleEnd = cursor;
            if (cursor >= line.size() || !isSpace(line[cursor]))
            {
                return std::nullopt;
            }
            cursor = skipSpaces(line, cursor);
            if (!keywordAt(line, cursor, "import") || (cursor + 6 < line.size() && isIdentifierPart(line[cursor + 6])))
            {
                return std::nullopt;
            }
            return std::string{line.substr(start, moduleEnd - start)};
        }

        // The module list of "import a, b as c", cut at a comment or ';'.
        std::optional<std::string_view> pythonImportClause(std::string_view line)
        {
            if (!keywordThenSpaceAt(line, 0, "import"))
            {
                return std::nullopt;
            }

            const std::size_t start = skipSpaces(line, 6);
            const std::size_t end = line.find_first_of("#;/", start);
            const std::string_view clause = line.substr(start, end == std::string_view::npos ? std::string_view::npos : end - start);
            if (clause.empty())
            {
                return std::nullopt;
            }
            return clause;
        }
    } // namespace

    std::vector<std::string> extractImports(std::string_view content, const LanguageRules* rules)
    {
        if (rules == nullptr || !rules->extract)
        {
            return {};
        }

        return rules->extract(content);
    }

    std::vector<std::string> extractPythonImports(std::string_view content)
    {
        // Only unindented statements count: indented imports sit inside a
        // function, conditional or try block.
        std::vector<ImportMatch> matches;
        std::size_t offset = 0;

        forEachLine(content, [&](std::string_view line) {
            if (auto module = pythonFromModule(line))
            {
                matches.push_back({offset, std::move(*module)});
            }
            else if (auto clause = pythonImportClause(line))
            {
                std::string_view remaining = *clause;

                std::size_t partIndex = 0;
                while (!remaining.empty())
                {
                    const std::size_t comma = remaining.find(',');
                    std::string_view part = trim(remaining.substr(0, comma));
                    remaining = comma == std::string_view::npos ? std::string_view{} : remaining.substr(comma + 1);

                    const std::size_t alias = part.find(" as ");
                    if (alias != std::string_view::npos)
                    {
                        part = trim(part.substr(0, alias));
                    }

                    if (isDottedName(part))
                    {
                        matches.push_back({offset + partIndex, std::string{part}});
                    }
                    ++partIndex;
                }
            }

            offset += line.size() + 1;
        });

        return orderedUnique(std::move(matches));
    }

    std::vector<std::string> extractScriptImports(std::string_view content)
    {
        std::vector<ImportMatch> matches;

        // import/export statements start a line, after optional indentation.
        std::size_t lineStart = 0;
        while (lineStart < content.size())
        {
            const std::size_t keyword = skipBlanks(content, lineStart);

            if (keywordAt(content, keyword, "import") && keyword + 6 < content.size() && isBlank(content[keyword + 6]))
            {
                const std::size_t clause = skipBlanks(content, keyword + 6);
                if (auto module = readQuoted(content, clause))
                {
                    matches.push_back(std::move(*module));
                }
                else if (auto bound = scanImportClause(content, clause))
                {
                    matches.push_back(std::move(*bound));
                }
            }
            else if (keywordAt(content, keyword, "export") && keyword + 6 < content.size() && isBlank(content[keyword + 6]))
            {
                if (auto module = scanExportFrom(content, skipBlanks(content, keyword + 6)))
                {
                    matches.push_back(std::move(*module));
                }
            }

            const std::size_t lineEnd = content.find('\n', lineStart);
            if (lineEnd == std::string_view::npos)
            {
                break;
            }
            lineStart = lineEnd + 1;
        }

        // require('X') may appear anywhere in an expression.
        constexpr std::string_view kRequire = "require";
        for (std::size_t found = content.find(kRequire); found != std::string_view::npos;
             found = content.find(kRequire, found + kRequire.size()))
        {
            if (found > 0 && (isIdentifierPart(content[found - 1]) || content[found - 1] == '$'))
            {
                continue;
            }

            std::size_t cursor = skipBlanks(content, found + kRequire.size());
            if (cursor >= content.size() || content[cursor] != '(')
            {
                continue;
            }

            auto module = readQuoted(content, skipBlanks(content, cursor + 1));
            if (!module.has_value())
            {
                continue;
            }

            cursor = skipBlanks(content, module->offset + module->text.size() + 1);
            if (cursor < content.size() && content[cursor] == ')')
            {
                matches.push_back(std::move(*module));
            }
        }

        return orderedUnique(std::move(matches));
    }

    std::vector<std::string> extractJavaImports(std::string_view content)
    {
        std::vector<ImportMatch> matches;
        std::size_t offset = 0;

        forEachLine(content, [&](std::string_view line) {
            const std::size_t lineOffset = offset;
            offset += line.size() + 1;

            std::size_t cursor = skipSpaces(line, 0);
            if (!keywordThenSpaceAt(line, cursor, "import"))
            {
                return;
            }
            cursor = skipSpaces(line, cursor + 6);

            bool isStatic = false;
            if (keywordThenSpaceAt(line, cursor, "static"))
            {
                isStatic = true;
                cursor = skipSpaces(line, cursor + 6);
            }

            const std::size_t nameStart = cursor;
            if (cursor >= line.size() || !isIdentifierStart(line[cursor]))
            {
                return;
            }
            while (true)
            {
                while (cursor < line.size() && isIdentifierPart(line[cursor]))
                {
                    ++cursor;
                }
                if (cursor + 1 < line.size() && line[cursor] == '.' && isIdentifierStart(line[cursor + 1]))
                {
                    ++cursor;
                    continue;
                }
                break;
            }
            std::string name{line.substr(nameStart, cursor - nameStart)};

            bool isWildcard = false;
            if (cursor + 1 < line.size() && line[cursor] == '.' && line[cursor + 1] == '*')
            {
                isWildcard = true;
                cursor += 2;
            }

            cursor = skipSpaces(line, cursor);
            if (cursor >= line.size() || line[cursor] != ';')
            {
                return;
            }

            // "import static pkg.Type.member;" names a member of pkg.Type.
            if (isStatic && !isWildcard)
            {
                const std::size_t lastDot = name.rfind('.');
                name = lastDot == std::string::npos ? std::string{} : name.substr(0, lastDot);
            }

            matches.push_back({lineOffset, std::move(name)});
        });

        return orderedUnique(std::move(matches));
    }

    bool isTextContent(std::string_view content) noexcept
    {
        std::size_t index = 0;
        while (index < content.size())
        {
            const auto lead = static_cast<unsigned char>(content[index]);
            if (lead == 0)
            {
                return false;
            }

            std::size_t continuationCount = 0;
            // Bounds of the first continuation byte; they exclude overlong
            // forms, UTF-16 surrogates and code points past U+10FFFF.
            unsigned char lower = 0x80;
            unsigned char upper = 0xBF;
            if (lead < 0x80)
            {
                continuationCount = 0;
            }
            else if (lead >= 0xC2 && lead <= 0xDF)
            {
                continuationCount = 1;
            }
            else if (lead >= 0xE0 && lead <= 0xEF)
            {
                continuationCount = 2;
                if (lead == 0xE0)
                {
                    lower = 0xA0;
                }
                else if (lead == 0xED)
                {
                    upper = 0x9F;
                }
            }
            else if (lead >= 0xF0 && lead <= 0xF4)
            {
                continuationCount = 3;
                if (lead == 0xF0)
                {
                    lower = 0x90;
                }
                else if (lead == 0xF4)
                {
                    upper = 0x8F;
                }
            }
            else
            {
                return false;
            }

            if (index + continuationCount >= content.size())
            {
                return false;
            }

            for (std::size_t offset = 1; offset <= continuationCount; ++offset)
            {
                const auto next = static_cast<unsigned char>(content[index + offset]);
                const unsigned char low = offset == 1 ? lower : 0x80;
                const unsigned char high = offset == 1 ? upper : 0xBF;
                if (next < low || next > high)
                {
                    return false;
                }
            }

            index += continuationCount + 1;
        }

        return true;
    }
} // namespace ccc::deps
