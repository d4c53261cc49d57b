#pragma once

#include "language.hpp"

#include <string>
#include <string_view>
#include <vector>

namespace ccc::deps
{
    // Returns the raw import strings of a file in textual order. Languages
    // without rules yield an empty list. Content is expected to be text already
    // (see readSourceFile); the scanners never fail on other input.
    [[nodiscard]] std::vector<std::string> extractImports(std::string_view content, const LanguageRules* rules);

    [[nodiscard]] std::vector<std::string> extractPythonImports(std::string_view content);
    [[nodiscard]] std::vector<std::string> extractScriptImports(std::string_view content);
    [[nodiscard]] std::vector<std::string> extractJavaImports(std::string_view content);

    // False for content containing NUL bytes or malformed UTF-8.
    [[nodiscard]] bool isTextContent(std::string_view content) noexcept;
} // namespace ccc::deps
