#include "context_document_writer.hpp"

#include "../dependencies/source_file.hpp"

#include <algorithm>
#include <cctype>
#include <utility>

namespace ccc
{
    std::string fenceLanguageFor(const std::filesystem::path& path)
    {
        std::string extension = path.extension().string();
        std::transform(extension.begin(), extension.end(), extension.begin(), [](unsigned char ch) {
            return static_cast<char>(std::tolower(ch));
        });

        if (extension == ".py" || extension == ".pyi") return "python";
        if (extension == ".js" || extension == ".jsx" || extension == ".mjs" || extension == ".cjs") return "javascript";
        if (extension == ".ts" || extension == ".tsx" || extension == ".mts" || extension == ".cts") return "typescript";
        if (extension == ".java") return "java";
        if (extension == ".json") return "json";
        if (extension == ".c" || extension == ".cpp" || extension == ".h" || extension == ".hpp") return "cpp";
        return {};
    }

    PrimaryDocument loadPrimaryDocument(const std::filesystem::path& path, std::string displayPath)
    {
        PrimaryDocument document;
        document.displayPath = std::move(displayPath);
        document.fenceLanguage = fenceLanguageFor(path);

        deps::SourceReadResult source = deps::readSourceFile(path);
        if (source.status == deps::SourceReadStatus::Ok)
        {
            document.content = std::move(source.content);
        }
        else
        {
            document.content = "Error reading: " + source.errorMessage;
        }

        return document;
    }

    std::string renderContextDocument(const ContextDocument& document)
    {
        std::string text = "# Context\n\n";

        if (!document.signaturesOnly && !document.primaries.empty())
        {
            text += "## Primary Files (Full Content)\n\n";
            for (const auto& primary : document.primaries)
            {
                text += "### " + primary.displayPath + "\n";
                text += "```" + primary.fenceLanguage + "\n";
                text += primary.content;
                if (primary.content.empty() || primary.content.back() != '\n')
                {
                    text += "\n";
                }
                text += "```\n\n";
            }
        }

        if (!document.signatures.empty())
        {
            text += document.signaturesOnly ? "## File Signatures\n\n" : "## Dependencies (Signatures)\n\n";
            text += document.signatures;
        }

        return text;
    }
} // namespace ccc
