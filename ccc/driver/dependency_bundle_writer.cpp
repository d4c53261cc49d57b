#include "dependency_bundle_writer.hpp"

#include "output_file.hpp"

#include <sstream>
#include <string_view>

namespace ccc
{
    namespace
    {
        char hexDigit(unsigned value)
        {
            return static_cast<char>(value < 10 ? ('0' + value) : ('a' + (value - 10)));
        }

        std::string escapeJson(std::string_view value)
        {
            std::string result;
            result.reserve(value.size() + 8);

            for (unsigned char ch : value)
            {
                switch (ch)
                {
                case '\\':
                    result += "\\\\";
                    break;
                case '"':
                    result += "\\\"";
                    break;
                case '\b':
                    result += "\\b";
                    break;
                case '\f':
                    result += "\\f";
                    break;
                case '\n':
                    result += "\\n";
                    break;
                case '\r':
                    result += "\\r";
                    break;
                case '\t':
                    result += "\\t";
                    break;
                default:
                    if (ch < 0x20)
                    {
                        result += "\\u00";
                        result.push_back(hexDigit((ch >> 4) & 0xF));
                        result.push_back(hexDigit(ch & 0xF));
                    }
                    else
                    {
                        result.push_back(static_cast<char>(ch));
                    }
                    break;
                }
            }

            return result;
        }

        std::string quoted(std::string_view value)
        {
            return "\"" + escapeJson(value) + "\"";
        }

        const char* separator(std::size_t index, std::size_t count)
        {
            return index + 1 < count ? ",\n" : "\n";
        }
    } // namespace

    std::string renderDependencyBundle(const DependencyBundle& bundle)
    {
        static const deps::TraversalResult emptyTraversal;
        const deps::TraversalResult& traversal = bundle.traversal != nullptr ? *bundle.traversal : emptyTraversal;

        std::ostringstream stream;
        stream << "{\n";

        stream << "  \"roots\": [";
        if (!bundle.roots.empty())
        {
            stream << "\n";
            for (std::size_t index = 0; index < bundle.roots.size(); ++index)
            {
                stream << "    " << quoted(bundle.roots[index].generic_string()) << separator(index, bundle.roots.size());
            }
            stream << "  ";
        }
        stream << "],\n";

        stream << "  \"maxDepth\": ";
        if (bundle.maxDepth.has_value())
        {
            stream << *bundle.maxDepth;
        }
        else
        {
            stream << "null";
        }
        stream << ",\n";

        stream << "  \"files\": [";
        if (!traversal.files.empty())
        {
            stream << "\n";
            for (std::size_t index = 0; index < traversal.files.size(); ++index)
            {
                const auto& entry = traversal.files[index];
                stream << "    {\n";
                stream << "      \"path\": " << quoted(entry.path.generic_string()) << ",\n";
                stream << "      \"depth\": " << entry.depth << ",\n";
                stream << "      \"language\": " << quoted(deps::toString(entry.language));

                if (entry.depth > 0)
                {
                    stream << ",\n";
                    stream << "      \"import\": " << quoted(entry.importText) << ",\n";
                    stream << "      \"importedBy\": " << quoted(entry.importedBy.generic_string()) << "\n";
                }
                else
                {
                    stream << "\n";
                }

                stream << "    }" << separator(index, traversal.files.size());
            }
            stream << "  ";
        }
        stream << "],\n";

        stream << "  \"unresolved\": [";
        if (!traversal.unresolvedImports.empty())
        {
            stream << "\n";
            for (std::size_t index = 0; index < traversal.unresolvedImports.size(); ++index)
            {
                const auto& entry = traversal.unresolvedImports[index];
                stream << "    { \"import\": " << quoted(entry.importText)
                       << ", \"file\": " << quoted(entry.filePath.generic_string()) << " }"
                       << separator(index, traversal.unresolvedImports.size());
            }
            stream << "  ";
        }
        stream << "],\n";

        stream << "  \"warnings\": [";
        if (!traversal.diagnostics.empty())
        {
            stream << "\n";
            for (std::size_t index = 0; index < traversal.diagnostics.size(); ++index)
            {
                const auto& diagnostic = traversal.diagnostics[index];
                stream << "    { \"code\": " << quoted(diagnostic.code)
                       << ", \"file\": " << quoted(diagnostic.filePath.generic_string())
                       << ", \"message\": " << quoted(diagnostic.message) << " }"
                       << separator(index, traversal.diagnostics.size());
            }
            stream << "  ";
        }
        stream << "]\n";

        stream << "}\n";
        return stream.str();
    }

    bool writeDependencyBundle(const std::filesystem::path& outputPath,
        const DependencyBundle& bundle,
        std::string& errorMessage)
    {
        return writeTextFile(outputPath, renderDependencyBundle(bundle), errorMessage);
    }
} // namespace ccc
