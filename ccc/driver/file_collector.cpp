#include "file_collector.hpp"

#include "value_parsing.hpp"

#include <algorithm>
#include <array>
#include <cstdio>
#include <sys/wait.h>
#include <string_view>
#include <system_error>
#include <utility>

namespace ccc
{
    FindCommandResult runFindCommand(const std::string& command)
    {
        FindCommandResult result;

        FILE* pipe = popen(command.c_str(), "r");
        if (pipe == nullptr)
        {
            result.hasError = true;
            result.errorMessage = "failed to start '" + command + "'.";
            return result;
        }

        std::string output;
        std::array<char, 256> buffer{};
        while (std::fgets(buffer.data(), static_cast<int>(buffer.size()), pipe) != nullptr)
        {
            output.append(buffer.data());
        }

        const int status = pclose(pipe);
        if (status == -1 || !WIFEXITED(status) || WEXITSTATUS(status) != 0)
        {
            result.hasError = true;
            result.errorMessage = "'" + command + "' exited with a non-zero status.";
            return result;
        }

        std::size_t lineStart = 0;
        while (lineStart < output.size())
        {
            std::size_t lineEnd = output.find('\n', lineStart);
            if (lineEnd == std::string::npos)
            {
                lineEnd = output.size();
            }

            const std::string_view line = trimView(std::string_view{output}.substr(lineStart, lineEnd - lineStart));
            if (!line.empty())
            {
                result.lines.emplace_back(line);
            }
            lineStart = lineEnd + 1;
        }

        return result;
    }

    FileCollectionResult collectInputFiles(const std::vector<std::string>& inputPaths,
        const std::optional<std::string>& findBy)
    {
        FileCollectionResult result;
        std::vector<std::string> selected;

        if (findBy.has_value() && !findBy->empty())
        {
            FindCommandResult found = runFindCommand(*findBy);
            if (found.hasError)
            {
                result.hasError = true;
                result.code = "CCC-E1300";
                result.errorMessage = found.errorMessage;
                return result;
            }
            selected = std::move(found.lines);
        }

        selected.insert(selected.end(), inputPaths.begin(), inputPaths.end());

        for (const auto& entry : selected)
        {
            std::error_code error;
            std::filesystem::path absolute = std::filesystem::absolute(entry, error);
            if (error)
            {
                absolute = std::filesystem::path{entry};
            }
            absolute = absolute.lexically_normal();

            if (std::find(result.files.begin(), result.files.end(), absolute) == result.files.end())
            {
                result.files.emplace_back(std::move(absolute));
            }
        }

        if (result.files.empty())
        {
            result.hasError = true;
            result.code = "CCC-E1002";
            result.errorMessage = "no files selected.";
        }

        return result;
    }
} // namespace ccc
