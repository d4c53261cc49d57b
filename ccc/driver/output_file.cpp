#include "output_file.hpp"

#include <fstream>
#include <system_error>

namespace ccc
{
    bool writeTextFile(const std::filesystem::path& outputPath, std::string_view text, std::string& errorMessage)
    {
        const auto parentDirectory = outputPath.parent_path();
        if (!parentDirectory.empty())
        {
            std::error_code createError;
            std::filesystem::create_directories(parentDirectory, createError);
            if (createError)
            {
                errorMessage = "failed to create directories for '" + outputPath.string() + "': " + createError.message();
                return false;
            }
        }

        std::ofstream file(outputPath, std::ios::binary | std::ios::trunc);
        if (!file)
        {
            errorMessage = "unable to open '" + outputPath.string() + "' for writing.";
            return false;
        }

        file.write(text.data(), static_cast<std::streamsize>(text.size()));
        if (!file.good())
        {
            errorMessage = "failed while writing '" + outputPath.string() + "'.";
            return false;
        }

        return true;
    }
} // namespace ccc
