#include "source_file.hpp"

#include "import_extractor.hpp"

#include <cerrno>
#include <cstring>
#include <fstream>
#include <sstream>
#include <utility>

namespace ccc::deps
{
    SourceFile::SourceFile(std::filesystem::path path, Language language)
        : m_path(std::move(path))
        , m_language(language)
    {
    }

    const std::filesystem::path& SourceFile::path() const noexcept
    {
        return m_path;
    }

    Language SourceFile::language() const noexcept
    {
        return m_language;
    }

    const SourceReadResult& SourceFile::read()
    {
        if (!m_content.has_value())
        {
            m_content = readSourceFile(m_path);
        }
        return *m_content;
    }

    SourceReadResult readSourceFile(const std::filesystem::path& path)
    {
        SourceReadResult result;

        errno = 0;
        std::ifstream stream(path, std::ios::binary);
        if (!stream)
        {
            result.status = SourceReadStatus::ReadFailed;
            result.errorMessage = "unable to open '" + path.string() + "'";
            if (errno != 0)
            {
                result.errorMessage += ": ";
                result.errorMessage += std::strerror(errno);
            }
            return result;
        }

        std::ostringstream buffer;
        buffer << stream.rdbuf();
        if (stream.bad())
        {
            result.status = SourceReadStatus::ReadFailed;
            result.errorMessage = "failed while reading '" + path.string() + "'";
            return result;
        }

        result.content = buffer.str();
        if (!isTextContent(result.content))
        {
            result.status = SourceReadStatus::NotText;
            result.errorMessage = "'" + path.string() + "' is binary or not valid UTF-8";
            result.content.clear();
        }

        return result;
    }
} // namespace ccc::deps
