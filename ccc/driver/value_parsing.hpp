#pragma once

#include <cctype>
#include <cstddef>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>

namespace ccc
{
    inline std::string_view trimView(std::string_view text)
    {
        while (!text.empty() && std::isspace(static_cast<unsigned char>(text.front())))
        {
            text.remove_prefix(1);
        }
        while (!text.empty() && std::isspace(static_cast<unsigned char>(text.back())))
        {
            text.remove_suffix(1);
        }
        return text;
    }

    inline bool isAllDigits(std::string_view text)
    {
        if (text.empty())
        {
            return false;
        }
        for (char ch : text)
        {
            if (!std::isdigit(static_cast<unsigned char>(ch)))
            {
                return false;
            }
        }
        return true;
    }

    inline std::optional<std::size_t> parseUnsigned(std::string_view text)
    {
        if (!isAllDigits(text))
        {
            return std::nullopt;
        }

        try
        {
            return static_cast<std::size_t>(std::stoull(std::string{text}));
        }
        catch (const std::out_of_range&)
        {
            return std::nullopt;
        }
    }

    inline std::optional<bool> parseBoolean(std::string_view text)
    {
        std::string lowered;
        lowered.reserve(text.size());
        for (char ch : text)
        {
            lowered.push_back(static_cast<char>(std::tolower(static_cast<unsigned char>(ch))));
        }

        if (lowered == "true")
        {
            return true;
        }
        if (lowered == "false")
        {
            return false;
        }
        return std::nullopt;
    }
} // namespace ccc
