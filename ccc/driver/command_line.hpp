#pragma once

#include "value_parsing.hpp"

#include <cstddef>
#include <iostream>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace ccc
{
    struct CommandLineOptions
    {
        std::vector<std::string> inputPaths;
        std::vector<std::string> roots;
        std::optional<std::string> configPath;
        std::optional<std::string> outputPath;
        std::optional<std::string> findBy;
        std::optional<std::size_t> sigTokens;
        std::optional<std::size_t> depthMax;
        std::optional<std::string> dependencyBundlePath;
        bool verbose{false};
        bool sigOnly{false};
        bool sigDetailed{false};
        bool showHelp{false};
        bool showVersion{false};
    };

    class CommandLineParser
    {
    public:
        std::optional<CommandLineOptions> parse(int argc, char** argv) const
        {
            CommandLineOptions options;

            for (int index = 1; index < argc; ++index)
            {
                std::string_view argument{argv[index]};

                if (argument == "--help" || argument == "-h")
                {
                    options.showHelp = true;
                    return options;
                }

                if (argument == "--version")
                {
                    options.showVersion = true;
                    return options;
                }

                if (argument == "--verbose" || argument == "-v")
                {
                    options.verbose = true;
                    continue;
                }

                if (argument == "--sig-only" || argument == "-so")
                {
                    options.sigOnly = true;
                    continue;
                }

                if (argument == "--sig-detailed" || argument == "-sd")
                {
                    options.sigDetailed = true;
                    continue;
                }

                std::optional<std::string> value;
                bool failed = false;

                if (takeValue(argument, "--root", "-r", index, argc, argv, value, failed))
                {
                    if (failed)
                    {
                        return std::nullopt;
                    }
                    options.roots.emplace_back(std::move(*value));
                    continue;
                }

                if (takeValue(argument, "--config", "-c", index, argc, argv, value, failed))
                {
                    if (failed)
                    {
                        return std::nullopt;
                    }
                    options.configPath = std::move(value);
                    continue;
                }

                if (takeValue(argument, "--output", "-o", index, argc, argv, value, failed))
                {
                    if (failed)
                    {
                        return std::nullopt;
                    }
                    options.outputPath = std::move(value);
                    continue;
                }

                if (takeValue(argument, "--find-by", "-f", index, argc, argv, value, failed))
                {
                    if (failed)
                    {
                        return std::nullopt;
                    }
                    options.findBy = std::move(value);
                    continue;
                }

                if (takeValue(argument, "--emit-dependency-bundle", "", index, argc, argv, value, failed))
                {
                    if (failed)
                    {
                        return std::nullopt;
                    }
                    options.dependencyBundlePath = std::move(value);
                    continue;
                }

                if (takeValue(argument, "--sig-tokens", "-st", index, argc, argv, value, failed))
                {
                    if (failed)
                    {
                        return std::nullopt;
                    }
                    options.sigTokens = parseUnsigned(*value);
                    if (!options.sigTokens.has_value())
                    {
                        std::cerr << "CCC-E1005 InvalidInteger: --sig-tokens expects a non-negative integer, got '" << *value << "'.\n";
                        return std::nullopt;
                    }
                    continue;
                }

                if (takeValue(argument, "--dep-depth-max", "-dm", index, argc, argv, value, failed))
                {
                    if (failed)
                    {
                        return std::nullopt;
                    }
                    options.depthMax = parseUnsigned(*value);
                    if (!options.depthMax.has_value())
                    {
                        std::cerr << "CCC-E1005 InvalidInteger: --dep-depth-max expects a non-negative integer, got '" << *value << "'.\n";
                        return std::nullopt;
                    }
                    continue;
                }

                if (argument.size() > 1 && argument[0] == '-')
                {
                    std::cerr << "CCC-E1001 UnknownOption: unrecognised option '" << argument << "'.\n";
                    return std::nullopt;
                }

                options.inputPaths.emplace_back(argument);
            }

            return options;
        }

    private:
        // Accepts "--name value", "--name=value" and "-short value". Returns true
        // when the argument names this option; failed is set when the value is missing.
        static bool takeValue(std::string_view argument,
            std::string_view longName,
            std::string_view shortName,
            int& index,
            int argc,
            char** argv,
            std::optional<std::string>& value,
            bool& failed)
        {
            value.reset();
            failed = false;

            if (argument.size() > longName.size() && argument.rfind(longName, 0) == 0 && argument[longName.size()] == '=')
            {
                value = std::string{argument.substr(longName.size() + 1)};
                return true;
            }

            if (argument != longName && (shortName.empty() || argument != shortName))
            {
                return false;
            }

            if (index + 1 >= argc)
            {
                std::cerr << "CCC-E1000 MissingValue: expected a value after '" << argument << "'.\n";
                failed = true;
                return true;
            }

            value = std::string{argv[++index]};
            return true;
        }
    };
} // namespace ccc
