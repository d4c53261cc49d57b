#include "../dependencies/language.hpp"
#include "../dependencies/traverser.hpp"
#include "../signatures/signature_extractor.hpp"
#include "command_line.hpp"
#include "config_file.hpp"
#include "context_document_writer.hpp"
#include "dependency_bundle_writer.hpp"
#include "file_collector.hpp"
#include "output_file.hpp"

#include <algorithm>
#include <filesystem>
#include <iostream>
#include <string>
#include <system_error>
#include <vector>

#ifndef CCC_VERSION
#define CCC_VERSION "0.0.0-local"
#endif

namespace ccc
{
    void printHelp()
    {
        std::cout << "ccc - CodeContextCrafter\n"
                  << "Builds a markdown context bundle: full content of the given files plus\n"
                  << "signatures of the files they depend on.\n"
                  << "Usage: ccc [options] [files...]\n\n"
                  << "Options:\n"
                  << "  -h, --help                     Show this help text and exit.\n"
                  << "  --version                      Show version information and exit.\n"
                  << "  -c, --config <path>            Configuration file (default: ./.ccc.conf when present).\n"
                  << "  -r, --root <dir>               Import root (repeatable; earlier roots win).\n"
                  << "  -o, --output <path>            Write the document to a file instead of stdout.\n"
                  << "  -st, --sig-tokens <n>          Approximate token budget for signatures.\n"
                  << "  -f, --find-by <command>        Shell command whose output lists input files.\n"
                  << "  -dm, --dep-depth-max <n>       Maximum dependency depth (default: unbounded).\n"
                  << "  -v, --verbose                  Print traversal details.\n"
                  << "  -so, --sig-only                Signatures for every input, no dependency traversal.\n"
                  << "  -sd, --sig-detailed            Keep leading comments and the first body line in signatures.\n"
                  << "  --emit-dependency-bundle <path> Write the traversal report as JSON.\n";
    }

    void printVersion()
    {
        std::cout << "ccc " << CCC_VERSION << "\n";
    }

    bool loadConfiguration(CommandLineOptions& options, ConfigFile& config)
    {
        std::filesystem::path configPath;
        if (options.configPath.has_value())
        {
            configPath = *options.configPath;
        }
        else
        {
            std::error_code statusError;
            if (std::filesystem::exists(kDefaultConfigFileName, statusError) && !statusError)
            {
                configPath = std::string{kDefaultConfigFileName};
            }
        }

        if (configPath.empty())
        {
            return true;
        }

        ConfigParseResult parsed = parseConfigFile(configPath);
        if (parsed.hasError)
        {
            std::cerr << parsed.code << " ConfigLoadFailed: " << parsed.errorMessage << "\n";
            return false;
        }

        ConfigValidationResult validation = validateConfig(parsed.config);
        if (validation.hasError)
        {
            std::cerr << validation.code << " ConfigInvalid: " << validation.errorMessage << "\n";
            return false;
        }

        applyConfigDefaults(options, parsed.config);
        config = std::move(parsed.config);

        if (options.verbose)
        {
            std::clog << "[notice] Loaded configuration from " << configPath.string() << "\n";
        }
        return true;
    }

    bool collectRoots(const CommandLineOptions& options, std::vector<std::filesystem::path>& roots)
    {
        bool valid = true;
        for (const auto& root : options.roots)
        {
            if (root.empty())
            {
                continue;
            }

            std::error_code ec;
            std::filesystem::path normalised = std::filesystem::absolute(root, ec);
            if (ec)
            {
                normalised = std::filesystem::path{root};
            }
            normalised = normalised.lexically_normal();

            if (!std::filesystem::exists(normalised, ec) || ec)
            {
                std::cerr << "CCC-E1200 InvalidRoot: import root does not exist -> '" << root << "'\n";
                valid = false;
                continue;
            }
            if (!std::filesystem::is_directory(normalised, ec) || ec)
            {
                std::cerr << "CCC-E1200 InvalidRoot: import root is not a directory -> '" << root << "'\n";
                valid = false;
                continue;
            }

            if (std::find(roots.begin(), roots.end(), normalised) == roots.end())
            {
                roots.emplace_back(std::move(normalised));
            }
        }
        return valid;
    }

    void reportTraversal(const deps::TraversalResult& traversal, bool verbose)
    {
        const auto dependencyCount = traversal.dependencyFiles().size();
        std::clog << "[notice] Discovered " << dependencyCount << " dependency file(s).\n";

        if (verbose)
        {
            for (const auto& entry : traversal.files)
            {
                std::clog << "[debug] depth " << entry.depth << ": " << entry.path.string();
                if (entry.depth > 0)
                {
                    std::clog << " (import '" << entry.importText << "' in " << entry.importedBy.string() << ")";
                }
                std::clog << "\n";
            }

            for (const auto& miss : traversal.unresolvedImports)
            {
                std::clog << "[debug] Unresolved import '" << miss.importText << "' in " << miss.filePath.string() << "\n";
            }
        }

        for (const auto& diagnostic : traversal.diagnostics)
        {
            std::cerr << diagnostic.code << ' ' << diagnostic.message << '\n';
        }

        if (traversal.warningCount() > 0)
        {
            std::clog << "[notice] " << traversal.warningCount() << " file(s) could not be scanned and were kept as leaves.\n";
        }
    }

    int runCrafter(CommandLineOptions options)
    {
        std::clog << "[information] CodeContextCrafter is running.\n";

        ConfigFile config;
        if (!loadConfiguration(options, config))
        {
            return 1;
        }

        if (options.verbose && !options.sigTokens.has_value())
        {
            std::clog << "[notice] No --sig-tokens specified: signatures are not truncated.\n";
        }

        if (options.dependencyBundlePath.has_value() && options.sigOnly)
        {
            std::cerr << "CCC-E3002 DependencyBundleNeedsTraversal: --emit-dependency-bundle cannot be combined with --sig-only.\n";
            return 1;
        }

        deps::LanguageRegistry registry = deps::makeDefaultLanguageRegistry();
        for (auto& [language, extensions] : extensionOverrides(config))
        {
            if (!registry.setCandidateExtensions(language, std::move(extensions)))
            {
                std::cerr << "CCC-W1204 ExtensionOverrideIgnored: no rules registered for '" << deps::toString(language) << "'.\n";
            }
        }

        std::vector<std::filesystem::path> roots;
        if (!collectRoots(options, roots))
        {
            return 1;
        }

        FileCollectionResult collected = collectInputFiles(options.inputPaths, options.findBy);
        if (collected.hasError)
        {
            std::cerr << collected.code << " InputSelectionFailed: " << collected.errorMessage << "\n";
            return 1;
        }

        std::error_code cwdError;
        const std::filesystem::path displayBase = std::filesystem::current_path(cwdError);

        ContextDocument document;
        document.signaturesOnly = options.sigOnly;
        std::vector<std::filesystem::path> signatureFiles;

        if (options.sigOnly)
        {
            signatureFiles = collected.files;
        }
        else
        {
            std::clog << "[notice] Processing " << collected.files.size() << " primary file(s)...\n";

            deps::Traverser traverser{registry};
            const deps::TraversalResult traversal = traverser.traverse(collected.files, roots, options.depthMax);
            if (traversal.hasError)
            {
                std::cerr << "CCC-E2000 InvalidPrimaryFiles: " << traversal.errorMessage << "\n";
                return 1;
            }

            reportTraversal(traversal, options.verbose);

            for (const auto& entry : traversal.files)
            {
                const std::string shown = signatures::displayPath(entry.path, cwdError ? std::filesystem::path{} : displayBase);
                if (entry.depth == 0)
                {
                    document.primaries.emplace_back(loadPrimaryDocument(entry.path, shown));
                }
                else
                {
                    signatureFiles.push_back(entry.path);
                }
            }

            if (options.dependencyBundlePath.has_value())
            {
                DependencyBundle bundle;
                bundle.roots = roots;
                bundle.maxDepth = options.depthMax;
                bundle.traversal = &traversal;

                std::string errorMessage;
                if (!writeDependencyBundle(*options.dependencyBundlePath, bundle, errorMessage))
                {
                    std::cerr << "CCC-E3003 DependencyBundleWriteFailed: " << errorMessage << "\n";
                    return 1;
                }
                std::clog << "[notice] Dependency bundle written to " << *options.dependencyBundlePath << "\n";
            }
        }

        std::clog << "[notice] Generating file signatures for " << signatureFiles.size() << " file(s)...\n";
        signatures::SignatureOptions signatureOptions;
        signatureOptions.tokenBudget = options.sigTokens;
        signatureOptions.detailed = options.sigDetailed;
        if (!cwdError)
        {
            signatureOptions.displayBase = displayBase;
        }
        document.signatures = signatures::renderSignatures(signatureFiles, registry, signatureOptions);

        std::clog << "[notice] Generating final document...\n";
        const std::string text = renderContextDocument(document);

        if (options.outputPath.has_value() && !options.outputPath->empty())
        {
            std::string errorMessage;
            if (!writeTextFile(*options.outputPath, text, errorMessage))
            {
                std::cerr << "CCC-E3000 OutputWriteFailed: " << errorMessage << "\n";
                return 1;
            }
            std::clog << "[notice] Document written to " << *options.outputPath << "\n";
        }
        else
        {
            std::cout << text;
            std::cout.flush();
        }

        return 0;
    }
} // namespace ccc

int main(int argc, char** argv)
{
    ccc::CommandLineParser parser;
    auto options = parser.parse(argc, argv);

    if (!options.has_value())
    {
        return 1;
    }

    if (options->showHelp)
    {
        ccc::printHelp();
        return 0;
    }

    if (options->showVersion)
    {
        ccc::printVersion();
        return 0;
    }

    return ccc::runCrafter(std::move(*options));
}
