#include "cli/Tool.hpp"

#include <cstddef>
#include <cstring>
#include <filesystem>
#include <string>
#include <system_error>
#include <utility>

#include <llvm/Support/Error.h>
#include <llvm/Support/raw_ostream.h>

namespace ctrace::compdb::cli
{
    namespace
    {
        bool loadInto(const std::filesystem::path& path, Entries& entries, const ToolOptions& options,
                      llvm::raw_ostream& err)
        {
            Database db(path);
            auto loaded = db.load();
            if (!loaded)
            {
                err << "error: " << llvm::toString(loaded.takeError()) << "\n";
                return false;
            }

            std::size_t dropped = mergeEntries(entries, *loaded);
            if (options.verbose)
            {
                err << "Loaded " << loaded->size() << " entries from " << path.string() << "\n";
                if (dropped > 0)
                    err << "Warning: " << dropped << " duplicate entries from " << path.string()
                        << " ignored\n";
            }
            return true;
        }
    } // namespace

    bool parseToolOptions(int argc, const char* const* argv, ToolOptions& options,
                          std::string& error)
    {
        error.clear();
        for (int i = 1; i < argc; ++i)
        {
            const char* arg = argv[i];
            if (std::strcmp(arg, "-h") == 0 || std::strcmp(arg, "--help") == 0)
            {
                options.showHelp = true;
            }
            else if (std::strncmp(arg, "--output=", 9) == 0)
            {
                options.output = arg + 9;
            }
            else if (std::strcmp(arg, "-o") == 0)
            {
                if (i + 1 >= argc)
                {
                    error = "Missing value for -o";
                    return false;
                }
                options.output = argv[++i];
            }
            else if (std::strncmp(arg, "--format=", 9) == 0)
            {
                const char* formatStr = arg + 9;
                auto shape = enumFromString<CommandShape>(formatStr);
                if (!shape)
                {
                    error = std::string("Unknown format: ") + formatStr +
                            " (expected 'array' or 'string')";
                    return false;
                }
                options.shape = *shape;
            }
            else if (std::strcmp(arg, "--append") == 0)
            {
                options.append = true;
            }
            else if (std::strcmp(arg, "--quiet") == 0)
            {
                options.quiet = true;
            }
            else if (std::strcmp(arg, "--verbose") == 0)
            {
                options.verbose = true;
            }
            else if (arg[0] == '-' && arg[1] != '\0')
            {
                error = std::string("Unknown option: ") + arg;
                return false;
            }
            else
            {
                options.inputs.emplace_back(arg);
            }
        }

        if (options.showHelp)
            return true;

        if (options.inputs.empty())
        {
            error = "No input compilation database given";
            return false;
        }
        if (options.output.empty())
        {
            error = "Output path must not be empty";
            return false;
        }
        return true;
    }

    DatabaseFormat makeDatabaseFormat(const ToolOptions& options)
    {
        DatabaseFormat format;
        format.setCommandAsArray(options.shape == CommandShape::Array);
        return format;
    }

    void printUsage(llvm::raw_ostream& os)
    {
        os << "Usage: compdb [options] <compile_commands.json>...\n"
           << "  -o <file>, --output=<file>  database to write (default: compile_commands.json)\n"
           << "  --format=array|string       write \"arguments\" lists or \"command\" strings\n"
           << "  --append                    merge with the entries already in the output\n"
           << "  --quiet                     do not print a summary\n"
           << "  --verbose                   report per-input counts and duplicates\n";
    }

    int runTool(const ToolOptions& options, llvm::raw_ostream& out, llvm::raw_ostream& err)
    {
        Entries entries;
        for (const auto& input : options.inputs)
        {
            if (!loadInto(input, entries, options, err))
                return 1;
        }

        const std::filesystem::path outputPath(options.output);
        if (options.append)
        {
            std::error_code ec;
            if (std::filesystem::exists(outputPath, ec))
            {
                if (!loadInto(outputPath, entries, options, err))
                    return 1;
            }
            else if (options.verbose)
            {
                err << "No existing database at " << options.output << ", nothing to append to\n";
            }
        }

        Database db(outputPath);
        if (auto saveErr = db.save(entries, makeDatabaseFormat(options)))
        {
            err << "error: " << llvm::toString(std::move(saveErr)) << "\n";
            return 1;
        }

        if (!options.quiet)
            out << "Wrote " << entries.size() << " entries to " << options.output << "\n";
        return 0;
    }
} // namespace ctrace::compdb::cli
