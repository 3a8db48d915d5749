#pragma once

#include <array>
#include <string>
#include <string_view>
#include <vector>

#include "CompilationDatabase.hpp"
#include "helpers.hpp"

namespace llvm
{
    class raw_ostream;
} // namespace llvm

namespace ctrace::compdb
{
    enum class CommandShape
    {
        Array = 0,
        String = 1
    };

    template<>
    struct EnumTraits<CommandShape>
    {
        static constexpr std::array<std::string_view, 2> names = {"array", "string"};
    };

    namespace cli
    {
        // Options of the `compdb` front end.
        struct ToolOptions
        {
            std::vector<std::string> inputs;
            std::string output = "compile_commands.json";
            CommandShape shape = CommandShape::Array;
            bool append = false;  // merge with what `output` already holds
            bool quiet = false;   // no summary line
            bool verbose = false; // per-input counts and duplicate notices
            bool showHelp = false;
        };

        bool parseToolOptions(int argc, const char* const* argv, ToolOptions& options,
                              std::string& error);

        DatabaseFormat makeDatabaseFormat(const ToolOptions& options);

        void printUsage(llvm::raw_ostream& os);

        // Merges every input (first write wins, inputs in order, then the
        // existing output when appending) and saves the result. Returns the
        // process exit status.
        int runTool(const ToolOptions& options, llvm::raw_ostream& out, llvm::raw_ostream& err);
    } // namespace cli
} // namespace ctrace::compdb
