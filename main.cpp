#include "cli/Tool.hpp"

#include <string>

#include <llvm/Support/raw_ostream.h>

using namespace ctrace::compdb;

int main(int argc, char **argv)
{
    cli::ToolOptions options;
    std::string error;

    if (!cli::parseToolOptions(argc, argv, options, error)) {
        llvm::errs() << "error: " << error << "\n";
        cli::printUsage(llvm::errs());
        return 1;
    }

    if (options.showHelp) {
        cli::printUsage(llvm::outs());
        return 0;
    }

    return cli::runTool(options, llvm::outs(), llvm::errs());
}
