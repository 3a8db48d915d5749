#pragma once

#include <string>
#include <variant>
#include <vector>

#include <llvm/ADT/Optional.h>
#include <llvm/Support/Error.h>
#include <llvm/Support/JSON.h>

#include "CompilationDatabase.hpp"

namespace ctrace::compdb::wire
{
    // {"directory", "file", "arguments": [...], "output"?}
    struct ArrayEntry
    {
        std::string directory;
        std::string file;
        std::vector<std::string> arguments;
        llvm::Optional<std::string> output;
    };

    // {"directory", "file", "command": "...", "output"?}
    struct StringEntry
    {
        std::string directory;
        std::string file;
        std::string command;
        llvm::Optional<std::string> output;
    };

    // The file format carries no discriminant; the shape is told apart by
    // which of "arguments" / "command" an object has.
    using WireRecord = std::variant<ArrayEntry, StringEntry>;

    // Domain -> wire. Fails with PathEncoding when a path or a command token
    // is not valid UTF-8.
    llvm::Expected<WireRecord> fromEntry(const Entry& entry, const DatabaseFormat& format);

    // Wire -> domain. Fails with Conversion when a "command" string cannot be
    // split.
    llvm::Expected<Entry> toEntry(const WireRecord& record);

    // Orders records by (file, directory, command text) for stable output.
    bool lessByFile(const WireRecord& lhs, const WireRecord& rhs);

    // llvm::json hooks, found by ADL from json::parse<T>() and ObjectMapper.
    bool fromJSON(const llvm::json::Value& value, WireRecord& out, llvm::json::Path path);

    void write(llvm::json::OStream& os, const WireRecord& record);
} // namespace ctrace::compdb::wire
