// CompilationDatabase.hpp
#pragma once

#include <cstddef>
#include <filesystem>
#include <optional>
#include <string>
#include <unordered_set>
#include <utility>
#include <vector>

#include <llvm/Support/Error.h>

namespace ctrace::compdb
{

// One compiled source file: where it was built, which file, with what command.
// `output` is informative only and does not take part in identity.
struct Entry
{
    std::filesystem::path                directory;
    std::filesystem::path                file;
    std::vector<std::string>             command;
    std::optional<std::filesystem::path> output;
};

// Identity is (directory, file, command); `output` is ignored.
bool operator==(const Entry &lhs, const Entry &rhs);
bool operator!=(const Entry &lhs, const Entry &rhs);

struct EntryHash
{
    std::size_t operator()(const Entry &entry) const;
};

// Duplicates by identity collapse on insertion; the member already present is
// kept (first write wins).
using Entries = std::unordered_set<Entry, EntryHash>;

// Adds every entry of `from` to `into`. Returns how many were dropped because
// an entry with the same identity was already in `into`.
std::size_t mergeEntries(Entries &into, const Entries &from);

// Shape selection for Database::save. Loading detects the shape per record
// and ignores this object.
class DatabaseFormat
{
  public:
    DatabaseFormat() = default;

    DatabaseFormat &setCommandAsArray(bool value)
    {
        commandAsArray_ = value;
        return *this;
    }

    bool isCommandAsArray() const
    {
        return commandAsArray_;
    }

  private:
    bool commandAsArray_ = true;

    // Other attributes might be whether `output` is written at all and
    // whether paths are made relative to `directory`.
};

// JSON compilation database stored at one path. Holds no state besides the
// path; every call opens, reads or writes, and closes the file.
class Database
{
  public:
    explicit Database(std::filesystem::path path) : path_(std::move(path))
    {
    }

    const std::filesystem::path &path() const
    {
        return path_;
    }

    // Reads and converts every record. If any record fails to convert, no
    // entries are returned and the error lists every failing record.
    llvm::Expected<Entries> load() const;

    // Converts every entry before touching the file, so a conversion failure
    // leaves an existing database unmodified.
    llvm::Error save(const Entries &entries, const DatabaseFormat &format) const;

  private:
    std::filesystem::path path_;
};

} // namespace ctrace::compdb
