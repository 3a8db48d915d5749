#include "CompilationDatabase.hpp"

#include <algorithm>
#include <filesystem>
#include <string>
#include <system_error>
#include <utility>
#include <vector>

#include <llvm/ADT/Hashing.h>
#include <llvm/ADT/StringExtras.h>
#include <llvm/Support/FileSystem.h>
#include <llvm/Support/JSON.h>
#include <llvm/Support/MemoryBuffer.h>
#include <llvm/Support/raw_ostream.h>

#include "database/DatabaseError.hpp"
#include "database/WireRecord.hpp"

namespace ctrace::compdb
{

bool operator==(const Entry &lhs, const Entry &rhs)
{
    return lhs.directory == rhs.directory && lhs.file == rhs.file && lhs.command == rhs.command;
}

bool operator!=(const Entry &lhs, const Entry &rhs)
{
    return !(lhs == rhs);
}

std::size_t EntryHash::operator()(const Entry &entry) const
{
    // path::operator== compares components, so hash the same way.
    return llvm::hash_combine(std::filesystem::hash_value(entry.directory),
                              std::filesystem::hash_value(entry.file),
                              llvm::hash_combine_range(entry.command.begin(),
                                                       entry.command.end()));
}

std::size_t mergeEntries(Entries &into, const Entries &from)
{
    std::size_t dropped = 0;
    for (const auto &entry : from)
    {
        if (!into.insert(entry).second)
            ++dropped;
    }
    return dropped;
}

// ============================================================================
// File level helpers
// ============================================================================

namespace
{
    llvm::Expected<std::vector<wire::WireRecord>> readRecords(const std::filesystem::path &path)
    {
        auto bufferOrErr = llvm::MemoryBuffer::getFile(path.string());
        if (!bufferOrErr)
        {
            return makeDatabaseError(ErrorKind::Io, "unable to read compilation database: " +
                                                        path.string() + " (" +
                                                        bufferOrErr.getError().message() + ")");
        }

        auto parsed = llvm::json::parse<std::vector<wire::WireRecord>>(
            bufferOrErr.get()->getBuffer(), "compilation database");
        if (!parsed)
        {
            return makeDatabaseError(ErrorKind::Deserialization,
                                     "failed to parse compilation database " + path.string() +
                                         ": " + llvm::toString(parsed.takeError()));
        }
        return std::move(*parsed);
    }

    llvm::Error writeRecords(const std::filesystem::path &path,
                             const std::vector<wire::WireRecord> &records)
    {
        std::error_code ec;
        llvm::raw_fd_ostream os(path.string(), ec, llvm::sys::fs::OF_Text);
        if (ec)
        {
            return makeDatabaseError(ErrorKind::Io, "unable to open compilation database for "
                                                    "writing: " +
                                                        path.string() + " (" + ec.message() + ")");
        }

        {
            llvm::json::OStream json(os, 2);
            json.array([&] {
                for (const auto &record : records)
                    wire::write(json, record);
            });
        }
        os << "\n";
        os.close();

        if (os.has_error())
        {
            std::error_code writeErr = os.error();
            os.clear_error();
            return makeDatabaseError(ErrorKind::Io, "failed to write compilation database: " +
                                                        path.string() + " (" +
                                                        writeErr.message() + ")");
        }
        return llvm::Error::success();
    }
} // namespace

// ============================================================================
// Database
// ============================================================================

llvm::Expected<Entries> Database::load() const
{
    auto records = readRecords(path_);
    if (!records)
        return records.takeError();

    Entries entries;
    entries.reserve(records->size());

    // Keep going after a failure so the error names every bad record.
    std::vector<std::string> failures;
    for (const auto &record : *records)
    {
        auto entry = wire::toEntry(record);
        if (!entry)
        {
            failures.push_back(llvm::toString(entry.takeError()));
            continue;
        }
        entries.insert(std::move(*entry));
    }

    if (!failures.empty())
        return makeDatabaseError(ErrorKind::Conversion, llvm::join(failures, ", "));

    return std::move(entries);
}

llvm::Error Database::save(const Entries &entries, const DatabaseFormat &format) const
{
    std::vector<wire::WireRecord> records;
    records.reserve(entries.size());
    for (const auto &entry : entries)
    {
        auto record = wire::fromEntry(entry, format);
        if (!record)
            return record.takeError();
        records.push_back(std::move(*record));
    }

    std::sort(records.begin(), records.end(), wire::lessByFile);

    return writeRecords(path_, records);
}

} // namespace ctrace::compdb
