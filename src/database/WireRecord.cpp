#include "database/WireRecord.hpp"

#include <filesystem>
#include <string>
#include <tuple>
#include <type_traits>
#include <utility>
#include <vector>

#include <llvm/ADT/Twine.h>

#include "database/DatabaseError.hpp"
#include "database/Shellwords.hpp"

namespace ctrace::compdb::wire
{
    namespace
    {
        llvm::Expected<std::string> pathToString(const std::filesystem::path& path)
        {
            std::string text = path.string();
            if (!llvm::json::isUTF8(text))
                return makeDatabaseError(ErrorKind::PathEncoding,
                                         "failed to convert path to UTF-8 string: " + text);
            return std::move(text);
        }

        llvm::Error checkCommand(const std::vector<std::string>& command,
                                 const std::string& file)
        {
            for (const auto& arg : command)
            {
                if (!llvm::json::isUTF8(arg))
                    return makeDatabaseError(ErrorKind::PathEncoding,
                                             "command for " + file +
                                                 " has an argument that is not valid UTF-8");
            }
            return llvm::Error::success();
        }

        // Array records sort before string records; within a shape the
        // arguments or the command text decide.
        bool commandLess(const WireRecord& lhs, const WireRecord& rhs)
        {
            if (lhs.index() != rhs.index())
                return lhs.index() < rhs.index();
            if (const auto* array = std::get_if<ArrayEntry>(&lhs))
                return array->arguments < std::get<ArrayEntry>(rhs).arguments;
            return std::get<StringEntry>(lhs).command < std::get<StringEntry>(rhs).command;
        }

        const std::string& fileOf(const WireRecord& record)
        {
            return std::visit([](const auto& e) -> const std::string& { return e.file; },
                              record);
        }

        const std::string& directoryOf(const WireRecord& record)
        {
            return std::visit([](const auto& e) -> const std::string& { return e.directory; },
                              record);
        }
    } // namespace

    llvm::Expected<WireRecord> fromEntry(const Entry& entry, const DatabaseFormat& format)
    {
        auto directory = pathToString(entry.directory);
        if (!directory)
            return directory.takeError();
        auto file = pathToString(entry.file);
        if (!file)
            return file.takeError();

        llvm::Optional<std::string> output;
        if (entry.output)
        {
            auto text = pathToString(*entry.output);
            if (!text)
                return text.takeError();
            output = std::move(*text);
        }

        if (auto err = checkCommand(entry.command, *file))
            return std::move(err);

        if (format.isCommandAsArray())
        {
            ArrayEntry record;
            record.directory = std::move(*directory);
            record.file = std::move(*file);
            record.arguments = entry.command;
            record.output = std::move(output);
            return WireRecord(std::move(record));
        }

        StringEntry record;
        record.directory = std::move(*directory);
        record.file = std::move(*file);
        record.command = shellwords::join(entry.command);
        record.output = std::move(output);
        return WireRecord(std::move(record));
    }

    llvm::Expected<Entry> toEntry(const WireRecord& record)
    {
        Entry entry;
        std::visit(
            [&](const auto& e) {
                entry.directory = e.directory;
                entry.file = e.file;
                if (e.output)
                    entry.output = std::filesystem::path(*e.output);
            },
            record);

        if (const auto* array = std::get_if<ArrayEntry>(&record))
        {
            entry.command = array->arguments;
            return std::move(entry);
        }

        const auto& string = std::get<StringEntry>(record);
        auto argv = shellwords::split(string.command);
        if (!argv)
            return makeDatabaseError(ErrorKind::Conversion,
                                     "cannot convert entry for " + string.file + ": " +
                                         llvm::toString(argv.takeError()));
        entry.command = std::move(*argv);
        return std::move(entry);
    }

    bool lessByFile(const WireRecord& lhs, const WireRecord& rhs)
    {
        const auto lhsKey = std::tie(fileOf(lhs), directoryOf(lhs));
        const auto rhsKey = std::tie(fileOf(rhs), directoryOf(rhs));
        if (lhsKey != rhsKey)
            return lhsKey < rhsKey;
        return commandLess(lhs, rhs);
    }

    bool fromJSON(const llvm::json::Value& value, WireRecord& out, llvm::json::Path path)
    {
        llvm::json::ObjectMapper mapper(value, path);
        if (!mapper)
            return false;

        const llvm::json::Object* obj = value.getAsObject();
        if (obj->get("arguments"))
        {
            ArrayEntry record;
            if (!(mapper.map("directory", record.directory) && mapper.map("file", record.file) &&
                  mapper.map("arguments", record.arguments) && mapper.map("output", record.output)))
                return false;
            out = std::move(record);
            return true;
        }

        if (obj->get("command"))
        {
            StringEntry record;
            if (!(mapper.map("directory", record.directory) && mapper.map("file", record.file) &&
                  mapper.map("command", record.command) && mapper.map("output", record.output)))
                return false;
            out = std::move(record);
            return true;
        }

        path.report("expected \"arguments\" or \"command\"");
        return false;
    }

    void write(llvm::json::OStream& os, const WireRecord& record)
    {
        std::visit(
            [&](const auto& e) {
                using T = std::decay_t<decltype(e)>;
                os.object([&] {
                    os.attribute("directory", e.directory);
                    os.attribute("file", e.file);
                    if constexpr (std::is_same_v<T, ArrayEntry>)
                    {
                        os.attributeArray("arguments", [&] {
                            for (const auto& arg : e.arguments)
                                os.value(arg);
                        });
                    }
                    else
                    {
                        os.attribute("command", e.command);
                    }
                    if (e.output)
                        os.attribute("output", *e.output);
                });
            },
            record);
    }
} // namespace ctrace::compdb::wire
