#include "CompilationDatabase.hpp"

#include <string>
#include <utility>
#include <vector>

#include <gtest/gtest.h>
#include <llvm/Support/JSON.h>

#include "TestSupport.hpp"
#include "database/DatabaseError.hpp"

using namespace ctrace::compdb;

namespace
{
    Entry makeEntry(const std::string& file, std::vector<std::string> command,
                    const char* output = nullptr)
    {
        Entry entry;
        entry.directory = "/build";
        entry.file = file;
        entry.command = std::move(command);
        if (output)
            entry.output = output;
        return entry;
    }

    Entries sampleEntries()
    {
        return {
            makeEntry("/build/a.c", {"cc", "-c", "a.c"}, "/build/a.o"),
            makeEntry("/src/with space.c", {"cc", "-DMSG=\"hi there\"", "-c", "with space.c"}),
            makeEntry("/src/quote's.cpp", {"c++", "-std=c++20", "-c", "quote's.cpp", ""}),
            makeEntry("/src/empty.c", {}),
        };
    }

    llvm::json::Value parseFile(const std::string& text)
    {
        auto parsed = llvm::json::parse(text);
        if (!parsed)
        {
            ADD_FAILURE() << llvm::toString(parsed.takeError());
            return nullptr;
        }
        return std::move(*parsed);
    }
} // namespace

class DatabaseTest : public test::TempDirTest
{
};

TEST_F(DatabaseTest, RoundTripsBothFormats)
{
    for (bool asArray : {true, false})
    {
        Database db(pathFor(asArray ? "array.json" : "string.json"));
        const Entries entries = sampleEntries();

        ASSERT_TRUE(test::succeeded(db.save(entries, DatabaseFormat().setCommandAsArray(asArray))));

        auto loaded = db.load();
        ASSERT_TRUE(static_cast<bool>(loaded)) << llvm::toString(loaded.takeError());
        EXPECT_EQ(*loaded, entries);

        auto a = loaded->find(makeEntry("/build/a.c", {"cc", "-c", "a.c"}));
        ASSERT_NE(a, loaded->end());
        ASSERT_TRUE(a->output.has_value());
        EXPECT_EQ(a->output->string(), "/build/a.o");
    }
}

TEST_F(DatabaseTest, ArrayFormatWritesArgumentsWithoutOutputKey)
{
    Database db(pathFor("compile_commands.json"));
    Entries entries{makeEntry("/build/a.c", {"cc", "-c", "a.c"})};

    ASSERT_TRUE(test::succeeded(db.save(entries, DatabaseFormat())));

    llvm::json::Value expected = llvm::json::Array{llvm::json::Object{
        {"directory", "/build"},
        {"file", "/build/a.c"},
        {"arguments", llvm::json::Array{"cc", "-c", "a.c"}},
    }};
    const std::string text = readFile(db.path());
    EXPECT_EQ(parseFile(text), expected) << text;
    EXPECT_EQ(text.find("output"), std::string::npos) << text;
}

TEST_F(DatabaseTest, StringFormatWritesCommand)
{
    Database db(pathFor("compile_commands.json"));
    Entries entries{makeEntry("/build/a.c", {"cc", "-c", "a.c"})};

    ASSERT_TRUE(test::succeeded(db.save(entries, DatabaseFormat().setCommandAsArray(false))));

    llvm::json::Value expected = llvm::json::Array{llvm::json::Object{
        {"directory", "/build"},
        {"file", "/build/a.c"},
        {"command", "cc -c a.c"},
    }};
    EXPECT_EQ(parseFile(readFile(db.path())), expected);
}

TEST_F(DatabaseTest, OutputIsPrettyPrinted)
{
    Database db(pathFor("compile_commands.json"));
    ASSERT_TRUE(test::succeeded(db.save(sampleEntries(), DatabaseFormat())));

    const std::string text = readFile(db.path());
    EXPECT_EQ(text.rfind("[\n  {\n    \"directory\": ", 0), 0u) << text;
    EXPECT_NE(text.find("\n    \"arguments\": [\n      \"cc\","), std::string::npos) << text;
}

TEST_F(DatabaseTest, SaveIsDeterministic)
{
    Database first(pathFor("first.json"));
    Database second(pathFor("second.json"));

    Entries forward;
    Entries backward;
    const Entries sample = sampleEntries();
    std::vector<Entry> ordered(sample.begin(), sample.end());
    for (const auto& entry : ordered)
        forward.insert(entry);
    for (auto it = ordered.rbegin(); it != ordered.rend(); ++it)
        backward.insert(*it);

    ASSERT_TRUE(test::succeeded(first.save(forward, DatabaseFormat())));
    ASSERT_TRUE(test::succeeded(second.save(backward, DatabaseFormat())));
    EXPECT_EQ(readFile(first.path()), readFile(second.path()));
}

TEST_F(DatabaseTest, SaveTruncatesExistingFile)
{
    Database db(pathFor("compile_commands.json"));
    writeFile(db.path(), std::string(4096, ' ') + "[]");

    Entries entries{makeEntry("/build/a.c", {"cc", "-c", "a.c"})};
    ASSERT_TRUE(test::succeeded(db.save(entries, DatabaseFormat())));

    auto loaded = db.load();
    ASSERT_TRUE(static_cast<bool>(loaded)) << llvm::toString(loaded.takeError());
    EXPECT_EQ(*loaded, entries);
}

TEST_F(DatabaseTest, SaveOfEmptySetWritesEmptyArray)
{
    Database db(pathFor("compile_commands.json"));
    ASSERT_TRUE(test::succeeded(db.save(Entries{}, DatabaseFormat())));

    EXPECT_EQ(parseFile(readFile(db.path())), llvm::json::Value(llvm::json::Array{}));
    auto loaded = db.load();
    ASSERT_TRUE(static_cast<bool>(loaded)) << llvm::toString(loaded.takeError());
    EXPECT_TRUE(loaded->empty());
}

TEST_F(DatabaseTest, PathEncodingFailureLeavesFileUntouched)
{
    Database db(pathFor("compile_commands.json"));
    const std::string original = "[{\"directory\": \"/keep\", \"file\": \"k.c\", \"command\": \"cc k.c\"}]";
    writeFile(db.path(), original);

    Entries entries = sampleEntries();
    Entry bad = makeEntry("/build/bad.c", {"cc", "-c", "bad.c"});
    bad.directory = "/build/\xff";
    entries.insert(bad);

    llvm::Error err = db.save(entries, DatabaseFormat());
    EXPECT_EQ(consumeErrorKind(std::move(err)), ErrorKind::PathEncoding);
    EXPECT_EQ(readFile(db.path()), original);
}

TEST_F(DatabaseTest, SaveIntoMissingDirectoryIsAnIoError)
{
    Database db(pathFor("missing/dir/compile_commands.json"));
    llvm::Error err = db.save(sampleEntries(), DatabaseFormat());
    EXPECT_EQ(consumeErrorKind(std::move(err)), ErrorKind::Io);
}

TEST_F(DatabaseTest, LoadOfMissingFileIsAnIoError)
{
    Database db(pathFor("does-not-exist.json"));
    auto loaded = db.load();
    ASSERT_FALSE(static_cast<bool>(loaded));
    EXPECT_EQ(consumeErrorKind(loaded.takeError()), ErrorKind::Io);
}

TEST_F(DatabaseTest, LoadAcceptsMixedShapes)
{
    Database db(pathFor("mixed.json"));
    writeFile(db.path(), R"([
        {"directory": "/build", "file": "a.c", "arguments": ["cc", "-c", "a.c"]},
        {"directory": "/build", "file": "b.c", "command": "cc -c 'b c.c'", "output": "b.o"}
    ])");

    auto loaded = db.load();
    ASSERT_TRUE(static_cast<bool>(loaded)) << llvm::toString(loaded.takeError());

    Entries expected{makeEntry("a.c", {"cc", "-c", "a.c"}), makeEntry("b.c", {"cc", "-c", "b c.c"})};
    EXPECT_EQ(*loaded, expected);
}

TEST_F(DatabaseTest, LoadCollapsesDuplicates)
{
    Database db(pathFor("dups.json"));
    writeFile(db.path(), R"([
        {"directory": "/build", "file": "a.c", "arguments": ["cc", "-c", "a.c"], "output": "one.o"},
        {"directory": "/build", "file": "a.c", "command": "cc -c a.c", "output": "two.o"}
    ])");

    auto loaded = db.load();
    ASSERT_TRUE(static_cast<bool>(loaded)) << llvm::toString(loaded.takeError());
    ASSERT_EQ(loaded->size(), 1u);
    EXPECT_EQ(loaded->begin()->output->string(), "one.o");
}

TEST_F(DatabaseTest, LoadRejectsInvalidDocuments)
{
    const char* documents[] = {
        "",
        "[",
        "{\"directory\": \"/build\", \"file\": \"a.c\", \"command\": \"cc a.c\"}",
        "[{\"directory\": \"/build\", \"file\": \"a.c\"}]",
        "[{\"directory\": \"/build\", \"file\": \"a.c\", \"arguments\": [1, 2]}]",
        "[42]",
    };

    Database db(pathFor("invalid.json"));
    for (const char* document : documents)
    {
        writeFile(db.path(), document);
        auto loaded = db.load();
        ASSERT_FALSE(static_cast<bool>(loaded)) << document;
        EXPECT_EQ(consumeErrorKind(loaded.takeError()), ErrorKind::Deserialization) << document;
    }
}

TEST_F(DatabaseTest, LoadReportsMalformedRecordAndReturnsNothing)
{
    Database db(pathFor("broken.json"));
    writeFile(db.path(), R"([
        {"directory": "/build", "file": "good.c", "command": "cc -c good.c"},
        {"directory": "/build", "file": "bad.c", "command": "cc -c 'bad.c"}
    ])");

    auto loaded = db.load();
    ASSERT_FALSE(static_cast<bool>(loaded));

    std::string message;
    llvm::handleAllErrors(loaded.takeError(), [&](const DatabaseError& e) {
        EXPECT_EQ(e.kind(), ErrorKind::Conversion);
        message = e.text();
    });
    EXPECT_NE(message.find("bad.c"), std::string::npos) << message;
    EXPECT_EQ(message.find("good.c"), std::string::npos) << message;
}

TEST_F(DatabaseTest, LoadJoinsEveryConversionFailure)
{
    Database db(pathFor("broken.json"));
    writeFile(db.path(), R"([
        {"directory": "/build", "file": "first.c", "command": "cc \"first.c"},
        {"directory": "/build", "file": "fine.c", "arguments": ["cc", "fine.c"]},
        {"directory": "/build", "file": "second.c", "command": "cc second.c\\"}
    ])");

    auto loaded = db.load();
    ASSERT_FALSE(static_cast<bool>(loaded));
    const std::string message = llvm::toString(loaded.takeError());

    const auto first = message.find("first.c");
    const auto second = message.find("second.c");
    ASSERT_NE(first, std::string::npos) << message;
    ASSERT_NE(second, std::string::npos) << message;
    EXPECT_NE(message.find(", "), std::string::npos) << message;
    EXPECT_LT(first, second) << message;
}
