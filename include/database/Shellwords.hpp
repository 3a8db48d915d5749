#pragma once

#include <string>
#include <vector>

#include <llvm/ADT/StringRef.h>
#include <llvm/Support/Error.h>

namespace ctrace::compdb::shellwords
{
    // Quote one argument so a POSIX shell reads it back as exactly one word.
    // Words made only of [A-Za-z0-9@%+=:,./_-] are left untouched, the empty
    // word becomes '' and everything else is wrapped in single quotes.
    std::string escape(llvm::StringRef word);

    // escape() every argument and separate them with single spaces.
    std::string join(const std::vector<std::string>& argv);

    /**
     * @brief Splits a command line into words using POSIX shell quoting.
     *
     * Handles blanks (space, tab, newline) as separators, single quotes,
     * double quotes (where a backslash only escapes $ ` " \ and newline) and
     * backslash escapes outside quotes. Backslash-newline is a line
     * continuation. No expansion of any kind is performed.
     *
     * @return The words, or a Conversion DatabaseError for an unterminated
     *         quote or a trailing backslash.
     */
    llvm::Expected<std::vector<std::string>> split(llvm::StringRef command);
} // namespace ctrace::compdb::shellwords
