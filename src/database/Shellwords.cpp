#include "database/Shellwords.hpp"

#include <cstddef>
#include <string>
#include <utility>
#include <vector>

#include "database/DatabaseError.hpp"

namespace ctrace::compdb::shellwords
{
    namespace
    {
        bool isSafeChar(char c)
        {
            if ((c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z') || (c >= '0' && c <= '9'))
                return true;
            switch (c)
            {
            case '@':
            case '%':
            case '+':
            case '=':
            case ':':
            case ',':
            case '.':
            case '/':
            case '_':
            case '-':
                return true;
            default:
                return false;
            }
        }

        bool isBlank(char c)
        {
            return c == ' ' || c == '\t' || c == '\n';
        }

        // Characters a backslash escapes inside double quotes.
        bool isDoubleQuoteEscapable(char c)
        {
            return c == '$' || c == '`' || c == '"' || c == '\\' || c == '\n';
        }
    } // namespace

    std::string escape(llvm::StringRef word)
    {
        if (word.empty())
            return "''";

        bool safe = true;
        for (char c : word)
        {
            if (!isSafeChar(c))
            {
                safe = false;
                break;
            }
        }
        if (safe)
            return word.str();

        std::string out;
        out.reserve(word.size() + 2);
        out.push_back('\'');
        for (char c : word)
        {
            // A single quote cannot appear inside single quotes: close, emit
            // an escaped quote, reopen.
            if (c == '\'')
                out += "'\\''";
            else
                out.push_back(c);
        }
        out.push_back('\'');
        return out;
    }

    std::string join(const std::vector<std::string>& argv)
    {
        std::string out;
        for (std::size_t i = 0; i < argv.size(); ++i)
        {
            if (i > 0)
                out.push_back(' ');
            out += escape(argv[i]);
        }
        return out;
    }

    llvm::Expected<std::vector<std::string>> split(llvm::StringRef command)
    {
        std::vector<std::string> words;
        std::string current;
        // An empty quoted word ('' or "") still produces an argument.
        bool inWord = false;

        enum class State
        {
            Normal,
            SingleQuote,
            DoubleQuote
        };

        State state = State::Normal;
        for (std::size_t i = 0; i < command.size(); ++i)
        {
            char c = command[i];
            if (state == State::Normal)
            {
                if (isBlank(c))
                {
                    if (inWord)
                    {
                        words.push_back(std::move(current));
                        current.clear();
                        inWord = false;
                    }
                    continue;
                }
                if (c == '\'')
                {
                    state = State::SingleQuote;
                    inWord = true;
                    continue;
                }
                if (c == '"')
                {
                    state = State::DoubleQuote;
                    inWord = true;
                    continue;
                }
                if (c == '\\')
                {
                    if (i + 1 >= command.size())
                        return makeDatabaseError(ErrorKind::Conversion,
                                                 "trailing backslash in command: " + command);
                    char next = command[++i];
                    if (next == '\n')
                        continue;
                    current.push_back(next);
                    inWord = true;
                    continue;
                }
                current.push_back(c);
                inWord = true;
                continue;
            }

            if (state == State::SingleQuote)
            {
                if (c == '\'')
                {
                    state = State::Normal;
                    continue;
                }
                current.push_back(c);
                continue;
            }

            if (c == '"')
            {
                state = State::Normal;
                continue;
            }
            if (c == '\\' && i + 1 < command.size() && isDoubleQuoteEscapable(command[i + 1]))
            {
                char next = command[++i];
                if (next != '\n')
                    current.push_back(next);
                continue;
            }
            current.push_back(c);
        }

        if (state == State::SingleQuote)
            return makeDatabaseError(ErrorKind::Conversion,
                                     "unterminated single quote in command: " + command);
        if (state == State::DoubleQuote)
            return makeDatabaseError(ErrorKind::Conversion,
                                     "unterminated double quote in command: " + command);

        if (inWord)
            words.push_back(std::move(current));

        return std::move(words);
    }
} // namespace ctrace::compdb::shellwords
