#pragma once

#include <optional>
#include <string>
#include <system_error>
#include <utility>

#include <llvm/ADT/Twine.h>
#include <llvm/Support/Error.h>

namespace ctrace::compdb
{
    enum class ErrorKind
    {
        Io = 0,
        Deserialization = 1,
        PathEncoding = 2,
        Conversion = 3
    };

    /**
     * @brief Failure reported by the compilation database layer.
     *
     * Every fallible operation of the core returns an `llvm::Error` (or an
     * `llvm::Expected<T>`) holding one of these. The kind tells callers which
     * stage failed; `text()` is the human-readable message and is what
     * `llvm::toString()` yields.
     */
    class DatabaseError : public llvm::ErrorInfo<DatabaseError>
    {
      public:
        static char ID;

        DatabaseError(ErrorKind kind, std::string message)
            : kind_(kind), message_(std::move(message))
        {
        }

        ErrorKind kind() const
        {
            return kind_;
        }

        const std::string& text() const
        {
            return message_;
        }

        void log(llvm::raw_ostream& os) const override;

        std::error_code convertToErrorCode() const override;

      private:
        ErrorKind kind_;
        std::string message_;
    };

    llvm::Error makeDatabaseError(ErrorKind kind, const llvm::Twine& message);

    // Returns the kind carried by `err` and consumes it. Errors that are not a
    // DatabaseError (e.g. a raw llvm::json::ParseError) report Deserialization.
    // A success value yields std::nullopt.
    std::optional<ErrorKind> consumeErrorKind(llvm::Error err);
} // namespace ctrace::compdb
