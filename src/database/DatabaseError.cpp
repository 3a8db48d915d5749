#include "database/DatabaseError.hpp"

#include <llvm/ADT/Twine.h>
#include <llvm/Support/raw_ostream.h>

namespace ctrace::compdb
{
    char DatabaseError::ID = 0;

    void DatabaseError::log(llvm::raw_ostream& os) const
    {
        os << message_;
    }

    std::error_code DatabaseError::convertToErrorCode() const
    {
        if (kind_ == ErrorKind::Io)
            return std::make_error_code(std::errc::io_error);
        return llvm::inconvertibleErrorCode();
    }

    llvm::Error makeDatabaseError(ErrorKind kind, const llvm::Twine& message)
    {
        return llvm::make_error<DatabaseError>(kind, message.str());
    }

    std::optional<ErrorKind> consumeErrorKind(llvm::Error err)
    {
        if (!err)
            return std::nullopt;

        std::optional<ErrorKind> kind;
        llvm::handleAllErrors(
            std::move(err), [&](const DatabaseError& e) { kind = e.kind(); },
            [&](const llvm::ErrorInfoBase&) { kind = ErrorKind::Deserialization; });
        return kind;
    }
} // namespace ctrace::compdb
