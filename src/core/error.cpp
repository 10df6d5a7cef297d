#include <cgfs/core/error.hpp>
#include <sstream>

namespace cgfs {

const FsErrorCategory& getFsErrorCategory()
{
    static FsErrorCategory category;
    return category;
}

FsError::FsError(ErrorCode code, std::string message)
    : error_code_(code), message_(std::move(message))
{}

FsError::FsError(const FsError& other) noexcept
    : error_code_(other.error_code_), message_(other.message_), full_message_(other.full_message_)
{}

FsError::FsError(FsError&& other) noexcept
    : error_code_(other.error_code_), message_(std::move(other.message_)),
      full_message_(std::move(other.full_message_))
{
    other.error_code_ = ErrorCode::UNKNOWN_ERROR;
}

FsError& FsError::operator=(const FsError& other) noexcept
{
    if (this != &other) {
        error_code_ = other.error_code_;
        message_ = other.message_;
        full_message_ = other.full_message_;
    }
    return *this;
}

FsError& FsError::operator=(FsError&& other) noexcept
{
    if (this != &other) {
        error_code_ = other.error_code_;
        message_ = std::move(other.message_);
        full_message_ = std::move(other.full_message_);

        other.error_code_ = ErrorCode::UNKNOWN_ERROR;
    }
    return *this;
}

const char* FsError::what() const noexcept
{
    if (full_message_.empty()) {
        std::ostringstream oss;
        oss << "[" << getFsErrorCategory().name() << " " << static_cast<int>(error_code_) << "] "
            << getFsErrorCategory().message(static_cast<int>(error_code_));

        if (!message_.empty()) {
            oss << ": " << message_;
        }

        full_message_ = oss.str();
    }
    return full_message_.c_str();
}

ErrorCode FsError::getErrorCode() const noexcept
{
    return error_code_;
}

const std::string& FsError::detail() const noexcept
{
    return message_;
}

std::error_code FsError::code() const noexcept
{
    return std::error_code(static_cast<int>(error_code_), getFsErrorCategory());
}

bool FsError::isLookupFailure() const noexcept
{
    switch (error_code_) {
        case ErrorCode::NOT_FOUND:
        case ErrorCode::SERVICE_FAILURE:
        case ErrorCode::SOURCE_UNAVAILABLE:
            return true;
        default:
            return false;
    }
}

FsError makeSystemError(ErrorCode code, const std::system_error& sys_error)
{
    std::ostringstream oss;
    oss << sys_error.what() << " (system error " << sys_error.code().value() << ")";
    return FsError(code, oss.str());
}

} // namespace cgfs
