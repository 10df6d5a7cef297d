#pragma once

#include <exception>
#include <string>
#include <system_error>

namespace cgfs {

/**
 * @brief Error codes for filesystem request handling
 */
enum class ErrorCode {
    // Lookup errors (reported to the kernel as ENOENT)
    NOT_FOUND = 1000,
    SERVICE_FAILURE = 1001,
    SOURCE_UNAVAILABLE = 1002,

    // Request errors
    READ_ONLY = 2000,
    IS_DIRECTORY = 2001,
    NOT_A_DIRECTORY = 2002,

    // System errors
    SYSTEM_ERROR = 8000,
    IO_ERROR = 8001,

    // Configuration errors
    CONFIG_INVALID = 9000,
    CONFIG_MISSING = 9001,
    INVALID_TYPE = 9002,
    FILE_NOT_FOUND = 9003,

    // Generic error
    UNKNOWN_ERROR = 9999
};

/**
 * @brief Error category for cgfs errors
 */
class FsErrorCategory : public std::error_category {
public:
    const char* name() const noexcept override
    {
        return "cgfs";
    }

    std::string message(int ev) const override
    {
        switch (static_cast<ErrorCode>(ev)) {
            case ErrorCode::NOT_FOUND:
                return "No such entry";
            case ErrorCode::SERVICE_FAILURE:
                return "Cgroup service request failed";
            case ErrorCode::SOURCE_UNAVAILABLE:
                return "Kernel source unavailable";

            case ErrorCode::READ_ONLY:
                return "Read-only filesystem";
            case ErrorCode::IS_DIRECTORY:
                return "Is a directory";
            case ErrorCode::NOT_A_DIRECTORY:
                return "Not a directory";

            case ErrorCode::SYSTEM_ERROR:
                return "System error";
            case ErrorCode::IO_ERROR:
                return "I/O error";

            case ErrorCode::CONFIG_INVALID:
                return "Invalid configuration";
            case ErrorCode::CONFIG_MISSING:
                return "Missing configuration";
            case ErrorCode::INVALID_TYPE:
                return "Invalid type for configuration value";
            case ErrorCode::FILE_NOT_FOUND:
                return "File not found";

            case ErrorCode::UNKNOWN_ERROR:
            default:
                return "Unknown error";
        }
    }
};

/**
 * @brief Get the cgfs error category instance
 */
const FsErrorCategory& getFsErrorCategory();

/**
 * @brief Exception thrown by every cgfs component
 *
 * Lookup failures (NOT_FOUND, SERVICE_FAILURE, SOURCE_UNAVAILABLE) abort the
 * single request being served and are collapsed to ENOENT by the FUSE bridge.
 */
class FsError : public std::exception {
public:
    /**
     * @brief Construct an error
     * @param code The error code
     * @param message Detail appended to the category message
     */
    FsError(ErrorCode code, std::string message);

    FsError(const FsError& other) noexcept;
    FsError(FsError&& other) noexcept;
    FsError& operator=(const FsError& other) noexcept;
    FsError& operator=(FsError&& other) noexcept;
    ~FsError() noexcept override = default;

    const char* what() const noexcept override;

    ErrorCode getErrorCode() const noexcept;

    /**
     * @brief Detail message without the category prefix
     */
    const std::string& detail() const noexcept;

    std::error_code code() const noexcept;

    /**
     * @brief True for the three codes that mean "no such entry" externally
     */
    bool isLookupFailure() const noexcept;

private:
    ErrorCode error_code_;
    std::string message_;
    mutable std::string full_message_; // Cache for what() result
};

/**
 * @brief Create an error from a system error
 * @param code The cgfs error code
 * @param sys_error The system error
 */
FsError makeSystemError(ErrorCode code, const std::system_error& sys_error);

} // namespace cgfs
