#pragma once

#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>

namespace justdl {

enum class ErrorKind {
    InvalidInput,
    UnresolvableSource,
    Network,
    MediaProcessing,
    Filesystem,
    WorkerCrash,
    Cancelled,
    Config,
};

[[nodiscard]] std::string_view toString(ErrorKind kind) noexcept;
[[nodiscard]] std::optional<ErrorKind> parseErrorKind(std::string_view text) noexcept;

class Error : public std::runtime_error {
public:
    Error(ErrorKind kind, const std::string& message)
        : std::runtime_error(message), kind_(kind) {}

    [[nodiscard]] ErrorKind kind() const noexcept { return kind_; }

private:
    ErrorKind kind_;
};

class InvalidInputError : public Error {
public:
    explicit InvalidInputError(const std::string& message) : Error(ErrorKind::InvalidInput, message) {}
};

class UnresolvableSourceError : public Error {
public:
    explicit UnresolvableSourceError(const std::string& message)
        : Error(ErrorKind::UnresolvableSource, message) {}
};

// Transient by nature; raised only once the retry budget is spent.
class NetworkError : public Error {
public:
    explicit NetworkError(const std::string& message) : Error(ErrorKind::Network, message) {}
};

class MediaProcessingError : public Error {
public:
    explicit MediaProcessingError(const std::string& message)
        : Error(ErrorKind::MediaProcessing, message) {}
};

class FilesystemError : public Error {
public:
    explicit FilesystemError(const std::string& message) : Error(ErrorKind::Filesystem, message) {}
};

class WorkerCrashError : public Error {
public:
    explicit WorkerCrashError(const std::string& message) : Error(ErrorKind::WorkerCrash, message) {}
};

class CancelledError : public Error {
public:
    CancelledError() : Error(ErrorKind::Cancelled, "cancelled by user") {}
};

class ConfigError : public Error {
public:
    explicit ConfigError(const std::string& message) : Error(ErrorKind::Config, message) {}
};

// Throws the exception class matching `kind`.
[[noreturn]] void throwError(ErrorKind kind, const std::string& message);

} // namespace justdl
