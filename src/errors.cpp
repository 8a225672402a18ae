#include "justdl/errors.hpp"

#include <array>
#include <utility>

namespace justdl {

namespace {

constexpr std::array<std::pair<ErrorKind, std::string_view>, 8> kErrorKindNames{{
    {ErrorKind::InvalidInput, "invalid-input"},
    {ErrorKind::UnresolvableSource, "unresolvable-source"},
    {ErrorKind::Network, "network"},
    {ErrorKind::MediaProcessing, "media-processing"},
    {ErrorKind::Filesystem, "filesystem"},
    {ErrorKind::WorkerCrash, "worker-crashed"},
    {ErrorKind::Cancelled, "cancelled"},
    {ErrorKind::Config, "config"},
}};

} // namespace

std::string_view toString(ErrorKind kind) noexcept {
    for (const auto& [value, name] : kErrorKindNames) {
        if (value == kind) {
            return name;
        }
    }
    return "unknown";
}

std::optional<ErrorKind> parseErrorKind(std::string_view text) noexcept {
    for (const auto& [value, name] : kErrorKindNames) {
        if (name == text) {
            return value;
        }
    }
    return std::nullopt;
}

void throwError(ErrorKind kind, const std::string& message) {
    switch (kind) {
        case ErrorKind::InvalidInput: throw InvalidInputError(message);
        case ErrorKind::UnresolvableSource: throw UnresolvableSourceError(message);
        case ErrorKind::Network: throw NetworkError(message);
        case ErrorKind::MediaProcessing: throw MediaProcessingError(message);
        case ErrorKind::Filesystem: throw FilesystemError(message);
        case ErrorKind::WorkerCrash: throw WorkerCrashError(message);
        case ErrorKind::Cancelled: throw CancelledError();
        case ErrorKind::Config: throw ConfigError(message);
    }
    throw Error(kind, message);
}

} // namespace justdl
