#pragma once

#include "justdl/errors.hpp"

#include <string>

#include <curl/curl.h>

namespace justdl::detail {

void ensureCurlInitialized();

struct TransferFailure {
    ErrorKind kind{ErrorKind::Network};
    bool retryable{false};
    std::string message;
};

// Maps a finished transfer to an error class. `http_code` is the last
// response status (0 if none was received).
[[nodiscard]] TransferFailure classifyTransfer(CURLcode code, long http_code);

} // namespace justdl::detail
