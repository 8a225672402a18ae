#include "justdl/detail/curl_utils.hpp"

#include <cstdlib>
#include <mutex>
#include <stdexcept>

#include <fmt/format.h>

namespace justdl::detail {

void ensureCurlInitialized() {
    static std::once_flag flag;
    std::call_once(flag, [] {
        if (curl_global_init(CURL_GLOBAL_DEFAULT) != CURLE_OK) {
            throw std::runtime_error("Failed to initialize libcurl");
        }
        std::atexit([] { curl_global_cleanup(); });
    });
}

TransferFailure classifyTransfer(CURLcode code, long http_code) {
    if (code == CURLE_HTTP_RETURNED_ERROR || (code == CURLE_OK && http_code >= 400)) {
        const auto message = fmt::format("HTTP {}", http_code);
        if (http_code == 408 || http_code == 425 || http_code == 429 || http_code >= 500) {
            return {ErrorKind::Network, true, message};
        }
        // 401/403/404/410/451 and friends: the content is gone or not ours.
        return {ErrorKind::UnresolvableSource, false, message};
    }

    const std::string message = curl_easy_strerror(code);
    switch (code) {
        case CURLE_ABORTED_BY_CALLBACK:
            return {ErrorKind::Cancelled, false, message};
        case CURLE_WRITE_ERROR:
            return {ErrorKind::Filesystem, false, message};
        case CURLE_UNSUPPORTED_PROTOCOL:
        case CURLE_URL_MALFORMAT:
        case CURLE_TOO_MANY_REDIRECTS:
            return {ErrorKind::UnresolvableSource, false, message};
        case CURLE_OUT_OF_MEMORY:
            return {ErrorKind::WorkerCrash, false, message};
        default:
            // resolve/connect/timeout/recv/partial-file: worth another try
            return {ErrorKind::Network, true, message};
    }
}

} // namespace justdl::detail
