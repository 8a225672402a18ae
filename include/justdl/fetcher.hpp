#pragma once

#include <cstdint>
#include <filesystem>
#include <functional>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace justdl {

using HttpHeaders = std::vector<std::pair<std::string, std::string>>;
using ProgressFn = std::function<void(std::uint64_t done, std::optional<std::uint64_t> total)>;
using CancelFn = std::function<bool()>;

struct RemoteInfo {
    std::optional<std::uint64_t> content_length;
    bool supports_range{false};
    std::string filename;  // from Content-Disposition, if any
    std::string content_type;
};

struct FetchRequest {
    std::string url;
    HttpHeaders headers;
    std::filesystem::path destination;
    std::optional<RemoteInfo> remote;  // skips the metadata probe when set
};

// Moves bytes from a URL into a local file. Implementations own their retry
// policy and throw justdl::Error subclasses once it is exhausted.
class Fetcher {
public:
    virtual ~Fetcher() = default;

    [[nodiscard]] virtual RemoteInfo probe(const std::string& url, const HttpHeaders& headers) = 0;
    virtual std::uint64_t fetch(const FetchRequest& request, const ProgressFn& on_progress,
                                const CancelFn& should_cancel) = 0;
};

} // namespace justdl
