#pragma once

#include <optional>
#include <string>

namespace justdl {

struct UrlParts {
    std::string scheme;
    std::string host;
    std::string path;
    std::string query;
};

// Shape check only: http(s) scheme, non-empty host, no whitespace.
[[nodiscard]] std::optional<UrlParts> parseUrl(const std::string& url);
[[nodiscard]] bool isValidUrl(const std::string& url);

[[nodiscard]] bool isYouTubeVideoUrl(const std::string& url);
[[nodiscard]] bool isYouTubePlaylistUrl(const std::string& url);

[[nodiscard]] std::string percentDecode(const std::string& text);

// Last path segment, percent-decoded and sanitized; "download" when empty.
[[nodiscard]] std::string filenameFromUrl(const std::string& url);

} // namespace justdl
