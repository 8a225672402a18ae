#include "justdl/url_utils.hpp"

#include "justdl/file_utils.hpp"

#include <algorithm>
#include <cctype>
#include <regex>

namespace justdl {

std::optional<UrlParts> parseUrl(const std::string& url) {
    static const std::regex pattern{R"(^(https?)://([^/?#\s:]+)(:\d{1,5})?(/[^?#\s]*)?(\?[^#\s]*)?(#\S*)?$)",
                                    std::regex::icase};
    std::smatch match;
    if (!std::regex_match(url, match, pattern)) {
        return std::nullopt;
    }

    UrlParts parts;
    parts.scheme = match[1].str();
    std::transform(parts.scheme.begin(), parts.scheme.end(), parts.scheme.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    parts.host = match[2].str();
    parts.path = match[4].matched ? match[4].str() : "/";
    parts.query = match[5].matched ? match[5].str().substr(1) : std::string{};
    return parts;
}

bool isValidUrl(const std::string& url) {
    return parseUrl(url).has_value();
}

bool isYouTubeVideoUrl(const std::string& url) {
    static const std::regex pattern{
        R"(^https?://(?:(?:www\.|m\.|music\.)?youtube\.com/(?:watch\?(?:.*&)?v=|v/|shorts/)|youtu\.be/)[\w-]+.*$)",
        std::regex::icase};
    return std::regex_match(url, pattern);
}

bool isYouTubePlaylistUrl(const std::string& url) {
    static const std::regex pattern{R"(^https?://(?:www\.|m\.|music\.)?youtube\.com/playlist\?(?:.*&)?list=[\w-]+.*$)",
                                    std::regex::icase};
    return std::regex_match(url, pattern);
}

std::string percentDecode(const std::string& text) {
    std::string out;
    out.reserve(text.size());
    for (std::size_t i = 0; i < text.size(); ++i) {
        if (text[i] == '%' && i + 2 < text.size() &&
            std::isxdigit(static_cast<unsigned char>(text[i + 1])) &&
            std::isxdigit(static_cast<unsigned char>(text[i + 2]))) {
            out.push_back(static_cast<char>(std::stoi(text.substr(i + 1, 2), nullptr, 16)));
            i += 2;
        } else {
            out.push_back(text[i]);
        }
    }
    return out;
}

std::string filenameFromUrl(const std::string& url) {
    const auto parts = parseUrl(url);
    if (!parts) {
        return "download";
    }
    const auto slash = parts->path.find_last_of('/');
    const std::string last = slash == std::string::npos ? parts->path : parts->path.substr(slash + 1);
    return sanitizeFilename(percentDecode(last));
}

} // namespace justdl
