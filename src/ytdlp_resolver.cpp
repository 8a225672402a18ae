#include "justdl/ytdlp_resolver.hpp"

#include "justdl/detail/subprocess.hpp"
#include "justdl/errors.hpp"

#include <system_error>

#include <fmt/format.h>
#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

namespace justdl {

namespace {

using json = nlohmann::json;

std::string lastLine(const std::string& text) {
    const auto end = text.find_last_not_of("\r\n");
    if (end == std::string::npos) {
        return {};
    }
    const auto newline = text.rfind('\n', end);
    const auto start = newline == std::string::npos ? 0 : newline + 1;
    return text.substr(start, end - start + 1);
}

std::string runYtDlp(const std::string& program, const std::vector<std::string>& args, const std::string& url,
                     const CancelFn& should_cancel, std::chrono::milliseconds timeout) {
    detail::ProcessResult result;
    try {
        result = detail::runProcess(program, args, should_cancel, timeout);
    } catch (const std::system_error& ex) {
        throw UnresolvableSourceError(fmt::format("cannot run {}: {}", program, ex.what()));
    } catch (const detail::ProcessTimeoutError& ex) {
        throw UnresolvableSourceError(fmt::format("{}: {}", url, ex.what()));
    }
    if (result.exit_code != 0) {
        const auto reason = lastLine(result.err);
        throw UnresolvableSourceError(
            fmt::format("{}: {}", url, reason.empty() ? fmt::format("{} exited with {}", program, result.exit_code)
                                                      : reason));
    }
    return result.out;
}

bool hasCodec(const json& format, const char* key) {
    const auto it = format.find(key);
    if (it == format.end() || !it->is_string()) {
        return false;
    }
    const auto codec = it->get<std::string>();
    return !codec.empty() && codec != "none";
}

double number(const json& format, const char* key) {
    const auto it = format.find(key);
    return (it != format.end() && it->is_number()) ? it->get<double>() : 0.0;
}

StreamDescriptor toStream(const json& format) {
    StreamDescriptor stream;
    stream.url = format.value("url", std::string{});
    stream.format_id = format.value("format_id", std::string{});
    stream.container = format.value("ext", std::string{});
    stream.has_video = hasCodec(format, "vcodec");
    stream.has_audio = hasCodec(format, "acodec");
    stream.height = static_cast<int>(number(format, "height"));

    const double abr = number(format, "abr");
    const double tbr = number(format, "tbr");
    stream.bitrate = stream.has_video ? (tbr > 0 ? tbr : number(format, "vbr")) : (abr > 0 ? abr : tbr);
    stream.quality_label = stream.has_video ? fmt::format("{}p", stream.height)
                                            : fmt::format("{}k", static_cast<int>(stream.bitrate));

    for (const char* key : {"filesize", "filesize_approx"}) {
        const auto it = format.find(key);
        if (it != format.end() && it->is_number() && it->get<double>() > 0) {
            stream.size = it->get<std::uint64_t>();
            break;
        }
    }

    const auto headers = format.find("http_headers");
    if (headers != format.end() && headers->is_object()) {
        for (const auto& [name, value] : headers->items()) {
            if (value.is_string()) {
                stream.headers.emplace_back(name, value.get<std::string>());
            }
        }
    }
    return stream;
}

} // namespace

YtDlpResolver::YtDlpResolver(std::string program, std::chrono::milliseconds timeout)
    : program_(std::move(program)), timeout_(timeout) {}

MediaInfo YtDlpResolver::resolve(const std::string& url, const CancelFn& should_cancel) {
    spdlog::debug("resolving {} with {}", url, program_);
    const auto out = runYtDlp(program_, {"-J", "--no-playlist", "--no-warnings", url}, url, should_cancel, timeout_);
    auto info = parseInfo(out);
    spdlog::info("resolved '{}': {} streams", info.title, info.streams.size());
    return info;
}

std::vector<std::string> YtDlpResolver::expandPlaylist(const std::string& url) {
    spdlog::debug("expanding playlist {}", url);
    const auto out = runYtDlp(program_, {"-J", "--flat-playlist", "--no-warnings", url}, url, {}, timeout_);
    auto urls = parsePlaylist(out);
    spdlog::info("playlist {} has {} entries", url, urls.size());
    return urls;
}

MediaInfo YtDlpResolver::parseInfo(const std::string& json_text) {
    json root;
    try {
        root = json::parse(json_text);
    } catch (const json::parse_error& ex) {
        throw UnresolvableSourceError(std::string{"unreadable resolver output: "} + ex.what());
    }

    MediaInfo info;
    info.title = root.value("title", std::string{});

    const auto formats = root.find("formats");
    if (formats == root.end() || !formats->is_array()) {
        throw UnresolvableSourceError("resolver returned no formats");
    }
    for (const auto& format : *formats) {
        // only plain HTTP(S) renditions; segmented manifests need a different fetcher
        const auto protocol = format.value("protocol", std::string{"https"});
        if (protocol != "https" && protocol != "http") {
            continue;
        }
        auto stream = toStream(format);
        if (stream.url.empty() || (!stream.has_video && !stream.has_audio)) {
            continue;
        }
        info.streams.push_back(std::move(stream));
    }
    if (info.streams.empty()) {
        throw UnresolvableSourceError("no downloadable streams for '" + info.title + "'");
    }
    return info;
}

std::vector<std::string> YtDlpResolver::parsePlaylist(const std::string& json_text) {
    json root;
    try {
        root = json::parse(json_text);
    } catch (const json::parse_error& ex) {
        throw UnresolvableSourceError(std::string{"unreadable resolver output: "} + ex.what());
    }

    std::vector<std::string> urls;
    const auto entries = root.find("entries");
    if (entries == root.end() || !entries->is_array()) {
        return urls;
    }
    for (const auto& entry : *entries) {
        // unavailable videos come back as null entries
        if (!entry.is_object()) {
            continue;
        }
        if (entry.contains("id") && entry["id"].is_string()) {
            urls.push_back("https://www.youtube.com/watch?v=" + entry["id"].get<std::string>());
        } else if (entry.contains("url") && entry["url"].is_string()) {
            urls.push_back(entry["url"].get<std::string>());
        }
    }
    return urls;
}

} // namespace justdl
