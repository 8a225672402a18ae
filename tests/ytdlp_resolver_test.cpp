#include "gtest/gtest.h"

#include "test_support.hpp"

#include "justdl/errors.hpp"
#include "justdl/ytdlp_resolver.hpp"

#include <chrono>

using namespace justdl;

namespace {

constexpr const char* kVideoJson = R"({
  "id": "abcdefghijk",
  "title": "Conference Keynote",
  "formats": [
    {"format_id": "233", "protocol": "m3u8_native", "url": "https://manifest.invalid/a.m3u8",
     "vcodec": "none", "acodec": "mp4a.40.2", "ext": "mp4"},
    {"format_id": "140", "protocol": "https", "url": "https://media.invalid/140", "ext": "m4a",
     "vcodec": "none", "acodec": "mp4a.40.2", "abr": 129.5, "filesize": 3400000,
     "http_headers": {"User-Agent": "Mozilla/5.0", "Accept": "*/*"}},
    {"format_id": "251", "protocol": "https", "url": "https://media.invalid/251", "ext": "webm",
     "vcodec": "none", "acodec": "opus", "abr": 160.1, "filesize_approx": 4100000.7},
    {"format_id": "136", "protocol": "https", "url": "https://media.invalid/136", "ext": "mp4",
     "vcodec": "avc1.4d401f", "acodec": "none", "height": 720, "tbr": 1800.2},
    {"format_id": "18", "protocol": "https", "url": "https://media.invalid/18", "ext": "mp4",
     "vcodec": "avc1.42001E", "acodec": "mp4a.40.2", "height": 360, "tbr": 500},
    {"format_id": "sb0", "protocol": "mhtml", "url": "https://media.invalid/sb0", "ext": "mhtml",
     "vcodec": "none", "acodec": "none"},
    {"format_id": "nourl", "protocol": "https", "ext": "mp4", "vcodec": "avc1", "acodec": "none", "height": 1080}
  ]
})";

} // namespace

TEST(YtDlpResolverTest, ParsesDownloadableFormats) {
    const auto info = YtDlpResolver::parseInfo(kVideoJson);

    EXPECT_EQ(info.title, "Conference Keynote");
    ASSERT_EQ(info.streams.size(), 4u);

    const auto& m4a = info.streams[0];
    EXPECT_EQ(m4a.format_id, "140");
    EXPECT_TRUE(m4a.has_audio);
    EXPECT_FALSE(m4a.has_video);
    EXPECT_DOUBLE_EQ(m4a.bitrate, 129.5);
    EXPECT_EQ(m4a.quality_label, "129k");
    EXPECT_EQ(m4a.size, std::optional<std::uint64_t>(3400000));
    EXPECT_EQ(m4a.headers.size(), 2u);

    EXPECT_EQ(info.streams[1].size, std::optional<std::uint64_t>(4100000));

    const auto& video = info.streams[2];
    EXPECT_EQ(video.format_id, "136");
    EXPECT_TRUE(video.has_video);
    EXPECT_FALSE(video.has_audio);
    EXPECT_EQ(video.height, 720);
    EXPECT_EQ(video.quality_label, "720p");
    EXPECT_FALSE(video.size.has_value());

    EXPECT_TRUE(info.streams[3].has_video);
    EXPECT_TRUE(info.streams[3].has_audio);
}

TEST(YtDlpResolverTest, RejectsUnusableOutput) {
    EXPECT_THROW(YtDlpResolver::parseInfo("ERROR: not json"), UnresolvableSourceError);
    EXPECT_THROW(YtDlpResolver::parseInfo(R"({"title": "x"})"), UnresolvableSourceError);
    EXPECT_THROW(YtDlpResolver::parseInfo(
                     R"({"title": "x", "formats": [{"protocol": "m3u8", "url": "u", "vcodec": "avc1"}]})"),
                 UnresolvableSourceError);
}

TEST(YtDlpResolverTest, PlaylistEntriesInOrder) {
    const auto urls = YtDlpResolver::parsePlaylist(R"({
      "_type": "playlist",
      "entries": [
        {"id": "aaaaaaaaaaa", "url": "https://www.youtube.com/watch?v=aaaaaaaaaaa"},
        null,
        {"url": "https://www.youtube.com/watch?v=bbbbbbbbbbb"},
        {"id": "ccccccccccc"}
      ]
    })");

    EXPECT_EQ(urls, (std::vector<std::string>{
                        "https://www.youtube.com/watch?v=aaaaaaaaaaa",
                        "https://www.youtube.com/watch?v=bbbbbbbbbbb",
                        "https://www.youtube.com/watch?v=ccccccccccc",
                    }));
    EXPECT_TRUE(YtDlpResolver::parsePlaylist(R"({"entries": []})").empty());
    EXPECT_THROW(YtDlpResolver::parsePlaylist("<html>"), UnresolvableSourceError);
}

TEST(YtDlpResolverTest, MissingProgramIsUnresolvable) {
    YtDlpResolver resolver{"/nonexistent/yt-dlp"};
    EXPECT_THROW(resolver.resolve("https://youtu.be/abcdefghijk", {}), UnresolvableSourceError);
}

TEST(YtDlpResolverTest, StuckResolverIsUnresolvable) {
    test::TempDir dir;
    const auto tool = dir.path() / "yt-dlp";
    test::writeScript(tool, "exec sleep 30");

    YtDlpResolver resolver{tool.string(), std::chrono::milliseconds(200)};
    const auto started = std::chrono::steady_clock::now();
    EXPECT_THROW((void)resolver.resolve("https://youtu.be/abcdefghijk", {}), UnresolvableSourceError);
    EXPECT_LT(std::chrono::steady_clock::now() - started, std::chrono::seconds(5));
}
