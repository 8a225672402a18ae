#include "gtest/gtest.h"

#include "justdl/url_utils.hpp"

using namespace justdl;

TEST(UrlUtilsTest, AcceptsHttpUrlsOnly) {
    EXPECT_TRUE(isValidUrl("https://example.com"));
    EXPECT_TRUE(isValidUrl("http://example.com:8080/a/b.zip?x=1#frag"));
    EXPECT_FALSE(isValidUrl("example.com/file"));
    EXPECT_FALSE(isValidUrl("ftp://example.com/file"));
    EXPECT_FALSE(isValidUrl("https://"));
    EXPECT_FALSE(isValidUrl("https://exa mple.com/"));
    EXPECT_FALSE(isValidUrl(""));
}

TEST(UrlUtilsTest, SplitsParts) {
    const auto parts = parseUrl("HTTPS://Example.com/dir/file.txt?a=1&b=2");
    ASSERT_TRUE(parts.has_value());
    EXPECT_EQ(parts->scheme, "https");
    EXPECT_EQ(parts->host, "Example.com");
    EXPECT_EQ(parts->path, "/dir/file.txt");
    EXPECT_EQ(parts->query, "a=1&b=2");
}

TEST(UrlUtilsTest, RecognisesYouTube) {
    EXPECT_TRUE(isYouTubeVideoUrl("https://www.youtube.com/watch?v=dQw4w9WgXcQ"));
    EXPECT_TRUE(isYouTubeVideoUrl("https://youtube.com/watch?feature=share&v=dQw4w9WgXcQ"));
    EXPECT_TRUE(isYouTubeVideoUrl("https://youtu.be/dQw4w9WgXcQ"));
    EXPECT_TRUE(isYouTubeVideoUrl("https://www.youtube.com/shorts/abc123"));
    EXPECT_FALSE(isYouTubeVideoUrl("https://www.youtube.com/playlist?list=PL123"));
    EXPECT_FALSE(isYouTubeVideoUrl("https://vimeo.com/12345"));

    EXPECT_TRUE(isYouTubePlaylistUrl("https://www.youtube.com/playlist?list=PL123"));
    EXPECT_FALSE(isYouTubePlaylistUrl("https://www.youtube.com/watch?v=dQw4w9WgXcQ"));
}

TEST(UrlUtilsTest, FilenameFromPath) {
    EXPECT_EQ(filenameFromUrl("https://example.com/files/My%20Report.pdf?dl=1"), "My Report.pdf");
    EXPECT_EQ(filenameFromUrl("https://example.com/a+b.txt"), "a+b.txt");
    EXPECT_EQ(filenameFromUrl("https://example.com/"), "download");
    EXPECT_EQ(filenameFromUrl("https://example.com"), "download");
    EXPECT_EQ(filenameFromUrl("https://example.com/%2Fetc%2Fpasswd"), "_etc_passwd");
}
