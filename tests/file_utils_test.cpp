#include "gtest/gtest.h"

#include "test_support.hpp"

#include "justdl/errors.hpp"
#include "justdl/file_utils.hpp"

#include <string>

using namespace justdl;
using namespace justdl::test;

TEST(SanitizeFilenameTest, ReplacesUnsafeCharacters) {
    EXPECT_EQ(sanitizeFilename("a<b>c:d\"e/f\\g|h?i*j"), "a_b_c_d_e_f_g_h_i_j");
    EXPECT_EQ(sanitizeFilename("tab\there"), "tab_here");
    EXPECT_EQ(sanitizeFilename("  .hidden.  "), "hidden");
    EXPECT_EQ(sanitizeFilename("..."), "download");
    EXPECT_EQ(sanitizeFilename(""), "download");
    EXPECT_EQ(sanitizeFilename("Song (Live) [2020].mp3"), "Song (Live) [2020].mp3");
}

TEST(SanitizeFilenameTest, TruncatesKeepingExtension) {
    const auto name = sanitizeFilename(std::string(300, 'x') + ".mp4");
    EXPECT_EQ(name.size(), 200u);
    EXPECT_EQ(name.substr(name.size() - 4), ".mp4");
}

TEST(SanitizeFilenameTest, TruncationKeepsWholeCharacters) {
    std::string title;
    for (int i = 0; i < 100; ++i) {
        title += "日";
    }
    const auto name = sanitizeFilename(title + ".mp4");

    std::string expected;
    for (int i = 0; i < 65; ++i) {
        expected += "日";
    }
    EXPECT_EQ(name, expected + ".mp4");
}

TEST(Utf8PrefixTest, BacksUpToCharacterBoundary) {
    EXPECT_EQ(utf8Prefix("abc", 10), "abc");
    EXPECT_EQ(utf8Prefix("abc", 2), "ab");
    EXPECT_EQ(utf8Prefix("a\xC3\xA9" "b", 2), "a");
    EXPECT_EQ(utf8Prefix("a\xC3\xA9" "b", 3), "a\xC3\xA9");
    EXPECT_EQ(utf8Prefix("\xF0\x9F\x8E\xB5x", 3), "");
}

TEST(ReserveUniquePathTest, NumbersCollisions) {
    TempDir dir;
    const auto first = reserveUniquePath(dir.path(), "clip.mp4");
    const auto second = reserveUniquePath(dir.path(), "clip.mp4");
    const auto third = reserveUniquePath(dir.path(), "clip.mp4");
    const auto other = reserveUniquePath(dir.path(), "README");
    const auto other2 = reserveUniquePath(dir.path(), "README");

    EXPECT_EQ(first, dir.path() / "clip.mp4");
    EXPECT_EQ(second, dir.path() / "clip (1).mp4");
    EXPECT_EQ(third, dir.path() / "clip (2).mp4");
    EXPECT_EQ(other, dir.path() / "README");
    EXPECT_EQ(other2, dir.path() / "README (1)");
}

TEST(ReserveUniquePathTest, CreatesMissingDirectory) {
    TempDir dir;
    const auto path = reserveUniquePath(dir.path() / "a" / "b", "f.txt");
    EXPECT_TRUE(std::filesystem::exists(path));
}

TEST(CommitFileTest, MovesOverReservation) {
    TempDir dir;
    const auto source = dir.path() / "tmp.part";
    writeFile(source, "data");
    const auto target = reserveUniquePath(dir.path(), "final.bin");

    commitFile(source, target);

    EXPECT_FALSE(std::filesystem::exists(source));
    EXPECT_EQ(readFile(target), "data");
    EXPECT_THROW(commitFile(dir.path() / "nope", reserveUniquePath(dir.path(), "x")), FilesystemError);
}

TEST(WorkspaceTest, RemovedWithContents) {
    TempDir dir;
    std::filesystem::path inside;
    {
        Workspace workspace{dir.path(), 17};
        inside = workspace.file("video.mp4");
        writeFile(inside, "v");
        EXPECT_EQ(workspace.path().parent_path(), dir.path());
        EXPECT_EQ(workspace.path().filename().string().rfind(".justdl-17-", 0), 0u);
    }
    EXPECT_FALSE(std::filesystem::exists(inside));
    EXPECT_TRUE(listDir(dir.path()).empty());
}

TEST(FormatTest, HumanReadableSizes) {
    EXPECT_EQ(formatSize(512), "512 B");
    EXPECT_EQ(formatSize(1536), "1.5 KB");
    EXPECT_EQ(formatSize(5ull * 1024 * 1024), "5.0 MB");
    EXPECT_EQ(formatSize(3ull * 1024 * 1024 * 1024), "3.0 GB");
    EXPECT_EQ(formatSpeed(0.0), "--");
    EXPECT_EQ(formatSpeed(2048.0), "2.0 KB/s");
}
