#include "gtest/gtest.h"

#include "justdl/console_view.hpp"

#include <sstream>

using namespace justdl;

namespace {

bool contains(const std::string& text, const std::string& part) {
    return text.find(part) != std::string::npos;
}

ResultRecord result(TaskId id, Outcome outcome) {
    ResultRecord record;
    record.task.id = id;
    record.task.url = "https://example.com/file" + std::to_string(id);
    record.outcome = outcome;
    return record;
}

} // namespace

TEST(ConsoleViewTest, TaskLineShowsProgress) {
    Progress progress;
    progress.filename = "/downloads/movie.mp4";
    progress.stage = "downloading video";
    progress.downloaded_bytes = 512 * 1024;
    progress.total_bytes = 1024 * 1024;
    progress.speed = 2048.0;

    const auto line = ConsoleView::formatTaskLine(progress);
    EXPECT_TRUE(contains(line, "movie.mp4"));
    EXPECT_FALSE(contains(line, "/downloads"));
    EXPECT_TRUE(contains(line, " 50%"));
    EXPECT_TRUE(contains(line, "512.0 KB/1.0 MB"));
    EXPECT_TRUE(contains(line, "2.0 KB/s"));
    EXPECT_TRUE(contains(line, "downloading video"));

    Progress starting;
    starting.url = "https://example.com/x";
    EXPECT_TRUE(contains(ConsoleView::formatTaskLine(starting), "[starting...]"));
}

TEST(ConsoleViewTest, LongNamesAreCutOnCharacterBoundaries) {
    Progress progress;
    progress.filename = "ab";
    for (int i = 0; i < 10; ++i) {
        progress.filename += "日";
    }
    progress.filename += ".mp4";

    EXPECT_TRUE(contains(ConsoleView::formatTaskLine(progress), "ab日日日日日日..."));
}

TEST(ConsoleViewTest, ResultLinesCarryOutcome) {
    auto ok = result(1, Outcome::Success);
    ok.file_path = "/downloads/a.bin";
    ok.bytes = 2048;
    EXPECT_TRUE(contains(ConsoleView::formatResultLine(ok), "Done (2.0 KB"));

    auto failed = result(2, Outcome::Failure);
    failed.error = ErrorKind::Network;
    failed.error_message = "HTTP 503";
    EXPECT_TRUE(contains(ConsoleView::formatResultLine(failed), "network: HTTP 503"));

    EXPECT_TRUE(contains(ConsoleView::formatResultLine(result(3, Outcome::Cancelled)), "Cancelled"));
}

TEST(ConsoleViewTest, PanelCountsEveryTask) {
    std::ostringstream out;
    ConsoleView view(out);
    view.addResults({result(1, Outcome::Success), result(2, Outcome::Failure)});

    Snapshot snapshot;
    snapshot.pending_count = 3;
    Progress running;
    running.id = 4;
    running.filename = "c.bin";
    running.downloaded_bytes = 25;
    running.total_bytes = 100;
    snapshot.active.push_back(running);

    const auto panel = view.buildPanel(snapshot);
    EXPECT_TRUE(contains(panel, "6 tasks: 1 active, 3 queued, 2 finished"));
    EXPECT_TRUE(contains(panel, "Active:  25%"));

    view.render(snapshot);
    view.render(snapshot);
    EXPECT_TRUE(contains(out.str(), "\033["));
}

TEST(ConsoleViewTest, SummaryListsFailures) {
    std::ostringstream out;
    ConsoleView view(out);
    auto failed = result(1, Outcome::Failure);
    failed.error_message = "no video stream";
    view.addResults({failed, result(2, Outcome::Cancelled)});

    view.printSummary();

    EXPECT_TRUE(contains(out.str(), "0 succeeded, 1 failed, 1 cancelled"));
    EXPECT_TRUE(contains(out.str(), "https://example.com/file1 failed: no video stream"));
}
