#include "justdl/console_view.hpp"

#include "justdl/file_utils.hpp"

#include <algorithm>
#include <filesystem>
#include <ostream>

#include <fmt/format.h>

namespace justdl {

namespace {

constexpr std::size_t kNameWidth = 24;
constexpr int kBarWidth = 30;

std::string displayName(const std::string& filename, const std::string& url) {
    std::string name;
    if (!filename.empty()) {
        name = std::filesystem::path{filename}.filename().string();
    }
    if (name.empty()) {
        name = url;
    }
    if (name.size() > kNameWidth) {
        name = utf8Prefix(name, kNameWidth - 3) + "...";
    }
    if (name.empty()) {
        name = "(unnamed)";
    }
    return name;
}

std::string progressBar(double ratio) {
    const int filled = static_cast<int>(std::clamp(ratio, 0.0, 1.0) * kBarWidth);
    std::string bar;
    bar.reserve(static_cast<std::size_t>(kBarWidth) * 3);
    for (int i = 0; i < kBarWidth; ++i) {
        bar += (i < filled) ? u8"█" : u8"░";
    }
    return bar;
}

} // namespace

ConsoleView::ConsoleView(std::ostream& out) : out_(out) {}

void ConsoleView::addResults(std::vector<ResultRecord> results) {
    for (auto& result : results) {
        finished_.push_back(std::move(result));
    }
}

void ConsoleView::render(const Snapshot& snapshot) {
    redrawPanel(buildPanel(snapshot));
    out_ << std::flush;
}

std::string ConsoleView::buildPanel(const Snapshot& snapshot) const {
    const auto total_tasks = finished_.size() + snapshot.results.size() + snapshot.active.size() +
                             snapshot.pending_count;

    std::string panel;
    panel.reserve(total_tasks * 128 + 256);
    panel.append("==================================================\n");
    panel += fmt::format("justdl ({} tasks: {} active, {} queued, {} finished)\n", total_tasks,
                         snapshot.active.size(), snapshot.pending_count,
                         finished_.size() + snapshot.results.size());
    panel.append("--------------------------------------------------\n");

    for (const auto& result : finished_) {
        panel += formatResultLine(result);
        panel.push_back('\n');
    }
    for (const auto& result : snapshot.results) {
        panel += formatResultLine(result);
        panel.push_back('\n');
    }

    std::uint64_t total_all = 0;
    std::uint64_t downloaded_all = 0;
    for (const auto& progress : snapshot.active) {
        panel += formatTaskLine(progress);
        panel.push_back('\n');
        if (progress.total_bytes) {
            total_all += *progress.total_bytes;
            downloaded_all += progress.downloaded_bytes;
        }
    }

    panel.append("--------------------------------------------------\n");
    if (total_all > 0) {
        const double ratio = static_cast<double>(downloaded_all) / static_cast<double>(total_all);
        panel += fmt::format("Active: {:>3}%", static_cast<int>(ratio * 100.0));
    } else {
        panel.append("Active: N/A");
    }
    panel.push_back('\n');
    panel.append("==================================================\n");

    return panel;
}

std::string ConsoleView::formatTaskLine(const Progress& progress) {
    const auto name = displayName(progress.filename, progress.url);
    const auto stage = progress.stage.empty() ? std::string{"starting"} : progress.stage;

    if (progress.total_bytes && *progress.total_bytes > 0) {
        const double ratio = static_cast<double>(progress.downloaded_bytes) /
                             static_cast<double>(*progress.total_bytes);
        return fmt::format("{:<24} [{}] {:>3}% ({}/{}) {} {}", name, progressBar(ratio),
                           static_cast<int>(std::min(ratio, 1.0) * 100.0),
                           formatSize(progress.downloaded_bytes), formatSize(*progress.total_bytes),
                           formatSpeed(progress.speed), stage);
    }
    if (progress.downloaded_bytes > 0) {
        return fmt::format("{:<24} [{:^30}] {} {} {}", name, "?", formatSize(progress.downloaded_bytes),
                           formatSpeed(progress.speed), stage);
    }
    return fmt::format("{:<24} [{}...]", name, stage);
}

std::string ConsoleView::formatResultLine(const ResultRecord& result) {
    const auto name = displayName(result.file_path, result.task.url);
    switch (result.outcome) {
        case Outcome::Success:
            return fmt::format("{:<24} ✅ Done ({}, {:.1f}s)", name, formatSize(result.bytes),
                               static_cast<double>(result.duration.count()) / 1000.0);
        case Outcome::Cancelled:
            return fmt::format("{:<24} ⏹ Cancelled", name);
        case Outcome::Failure:
            break;
    }
    return fmt::format("{:<24} ❌ {}: {}", name, result.error ? toString(*result.error) : "error",
                       result.error_message);
}

void ConsoleView::printSummary() const {
    std::size_t succeeded = 0;
    std::size_t failed = 0;
    std::size_t cancelled = 0;
    for (const auto& result : finished_) {
        switch (result.outcome) {
            case Outcome::Success:
                ++succeeded;
                break;
            case Outcome::Failure:
                ++failed;
                break;
            case Outcome::Cancelled:
                ++cancelled;
                break;
        }
    }

    out_ << fmt::format("{} succeeded, {} failed, {} cancelled\n", succeeded, failed, cancelled);
    for (const auto& result : finished_) {
        if (result.outcome == Outcome::Success) {
            out_ << fmt::format("  {} -> {}\n", result.task.url, result.file_path);
        } else if (result.outcome == Outcome::Failure) {
            out_ << fmt::format("  {} failed: {}\n", result.task.url, result.error_message);
        }
    }
    out_ << std::flush;
}

void ConsoleView::redrawPanel(const std::string& panel) {
    const auto current_lines = static_cast<std::size_t>(std::count(panel.begin(), panel.end(), '\n'));
    if (previous_lines_ > 0) {
        out_ << "\033[" << previous_lines_ << "F\033[J";
    }
    out_ << panel;
    previous_lines_ = current_lines;
}

} // namespace justdl
