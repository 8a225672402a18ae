#pragma once

#include "progress.hpp"
#include "queue_manager.hpp"
#include "result.hpp"

#include <cstddef>
#include <iosfwd>
#include <string>
#include <vector>

namespace justdl {

// Terminal progress panel. Keeps every result it has been handed so that
// finished tasks stay on screen after the manager forgets them.
class ConsoleView {
public:
    explicit ConsoleView(std::ostream& out);

    void addResults(std::vector<ResultRecord> results);
    void render(const Snapshot& snapshot);
    void printSummary() const;

    [[nodiscard]] std::string buildPanel(const Snapshot& snapshot) const;
    [[nodiscard]] const std::vector<ResultRecord>& results() const noexcept { return finished_; }

    static std::string formatTaskLine(const Progress& progress);
    static std::string formatResultLine(const ResultRecord& result);

private:
    void redrawPanel(const std::string& panel);

    std::ostream& out_;
    std::vector<ResultRecord> finished_;
    std::size_t previous_lines_{0};
};

} // namespace justdl
