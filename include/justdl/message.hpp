#pragma once

#include "errors.hpp"

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace justdl {

// One line on a worker's progress channel. Progress and heartbeat messages
// may repeat; completed/failed/cancelled is sent exactly once, last.
struct WorkerMessage {
    enum class Type { Progress, Heartbeat, Completed, Failed, Cancelled };

    Type type{Type::Heartbeat};
    std::string stage;
    std::uint64_t downloaded_bytes{0};
    std::optional<std::uint64_t> total_bytes;
    double speed{0.0};
    std::string filename;
    std::string file_path;
    ErrorKind error{ErrorKind::WorkerCrash};
    std::string error_message;

    [[nodiscard]] bool isTerminal() const noexcept {
        return type == Type::Completed || type == Type::Failed || type == Type::Cancelled;
    }
};

// Newline-terminated JSON object.
[[nodiscard]] std::string encodeMessage(const WorkerMessage& message);

// Reassembles messages from arbitrary read boundaries.
class MessageDecoder {
public:
    // Appends every complete message in `data` (plus any buffered prefix) to
    // `out`. Malformed lines are logged and skipped.
    void feed(const char* data, std::size_t size, std::vector<WorkerMessage>& out);

    [[nodiscard]] bool hasPartial() const noexcept { return !buffer_.empty(); }

private:
    std::string buffer_;
};

} // namespace justdl
