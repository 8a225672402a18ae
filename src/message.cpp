#include "justdl/message.hpp"

#include <optional>
#include <stdexcept>

#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

namespace justdl {

namespace {

using json = nlohmann::json;

const char* typeName(WorkerMessage::Type type) {
    switch (type) {
        case WorkerMessage::Type::Progress: return "progress";
        case WorkerMessage::Type::Heartbeat: return "heartbeat";
        case WorkerMessage::Type::Completed: return "completed";
        case WorkerMessage::Type::Failed: return "failed";
        case WorkerMessage::Type::Cancelled: return "cancelled";
    }
    return "heartbeat";
}

std::optional<WorkerMessage::Type> parseType(const std::string& name) {
    if (name == "progress") return WorkerMessage::Type::Progress;
    if (name == "heartbeat") return WorkerMessage::Type::Heartbeat;
    if (name == "completed") return WorkerMessage::Type::Completed;
    if (name == "failed") return WorkerMessage::Type::Failed;
    if (name == "cancelled") return WorkerMessage::Type::Cancelled;
    return std::nullopt;
}

WorkerMessage decodeLine(const std::string& line) {
    const json j = json::parse(line);
    const auto type = parseType(j.at("type").get<std::string>());
    if (!type) {
        throw std::invalid_argument("unknown message type");
    }

    WorkerMessage msg;
    msg.type = *type;
    switch (msg.type) {
        case WorkerMessage::Type::Progress:
            msg.stage = j.value("stage", std::string{});
            msg.downloaded_bytes = j.value("done", std::uint64_t{0});
            if (j.contains("total") && !j["total"].is_null()) {
                msg.total_bytes = j["total"].get<std::uint64_t>();
            }
            msg.speed = j.value("speed", 0.0);
            msg.filename = j.value("filename", std::string{});
            break;
        case WorkerMessage::Type::Completed:
            msg.file_path = j.at("path").get<std::string>();
            msg.downloaded_bytes = j.value("bytes", std::uint64_t{0});
            break;
        case WorkerMessage::Type::Failed:
            msg.error = parseErrorKind(j.value("error", std::string{})).value_or(ErrorKind::WorkerCrash);
            msg.error_message = j.value("message", std::string{});
            break;
        case WorkerMessage::Type::Heartbeat:
        case WorkerMessage::Type::Cancelled:
            break;
    }
    return msg;
}

} // namespace

std::string encodeMessage(const WorkerMessage& message) {
    json j;
    j["type"] = typeName(message.type);
    switch (message.type) {
        case WorkerMessage::Type::Progress:
            j["stage"] = message.stage;
            j["done"] = message.downloaded_bytes;
            if (message.total_bytes) {
                j["total"] = *message.total_bytes;
            }
            j["speed"] = message.speed;
            if (!message.filename.empty()) {
                j["filename"] = message.filename;
            }
            break;
        case WorkerMessage::Type::Completed:
            j["path"] = message.file_path;
            j["bytes"] = message.downloaded_bytes;
            break;
        case WorkerMessage::Type::Failed:
            j["error"] = std::string{toString(message.error)};
            j["message"] = message.error_message;
            break;
        case WorkerMessage::Type::Heartbeat:
        case WorkerMessage::Type::Cancelled:
            break;
    }
    // dump() escapes control characters, so the line never contains '\n'
    return j.dump(-1, ' ', false, json::error_handler_t::replace) + '\n';
}

void MessageDecoder::feed(const char* data, std::size_t size, std::vector<WorkerMessage>& out) {
    buffer_.append(data, size);

    std::size_t start = 0;
    for (auto newline = buffer_.find('\n', start); newline != std::string::npos;
         newline = buffer_.find('\n', start)) {
        const std::string line = buffer_.substr(start, newline - start);
        start = newline + 1;
        if (line.empty()) {
            continue;
        }
        try {
            out.push_back(decodeLine(line));
        } catch (const std::exception& ex) {
            spdlog::warn("dropping malformed worker message '{}': {}", line, ex.what());
        }
    }
    buffer_.erase(0, start);
}

} // namespace justdl
