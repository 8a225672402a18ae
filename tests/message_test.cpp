#include "gtest/gtest.h"

#include "justdl/channel.hpp"
#include "justdl/message.hpp"

#include <string>
#include <vector>

using namespace justdl;

namespace {

WorkerMessage progress(std::uint64_t done, std::optional<std::uint64_t> total) {
    WorkerMessage msg;
    msg.type = WorkerMessage::Type::Progress;
    msg.stage = "downloading";
    msg.downloaded_bytes = done;
    msg.total_bytes = total;
    msg.speed = 1024.0;
    msg.filename = "clip \"1\"\n.mp4";
    return msg;
}

} // namespace

TEST(MessageCodecTest, OneLinePerMessage) {
    const auto line = encodeMessage(progress(10, 100));
    EXPECT_EQ(line.back(), '\n');
    EXPECT_EQ(line.find('\n'), line.size() - 1);
}

TEST(MessageCodecTest, DecoderHandlesSplitReads) {
    WorkerMessage failed;
    failed.type = WorkerMessage::Type::Failed;
    failed.error = ErrorKind::MediaProcessing;
    failed.error_message = "ffmpeg exited with 1";

    const std::string stream = encodeMessage(progress(10, std::nullopt)) + encodeMessage(failed);
    MessageDecoder decoder;
    std::vector<WorkerMessage> out;
    for (const char ch : stream) {
        decoder.feed(&ch, 1, out);
    }

    ASSERT_EQ(out.size(), 2u);
    EXPECT_EQ(out[0].type, WorkerMessage::Type::Progress);
    EXPECT_EQ(out[0].downloaded_bytes, 10u);
    EXPECT_FALSE(out[0].total_bytes.has_value());
    EXPECT_EQ(out[0].filename, "clip \"1\"\n.mp4");
    EXPECT_EQ(out[1].type, WorkerMessage::Type::Failed);
    EXPECT_EQ(out[1].error, ErrorKind::MediaProcessing);
    EXPECT_EQ(out[1].error_message, "ffmpeg exited with 1");
    EXPECT_TRUE(out[1].isTerminal());
    EXPECT_FALSE(decoder.hasPartial());
}

TEST(MessageCodecTest, MalformedLinesAreSkipped) {
    WorkerMessage done;
    done.type = WorkerMessage::Type::Completed;
    done.file_path = "/tmp/a.bin";
    done.downloaded_bytes = 42;

    const std::string stream = "garbage\n{\"type\":\"bogus\"}\n\n" + encodeMessage(done) + "{\"type\":";
    MessageDecoder decoder;
    std::vector<WorkerMessage> out;
    decoder.feed(stream.data(), stream.size(), out);

    ASSERT_EQ(out.size(), 1u);
    EXPECT_EQ(out[0].type, WorkerMessage::Type::Completed);
    EXPECT_EQ(out[0].file_path, "/tmp/a.bin");
    EXPECT_EQ(out[0].downloaded_bytes, 42u);
    EXPECT_TRUE(decoder.hasPartial());
}

TEST(ChannelTest, DeliversMessagesAndReportsClose) {
    auto pair = makeChannel();
    std::vector<WorkerMessage> out;
    EXPECT_TRUE(pair.reader.drain(out));
    EXPECT_TRUE(out.empty());

    {
        ChannelWriter writer{std::move(pair.writer_fd)};
        writer.send(progress(1, 2));
        WorkerMessage cancelled;
        cancelled.type = WorkerMessage::Type::Cancelled;
        writer.send(cancelled);
    }

    EXPECT_FALSE(pair.reader.drain(out));
    EXPECT_TRUE(pair.reader.closed());
    ASSERT_EQ(out.size(), 2u);
    EXPECT_EQ(out[1].type, WorkerMessage::Type::Cancelled);
}
