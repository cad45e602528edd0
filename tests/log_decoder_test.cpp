#include "runtime/log_decoder.hpp"

#include <gtest/gtest.h>

#include <string>
#include <vector>

namespace {

std::string frame(uint8_t stream, const std::string& payload) {
    std::string f(8, '\0');
    f[0] = static_cast<char>(stream);
    uint32_t n = static_cast<uint32_t>(payload.size());
    f[4] = static_cast<char>((n >> 24) & 0xff);
    f[5] = static_cast<char>((n >> 16) & 0xff);
    f[6] = static_cast<char>((n >> 8) & 0xff);
    f[7] = static_cast<char>(n & 0xff);
    return f + payload;
}

class LogLineDecoderTest : public ::testing::Test {
protected:
    LineSink sink = [this](const std::string& l) { lines.push_back(l); };
    std::vector<std::string> lines;
    LogLineDecoder decoder;
};

TEST_F(LogLineDecoderTest, SplitsStdoutIntoLinesAndDropsStderr) {
    std::string stream = frame(LogLineDecoder::kStdout, "starting\nstep 1\n") +
                         frame(LogLineDecoder::kStderr, "warning: ignored\n") +
                         frame(LogLineDecoder::kStdout, "done\r\n");
    decoder.feed(stream.data(), stream.size(), sink);
    decoder.flush(sink);
    EXPECT_EQ(lines, (std::vector<std::string>{"starting", "step 1", "done"}));
}

TEST_F(LogLineDecoderTest, ByteAtATimeDelivery) {
    std::string stream = frame(LogLineDecoder::kStdout, "par") + frame(LogLineDecoder::kStdout, "tial\nnext");
    for (char c : stream) decoder.feed(&c, 1, sink);
    EXPECT_EQ(lines, (std::vector<std::string>{"partial"}));
    decoder.flush(sink);
    EXPECT_EQ(lines, (std::vector<std::string>{"partial", "next"}));
}

TEST_F(LogLineDecoderTest, LargeFrameLength) {
    std::string payload(70000, 'x');
    payload += "\n";
    std::string stream = frame(LogLineDecoder::kStdout, payload);
    decoder.feed(stream.data(), stream.size(), sink);
    ASSERT_EQ(lines.size(), 1u);
    EXPECT_EQ(lines[0].size(), 70000u);
}

} // namespace
