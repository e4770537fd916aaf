#include "api/event_serializer.hpp"

#include <gtest/gtest.h>
#include <nlohmann/json.hpp>
#include <string>

namespace MediaShuttle::Api
{
namespace
{

using namespace Transfer;

TransferCounters Counters()
{
    return TransferCounters{
        .current = 2, .total = 5, .completed = 1, .failed = 1, .errors = {"Failed: x.mkv"}
    };
}

TEST(EventSerializerTest, ProgressEvent)
{
    const auto j = EventToJson(ProgressEvent{Counters(), "ep.mkv"});
    EXPECT_EQ(j.at("type"), "progress");
    EXPECT_EQ(j.at("current"), 2);
    EXPECT_EQ(j.at("total"), 5);
    EXPECT_EQ(j.at("completed"), 1);
    EXPECT_EQ(j.at("failed"), 1);
    EXPECT_EQ(j.at("errors"), nlohmann::json::array({"Failed: x.mkv"}));
    EXPECT_EQ(j.at("currentFile"), "ep.mkv");
    EXPECT_FALSE(j.contains("bytesCopied"));
    EXPECT_FALSE(j.contains("message"));
}

TEST(EventSerializerTest, FileProgressEvent)
{
    const auto j = EventToJson(FileProgressEvent{Counters(), "ep.mkv", 512, 1024, 2048.5});
    EXPECT_EQ(j.at("type"), "file_progress");
    EXPECT_EQ(j.at("currentFile"), "ep.mkv");
    EXPECT_EQ(j.at("bytesCopied"), 512);
    EXPECT_EQ(j.at("bytesTotal"), 1024);
    EXPECT_DOUBLE_EQ(j.at("bytesPerSecond").get<double>(), 2048.5);
}

TEST(EventSerializerTest, TerminalEvents)
{
    const auto complete = EventToJson(CompleteEvent{Counters(), "Completed with 1 error(s)"});
    EXPECT_EQ(complete.at("type"), "complete");
    EXPECT_EQ(complete.at("message"), "Completed with 1 error(s)");
    EXPECT_FALSE(complete.contains("currentFile"));

    const auto error = EventToJson(ErrorEvent{Counters(), "Operation cancelled"});
    EXPECT_EQ(error.at("type"), "error");
    EXPECT_EQ(error.at("message"), "Operation cancelled");
    EXPECT_EQ(error.at("failed"), 1);
}

TEST(EventSerializerTest, SseFraming)
{
    const auto frame = FormatSseFrame(ProgressEvent{Counters(), "ep.mkv"});
    ASSERT_GT(frame.size(), 8u);
    EXPECT_EQ(frame.substr(0, 6), "data: ");
    EXPECT_EQ(frame.substr(frame.size() - 2), "\n\n");
    EXPECT_EQ(frame.find('\n'), frame.size() - 2);

    const auto parsed = nlohmann::json::parse(frame.substr(6, frame.size() - 8));
    EXPECT_EQ(parsed.at("type"), "progress");
}

TEST(EventSerializerTest, InvalidUtf8FileNameDoesNotThrow)
{
    const std::string name = "bad\xff\xfe.mkv";
    std::string frame;
    EXPECT_NO_THROW(frame = FormatSseFrame(ProgressEvent{Counters(), name}));
    EXPECT_NE(frame.find("bad"), std::string::npos);
}

}  // namespace
}  // namespace MediaShuttle::Api
