#include "api/event_serializer.hpp"

#include <variant>

namespace MediaShuttle::Api
{

using namespace Transfer;

namespace
{

template <class... Ts>
struct Overloaded : Ts... {
    using Ts::operator()...;
};

nlohmann::json CountersToJson(const char *type, const TransferCounters &counters)
{
    return nlohmann::json{
        {     "type",              type},
        {  "current",  counters.current},
        {    "total",    counters.total},
        {"completed", counters.completed},
        {   "failed",   counters.failed},
        {   "errors",   counters.errors},
    };
}

}  // namespace

nlohmann::json EventToJson(const TransferEvent &event)
{
    return std::visit(
        Overloaded{
            [](const ProgressEvent &e) {
                auto j           = CountersToJson("progress", e.counters);
                j["currentFile"] = e.current_file;
                return j;
            },
            [](const FileProgressEvent &e) {
                auto j              = CountersToJson("file_progress", e.counters);
                j["currentFile"]    = e.current_file;
                j["bytesCopied"]    = e.bytes_copied;
                j["bytesTotal"]     = e.bytes_total;
                j["bytesPerSecond"] = e.bytes_per_second;
                return j;
            },
            [](const CompleteEvent &e) {
                auto j       = CountersToJson("complete", e.counters);
                j["message"] = e.message;
                return j;
            },
            [](const ErrorEvent &e) {
                auto j       = CountersToJson("error", e.counters);
                j["message"] = e.message;
                return j;
            },
        },
        event
    );
}

std::string FormatSseFrame(const TransferEvent &event)
{
    std::string frame = "data: ";
    frame += EventToJson(event).dump(-1, ' ', false, nlohmann::json::error_handler_t::replace);
    frame += "\n\n";
    return frame;
}

}  // namespace MediaShuttle::Api
