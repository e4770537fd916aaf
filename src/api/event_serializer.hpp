#ifndef MEDIASHUTTLE_SRC_API_EVENT_SERIALIZER_HPP_
#define MEDIASHUTTLE_SRC_API_EVENT_SERIALIZER_HPP_

#include "transfer/transfer_types.hpp"

#include <nlohmann/json.hpp>
#include <string>

namespace MediaShuttle::Api
{

// JSON payload of one progress protocol event, discriminated by "type".
nlohmann::json EventToJson(const Transfer::TransferEvent &event);

// One server-sent-events frame: "data: <json>\n\n". Invalid UTF-8 in file
// names is replaced rather than rejected.
std::string FormatSseFrame(const Transfer::TransferEvent &event);

}  // namespace MediaShuttle::Api

#endif  // MEDIASHUTTLE_SRC_API_EVENT_SERIALIZER_HPP_
