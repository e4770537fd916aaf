#ifndef MEDIASHUTTLE_SRC_API_REQUEST_PARSER_HPP_
#define MEDIASHUTTLE_SRC_API_REQUEST_PARSER_HPP_

#include "transfer/transfer_types.hpp"

#include <expected>
#include <nlohmann/json.hpp>
#include <string>
#include <string_view>

namespace MediaShuttle::Api
{

using ParseResult = std::expected<Transfer::TransferRequest, std::string>;

// Validates a batch-transfer body. Accepts the explicit `files` list as well as
// the `sourcePaths` + `destinationFolder` shorthand, which is expanded so every
// source keeps its own name inside the folder. The error string is meant for
// the client.
ParseResult ParseTransferRequest(const nlohmann::json &body);

// Last non-empty segment of a '/' or '\' separated client path.
std::string BaseName(std::string_view path);

}  // namespace MediaShuttle::Api

#endif  // MEDIASHUTTLE_SRC_API_REQUEST_PARSER_HPP_
