#pragma once

/**
 * @file json_codec.h
 * @brief jsoncpp helpers for API payloads, agent messages and location files
 */

#include <json/json.h>

#include <string>

namespace ocspdash {
namespace monitor {
namespace infrastructure {

/**
 * @brief Parse a JSON document
 * @param text Document text
 * @param what Payload description used in the error message
 * @throws common::ParsingException if the text is not valid JSON
 */
Json::Value parseJson(const std::string& text, const std::string& what);

/// @brief Single-line JSON rendering
std::string writeCompactJson(const Json::Value& value);

} // namespace infrastructure
} // namespace monitor
} // namespace ocspdash
