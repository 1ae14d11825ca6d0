/**
 * @file json_codec.cpp
 */

#include "json_codec.h"
#include "exceptions.h"

#include <sstream>

namespace ocspdash {
namespace monitor {
namespace infrastructure {

Json::Value parseJson(const std::string& text, const std::string& what) {
    Json::CharReaderBuilder reader;
    Json::Value root;
    std::string errs;
    std::istringstream iss(text);
    if (!Json::parseFromStream(reader, iss, &root, &errs)) {
        throw common::ParsingException("Invalid JSON in " + what + ": " + errs);
    }
    return root;
}

std::string writeCompactJson(const Json::Value& value) {
    Json::StreamWriterBuilder writer;
    writer["indentation"] = "";
    return Json::writeString(writer, value);
}

} // namespace infrastructure
} // namespace monitor
} // namespace ocspdash
