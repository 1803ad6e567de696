// payload.cpp - jsoncpp-backed payload serialization

#include "rexec/payload.hpp"

#include "rexec/log.hpp"

#include <memory>

namespace rexec::payload
{

    auto serialize(Json::Value const &data) -> std::string
    {
        Json::StreamWriterBuilder builder;
        builder["indentation"] = "    ";
        builder["emitUTF8"] = true;
        return Json::writeString(builder, data);
    }

    auto parse(std::string_view text) -> result<Json::Value>
    {
        Json::CharReaderBuilder builder;
        builder["collectComments"] = false;
        std::unique_ptr<Json::CharReader> const reader{builder.newCharReader()};

        Json::Value root;
        std::string errors;
        if (!reader->parse(text.data(), text.data() + text.size(), &root, &errors))
        {
            log::debug("payload parse failed: {}", errors);
            return std::unexpected(error::payload_parse_failed);
        }
        return root;
    }

} // namespace rexec::payload
