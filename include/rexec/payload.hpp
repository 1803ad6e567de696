// payload.hpp - structured payloads exchanged with remote scripts, stored as JSON text

#pragma once

#include "rexec/common.hpp"

#include <json/json.h>
#include <string>
#include <string_view>

namespace rexec::payload
{

    /// @brief Pretty-printed JSON, four-space indentation
    [[nodiscard]] auto serialize(Json::Value const &data) -> std::string;

    [[nodiscard]] auto parse(std::string_view text) -> result<Json::Value>;

} // namespace rexec::payload
