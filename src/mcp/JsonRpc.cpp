// SPDX-License-Identifier: Apache-2.0
#include "JsonRpc.hpp"

#include <core/JsonUtils.hpp>

#include <charconv>
#include <format>

namespace toolrelay::jsonrpc
{

auto makeRequest(int64_t id, std::string_view method, nlohmann::json params) -> nlohmann::json
{
    auto msg = nlohmann::json {
        { "jsonrpc", "2.0" },
        { "id", id },
        { "method", method },
    };

    if (!params.is_null())
        msg["params"] = std::move(params);

    return msg;
}

auto makeNotification(std::string_view method, nlohmann::json params) -> nlohmann::json
{
    auto msg = nlohmann::json {
        { "jsonrpc", "2.0" },
        { "method", method },
    };

    if (!params.is_null())
        msg["params"] = std::move(params);

    return msg;
}

auto parseResponse(const nlohmann::json& message) -> Result<Response>
{
    if (!message.is_object() || !message.contains("jsonrpc") || message["jsonrpc"] != "2.0")
        return makeError(ErrorCode::ProtocolError, "Not a valid JSON-RPC 2.0 message");

    auto response = Response {};

    if (message.contains("id"))
        response.id = message["id"];

    if (message.contains("result"))
    {
        response.result = message["result"];
    }
    else if (message.contains("error") && message["error"].is_object())
    {
        auto const& err = message["error"];
        response.error = RpcError {
            .code = json::getIntOr(err, "code", 0),
            .message = json::getStringOr(err, "message", "Unknown error"),
            .data = err.contains("data") ? err["data"] : nlohmann::json {},
        };
    }
    else if (message.contains("method") && message["method"].is_string())
    {
        response.method = message["method"].get<std::string>();
    }
    else
    {
        return makeError(ErrorCode::ProtocolError, "JSON-RPC message has neither result, error, nor method");
    }

    return response;
}

auto idOf(const nlohmann::json& id) -> std::optional<int64_t>
{
    if (id.is_number_integer())
        return id.get<int64_t>();

    if (id.is_string())
    {
        auto const& text = id.get_ref<const std::string&>();
        int64_t value = 0;
        auto const [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), value);
        if (ec == std::errc {} && ptr == text.data() + text.size())
            return value;
    }

    return std::nullopt;
}

} // namespace toolrelay::jsonrpc
