// SPDX-License-Identifier: Apache-2.0
#include "StreamEvent.hpp"

#include <core/JsonUtils.hpp>

#include <format>

namespace toolrelay
{

auto parseStreamEvent(const nlohmann::json& record) -> Result<StreamEvent>
{
    if (!record.is_object())
        return makeError(ErrorCode::ProtocolError, "Stream event is not an object");

    auto const typeName = json::getString(record, "eventType");
    if (!typeName)
        return std::unexpected(typeName.error());

    auto const type = eventTypeFromString(*typeName);
    if (!type)
        return makeError(ErrorCode::ProtocolError, std::format("Unknown event type: {}", *typeName));

    auto event = StreamEvent { .type = *type, .kind = BlockKind::Text, .index = 0, .payload = nullptr };
    if (*type == EventType::Finalize || *type == EventType::Abort)
        return event;

    auto const kindName = json::getString(record, "kind");
    if (!kindName)
        return std::unexpected(kindName.error());

    auto const kind = blockKindFromString(*kindName);
    if (!kind)
        return makeError(ErrorCode::ProtocolError, std::format("Unknown block kind: {}", *kindName));

    if (!record.contains("index") || !record["index"].is_number_integer())
        return makeError(ErrorCode::ProtocolError, "Missing or invalid integer field: index");

    event.kind = *kind;
    event.index = record["index"].get<int64_t>();
    event.payload = record.value("payload", nlohmann::json {});
    return event;
}

auto toJson(const StreamEvent& event) -> nlohmann::json
{
    auto record = nlohmann::json { { "eventType", eventTypeToString(event.type) } };
    if (event.type == EventType::Finalize || event.type == EventType::Abort)
        return record;

    record["kind"] = blockKindToString(event.kind);
    record["index"] = event.index;
    if (!event.payload.is_null())
        record["payload"] = event.payload;
    return record;
}

} // namespace toolrelay
