// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <stream/StreamEvent.hpp>

#include <nlohmann/json.hpp>

#include <cstdint>
#include <map>
#include <vector>

namespace toolrelay
{

/// @brief Maps Messages-API style streaming events onto stream events.
///
/// Understands content_block_start / content_block_delta / content_block_stop, message_stop and
/// error. Deltas and stops do not name their block kind, so the kind seen at block start is
/// remembered per index. One translator per response; reset() between responses.
class BackendEventTranslator
{
  public:
    /// @brief Translates one backend event.
    /// @return Zero or more stream events; unknown or irrelevant events yield none.
    [[nodiscard]] auto translate(const nlohmann::json& event) -> std::vector<StreamEvent>;

    void reset();

  private:
    std::map<int64_t, BlockKind> _kinds;

    [[nodiscard]] auto onBlockStart(int64_t index, const nlohmann::json& block) -> std::vector<StreamEvent>;
    [[nodiscard]] auto onBlockDelta(int64_t index, const nlohmann::json& delta) -> std::vector<StreamEvent>;
};

} // namespace toolrelay
