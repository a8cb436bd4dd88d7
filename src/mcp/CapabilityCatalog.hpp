// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <core/Types.hpp>

#include <string_view>
#include <vector>

namespace toolrelay
{

/// @brief Read-only view of the capabilities currently discovered on live connections.
class CapabilityCatalog
{
  public:
    virtual ~CapabilityCatalog() = default;

    /// @brief Returns the capabilities of a connected server, or an empty list otherwise.
    [[nodiscard]] virtual auto listCapabilities(std::string_view serverId) const -> std::vector<Capability> = 0;
};

} // namespace toolrelay
