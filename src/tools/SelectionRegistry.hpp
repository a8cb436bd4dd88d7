// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <core/Types.hpp>
#include <mcp/CapabilityCatalog.hpp>

#include <nlohmann/json.hpp>

#include <map>
#include <optional>
#include <set>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace toolrelay
{

/// @brief Enabled capability names per server. A missing server means none are enabled.
using SelectionState = std::map<std::string, std::set<std::string, std::less<>>, std::less<>>;

/// @brief Tri-state selection display for one server.
enum class SelectionStatus
{
    None,
    Partial,
    Full,
};

/// @brief Tracks which discovered capabilities are enabled for the next request.
///
/// Selecting a whole server records the names discovered at that moment; later discovery changes
/// do not grow or shrink that selection. Names that disappear from the live catalog stay in the
/// state and are filtered out by resolve(), which is the only place the effective set is derived.
class SelectionRegistry
{
  public:
    /// @brief Constructs a registry over a live capability catalog.
    /// @param catalog Source of the currently discovered capabilities; must outlive the registry.
    explicit SelectionRegistry(const CapabilityCatalog& catalog);

    /// @brief Enables every capability currently discovered for the server.
    void selectServer(std::string_view serverId);

    /// @brief Disables every capability of the server.
    void deselectServer(std::string_view serverId);

    /// @brief Enables one capability.
    void selectCapability(std::string_view serverId, std::string_view name);

    /// @brief Disables one capability.
    void deselectCapability(std::string_view serverId, std::string_view name);

    /// @brief Flips one capability between enabled and disabled.
    void toggleCapability(std::string_view serverId, std::string_view name);

    /// @brief Forgets every selection.
    void clear();

    /// @brief Returns the enabled capabilities that still exist on live connections.
    ///
    /// De-duplicated and ordered by (serverId, name).
    [[nodiscard]] auto resolve() const -> std::vector<CapabilityRef>;

    /// @brief Number of capabilities resolve() would return.
    [[nodiscard]] auto selectedCount() const -> size_t;

    /// @brief Number of resolved capabilities belonging to one server.
    [[nodiscard]] auto selectedCount(std::string_view serverId) const -> size_t;

    /// @brief True iff the server has discovered capabilities and all of them are enabled.
    [[nodiscard]] auto isServerFullySelected(std::string_view serverId) const -> bool;

    [[nodiscard]] auto selectionStatus(std::string_view serverId) const -> SelectionStatus;

    /// @brief Returns true if the capability is enabled and still discovered.
    [[nodiscard]] auto isSelected(std::string_view serverId, std::string_view name) const -> bool;

    /// @brief Returns the raw selection state, including stale names.
    [[nodiscard]] auto state() const -> const SelectionState&;

  private:
    const CapabilityCatalog& _catalog;
    SelectionState _state;
};

/// @brief Separator between server id and capability name in request tool names.
inline constexpr auto QualifiedNameSeparator = std::string_view { "__" };

/// @brief Builds the request-facing tool name for a capability: "<serverId>__<name>".
[[nodiscard]] auto qualifiedName(const CapabilityRef& ref) -> std::string;

/// @brief Reverses qualifiedName(). Splits at the first separator.
[[nodiscard]] auto splitQualifiedName(std::string_view qualified) -> std::optional<CapabilityRef>;

/// @brief Serializes resolved capabilities into the tool list of an inference request.
///
/// Each element carries "name" (qualified), "description" and "input_schema".
/// References missing from the catalog are skipped.
[[nodiscard]] auto buildRequestTools(std::span<const CapabilityRef> resolved, const CapabilityCatalog& catalog)
    -> nlohmann::json;

} // namespace toolrelay
