// SPDX-License-Identifier: Apache-2.0
#include "SelectionRegistry.hpp"

#include <core/Log.hpp>

#include <algorithm>

namespace toolrelay
{

SelectionRegistry::SelectionRegistry(const CapabilityCatalog& catalog): _catalog(catalog)
{
}

void SelectionRegistry::selectServer(std::string_view serverId)
{
    auto const capabilities = _catalog.listCapabilities(serverId);
    if (capabilities.empty())
    {
        log::debug("[{}] select all: no capabilities discovered", serverId);
        return;
    }

    auto& names = _state[std::string(serverId)];
    for (const auto& capability: capabilities)
        names.insert(capability.name);
}

void SelectionRegistry::deselectServer(std::string_view serverId)
{
    if (auto it = _state.find(serverId); it != _state.end())
        _state.erase(it);
}

void SelectionRegistry::selectCapability(std::string_view serverId, std::string_view name)
{
    _state[std::string(serverId)].insert(std::string(name));
}

void SelectionRegistry::deselectCapability(std::string_view serverId, std::string_view name)
{
    auto it = _state.find(serverId);
    if (it == _state.end())
        return;

    if (auto nameIt = it->second.find(name); nameIt != it->second.end())
        it->second.erase(nameIt);
    if (it->second.empty())
        _state.erase(it);
}

void SelectionRegistry::toggleCapability(std::string_view serverId, std::string_view name)
{
    if (auto it = _state.find(serverId); it != _state.end() && it->second.contains(name))
        deselectCapability(serverId, name);
    else
        selectCapability(serverId, name);
}

void SelectionRegistry::clear()
{
    _state.clear();
}

auto SelectionRegistry::resolve() const -> std::vector<CapabilityRef>
{
    auto resolved = std::vector<CapabilityRef> {};
    auto stale = size_t { 0 };

    for (const auto& [serverId, names]: _state)
    {
        auto const live = _catalog.listCapabilities(serverId);
        for (const auto& name: names)
        {
            auto const present =
                std::ranges::any_of(live, [&](const Capability& capability) { return capability.name == name; });
            if (present)
                resolved.push_back(CapabilityRef { .serverId = serverId, .name = name });
            else
                ++stale;
        }
    }

    if (stale > 0)
        log::debug("Selection has {} stale capability reference(s)", stale);

    // std::map and std::set iteration already yields (serverId, name) order without duplicates.
    return resolved;
}

auto SelectionRegistry::selectedCount() const -> size_t
{
    return resolve().size();
}

auto SelectionRegistry::selectedCount(std::string_view serverId) const -> size_t
{
    auto const resolved = resolve();
    return static_cast<size_t>(
        std::ranges::count_if(resolved, [&](const CapabilityRef& ref) { return ref.serverId == serverId; }));
}

auto SelectionRegistry::isServerFullySelected(std::string_view serverId) const -> bool
{
    return selectionStatus(serverId) == SelectionStatus::Full;
}

auto SelectionRegistry::selectionStatus(std::string_view serverId) const -> SelectionStatus
{
    auto const live = _catalog.listCapabilities(serverId);
    auto const it = _state.find(serverId);
    if (live.empty() || it == _state.end())
        return SelectionStatus::None;

    auto const selected = std::ranges::count_if(
        live, [&](const Capability& capability) { return it->second.contains(capability.name); });

    if (selected == 0)
        return SelectionStatus::None;
    if (static_cast<size_t>(selected) == live.size())
        return SelectionStatus::Full;
    return SelectionStatus::Partial;
}

auto SelectionRegistry::isSelected(std::string_view serverId, std::string_view name) const -> bool
{
    auto const resolved = resolve();
    return std::ranges::any_of(
        resolved, [&](const CapabilityRef& ref) { return ref.serverId == serverId && ref.name == name; });
}

auto SelectionRegistry::state() const -> const SelectionState&
{
    return _state;
}

auto qualifiedName(const CapabilityRef& ref) -> std::string
{
    return ref.serverId + std::string(QualifiedNameSeparator) + ref.name;
}

auto splitQualifiedName(std::string_view qualified) -> std::optional<CapabilityRef>
{
    auto const pos = qualified.find(QualifiedNameSeparator);
    if (pos == std::string_view::npos || pos == 0 || pos + QualifiedNameSeparator.size() >= qualified.size())
        return std::nullopt;

    return CapabilityRef {
        .serverId = std::string(qualified.substr(0, pos)),
        .name = std::string(qualified.substr(pos + QualifiedNameSeparator.size())),
    };
}

auto buildRequestTools(std::span<const CapabilityRef> resolved, const CapabilityCatalog& catalog) -> nlohmann::json
{
    auto tools = nlohmann::json::array();
    auto cachedServer = std::string {};
    auto cachedCapabilities = std::vector<Capability> {};

    for (const auto& ref: resolved)
    {
        if (ref.serverId != cachedServer || cachedCapabilities.empty())
        {
            cachedServer = ref.serverId;
            cachedCapabilities = catalog.listCapabilities(ref.serverId);
        }

        auto const it = std::ranges::find_if(
            cachedCapabilities, [&](const Capability& capability) { return capability.name == ref.name; });
        if (it == cachedCapabilities.end())
            continue;

        tools.push_back(nlohmann::json {
            { "name", qualifiedName(ref) },
            { "description", it->description },
            { "input_schema", it->inputSchema.is_null() ? nlohmann::json::object() : it->inputSchema },
        });
    }

    return tools;
}

} // namespace toolrelay
