// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <nlohmann/json.hpp>

#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace toolrelay
{

/// @brief Normalizes one user-supplied launch argument.
///
/// A string fully wrapped in a matching pair of single or double quotes loses exactly one layer
/// of quoting. Other strings are returned unchanged; a non-string value yields an empty string.
[[nodiscard]] auto sanitizeArgumentValue(const nlohmann::json& argument) -> std::string;

/// @brief Same rule for a plain string argument.
[[nodiscard]] auto sanitizeArgument(std::string_view argument) -> std::string;

/// @brief Applies sanitizeArgument() to every element, preserving order.
[[nodiscard]] auto sanitizeArguments(std::span<const std::string> arguments) -> std::vector<std::string>;

/// @brief Splits the comma-separated argument text used by the settings form.
///
/// Elements are trimmed and empty elements dropped: "a, b,,c " becomes {"a", "b", "c"}.
[[nodiscard]] auto splitArgumentList(std::string_view text) -> std::vector<std::string>;

} // namespace toolrelay
