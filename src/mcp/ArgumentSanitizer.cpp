// SPDX-License-Identifier: Apache-2.0
#include "ArgumentSanitizer.hpp"

namespace toolrelay
{

namespace
{
    constexpr auto Whitespace = std::string_view { " \t\r\n" };

    auto trim(std::string_view text) -> std::string_view
    {
        auto const first = text.find_first_not_of(Whitespace);
        if (first == std::string_view::npos)
            return {};
        auto const last = text.find_last_not_of(Whitespace);
        return text.substr(first, last - first + 1);
    }
} // namespace

auto sanitizeArgument(std::string_view argument) -> std::string
{
    if (argument.size() >= 2)
    {
        auto const front = argument.front();
        if ((front == '"' || front == '\'') && argument.back() == front)
            return std::string(argument.substr(1, argument.size() - 2));
    }
    return std::string(argument);
}

auto sanitizeArgumentValue(const nlohmann::json& argument) -> std::string
{
    if (!argument.is_string())
        return {};
    return sanitizeArgument(std::string_view(argument.get_ref<const std::string&>()));
}

auto sanitizeArguments(std::span<const std::string> arguments) -> std::vector<std::string>
{
    auto result = std::vector<std::string> {};
    result.reserve(arguments.size());
    for (const auto& argument: arguments)
        result.push_back(sanitizeArgument(std::string_view(argument)));
    return result;
}

auto splitArgumentList(std::string_view text) -> std::vector<std::string>
{
    auto result = std::vector<std::string> {};
    while (!text.empty())
    {
        auto const comma = text.find(',');
        auto const item = trim(text.substr(0, comma));
        if (!item.empty())
            result.emplace_back(item);
        if (comma == std::string_view::npos)
            break;
        text.remove_prefix(comma + 1);
    }
    return result;
}

} // namespace toolrelay
