// SPDX-License-Identifier: Apache-2.0
#include <tui/Text.hpp>

namespace bufstack::tui
{

namespace
{
    constexpr auto isContinuation(char ch) noexcept -> bool
    {
        return (static_cast<unsigned char>(ch) & 0xC0) == 0x80;
    }
} // namespace

auto displayWidth(std::string_view text) -> int
{
    auto width = 0;
    for (auto const ch: text)
    {
        if (!isContinuation(ch))
            ++width;
    }
    return width;
}

auto clipToWidth(std::string_view text, int width) -> std::string_view
{
    if (width <= 0)
        return {};

    auto columns = 0;
    for (auto i = std::size_t { 0 }; i < text.size(); ++i)
    {
        if (isContinuation(text[i]))
            continue;
        if (columns == width)
            return text.substr(0, i);
        ++columns;
    }
    return text;
}

auto truncate(std::string_view text, int width) -> std::string
{
    if (width <= 0)
        return "";

    if (displayWidth(text) <= width)
        return std::string(text);

    if (width <= 3)
        return std::string(static_cast<std::size_t>(width), '.');

    auto result = std::string(clipToWidth(text, width - 1));
    result += "…";
    return result;
}

auto padRight(std::string_view text, int width) -> std::string
{
    auto result = std::string(text);
    auto const missing = width - displayWidth(text);
    if (missing > 0)
        result.append(static_cast<std::size_t>(missing), ' ');
    return result;
}

auto splitLines(std::string_view text) -> std::vector<std::string_view>
{
    auto lines = std::vector<std::string_view> {};
    while (!text.empty())
    {
        auto const nl = text.find('\n');
        if (nl == std::string_view::npos)
        {
            lines.push_back(text);
            break;
        }
        lines.push_back(text.substr(0, nl));
        text.remove_prefix(nl + 1);
    }
    return lines;
}

} // namespace bufstack::tui
