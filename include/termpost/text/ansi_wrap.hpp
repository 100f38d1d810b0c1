#pragma once

#include <cstddef>
#include <string>
#include <string_view>
#include <vector>

namespace termpost::text
{

// SGR attributes in effect at some point of a styled text.
struct ActiveStyle
{
    bool bold = false;
    bool underline = false;
    bool inverse = false;
    std::string foreground;
    std::string background;

    bool empty() const noexcept;
    void apply(std::string_view sgrParameters);
    // Escape text that re-establishes this style from a reset terminal.
    std::string escapeText() const;

    bool operator==(const ActiveStyle &other) const noexcept;
};

std::size_t visibleWidth(std::string_view line);
std::string stripEscapes(std::string_view text);

// Re-flows lines to a column width. Escape sequences take no columns and are
// never split; continuation lines start with the style active at the break.
// Lines that already fit are returned unchanged.
class EscapeAwareWrapper
{
public:
    explicit EscapeAwareWrapper(int width);

    int width() const noexcept { return columns; }

    // Styles opened on one line stay active for the following calls.
    std::vector<std::string> wrapLine(std::string_view line);
    const ActiveStyle &activeStyle() const noexcept { return style; }

private:
    int columns;
    ActiveStyle style;
};

// Width 0 returns the input unchanged; a negative width throws ConfigurationError.
std::vector<std::string> wrapAnsi(const std::vector<std::string> &lines, int width);
std::vector<std::string> wrapAnsi(std::string_view text, int width);

std::vector<std::string> splitLines(std::string_view text);

} // namespace termpost::text
