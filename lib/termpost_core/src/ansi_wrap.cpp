#include "termpost/text/ansi_wrap.hpp"

#include "termpost/errors.hpp"
#include "termpost/render/style_codec.hpp"

#include <charconv>
#include <iterator>
#include <optional>
#include <string>
#include <utility>

namespace termpost::text
{
namespace
{

constexpr char kEscape = '\033';

bool isContinuationByte(unsigned char ch) noexcept
{
    return (ch & 0xC0) == 0x80;
}

constexpr std::size_t kTabStop = 8;

bool isBlank(char ch) noexcept
{
    return ch == ' ' || ch == '\t';
}

// Columns taken by a blank starting at column; tabs advance to the next stop.
std::size_t blankWidth(char ch, std::size_t column) noexcept
{
    return ch == '\t' ? kTabStop - column % kTabStop : 1;
}

bool escapeComplete(std::string_view token) noexcept
{
    if (token.size() < 2)
        return false;
    if (token[1] != '[')
        return true;
    if (token.size() < 3)
        return false;
    unsigned char last = static_cast<unsigned char>(token.back());
    return last >= 0x40 && last <= 0x7E;
}

// Returns the parameter text of an SGR sequence, or nullopt for other escapes.
std::optional<std::string_view> sgrParameters(std::string_view token) noexcept
{
    if (token.size() < 3 || token[1] != '[' || token.back() != 'm')
        return std::nullopt;
    return token.substr(2, token.size() - 3);
}

std::vector<std::string_view> splitParameters(std::string_view params)
{
    std::vector<std::string_view> parts;
    std::size_t start = 0;
    while (true)
    {
        std::size_t end = params.find(';', start);
        parts.push_back(params.substr(start, end == std::string_view::npos ? std::string_view::npos : end - start));
        if (end == std::string_view::npos)
            break;
        start = end + 1;
    }
    return parts;
}

// Unknown or out of range parameters map to -1.
int toCode(std::string_view part) noexcept
{
    if (part.empty())
        return 0;
    int value = 0;
    auto [end, error] = std::from_chars(part.data(), part.data() + part.size(), value);
    if (error != std::errc() || end != part.data() + part.size())
        return -1;
    return value;
}

// Escape tokens found in a slice of an already tokenized line.
std::string escapesIn(std::string_view slice)
{
    std::string result;
    std::string pending;
    for (char ch : slice)
    {
        if (!pending.empty())
        {
            pending.push_back(ch);
            if (escapeComplete(pending))
            {
                result += pending;
                pending.clear();
            }
            continue;
        }
        if (ch == kEscape)
            pending.push_back(ch);
    }
    return result;
}

struct BreakPoint
{
    std::size_t start = 0;
    std::size_t end = 0;
    std::size_t columnBefore = 0;
    std::size_t columnAfter = 0;
    ActiveStyle style;
};

struct WrapState
{
    std::string current;
    std::size_t column = 0;
    bool hasWord = false;
    bool inBlankRun = false;
    std::optional<BreakPoint> lastBreak;
    std::string pendingEscape;
    std::vector<std::string> output;
};

} // namespace

bool ActiveStyle::empty() const noexcept
{
    return !bold && !underline && !inverse && foreground.empty() && background.empty();
}

void ActiveStyle::apply(std::string_view sgrParameters)
{
    auto parts = splitParameters(sgrParameters);
    for (std::size_t i = 0; i < parts.size(); ++i)
    {
        int code = toCode(parts[i]);
        if (code == 0)
        {
            *this = ActiveStyle{};
        }
        else if (code == 1)
        {
            bold = true;
        }
        else if (code == 22)
        {
            bold = false;
        }
        else if (code == 4)
        {
            underline = true;
        }
        else if (code == 24)
        {
            underline = false;
        }
        else if (code == 7)
        {
            inverse = true;
        }
        else if (code == 27)
        {
            inverse = false;
        }
        else if ((code >= 30 && code <= 37) || (code >= 90 && code <= 97))
        {
            foreground = std::string(parts[i]);
        }
        else if (code == 39)
        {
            foreground.clear();
        }
        else if ((code >= 40 && code <= 47) || (code >= 100 && code <= 107))
        {
            background = std::string(parts[i]);
        }
        else if (code == 49)
        {
            background.clear();
        }
        else if (code == 38 || code == 48)
        {
            // 38;5;n and 38;2;r;g;b carry their color in the following parameters.
            std::size_t extra = 0;
            if (i + 1 < parts.size())
                extra = toCode(parts[i + 1]) == 5 ? 2 : (toCode(parts[i + 1]) == 2 ? 4 : 0);
            std::string color(parts[i]);
            for (std::size_t k = 1; k <= extra && i + k < parts.size(); ++k)
            {
                color += ';';
                color += parts[i + k];
            }
            i += extra;
            if (code == 38)
                foreground = color;
            else
                background = color;
        }
    }
}

std::string ActiveStyle::escapeText() const
{
    using render::StyleIntent;
    std::string result;
    if (bold)
        result += render::encode(StyleIntent::BoldOn).escape;
    if (underline)
        result += render::encode(StyleIntent::UnderlineOn).escape;
    if (inverse)
        result += render::encode(StyleIntent::InverseOn).escape;
    if (!foreground.empty())
        result += "\033[" + foreground + "m";
    if (background == "41")
        result += render::encode(StyleIntent::BackgroundRed).escape;
    else if (background == "42")
        result += render::encode(StyleIntent::BackgroundGreen).escape;
    else if (!background.empty())
        result += "\033[" + background + "m";
    return result;
}

bool ActiveStyle::operator==(const ActiveStyle &other) const noexcept
{
    return bold == other.bold && underline == other.underline && inverse == other.inverse &&
           foreground == other.foreground && background == other.background;
}

std::size_t visibleWidth(std::string_view line)
{
    std::size_t width = 0;
    std::string pending;
    for (char ch : line)
    {
        if (!pending.empty())
        {
            pending.push_back(ch);
            if (escapeComplete(pending))
                pending.clear();
            continue;
        }
        if (ch == kEscape)
        {
            pending.push_back(ch);
            continue;
        }
        if (ch == '\t')
            width += blankWidth(ch, width);
        else if (!isContinuationByte(static_cast<unsigned char>(ch)))
            ++width;
    }
    return width;
}

std::string stripEscapes(std::string_view text)
{
    std::string result;
    result.reserve(text.size());
    std::string pending;
    for (char ch : text)
    {
        if (!pending.empty())
        {
            pending.push_back(ch);
            if (escapeComplete(pending))
                pending.clear();
            continue;
        }
        if (ch == kEscape)
        {
            pending.push_back(ch);
            continue;
        }
        result.push_back(ch);
    }
    return result;
}

EscapeAwareWrapper::EscapeAwareWrapper(int width)
    : columns(width)
{
    if (width <= 0)
        throw ConfigurationError("Wrap width must be positive, got " + std::to_string(width));
}

std::vector<std::string> EscapeAwareWrapper::wrapLine(std::string_view line)
{
    const std::size_t limit = static_cast<std::size_t>(columns);
    WrapState state;

    // Escapes do not end a blank run, so a run split by a style change is
    // still one break point.
    auto appendEscape = [&](const std::string &token) {
        state.current += token;
        if (auto params = sgrParameters(token))
            style.apply(*params);
    };

    auto breakLine = [&]() {
        const BreakPoint &point = *state.lastBreak;
        state.output.push_back(state.current.substr(0, point.start));
        std::string dropped = escapesIn(std::string_view(state.current).substr(point.start, point.end - point.start));
        std::string tail = state.current.substr(point.end);
        state.current = point.style.escapeText() + dropped + tail;
        state.column -= point.columnAfter;
        state.hasWord = state.column > 0;
        state.lastBreak.reset();
    };

    for (char ch : line)
    {
        if (!state.pendingEscape.empty())
        {
            state.pendingEscape.push_back(ch);
            if (escapeComplete(state.pendingEscape))
            {
                appendEscape(state.pendingEscape);
                state.pendingEscape.clear();
            }
            continue;
        }
        if (ch == kEscape)
        {
            state.pendingEscape.push_back(ch);
            continue;
        }

        unsigned char byte = static_cast<unsigned char>(ch);
        if (isContinuationByte(byte))
        {
            state.current.push_back(ch);
            continue;
        }

        if (isBlank(ch))
        {
            if (state.hasWord)
            {
                if (!state.inBlankRun)
                {
                    BreakPoint point;
                    point.start = state.current.size();
                    point.columnBefore = state.column;
                    point.style = style;
                    state.lastBreak = point;
                    state.inBlankRun = true;
                }
                state.current.push_back(ch);
                state.column += blankWidth(ch, state.column);
                state.lastBreak->end = state.current.size();
                state.lastBreak->columnAfter = state.column;
            }
            else
            {
                state.current.push_back(ch);
                state.column += blankWidth(ch, state.column);
            }
            continue;
        }

        state.inBlankRun = false;
        if (state.column + 1 > limit && state.lastBreak)
            breakLine();
        state.current.push_back(ch);
        ++state.column;
        state.hasWord = true;
    }

    // An unterminated escape stays attached to the line as it came in.
    if (!state.pendingEscape.empty())
        state.current += state.pendingEscape;

    if (state.lastBreak && state.lastBreak->columnAfter == state.column && state.column > limit)
    {
        const BreakPoint &point = *state.lastBreak;
        std::string kept = escapesIn(std::string_view(state.current).substr(point.start, point.end - point.start));
        state.current.replace(point.start, point.end - point.start, kept);
        state.column = point.columnBefore;
    }

    state.output.push_back(std::move(state.current));
    return std::move(state.output);
}

std::vector<std::string> wrapAnsi(const std::vector<std::string> &lines, int width)
{
    if (width < 0)
        throw ConfigurationError("Wrap width cannot be negative, got " + std::to_string(width));
    if (width == 0)
        return lines;

    EscapeAwareWrapper wrapper(width);
    std::vector<std::string> result;
    result.reserve(lines.size());
    for (const auto &line : lines)
    {
        auto wrapped = wrapper.wrapLine(line);
        result.insert(result.end(), std::make_move_iterator(wrapped.begin()), std::make_move_iterator(wrapped.end()));
    }
    return result;
}

std::vector<std::string> wrapAnsi(std::string_view text, int width)
{
    return wrapAnsi(splitLines(text), width);
}

std::vector<std::string> splitLines(std::string_view text)
{
    std::vector<std::string> lines;
    std::size_t offset = 0;
    while (offset < text.size())
    {
        std::size_t end = text.find('\n', offset);
        if (end == std::string_view::npos)
        {
            lines.emplace_back(text.substr(offset));
            break;
        }
        std::string_view line = text.substr(offset, end - offset);
        if (!line.empty() && line.back() == '\r')
            line.remove_suffix(1);
        lines.emplace_back(line);
        offset = end + 1;
    }
    return lines;
}

} // namespace termpost::text
