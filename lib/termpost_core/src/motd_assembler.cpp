#include "termpost/motd/motd_assembler.hpp"

#include "termpost/errors.hpp"
#include "termpost/text/ansi_wrap.hpp"

#include <algorithm>
#include <cctype>
#include <regex>

namespace termpost::motd
{
namespace
{

void requireNonNegative(int value, const char *name)
{
    if (value < 0)
        throw ConfigurationError(std::string(name) + " cannot be negative, got " + std::to_string(value));
}

void appendPart(std::string &content, const std::string &part)
{
    if (part.empty())
        return;
    content += part;
    if (content.back() != '\n')
        content.push_back('\n');
}

bool isBlankLine(const std::string &line)
{
    return std::all_of(line.begin(), line.end(), [](char ch)
                       { return std::isspace(static_cast<unsigned char>(ch)) != 0; });
}

void reportLongUrls(const std::string &content, int wrapWidth, log::Logger *logger)
{
    if (!logger || wrapWidth <= 0)
        return;
    static const std::regex urlPattern(R"(https?://[^\s]+)");
    const std::string clear = text::stripEscapes(content);
    for (auto it = std::sregex_iterator(clear.begin(), clear.end(), urlPattern); it != std::sregex_iterator(); ++it)
    {
        std::string url = it->str();
        std::size_t width = text::visibleWidth(url);
        if (width > static_cast<std::size_t>(wrapWidth))
            logger->warning("Found a URL longer than the MOTD width: " + url + " (" + std::to_string(width) +
                            " characters)");
    }
}

} // namespace

Freshness evaluateFreshness(Clock::time_point postDate, Clock::time_point now, int lifespanHours)
{
    requireNonNegative(lifespanHours, "Lifespan hours");
    if (lifespanHours == 0)
        return Freshness::Fresh;
    return (now - postDate) < std::chrono::hours(lifespanHours) ? Freshness::Fresh : Freshness::Stale;
}

std::string composeMotd(const std::string &body, const MotdLayout &layout, log::Logger *logger)
{
    requireNonNegative(layout.wrapWidth, "Wrap width");
    requireNonNegative(layout.indent, "Indent");

    std::string content;
    if (layout.header)
        appendPart(content, *layout.header);
    appendPart(content, body);
    if (layout.footerLink && !layout.footerLink->empty())
        appendPart(content, "\nMore information in\n" + *layout.footerLink + "\n");
    if (layout.footer)
        appendPart(content, *layout.footer);

    reportLongUrls(content, layout.wrapWidth, logger);

    std::vector<std::string> lines = text::wrapAnsi(std::string_view(content), layout.wrapWidth);
    const std::string prefix(static_cast<std::size_t>(layout.indent), ' ');

    std::string result;
    for (const auto &line : lines)
    {
        if (!isBlankLine(line))
            result += prefix;
        result += line;
        result.push_back('\n');
    }
    log::debug(logger, "Composed MOTD with " + std::to_string(lines.size()) + " lines");
    return result;
}

MotdResult assembleMotd(const MotdRequest &request, log::Logger *logger)
{
    requireNonNegative(request.layout.wrapWidth, "Wrap width");
    requireNonNegative(request.layout.indent, "Indent");

    MotdResult result;
    result.age = request.now - request.postDate;
    result.freshness = evaluateFreshness(request.postDate, request.now, request.lifespanHours);

    auto ageHours = std::chrono::duration_cast<std::chrono::hours>(result.age).count();
    if (result.freshness == Freshness::Fresh)
    {
        log::info(logger, "Post is " + std::to_string(ageHours) + " hours old, using it for the MOTD");
        result.text = composeMotd(request.renderedBody, request.layout, logger);
    }
    else
    {
        log::info(logger, "Post is " + std::to_string(ageHours) + " hours old, older than " +
                              std::to_string(request.lifespanHours) + " hours, using the fallback MOTD");
        result.text = request.fallbackBody;
    }
    return result;
}

std::string_view freshnessName(Freshness freshness) noexcept
{
    return freshness == Freshness::Fresh ? "fresh" : "stale";
}

} // namespace termpost::motd
