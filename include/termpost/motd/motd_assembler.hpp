#pragma once

#include "termpost/log.hpp"
#include "termpost/motd/post_record.hpp"

#include <optional>
#include <string>
#include <vector>

namespace termpost::motd
{

enum class Freshness
{
    Fresh,
    Stale
};

struct MotdLayout
{
    std::optional<std::string> header;
    std::optional<std::string> footer;
    std::optional<std::string> footerLink;
    int wrapWidth = 0;
    int indent = 0;
};

struct MotdRequest
{
    std::string renderedBody;
    Clock::time_point postDate;
    Clock::time_point now;
    int lifespanHours = 0;
    std::string fallbackBody;
    MotdLayout layout;
};

struct MotdResult
{
    Freshness freshness = Freshness::Stale;
    Clock::duration age{};
    std::string text;
};

// A lifespan of 0 hours never expires.
Freshness evaluateFreshness(Clock::time_point postDate, Clock::time_point now, int lifespanHours);

// Header, body, link block and footer, wrapped and indented.
std::string composeMotd(const std::string &body, const MotdLayout &layout, log::Logger *logger = nullptr);

// Fresh posts go through composeMotd; stale ones fall back to the pre-formatted
// fallback body verbatim. Throws ConfigurationError for negative settings.
MotdResult assembleMotd(const MotdRequest &request, log::Logger *logger = nullptr);

std::string_view freshnessName(Freshness freshness) noexcept;

} // namespace termpost::motd
