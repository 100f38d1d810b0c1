#pragma once

#include "termpost/options.hpp"
#include "termpost/render/tree_renderer.hpp"

#include <filesystem>

namespace termpost::ansi
{

struct AnsiSettings
{
    bool briefing = false;
    int wrapWidth = 0;
    render::OutputFormat format = render::OutputFormat::Escape;
};

inline constexpr const char *kOptionBriefing = "briefing";
inline constexpr const char *kOptionWrapWidth = "wrapWidth";
inline constexpr const char *kOptionFormat = "format";

void registerAnsiOptions(config::OptionRegistry &registry);

// Throws ConfigurationError for an unknown format name.
AnsiSettings settingsFromRegistry(const config::OptionRegistry &registry);
render::OutputFormat parseOutputFormat(const std::string &name);

// An existing directory as output receives the input's file name with ".ansi"
// or ".md" as extension; any other output is used as given.
std::filesystem::path outputPathFor(const std::filesystem::path &input, const std::filesystem::path &output,
                                    render::OutputFormat format);

} // namespace termpost::ansi
