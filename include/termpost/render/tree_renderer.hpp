#pragma once

#include "termpost/doc/document.hpp"
#include "termpost/log.hpp"

#include <string>

namespace termpost::render
{

struct RenderedText
{
    std::string escapeBody;
    std::string markdownBody;
};

enum class OutputFormat
{
    Escape,
    Markdown
};

// Walks a document tree once and fills both bodies. Nodes outside the
// supported set degrade to their plain text and are reported to the logger.
class TreeRenderer
{
public:
    explicit TreeRenderer(log::Logger *logger = nullptr) noexcept
        : logger(logger)
    {
    }

    // With briefingOnly the walk stops after the first top-level paragraph
    // that follows a title.
    RenderedText render(const doc::DocumentNode &tree, bool briefingOnly = false) const;

private:
    log::Logger *logger;
};

const std::string &select(const RenderedText &rendered, OutputFormat format) noexcept;

} // namespace termpost::render
