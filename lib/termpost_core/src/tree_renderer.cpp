#include "termpost/render/tree_renderer.hpp"

#include "termpost/render/style_codec.hpp"

#include <string_view>
#include <utility>
#include <vector>

namespace termpost::render
{
namespace
{

using doc::DocumentNode;
using doc::NodeKind;

constexpr std::size_t kIndentUnit = 2;

enum class BlockClass
{
    None,
    Heading,
    Body
};

struct ListFrame
{
    NodeKind kind = NodeKind::BulletList;
    int position = 0;
    bool itemFresh = false;
};

struct RenderContext
{
    std::string escape;
    std::string markdown;
    std::vector<ListFrame> lists;
    int sectionDepth = 0;
    bool atLineStart = true;
    BlockClass lastBlock = BlockClass::None;

    bool briefing = false;
    bool titleSeen = false;
    bool done = false;
};

bool isTopLevelContainer(NodeKind kind) noexcept
{
    return kind == NodeKind::Document || kind == NodeKind::Section;
}

bool isBadge(std::string_view name, StyleIntent &background) noexcept
{
    if (name == "Warning")
    {
        background = StyleIntent::BackgroundRed;
        return true;
    }
    if (name == "Info")
    {
        background = StyleIntent::BackgroundGreen;
        return true;
    }
    return false;
}

void trimTrailingNewlines(std::string &text)
{
    while (!text.empty() && text.back() == '\n')
        text.pop_back();
}

class Walker
{
public:
    Walker(RenderContext &context, log::Logger *logger)
        : ctx(context), logger(logger)
    {
    }

    void walk(const DocumentNode &node, NodeKind parent)
    {
        if (ctx.done)
            return;

        switch (node.kind)
        {
        case NodeKind::Document:
            walkChildren(node);
            break;
        case NodeKind::Section:
            ++ctx.sectionDepth;
            walkChildren(node);
            --ctx.sectionDepth;
            break;
        case NodeKind::Title:
            visitTitle(node);
            break;
        case NodeKind::Subtitle:
            visitSubtitle(node);
            break;
        case NodeKind::Paragraph:
            visitParagraph(node, parent);
            break;
        case NodeKind::Strong:
            visitStyled(node, StyleIntent::BoldOn, StyleIntent::BoldOff);
            break;
        case NodeKind::Emphasis:
            visitStyled(node, StyleIntent::UnderlineOn, StyleIntent::UnderlineOff);
            break;
        case NodeKind::Literal:
            visitStyled(node, StyleIntent::InverseOn, StyleIntent::InverseOff);
            break;
        case NodeKind::Reference:
            visitReference(node);
            break;
        case NodeKind::BulletList:
        case NodeKind::EnumeratedList:
            visitList(node);
            break;
        case NodeKind::ListItem:
            log::warning(logger, "List item outside of a list, rendering it as a bullet");
            ctx.lists.push_back({NodeKind::BulletList, 0, false});
            visitListItem(node);
            ctx.lists.pop_back();
            break;
        case NodeKind::Substitution:
            visitSubstitution(node);
            break;
        case NodeKind::Directive:
            visitDirective(node);
            break;
        case NodeKind::Transition:
            beginBlock();
            writeText("---");
            ctx.lastBlock = BlockClass::Body;
            break;
        case NodeKind::DocInfo:
        case NodeKind::Field:
            break;
        case NodeKind::PlainText:
            walkContent(node);
            break;
        case NodeKind::Unknown:
            log::warning(logger, "Unsupported element '" + (node.name.empty() ? std::string("unknown") : node.name) +
                                     "', rendered as plain text");
            writeText(node.plainText());
            break;
        }
    }

private:
    void walkChildren(const DocumentNode &node)
    {
        for (const auto &child : node.children)
        {
            if (ctx.done)
                return;
            walk(child, node.kind);
        }
    }

    void walkContent(const DocumentNode &node)
    {
        writeText(node.text);
        walkChildren(node);
    }

    std::string currentIndent() const
    {
        return std::string(kIndentUnit * ctx.lists.size(), ' ');
    }

    void both(std::string_view text)
    {
        ctx.escape.append(text);
        ctx.markdown.append(text);
    }

    void ensureIndent()
    {
        if (!ctx.atLineStart)
            return;
        both(currentIndent());
        ctx.atLineStart = false;
    }

    void writeText(std::string_view text)
    {
        std::size_t offset = 0;
        while (offset < text.size())
        {
            std::size_t end = text.find('\n', offset);
            std::string_view segment = text.substr(offset, end == std::string_view::npos ? std::string_view::npos : end - offset);
            if (!segment.empty())
            {
                ensureIndent();
                both(segment);
            }
            if (end == std::string_view::npos)
                break;
            both("\n");
            ctx.atLineStart = true;
            offset = end + 1;
        }
    }

    void writeSplit(std::string_view escape, std::string_view markdown)
    {
        ensureIndent();
        ctx.escape.append(escape);
        ctx.markdown.append(markdown);
    }

    void writeStyle(StyleIntent intent)
    {
        StyleRun run = encode(intent);
        writeSplit(run.escape, run.markdown);
    }

    void newline()
    {
        if (ctx.atLineStart)
            return;
        both("\n");
        ctx.atLineStart = true;
    }

    // Blocks start on a fresh line; top-level blocks after body text also get
    // a blank separator line.
    void beginBlock()
    {
        if (ctx.escape.empty() && ctx.markdown.empty())
            return;
        newline();
        if (ctx.lists.empty() && ctx.lastBlock == BlockClass::Body)
            both("\n");
    }

    int headingLevel() const noexcept
    {
        return ctx.sectionDepth > 1 ? ctx.sectionDepth : 1;
    }

    void visitTitle(const DocumentNode &node)
    {
        beginBlock();
        writeSplit(encode(StyleIntent::BoldOn).escape, std::string(headingLevel(), '#') + " ");
        walkContent(node);
        writeSplit(encode(StyleIntent::BoldOff).escape, "");
        ctx.lastBlock = BlockClass::Heading;
        ctx.titleSeen = true;
        log::debug(logger, "Translated title element: '" + node.plainText() + "'");
    }

    void visitSubtitle(const DocumentNode &node)
    {
        beginBlock();
        writeSplit("", std::string(headingLevel() + 1, '#') + " ");
        walkContent(node);
        ctx.lastBlock = BlockClass::Heading;
        log::debug(logger, "Translated subtitle element: '" + node.plainText() + "'");
    }

    void visitParagraph(const DocumentNode &node, NodeKind parent)
    {
        if (!ctx.lists.empty() && ctx.lists.back().itemFresh)
            ctx.lists.back().itemFresh = false;
        else
            beginBlock();

        walkContent(node);
        ctx.lastBlock = BlockClass::Body;

        if (ctx.briefing && ctx.titleSeen && ctx.lists.empty() && isTopLevelContainer(parent))
        {
            ctx.done = true;
            log::debug(logger, "Reached end of the briefing paragraph");
        }
    }

    void visitStyled(const DocumentNode &node, StyleIntent on, StyleIntent off)
    {
        writeStyle(on);
        walkContent(node);
        writeStyle(off);
        log::debug(logger, "Translated " + std::string(doc::kindName(node.kind)) + " element: '" + node.plainText() +
                               "'");
    }

    void visitReference(const DocumentNode &node)
    {
        std::string label = node.plainText();
        if (node.target.empty())
        {
            log::warning(logger, "Reference '" + label + "' has no target, rendered without link");
            walkContent(node);
            return;
        }

        writeSplit("", "[");
        walkContent(node);
        if (label.empty() || label == node.target)
            writeSplit(label.empty() ? node.target : std::string(), "](" + node.target + ")");
        else
            writeSplit(" (" + node.target + ")", "](" + node.target + ")");
        log::debug(logger, "Translated link element: '" + label + "'");
    }

    void visitList(const DocumentNode &node)
    {
        if (!ctx.lists.empty())
            ctx.lists.back().itemFresh = false;
        beginBlock();
        ctx.lists.push_back({node.kind, 0, false});
        for (const auto &child : node.children)
        {
            if (ctx.done)
                break;
            if (child.kind == NodeKind::ListItem)
            {
                visitListItem(child);
            }
            else
            {
                log::warning(logger, "Unexpected '" + std::string(doc::kindName(child.kind)) + "' inside a list");
                walk(child, node.kind);
            }
        }
        ctx.lists.pop_back();
        ctx.lastBlock = BlockClass::Body;
    }

    void visitListItem(const DocumentNode &node)
    {
        ListFrame &frame = ctx.lists.back();
        newline();
        std::string marker(kIndentUnit * (ctx.lists.size() - 1), ' ');
        if (frame.kind == NodeKind::EnumeratedList)
            marker += std::to_string(++frame.position) + ". ";
        else
            marker += "- ";
        both(marker);
        ctx.atLineStart = false;
        frame.itemFresh = true;

        walkContent(node);
        ctx.lists.back().itemFresh = false;
        log::debug(logger, "Translated list item: '" + node.plainText() + "'");
    }

    void visitSubstitution(const DocumentNode &node)
    {
        std::string display = node.text.empty() ? node.name : node.text;
        StyleIntent background = StyleIntent::Reset;
        if (!isBadge(node.name, background))
        {
            writeText(display);
            return;
        }
        writeStyle(background);
        writeText(" " + display + " ");
        writeStyle(StyleIntent::Reset);
        log::debug(logger, "Translated badge: '" + node.name + "'");
    }

    void visitDirective(const DocumentNode &node)
    {
        if (node.name != "update" || node.argument.empty())
        {
            if (node.name.empty())
                log::warning(logger, "Directive without a name, rendering its content unstyled");
            else
                log::warning(logger, "Unsupported directive '" + node.name + "', rendering its content unstyled");
            walkChildren(node);
            return;
        }

        beginBlock();
        writeStyle(StyleIntent::BoldOn);
        writeText("Update " + node.argument);
        writeStyle(StyleIntent::BoldOff);
        ctx.lastBlock = BlockClass::Heading;
        walkChildren(node);
        ctx.lastBlock = BlockClass::Body;
        log::debug(logger, "Translated update directive from " + node.argument);
    }

    RenderContext &ctx;
    log::Logger *logger;
};

} // namespace

RenderedText TreeRenderer::render(const doc::DocumentNode &tree, bool briefingOnly) const
{
    RenderContext context;
    context.briefing = briefingOnly;

    Walker walker(context, logger);
    walker.walk(tree, NodeKind::Document);

    if (briefingOnly && !context.done)
        log::warning(logger, "Document has no paragraph after its title, briefing contains the whole document");

    trimTrailingNewlines(context.escape);
    trimTrailingNewlines(context.markdown);
    return {std::move(context.escape), std::move(context.markdown)};
}

const std::string &select(const RenderedText &rendered, OutputFormat format) noexcept
{
    return format == OutputFormat::Markdown ? rendered.markdownBody : rendered.escapeBody;
}

} // namespace termpost::render
