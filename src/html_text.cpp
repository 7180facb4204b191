#include "html_text.hpp"

#include <sstream>
#include <string>
#include <unordered_set>

#include <gumbo.h>

namespace
{

const std::unordered_set<GumboTag> DROPPED_TAGS = {
    GUMBO_TAG_SCRIPT, GUMBO_TAG_STYLE, GUMBO_TAG_IFRAME, GUMBO_TAG_OBJECT,
    GUMBO_TAG_EMBED, GUMBO_TAG_APPLET, GUMBO_TAG_META, GUMBO_TAG_LINK,
    GUMBO_TAG_TITLE,
};

struct TextWriter
{
    std::stringstream ss;
    bool seen_paragraph = false;
};

void traverse(const GumboNode* node, TextWriter& out)
{
    if(node->type == GUMBO_NODE_TEXT || node->type == GUMBO_NODE_WHITESPACE)
    {
        out.ss << node->v.text.text;
        return;
    }
    else if(node->type != GUMBO_NODE_ELEMENT)
    {
        return;
    }

    GumboTag tag = node->v.element.tag;
    if(DROPPED_TAGS.count(tag))
    {
        return;
    }
    if(tag == GUMBO_TAG_BR)
    {
        out.ss << "\n";
        return;
    }
    if(tag == GUMBO_TAG_P)
    {
        if(out.seen_paragraph)
        {
            out.ss << "\n\n";
        }
        out.seen_paragraph = true;
    }

    const GumboVector* children = &node->v.element.children;
    for(unsigned int i = 0; i < children->length; ++i)
    {
        traverse(static_cast<const GumboNode*>(children->data[i]), out);
    }
}

} // namespace

std::string HtmlText::toPlainText(const std::string& html)
{
    GumboOutput* output = gumbo_parse(html.c_str());
    TextWriter writer;

    // Gumbo wraps everything in <html><head/><body/></html>. The
    // content we want is in the body.
    const GumboNode* root = output->root;
    const GumboNode* body = nullptr;
    if(root->type == GUMBO_NODE_ELEMENT)
    {
        for(unsigned int i = 0; i < root->v.element.children.length; ++i)
        {
            const GumboNode* child = static_cast<const GumboNode*>(
                root->v.element.children.data[i]);
            if(child->type == GUMBO_NODE_ELEMENT &&
               child->v.element.tag == GUMBO_TAG_BODY)
            {
                body = child;
                break;
            }
        }
    }
    traverse(body == nullptr ? root : body, writer);

    gumbo_destroy_output(&kGumboDefaultOptions, output);
    return writer.ss.str();
}
