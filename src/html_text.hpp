#pragma once

#include <string>

class HtmlText
{
public:
    // Render status HTML as plain text. Entities are decoded, “<br>”
    // becomes a newline, consecutive paragraphs are separated by a
    // blank line, and every other tag is dropped while keeping its
    // text. Script and style content is discarded.
    static std::string toPlainText(const std::string& html);
};
