#include "description.hpp"

#include <sstream>

namespace Repodex {

namespace {

enum class Block { None, Paragraph, Bullets, Numbers };

bool isListItem(const std::string& line, char marker)
{
    return line.size() >= 2 && line[0] == marker && line[1] == ' ';
}

std::string trim(const std::string& s)
{
    size_t start = s.find_first_not_of(" \t\r");
    if (start == std::string::npos) {
        return "";
    }
    size_t end = s.find_last_not_of(" \t\r");
    return s.substr(start, end - start + 1);
}

} // namespace

std::string DescriptionFormatter::escape(const std::string& text)
{
    std::string out;
    out.reserve(text.size());
    for (char c : text) {
        switch (c) {
        case '&': out += "&amp;"; break;
        case '<': out += "&lt;"; break;
        case '>': out += "&gt;"; break;
        case '"': out += "&quot;"; break;
        default:  out += c; break;
        }
    }
    return out;
}

std::string DescriptionFormatter::formatInline(const std::string& text, const LinkResolver& resolver)
{
    std::string out;
    bool bold = false;
    bool italic = false;
    size_t i = 0;

    while (i < text.size()) {
        if (text.compare(i, 3, "'''") == 0) {
            out += bold ? "</b>" : "<b>";
            bold = !bold;
            i += 3;
        } else if (text.compare(i, 2, "''") == 0) {
            out += italic ? "</i>" : "<i>";
            italic = !italic;
            i += 2;
        } else if (text.compare(i, 2, "[[") == 0) {
            size_t close = text.find("]]", i + 2);
            if (close == std::string::npos) {
                out += escape(text.substr(i));
                break;
            }
            std::string appId = text.substr(i + 2, close - i - 2);
            auto [target, label] = resolver(appId);
            out += "<a href=\"" + escape(target) + "\">" + escape(label) + "</a>";
            i = close + 2;
        } else if (text[i] == '[') {
            size_t close = text.find(']', i + 1);
            if (close == std::string::npos) {
                out += escape(text.substr(i));
                break;
            }
            std::string inner = text.substr(i + 1, close - i - 1);
            size_t space = inner.find(' ');
            std::string url = inner.substr(0, space);
            std::string label = (space == std::string::npos) ? url : trim(inner.substr(space + 1));
            out += "<a href=\"" + escape(url) + "\">" + escape(label) + "</a>";
            i = close + 1;
        } else {
            out += escape(std::string(1, text[i]));
            ++i;
        }
    }

    if (italic) {
        out += "</i>";
    }
    if (bold) {
        out += "</b>";
    }
    return out;
}

std::string DescriptionFormatter::toHtml(const std::string& text, const LinkResolver& resolver)
{
    std::string html;
    std::string paragraph;
    Block block = Block::None;

    auto endBlock = [&]() {
        switch (block) {
        case Block::Paragraph:
            html += "<p>" + formatInline(paragraph, resolver) + "</p>";
            paragraph.clear();
            break;
        case Block::Bullets:
            html += "</ul>";
            break;
        case Block::Numbers:
            html += "</ol>";
            break;
        case Block::None:
            break;
        }
        block = Block::None;
    };

    std::istringstream lines(text);
    std::string raw;
    while (std::getline(lines, raw)) {
        std::string line = trim(raw);

        if (line.empty()) {
            endBlock();
            continue;
        }

        if (isListItem(line, '*') || isListItem(line, '#')) {
            Block wanted = (line[0] == '*') ? Block::Bullets : Block::Numbers;
            if (block != wanted) {
                endBlock();
                html += (wanted == Block::Bullets) ? "<ul>" : "<ol>";
                block = wanted;
            }
            html += "<li>" + formatInline(trim(line.substr(2)), resolver) + "</li>";
            continue;
        }

        if (block == Block::Bullets || block == Block::Numbers) {
            endBlock();
        }
        if (block == Block::Paragraph) {
            paragraph += " ";
        }
        paragraph += line;
        block = Block::Paragraph;
    }
    endBlock();

    return html;
}

} // namespace Repodex
