/**
 * Campaign Keeper - Frontmatter Parser Implementation
 * 
 * SPDX-License-Identifier: GPL-3.0-or-later
 */

#include "FrontmatterParser.hpp"
#include "ContentError.hpp"

namespace keeper {

namespace {

constexpr const char* FENCE = "---";
constexpr const char* UTF8_BOM = "\xEF\xBB\xBF";

std::string trim(const std::string& text) {
    const char* whitespace = " \t\r\n";
    auto start = text.find_first_not_of(whitespace);
    if (start == std::string::npos) {
        return {};
    }
    auto end = text.find_last_not_of(whitespace);
    return text.substr(start, end - start + 1);
}

// Read one line starting at pos, without its terminator; advances pos
std::string readLine(const std::string& text, std::size_t& pos) {
    auto newline = text.find('\n', pos);
    std::string line;
    if (newline == std::string::npos) {
        line = text.substr(pos);
        pos = text.size();
    } else {
        line = text.substr(pos, newline - pos);
        pos = newline + 1;
    }
    if (!line.empty() && line.back() == '\r') {
        line.pop_back();
    }
    return line;
}

bool isFenceLine(const std::string& line) {
    return trim(line) == FENCE;
}

} // anonymous namespace

ParsedDocument FrontmatterParser::parse(const std::string& raw) {
    ParsedDocument document;
    
    std::size_t pos = 0;
    if (raw.compare(0, 3, UTF8_BOM) == 0) {
        pos = 3;
    }
    
    // Skip blank lines before the opening fence
    std::size_t firstLineStart = pos;
    std::string firstLine;
    while (pos < raw.size()) {
        firstLineStart = pos;
        firstLine = readLine(raw, pos);
        if (!trim(firstLine).empty()) {
            break;
        }
    }
    
    if (!isFenceLine(firstLine)) {
        // No header at all: the whole file is body text
        document.content = trim(raw.substr(firstLineStart));
        return document;
    }
    
    std::string header;
    bool closed = false;
    while (pos < raw.size()) {
        std::string line = readLine(raw, pos);
        if (isFenceLine(line)) {
            closed = true;
            break;
        }
        header += line;
        header += '\n';
    }
    
    if (!closed) {
        throw ContentError(ContentErrorKind::Parse, "Unterminated frontmatter block");
    }
    
    if (!trim(header).empty()) {
        try {
            document.frontmatter = nlohmann::json::parse(header);
        } catch (const nlohmann::json::parse_error& e) {
            throw ContentError(ContentErrorKind::Parse,
                std::string("Invalid frontmatter: ") + e.what());
        }
        if (!document.frontmatter.is_object()) {
            throw ContentError(ContentErrorKind::Parse, "Frontmatter must be an object");
        }
    }
    
    document.content = trim(raw.substr(pos));
    return document;
}

std::string FrontmatterParser::serialize(const Frontmatter& frontmatter, const std::string& content) {
    std::string raw;
    raw += FENCE;
    raw += '\n';
    raw += frontmatter.is_object() ? frontmatter.dump(2) : std::string("{}");
    raw += '\n';
    raw += FENCE;
    raw += "\n\n";
    raw += content;
    if (raw.back() != '\n') {
        raw += '\n';
    }
    return raw;
}

} // namespace keeper
