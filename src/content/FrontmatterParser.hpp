/**
 * Campaign Keeper - Frontmatter Parser
 * 
 * Reads and writes entity files: a JSON header between "---" fences
 * followed by free-form body text.
 * 
 * SPDX-License-Identifier: GPL-3.0-or-later
 */

#pragma once

#include <string>

#include "Entity.hpp"

namespace keeper {

/**
 * Result of splitting an entity file
 */
struct ParsedDocument {
    Frontmatter frontmatter = Frontmatter::object();
    std::string content;
};

/**
 * Entity file parser
 * 
 * Format:
 * ---
 * {
 *   "id": "captain-vex-a1b2c3",
 *   "name": "Captain Vex",
 *   "relatedCharacters": ["mira-x9y8z7"]
 * }
 * ---
 * 
 * Body text...
 */
class FrontmatterParser {
public:
    /**
     * Split raw file text into header and body
     * 
     * @throws ContentError (Parse) on an unterminated fence, invalid JSON,
     *         or a header that is not an object
     */
    static ParsedDocument parse(const std::string& raw);
    
    /**
     * Render header and body back into file text
     */
    static std::string serialize(const Frontmatter& frontmatter, const std::string& content);
};

} // namespace keeper
