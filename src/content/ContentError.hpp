/**
 * Campaign Keeper - Content Errors
 * 
 * Failure taxonomy shared by the content store and its collaborators.
 * 
 * SPDX-License-Identifier: GPL-3.0-or-later
 */

#pragma once

#include <stdexcept>
#include <string>

namespace keeper {

/**
 * Kind of content failure
 */
enum class ContentErrorKind {
    None,
    NotFound,       // Entity or campaign absent
    Validation,     // Rejected before any write
    IO,             // Disk read/write/permission failure
    Parse           // Malformed entity file
};

/**
 * Content store error
 * 
 * Thrown for failures that are not plain not-found sentinels.
 */
class ContentError : public std::runtime_error {
public:
    ContentError(ContentErrorKind kind, const std::string& message)
        : std::runtime_error(message), m_kind(kind) {}
    
    ContentErrorKind kind() const { return m_kind; }
    
private:
    ContentErrorKind m_kind;
};

/**
 * Convert error kind to string
 */
const char* contentErrorKindToString(ContentErrorKind kind);

} // namespace keeper
