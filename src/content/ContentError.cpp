/**
 * Campaign Keeper - Content Errors Implementation
 * 
 * SPDX-License-Identifier: GPL-3.0-or-later
 */

#include "ContentError.hpp"

namespace keeper {

const char* contentErrorKindToString(ContentErrorKind kind) {
    switch (kind) {
        case ContentErrorKind::None:        return "none";
        case ContentErrorKind::NotFound:    return "not-found";
        case ContentErrorKind::Validation:  return "validation";
        case ContentErrorKind::IO:          return "io";
        case ContentErrorKind::Parse:       return "parse";
    }
    return "unknown";
}

} // namespace keeper
