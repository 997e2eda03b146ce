/**
 * Campaign Keeper - Id Generator
 * 
 * Slug and random id helpers for entity file names.
 * 
 * SPDX-License-Identifier: GPL-3.0-or-later
 */

#pragma once

#include <cstddef>
#include <string>

namespace keeper {

/**
 * Lowercase slug of arbitrary text ("Captain Vex!" -> "captain-vex")
 */
std::string slugify(const std::string& text);

/**
 * Random id over the URL-safe alphabet A-Za-z0-9_-
 */
std::string generateId(std::size_t length = 12);

/**
 * Entity id of the form <slug>-<6 random characters>
 */
std::string generateEntityId(const std::string& name);

/**
 * Check that an id can be used as a file name inside a module folder
 */
bool isValidEntityId(const std::string& id);

} // namespace keeper
