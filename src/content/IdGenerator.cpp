/**
 * Campaign Keeper - Id Generator Implementation
 * 
 * SPDX-License-Identifier: GPL-3.0-or-later
 */

#include "IdGenerator.hpp"

#include <cctype>
#include <random>

namespace keeper {

namespace {

constexpr const char ID_ALPHABET[] =
    "useandom-26T198340PX75pxJACKVERYMINDBUSHWOLF_GQZbfghjklqvwyzrict";

constexpr std::size_t ENTITY_SUFFIX_LENGTH = 6;

bool isSeparator(char c) {
    return std::isspace(static_cast<unsigned char>(c)) || c == '_' || c == '-';
}

} // anonymous namespace

std::string slugify(const std::string& text) {
    std::string slug;
    slug.reserve(text.size());
    bool pendingSeparator = false;
    
    for (char c : text) {
        auto uc = static_cast<unsigned char>(c);
        if (isSeparator(c)) {
            pendingSeparator = true;
            continue;
        }
        if (!std::isalnum(uc)) {
            // Punctuation is dropped without splitting words
            continue;
        }
        if (pendingSeparator && !slug.empty()) {
            slug += '-';
        }
        pendingSeparator = false;
        slug += static_cast<char>(std::tolower(uc));
    }
    
    return slug;
}

std::string generateId(std::size_t length) {
    thread_local std::mt19937 generator{std::random_device{}()};
    std::uniform_int_distribution<std::size_t> pick(0, sizeof(ID_ALPHABET) - 2);
    
    std::string id;
    id.reserve(length);
    for (std::size_t i = 0; i < length; ++i) {
        id += ID_ALPHABET[pick(generator)];
    }
    return id;
}

std::string generateEntityId(const std::string& name) {
    std::string slug = slugify(name);
    if (slug.empty()) {
        // A bare random id could start with '_' and read as a system record
        slug = "entity";
    }
    return slug + "-" + generateId(ENTITY_SUFFIX_LENGTH);
}

bool isValidEntityId(const std::string& id) {
    if (id.empty() || id == "." || id == "..") {
        return false;
    }
    for (char c : id) {
        if (c == '/' || c == '\\' || c == '\0') {
            return false;
        }
    }
    return true;
}

} // namespace keeper
