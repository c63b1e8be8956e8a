#pragma once

#include <cstddef>

/**
 * @brief Repository layout names and other fixed values
 */
namespace oops {

namespace Constants {
    // Repository layout (relative to the working tree root)
    constexpr const char* REPO_DIR = ".oops";
    constexpr const char* OBJECTS_DIR = "objects";
    constexpr const char* REFS_DIR = "refs";
    constexpr const char* HEAD_REF = "HEAD";
    constexpr const char* BRANCH_FILE = "branch";
    constexpr const char* INDEX_FILE = "index";
    constexpr const char* IGNORE_FILE = ".oopsignore";

    constexpr const char* DEFAULT_BRANCH = "main";

    // Hash algorithm constants
    constexpr size_t SHA1_HEX_LENGTH = 40;

    // Log pagination
    constexpr size_t DEFAULT_PAGE_SIZE = 10;

    // Parent value written for a root commit
    constexpr const char* NO_PARENT = "none";
}
}
