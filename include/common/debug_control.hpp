#pragma once

#include <cstdlib>
#include <cstring>
#include <iostream>

namespace authtree {
namespace debug {

/**
 * Logging switches, read once from the environment:
 *
 *   AUTHTREE_PROFILE=1|true   per-batch timings and table construction times
 *   AUTHTREE_DEBUG=1|true     tree layouts and policy branch choices
 */

inline bool env_flag(const char* name) {
    const char* env = std::getenv(name);
    return env && (strcmp(env, "1") == 0 || strcmp(env, "true") == 0);
}

inline bool is_profile_enabled() {
    static const bool enabled = env_flag("AUTHTREE_PROFILE");
    return enabled;
}

inline bool is_debug_enabled() {
    static const bool enabled = env_flag("AUTHTREE_DEBUG");
    return enabled;
}

} // namespace debug
} // namespace authtree

// Wrap `expr` in parentheses if it contains a top-level comma
#define AUTHTREE_PROFILE_COUT(expr) \
    do { \
        if (authtree::debug::is_profile_enabled()) { \
            std::cout << expr; \
        } \
    } while(0)

#define AUTHTREE_DEBUG_COUT(expr) \
    do { \
        if (authtree::debug::is_debug_enabled()) { \
            std::cout << expr; \
        } \
    } while(0)

// Guards a multi-statement profiling block
#define AUTHTREE_IF_PROFILE if (authtree::debug::is_profile_enabled())
