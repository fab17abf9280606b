#ifndef SESSION_CONTEXT_H
#define SESSION_CONTEXT_H

#include "focus_registry.h"
#include "on_screen_keyboard.h"
#include "virtual_pointer.h"

#include <string>

namespace section
{
constexpr const char* HOME = "home";
constexpr const char* BOOKMARKS = "bookmarks";
constexpr const char* HISTORY = "history";
constexpr const char* SETTINGS = "settings";
constexpr const char* BROWSE = "browse"; // Hosts the content surface
} // namespace section

/**
 * @brief Everything one UI session mutates, handed by reference to each component
 */
struct SessionContext
{
    NavigationState navigation;
    CursorState cursor;
    OskState osk;
    std::string currentSection = section::HOME;
    bool sidebarHidden = false;
};

#endif // SESSION_CONTEXT_H
