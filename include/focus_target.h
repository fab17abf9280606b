#ifndef FOCUS_TARGET_H
#define FOCUS_TARGET_H

#include "geometry.h"

#include <string>
#include <vector>

/**
 * @brief A navigable UI element
 *
 * Targets are owned by the UI tree. Navigation code only keeps non-owning
 * pointers and re-reads the bounding box every time it needs geometry, since
 * layout may change between navigations.
 */
class FocusTarget
{
public:
    virtual ~FocusTarget() = default;

    /**
     * @brief Current bounding box in screen coordinates
     */
    virtual Rect boundingBox() const = 0;

    /**
     * @brief Perform the element's action (the equivalent of a click)
     */
    virtual void activate() = 0;

    /**
     * @brief Toggle the visual focus mark
     */
    virtual void markFocused(bool focused) = 0;

    /**
     * @brief Ask the owning container to bring the element into view
     */
    virtual void scrollIntoView()
    {
    }
};

/**
 * @brief Regions of the UI tree that can be queried for focusable elements
 */
enum class FocusScope
{
    Keyboard, // Modal on-screen keyboard overlay
    Sidebar,  // Always-visible navigation column
    Section,  // Content of the active section
    Header    // Always-visible header bar
};

/**
 * @brief Query interface onto the host UI tree
 */
class UiTree
{
public:
    virtual ~UiTree() = default;

    /**
     * @brief All elements opted into focusability inside a scope, in document order
     * @param scope Region to query
     * @param sectionId Active section, only meaningful for FocusScope::Section
     */
    virtual std::vector<FocusTarget*> queryFocusable(FocusScope scope, const std::string& sectionId) = 0;

    /**
     * @brief Show the given section and mark its navigation item active
     */
    virtual void activateSection(const std::string& sectionId)
    {
        (void)sectionId;
    }

    virtual void setSidebarHidden(bool hidden)
    {
        (void)hidden;
    }

    /**
     * @brief Sidebar navigation item that leads to a section, if any
     */
    virtual FocusTarget* navigationItem(const std::string& sectionId)
    {
        (void)sectionId;
        return nullptr;
    }
};

#endif // FOCUS_TARGET_H
