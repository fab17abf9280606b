#ifndef FOCUS_REGISTRY_H
#define FOCUS_REGISTRY_H

#include "focus_target.h"
#include "spatial_resolver.h"

#include <string>
#include <vector>

/**
 * @brief Which part of the UI owns directional navigation
 */
enum class NavigationMode
{
    Main,
    Keyboard
};

/**
 * @brief Structure to hold navigation state
 */
struct NavigationState
{
    NavigationMode mode = NavigationMode::Main;
    int focusedIndex = -1; // -1 when the set is empty
    std::vector<FocusTarget*> focusableSet;
};

/**
 * @brief Maintains the set of navigable targets and the focused one
 *
 * The set is rebuilt from the UI tree on every mode or section change; the
 * only patch is release() for targets being destroyed. At most one target
 * carries the focus mark, and only a member of the current set can carry it.
 */
class FocusRegistry
{
public:
    FocusRegistry(UiTree& tree, NavigationState& state);
    ~FocusRegistry() = default;

    /**
     * @brief Replace the focusable set
     * @param mode Keyboard queries only the keyboard overlay; Main queries
     *        sidebar, active section, then header
     * @param sectionId Active section for Main mode
     * @param chromeOnly Main mode without section content (pointer over a content surface)
     */
    void rebuild(NavigationMode mode, const std::string& sectionId, bool chromeOnly = false);

    bool focusFirst();
    bool focusFirstInActiveSection();

    /**
     * @brief Focus the element at index; out-of-range indices are ignored
     * @return true if focus was applied
     */
    bool setFocus(int index);

    /**
     * @brief Focus a specific element if it is a member of the current set
     */
    bool focusTarget(const FocusTarget* target);

    /**
     * @brief Move focus spatially
     * @return true if the focused element changed
     */
    bool moveFocus(Direction direction);

    /**
     * @brief Activate the focused element
     * @return false when nothing is focused
     */
    bool activateFocused();

    /**
     * @brief Forget a target that is about to be destroyed
     *
     * Drops it from the set without touching it. Focus is lost if it was the
     * focused element.
     */
    void release(const FocusTarget* target);

    FocusTarget* focusedTarget() const;
    int indexOf(const FocusTarget* target) const;

    int size() const
    {
        return static_cast<int>(m_state.focusableSet.size());
    }
    bool empty() const
    {
        return m_state.focusableSet.empty();
    }

    void setDirectionTolerance(float tolerance)
    {
        m_resolver.setTolerance(tolerance);
    }

    void printNavigationState() const;

private:
    UiTree& m_tree;
    NavigationState& m_state;
    SpatialResolver m_resolver;

    FocusTarget* m_marked = nullptr;

    // [m_sectionBegin, m_sectionEnd) holds the active section's elements in Main mode
    int m_sectionBegin = 0;
    int m_sectionEnd = 0;
};

#endif // FOCUS_REGISTRY_H
