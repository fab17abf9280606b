#include "focus_registry.h"
#include <algorithm>
#include <iostream>
#include <iterator>
#include <utility>

FocusRegistry::FocusRegistry(UiTree& tree, NavigationState& state)
    : m_tree(tree), m_state(state)
{
}

void FocusRegistry::rebuild(NavigationMode mode, const std::string& sectionId, bool chromeOnly)
{
    std::vector<FocusTarget*> next;
    auto append = [&next](const std::vector<FocusTarget*>& targets)
    {
        for (FocusTarget* target : targets)
        {
            if (target)
            {
                next.push_back(target);
            }
        }
    };

    m_sectionBegin = 0;
    m_sectionEnd = 0;

    if (mode == NavigationMode::Keyboard)
    {
        append(m_tree.queryFocusable(FocusScope::Keyboard, sectionId));
    }
    else
    {
        append(m_tree.queryFocusable(FocusScope::Sidebar, sectionId));
        m_sectionBegin = static_cast<int>(next.size());
        if (!chromeOnly)
        {
            append(m_tree.queryFocusable(FocusScope::Section, sectionId));
        }
        m_sectionEnd = static_cast<int>(next.size());
        append(m_tree.queryFocusable(FocusScope::Header, sectionId));
    }

    // Targets leaving the tree for good are released before they are destroyed
    if (m_marked)
    {
        m_marked->markFocused(false);
    }
    m_marked = nullptr;

    m_state.mode = mode;
    m_state.focusableSet = std::move(next);
    m_state.focusedIndex = -1;

    if (!m_state.focusableSet.empty())
    {
        setFocus(0);
    }

    std::cout << "[FocusRegistry] " << (mode == NavigationMode::Keyboard ? "Keyboard" : "Main")
              << " focusable elements: " << m_state.focusableSet.size() << std::endl;
}

bool FocusRegistry::focusFirst()
{
    return setFocus(0);
}

bool FocusRegistry::focusFirstInActiveSection()
{
    if (m_state.mode != NavigationMode::Main || m_sectionBegin >= m_sectionEnd)
    {
        return false;
    }
    return setFocus(m_sectionBegin);
}

bool FocusRegistry::setFocus(int index)
{
    if (index < 0 || index >= size())
    {
        return false;
    }

    FocusTarget* target = m_state.focusableSet[static_cast<size_t>(index)];

    if (m_marked && m_marked != target)
    {
        m_marked->markFocused(false);
    }

    target->markFocused(true);
    m_marked = target;
    m_state.focusedIndex = index;

    target->scrollIntoView();
    return true;
}

bool FocusRegistry::focusTarget(const FocusTarget* target)
{
    return setFocus(indexOf(target));
}

bool FocusRegistry::moveFocus(Direction direction)
{
    if (empty())
    {
        return false;
    }

    int next = m_resolver.resolve(m_state.focusableSet, m_state.focusedIndex, direction);
    if (next == m_state.focusedIndex)
    {
        return false;
    }

    return setFocus(next);
}

bool FocusRegistry::activateFocused()
{
    FocusTarget* target = focusedTarget();
    if (!target)
    {
        return false;
    }

    target->activate();
    return true;
}

void FocusRegistry::release(const FocusTarget* target)
{
    if (!target)
    {
        return;
    }

    if (m_marked == target)
    {
        m_marked = nullptr;
    }

    int index = indexOf(target);
    if (index < 0)
    {
        return;
    }

    m_state.focusableSet.erase(m_state.focusableSet.begin() + index);
    if (index < m_sectionEnd)
    {
        --m_sectionEnd;
        if (index < m_sectionBegin)
            --m_sectionBegin;
    }

    if (m_state.focusedIndex == index)
    {
        m_state.focusedIndex = -1;
    }
    else if (m_state.focusedIndex > index)
    {
        --m_state.focusedIndex;
    }
}

FocusTarget* FocusRegistry::focusedTarget() const
{
    if (m_state.focusedIndex < 0 || m_state.focusedIndex >= size())
    {
        return nullptr;
    }
    return m_state.focusableSet[static_cast<size_t>(m_state.focusedIndex)];
}

int FocusRegistry::indexOf(const FocusTarget* target) const
{
    if (!target)
    {
        return -1;
    }

    auto it = std::find(m_state.focusableSet.begin(), m_state.focusableSet.end(), target);
    if (it == m_state.focusableSet.end())
    {
        return -1;
    }
    return static_cast<int>(std::distance(m_state.focusableSet.begin(), it));
}

void FocusRegistry::printNavigationState() const
{
    std::cout << "--- Navigation State ---" << std::endl;
    std::cout << "Mode: " << (m_state.mode == NavigationMode::Keyboard ? "Keyboard" : "Main") << std::endl;
    std::cout << "Focusable elements: " << m_state.focusableSet.size() << std::endl;
    std::cout << "Focused index: " << m_state.focusedIndex << std::endl;
    std::cout << "Section range: [" << m_sectionBegin << ", " << m_sectionEnd << ")" << std::endl;
    std::cout << "Direction tolerance: " << m_resolver.getTolerance() << "px" << std::endl;
    std::cout << "------------------------" << std::endl;
}
