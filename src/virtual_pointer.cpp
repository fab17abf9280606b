#include "virtual_pointer.h"
#include "feedback.h"
#include "frame_scheduler.h"
#include "injection_scripts.h"

#include <algorithm>
#include <cmath>
#include <exception>
#include <iostream>

VirtualPointer::VirtualPointer(CursorState& state, ContentHost& host)
    : m_state(state), m_host(host), m_pending(std::make_shared<int>(0))
{
}

float VirtualPointer::speedUnits(PointerSpeed speed)
{
    switch (speed)
    {
    case PointerSpeed::Slow:
        return 8.0f;
    case PointerSpeed::Fast:
        return 25.0f;
    case PointerSpeed::Normal:
    default:
        return 15.0f;
    }
}

const char* VirtualPointer::speedName(PointerSpeed speed)
{
    switch (speed)
    {
    case PointerSpeed::Slow:
        return "Slow";
    case PointerSpeed::Fast:
        return "Fast";
    case PointerSpeed::Normal:
    default:
        return "Normal";
    }
}

void VirtualPointer::enable()
{
    std::optional<Rect> container = m_host.containerBounds();
    if (container)
    {
        m_state.boundingContainer = *container;
    }
    else
    {
        m_state.boundingContainer = m_host.viewport();
        std::cout << "[VirtualPointer] No content container, centering on viewport" << std::endl;
    }

    Point center = m_state.boundingContainer.center();
    m_state.x = center.x;
    m_state.y = center.y;
    m_state.enabled = true;
    m_state.clicking = false;

    std::cout << "[VirtualPointer] Enabled at (" << m_state.x << ", " << m_state.y << ")" << std::endl;

    if (m_feedback)
    {
        m_feedback->showToast("Right stick: Move cursor | RT: Click | Left stick: Scroll | B: Back");
    }
}

void VirtualPointer::disable()
{
    if (!m_state.enabled)
    {
        return;
    }
    m_state.enabled = false;
    m_state.clicking = false;
    std::cout << "[VirtualPointer] Disabled" << std::endl;
}

void VirtualPointer::move(float dx, float dy)
{
    if (!m_state.enabled)
    {
        return;
    }

    refreshContainer();
    m_state.x += dx;
    m_state.y += dy;
    clampToContainer();
}

void VirtualPointer::moveByStick(const StickVector& stick)
{
    if (stick.isZero())
    {
        return;
    }
    float units = speedUnits(m_state.speedTier);
    move(stick.x * units, stick.y * units);
}

bool VirtualPointer::click(bool rightClick)
{
    if (!m_state.enabled || !m_host.current())
    {
        return false;
    }

    refreshContainer();
    const Rect& container = m_state.boundingContainer;
    int x = static_cast<int>(std::lround(m_state.x - container.left));
    int y = static_cast<int>(std::lround(m_state.y - container.top));

    m_state.clicking = true;
    if (m_scheduler)
    {
        CursorState* state = &m_state;
        m_scheduler->defer(CLICK_INDICATOR_MS, [state]() { state->clicking = false; });
    }

    if (rightClick)
    {
        return inject("Right-click", injection::buildContextMenuScript(x, y));
    }
    return inject("Click", injection::buildClickScript(x, y));
}

bool VirtualPointer::scroll(float amountY, float amountX)
{
    if (!m_state.enabled || !m_host.current())
    {
        return false;
    }

    int dx = static_cast<int>(std::lround(amountX));
    int dy = static_cast<int>(std::lround(amountY));
    if (dx == 0 && dy == 0)
    {
        return false;
    }
    return inject("Scroll", injection::buildScrollScript(dx, dy));
}

bool VirtualPointer::sendText(const std::string& text, bool submit)
{
    if (!m_host.current())
    {
        std::cerr << "[VirtualPointer] Text entry dropped, no content surface" << std::endl;
        return false;
    }
    return inject("Text entry", injection::buildTextEntryScript(text, submit));
}

void VirtualPointer::cycleSpeed()
{
    switch (m_state.speedTier)
    {
    case PointerSpeed::Slow:
        m_state.speedTier = PointerSpeed::Normal;
        break;
    case PointerSpeed::Normal:
        m_state.speedTier = PointerSpeed::Fast;
        break;
    case PointerSpeed::Fast:
        m_state.speedTier = PointerSpeed::Slow;
        break;
    }

    std::string message = std::string("Cursor speed: ") + speedName(m_state.speedTier);
    std::cout << "[VirtualPointer] " << message << std::endl;
    if (m_feedback)
    {
        m_feedback->showToast(message);
    }
}

void VirtualPointer::refreshContainer()
{
    std::optional<Rect> container = m_host.containerBounds();
    if (container)
    {
        m_state.boundingContainer = *container;
    }
}

void VirtualPointer::clampToContainer()
{
    const Rect& c = m_state.boundingContainer;
    m_state.x = std::max(c.left, std::min(c.right() - m_margin, m_state.x));
    m_state.y = std::max(c.top, std::min(c.bottom() - m_margin, m_state.y));
}

bool VirtualPointer::inject(const std::string& what, const std::string& script)
{
    ContentSurface* surface = m_host.current();
    if (!surface)
    {
        return false;
    }

    if (!surface->isReady())
    {
        std::cerr << "[VirtualPointer] " << what << " skipped, surface not ready" << std::endl;
        return false;
    }

    std::shared_ptr<int> pending = m_pending;
    ++*pending;

    try
    {
        surface->executeScript(script,
                               [pending, what](bool ok, const std::string& error)
                               {
                                   --*pending;
                                   if (!ok)
                                   {
                                       std::cerr << "[VirtualPointer] " << what << " injection error: " << error
                                                 << std::endl;
                                   }
                               });
    }
    catch (const std::exception& e)
    {
        --*pending;
        std::cerr << "[VirtualPointer] " << what << " injection failed: " << e.what() << std::endl;
        return false;
    }

    return true;
}
