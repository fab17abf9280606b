#ifndef VIRTUAL_POINTER_H
#define VIRTUAL_POINTER_H

#include "content_surface.h"
#include "input_manager.h"

#include <cstdint>
#include <memory>
#include <string>

class Feedback;
class Scheduler;

enum class PointerSpeed
{
    Slow,
    Normal,
    Fast
};

/**
 * @brief Structure to hold virtual cursor state
 */
struct CursorState
{
    float x = 0.0f;
    float y = 0.0f;
    PointerSpeed speedTier = PointerSpeed::Normal;
    bool enabled = false;
    bool clicking = false; // Click indicator, cleared by a timer
    Rect boundingContainer;
};

/**
 * @brief Synthetic mouse pointer over the active content surface
 *
 * Motion stays host-side; clicks, scrolls and text entry become scripts
 * evaluated inside the surface. Injections are fire-and-forget: failures are
 * logged from the completion and never block later commands.
 */
class VirtualPointer
{
public:
    static constexpr float DEFAULT_MARGIN = 10.0f;
    static constexpr uint32_t CLICK_INDICATOR_MS = 150;

    VirtualPointer(CursorState& state, ContentHost& host);
    ~VirtualPointer() = default;

    void setFeedback(Feedback* feedback)
    {
        m_feedback = feedback;
    }
    void setScheduler(Scheduler* scheduler)
    {
        m_scheduler = scheduler;
    }
    void setMargin(float margin)
    {
        m_margin = margin;
    }
    float getMargin() const
    {
        return m_margin;
    }

    /**
     * @brief Show the cursor at the container center (viewport center as fallback)
     */
    void enable();
    void disable();

    /**
     * @brief Displace the cursor and clamp it to the container minus the margin
     */
    void move(float dx, float dy);

    /**
     * @brief Move by a deadzone-filtered stick vector scaled by the speed tier
     */
    void moveByStick(const StickVector& stick);

    /**
     * @brief Click at the cursor position, in surface-relative coordinates
     * @return false if the pointer is inert or no surface is active
     */
    bool click(bool rightClick = false);

    bool scroll(float amountY, float amountX = 0.0f);

    /**
     * @brief Enter text into the surface's focused input
     */
    bool sendText(const std::string& text, bool submit);

    /**
     * @brief slow -> normal -> fast -> slow, with a toast naming the new tier
     */
    void cycleSpeed();


    /**
     * @brief Injections sent but not yet completed
     */
    int pendingInjections() const
    {
        return *m_pending;
    }

    static float speedUnits(PointerSpeed speed);
    static const char* speedName(PointerSpeed speed);

private:
    CursorState& m_state;
    ContentHost& m_host;
    Feedback* m_feedback = nullptr;
    Scheduler* m_scheduler = nullptr;
    float m_margin = DEFAULT_MARGIN;

    // Shared with completions so a late completion never touches a dead pointer
    std::shared_ptr<int> m_pending;

    void refreshContainer();
    void clampToContainer();
    bool inject(const std::string& what, const std::string& script);
};

#endif // VIRTUAL_POINTER_H
