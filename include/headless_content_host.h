#ifndef HEADLESS_CONTENT_HOST_H
#define HEADLESS_CONTENT_HOST_H

#include "content_surface.h"
#include "frame_scheduler.h"

#include <deque>
#include <functional>
#include <memory>
#include <string>
#include <utility>
#include <vector>

/**
 * @brief Content surface without a page engine
 *
 * Keeps per-surface navigation history and a simulated page: a scroll offset
 * and one search field at the top. Becomes ready one tick after a load;
 * scripts complete on the next tick.
 */
class HeadlessSurface : public ContentSurface
{
public:
    static constexpr float PAGE_HEIGHT = 3000.0f;
    static constexpr float FIELD_INSET = 40.0f;
    static constexpr float FIELD_HEIGHT = 48.0f;

    HeadlessSurface() = default;
    ~HeadlessSurface() override;

    bool isReady() const override
    {
        return m_ready;
    }

    bool canGoBack() const override;
    void goBack() override;
    bool canGoForward() const override;
    void goForward() override;

    std::string currentUrl() const override;

    void executeScript(const std::string& script, ScriptCompletion completion) override;

    /**
     * @brief Load a URL, dropping any forward history
     */
    void load(const std::string& url);

    /**
     * @brief Become ready and run queued scripts
     */
    void tick();

    /**
     * @brief Search field bounds relative to the surface origin, after scrolling
     */
    Rect fieldBounds(float surfaceWidth) const;

    float getScrollY() const
    {
        return m_scrollY;
    }
    const std::string& getFieldText() const
    {
        return m_fieldText;
    }

    void setSurfaceWidth(float width)
    {
        m_surfaceWidth = width;
    }
    void setInputFocusedCallback(std::function<void()> callback)
    {
        m_inputFocusedCallback = std::move(callback);
    }

private:
    struct PendingScript
    {
        std::string script;
        ScriptCompletion completion;
    };

    std::vector<std::string> m_history;
    int m_historyIndex = -1;
    bool m_ready = false;
    float m_scrollY = 0.0f;
    float m_surfaceWidth = 0.0f;
    std::string m_fieldText;
    std::deque<PendingScript> m_pending;
    std::function<void()> m_inputFocusedCallback;

    void navigated();
    bool evaluate(const std::string& script, std::string& error);
};

class HeadlessContentHost : public ContentHost
{
public:
    explicit HeadlessContentHost(Scheduler& scheduler);
    ~HeadlessContentHost() override = default;

    ContentSurface* open(const std::string& url) override;
    void destroy() override;
    ContentSurface* current() override;
    void setVisible(bool visible) override;
    std::optional<Rect> containerBounds() const override;
    Rect viewport() const override;
    void setInputFocusedCallback(std::function<void()> callback) override;

    /**
     * @brief Called by the scene whenever its layout changes
     */
    void setLayout(const Rect& container, const Rect& viewport);

    bool isVisible() const
    {
        return m_visible;
    }
    HeadlessSurface* surface() const
    {
        return m_surface.get();
    }

private:
    std::unique_ptr<HeadlessSurface> m_surface;
    std::function<void()> m_inputFocusedCallback;
    Rect m_container;
    Rect m_viewport;
    bool m_hasLayout = false;
    bool m_visible = false;
};

#endif // HEADLESS_CONTENT_HOST_H
