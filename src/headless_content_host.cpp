#include "headless_content_host.h"

#include <algorithm>
#include <iostream>
#include <regex>
#include <stdexcept>
#include <utility>

// --- HeadlessSurface ---

HeadlessSurface::~HeadlessSurface()
{
    // Scripts still queued never ran
    for (PendingScript& pending : m_pending)
    {
        if (pending.completion)
        {
            pending.completion(false, "surface destroyed");
        }
    }
}

bool HeadlessSurface::canGoBack() const
{
    return m_historyIndex > 0;
}

void HeadlessSurface::goBack()
{
    if (!canGoBack())
    {
        return;
    }
    --m_historyIndex;
    navigated();
}

bool HeadlessSurface::canGoForward() const
{
    return m_historyIndex >= 0 && m_historyIndex + 1 < static_cast<int>(m_history.size());
}

void HeadlessSurface::goForward()
{
    if (!canGoForward())
    {
        return;
    }
    ++m_historyIndex;
    navigated();
}

std::string HeadlessSurface::currentUrl() const
{
    if (m_historyIndex < 0)
    {
        return "";
    }
    return m_history[static_cast<size_t>(m_historyIndex)];
}

void HeadlessSurface::load(const std::string& url)
{
    m_history.resize(static_cast<size_t>(m_historyIndex + 1));
    m_history.push_back(url);
    m_historyIndex = static_cast<int>(m_history.size()) - 1;
    navigated();
}

void HeadlessSurface::navigated()
{
    m_ready = false;
    m_scrollY = 0.0f;
    m_fieldText.clear();
    std::cout << "[HeadlessContentHost] Loading " << currentUrl() << std::endl;
}

void HeadlessSurface::executeScript(const std::string& script, ScriptCompletion completion)
{
    if (!m_ready)
    {
        throw std::runtime_error("surface is still loading");
    }
    m_pending.push_back(PendingScript{script, std::move(completion)});
}

void HeadlessSurface::tick()
{
    if (!m_ready)
    {
        m_ready = true;
        return;
    }

    // Scripts queued while these run wait for the next tick
    std::deque<PendingScript> batch;
    batch.swap(m_pending);

    for (PendingScript& pending : batch)
    {
        std::string error;
        bool ok = evaluate(pending.script, error);
        if (pending.completion)
        {
            pending.completion(ok, error);
        }
    }
}

Rect HeadlessSurface::fieldBounds(float surfaceWidth) const
{
    return Rect{FIELD_INSET, FIELD_INSET - m_scrollY, std::max(0.0f, surfaceWidth - 2.0f * FIELD_INSET), FIELD_HEIGHT};
}

bool HeadlessSurface::evaluate(const std::string& script, std::string& error)
{
    static const std::regex scrollPattern(R"(window\.scrollBy\((-?\d+), (-?\d+)\))");
    static const std::regex pointPattern(R"(elementFromPoint\((-?\d+), (-?\d+)\))");
    static const std::regex clickPattern(R"(const x = (-?\d+);\s*const y = (-?\d+);)");
    static const std::regex valuePattern(R"re(const value = "((?:[^"\\]|\\.)*)";)re");

    std::smatch match;

    if (std::regex_search(script, match, scrollPattern))
    {
        float dy = std::stof(match[2].str());
        m_scrollY = std::clamp(m_scrollY + dy, 0.0f, PAGE_HEIGHT);
        return true;
    }

    if (std::regex_search(script, match, valuePattern))
    {
        std::string raw = match[1].str();
        m_fieldText.clear();
        for (size_t i = 0; i < raw.size(); ++i)
        {
            if (raw[i] == '\\' && i + 1 < raw.size())
            {
                char next = raw[++i];
                m_fieldText += next == 'n' ? '\n' : next == 't' ? '\t' : next;
            }
            else
            {
                m_fieldText += raw[i];
            }
        }
        std::cout << "[HeadlessContentHost] Field text: " << m_fieldText << std::endl;
        return true;
    }

    if (std::regex_search(script, match, clickPattern))
    {
        float x = std::stof(match[1].str());
        float y = std::stof(match[2].str());
        std::cout << "[HeadlessContentHost] Click at (" << x << ", " << y << ")" << std::endl;
        if (fieldBounds(m_surfaceWidth).contains(x, y) && m_inputFocusedCallback)
        {
            m_inputFocusedCallback();
        }
        return true;
    }

    if (std::regex_search(script, match, pointPattern))
    {
        std::cout << "[HeadlessContentHost] Context menu at (" << match[1] << ", " << match[2] << ")" << std::endl;
        return true;
    }

    error = "unsupported script";
    return false;
}

// --- HeadlessContentHost ---

HeadlessContentHost::HeadlessContentHost(Scheduler& scheduler)
{
    scheduler.onTick(
        [this]()
        {
            if (m_surface)
            {
                m_surface->tick();
            }
        });
}

ContentSurface* HeadlessContentHost::open(const std::string& url)
{
    if (!m_surface)
    {
        m_surface = std::make_unique<HeadlessSurface>();
        m_surface->setSurfaceWidth(m_container.width);
        m_surface->setInputFocusedCallback(m_inputFocusedCallback);
    }
    m_surface->load(url);
    return m_surface.get();
}

void HeadlessContentHost::destroy()
{
    if (m_surface)
    {
        std::cout << "[HeadlessContentHost] Destroying surface" << std::endl;
        m_surface.reset();
    }
    m_visible = false;
}

ContentSurface* HeadlessContentHost::current()
{
    return m_surface.get();
}

void HeadlessContentHost::setVisible(bool visible)
{
    m_visible = visible && m_surface;
}

std::optional<Rect> HeadlessContentHost::containerBounds() const
{
    if (!m_hasLayout || !m_visible)
    {
        return std::nullopt;
    }
    return m_container;
}

Rect HeadlessContentHost::viewport() const
{
    return m_viewport;
}

void HeadlessContentHost::setInputFocusedCallback(std::function<void()> callback)
{
    m_inputFocusedCallback = std::move(callback);
    if (m_surface)
    {
        m_surface->setInputFocusedCallback(m_inputFocusedCallback);
    }
}

void HeadlessContentHost::setLayout(const Rect& container, const Rect& viewport)
{
    m_container = container;
    m_viewport = viewport;
    m_hasLayout = true;
    if (m_surface)
    {
        m_surface->setSurfaceWidth(container.width);
    }
}
