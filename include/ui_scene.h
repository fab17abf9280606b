#ifndef UI_SCENE_H
#define UI_SCENE_H

#include "focus_target.h"
#include "geometry.h"
#include "headless_content_host.h"
#include "renderer.h"
#include "sdl_feedback.h"
#include "session_context.h"
#include "text_renderer.h"

#include <SDL.h>
#include <cstddef>
#include <functional>
#include <map>
#include <memory>
#include <string>
#include <utility>
#include <vector>

class ModeCoordinator;

// Forward declaration for Nuklear context
struct nk_context;

/**
 * @brief Scrollable region shared by the widgets of one section
 */
struct ScrollArea
{
    Rect viewport;
    float offset = 0.0f;
    float contentBottom = 0.0f; // Lowest layout edge, in unscrolled screen coordinates
};

/**
 * @brief A focusable, activatable box in the scene
 */
class Widget : public FocusTarget
{
public:
    using Action = std::function<void()>;
    using LabelSource = std::function<std::string()>;

    Widget(std::string label, Action action);
    ~Widget() override = default;

    /**
     * @brief Layout bounds shifted by the owning scroll area, computed on every call
     */
    Rect boundingBox() const override;
    void activate() override;
    void markFocused(bool focused) override
    {
        m_focused = focused;
    }
    void scrollIntoView() override;

    void setLayout(const Rect& bounds)
    {
        m_layout = bounds;
    }
    const Rect& getLayout() const
    {
        return m_layout;
    }
    void setScrollArea(ScrollArea* area)
    {
        m_scrollArea = area;
    }
    void setLabelSource(LabelSource source)
    {
        m_labelSource = std::move(source);
    }
    std::string getLabel() const;

    bool isFocused() const
    {
        return m_focused;
    }
    void setSelected(bool selected)
    {
        m_selected = selected;
    }
    bool isSelected() const
    {
        return m_selected;
    }

private:
    static constexpr float kScrollPadding = 12.0f;

    std::string m_label;
    LabelSource m_labelSource;
    Action m_action;
    Rect m_layout;
    ScrollArea* m_scrollArea = nullptr;
    bool m_focused = false;
    bool m_selected = false;
};

/**
 * @brief Hooks the scene needs from the application for its settings rows
 */
struct SceneActions
{
    std::function<void()> toggleSounds;
    std::function<bool()> soundsEnabled;
    std::function<void()> toggleFullscreen;
};

/**
 * @brief The overlay's UI tree: sidebar, header, sections and the keyboard overlay
 *
 * Widgets keep their own layout so focus navigation works on retained geometry.
 * Each frame the chrome is drawn as Nuklear windows that place every widget at
 * its layout box; the content page, the virtual cursor and toasts are drawn
 * with the plain SDL renderer around it.
 */
class UiScene : public UiTree
{
public:
    static constexpr int SIDEBAR_WIDTH = 220;
    static constexpr int HEADER_HEIGHT = 60;
    static constexpr int QUICK_ACCESS_COLUMNS = 3;

    UiScene(Renderer& renderer, TextRenderer& textRenderer);
    ~UiScene() override;

    UiScene(const UiScene&) = delete;
    UiScene& operator=(const UiScene&) = delete;

    /**
     * @brief Create the Nuklear SDL context and bake the UI font
     * @return false if Nuklear could not be initialized
     */
    bool initialize(SDL_Window* window, SDL_Renderer* renderer, const std::string& fontPath, int fontSize);
    void cleanup();

    /**
     * @brief Start collecting Nuklear input; call before polling events
     */
    void newFrame();

    /**
     * @brief Forward mouse events to Nuklear
     */
    bool handleEvent(const SDL_Event& event);

    /**
     * @brief Widget whose button was clicked during the last render, if any
     */
    Widget* takeClickedWidget();

    /**
     * @brief Create every widget; actions call into the coordinator
     */
    void build(ModeCoordinator& coordinator, SceneActions actions);

    std::vector<FocusTarget*> queryFocusable(FocusScope scope, const std::string& sectionId) override;
    void activateSection(const std::string& sectionId) override;
    void setSidebarHidden(bool hidden) override;
    FocusTarget* navigationItem(const std::string& sectionId) override;

    /**
     * @brief Recompute layout for the window size and publish the content container
     */
    void layout(int width, int height, HeadlessContentHost& host);

    void render(const SessionContext& context, const SdlFeedback& feedback, const HeadlessContentHost& host);

    /**
     * @brief Topmost interactive widget under the mouse, or nullptr
     */
    Widget* hitTest(float x, float y, const SessionContext& context) const;

    void scrollActiveSection(float dy);

    /**
     * @brief Record a visited URL in the history section (newest first)
     */
    void addHistoryEntry(const std::string& url);

private:
    struct Section
    {
        std::string title;
        std::vector<std::unique_ptr<Widget>> widgets;
        ScrollArea scroll;
    };

    static constexpr size_t MAX_HISTORY_ENTRIES = 20;

    Renderer& m_renderer;
    TextRenderer& m_textRenderer;
    ModeCoordinator* m_coordinator = nullptr;

    nk_context* m_ctx = nullptr;
    bool m_initialized = false;
    bool m_backgroundPushed = false;
    Widget* m_clicked = nullptr;

    std::vector<std::unique_ptr<Widget>> m_navItems;
    std::vector<std::string> m_navSections;
    std::unique_ptr<Widget> m_exitButton;
    std::map<std::string, Section> m_sections;
    std::vector<std::unique_ptr<Widget>> m_keys;
    std::vector<std::string> m_history;

    std::string m_activeSection = section::HOME;
    bool m_sidebarHidden = false;
    int m_width = 0;
    int m_height = 0;
    Rect m_contentArea;
    Rect m_keyboardPanel;

    void buildNavigation();
    void buildHome();
    void buildBookmarks();
    void buildHistory();
    void buildSettings(SceneActions actions);
    void buildKeyboard();

    void layoutSidebar();
    void layoutSections();
    void layoutList(Section& section);
    void layoutKeyboard();

    void setupColorScheme();
    bool beginWindow(const char* name, const Rect& bounds, SDL_Color background, bool backmost);
    void endWindow();
    void pushWidget(Widget& widget, const Rect& origin);
    void pushLabel(const std::string& text, const Rect& box, const Rect& origin, SDL_Color color, bool centered);

    void renderSidebar();
    void renderHeader(const SessionContext& context);
    void renderSection(Section& section);
    void renderKeyboard(const SessionContext& context);

    void renderBrowse(const SessionContext& context, const HeadlessContentHost& host);
    void renderCursor(const CursorState& cursor);
    void renderToast(const std::string& message);
};

#endif // UI_SCENE_H
