#ifndef MODE_COORDINATOR_H
#define MODE_COORDINATOR_H

#include "config_manager.h"
#include "content_surface.h"
#include "feedback.h"
#include "focus_registry.h"
#include "frame_scheduler.h"
#include "input_manager.h"
#include "on_screen_keyboard.h"
#include "session_context.h"
#include "virtual_pointer.h"

#include <functional>
#include <string>
#include <utility>
#include <vector>

/**
 * @brief One step of the "back" chain
 */
struct BackPolicy
{
    std::string name;
    std::function<bool()> applies;
    std::function<void()> run;
};

/**
 * @brief Decides which consumer receives input and keeps focus consistent
 *
 * Owns the focus registry, on-screen keyboard and virtual pointer for one
 * session. Input goes to the keyboard while it is visible, otherwise to
 * directional focus, with the virtual pointer also driven while a content
 * surface is active in the browse section.
 */
class ModeCoordinator
{
public:
    using NavigateCallback = std::function<void(const std::string& url)>;
    using ExitCallback = std::function<void()>;

    ModeCoordinator(SessionContext& context, UiTree& tree, ContentHost& host, Feedback& feedback);
    ~ModeCoordinator() = default;

    ModeCoordinator(const ModeCoordinator&) = delete;
    ModeCoordinator& operator=(const ModeCoordinator&) = delete;

    /**
     * @brief Build the initial focus set for the current section
     */
    void start();

    /**
     * @brief Register the per-frame sampler callback
     *
     * Every tick: restrict directions to the d-pad while browsing, sample the
     * source, report connection changes, then route the frame.
     */
    void bindInput(Scheduler& scheduler, InputSource& source, InputManager& input);

    void handleInput(const InputFrame& frame);
    bool handleKey(const KeyPress& key);

    void switchSection(const std::string& sectionId);

    /**
     * @brief Open a URL, or search for anything that does not look like one
     * @return false for a blank term or when the surface could not be opened
     */
    bool navigateTo(const std::string& urlOrSearchTerm);

    bool openContent(const std::string& url);

    /**
     * @brief Run the first applicable back policy
     * @return false when none applied
     */
    bool goBack();
    bool goForward();

    void toggleSidebar();
    void requestExit();

    /**
     * @brief An editable element inside the content surface received focus
     */
    void onContentInputFocused();

    /**
     * @brief Mouse hover over a focusable element
     */
    bool hoverTarget(const FocusTarget* target);

    /**
     * @brief Rebuild the focus set for the current mode and pick initial focus
     */
    void refreshFocus();

    void applyConfig(const BigPictureConfig& config);

    /**
     * @brief True while the pointer drives an active content surface
     */
    bool isContentActive() const;

    const std::vector<BackPolicy>& backPolicies() const
    {
        return m_backPolicies;
    }

    void setNavigateCallback(NavigateCallback callback)
    {
        m_navigateCallback = std::move(callback);
    }
    void setExitCallback(ExitCallback callback)
    {
        m_exitCallback = std::move(callback);
    }

    FocusRegistry& getFocusRegistry()
    {
        return m_registry;
    }
    OnScreenKeyboard& getKeyboard()
    {
        return m_keyboard;
    }
    VirtualPointer& getPointer()
    {
        return m_pointer;
    }
    const SessionContext& getContext() const
    {
        return m_context;
    }

private:
    SessionContext& m_context;
    UiTree& m_tree;
    ContentHost& m_host;
    Feedback& m_feedback;

    FocusRegistry m_registry;
    OnScreenKeyboard m_keyboard;
    VirtualPointer m_pointer;

    std::vector<BackPolicy> m_backPolicies;
    NavigateCallback m_navigateCallback;
    ExitCallback m_exitCallback;

    float m_scrollStep = 20.0f;
    std::string m_searchUrlPrefix = url::DEFAULT_SEARCH_PREFIX;
    bool m_controllerConnected = false;

    void buildBackPolicies();
    void returnHome();
    void moveFocus(Direction direction);
    void activateFocused();
    void handleButton(LogicalInput input);
    void drivePointer(const InputFrame& frame);
};

#endif // MODE_COORDINATOR_H
