#ifndef ON_SCREEN_KEYBOARD_H
#define ON_SCREEN_KEYBOARD_H

#include "input_manager.h"

#include <functional>
#include <map>
#include <string>
#include <utility>
#include <vector>

class Feedback;
class FocusRegistry;

/**
 * @brief What the keyboard is collecting text for
 */
enum class OskMode
{
    Search,      // Search term or URL for the browser
    ContentInput // Text for the focused input inside the content surface
};

enum class OskPhase
{
    Closed,
    Open,   // Visible, buffer untouched since opening
    Editing // Visible, buffer edited at least once
};

enum class OskOutcome
{
    None,
    Submitted,
    Cancelled
};

/**
 * @brief Structure to hold on-screen keyboard state
 */
struct OskState
{
    bool visible = false;
    OskMode mode = OskMode::Search;
    OskPhase phase = OskPhase::Closed;
    OskOutcome lastOutcome = OskOutcome::None;
    std::string buffer;
};

enum class OskKeyKind
{
    Character,
    Space,
    Backspace,
    Clear,
    Submit,
    Close
};

/**
 * @brief One key of the on-screen keyboard layout
 */
struct OskKey
{
    OskKeyKind kind = OskKeyKind::Character;
    std::string text;  // Appended text for Character keys
    std::string label; // Text shown on the key
    int row = 0;
    int column = 0;
    bool wide = false;
};

/**
 * @brief Modal on-screen keyboard controller
 *
 * Closed -> Open -> Editing -> (Submitted | Cancelled) -> Closed. The buffer
 * belongs to this controller only. Opening scopes the focus registry to the
 * keyboard keys; closing hands focus back through the restore-focus callback.
 */
class OnScreenKeyboard
{
public:
    using SubmitHandler = std::function<void(const std::string&)>;

    OnScreenKeyboard(OskState& state, FocusRegistry& registry);
    ~OnScreenKeyboard() = default;

    /**
     * @brief Key layout: four character rows, a symbol row, then the action row
     */
    static const std::vector<OskKey>& layout();

    void setSubmitHandler(OskMode mode, SubmitHandler handler);

    /**
     * @brief Called after the keyboard closes to rebuild Main-mode focus
     */
    void setRestoreFocusCallback(std::function<void()> callback)
    {
        m_restoreFocusCallback = std::move(callback);
    }

    void setFeedback(Feedback* feedback)
    {
        m_feedback = feedback;
    }

    void open(OskMode mode = OskMode::Search);
    void close();

    void appendText(const std::string& text);
    void backspace();
    void clear();

    /**
     * @brief Dispatch the buffer to the mode's handler and close
     * @return false (keyboard stays open) when the trimmed buffer is empty
     */
    bool submit();

    /**
     * @brief Apply a layout key (what activating a key widget does)
     */
    void pressKey(const OskKey& key);

    /**
     * @brief Route controller edges while the keyboard is visible
     * @return true if the frame was consumed
     */
    bool handleInput(const InputFrame& frame);

    /**
     * @brief Mirror physical keyboard input
     * @return true if the key was consumed
     */
    bool handleKey(const KeyPress& key);

    bool isVisible() const
    {
        return m_state.visible;
    }
    const std::string& getBuffer() const
    {
        return m_state.buffer;
    }
    OskMode getMode() const
    {
        return m_state.mode;
    }
    OskPhase getPhase() const
    {
        return m_state.phase;
    }
    const char* getLabel() const;

private:
    OskState& m_state;
    FocusRegistry& m_registry;
    Feedback* m_feedback = nullptr;

    std::map<OskMode, SubmitHandler> m_submitHandlers;
    std::function<void()> m_restoreFocusCallback;

    void finish(OskOutcome outcome);
    void markEdited();
    void playNavSound();
};

#endif // ON_SCREEN_KEYBOARD_H
