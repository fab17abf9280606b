#include "on_screen_keyboard.h"
#include "feedback.h"
#include "focus_registry.h"

#include <iostream>

namespace
{
std::string trim(const std::string& text)
{
    size_t first = text.find_first_not_of(" \t\n\r");
    if (first == std::string::npos)
    {
        return "";
    }
    size_t last = text.find_last_not_of(" \t\n\r");
    return text.substr(first, last - first + 1);
}

std::vector<OskKey> buildLayout()
{
    std::vector<OskKey> keys;

    const char* rows[] = {"1234567890", "qwertyuiop", "asdfghjkl", "zxcvbnm"};
    int row = 0;
    for (const char* chars : rows)
    {
        int column = 0;
        for (const char* c = chars; *c != '\0'; ++c)
        {
            std::string text(1, *c);
            keys.push_back(OskKey{OskKeyKind::Character, text, text, row, column++, false});
        }
        ++row;
    }

    int column = 0;
    for (const char* symbol : {".", "-", "_", "@", "/", ":", ".com"})
    {
        std::string text(symbol);
        keys.push_back(OskKey{OskKeyKind::Character, text, text, row, column++, text == ".com"});
    }
    ++row;

    keys.push_back(OskKey{OskKeyKind::Space, " ", "Space", row, 0, true});
    keys.push_back(OskKey{OskKeyKind::Backspace, "", "Backspace", row, 1, true});
    keys.push_back(OskKey{OskKeyKind::Clear, "", "Clear", row, 2, true});
    keys.push_back(OskKey{OskKeyKind::Submit, "", "Go", row, 3, true});
    keys.push_back(OskKey{OskKeyKind::Close, "", "Close", row, 4, true});

    return keys;
}
} // namespace

OnScreenKeyboard::OnScreenKeyboard(OskState& state, FocusRegistry& registry)
    : m_state(state), m_registry(registry)
{
}

const std::vector<OskKey>& OnScreenKeyboard::layout()
{
    static const std::vector<OskKey> keys = buildLayout();
    return keys;
}

void OnScreenKeyboard::setSubmitHandler(OskMode mode, SubmitHandler handler)
{
    m_submitHandlers[mode] = std::move(handler);
}

void OnScreenKeyboard::open(OskMode mode)
{
    m_state.visible = true;
    m_state.mode = mode;
    m_state.phase = OskPhase::Open;
    m_state.lastOutcome = OskOutcome::None;
    m_state.buffer.clear();

    m_registry.rebuild(NavigationMode::Keyboard, "");
    m_registry.focusFirst();

    std::cout << "[OnScreenKeyboard] Opened: " << getLabel() << std::endl;
}

void OnScreenKeyboard::close()
{
    if (!m_state.visible)
    {
        return;
    }
    finish(OskOutcome::Cancelled);
}

void OnScreenKeyboard::appendText(const std::string& text)
{
    if (!m_state.visible || text.empty())
    {
        return;
    }
    m_state.buffer += text;
    markEdited();
    playNavSound();
}

void OnScreenKeyboard::backspace()
{
    if (!m_state.visible || m_state.buffer.empty())
    {
        return;
    }

    // Drop the whole trailing UTF-8 sequence, not just its last byte
    size_t cut = m_state.buffer.size() - 1;
    while (cut > 0 && (static_cast<unsigned char>(m_state.buffer[cut]) & 0xC0) == 0x80)
    {
        --cut;
    }
    m_state.buffer.erase(cut);

    markEdited();
    playNavSound();
}

void OnScreenKeyboard::clear()
{
    if (!m_state.visible)
    {
        return;
    }
    m_state.buffer.clear();
    markEdited();
    playNavSound();
}

bool OnScreenKeyboard::submit()
{
    if (!m_state.visible)
    {
        return false;
    }

    std::string value = trim(m_state.buffer);
    if (value.empty())
    {
        std::cout << "[OnScreenKeyboard] Nothing to submit" << std::endl;
        return false;
    }

    // Content input keeps the text exactly as typed
    if (m_state.mode == OskMode::ContentInput)
    {
        value = m_state.buffer;
    }

    auto it = m_submitHandlers.find(m_state.mode);
    if (it != m_submitHandlers.end() && it->second)
    {
        it->second(value);
    }
    else
    {
        std::cerr << "[OnScreenKeyboard] No submit handler for " << getLabel() << std::endl;
    }

    finish(OskOutcome::Submitted);
    return true;
}

void OnScreenKeyboard::pressKey(const OskKey& key)
{
    switch (key.kind)
    {
    case OskKeyKind::Character:
    case OskKeyKind::Space:
        appendText(key.text);
        break;
    case OskKeyKind::Backspace:
        backspace();
        break;
    case OskKeyKind::Clear:
        clear();
        break;
    case OskKeyKind::Submit:
        submit();
        break;
    case OskKeyKind::Close:
        close();
        break;
    }
}

bool OnScreenKeyboard::handleInput(const InputFrame& frame)
{
    if (!m_state.visible)
    {
        return false;
    }

    for (LogicalInput input : frame.pressed)
    {
        // Submit or close earlier in this frame ends keyboard handling
        if (!m_state.visible)
        {
            break;
        }

        switch (input)
        {
        case LogicalInput::Up:
            if (m_registry.moveFocus(Direction::Up))
                playNavSound();
            break;
        case LogicalInput::Down:
            if (m_registry.moveFocus(Direction::Down))
                playNavSound();
            break;
        case LogicalInput::Left:
            if (m_registry.moveFocus(Direction::Left))
                playNavSound();
            break;
        case LogicalInput::Right:
            if (m_registry.moveFocus(Direction::Right))
                playNavSound();
            break;
        case LogicalInput::A:
            if (m_registry.activateFocused() && m_feedback)
            {
                m_feedback->playSelectSound();
            }
            break;
        case LogicalInput::B:
            close();
            break;
        case LogicalInput::X:
            backspace();
            break;
        case LogicalInput::Y:
            appendText(" ");
            break;
        case LogicalInput::LB:
            clear();
            break;
        case LogicalInput::RB:
            submit();
            break;
        default:
            break;
        }
    }

    return true;
}

bool OnScreenKeyboard::handleKey(const KeyPress& key)
{
    if (!m_state.visible)
    {
        return false;
    }

    switch (key.code)
    {
    case KeyCode::Escape:
        close();
        return true;
    case KeyCode::Enter:
        submit();
        return true;
    case KeyCode::Backspace:
        backspace();
        return true;
    case KeyCode::Space:
        appendText(" ");
        return true;
    case KeyCode::Character:
        appendText(key.text);
        return true;
    case KeyCode::Up:
        m_registry.moveFocus(Direction::Up);
        return true;
    case KeyCode::Down:
        m_registry.moveFocus(Direction::Down);
        return true;
    case KeyCode::Left:
        m_registry.moveFocus(Direction::Left);
        return true;
    case KeyCode::Right:
        m_registry.moveFocus(Direction::Right);
        return true;
    default:
        break;
    }

    return false;
}

const char* OnScreenKeyboard::getLabel() const
{
    return m_state.mode == OskMode::Search ? "Search or enter URL" : "Type your text";
}

void OnScreenKeyboard::finish(OskOutcome outcome)
{
    m_state.visible = false;
    m_state.phase = OskPhase::Closed;
    m_state.lastOutcome = outcome;

    std::cout << "[OnScreenKeyboard] Closed (" << (outcome == OskOutcome::Submitted ? "submitted" : "cancelled") << ")"
              << std::endl;

    if (m_restoreFocusCallback)
    {
        m_restoreFocusCallback();
    }
}

void OnScreenKeyboard::markEdited()
{
    m_state.phase = OskPhase::Editing;
}

void OnScreenKeyboard::playNavSound()
{
    if (m_feedback)
    {
        m_feedback->playNavSound();
    }
}
