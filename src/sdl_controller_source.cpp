#include "sdl_controller_source.h"
#include "button_mapper.h"

#include <iostream>

namespace
{
struct ButtonBinding
{
    SDL_GameControllerButton sdlButton;
    int standardIndex;
};

const ButtonBinding BUTTON_BINDINGS[] = {
    {SDL_CONTROLLER_BUTTON_A, STANDARD_BUTTON_A},
    {SDL_CONTROLLER_BUTTON_B, STANDARD_BUTTON_B},
    {SDL_CONTROLLER_BUTTON_X, STANDARD_BUTTON_X},
    {SDL_CONTROLLER_BUTTON_Y, STANDARD_BUTTON_Y},
    {SDL_CONTROLLER_BUTTON_LEFTSHOULDER, STANDARD_BUTTON_LB},
    {SDL_CONTROLLER_BUTTON_RIGHTSHOULDER, STANDARD_BUTTON_RB},
    {SDL_CONTROLLER_BUTTON_BACK, STANDARD_BUTTON_SELECT},
    {SDL_CONTROLLER_BUTTON_START, STANDARD_BUTTON_START},
    {SDL_CONTROLLER_BUTTON_LEFTSTICK, STANDARD_BUTTON_LEFT_STICK},
    {SDL_CONTROLLER_BUTTON_RIGHTSTICK, STANDARD_BUTTON_RIGHT_STICK},
    {SDL_CONTROLLER_BUTTON_DPAD_UP, STANDARD_BUTTON_DPAD_UP},
    {SDL_CONTROLLER_BUTTON_DPAD_DOWN, STANDARD_BUTTON_DPAD_DOWN},
    {SDL_CONTROLLER_BUTTON_DPAD_LEFT, STANDARD_BUTTON_DPAD_LEFT},
    {SDL_CONTROLLER_BUTTON_DPAD_RIGHT, STANDARD_BUTTON_DPAD_RIGHT},
};

float normalizeAxis(Sint16 value)
{
    float normalized = static_cast<float>(value) / 32767.0f;
    return normalized < -1.0f ? -1.0f : normalized;
}
} // namespace

SdlControllerSource::~SdlControllerSource()
{
    close();
}

void SdlControllerSource::openFirstAvailable()
{
    for (int i = 0; i < SDL_NumJoysticks(); ++i)
    {
        if (SDL_IsGameController(i) && open(i))
        {
            break;
        }
    }
}

bool SdlControllerSource::open(int deviceIndex)
{
    m_gameController = SDL_GameControllerOpen(deviceIndex);
    if (!m_gameController)
    {
        std::cerr << "[SdlControllerSource] Could not open game controller: " << SDL_GetError() << std::endl;
        return false;
    }

    m_gameControllerInstanceID = SDL_JoystickGetDeviceInstanceID(deviceIndex);
    std::cout << "[SdlControllerSource] Opened game controller: " << name() << std::endl;
    return true;
}

void SdlControllerSource::close()
{
    if (m_gameController)
    {
        SDL_GameControllerClose(m_gameController);
        m_gameController = nullptr;
        m_gameControllerInstanceID = -1;
        std::cout << "[SdlControllerSource] Closed game controller." << std::endl;
    }
}

bool SdlControllerSource::handleEvent(const SDL_Event& event)
{
    switch (event.type)
    {
    case SDL_CONTROLLERDEVICEADDED:
        if (m_gameController == nullptr)
        {
            open(event.cdevice.which);
        }
        return true;

    case SDL_CONTROLLERDEVICEREMOVED:
        if (m_gameController != nullptr && event.cdevice.which == m_gameControllerInstanceID)
        {
            close();
            // Fall back to any other controller still attached
            openFirstAvailable();
        }
        return true;

    default:
        return false;
    }
}

bool SdlControllerSource::sample(RawControllerState& state)
{
    if (!m_gameController || !SDL_GameControllerGetAttached(m_gameController))
    {
        return false;
    }

    state.axes.assign(4, 0.0f);
    state.axes[STANDARD_AXIS_LEFT_X] = normalizeAxis(SDL_GameControllerGetAxis(m_gameController, SDL_CONTROLLER_AXIS_LEFTX));
    state.axes[STANDARD_AXIS_LEFT_Y] = normalizeAxis(SDL_GameControllerGetAxis(m_gameController, SDL_CONTROLLER_AXIS_LEFTY));
    state.axes[STANDARD_AXIS_RIGHT_X] = normalizeAxis(SDL_GameControllerGetAxis(m_gameController, SDL_CONTROLLER_AXIS_RIGHTX));
    state.axes[STANDARD_AXIS_RIGHT_Y] = normalizeAxis(SDL_GameControllerGetAxis(m_gameController, SDL_CONTROLLER_AXIS_RIGHTY));

    state.buttons.assign(STANDARD_BUTTON_COUNT, false);
    for (const ButtonBinding& binding : BUTTON_BINDINGS)
    {
        state.buttons[static_cast<size_t>(binding.standardIndex)] =
            SDL_GameControllerGetButton(m_gameController, binding.sdlButton) != 0;
    }

    state.buttonValues.assign(STANDARD_BUTTON_COUNT, 0.0f);
    state.buttonValues[STANDARD_BUTTON_LT] =
        normalizeAxis(SDL_GameControllerGetAxis(m_gameController, SDL_CONTROLLER_AXIS_TRIGGERLEFT));
    state.buttonValues[STANDARD_BUTTON_RT] =
        normalizeAxis(SDL_GameControllerGetAxis(m_gameController, SDL_CONTROLLER_AXIS_TRIGGERRIGHT));

    return true;
}

std::string SdlControllerSource::name() const
{
    if (!m_gameController)
    {
        return "controller";
    }
    const char* controllerName = SDL_GameControllerName(m_gameController);
    return controllerName ? controllerName : "controller";
}

KeyPress translateKeyEvent(const SDL_Event& event)
{
    KeyPress key;

    if (event.type == SDL_TEXTINPUT)
    {
        std::string text = event.text.text;
        // Space arrives as SDL_KEYDOWN too
        if (!text.empty() && text != " ")
        {
            key.code = KeyCode::Character;
            key.text = text;
        }
        return key;
    }

    if (event.type != SDL_KEYDOWN || event.key.repeat != 0)
    {
        return key;
    }

    switch (event.key.keysym.sym)
    {
    case SDLK_UP:
        key.code = KeyCode::Up;
        break;
    case SDLK_DOWN:
        key.code = KeyCode::Down;
        break;
    case SDLK_LEFT:
        key.code = KeyCode::Left;
        break;
    case SDLK_RIGHT:
        key.code = KeyCode::Right;
        break;
    case SDLK_RETURN:
    case SDLK_KP_ENTER:
        key.code = KeyCode::Enter;
        break;
    case SDLK_SPACE:
        key.code = KeyCode::Space;
        break;
    case SDLK_ESCAPE:
        key.code = KeyCode::Escape;
        break;
    case SDLK_BACKSPACE:
        key.code = KeyCode::Backspace;
        break;
    case SDLK_TAB:
        key.code = KeyCode::Tab;
        break;
    default:
        break;
    }

    return key;
}
