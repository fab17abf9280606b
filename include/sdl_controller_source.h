#ifndef SDL_CONTROLLER_SOURCE_H
#define SDL_CONTROLLER_SOURCE_H

#include "input_manager.h"
#include "input_source.h"

#include <SDL.h>
#include <string>

/**
 * @brief InputSource over the first attached SDL game controller
 *
 * Buttons and axes are reported in the standard layout. Triggers are analog
 * axes in SDL, so they arrive as button values and the sampler applies the
 * trigger deadzone.
 */
class SdlControllerSource : public InputSource
{
public:
    SdlControllerSource() = default;
    ~SdlControllerSource() override;

    SdlControllerSource(const SdlControllerSource&) = delete;
    SdlControllerSource& operator=(const SdlControllerSource&) = delete;

    void openFirstAvailable();
    void close();

    /**
     * @brief Track controller hot-plug events
     * @return true if the event was a controller device event
     */
    bool handleEvent(const SDL_Event& event);

    bool sample(RawControllerState& state) override;
    std::string name() const override;

private:
    SDL_GameController* m_gameController{nullptr};
    SDL_JoystickID m_gameControllerInstanceID{-1};

    bool open(int deviceIndex);
};

/**
 * @brief Map an SDL key or text event onto a KeyPress (KeyCode::None if unrelated)
 *
 * Printable characters come from SDL_TEXTINPUT; space, editing and navigation
 * keys from SDL_KEYDOWN.
 */
KeyPress translateKeyEvent(const SDL_Event& event);

#endif // SDL_CONTROLLER_SOURCE_H
