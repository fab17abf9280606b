#ifndef APP_H
#define APP_H

#include "config_manager.h"
#include "frame_scheduler.h"
#include "headless_content_host.h"
#include "input_manager.h"
#include "mode_coordinator.h"
#include "renderer.h"
#include "sdl_controller_source.h"
#include "sdl_feedback.h"
#include "session_context.h"
#include "text_renderer.h"
#include "ui_scene.h"

#include <SDL.h>
#include <memory>
#include <string>

class App
{
public:
    // Window and renderer are created and destroyed by main
    App(const std::string& initialTarget, SDL_Window* window, SDL_Renderer* renderer);
    ~App();

    App(const App&) = delete;
    App& operator=(const App&) = delete;

    void run();

private:
    bool m_running;

    ConfigManager m_configManager;
    BigPictureConfig m_config;
    std::string m_initialTarget;

    FrameScheduler m_scheduler;
    SessionContext m_context;

    std::unique_ptr<Renderer> m_renderer;
    std::unique_ptr<TextRenderer> m_textRenderer;
    std::unique_ptr<SdlFeedback> m_feedback;
    std::unique_ptr<HeadlessContentHost> m_contentHost;
    std::unique_ptr<UiScene> m_scene;
    std::unique_ptr<ModeCoordinator> m_coordinator;
    std::unique_ptr<InputManager> m_inputManager;
    SdlControllerSource m_controllerSource;

    void handleEvent(const SDL_Event& event);
    void handleMouseButton(const SDL_MouseButtonEvent& button);
    void activateClicked(Widget* widget);
    void updateLayout();
    void saveSettings();
    void printAppState();
};

#endif // APP_H
