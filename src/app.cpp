#include "app.h"

#include <iostream>
#include <stdexcept>

// --- App Class ---

App::App(const std::string& initialTarget, SDL_Window* window, SDL_Renderer* renderer)
    : m_running(true), m_initialTarget(initialTarget)
{
    m_config = m_configManager.loadConfig();

    m_renderer = std::make_unique<Renderer>(window, renderer);
    m_textRenderer = std::make_unique<TextRenderer>(renderer, m_config.fontPath, m_config.fontSize);

    m_feedback = std::make_unique<SdlFeedback>(m_scheduler);
    m_feedback->setSoundEnabled(m_config.navSoundEnabled);

    m_contentHost = std::make_unique<HeadlessContentHost>(m_scheduler);
    m_scene = std::make_unique<UiScene>(*m_renderer, *m_textRenderer);
    m_coordinator = std::make_unique<ModeCoordinator>(m_context, *m_scene, *m_contentHost, *m_feedback);
    m_coordinator->applyConfig(m_config);

    SceneActions actions;
    actions.toggleSounds = [this]()
    {
        m_config.navSoundEnabled = !m_config.navSoundEnabled;
        m_feedback->setSoundEnabled(m_config.navSoundEnabled);
        m_feedback->showToast(m_config.navSoundEnabled ? "Navigation sounds on" : "Navigation sounds off");
        saveSettings();
    };
    actions.soundsEnabled = [this]() { return m_feedback->isSoundEnabled(); };
    actions.toggleFullscreen = [this]()
    {
        m_renderer->toggleFullscreen();
        updateLayout();
    };
    m_scene->build(*m_coordinator, actions);
    if (!m_scene->initialize(window, renderer, m_config.fontPath, m_config.fontSize))
    {
        throw std::runtime_error("Failed to initialize the Nuklear GUI");
    }

    // History widgets are rebuilt on the next tick, never while one of them is running its action
    m_coordinator->setNavigateCallback(
        [this](const std::string& url) { m_scheduler.defer(0, [this, url]() { m_scene->addHistoryEntry(url); }); });
    m_coordinator->setExitCallback([this]() { m_running = false; });

    m_inputManager = std::make_unique<InputManager>(m_config.deadzones);
    m_controllerSource.openFirstAvailable();
    m_coordinator->bindInput(m_scheduler, m_controllerSource, *m_inputManager);

    updateLayout();
    m_coordinator->start();

    if (!m_initialTarget.empty() && !m_coordinator->navigateTo(m_initialTarget))
    {
        std::cerr << "Warning: Could not open initial target: " << m_initialTarget << std::endl;
    }

    SDL_StartTextInput();
    printAppState();
}

App::~App()
{
    SDL_StopTextInput();
    saveSettings();
    m_controllerSource.close();
}

void App::run()
{
    SDL_Event event;
    while (m_running)
    {
        m_scene->newFrame();
        while (SDL_PollEvent(&event) != 0)
        {
            handleEvent(event);
        }

        // Due timers, then tick callbacks in registration order: content surface before the input sampler
        m_scheduler.tick(SDL_GetTicks());

        updateLayout();
        m_scene->render(m_context, *m_feedback, *m_contentHost);

        if (Widget* clicked = m_scene->takeClickedWidget())
        {
            activateClicked(clicked);
        }
    }
}

void App::handleEvent(const SDL_Event& event)
{
    if (m_controllerSource.handleEvent(event))
    {
        return;
    }
    m_scene->handleEvent(event);

    switch (event.type)
    {
    case SDL_QUIT:
        m_running = false;
        break;

    case SDL_KEYDOWN:
    case SDL_TEXTINPUT:
    {
        KeyPress key = translateKeyEvent(event);
        if (key.code != KeyCode::None)
        {
            m_coordinator->handleKey(key);
        }
        break;
    }

    case SDL_MOUSEMOTION:
        if (Widget* widget = m_scene->hitTest(static_cast<float>(event.motion.x), static_cast<float>(event.motion.y),
                                              m_context))
        {
            m_coordinator->hoverTarget(widget);
        }
        break;

    case SDL_MOUSEBUTTONDOWN:
        handleMouseButton(event.button);
        break;

    case SDL_MOUSEWHEEL:
        if (m_coordinator->isContentActive())
        {
            m_coordinator->getPointer().scroll(-event.wheel.y * m_config.scrollStep * 3.0f,
                                               event.wheel.x * m_config.scrollStep * 3.0f);
        }
        else
        {
            m_scene->scrollActiveSection(-event.wheel.y * 40.0f);
        }
        break;

    case SDL_WINDOWEVENT:
        if (event.window.event == SDL_WINDOWEVENT_RESIZED || event.window.event == SDL_WINDOWEVENT_SIZE_CHANGED)
        {
            updateLayout();
        }
        break;

    default:
        break;
    }
}

void App::handleMouseButton(const SDL_MouseButtonEvent& button)
{
    const float x = static_cast<float>(button.x);
    const float y = static_cast<float>(button.y);

    // Widget buttons report their own clicks through the GUI
    if (Widget* widget = m_scene->hitTest(x, y, m_context))
    {
        m_coordinator->hoverTarget(widget);
        return;
    }

    // Clicks over the content surface go through the virtual pointer
    std::optional<Rect> container = m_contentHost->containerBounds();
    if (m_coordinator->isContentActive() && container && container->contains(x, y))
    {
        VirtualPointer& pointer = m_coordinator->getPointer();
        pointer.move(x - m_context.cursor.x, y - m_context.cursor.y);
        pointer.click(button.button == SDL_BUTTON_RIGHT);
    }
}

void App::activateClicked(Widget* widget)
{
    m_coordinator->hoverTarget(widget);
    widget->activate();
    m_feedback->playSelectSound();
}

void App::updateLayout()
{
    m_scene->layout(m_renderer->getWindowWidth(), m_renderer->getWindowHeight(), *m_contentHost);
}

void App::saveSettings()
{
    m_config.cursorSpeed = m_context.cursor.speedTier;
    if (!m_configManager.saveConfig(m_config))
    {
        std::cerr << "Warning: Failed to save settings" << std::endl;
    }
}

void App::printAppState()
{
    std::cout << "--- App State ---" << std::endl;
    std::cout << "Window: " << m_renderer->getWindowWidth() << "x" << m_renderer->getWindowHeight() << std::endl;
    std::cout << "Controller: " << m_controllerSource.name() << std::endl;
    std::cout << "Button layout: " << m_inputManager->getButtonMapper().getPlatformName() << std::endl;
    std::cout << "Section: " << m_context.currentSection << std::endl;
    std::cout << "Cursor speed: " << VirtualPointer::speedName(m_context.cursor.speedTier) << std::endl;
    std::cout << "Config: " << getDefaultConfigPath().string() << std::endl;
    std::cout << "-----------------" << std::endl;
    m_coordinator->getFocusRegistry().printNavigationState();
}
