#include "mode_coordinator.h"

#include <exception>
#include <iostream>

ModeCoordinator::ModeCoordinator(SessionContext& context, UiTree& tree, ContentHost& host, Feedback& feedback)
    : m_context(context), m_tree(tree), m_host(host), m_feedback(feedback),
      m_registry(tree, context.navigation),
      m_keyboard(context.osk, m_registry),
      m_pointer(context.cursor, host)
{
    m_keyboard.setFeedback(&m_feedback);
    m_keyboard.setRestoreFocusCallback([this]() { refreshFocus(); });
    m_keyboard.setSubmitHandler(OskMode::Search, [this](const std::string& term) { navigateTo(term); });
    m_keyboard.setSubmitHandler(OskMode::ContentInput,
                                [this](const std::string& text) { m_pointer.sendText(text, true); });

    m_pointer.setFeedback(&m_feedback);
    m_host.setInputFocusedCallback([this]() { onContentInputFocused(); });

    buildBackPolicies();
}

void ModeCoordinator::buildBackPolicies()
{
    m_backPolicies.clear();

    m_backPolicies.push_back(BackPolicy{
        "close-keyboard",
        [this]() { return m_context.osk.visible; },
        [this]() { m_keyboard.close(); }});

    m_backPolicies.push_back(BackPolicy{
        "content-history",
        [this]()
        {
            ContentSurface* surface = m_host.current();
            return m_context.currentSection == section::BROWSE && surface && surface->canGoBack();
        },
        [this]()
        {
            if (ContentSurface* surface = m_host.current())
            {
                surface->goBack();
            }
        }});

    m_backPolicies.push_back(BackPolicy{
        "return-home",
        [this]() { return m_context.currentSection != section::HOME; },
        [this]() { returnHome(); }});
}

void ModeCoordinator::start()
{
    m_tree.activateSection(m_context.currentSection);
    m_tree.setSidebarHidden(m_context.sidebarHidden);
    refreshFocus();
    std::cout << "[ModeCoordinator] Started in section: " << m_context.currentSection << std::endl;
}

void ModeCoordinator::bindInput(Scheduler& scheduler, InputSource& source, InputManager& input)
{
    m_pointer.setScheduler(&scheduler);

    scheduler.onTick(
        [this, &source, &input]()
        {
            input.setDpadOnlyNavigation(isContentActive());
            InputFrame frame = input.update(source);

            if (input.isConnected() != m_controllerConnected)
            {
                m_controllerConnected = input.isConnected();
                m_feedback.showToast(m_controllerConnected ? "Controller connected" : "Controller disconnected");
            }

            if (frame.connected)
            {
                handleInput(frame);
            }
        });
}

void ModeCoordinator::handleInput(const InputFrame& frame)
{
    if (m_keyboard.isVisible())
    {
        m_keyboard.handleInput(frame);
        return;
    }

    for (LogicalInput input : frame.pressed)
    {
        handleButton(input);

        // The rest of this frame belongs to the keyboard now
        if (m_keyboard.isVisible())
        {
            return;
        }
    }

    if (isContentActive())
    {
        drivePointer(frame);
    }
}

void ModeCoordinator::handleButton(LogicalInput input)
{
    const bool browsing = isContentActive();

    switch (input)
    {
    case LogicalInput::Up:
        moveFocus(Direction::Up);
        break;
    case LogicalInput::Down:
        moveFocus(Direction::Down);
        break;
    case LogicalInput::Left:
        moveFocus(Direction::Left);
        break;
    case LogicalInput::Right:
        moveFocus(Direction::Right);
        break;
    case LogicalInput::A:
        activateFocused();
        break;
    case LogicalInput::B:
        goBack();
        break;
    case LogicalInput::Y:
        m_keyboard.open(OskMode::Search);
        break;
    case LogicalInput::LB:
        if (browsing)
            goBack();
        break;
    case LogicalInput::RB:
        if (browsing)
            goForward();
        break;
    case LogicalInput::Select:
        if (browsing)
            toggleSidebar();
        break;
    case LogicalInput::Start:
        if (browsing)
            toggleSidebar();
        else if (m_context.currentSection != section::SETTINGS)
            switchSection(section::SETTINGS);
        else
            switchSection(section::HOME);
        break;
    case LogicalInput::RT:
        if (browsing)
            m_pointer.click(false);
        break;
    case LogicalInput::LT:
        if (browsing)
            m_pointer.click(true);
        break;
    case LogicalInput::RightStickClick:
        if (browsing)
            m_pointer.cycleSpeed();
        break;
    default:
        break;
    }
}

void ModeCoordinator::drivePointer(const InputFrame& frame)
{
    m_pointer.moveByStick(frame.snapshot.rightStick);

    const StickVector& scroll = frame.snapshot.scroll;
    if (!scroll.isZero())
    {
        m_pointer.scroll(scroll.y * m_scrollStep, scroll.x * m_scrollStep);
    }
}

bool ModeCoordinator::handleKey(const KeyPress& key)
{
    if (m_keyboard.isVisible())
    {
        return m_keyboard.handleKey(key);
    }

    switch (key.code)
    {
    case KeyCode::Up:
        moveFocus(Direction::Up);
        return true;
    case KeyCode::Down:
        moveFocus(Direction::Down);
        return true;
    case KeyCode::Left:
        moveFocus(Direction::Left);
        return true;
    case KeyCode::Right:
        moveFocus(Direction::Right);
        return true;
    case KeyCode::Enter:
    case KeyCode::Space:
        activateFocused();
        return true;
    case KeyCode::Escape:
    case KeyCode::Backspace:
        goBack();
        return true;
    default:
        return false;
    }
}

void ModeCoordinator::moveFocus(Direction direction)
{
    if (m_registry.moveFocus(direction))
    {
        m_feedback.playNavSound();
    }
}

void ModeCoordinator::activateFocused()
{
    if (m_registry.activateFocused())
    {
        m_feedback.playSelectSound();
    }
}

void ModeCoordinator::switchSection(const std::string& sectionId)
{
    std::cout << "[ModeCoordinator] Switching to section: " << sectionId << std::endl;

    if (sectionId != section::BROWSE && m_context.sidebarHidden)
    {
        toggleSidebar();
    }

    // The surface is hidden, not destroyed, when leaving the browse section
    if (sectionId == section::BROWSE && m_host.current())
    {
        m_host.setVisible(true);
        m_pointer.enable();
    }
    else if (sectionId != section::BROWSE)
    {
        m_host.setVisible(false);
        m_pointer.disable();
    }

    m_context.currentSection = sectionId;
    m_tree.activateSection(sectionId);

    refreshFocus();
    m_feedback.playNavSound();
}

bool ModeCoordinator::navigateTo(const std::string& urlOrSearchTerm)
{
    std::string target = url::resolveNavigationTarget(urlOrSearchTerm, m_searchUrlPrefix);
    if (target.empty())
    {
        std::cout << "[ModeCoordinator] Ignoring empty navigation request" << std::endl;
        return false;
    }
    return openContent(target);
}

bool ModeCoordinator::openContent(const std::string& url)
{
    std::cout << "[ModeCoordinator] Navigating to: " << url << std::endl;

    ContentSurface* surface = nullptr;
    try
    {
        surface = m_host.open(url);
    }
    catch (const std::exception& e)
    {
        std::cerr << "[ModeCoordinator] Could not open content surface: " << e.what() << std::endl;
        return false;
    }

    if (!surface)
    {
        std::cerr << "[ModeCoordinator] Content host returned no surface for " << url << std::endl;
        return false;
    }

    if (m_navigateCallback)
    {
        m_navigateCallback(url);
    }

    switchSection(section::BROWSE);
    return true;
}

bool ModeCoordinator::goBack()
{
    for (const BackPolicy& policy : m_backPolicies)
    {
        if (policy.applies())
        {
            std::cout << "[ModeCoordinator] Back: " << policy.name << std::endl;
            policy.run();
            return true;
        }
    }
    return false;
}

bool ModeCoordinator::goForward()
{
    ContentSurface* surface = m_host.current();
    if (m_context.currentSection != section::BROWSE || !surface || !surface->canGoForward())
    {
        return false;
    }
    surface->goForward();
    return true;
}

void ModeCoordinator::returnHome()
{
    m_host.destroy();
    switchSection(section::HOME);

    if (!m_registry.focusTarget(m_tree.navigationItem(section::HOME)))
    {
        std::cout << "[ModeCoordinator] Home navigation item not focusable" << std::endl;
    }
}

void ModeCoordinator::toggleSidebar()
{
    m_context.sidebarHidden = !m_context.sidebarHidden;
    m_tree.setSidebarHidden(m_context.sidebarHidden);
    m_feedback.showToast(m_context.sidebarHidden ? "Fullscreen mode | Press Start to show sidebar" : "Sidebar restored");
    refreshFocus();
}

void ModeCoordinator::requestExit()
{
    std::cout << "[ModeCoordinator] Exit requested" << std::endl;
    if (m_exitCallback)
    {
        m_exitCallback();
    }
}

void ModeCoordinator::onContentInputFocused()
{
    if (!isContentActive())
    {
        std::cout << "[ModeCoordinator] Content input focus ignored, not browsing" << std::endl;
        return;
    }
    m_keyboard.open(OskMode::ContentInput);
}

bool ModeCoordinator::hoverTarget(const FocusTarget* target)
{
    // Hover only moves focus within the current set
    if (m_registry.focusedTarget() == target)
    {
        return false;
    }
    return m_registry.focusTarget(target);
}

void ModeCoordinator::refreshFocus()
{
    if (m_keyboard.isVisible())
    {
        m_registry.rebuild(NavigationMode::Keyboard, "");
        m_registry.focusFirst();
        return;
    }

    const bool chromeOnly = isContentActive();
    m_registry.rebuild(NavigationMode::Main, m_context.currentSection, chromeOnly);
    if (chromeOnly || !m_registry.focusFirstInActiveSection())
    {
        m_registry.focusFirst();
    }
}

void ModeCoordinator::applyConfig(const BigPictureConfig& config)
{
    m_registry.setDirectionTolerance(config.directionTolerance);
    m_pointer.setMargin(config.cursorMargin);
    m_context.cursor.speedTier = config.cursorSpeed;
    m_scrollStep = config.scrollStep;
    m_searchUrlPrefix = config.searchUrlPrefix;
}

bool ModeCoordinator::isContentActive() const
{
    return m_context.currentSection == section::BROWSE && m_context.cursor.enabled && m_host.current() != nullptr;
}
