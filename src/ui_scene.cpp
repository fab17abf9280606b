#include "ui_scene.h"
#include "mode_coordinator.h"
#include "on_screen_keyboard.h"
#include "virtual_pointer.h"

#include <algorithm>
#include <climits>
#include <cmath>
#include <cstdint>
#include <filesystem>
#include <iostream>
#include <system_error>

#define NK_INCLUDE_FIXED_TYPES
#define NK_INCLUDE_STANDARD_IO
#define NK_INCLUDE_STANDARD_VARARGS
#define NK_INCLUDE_DEFAULT_ALLOCATOR
#define NK_INCLUDE_VERTEX_BUFFER_OUTPUT
#define NK_INCLUDE_DEFAULT_FONT
#define NK_INCLUDE_FONT_BAKING
#define NK_IMPLEMENTATION
#include "nuklear.h"

#define NK_SDL_RENDERER_IMPLEMENTATION
#include "demo/sdl_renderer/nuklear_sdl_renderer.h"

namespace
{
struct QuickAccessSite
{
    const char* name;
    const char* url;
};

const QuickAccessSite QUICK_ACCESS[] = {
    {"YouTube", "https://www.youtube.com"},
    {"Netflix", "https://www.netflix.com"},
    {"Twitch", "https://www.twitch.tv"},
    {"Spotify", "https://open.spotify.com"},
    {"Reddit", "https://www.reddit.com"},
    {"Wikipedia", "https://www.wikipedia.org"},
};

const QuickAccessSite DEFAULT_BOOKMARKS[] = {
    {"DuckDuckGo", "https://duckduckgo.com"},
    {"GitHub", "https://github.com"},
    {"Steam Store", "https://store.steampowered.com"},
    {"Hacker News", "https://news.ycombinator.com"},
};

const SDL_Color TEXT_COLOR = {235, 235, 245, 255};
const SDL_Color MUTED_TEXT_COLOR = {150, 150, 170, 255};
const SDL_Color DARK_TEXT_COLOR = {30, 30, 40, 255};

constexpr int PADDING = 40;
constexpr int ROW_HEIGHT = 56;
constexpr int ROW_GAP = 12;
constexpr int TILE_HEIGHT = 120;
constexpr int TILE_GAP = 24;
constexpr int KEY_SIZE = 52;
constexpr int KEY_GAP = 6;

const SDL_Color SIDEBAR_BACKGROUND = {28, 28, 36, 255};
const SDL_Color HEADER_BACKGROUND = {24, 24, 32, 255};
const SDL_Color SECTION_BACKGROUND = {18, 18, 24, 255};
const SDL_Color KEYBOARD_BACKGROUND = {30, 30, 40, 245};

SDL_Rect toSDLRect(const Rect& rect)
{
    return SDL_Rect{static_cast<int>(std::lround(rect.left)), static_cast<int>(std::lround(rect.top)),
                    static_cast<int>(std::lround(rect.width)), static_cast<int>(std::lround(rect.height))};
}

struct nk_rect toNkRect(const Rect& rect)
{
    return nk_rect(rect.left, rect.top, rect.width, rect.height);
}

struct nk_color toNkColor(SDL_Color color)
{
    return nk_rgba(color.r, color.g, color.b, color.a);
}
} // namespace

// --- Widget ---

Widget::Widget(std::string label, Action action)
    : m_label(std::move(label)), m_action(std::move(action))
{
}

Rect Widget::boundingBox() const
{
    Rect box = m_layout;
    if (m_scrollArea)
    {
        box.top -= m_scrollArea->offset;
    }
    return box;
}

void Widget::activate()
{
    if (m_action)
    {
        m_action();
    }
}

void Widget::scrollIntoView()
{
    if (!m_scrollArea)
    {
        return;
    }

    float clipTop = m_scrollArea->viewport.top;
    float clipBottom = m_scrollArea->viewport.bottom();
    if (clipBottom - clipTop > 2.0f * kScrollPadding)
    {
        clipTop += kScrollPadding;
        clipBottom -= kScrollPadding;
    }

    Rect box = boundingBox();
    float newScroll = m_scrollArea->offset;

    if (box.top < clipTop)
    {
        newScroll = std::max(0.0f, newScroll - (clipTop - box.top));
    }
    else if (box.bottom() > clipBottom)
    {
        newScroll += box.bottom() - clipBottom;
    }

    m_scrollArea->offset = std::max(0.0f, newScroll);
}

std::string Widget::getLabel() const
{
    return m_labelSource ? m_labelSource() : m_label;
}

// --- UiScene ---

UiScene::UiScene(Renderer& renderer, TextRenderer& textRenderer)
    : m_renderer(renderer), m_textRenderer(textRenderer)
{
}

UiScene::~UiScene()
{
    cleanup();
}

bool UiScene::initialize(SDL_Window* window, SDL_Renderer* renderer, const std::string& fontPath, int fontSize)
{
    if (m_initialized)
    {
        return true;
    }

    m_ctx = nk_sdl_init(window, renderer);
    if (!m_ctx)
    {
        std::cerr << "[UiScene] Failed to initialize Nuklear SDL context" << std::endl;
        return false;
    }

    struct nk_font_atlas* atlas = nullptr;
    nk_sdl_font_stash_begin(&atlas);
    struct nk_font* uiFont = nullptr;
    if (atlas)
    {
        std::error_code ec;
        if (!fontPath.empty() && std::filesystem::exists(fontPath, ec) && !ec)
        {
            uiFont = nk_font_atlas_add_from_file(atlas, fontPath.c_str(), static_cast<float>(fontSize), nullptr);
        }
        if (uiFont)
        {
            std::cout << "[UiScene] Loaded UI font: " << fontPath << std::endl;
        }
        else
        {
            uiFont = nk_font_atlas_add_default(atlas, static_cast<float>(fontSize), nullptr);
            std::cout << "[UiScene] Using Nuklear default font" << std::endl;
        }
        if (uiFont)
        {
            atlas->default_font = uiFont;
        }
    }
    nk_sdl_font_stash_end();

    if (uiFont)
    {
        nk_style_set_font(m_ctx, &uiFont->handle);
    }
    else
    {
        std::cerr << "[UiScene] No UI font available; labels may be missing" << std::endl;
    }

    setupColorScheme();

    m_initialized = true;
    std::cout << "[UiScene] Nuklear GUI initialized" << std::endl;
    return true;
}

void UiScene::cleanup()
{
    if (!m_initialized)
    {
        return;
    }

    nk_sdl_shutdown();
    m_ctx = nullptr;
    m_clicked = nullptr;
    m_initialized = false;
}

void UiScene::setupColorScheme()
{
    struct nk_color table[NK_COLOR_COUNT];
    for (struct nk_color& color : table)
    {
        color = nk_rgba(60, 60, 65, 246);
    }

    table[NK_COLOR_TEXT] = toNkColor(TEXT_COLOR);
    table[NK_COLOR_WINDOW] = toNkColor(SECTION_BACKGROUND);
    table[NK_COLOR_HEADER] = toNkColor(HEADER_BACKGROUND);
    table[NK_COLOR_BORDER] = nk_rgb(65, 65, 70);
    table[NK_COLOR_BUTTON] = nk_rgb(44, 44, 56);
    table[NK_COLOR_BUTTON_HOVER] = nk_rgb(56, 56, 70);
    table[NK_COLOR_BUTTON_ACTIVE] = nk_rgb(0, 102, 235);
    nk_style_from_table(m_ctx, table);

    // Widgets are placed at absolute layout boxes, so windows add no padding or spacing
    m_ctx->style.window.padding = nk_vec2(0, 0);
    m_ctx->style.window.spacing = nk_vec2(0, 0);
    m_ctx->style.window.border = 0.0f;
    m_ctx->style.window.rounding = 0.0f;

    m_ctx->style.button.rounding = 6.0f;
    m_ctx->style.button.border = 1.0f;
    m_ctx->style.button.border_color = nk_rgb(65, 65, 70);
    m_ctx->style.button.text_normal = toNkColor(TEXT_COLOR);
    m_ctx->style.button.text_hover = toNkColor(TEXT_COLOR);
    m_ctx->style.button.text_active = nk_rgb(255, 255, 255);
}

void UiScene::newFrame()
{
    if (!m_initialized)
    {
        return;
    }
    nk_input_begin(m_ctx);
}

bool UiScene::handleEvent(const SDL_Event& event)
{
    if (!m_initialized)
    {
        return false;
    }

    // Keys and text go to the coordinator, never to Nuklear
    switch (event.type)
    {
    case SDL_MOUSEMOTION:
    case SDL_MOUSEBUTTONDOWN:
    case SDL_MOUSEBUTTONUP:
        return nk_sdl_handle_event(const_cast<SDL_Event*>(&event)) != 0;
    default:
        return false;
    }
}

Widget* UiScene::takeClickedWidget()
{
    Widget* clicked = m_clicked;
    m_clicked = nullptr;
    return clicked;
}

void UiScene::build(ModeCoordinator& coordinator, SceneActions actions)
{
    m_coordinator = &coordinator;

    buildNavigation();
    buildHome();
    buildBookmarks();
    buildHistory();
    buildSettings(std::move(actions));
    buildKeyboard();

    m_sections[section::BROWSE].title = "Browse";

    std::cout << "[UiScene] Built " << m_navItems.size() << " navigation items, " << m_sections.size()
              << " sections, " << m_keys.size() << " keyboard keys" << std::endl;
}

void UiScene::buildNavigation()
{
    const std::pair<const char*, const char*> items[] = {
        {section::HOME, "Home"},
        {section::BOOKMARKS, "Bookmarks"},
        {section::HISTORY, "History"},
        {section::SETTINGS, "Settings"},
    };

    for (const auto& item : items)
    {
        std::string sectionId = item.first;
        m_navSections.push_back(sectionId);
        m_navItems.push_back(std::make_unique<Widget>(item.second,
                                                      [this, sectionId]() { m_coordinator->switchSection(sectionId); }));
    }

    m_exitButton = std::make_unique<Widget>("Exit", [this]() { m_coordinator->requestExit(); });
}

void UiScene::buildHome()
{
    Section& home = m_sections[section::HOME];
    home.title = "Home";

    home.widgets.push_back(std::make_unique<Widget>("Search or enter URL",
                                                    [this]() { m_coordinator->getKeyboard().open(OskMode::Search); }));

    for (const QuickAccessSite& site : QUICK_ACCESS)
    {
        std::string url = site.url;
        home.widgets.push_back(std::make_unique<Widget>(site.name, [this, url]() { m_coordinator->navigateTo(url); }));
    }
}

void UiScene::buildBookmarks()
{
    Section& bookmarks = m_sections[section::BOOKMARKS];
    bookmarks.title = "Bookmarks";

    for (const QuickAccessSite& site : DEFAULT_BOOKMARKS)
    {
        std::string url = site.url;
        bookmarks.widgets.push_back(
            std::make_unique<Widget>(std::string(site.name) + "  " + url, [this, url]() { m_coordinator->navigateTo(url); }));
    }
}

void UiScene::buildHistory()
{
    Section& history = m_sections[section::HISTORY];
    history.title = "History";
    history.widgets.clear();

    for (const std::string& url : m_history)
    {
        history.widgets.push_back(std::make_unique<Widget>(url, [this, url]() { m_coordinator->navigateTo(url); }));
    }
}

void UiScene::buildSettings(SceneActions actions)
{
    Section& settings = m_sections[section::SETTINGS];
    settings.title = "Settings";

    auto cursorSpeed = std::make_unique<Widget>("", [this]() { m_coordinator->getPointer().cycleSpeed(); });
    cursorSpeed->setLabelSource(
        [this]()
        {
            return std::string("Cursor speed: ") +
                   VirtualPointer::speedName(m_coordinator->getContext().cursor.speedTier);
        });
    settings.widgets.push_back(std::move(cursorSpeed));

    auto sounds = std::make_unique<Widget>("", actions.toggleSounds);
    std::function<bool()> soundsEnabled = actions.soundsEnabled;
    sounds->setLabelSource(
        [soundsEnabled]()
        {
            bool enabled = soundsEnabled ? soundsEnabled() : true;
            return std::string("Navigation sounds: ") + (enabled ? "On" : "Off");
        });
    settings.widgets.push_back(std::move(sounds));

    settings.widgets.push_back(std::make_unique<Widget>("Toggle fullscreen", actions.toggleFullscreen));
    settings.widgets.push_back(std::make_unique<Widget>("Exit", [this]() { m_coordinator->requestExit(); }));
}

void UiScene::buildKeyboard()
{
    for (const OskKey& key : OnScreenKeyboard::layout())
    {
        OskKey copy = key;
        m_keys.push_back(std::make_unique<Widget>(key.label, [this, copy]() { m_coordinator->getKeyboard().pressKey(copy); }));
    }
}

std::vector<FocusTarget*> UiScene::queryFocusable(FocusScope scope, const std::string& sectionId)
{
    std::vector<FocusTarget*> targets;

    switch (scope)
    {
    case FocusScope::Keyboard:
        for (const auto& key : m_keys)
            targets.push_back(key.get());
        break;

    case FocusScope::Sidebar:
        if (!m_sidebarHidden)
        {
            for (const auto& item : m_navItems)
                targets.push_back(item.get());
        }
        break;

    case FocusScope::Section:
    {
        auto it = m_sections.find(sectionId);
        if (it != m_sections.end())
        {
            for (const auto& widget : it->second.widgets)
                targets.push_back(widget.get());
        }
        break;
    }

    case FocusScope::Header:
        if (m_exitButton)
            targets.push_back(m_exitButton.get());
        break;
    }

    return targets;
}

void UiScene::activateSection(const std::string& sectionId)
{
    m_activeSection = sectionId;
    for (size_t i = 0; i < m_navItems.size(); ++i)
    {
        m_navItems[i]->setSelected(m_navSections[i] == sectionId);
    }
}

void UiScene::setSidebarHidden(bool hidden)
{
    if (m_sidebarHidden == hidden)
    {
        return;
    }
    m_sidebarHidden = hidden;
    // Force a relayout on the next frame
    m_width = 0;
    m_height = 0;
}

FocusTarget* UiScene::navigationItem(const std::string& sectionId)
{
    for (size_t i = 0; i < m_navItems.size(); ++i)
    {
        if (m_navSections[i] == sectionId)
        {
            return m_navItems[i].get();
        }
    }
    return nullptr;
}

void UiScene::layout(int width, int height, HeadlessContentHost& host)
{
    if (width == m_width && height == m_height)
    {
        return;
    }
    m_width = width;
    m_height = height;

    float sidebarWidth = m_sidebarHidden ? 0.0f : static_cast<float>(SIDEBAR_WIDTH);
    m_contentArea = Rect{sidebarWidth, static_cast<float>(HEADER_HEIGHT), std::max(0.0f, width - sidebarWidth),
                         std::max(0.0f, static_cast<float>(height - HEADER_HEIGHT))};

    layoutSidebar();
    layoutSections();
    layoutKeyboard();

    host.setLayout(m_contentArea, Rect{0.0f, 0.0f, static_cast<float>(width), static_cast<float>(height)});
}

void UiScene::layoutSidebar()
{
    for (size_t i = 0; i < m_navItems.size(); ++i)
    {
        m_navItems[i]->setLayout(Rect{20.0f, static_cast<float>(HEADER_HEIGHT + 20 + static_cast<int>(i) * 64), 180.0f, 52.0f});
    }

    if (m_exitButton)
    {
        m_exitButton->setLayout(Rect{static_cast<float>(m_width - 140), 10.0f, 120.0f, 40.0f});
    }
}

void UiScene::layoutSections()
{
    for (auto& entry : m_sections)
    {
        Section& area = entry.second;
        area.scroll.viewport = m_contentArea;
        area.scroll.offset = 0.0f;
        for (auto& widget : area.widgets)
        {
            widget->setScrollArea(&area.scroll);
        }

        if (entry.first == section::HOME)
        {
            float left = m_contentArea.left + PADDING;
            float top = m_contentArea.top + 30.0f;
            float innerWidth = std::max(0.0f, m_contentArea.width - 2.0f * PADDING);

            // Search card, then the quick access grid below it
            area.widgets[0]->setLayout(Rect{left, top, innerWidth, 60.0f});

            float tileWidth = (innerWidth - (QUICK_ACCESS_COLUMNS - 1) * TILE_GAP) / QUICK_ACCESS_COLUMNS;
            float gridTop = top + 60.0f + 40.0f;
            for (size_t i = 1; i < area.widgets.size(); ++i)
            {
                int index = static_cast<int>(i) - 1;
                int column = index % QUICK_ACCESS_COLUMNS;
                int row = index / QUICK_ACCESS_COLUMNS;
                area.widgets[i]->setLayout(Rect{left + column * (tileWidth + TILE_GAP),
                                                   gridTop + row * (TILE_HEIGHT + TILE_GAP), tileWidth,
                                                   static_cast<float>(TILE_HEIGHT)});
            }

            area.scroll.contentBottom = area.widgets.empty() ? top : area.widgets.back()->getLayout().bottom();
        }
        else
        {
            layoutList(area);
        }
    }
}

void UiScene::layoutList(Section& section)
{
    float left = m_contentArea.left + PADDING;
    float top = m_contentArea.top + 70.0f; // Below the section title
    float width = std::max(0.0f, m_contentArea.width - 2.0f * PADDING);

    for (size_t i = 0; i < section.widgets.size(); ++i)
    {
        section.widgets[i]->setLayout(Rect{left, top + i * (ROW_HEIGHT + ROW_GAP), width, static_cast<float>(ROW_HEIGHT)});
    }
    section.scroll.contentBottom = section.widgets.empty() ? top : section.widgets.back()->getLayout().bottom();
}

void UiScene::layoutKeyboard()
{
    const auto& layout = OnScreenKeyboard::layout();
    int rowCount = 0;
    for (const OskKey& key : layout)
    {
        rowCount = std::max(rowCount, key.row + 1);
    }

    float panelHeight = 110.0f + rowCount * (KEY_SIZE + KEY_GAP);
    m_keyboardPanel = Rect{0.0f, std::max(0.0f, m_height - panelHeight), static_cast<float>(m_width), panelHeight};

    for (int row = 0; row < rowCount; ++row)
    {
        float rowWidth = 0.0f;
        for (const OskKey& key : layout)
        {
            if (key.row == row)
                rowWidth += (key.wide ? 2 * KEY_SIZE + KEY_GAP : KEY_SIZE) + KEY_GAP;
        }
        rowWidth -= KEY_GAP;

        float x = (m_width - rowWidth) / 2.0f;
        float y = m_keyboardPanel.top + 100.0f + row * (KEY_SIZE + KEY_GAP);
        for (size_t i = 0; i < layout.size(); ++i)
        {
            if (layout[i].row != row)
                continue;
            float keyWidth = layout[i].wide ? 2.0f * KEY_SIZE + KEY_GAP : static_cast<float>(KEY_SIZE);
            m_keys[i]->setLayout(Rect{x, y, keyWidth, static_cast<float>(KEY_SIZE)});
            x += keyWidth + KEY_GAP;
        }
    }
}

void UiScene::render(const SessionContext& context, const SdlFeedback& feedback, const HeadlessContentHost& host)
{
    m_renderer.clear(SECTION_BACKGROUND.r, SECTION_BACKGROUND.g, SECTION_BACKGROUND.b, 255);

    if (m_activeSection == section::BROWSE)
    {
        renderBrowse(context, host);
    }

    if (m_initialized)
    {
        nk_input_end(m_ctx);

        if (m_activeSection != section::BROWSE)
        {
            auto it = m_sections.find(m_activeSection);
            if (it != m_sections.end())
            {
                renderSection(it->second);
            }
        }
        if (!m_sidebarHidden)
        {
            renderSidebar();
        }
        renderHeader(context);
        if (context.osk.visible)
        {
            renderKeyboard(context);
        }

        nk_sdl_render(NK_ANTI_ALIASING_ON);
        nk_sdl_handle_grab();
    }

    if (context.cursor.enabled && !context.osk.visible)
    {
        renderCursor(context.cursor);
    }

    if (feedback.hasToast())
    {
        renderToast(feedback.getToast());
    }

    m_renderer.present();
}

bool UiScene::beginWindow(const char* name, const Rect& bounds, SDL_Color background, bool backmost)
{
    nk_flags flags = NK_WINDOW_NO_SCROLLBAR;
    if (backmost)
    {
        flags |= NK_WINDOW_BACKGROUND;
    }
    else
    {
        nk_window_set_focus(m_ctx, name);
    }

    // Bounds passed to nk_begin only apply when the window is first created
    nk_window_set_bounds(m_ctx, name, toNkRect(bounds));
    m_backgroundPushed =
        nk_style_push_style_item(m_ctx, &m_ctx->style.window.fixed_background, nk_style_item_color(toNkColor(background)));

    if (!nk_begin(m_ctx, name, toNkRect(bounds), flags))
    {
        return false;
    }
    nk_layout_space_begin(m_ctx, NK_STATIC, bounds.height, INT_MAX);
    return true;
}

void UiScene::endWindow()
{
    nk_end(m_ctx);
    if (m_backgroundPushed)
    {
        nk_style_pop_style_item(m_ctx);
        m_backgroundPushed = false;
    }
}

void UiScene::pushWidget(Widget& widget, const Rect& origin)
{
    Rect box = widget.boundingBox();
    nk_layout_space_push(m_ctx, nk_rect(box.left - origin.left, box.top - origin.top, box.width, box.height));

    struct nk_style_button style = m_ctx->style.button;
    if (widget.isSelected())
    {
        style.normal = nk_style_item_color(nk_rgb(0, 110, 170));
        style.hover = nk_style_item_color(nk_rgb(0, 122, 190));
    }
    if (widget.isFocused())
    {
        style.border = 3.0f;
        style.border_color = nk_rgb(0, 170, 255);
    }

    std::string label = widget.getLabel();
    if (nk_button_label_styled(m_ctx, &style, label.c_str()))
    {
        m_clicked = &widget;
    }
}

void UiScene::pushLabel(const std::string& text, const Rect& box, const Rect& origin, SDL_Color color, bool centered)
{
    nk_layout_space_push(m_ctx, nk_rect(box.left - origin.left, box.top - origin.top, box.width, box.height));
    nk_label_colored(m_ctx, text.c_str(), centered ? NK_TEXT_CENTERED : NK_TEXT_LEFT, toNkColor(color));
}

void UiScene::renderSidebar()
{
    Rect bounds{0.0f, 0.0f, static_cast<float>(SIDEBAR_WIDTH), static_cast<float>(m_height)};
    if (beginWindow("sidebar", bounds, SIDEBAR_BACKGROUND, false))
    {
        pushLabel("Big Picture", Rect{24.0f, 14.0f, SIDEBAR_WIDTH - 48.0f, 32.0f}, bounds, TEXT_COLOR, false);
        for (const auto& item : m_navItems)
        {
            pushWidget(*item, bounds);
        }
        nk_layout_space_end(m_ctx);
    }
    endWindow();
}

void UiScene::renderHeader(const SessionContext& context)
{
    Rect bounds{m_contentArea.left, 0.0f, m_contentArea.width, static_cast<float>(HEADER_HEIGHT)};

    std::string title = m_activeSection;
    auto it = m_sections.find(m_activeSection);
    if (it != m_sections.end())
    {
        title = it->second.title;
    }
    if (context.sidebarHidden)
    {
        title += "  (fullscreen)";
    }

    if (beginWindow("header", bounds, HEADER_BACKGROUND, false))
    {
        pushLabel(title, Rect{bounds.left + 20.0f, 14.0f, bounds.width / 2.0f, 32.0f}, bounds, TEXT_COLOR, false);
        if (m_exitButton)
        {
            pushWidget(*m_exitButton, bounds);
        }
        nk_layout_space_end(m_ctx);
    }
    endWindow();
}

void UiScene::renderSection(Section& section)
{
    const Rect& bounds = m_contentArea;
    if (beginWindow("section", bounds, SECTION_BACKGROUND, true))
    {
        if (section.title != "Home")
        {
            Rect titleBox{bounds.left + PADDING, bounds.top + 20.0f - section.scroll.offset, bounds.width / 2.0f, 32.0f};
            pushLabel(section.title, titleBox, bounds, TEXT_COLOR, false);
            if (section.widgets.empty())
            {
                pushLabel("Nothing here yet", Rect{bounds.left + PADDING, bounds.top + 70.0f, bounds.width / 2.0f, 32.0f},
                          bounds, MUTED_TEXT_COLOR, false);
            }
        }

        for (auto& widget : section.widgets)
        {
            pushWidget(*widget, bounds);
        }
        nk_layout_space_end(m_ctx);
    }
    endWindow();
}

void UiScene::renderKeyboard(const SessionContext& context)
{
    const Rect& bounds = m_keyboardPanel;
    if (beginWindow("keyboard", bounds, KEYBOARD_BACKGROUND, false))
    {
        const char* label = context.osk.mode == OskMode::Search ? "Search or enter URL" : "Type your text";
        pushLabel(label, Rect{bounds.left + PADDING, bounds.top + 10.0f, bounds.width / 2.0f, 28.0f}, bounds,
                  MUTED_TEXT_COLOR, false);

        Rect input{bounds.left + PADDING, bounds.top + 44.0f, bounds.width - 2.0f * PADDING, 44.0f};
        nk_fill_rect(nk_window_get_canvas(m_ctx), toNkRect(input), 4.0f, nk_rgb(50, 50, 64));
        pushLabel(context.osk.buffer + "_", Rect{input.left + 12.0f, input.top, input.width - 24.0f, input.height},
                  bounds, TEXT_COLOR, false);

        for (const auto& key : m_keys)
        {
            pushWidget(*key, bounds);
        }
        nk_layout_space_end(m_ctx);
    }
    endWindow();
}

void UiScene::renderBrowse(const SessionContext& context, const HeadlessContentHost& host)
{
    SDL_Rect container = toSDLRect(m_contentArea);
    HeadlessSurface* surface = host.surface();
    if (!surface || !host.isVisible())
    {
        m_textRenderer.renderText("No page open", container.x + PADDING, container.y + 30, MUTED_TEXT_COLOR);
        return;
    }

    m_renderer.setClip(&container);
    m_renderer.drawFilledRect(container.x, container.y, container.w, container.h, 245, 245, 248, 255);

    if (!surface->isReady())
    {
        m_textRenderer.renderText("Loading " + surface->currentUrl() + " ...", container.x + PADDING,
                                  container.y + container.h / 2, DARK_TEXT_COLOR);
        m_renderer.setClip(nullptr);
        return;
    }

    Rect field = surface->fieldBounds(m_contentArea.width);
    SDL_Rect fieldRect = toSDLRect(Rect{field.left + m_contentArea.left, field.top + m_contentArea.top, field.width,
                                        field.height});
    m_renderer.drawFilledRect(fieldRect.x, fieldRect.y, fieldRect.w, fieldRect.h, 255, 255, 255, 255);
    m_renderer.drawRect(fieldRect.x, fieldRect.y, fieldRect.w, fieldRect.h, 120, 120, 140, 255);
    const std::string& fieldText = surface->getFieldText();
    m_textRenderer.renderText(fieldText.empty() ? "Search this site" : fieldText, fieldRect.x + 12, fieldRect.y + 12,
                              fieldText.empty() ? MUTED_TEXT_COLOR : DARK_TEXT_COLOR);

    int lineTop = fieldRect.y + fieldRect.h + 30;
    m_textRenderer.renderText(surface->currentUrl(), container.x + PADDING, lineTop, DARK_TEXT_COLOR);

    // Scroll position indicator
    float ratio = surface->getScrollY() / HeadlessSurface::PAGE_HEIGHT;
    int barHeight = std::max(20, container.h / 10);
    int barTop = container.y + static_cast<int>(ratio * (container.h - barHeight));
    m_renderer.drawFilledRect(container.x + container.w - 8, barTop, 6, barHeight, 150, 150, 160, 255);

    m_renderer.setClip(nullptr);

    if (context.cursor.enabled)
    {
        m_textRenderer.renderText(std::string("Cursor: ") + VirtualPointer::speedName(context.cursor.speedTier),
                                  container.x + PADDING, container.y + container.h - 40, MUTED_TEXT_COLOR);
    }
}

void UiScene::renderCursor(const CursorState& cursor)
{
    float x = cursor.x;
    float y = cursor.y;
    uint8_t g = cursor.clicking ? 80 : 255;

    m_renderer.drawLine(x - 10, y, x + 10, y, 255, g, 80, 255);
    m_renderer.drawLine(x, y - 10, x, y + 10, 255, g, 80, 255);
    m_renderer.drawRect(static_cast<int>(x) - 6, static_cast<int>(y) - 6, 12, 12, 255, g, 80, 255);
    if (cursor.clicking)
    {
        m_renderer.drawRect(static_cast<int>(x) - 14, static_cast<int>(y) - 14, 28, 28, 255, 80, 80, 255);
    }
}

void UiScene::renderToast(const std::string& message)
{
    int width = 0;
    int height = 0;
    if (!m_textRenderer.measureText(message, width, height))
    {
        return;
    }

    int boxWidth = width + 40;
    int boxHeight = height + 24;
    int x = (m_width - boxWidth) / 2;
    int y = m_height - boxHeight - 40;

    m_renderer.drawFilledRect(x, y, boxWidth, boxHeight, 10, 10, 14, 230);
    m_renderer.drawRect(x, y, boxWidth, boxHeight, 0, 170, 255, 255);
    m_textRenderer.renderText(message, x + 20, y + 12, TEXT_COLOR);
}

Widget* UiScene::hitTest(float x, float y, const SessionContext& context) const
{
    auto hit = [x, y](const std::vector<std::unique_ptr<Widget>>& widgets) -> Widget*
    {
        for (const auto& widget : widgets)
        {
            if (widget->boundingBox().contains(x, y))
                return widget.get();
        }
        return nullptr;
    };

    if (context.osk.visible)
    {
        return hit(m_keys);
    }

    if (!m_sidebarHidden)
    {
        if (Widget* widget = hit(m_navItems))
            return widget;
    }

    if (m_exitButton && m_exitButton->boundingBox().contains(x, y))
    {
        return m_exitButton.get();
    }

    if (!m_contentArea.contains(x, y))
    {
        return nullptr;
    }

    auto it = m_sections.find(m_activeSection);
    return it != m_sections.end() ? hit(it->second.widgets) : nullptr;
}

void UiScene::scrollActiveSection(float dy)
{
    auto it = m_sections.find(m_activeSection);
    if (it == m_sections.end())
    {
        return;
    }

    ScrollArea& scroll = it->second.scroll;
    float maxOffset = std::max(0.0f, scroll.contentBottom + PADDING - scroll.viewport.bottom());
    scroll.offset = std::clamp(scroll.offset + dy, 0.0f, maxOffset);
}

void UiScene::addHistoryEntry(const std::string& url)
{
    m_history.erase(std::remove(m_history.begin(), m_history.end(), url), m_history.end());
    m_history.insert(m_history.begin(), url);
    if (m_history.size() > MAX_HISTORY_ENTRIES)
    {
        m_history.resize(MAX_HISTORY_ENTRIES);
    }

    Section& history = m_sections[section::HISTORY];
    if (m_coordinator)
    {
        for (const auto& widget : history.widgets)
        {
            m_coordinator->getFocusRegistry().release(widget.get());
        }
    }

    buildHistory();

    for (auto& widget : history.widgets)
    {
        widget->setScrollArea(&history.scroll);
    }
    if (m_width > 0)
    {
        layoutList(history);
    }

    if (m_coordinator && m_activeSection == section::HISTORY)
    {
        m_coordinator->refreshFocus();
    }
}
