#include "renderer.h"

#include <iostream>
#include <stdexcept>

// --- Renderer Class ---

Renderer::Renderer(SDL_Window* window, SDL_Renderer* renderer)
    : m_window(window), m_renderer(renderer)
{
    if (!m_window)
    {
        throw std::runtime_error("Renderer received a null SDL_Window pointer.");
    }
    if (!m_renderer)
    {
        throw std::runtime_error("Renderer received a null SDL_Renderer pointer.");
    }

    SDL_SetRenderDrawBlendMode(m_renderer, SDL_BLENDMODE_BLEND);
}

void Renderer::clear(uint8_t r, uint8_t g, uint8_t b, uint8_t a)
{
    setColor(r, g, b, a);
    SDL_RenderClear(m_renderer);
}

void Renderer::present()
{
    SDL_RenderPresent(m_renderer);
}

void Renderer::drawFilledRect(int x, int y, int width, int height, uint8_t r, uint8_t g, uint8_t b, uint8_t a)
{
    SDL_Rect rect = {x, y, width, height};
    setColor(r, g, b, a);
    SDL_RenderFillRect(m_renderer, &rect);
}

void Renderer::drawRect(int x, int y, int width, int height, uint8_t r, uint8_t g, uint8_t b, uint8_t a)
{
    SDL_Rect rect = {x, y, width, height};
    setColor(r, g, b, a);
    SDL_RenderDrawRect(m_renderer, &rect);
}

void Renderer::drawLine(float x1, float y1, float x2, float y2, uint8_t r, uint8_t g, uint8_t b, uint8_t a)
{
    setColor(r, g, b, a);
#if SDL_VERSION_ATLEAST(2, 0, 10)
    SDL_RenderDrawLineF(m_renderer, x1, y1, x2, y2);
#else
    SDL_RenderDrawLine(m_renderer, static_cast<int>(x1), static_cast<int>(y1), static_cast<int>(x2),
                       static_cast<int>(y2));
#endif
}

void Renderer::setClip(const SDL_Rect* clip)
{
    SDL_RenderSetClipRect(m_renderer, clip);
}

int Renderer::getWindowWidth() const
{
    int w = 0;
    SDL_GetWindowSize(m_window, &w, nullptr);
    return w;
}

int Renderer::getWindowHeight() const
{
    int h = 0;
    SDL_GetWindowSize(m_window, nullptr, &h);
    return h;
}

void Renderer::toggleFullscreen()
{
    Uint32 flags = m_isFullscreen ? 0 : SDL_WINDOW_FULLSCREEN_DESKTOP;
    if (SDL_SetWindowFullscreen(m_window, flags) != 0)
    {
        std::cerr << "Error: Unable to toggle fullscreen! SDL_Error: " << SDL_GetError() << std::endl;
        return;
    }
    m_isFullscreen = !m_isFullscreen;
}

Uint32 Renderer::getRequiredSDLInitFlags()
{
    return SDL_INIT_VIDEO | SDL_INIT_GAMECONTROLLER | SDL_INIT_AUDIO;
}

void Renderer::setColor(uint8_t r, uint8_t g, uint8_t b, uint8_t a)
{
    SDL_SetRenderDrawColor(m_renderer, r, g, b, a);
}
