#include "text_renderer.h"
#include <algorithm>
#include <iostream>
#include <stdexcept>
#include <utility>

TextRenderer::TextRenderer(SDL_Renderer* renderer, const std::string& fontPath, int fontSize)
    : m_sdlRenderer(renderer), m_fontPath(fontPath)
{
    if (TTF_WasInit() == 0 && TTF_Init() == -1)
    {
        throw std::runtime_error("SDL_ttf could not initialize! TTF_Error: " + std::string(TTF_GetError()));
    }
    loadFont(fontSize);
}

void TextRenderer::loadFont(int size)
{
    int fontSize = std::max(8, size);
    m_font.reset(TTF_OpenFont(m_fontPath.c_str(), fontSize));
    if (!m_font)
    {
        throw std::runtime_error("Failed to load font: " + m_fontPath + " (" + TTF_GetError() + ")");
    }
    m_cache.clear();
}

std::string TextRenderer::cacheKey(const std::string& text, SDL_Color color)
{
    std::string key;
    key.reserve(text.size() + 4);
    key.push_back(static_cast<char>(color.r));
    key.push_back(static_cast<char>(color.g));
    key.push_back(static_cast<char>(color.b));
    key.push_back(static_cast<char>(color.a));
    key += text;
    return key;
}

const TextRenderer::CachedLabel* TextRenderer::findOrRender(const std::string& text, SDL_Color color)
{
    std::string key = cacheKey(text, color);
    auto it = m_cache.find(key);
    if (it != m_cache.end())
    {
        return &it->second;
    }

    std::unique_ptr<SDL_Surface, void (*)(SDL_Surface*)> surface(
        TTF_RenderUTF8_Blended(m_font.get(), text.c_str(), color),
        SDL_FreeSurface);
    if (!surface)
    {
        std::cerr << "[TextRenderer] Unable to render \"" << text << "\": " << TTF_GetError() << std::endl;
        return nullptr;
    }

    CachedLabel label;
    label.texture.reset(SDL_CreateTextureFromSurface(m_sdlRenderer, surface.get()));
    if (!label.texture)
    {
        std::cerr << "[TextRenderer] Unable to create label texture: " << SDL_GetError() << std::endl;
        return nullptr;
    }
    label.width = surface->w;
    label.height = surface->h;

    if (m_cache.size() >= MAX_CACHED_LABELS)
    {
        m_cache.clear();
    }
    return &m_cache.emplace(std::move(key), std::move(label)).first->second;
}

void TextRenderer::renderText(const std::string& text, int x, int y, SDL_Color color)
{
    if (text.empty())
        return;
    if (!m_font)
    {
        std::cerr << "[TextRenderer] No font loaded" << std::endl;
        return;
    }

    const CachedLabel* label = findOrRender(text, color);
    if (!label)
    {
        return;
    }

    SDL_Rect destination = {x, y, label->width, label->height};
    SDL_RenderCopy(m_sdlRenderer, label->texture.get(), nullptr, &destination);
}

bool TextRenderer::measureText(const std::string& text, int& width, int& height) const
{
    width = 0;
    height = 0;
    if (text.empty() || !m_font)
    {
        return false;
    }

    if (TTF_SizeUTF8(m_font.get(), text.c_str(), &width, &height) != 0)
    {
        std::cerr << "[TextRenderer] Unable to measure text: " << TTF_GetError() << std::endl;
        width = 0;
        height = 0;
        return false;
    }

    return true;
}
