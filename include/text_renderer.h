#pragma once

#include <SDL.h>
#include <SDL_ttf.h>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <string>
#include <unordered_map>

#include "renderer.h"

struct TTF_Font_Deleter
{
    inline void operator()(TTF_Font* font) const
    {
        if (font)
            TTF_CloseFont(font);
    }
};

/**
 * @brief UTF-8 label drawing with one font
 *
 * The scene redraws the same labels every frame, so rendered labels are kept
 * as textures keyed by text and color until the cache fills up.
 */
class TextRenderer
{
public:
    static constexpr size_t MAX_CACHED_LABELS = 256;

    TextRenderer(SDL_Renderer* renderer, const std::string& fontPath, int fontSize);

    // TTF_Quit() belongs to main, after every renderer is gone
    ~TextRenderer() = default;

    void renderText(const std::string& text, int x, int y, SDL_Color color);

    // Size of text at the current font size; false for empty text or a TTF failure.
    bool measureText(const std::string& text, int& width, int& height) const;

private:
    struct CachedLabel
    {
        std::unique_ptr<SDL_Texture, MySDLTextureDeleter> texture;
        int width = 0;
        int height = 0;
    };

    SDL_Renderer* m_sdlRenderer;
    std::unique_ptr<TTF_Font, TTF_Font_Deleter> m_font;
    std::string m_fontPath;
    std::unordered_map<std::string, CachedLabel> m_cache;

    void loadFont(int size);
    const CachedLabel* findOrRender(const std::string& text, SDL_Color color);
    static std::string cacheKey(const std::string& text, SDL_Color color);
};
