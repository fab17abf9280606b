#ifndef RENDERER_H
#define RENDERER_H

#include <SDL.h>
#include <cstdint>

struct MySDLTextureDeleter
{
    void operator()(SDL_Texture* texture) const
    {
        if (texture)
            SDL_DestroyTexture(texture);
    }
};

/**
 * @brief Thin 2D drawing layer over a window's SDL_Renderer
 *
 * Window and renderer are created (and destroyed) by main.
 */
class Renderer
{
public:
    Renderer(SDL_Window* window, SDL_Renderer* renderer);
    ~Renderer() = default;

    void clear(uint8_t r, uint8_t g, uint8_t b, uint8_t a);
    void present();

    void drawFilledRect(int x, int y, int width, int height, uint8_t r, uint8_t g, uint8_t b, uint8_t a);
    void drawRect(int x, int y, int width, int height, uint8_t r, uint8_t g, uint8_t b, uint8_t a);
    void drawLine(float x1, float y1, float x2, float y2, uint8_t r, uint8_t g, uint8_t b, uint8_t a);

    /**
     * @brief Clip subsequent drawing to a rectangle; nullptr removes the clip
     */
    void setClip(const SDL_Rect* clip);

    int getWindowWidth() const;
    int getWindowHeight() const;

    void toggleFullscreen();

    // Subsystems main must initialize before constructing the App
    static Uint32 getRequiredSDLInitFlags();

private:
    SDL_Window* m_window;
    SDL_Renderer* m_renderer;
    bool m_isFullscreen = false;

    void setColor(uint8_t r, uint8_t g, uint8_t b, uint8_t a);
};

#endif // RENDERER_H
