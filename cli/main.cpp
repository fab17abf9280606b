#include "app.h"
#include "renderer.h"
#include <SDL.h>
#include <SDL_ttf.h>
#include <cstring>
#include <iostream>
#include <string>

namespace
{

const char* const WINDOW_TITLE = "BigPicture";
const int WINDOW_WIDTH = 1280;
const int WINDOW_HEIGHT = 720;

void printUsage(std::ostream& out, const char* program)
{
    out << "Usage: " << program << " [url_or_search_term]" << std::endl;
}

void shutdownSDL(SDL_Window* window, SDL_Renderer* renderer)
{
    if (renderer)
        SDL_DestroyRenderer(renderer);
    if (window)
        SDL_DestroyWindow(window);
    if (TTF_WasInit())
        TTF_Quit();
    SDL_Quit();
}

// Creates the window and renderer the App draws into; logs and returns false on failure.
bool createVideo(SDL_Window*& window, SDL_Renderer*& renderer)
{
    if (SDL_Init(Renderer::getRequiredSDLInitFlags()) < 0)
    {
        std::cerr << "[Main] SDL_Init failed: " << SDL_GetError() << std::endl;
        return false;
    }
    if (TTF_Init() == -1)
    {
        std::cerr << "[Main] TTF_Init failed: " << TTF_GetError() << std::endl;
        return false;
    }

    window = SDL_CreateWindow(WINDOW_TITLE, SDL_WINDOWPOS_CENTERED, SDL_WINDOWPOS_CENTERED, WINDOW_WIDTH,
                              WINDOW_HEIGHT, SDL_WINDOW_SHOWN | SDL_WINDOW_RESIZABLE);
    if (!window)
    {
        std::cerr << "[Main] Unable to create window: " << SDL_GetError() << std::endl;
        return false;
    }

    renderer = SDL_CreateRenderer(window, -1, SDL_RENDERER_ACCELERATED | SDL_RENDERER_PRESENTVSYNC);
    if (!renderer)
    {
        std::cerr << "[Main] Unable to create renderer: " << SDL_GetError() << std::endl;
        return false;
    }
    return true;
}

} // namespace

int main(int argc, char* argv[])
{
    std::string initialTarget;
    if (argc > 2)
    {
        printUsage(std::cerr, argv[0]);
        return 1;
    }
    if (argc == 2)
    {
        if (std::strcmp(argv[1], "--help") == 0 || std::strcmp(argv[1], "-h") == 0)
        {
            printUsage(std::cout, argv[0]);
            return 0;
        }
        initialTarget = argv[1];
    }

    SDL_Window* window = nullptr;
    SDL_Renderer* renderer = nullptr;
    if (!createVideo(window, renderer))
    {
        shutdownSDL(window, renderer);
        return 1;
    }

    int exitCode = 0;
    try
    {
        // App must be gone before the renderer and TTF are torn down
        App app(initialTarget, window, renderer);
        app.run();
    }
    catch (const std::runtime_error& e)
    {
        std::cerr << "Application Error: " << e.what() << std::endl;
        exitCode = 1;
    }
    catch (const std::exception& e)
    {
        std::cerr << "Unexpected error: " << e.what() << std::endl;
        exitCode = 1;
    }

    shutdownSDL(window, renderer);
    return exitCode;
}
