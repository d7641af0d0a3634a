#include "viewer.h"

#include <SDL.h>
#include <SDL_image.h>

#include <iostream>
#include <sstream>
#include <stdexcept>
#include <utility>

#include "signals.h"

namespace
{
    constexpr int DefaultWindowSize = 8 * 48;

    bool is_stop_event(const SDL_Event& event)
    {
        return event.type == SDL_QUIT ||
               (event.type == SDL_KEYDOWN && event.key.keysym.sym == SDLK_ESCAPE);
    }

    bool is_confirm_event(const SDL_Event& event)
    {
        return event.type == SDL_KEYDOWN &&
               (event.key.keysym.sym == SDLK_RETURN || event.key.keysym.sym == SDLK_KP_ENTER);
    }

    std::string headline(const std::string& text)
    {
        std::istringstream in(text);
        std::string line;
        while (std::getline(in, line))
        {
            if (line.rfind("Move ", 0) == 0)
            {
                return line;
            }
        }
        return {};
    }
}

SdlViewer::SdlViewer(SessionSignals& signals, Announcer& announcer, const std::string& title)
    : signals_(signals),
      announcer_(announcer),
      title_(title)
{
    if (SDL_Init(SDL_INIT_VIDEO) != 0)
    {
        throw std::runtime_error(std::string("SDL_Init failed: ") + SDL_GetError());
    }

    const int imgFlags = IMG_INIT_PNG;
    if ((IMG_Init(imgFlags) & imgFlags) != imgFlags)
    {
        const std::string message = std::string("IMG_Init failed: ") + IMG_GetError();
        SDL_Quit();
        throw std::runtime_error(message);
    }

    window_ = SDL_CreateWindow(
        title_.c_str(),
        SDL_WINDOWPOS_CENTERED,
        SDL_WINDOWPOS_CENTERED,
        DefaultWindowSize,
        DefaultWindowSize,
        SDL_WINDOW_SHOWN | SDL_WINDOW_RESIZABLE);

    if (!window_)
    {
        const std::string message = std::string("SDL_CreateWindow failed: ") + SDL_GetError();
        IMG_Quit();
        SDL_Quit();
        throw std::runtime_error(message);
    }

    renderer_ = SDL_CreateRenderer(window_, -1, SDL_RENDERER_ACCELERATED | SDL_RENDERER_PRESENTVSYNC);
    if (!renderer_)
    {
        renderer_ = SDL_CreateRenderer(window_, -1, SDL_RENDERER_SOFTWARE);
    }

    if (!renderer_)
    {
        const std::string message = std::string("SDL_CreateRenderer failed: ") + SDL_GetError();
        SDL_DestroyWindow(window_);
        IMG_Quit();
        SDL_Quit();
        throw std::runtime_error(message);
    }

    present();
}

SdlViewer::~SdlViewer()
{
    if (texture_)
    {
        SDL_DestroyTexture(texture_);
    }
    SDL_DestroyRenderer(renderer_);
    SDL_DestroyWindow(window_);
    IMG_Quit();
    SDL_Quit();
}

void SdlViewer::show_text(const std::string& text)
{
    std::cout << text << std::endl;

    const std::string line = headline(text);
    if (!line.empty())
    {
        SDL_SetWindowTitle(window_, (title_ + " - " + line).c_str());
    }
}

void SdlViewer::show_image(const render::Image& image)
{
    if (image.empty())
    {
        return;
    }

    if (!texture_ || textureWidth_ != image.width || textureHeight_ != image.height)
    {
        if (texture_)
        {
            SDL_DestroyTexture(texture_);
        }

        texture_ = SDL_CreateTexture(
            renderer_,
            SDL_PIXELFORMAT_RGBA32,
            SDL_TEXTUREACCESS_STREAMING,
            image.width,
            image.height);

        if (!texture_)
        {
            textureWidth_ = 0;
            textureHeight_ = 0;
            std::cerr << "SDL_CreateTexture failed: " << SDL_GetError() << '\n';
            return;
        }

        textureWidth_ = image.width;
        textureHeight_ = image.height;
        SDL_SetWindowSize(window_, image.width, image.height);
    }

    if (SDL_UpdateTexture(texture_, nullptr, image.pixels.data(), image.width * 4) != 0)
    {
        std::cerr << "SDL_UpdateTexture failed: " << SDL_GetError() << '\n';
    }

    // Keys pressed while browsing do not end the next episode.
    discard_pending();

    present();
}

void SdlViewer::pump()
{
    SDL_Event event;
    while (SDL_PollEvent(&event))
    {
        handle_event(event);
    }
}

void SdlViewer::discard_pending()
{
    SDL_Event event;
    while (SDL_PollEvent(&event))
    {
        if (is_stop_event(event))
        {
            signals_.request_stop();
        }
    }
}

void SdlViewer::verify_setup()
{
    announcer_.say("Displaying observation, press Enter to continue");
    present();

    SDL_Event event;
    while (!signals_.stopRecording)
    {
        if (SDL_WaitEvent(&event) == 0)
        {
            throw std::runtime_error(std::string("SDL_WaitEvent failed: ") + SDL_GetError());
        }

        if (is_confirm_event(event))
        {
            return;
        }
        if (is_stop_event(event))
        {
            signals_.request_stop();
            return;
        }
        if (event.type == SDL_WINDOWEVENT && event.window.event == SDL_WINDOWEVENT_EXPOSED)
        {
            present();
        }
    }
}

void SdlViewer::present()
{
    SDL_SetRenderDrawColor(renderer_, 40, 40, 45, 255);
    SDL_RenderClear(renderer_);
    if (texture_)
    {
        SDL_RenderCopy(renderer_, texture_, nullptr, nullptr);
    }
    SDL_RenderPresent(renderer_);
}

void SdlViewer::handle_event(const SDL_Event& event)
{
    if (is_stop_event(event))
    {
        std::cout << "Escape key pressed. Stopping data recording..." << std::endl;
        signals_.request_stop();
        return;
    }

    if (event.type == SDL_KEYDOWN)
    {
        switch (event.key.keysym.sym)
        {
        case SDLK_RIGHT:
            std::cout << "Right arrow key pressed. Exiting loop..." << std::endl;
            signals_.request_exit_early();
            break;
        case SDLK_LEFT:
            std::cout << "Left arrow key pressed. Exiting loop and rerecord the last episode..." << std::endl;
            signals_.request_rerecord();
            break;
        default:
            break;
        }
    }
    else if (event.type == SDL_WINDOWEVENT && event.window.event == SDL_WINDOWEVENT_EXPOSED)
    {
        present();
    }
}

ConsoleViewer::ConsoleViewer(SessionSignals& signals,
                             Announcer& announcer,
                             OperatorInput& input,
                             std::filesystem::path imagePath)
    : signals_(signals),
      announcer_(announcer),
      input_(input),
      imagePath_(std::move(imagePath))
{
}

void ConsoleViewer::show_text(const std::string& text)
{
    std::cout << text << std::endl;
}

void ConsoleViewer::show_image(const render::Image& image)
{
    if (image.empty() || imagePath_.empty())
    {
        return;
    }

    try
    {
        render::save_png(image, imagePath_);
        std::cout << "Board image: " << imagePath_.string() << std::endl;
    }
    catch (const std::runtime_error& e)
    {
        std::cerr << "Could not write board image: " << e.what() << '\n';
    }
}

void ConsoleViewer::verify_setup()
{
    announcer_.say("Displaying observation, press Enter to continue");
    input_.discard_pending();
    if (!input_.read_line())
    {
        signals_.request_stop();
    }
}
