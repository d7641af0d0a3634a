#pragma once

#include <filesystem>
#include <string>

#include "operator_io.h"
#include "render.h"

struct SDL_Renderer;
struct SDL_Texture;
struct SDL_Window;
union SDL_Event;
struct SessionSignals;

// Window showing the current board image. Keys pressed in the window become
// SessionSignals flags: Right ends the episode early, Left asks for a re-record,
// Escape or closing the window stops the session. Enter confirms the setup check.
class SdlViewer : public Display, public SignalListener, public SetupCheck
{
public:
    // Throws std::runtime_error when SDL video, SDL_image or the window cannot be set up.
    SdlViewer(SessionSignals& signals, Announcer& announcer, const std::string& title);
    ~SdlViewer() override;

    SdlViewer(const SdlViewer&) = delete;
    SdlViewer& operator=(const SdlViewer&) = delete;

    void show_text(const std::string& text) override;
    void show_image(const render::Image& image) override;

    void pump() override;
    void discard_pending() override;

    void verify_setup() override;

private:
    SessionSignals& signals_;
    Announcer& announcer_;
    std::string title_;

    SDL_Window* window_{nullptr};
    SDL_Renderer* renderer_{nullptr};
    SDL_Texture* texture_{nullptr};
    int textureWidth_{0};
    int textureHeight_{0};

    void present();
    void handle_event(const SDL_Event& event);
};

// Headless stand-in: text to stdout, board images written as PNG files,
// setup confirmed with an Enter line on the operator input.
class ConsoleViewer : public Display, public SignalListener, public SetupCheck
{
public:
    ConsoleViewer(SessionSignals& signals,
                  Announcer& announcer,
                  OperatorInput& input,
                  std::filesystem::path imagePath);

    void show_text(const std::string& text) override;
    void show_image(const render::Image& image) override;

    void pump() override {}

    void verify_setup() override;

private:
    SessionSignals& signals_;
    Announcer& announcer_;
    OperatorInput& input_;
    std::filesystem::path imagePath_;
};
