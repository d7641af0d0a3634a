#pragma once

#include <optional>
#include <string>

namespace render
{
    struct Image;
}

class Display
{
public:
    virtual ~Display() = default;

    virtual void show_text(const std::string& text) = 0;
    virtual void show_image(const render::Image& image) = 0;
};

class OperatorInput
{
public:
    virtual ~OperatorInput() = default;

    // Drops anything typed before the prompt was shown.
    virtual void discard_pending() {}

    // std::nullopt once the input stream is closed.
    virtual std::optional<std::string> read_line() = 0;
};

class Announcer
{
public:
    virtual ~Announcer() = default;

    virtual void say(const std::string& message) = 0;
};

// Shows the live scene until the operator confirms the physical setup.
class SetupCheck
{
public:
    virtual ~SetupCheck() = default;

    virtual void verify_setup() = 0;
};

// Turns pending key events into SessionSignals flags.
class SignalListener
{
public:
    virtual ~SignalListener() = default;

    virtual void pump() = 0;

    // Drops queued key events except stop requests.
    virtual void discard_pending() {}
};
