#include "console.h"

#include <termios.h>
#include <unistd.h>

#include <iostream>

StreamOperatorInput::StreamOperatorInput(std::istream& in)
    : in_(in)
{
}

void StreamOperatorInput::discard_pending()
{
    if (&in_ == &std::cin && isatty(STDIN_FILENO))
    {
        tcflush(STDIN_FILENO, TCIFLUSH);
    }
}

std::optional<std::string> StreamOperatorInput::read_line()
{
    std::string line;
    if (!std::getline(in_, line))
    {
        return std::nullopt;
    }
    return line;
}

ConsoleAnnouncer::ConsoleAnnouncer(std::ostream& out, bool enabled)
    : out_(out),
      enabled_(enabled)
{
}

void ConsoleAnnouncer::say(const std::string& message)
{
    if (enabled_)
    {
        out_ << "[say] " << message << std::endl;
    }
}

Sample ClockSampleSource::capture(std::size_t frameIndex, double timestamp)
{
    Sample sample;
    sample.frameIndex = frameIndex;
    sample.timestamp = timestamp;
    return sample;
}
