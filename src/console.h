#pragma once

#include <cstddef>
#include <iosfwd>
#include <optional>
#include <string>

#include "operator_io.h"
#include "recording.h"

// Line input from a stream; stdin by default.
class StreamOperatorInput : public OperatorInput
{
public:
    explicit StreamOperatorInput(std::istream& in);

    // Flushes unread terminal input when the stream is stdin attached to a tty.
    void discard_pending() override;
    std::optional<std::string> read_line() override;

private:
    std::istream& in_;
};

// Prints announcements with a "[say]" prefix; silent when disabled.
class ConsoleAnnouncer : public Announcer
{
public:
    ConsoleAnnouncer(std::ostream& out, bool enabled);

    void say(const std::string& message) override;

private:
    std::ostream& out_;
    bool enabled_;
};

// Sample source used when no robot driver is linked: timestamps only,
// with empty action and observation vectors.
class ClockSampleSource : public SampleSource
{
public:
    Sample capture(std::size_t frameIndex, double timestamp) override;
};
