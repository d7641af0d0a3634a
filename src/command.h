#pragma once

#include <optional>
#include <string>

enum class Command
{
    Record,
    Next,
    Previous,
    Quit
};

// g / w / b / q, case-insensitive, surrounding whitespace ignored.
// Anything else is not a command and yields std::nullopt.
std::optional<Command> parse_command(const std::string& line);

std::string to_string(Command command);

inline const char* const CommandPrompt =
    "Press 'g' to start recording, 'w' for next move, 'b' for previous move, or 'q' to quit...";
inline const char* const InvalidCommandMessage =
    "Invalid input. Press 'g' to record, 'w' for next, 'b' for previous, or 'q' to quit.";
