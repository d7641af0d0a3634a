#include "command.h"

#include <cctype>
#include <sstream>
#include <vector>

namespace
{
    std::vector<std::string> tokenize(const std::string& line)
    {
        std::istringstream stream(line);
        std::vector<std::string> tokens;
        std::string token;
        while (stream >> token)
        {
            tokens.push_back(token);
        }
        return tokens;
    }

    std::string to_lower_copy(const std::string& text)
    {
        std::string lowered;
        lowered.reserve(text.size());
        for (char ch : text)
        {
            lowered.push_back(static_cast<char>(std::tolower(static_cast<unsigned char>(ch))));
        }
        return lowered;
    }
}

std::optional<Command> parse_command(const std::string& line)
{
    const std::vector<std::string> tokens = tokenize(line);
    if (tokens.size() != 1)
    {
        return std::nullopt;
    }

    const std::string command = to_lower_copy(tokens.front());

    if (command == "g")
    {
        return Command::Record;
    }
    if (command == "w")
    {
        return Command::Next;
    }
    if (command == "b")
    {
        return Command::Previous;
    }
    if (command == "q")
    {
        return Command::Quit;
    }
    return std::nullopt;
}

std::string to_string(Command command)
{
    switch (command)
    {
    case Command::Record: return "record";
    case Command::Next: return "next";
    case Command::Previous: return "previous";
    case Command::Quit: return "quit";
    }
    return {};
}
