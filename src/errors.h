#pragma once

#include <stdexcept>
#include <string>

// The game source could not be read, or holds no playable mainline.
class InvalidGameError : public std::runtime_error
{
public:
    explicit InvalidGameError(const std::string& message)
        : std::runtime_error(message)
    {
    }
};

class IndexOutOfRange : public std::out_of_range
{
public:
    explicit IndexOutOfRange(const std::string& message)
        : std::out_of_range(message)
    {
    }
};

// The color filter left nothing to record.
class EmptyFilteredSequence : public std::runtime_error
{
public:
    explicit EmptyFilteredSequence(const std::string& message)
        : std::runtime_error(message)
    {
    }
};

class ConfigError : public std::runtime_error
{
public:
    explicit ConfigError(const std::string& message)
        : std::runtime_error(message)
    {
    }
};
