#include "config.h"

#include <SDL.h>

#include <cctype>
#include <cstdlib>
#include <fstream>
#include <iostream>

#include "errors.h"

extern char** environ;

namespace
{
    std::string trim(const std::string& text)
    {
        const auto begin = text.find_first_not_of(" \t\r\n");
        if (begin == std::string::npos)
        {
            return {};
        }
        const auto end = text.find_last_not_of(" \t\r\n");
        return text.substr(begin, end - begin + 1);
    }

    std::string unquote(const std::string& value)
    {
        if (value.size() >= 2 &&
            (value.front() == '"' || value.front() == '\'') &&
            value.back() == value.front())
        {
            return value.substr(1, value.size() - 2);
        }
        return value;
    }

    std::string lookup(const config::Environment& env, const std::string& key)
    {
        const auto it = env.find(key);
        return it == env.end() ? std::string{} : it->second;
    }

    std::string require(const config::Environment& env, const std::string& key)
    {
        const std::string value = lookup(env, key);
        if (value.empty())
        {
            throw ConfigError(key + " is not set to environment variable");
        }
        return value;
    }

    double parse_number(const std::string& key, const std::string& value)
    {
        std::size_t consumed = 0;
        double parsed = 0.0;
        try
        {
            parsed = std::stod(value, &consumed);
        }
        catch (const std::exception&)
        {
            consumed = 0;
        }
        if (consumed != value.size() || parsed <= 0.0)
        {
            throw ConfigError(key + " must be a positive number, got '" + value + "'");
        }
        return parsed;
    }

    int parse_positive_int(const std::string& key, const std::string& value)
    {
        std::size_t consumed = 0;
        int parsed = 0;
        try
        {
            parsed = std::stoi(value, &consumed);
        }
        catch (const std::exception&)
        {
            consumed = 0;
        }
        if (consumed != value.size() || parsed <= 0)
        {
            throw ConfigError(key + " must be a positive integer, got '" + value + "'");
        }
        return parsed;
    }

    bool parse_flag(const std::string& key, const std::string& value)
    {
        std::string lowered;
        for (char ch : value)
        {
            lowered.push_back(static_cast<char>(std::tolower(static_cast<unsigned char>(ch))));
        }
        if (lowered == "1" || lowered == "true" || lowered == "yes" || lowered == "on")
        {
            return true;
        }
        if (lowered == "0" || lowered == "false" || lowered == "no" || lowered == "off")
        {
            return false;
        }
        throw ConfigError(key + " must be true or false, got '" + value + "'");
    }
}

namespace config
{
    Environment read_env_file(const std::filesystem::path& path)
    {
        Environment values;

        std::ifstream in(path);
        if (!in)
        {
            return values;
        }

        std::string line;
        while (std::getline(in, line))
        {
            std::string entry = trim(line);
            if (entry.empty() || entry.front() == '#')
            {
                continue;
            }
            if (entry.rfind("export ", 0) == 0)
            {
                entry = trim(entry.substr(7));
            }

            const std::size_t equals = entry.find('=');
            if (equals == std::string::npos || equals == 0)
            {
                std::cerr << "Ignoring malformed line in " << path << ": " << line << '\n';
                continue;
            }

            values[trim(entry.substr(0, equals))] = unquote(trim(entry.substr(equals + 1)));
        }

        return values;
    }

    Environment merged_environment(const std::filesystem::path& envFile)
    {
        Environment env = read_env_file(envFile);

        for (char** entry = environ; entry != nullptr && *entry != nullptr; ++entry)
        {
            const std::string text(*entry);
            const std::size_t equals = text.find('=');
            if (equals != std::string::npos)
            {
                env[text.substr(0, equals)] = text.substr(equals + 1);
            }
        }

        return env;
    }

    RecorderConfig load(const Environment& env)
    {
        RecorderConfig cfg;

        cfg.idFollower = require(env, "ID_FOLLOWER");
        cfg.idLeader = require(env, "ID_LEADER");
        cfg.portFollower = require(env, "PORT_FOLLOWER");
        cfg.portLeader = require(env, "PORT_LEADER");

        if (const std::string fps = lookup(env, "FPS"); !fps.empty())
        {
            cfg.fps = parse_positive_int("FPS", fps);
        }
        if (const std::string seconds = lookup(env, "EPISODE_TIME_SEC"); !seconds.empty())
        {
            cfg.episodeTimeSec = parse_number("EPISODE_TIME_SEC", seconds);
        }
        if (const std::string sounds = lookup(env, "PLAY_SOUNDS"); !sounds.empty())
        {
            cfg.playSounds = parse_flag("PLAY_SOUNDS", sounds);
        }

        cfg.pieceAssetsDir = lookup(env, "PIECE_ASSETS_DIR");
        cfg.datasetRoot = default_dataset_root(env);

        return cfg;
    }

    RecorderConfig load_from_process(const std::filesystem::path& envFile)
    {
        return load(merged_environment(envFile));
    }

    std::filesystem::path default_dataset_root(const Environment& env)
    {
        const std::string home = lookup(env, "HOME");
        if (!home.empty())
        {
            return std::filesystem::path(home) / ".cache" / "huggingface" / "lerobot";
        }

        std::filesystem::path dir;
        char* rawPath = SDL_GetPrefPath("pgn_teleop_recorder", "datasets");
        if (rawPath)
        {
            dir = std::filesystem::path(rawPath);
            SDL_free(rawPath);
        }
        else
        {
            dir = std::filesystem::temp_directory_path() / "pgn_teleop_recorder" / "datasets";
            std::cerr << "SDL_GetPrefPath failed; using temp directory " << dir << '\n';
        }
        return dir;
    }
}
