#pragma once

#include <filesystem>
#include <map>
#include <string>

constexpr int DefaultFps = 30;
constexpr double DefaultEpisodeTimeSec = 60.0;
constexpr bool DefaultPlaySounds = true;
constexpr int CheckpointInterval = 5;
constexpr int CheckpointPauseMs = 2000;

struct RecorderConfig
{
    int fps{DefaultFps};
    double episodeTimeSec{DefaultEpisodeTimeSec};
    bool playSounds{DefaultPlaySounds};
    int checkpointInterval{CheckpointInterval};
    int checkpointPauseMs{CheckpointPauseMs};

    std::string idFollower;
    std::string idLeader;
    std::string portFollower;
    std::string portLeader;

    std::filesystem::path pieceAssetsDir;
    std::filesystem::path datasetRoot;
};

namespace config
{
    using Environment = std::map<std::string, std::string>;

    // KEY=VALUE lines; blank lines and '#' comments are skipped, an "export " prefix and
    // matching quotes around the value are stripped. Missing file gives an empty map.
    Environment read_env_file(const std::filesystem::path& path);

    // Process environment first, then values from the .env file for keys it does not set.
    Environment merged_environment(const std::filesystem::path& envFile);

    // Throws ConfigError when a required variable is missing or a number does not parse.
    RecorderConfig load(const Environment& env);

    RecorderConfig load_from_process(const std::filesystem::path& envFile = ".env");

    std::filesystem::path default_dataset_root(const Environment& env);
}
