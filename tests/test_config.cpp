#include <catch2/catch.hpp>

#include <filesystem>
#include <fstream>

#include "config.h"
#include "errors.h"

namespace
{
    config::Environment robot_environment()
    {
        return {
            {"ID_FOLLOWER", "follower_arm"},
            {"ID_LEADER", "leader_arm"},
            {"PORT_FOLLOWER", "/dev/ttyACM0"},
            {"PORT_LEADER", "/dev/ttyACM1"},
            {"HOME", "/home/operator"},
        };
    }
}

TEST_CASE("Config uses fixed defaults", "[config]")
{
    const RecorderConfig cfg = config::load(robot_environment());

    REQUIRE(cfg.fps == 30);
    REQUIRE(cfg.episodeTimeSec == Approx(60.0));
    REQUIRE(cfg.playSounds);
    REQUIRE(cfg.checkpointInterval == 5);
    REQUIRE(cfg.checkpointPauseMs == 2000);
    REQUIRE(cfg.idFollower == "follower_arm");
    REQUIRE(cfg.portLeader == "/dev/ttyACM1");
    REQUIRE(cfg.datasetRoot == std::filesystem::path("/home/operator/.cache/huggingface/lerobot"));
}

TEST_CASE("Config names the missing robot variable", "[config]")
{
    config::Environment env = robot_environment();
    env.erase("PORT_LEADER");
    REQUIRE_THROWS_AS(config::load(env), ConfigError);
    REQUIRE_THROWS_WITH(config::load(env), Catch::Contains("PORT_LEADER"));

    env = robot_environment();
    env["ID_FOLLOWER"] = "";
    REQUIRE_THROWS_WITH(config::load(env), Catch::Contains("ID_FOLLOWER"));
}

TEST_CASE("Config applies optional overrides", "[config]")
{
    config::Environment env = robot_environment();
    env["FPS"] = "15";
    env["EPISODE_TIME_SEC"] = "12.5";
    env["PLAY_SOUNDS"] = "off";
    env["PIECE_ASSETS_DIR"] = "/opt/pieces";

    const RecorderConfig cfg = config::load(env);
    REQUIRE(cfg.fps == 15);
    REQUIRE(cfg.episodeTimeSec == Approx(12.5));
    REQUIRE_FALSE(cfg.playSounds);
    REQUIRE(cfg.pieceAssetsDir == std::filesystem::path("/opt/pieces"));
}

TEST_CASE("Config rejects unparsable overrides", "[config]")
{
    config::Environment env = robot_environment();
    env["FPS"] = "fast";
    REQUIRE_THROWS_AS(config::load(env), ConfigError);

    env = robot_environment();
    env["EPISODE_TIME_SEC"] = "-1";
    REQUIRE_THROWS_AS(config::load(env), ConfigError);

    env = robot_environment();
    env["PLAY_SOUNDS"] = "maybe";
    REQUIRE_THROWS_AS(config::load(env), ConfigError);
}

TEST_CASE("Config wants a whole positive frame rate", "[config]")
{
    for (const char* fps : {"0", "0.5", "1e20", "30fps", "99999999999"})
    {
        config::Environment env = robot_environment();
        env["FPS"] = fps;
        INFO("FPS=" << fps);
        REQUIRE_THROWS_AS(config::load(env), ConfigError);
    }
}

TEST_CASE("Env file lines are parsed", "[config]")
{
    const std::filesystem::path path = std::filesystem::temp_directory_path() / "pgn_teleop_recorder_test.env";
    {
        std::ofstream out(path);
        out << "# robot identity\n"
            << "ID_FOLLOWER=follower_arm\n"
            << "export ID_LEADER = \"leader arm\"\n"
            << "PORT_FOLLOWER='/dev/ttyACM0'\n"
            << "\n"
            << "not a pair\n";
    }

    const config::Environment env = config::read_env_file(path);
    std::filesystem::remove(path);

    REQUIRE(env.size() == 3);
    REQUIRE(env.at("ID_FOLLOWER") == "follower_arm");
    REQUIRE(env.at("ID_LEADER") == "leader arm");
    REQUIRE(env.at("PORT_FOLLOWER") == "/dev/ttyACM0");

    REQUIRE(config::read_env_file(path).empty());
}
