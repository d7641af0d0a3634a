#include <catch2/catch.hpp>

#include <filesystem>
#include <fstream>
#include <optional>
#include <sstream>
#include <stdexcept>
#include <string>

#include "dataset.h"

namespace
{
    struct ScratchDir
    {
        std::filesystem::path path;

        explicit ScratchDir(const std::string& name)
            : path(std::filesystem::temp_directory_path() / name)
        {
            std::filesystem::remove_all(path);
        }

        ~ScratchDir() { std::filesystem::remove_all(path); }
    };

    std::string read_all(const std::filesystem::path& path)
    {
        std::ifstream in(path);
        std::ostringstream contents;
        contents << in.rdbuf();
        return contents.str();
    }

    Sample make_sample(std::size_t frame)
    {
        Sample sample;
        sample.frameIndex = frame;
        sample.timestamp = static_cast<double>(frame) / 30.0;
        sample.action = {0.5f, 1.0f};
        sample.observation = {2.0f};
        return sample;
    }

    DatasetInfo make_info()
    {
        DatasetInfo info;
        info.repoId = "operator/chess_white";
        info.colorFilter = "white";
        return info;
    }
}

TEST_CASE("Episode store writes committed episodes", "[dataset]")
{
    ScratchDir scratch("pgn_teleop_recorder_dataset_commit");
    FileEpisodeStore store(scratch.path, make_info());

    store.begin_episode("FEN: start $$ MOVE: e4");
    store.add_sample(make_sample(0));
    store.add_sample(make_sample(1));
    REQUIRE(store.buffered_frames() == 2);
    store.commit_current_episode();

    REQUIRE(store.episode_count() == 1);
    REQUIRE(store.total_frames() == 2);
    REQUIRE_FALSE(store.has_open_episode());

    const std::string episode = read_all(FileEpisodeStore::episode_path(scratch.path, 0));
    REQUIRE(episode.find("task FEN: start $$ MOVE: e4\n") != std::string::npos);
    REQUIRE(episode.find("frames 2\n") != std::string::npos);

    REQUIRE(read_all(scratch.path / "tasks.txt") == "0\tFEN: start $$ MOVE: e4\n");

    const std::optional<DatasetMeta> meta = dataset::load_meta(scratch.path);
    REQUIRE(meta.has_value());
    REQUIRE(meta->repoId == "operator/chess_white");
    REQUIRE(meta->colorFilter == "white");
    REQUIRE(meta->episodes == 1);
    REQUIRE(meta->totalFrames == 2);
    REQUIRE(meta->fps == 30);
}

TEST_CASE("Episode store discards without writing", "[dataset]")
{
    ScratchDir scratch("pgn_teleop_recorder_dataset_discard");
    FileEpisodeStore store(scratch.path, make_info());

    store.begin_episode("retry");
    store.add_sample(make_sample(0));
    store.discard_current_episode();

    REQUIRE(store.episode_count() == 0);
    REQUIRE(store.buffered_frames() == 0);
    REQUIRE_FALSE(std::filesystem::exists(FileEpisodeStore::episode_path(scratch.path, 0)));
}

TEST_CASE("Episode store needs an open episode", "[dataset]")
{
    ScratchDir scratch("pgn_teleop_recorder_dataset_closed");
    FileEpisodeStore store(scratch.path, make_info());

    REQUIRE_THROWS_AS(store.add_sample(make_sample(0)), std::logic_error);
    REQUIRE_THROWS_AS(store.commit_current_episode(), std::logic_error);
}

TEST_CASE("Episode store resumes numbering", "[dataset]")
{
    ScratchDir scratch("pgn_teleop_recorder_dataset_resume");
    {
        FileEpisodeStore store(scratch.path, make_info());
        store.begin_episode("first");
        store.commit_current_episode();
    }

    FileEpisodeStore reopened(scratch.path, make_info());
    REQUIRE(reopened.episode_count() == 1);
    reopened.begin_episode("second");
    reopened.commit_current_episode();
    REQUIRE(std::filesystem::exists(FileEpisodeStore::episode_path(scratch.path, 1)));
}

TEST_CASE("Episode store refuses a corrupt episode count", "[dataset]")
{
    ScratchDir scratch("pgn_teleop_recorder_dataset_corrupt");
    {
        FileEpisodeStore store(scratch.path, make_info());
        store.begin_episode("first");
        store.commit_current_episode();
    }
    {
        std::ofstream meta(scratch.path / "meta.txt", std::ios::trunc);
        meta << "repo_id operator/chess_white\nepisodes abc\ntotal_frames 0\n";
    }

    REQUIRE_THROWS_AS(dataset::load_meta(scratch.path), std::runtime_error);
    REQUIRE_THROWS_AS(FileEpisodeStore(scratch.path, make_info()), std::runtime_error);
    REQUIRE(read_all(scratch.path / "meta.txt").find("episodes abc") != std::string::npos);
    REQUIRE(std::filesystem::exists(FileEpisodeStore::episode_path(scratch.path, 0)));
}

TEST_CASE("Episode store copies the game file", "[dataset]")
{
    ScratchDir source("pgn_teleop_recorder_dataset_source");
    ScratchDir scratch("pgn_teleop_recorder_dataset_copy");
    std::filesystem::create_directories(source.path);
    {
        std::ofstream out(source.path / "game.pgn");
        out << "1. e4 *\n";
    }

    DatasetInfo info = make_info();
    info.pgnPath = source.path / "game.pgn";
    const FileEpisodeStore store(scratch.path, info);

    REQUIRE(read_all(scratch.path / "game.pgn") == "1. e4 *\n");
    REQUIRE(dataset::load_meta(scratch.path)->pgnFile == "game.pgn");
}

TEST_CASE("Dataset directory is the root joined with the repo id", "[dataset]")
{
    REQUIRE(dataset::dataset_dir("/data", "operator/chess") == std::filesystem::path("/data/operator/chess"));
}
