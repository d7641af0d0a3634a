#include "config.h"
#include "console.h"
#include "dataset.h"
#include "errors.h"
#include "move_indexer.h"
#include "record_loop.h"
#include "session.h"
#include "signals.h"
#include "viewer.h"

#include <chrono>
#include <filesystem>
#include <iostream>
#include <memory>
#include <optional>
#include <string>

namespace
{
    struct CliOptions
    {
        std::filesystem::path pgnPath;
        std::string repoId;
        std::string color;
        bool help{false};
    };

    void print_usage(std::ostream& out)
    {
        out << "Usage: pgn_teleop_recorder --pgn_path <file.pgn> --repo_id <user/dataset> --color <white|black>\n"
            << "\n"
            << "Steps through the moves of one side of a PGN game and records a teleoperation\n"
            << "episode per move. Operator commands: g record, w next, b previous, q quit.\n"
            << "Viewer keys while recording: Right end episode, Left re-record, Escape stop.\n";
    }

    // Accepts "--name value" and "--name=value". Returns std::nullopt on a usage error.
    std::optional<CliOptions> parse_args(int argc, char* argv[])
    {
        CliOptions options;

        for (int i = 1; i < argc; ++i)
        {
            std::string arg = argv[i];
            if (arg == "--help" || arg == "-h")
            {
                options.help = true;
                return options;
            }

            std::string value;
            const std::size_t equals = arg.find('=');
            if (equals != std::string::npos)
            {
                value = arg.substr(equals + 1);
                arg = arg.substr(0, equals);
            }
            else if (i + 1 < argc)
            {
                value = argv[++i];
            }
            else
            {
                std::cerr << "missing value for " << arg << '\n';
                return std::nullopt;
            }

            if (arg == "--pgn_path")
            {
                options.pgnPath = value;
            }
            else if (arg == "--repo_id")
            {
                options.repoId = value;
            }
            else if (arg == "--color")
            {
                options.color = value;
            }
            else
            {
                std::cerr << "unknown argument " << arg << '\n';
                return std::nullopt;
            }
        }

        if (options.pgnPath.empty() || options.repoId.empty() || options.color.empty())
        {
            std::cerr << "--pgn_path, --repo_id and --color are required\n";
            return std::nullopt;
        }
        return options;
    }

    // Returns false when the operator keeps the existing dataset.
    bool confirm_fresh_dataset(const std::filesystem::path& dir)
    {
        if (!std::filesystem::exists(dir))
        {
            return true;
        }

        std::cout << "Dataset " << dir.string() << " already exists. Delete it? (y/n) " << std::flush;
        std::string answer;
        if (!std::getline(std::cin, answer) || (answer != "y" && answer != "Y"))
        {
            std::cout << "Keeping the existing dataset; nothing recorded." << std::endl;
            return false;
        }

        std::filesystem::remove_all(dir);
        std::cout << "Deleted " << dir.string() << std::endl;
        return true;
    }

    int run(const CliOptions& options)
    {
        const std::optional<ColorFilter> filter = parse_color_filter(options.color);
        if (!filter || *filter == ColorFilter::None)
        {
            std::cerr << "--color must be 'white' or 'black', got '" << options.color << "'\n";
            return 1;
        }

        const RecorderConfig cfg = config::load_from_process();
        const std::filesystem::path dir = dataset::dataset_dir(cfg.datasetRoot, options.repoId);

        if (!confirm_fresh_dataset(dir))
        {
            return 0;
        }

        render::RenderOptions renderOptions;
        renderOptions.pieceAssetsDir = cfg.pieceAssetsDir;

        const MoveIndexer indexer = MoveIndexer::from_pgn_file(options.pgnPath, *filter, renderOptions);
        if (indexer.empty())
        {
            throw EmptyFilteredSequence("No moves found for color '" + to_string(*filter) + "' in the PGN file.");
        }
        std::cout << "Found " << indexer.length() << " moves for " << to_string(*filter) << std::endl;

        DatasetInfo info;
        info.repoId = options.repoId;
        info.colorFilter = to_string(*filter);
        info.pgnPath = options.pgnPath;
        info.fps = cfg.fps;
        FileEpisodeStore store(dir, info);

        SessionSignals signals;
        ConsoleAnnouncer announcer(std::cout, cfg.playSounds);
        StreamOperatorInput input(std::cin);

        std::unique_ptr<SdlViewer> sdlViewer;
        std::unique_ptr<ConsoleViewer> consoleViewer;
        Display* display = nullptr;
        SignalListener* listener = nullptr;
        SetupCheck* setupCheck = nullptr;

        try
        {
            sdlViewer = std::make_unique<SdlViewer>(signals, announcer, "pgn_teleop_recorder");
            display = sdlViewer.get();
            listener = sdlViewer.get();
            setupCheck = sdlViewer.get();
        }
        catch (const std::runtime_error& e)
        {
            std::cerr << e.what() << "; using the console viewer\n";
            consoleViewer = std::make_unique<ConsoleViewer>(signals, announcer, input, dir / "current_move.png");
            display = consoleViewer.get();
            listener = consoleViewer.get();
            setupCheck = consoleViewer.get();
        }

        std::cerr << "No robot driver linked for follower '" << cfg.idFollower << "' on " << cfg.portFollower
                  << " and leader '" << cfg.idLeader << "' on " << cfg.portLeader
                  << "; episodes hold timestamps only\n";
        ClockSampleSource source;

        TimedRecorder recorder(source, store, *listener, signals, cfg.fps);

        SessionSettings settings;
        settings.episodeTimeSec = cfg.episodeTimeSec;
        settings.checkpointInterval = cfg.checkpointInterval;
        settings.checkpointPause = std::chrono::milliseconds(cfg.checkpointPauseMs);

        RecordingSession session(
            indexer,
            RecordingSession::Collaborators{recorder, store, *display, input, *setupCheck, announcer},
            signals,
            settings);

        const SessionSummary summary = session.run();

        std::cout << "Recorded " << summary.recordedEpisodes << " episodes in this session ("
                  << store.episode_count() << " total, " << store.total_frames() << " frames) in "
                  << store.dir().string() << std::endl;
        return 0;
    }
}

int main(int argc, char* argv[])
{
    const std::optional<CliOptions> options = parse_args(argc, argv);
    if (!options)
    {
        print_usage(std::cerr);
        return 1;
    }
    if (options->help)
    {
        print_usage(std::cout);
        return 0;
    }

    try
    {
        return run(*options);
    }
    catch (const std::exception& e)
    {
        std::cerr << "error: " << e.what() << '\n';
        return 1;
    }
}
