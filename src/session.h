#pragma once

#include <chrono>
#include <cstddef>
#include <optional>
#include <string>

#include "command.h"

class Announcer;
class Display;
class EpisodeStore;
class MoveIndexer;
class OperatorInput;
class Recorder;
class SetupCheck;
struct IndexedMove;
struct SessionSignals;

struct SessionSettings
{
    double episodeTimeSec{60.0};
    int checkpointInterval{5};
    std::chrono::milliseconds checkpointPause{2000};
};

struct SessionState
{
    std::size_t moveIdx{0};
    int recordedEpisodes{0};
    std::optional<std::string> pendingTaskLabel;
    bool stop{false};
};

struct SessionSummary
{
    int recordedEpisodes{0};
    std::size_t lastIndex{0};
    bool stoppedEarly{false};
};

std::string make_task_label(const std::string& fen, const std::string& san);

// Walks the indexed moves with the operator: present, wait for a command, then
// navigate or record. A committed episode advances to the next move, a re-record
// keeps the index. Every checkpointInterval commits the operator re-checks the setup.
class RecordingSession
{
public:
    struct Collaborators
    {
        Recorder& recorder;
        EpisodeStore& store;
        Display& display;
        OperatorInput& input;
        SetupCheck& setupCheck;
        Announcer& announcer;
    };

    // Throws EmptyFilteredSequence when the indexer holds no moves.
    RecordingSession(const MoveIndexer& indexer,
                     Collaborators collaborators,
                     SessionSignals& signals,
                     SessionSettings settings = {});

    // Runs until the last move is recorded, the operator quits or a stop signal arrives.
    // Exceptions from the collaborators are not caught.
    SessionSummary run();

    [[nodiscard]] const SessionState& state() const noexcept;

private:
    const MoveIndexer& indexer_;
    Collaborators io_;
    SessionSignals& signals_;
    SessionSettings settings_;
    SessionState state_;

    void present(const IndexedMove& entry);
    [[nodiscard]] Command await_command();
    void step_forward();
    void step_back();
    void record(const IndexedMove& entry);
    void checkpoint();
};
