#pragma once

#include <cstddef>
#include <string>
#include <vector>

enum class RecordOutcome
{
    Committed,
    ReRecordRequested,
    StopRequested
};

std::string to_string(RecordOutcome outcome);

// One synchronized tick of teleoperation data.
struct Sample
{
    std::size_t frameIndex{0};
    double timestamp{0.0};
    std::vector<float> action;
    std::vector<float> observation;
};

class SampleSource
{
public:
    virtual ~SampleSource() = default;

    // Called once per control tick while an episode is being captured.
    virtual Sample capture(std::size_t frameIndex, double timestamp) = 0;
};

// Holds the samples of the open episode until it is committed or thrown away.
class EpisodeStore
{
public:
    virtual ~EpisodeStore() = default;

    virtual void begin_episode(const std::string& task) = 0;
    virtual void add_sample(const Sample& sample) = 0;
    virtual void commit_current_episode() = 0;
    virtual void discard_current_episode() = 0;

    [[nodiscard]] virtual std::size_t episode_count() const = 0;
};

// Captures one episode labelled with task, for at most durationSeconds.
class Recorder
{
public:
    virtual ~Recorder() = default;

    virtual RecordOutcome record(const std::string& task, double durationSeconds) = 0;
};
