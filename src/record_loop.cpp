#include "record_loop.h"

#include <chrono>
#include <stdexcept>
#include <thread>

#include "operator_io.h"
#include "signals.h"

std::string to_string(RecordOutcome outcome)
{
    switch (outcome)
    {
    case RecordOutcome::Committed: return "committed";
    case RecordOutcome::ReRecordRequested: return "re-record requested";
    case RecordOutcome::StopRequested: return "stop requested";
    }
    return {};
}

TimedRecorder::TimedRecorder(SampleSource& source,
                             EpisodeStore& store,
                             SignalListener& listener,
                             SessionSignals& signals,
                             int fps)
    : source_(source),
      store_(store),
      listener_(listener),
      signals_(signals),
      fps_(fps)
{
    if (fps_ <= 0)
    {
        throw std::invalid_argument("fps must be positive, got " + std::to_string(fps_));
    }
}

RecordOutcome TimedRecorder::record(const std::string& task, double durationSeconds)
{
    using Clock = std::chrono::steady_clock;

    // Arrow keys pressed at the prompt belong to no episode. A pending stop is kept.
    listener_.discard_pending();
    if (!signals_.stopRecording)
    {
        signals_.rerecordEpisode = false;
        signals_.clear_exit_early();
    }

    store_.begin_episode(task);

    const auto tick = std::chrono::duration_cast<Clock::duration>(std::chrono::duration<double>(1.0 / fps_));
    const auto start = Clock::now();
    const auto deadline = start + std::chrono::duration_cast<Clock::duration>(
                                      std::chrono::duration<double>(durationSeconds));

    std::size_t frame = 0;
    auto nextTick = start;

    while (Clock::now() < deadline)
    {
        listener_.pump();
        if (signals_.exitEarly)
        {
            break;
        }

        const double timestamp = std::chrono::duration<double>(Clock::now() - start).count();
        store_.add_sample(source_.capture(frame, timestamp));
        ++frame;

        nextTick += tick;
        std::this_thread::sleep_until(nextTick);
    }

    lastFrameCount_ = frame;

    if (signals_.rerecordEpisode)
    {
        return RecordOutcome::ReRecordRequested;
    }
    if (signals_.stopRecording)
    {
        return RecordOutcome::StopRequested;
    }
    return RecordOutcome::Committed;
}

std::size_t TimedRecorder::last_frame_count() const noexcept
{
    return lastFrameCount_;
}
