#pragma once

#include "recording.h"

class SignalListener;
struct SessionSignals;

// Fixed-rate capture: one sample per tick until the duration runs out or the
// operator asks to end the episode early.
class TimedRecorder : public Recorder
{
public:
    TimedRecorder(SampleSource& source,
                  EpisodeStore& store,
                  SignalListener& listener,
                  SessionSignals& signals,
                  int fps);

    RecordOutcome record(const std::string& task, double durationSeconds) override;

    [[nodiscard]] std::size_t last_frame_count() const noexcept;

private:
    SampleSource& source_;
    EpisodeStore& store_;
    SignalListener& listener_;
    SessionSignals& signals_;
    int fps_;
    std::size_t lastFrameCount_{0};
};
