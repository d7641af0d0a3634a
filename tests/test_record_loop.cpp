#include <catch2/catch.hpp>

#include <stdexcept>

#include "fakes.h"
#include "record_loop.h"
#include "signals.h"

TEST_CASE("Timed recorder captures until the duration runs out", "[record_loop]")
{
    CountingSampleSource source;
    MemoryEpisodeStore store;
    ScriptedListener listener;
    SessionSignals signals;
    TimedRecorder recorder(source, store, listener, signals, 100);

    const RecordOutcome outcome = recorder.record("FEN: x $$ MOVE: e4", 0.1);

    REQUIRE(outcome == RecordOutcome::Committed);
    REQUIRE(store.openTask == std::optional<std::string>("FEN: x $$ MOVE: e4"));
    REQUIRE(recorder.last_frame_count() > 0);
    REQUIRE(recorder.last_frame_count() <= 11);
    REQUIRE(store.buffer.size() == recorder.last_frame_count());
    REQUIRE(store.committedTasks.empty());
}

TEST_CASE("Timed recorder ends early on request", "[record_loop]")
{
    CountingSampleSource source;
    MemoryEpisodeStore store;
    ScriptedListener listener;
    SessionSignals signals;
    listener.fireOn = 3;
    listener.action = [&] { signals.request_exit_early(); };

    TimedRecorder recorder(source, store, listener, signals, 200);
    const RecordOutcome outcome = recorder.record("task", 30.0);

    REQUIRE(outcome == RecordOutcome::Committed);
    REQUIRE(recorder.last_frame_count() == 2);
    REQUIRE(source.captures == 2);
}

TEST_CASE("Timed recorder reports a re-record request", "[record_loop]")
{
    CountingSampleSource source;
    MemoryEpisodeStore store;
    ScriptedListener listener;
    SessionSignals signals;
    listener.fireOn = 2;
    listener.action = [&] { signals.request_rerecord(); };

    TimedRecorder recorder(source, store, listener, signals, 200);
    REQUIRE(recorder.record("task", 30.0) == RecordOutcome::ReRecordRequested);
    REQUIRE(recorder.last_frame_count() == 1);
}

TEST_CASE("Timed recorder reports a stop request", "[record_loop]")
{
    CountingSampleSource source;
    MemoryEpisodeStore store;
    ScriptedListener listener;
    SessionSignals signals;
    listener.fireOn = 1;
    listener.action = [&] { signals.request_stop(); };

    TimedRecorder recorder(source, store, listener, signals, 200);
    REQUIRE(recorder.record("task", 30.0) == RecordOutcome::StopRequested);
    REQUIRE(recorder.last_frame_count() == 0);
}

TEST_CASE("Timed recorder ignores keys pressed before the episode began", "[record_loop]")
{
    CountingSampleSource source;
    MemoryEpisodeStore store;
    ScriptedListener listener;
    SessionSignals signals;
    signals.request_exit_early();
    signals.request_rerecord();

    TimedRecorder recorder(source, store, listener, signals, 200);
    const RecordOutcome outcome = recorder.record("task", 0.05);

    REQUIRE(outcome == RecordOutcome::Committed);
    REQUIRE(listener.discards == 1);
    REQUIRE(recorder.last_frame_count() > 0);
    REQUIRE(store.buffer.size() == recorder.last_frame_count());
}

TEST_CASE("Timed recorder keeps a stop raised before the episode began", "[record_loop]")
{
    CountingSampleSource source;
    MemoryEpisodeStore store;
    ScriptedListener listener;
    SessionSignals signals;
    signals.request_stop();

    TimedRecorder recorder(source, store, listener, signals, 200);
    REQUIRE(recorder.record("task", 30.0) == RecordOutcome::StopRequested);
    REQUIRE(recorder.last_frame_count() == 0);
    REQUIRE(signals.stopRecording);
}

TEST_CASE("Timed recorder needs a positive rate", "[record_loop]")
{
    CountingSampleSource source;
    MemoryEpisodeStore store;
    ScriptedListener listener;
    SessionSignals signals;
    REQUIRE_THROWS_AS(TimedRecorder(source, store, listener, signals, 0), std::invalid_argument);
}

TEST_CASE("Record outcomes have readable names", "[record_loop]")
{
    REQUIRE(to_string(RecordOutcome::Committed) == "committed");
    REQUIRE(to_string(RecordOutcome::ReRecordRequested) == "re-record requested");
    REQUIRE(to_string(RecordOutcome::StopRequested) == "stop requested");
}
