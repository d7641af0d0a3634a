#include "session.h"

#include <sstream>
#include <thread>

#include "errors.h"
#include "move_indexer.h"
#include "operator_io.h"
#include "recording.h"
#include "signals.h"

std::string make_task_label(const std::string& fen, const std::string& san)
{
    return "FEN: " + fen + " $$ MOVE: " + san;
}

RecordingSession::RecordingSession(const MoveIndexer& indexer,
                                   Collaborators collaborators,
                                   SessionSignals& signals,
                                   SessionSettings settings)
    : indexer_(indexer),
      io_(collaborators),
      signals_(signals),
      settings_(settings)
{
    if (indexer_.empty())
    {
        throw EmptyFilteredSequence("No moves found for color '" + to_string(indexer_.filter()) +
                                    "' in the PGN file.");
    }
}

SessionSummary RecordingSession::run()
{
    io_.setupCheck.verify_setup();

    while (!state_.stop && state_.moveIdx < indexer_.length())
    {
        if (signals_.stopRecording)
        {
            state_.stop = true;
            break;
        }

        const IndexedMove entry = indexer_.get(state_.moveIdx);
        present(entry);

        const Command command = await_command();
        if (command == Command::Quit)
        {
            state_.stop = true;
            break;
        }

        switch (command)
        {
        case Command::Next:
            step_forward();
            break;
        case Command::Previous:
            step_back();
            break;
        case Command::Record:
            record(entry);
            break;
        case Command::Quit:
            break;
        }
    }

    io_.announcer.say("Stop recording");

    SessionSummary summary;
    summary.recordedEpisodes = state_.recordedEpisodes;
    summary.lastIndex = state_.moveIdx;
    summary.stoppedEarly = state_.stop;
    return summary;
}

const SessionState& RecordingSession::state() const noexcept
{
    return state_;
}

void RecordingSession::present(const IndexedMove& entry)
{
    const std::string rule(60, '=');
    std::ostringstream text;
    text << '\n' << rule << '\n'
         << "Move " << state_.moveIdx + 1 << '/' << indexer_.length() << ": " << entry.san << '\n'
         << "FEN: " << entry.fen << '\n'
         << rule;

    io_.display.show_text(text.str());
    io_.display.show_image(entry.image);
}

Command RecordingSession::await_command()
{
    io_.display.show_text(std::string("\n") + CommandPrompt);
    io_.input.discard_pending();

    while (true)
    {
        const std::optional<std::string> line = io_.input.read_line();
        if (!line)
        {
            return Command::Quit;
        }

        const std::optional<Command> command = parse_command(*line);
        if (command)
        {
            return *command;
        }
        io_.display.show_text(InvalidCommandMessage);
    }
}

void RecordingSession::step_forward()
{
    if (state_.moveIdx + 1 >= indexer_.length())
    {
        io_.display.show_text("Already at the last move.");
        return;
    }
    ++state_.moveIdx;
}

void RecordingSession::step_back()
{
    if (state_.moveIdx == 0)
    {
        io_.display.show_text("Already at the first move.");
        return;
    }
    --state_.moveIdx;
}

void RecordingSession::record(const IndexedMove& entry)
{
    state_.pendingTaskLabel = make_task_label(entry.fen, entry.san);
    io_.display.show_text("Recording move " + std::to_string(state_.moveIdx + 1) + " with task:\n" +
                          *state_.pendingTaskLabel);
    io_.announcer.say("Recording move " + std::to_string(state_.moveIdx + 1) + " of " +
                      std::to_string(indexer_.length()));

    const RecordOutcome outcome = io_.recorder.record(*state_.pendingTaskLabel, settings_.episodeTimeSec);

    if (outcome == RecordOutcome::ReRecordRequested || signals_.rerecordEpisode)
    {
        io_.announcer.say("Re-record episode");
        signals_.consume_rerecord();
        signals_.clear_exit_early();
        io_.store.discard_current_episode();
        return;
    }

    if (outcome == RecordOutcome::StopRequested)
    {
        io_.store.discard_current_episode();
        state_.pendingTaskLabel.reset();
        state_.stop = true;
        return;
    }

    io_.store.commit_current_episode();
    ++state_.recordedEpisodes;
    state_.pendingTaskLabel.reset();
    signals_.clear_exit_early();

    if (settings_.checkpointInterval > 0 && state_.recordedEpisodes % settings_.checkpointInterval == 0)
    {
        checkpoint();
    }

    ++state_.moveIdx;
}

void RecordingSession::checkpoint()
{
    io_.announcer.say("Please modify the lighting and chessboard position");
    if (settings_.checkpointPause.count() > 0)
    {
        std::this_thread::sleep_for(settings_.checkpointPause);
    }
    io_.setupCheck.verify_setup();
}
