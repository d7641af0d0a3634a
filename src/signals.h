#pragma once

#include <atomic>

// Operator interrupts raised by a key listener while a recording or display call is running.
// The listener only sets flags; the session controller reads and clears them between steps.
struct SessionSignals
{
    std::atomic<bool> exitEarly{false};
    std::atomic<bool> rerecordEpisode{false};
    std::atomic<bool> stopRecording{false};

    void request_exit_early() noexcept { exitEarly = true; }

    void request_rerecord() noexcept
    {
        rerecordEpisode = true;
        exitEarly = true;
    }

    void request_stop() noexcept
    {
        stopRecording = true;
        exitEarly = true;
    }

    // Returns the re-record flag and clears it together with exit-early.
    bool consume_rerecord() noexcept
    {
        const bool requested = rerecordEpisode.exchange(false);
        if (requested)
        {
            exitEarly = false;
        }
        return requested;
    }

    void clear_exit_early() noexcept { exitEarly = false; }
};
