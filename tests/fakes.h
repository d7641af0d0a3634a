#pragma once

#include <cstddef>
#include <deque>
#include <functional>
#include <optional>
#include <string>
#include <utility>
#include <vector>

#include "operator_io.h"
#include "recording.h"
#include "render.h"

// In-memory collaborators shared by the recorder and session tests.

struct MemoryEpisodeStore : EpisodeStore
{
    std::optional<std::string> openTask;
    std::vector<Sample> buffer;
    std::vector<std::string> committedTasks;
    std::vector<std::size_t> committedFrames;
    int discards{0};

    void begin_episode(const std::string& task) override
    {
        openTask = task;
        buffer.clear();
    }

    void add_sample(const Sample& sample) override { buffer.push_back(sample); }

    void commit_current_episode() override
    {
        committedTasks.push_back(openTask.value_or(""));
        committedFrames.push_back(buffer.size());
        openTask.reset();
        buffer.clear();
    }

    void discard_current_episode() override
    {
        ++discards;
        openTask.reset();
        buffer.clear();
    }

    [[nodiscard]] std::size_t episode_count() const override { return committedTasks.size(); }
};

struct CountingSampleSource : SampleSource
{
    std::size_t captures{0};

    Sample capture(std::size_t frameIndex, double timestamp) override
    {
        ++captures;
        Sample sample;
        sample.frameIndex = frameIndex;
        sample.timestamp = timestamp;
        sample.action = {static_cast<float>(frameIndex)};
        return sample;
    }
};

// Runs an action on the n-th pump (1-based).
struct ScriptedListener : SignalListener
{
    int pumps{0};
    int discards{0};
    int fireOn{0};
    std::function<void()> action;

    void discard_pending() override { ++discards; }

    void pump() override
    {
        ++pumps;
        if (pumps == fireOn && action)
        {
            action();
        }
    }
};

struct RecordingDisplay : Display
{
    std::vector<std::string> lines;
    int images{0};
    // Called with the running image count after each image.
    std::function<void(int)> onImage;

    void show_text(const std::string& text) override { lines.push_back(text); }

    void show_image(const render::Image&) override
    {
        ++images;
        if (onImage)
        {
            onImage(images);
        }
    }

    [[nodiscard]] int count(const std::string& text) const
    {
        int n = 0;
        for (const std::string& line : lines)
        {
            if (line.find(text) != std::string::npos)
            {
                ++n;
            }
        }
        return n;
    }
};

struct ScriptedInput : OperatorInput
{
    std::deque<std::string> lines;
    int discards{0};

    explicit ScriptedInput(std::deque<std::string> script)
        : lines(std::move(script))
    {
    }

    void discard_pending() override { ++discards; }

    std::optional<std::string> read_line() override
    {
        if (lines.empty())
        {
            return std::nullopt;
        }
        std::string line = lines.front();
        lines.pop_front();
        return line;
    }
};

struct CountingSetupCheck : SetupCheck
{
    int checks{0};

    void verify_setup() override { ++checks; }
};

struct RecordingAnnouncer : Announcer
{
    std::vector<std::string> messages;

    void say(const std::string& message) override { messages.push_back(message); }
};
