#include "dataset.h"

#include <cstdio>
#include <fstream>
#include <iostream>
#include <stdexcept>
#include <utility>

namespace
{
    std::string line_value(const std::string& line, const std::string& key)
    {
        const std::size_t prefixSize = key.size();
        if (line.size() <= prefixSize)
        {
            return {};
        }
        return line.substr(prefixSize);
    }

    std::size_t parse_count(const std::string& key, const std::string& value)
    {
        std::size_t consumed = 0;
        unsigned long long parsed = 0;
        try
        {
            parsed = std::stoull(value, &consumed);
        }
        catch (const std::exception&)
        {
            consumed = 0;
        }
        if (consumed == 0 || consumed != value.size() || value.front() == '-')
        {
            throw std::runtime_error("corrupt meta.txt: " + key + " '" + value + "'");
        }
        return static_cast<std::size_t>(parsed);
    }

    void write_floats(std::ostream& out, const char* label, const std::vector<float>& values)
    {
        out << ' ' << label << ' ' << values.size();
        for (float value : values)
        {
            out << ' ' << value;
        }
    }

    std::ofstream open_for_writing(const std::filesystem::path& path, std::ios::openmode mode = std::ios::trunc)
    {
        std::ofstream out(path, std::ios::out | mode);
        if (!out)
        {
            throw std::runtime_error("failed to open for writing: " + path.string());
        }
        return out;
    }

    void finish_writing(std::ofstream& out, const std::filesystem::path& path)
    {
        out.close();
        if (!out)
        {
            throw std::runtime_error("failed to write: " + path.string());
        }
    }
}

namespace dataset
{
    std::filesystem::path dataset_dir(const std::filesystem::path& root, const std::string& repoId)
    {
        return root / repoId;
    }

    std::optional<DatasetMeta> load_meta(const std::filesystem::path& dir)
    {
        std::ifstream in(dir / "meta.txt");
        if (!in)
        {
            return std::nullopt;
        }

        DatasetMeta meta;
        std::string line;
        while (std::getline(in, line))
        {
            if (line.rfind("repo_id ", 0) == 0)
            {
                meta.repoId = line_value(line, "repo_id ");
            }
            else if (line.rfind("color ", 0) == 0)
            {
                meta.colorFilter = line_value(line, "color ");
            }
            else if (line.rfind("pgn ", 0) == 0)
            {
                meta.pgnFile = line_value(line, "pgn ");
            }
            else if (line.rfind("robot_type ", 0) == 0)
            {
                meta.robotType = line_value(line, "robot_type ");
            }
            else if (line.rfind("fps ", 0) == 0)
            {
                meta.fps = static_cast<int>(parse_count("fps", line_value(line, "fps ")));
            }
            else if (line.rfind("episodes ", 0) == 0)
            {
                meta.episodes = parse_count("episodes", line_value(line, "episodes "));
            }
            else if (line.rfind("total_frames ", 0) == 0)
            {
                meta.totalFrames = parse_count("total_frames", line_value(line, "total_frames "));
            }
        }
        return meta;
    }
}

FileEpisodeStore::FileEpisodeStore(std::filesystem::path dir, DatasetInfo info)
    : dir_(std::move(dir)),
      info_(std::move(info))
{
    std::error_code ec;
    std::filesystem::create_directories(dir_ / "episodes", ec);
    if (ec)
    {
        throw std::runtime_error("failed to create dataset directory " + dir_.string() + ": " + ec.message());
    }

    if (const std::optional<DatasetMeta> existing = dataset::load_meta(dir_))
    {
        episodes_ = existing->episodes;
        totalFrames_ = existing->totalFrames;
        std::cerr << "Resuming dataset " << dir_ << " at episode " << episodes_ << '\n';
    }

    if (!info_.pgnPath.empty())
    {
        const std::filesystem::path copy = dir_ / info_.pgnPath.filename();
        std::filesystem::copy_file(info_.pgnPath, copy, std::filesystem::copy_options::overwrite_existing, ec);
        if (ec)
        {
            throw std::runtime_error("failed to copy " + info_.pgnPath.string() + " into the dataset: " + ec.message());
        }
    }

    write_meta();
}

void FileEpisodeStore::begin_episode(const std::string& task)
{
    if (task_)
    {
        std::cerr << "Dropping " << buffer_.size() << " uncommitted frames of '" << *task_ << "'\n";
    }
    task_ = task;
    buffer_.clear();
}

void FileEpisodeStore::add_sample(const Sample& sample)
{
    if (!task_)
    {
        throw std::logic_error("add_sample called without an open episode");
    }
    buffer_.push_back(sample);
}

void FileEpisodeStore::commit_current_episode()
{
    if (!task_)
    {
        throw std::logic_error("commit_current_episode called without an open episode");
    }

    const std::filesystem::path path = episode_path(dir_, episodes_);
    std::ofstream out = open_for_writing(path);

    out << "episode_index " << episodes_ << '\n';
    out << "task " << *task_ << '\n';
    out << "fps " << info_.fps << '\n';
    out << "frames " << buffer_.size() << '\n';
    for (const Sample& sample : buffer_)
    {
        out << "frame " << sample.frameIndex << ' ' << sample.timestamp;
        write_floats(out, "action", sample.action);
        write_floats(out, "observation", sample.observation);
        out << '\n';
    }
    finish_writing(out, path);

    const std::filesystem::path tasksPath = dir_ / "tasks.txt";
    std::ofstream tasks = open_for_writing(tasksPath, std::ios::app);
    tasks << episodes_ << '\t' << *task_ << '\n';
    finish_writing(tasks, tasksPath);

    ++episodes_;
    totalFrames_ += buffer_.size();
    write_meta();

    task_.reset();
    buffer_.clear();
}

void FileEpisodeStore::discard_current_episode()
{
    task_.reset();
    buffer_.clear();
}

std::size_t FileEpisodeStore::episode_count() const
{
    return episodes_;
}

std::size_t FileEpisodeStore::total_frames() const noexcept
{
    return totalFrames_;
}

std::size_t FileEpisodeStore::buffered_frames() const noexcept
{
    return buffer_.size();
}

bool FileEpisodeStore::has_open_episode() const noexcept
{
    return task_.has_value();
}

const std::filesystem::path& FileEpisodeStore::dir() const noexcept
{
    return dir_;
}

std::filesystem::path FileEpisodeStore::episode_path(const std::filesystem::path& dir, std::size_t index)
{
    char name[32];
    std::snprintf(name, sizeof(name), "episode_%06zu.txt", index);
    return dir / "episodes" / name;
}

void FileEpisodeStore::write_meta() const
{
    const std::filesystem::path path = dir_ / "meta.txt";
    std::ofstream out = open_for_writing(path);

    out << "repo_id " << info_.repoId << '\n';
    out << "color " << info_.colorFilter << '\n';
    out << "pgn " << info_.pgnPath.filename().string() << '\n';
    out << "robot_type " << info_.robotType << '\n';
    out << "fps " << info_.fps << '\n';
    out << "episodes " << episodes_ << '\n';
    out << "total_frames " << totalFrames_ << '\n';

    finish_writing(out, path);
}
