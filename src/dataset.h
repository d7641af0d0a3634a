#pragma once

#include <cstddef>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

#include "recording.h"

struct DatasetInfo
{
    std::string repoId;
    std::string colorFilter;
    std::filesystem::path pgnPath;
    std::string robotType{"so101_follower"};
    int fps{30};
};

struct DatasetMeta
{
    std::string repoId;
    std::string colorFilter;
    std::string pgnFile;
    std::string robotType;
    int fps{0};
    std::size_t episodes{0};
    std::size_t totalFrames{0};
};

namespace dataset
{
    std::filesystem::path dataset_dir(const std::filesystem::path& root, const std::string& repoId);

    // Reads meta.txt from a dataset directory; std::nullopt when it is missing.
    // Throws std::runtime_error when a count in it is not a number.
    std::optional<DatasetMeta> load_meta(const std::filesystem::path& dir);
}

// Episode store backed by plain text files:
//   <dir>/meta.txt                      dataset summary
//   <dir>/tasks.txt                     one task label per committed episode
//   <dir>/episodes/episode_NNNNNN.txt   samples of one episode
// Opening an existing directory resumes its episode numbering.
class FileEpisodeStore : public EpisodeStore
{
public:
    // Throws std::runtime_error if the directory cannot be created or the PGN file cannot be copied.
    FileEpisodeStore(std::filesystem::path dir, DatasetInfo info);

    void begin_episode(const std::string& task) override;
    void add_sample(const Sample& sample) override;

    // Throws std::logic_error without an open episode, std::runtime_error on write failure.
    void commit_current_episode() override;
    void discard_current_episode() override;

    [[nodiscard]] std::size_t episode_count() const override;
    [[nodiscard]] std::size_t total_frames() const noexcept;
    [[nodiscard]] std::size_t buffered_frames() const noexcept;
    [[nodiscard]] bool has_open_episode() const noexcept;
    [[nodiscard]] const std::filesystem::path& dir() const noexcept;

    [[nodiscard]] static std::filesystem::path episode_path(const std::filesystem::path& dir, std::size_t index);

private:
    std::filesystem::path dir_;
    DatasetInfo info_;
    std::size_t episodes_{0};
    std::size_t totalFrames_{0};

    std::optional<std::string> task_;
    std::vector<Sample> buffer_;

    void write_meta() const;
};
