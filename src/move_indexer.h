#pragma once

#include <cstddef>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

#include "move.h"
#include "render.h"

namespace pgn
{
    struct Game;
}

enum class ColorFilter
{
    None,
    White,
    Black
};

// "white" / "black" (any case); "none" and "" mean no filter.
std::optional<ColorFilter> parse_color_filter(const std::string& text);
std::string to_string(ColorFilter filter);

struct IndexedMove
{
    std::string fen;
    std::string san;
    render::Image image;
};

// Random access to the moves of one side of a game, each paired with the position
// it was played from. Skipped moves are still replayed, so every stored position
// is exact. Notation and image are rebuilt on every get().
class MoveIndexer
{
public:
    // Throws InvalidGameError if a move is not legal in the position it is applied to.
    MoveIndexer(const std::vector<Move>& moves,
                const std::string& initialFen,
                ColorFilter filter,
                render::RenderOptions options = {});

    MoveIndexer(const pgn::Game& game, ColorFilter filter, render::RenderOptions options = {});

    static MoveIndexer from_pgn_file(const std::filesystem::path& path,
                                     ColorFilter filter,
                                     render::RenderOptions options = {});

    [[nodiscard]] std::size_t length() const noexcept;
    [[nodiscard]] bool empty() const noexcept;
    [[nodiscard]] ColorFilter filter() const noexcept;

    // Throws IndexOutOfRange when index >= length().
    [[nodiscard]] IndexedMove get(std::size_t index) const;

    [[nodiscard]] const std::string& position_at(std::size_t index) const;
    [[nodiscard]] const Move& move_at(std::size_t index) const;

private:
    std::vector<std::string> positions_;
    std::vector<Move> moves_;
    ColorFilter filter_{ColorFilter::None};
    render::RenderOptions options_;

    void check_index(std::size_t index) const;
};
