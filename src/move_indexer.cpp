#include "move_indexer.h"

#include <algorithm>
#include <cctype>
#include <stdexcept>
#include <utility>

#include "board.h"
#include "errors.h"
#include "notation.h"
#include "pgn.h"

namespace
{
    bool keeps(ColorFilter filter, Color sideToMove)
    {
        switch (filter)
        {
        case ColorFilter::White: return sideToMove == Color::White;
        case ColorFilter::Black: return sideToMove == Color::Black;
        case ColorFilter::None:
        default:
            return true;
        }
    }

    bool is_legal(const Board& board, const Move& move)
    {
        const std::vector<Move> legal = board.generate_legal_moves();
        return std::find(legal.begin(), legal.end(), move) != legal.end();
    }
}

std::optional<ColorFilter> parse_color_filter(const std::string& text)
{
    std::string lowered;
    lowered.reserve(text.size());
    for (char ch : text)
    {
        lowered.push_back(static_cast<char>(std::tolower(static_cast<unsigned char>(ch))));
    }

    if (lowered == "white")
    {
        return ColorFilter::White;
    }
    if (lowered == "black")
    {
        return ColorFilter::Black;
    }
    if (lowered.empty() || lowered == "none")
    {
        return ColorFilter::None;
    }
    return std::nullopt;
}

std::string to_string(ColorFilter filter)
{
    switch (filter)
    {
    case ColorFilter::White: return "white";
    case ColorFilter::Black: return "black";
    case ColorFilter::None:
    default:
        return "none";
    }
}

MoveIndexer::MoveIndexer(const std::vector<Move>& moves,
                         const std::string& initialFen,
                         ColorFilter filter,
                         render::RenderOptions options)
    : filter_(filter),
      options_(std::move(options))
{
    Board cursor;
    try
    {
        cursor.load_fen(initialFen);
    }
    catch (const std::invalid_argument& e)
    {
        throw InvalidGameError(std::string("bad initial position: ") + e.what());
    }

    for (std::size_t ply = 0; ply < moves.size(); ++ply)
    {
        const Move& move = moves[ply];
        if (!is_legal(cursor, move))
        {
            throw InvalidGameError("move " + move.to_uci() + " at ply " + std::to_string(ply + 1) +
                                   " is not legal in " + cursor.to_fen());
        }

        if (keeps(filter_, cursor.side_to_move()))
        {
            positions_.push_back(cursor.to_fen());
            moves_.push_back(move);
        }

        // Filtered-out moves still advance the cursor.
        cursor.make_move(move);
    }
}

MoveIndexer::MoveIndexer(const pgn::Game& game, ColorFilter filter, render::RenderOptions options)
    : MoveIndexer(game.moves, game.startFen, filter, std::move(options))
{
}

MoveIndexer MoveIndexer::from_pgn_file(const std::filesystem::path& path,
                                       ColorFilter filter,
                                       render::RenderOptions options)
{
    return MoveIndexer(pgn::read_game_file(path), filter, std::move(options));
}

std::size_t MoveIndexer::length() const noexcept
{
    return positions_.size();
}

bool MoveIndexer::empty() const noexcept
{
    return positions_.empty();
}

ColorFilter MoveIndexer::filter() const noexcept
{
    return filter_;
}

IndexedMove MoveIndexer::get(std::size_t index) const
{
    check_index(index);

    const std::string& fen = positions_[index];
    const Move& move = moves_[index];
    const Board board(fen);

    IndexedMove result;
    result.fen = fen;
    result.san = move_to_san(board, move);
    result.image = render::render_board(fen, move, options_);
    return result;
}

const std::string& MoveIndexer::position_at(std::size_t index) const
{
    check_index(index);
    return positions_[index];
}

const Move& MoveIndexer::move_at(std::size_t index) const
{
    check_index(index);
    return moves_[index];
}

void MoveIndexer::check_index(std::size_t index) const
{
    if (index >= positions_.size())
    {
        throw IndexOutOfRange("index " + std::to_string(index) + " out of range for " +
                              std::to_string(positions_.size()) + " moves");
    }
}
