#pragma once

#include <filesystem>
#include <map>
#include <string>
#include <vector>

#include "move.h"

namespace pgn
{
    struct Game
    {
        std::map<std::string, std::string> tags;
        std::string startFen;
        std::vector<Move> moves;
        std::vector<std::string> sanMoves;
        std::string result{"*"};
    };

    // Reads the first game of a PGN document. Comments, NAGs and variations are skipped;
    // every mainline move is checked for legality from the starting position (the FEN tag
    // when present). Throws InvalidGameError when no game is found or a move does not apply.
    Game read_game(const std::string& text);

    Game read_game_file(const std::filesystem::path& path);
}
