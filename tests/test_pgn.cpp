#include <catch2/catch.hpp>

#include <filesystem>
#include <fstream>
#include <string>
#include <vector>

#include "board.h"
#include "errors.h"
#include "pgn.h"

namespace
{
    const char* const ScholarsMate = R"([Event "Casual game"]
[Site "?"]
[White "Alice"]
[Black "Bob \"the rook\""]
[Result "1-0"]

% escaped line
1. e4 e5 {Open game} 2. Bc4 (2. Nf3 Nc6 (2... d6) 3. Bb5) 2... Nc6 $1
3. Qh5 ; threatens mate
Nf6?? 4. Qxf7# 1-0
)";
}

TEST_CASE("PGN reader collects tags and the mainline", "[pgn]")
{
    const pgn::Game game = pgn::read_game(ScholarsMate);

    REQUIRE(game.tags.at("White") == "Alice");
    REQUIRE(game.tags.at("Black") == "Bob \"the rook\"");
    REQUIRE(game.startFen == StartingFen);
    REQUIRE(game.result == "1-0");
    REQUIRE(game.moves.size() == 7);
    REQUIRE(game.sanMoves.front() == "e4");
    REQUIRE(game.sanMoves.back() == "Qxf7#");
    REQUIRE(game.moves.back().to_uci() == "h5f7");
}

TEST_CASE("PGN reader accepts move numbers glued to moves", "[pgn]")
{
    const pgn::Game game = pgn::read_game("1.e4 e5 2.Nf3 Nc6 3.Bb5 3...a6 *");
    REQUIRE(game.sanMoves == std::vector<std::string>{"e4", "e5", "Nf3", "Nc6", "Bb5", "a6"});
    REQUIRE(game.result == "*");
}

TEST_CASE("PGN reader starts from the FEN tag", "[pgn]")
{
    const pgn::Game game = pgn::read_game(R"([SetUp "1"]
[FEN "4k3/8/8/8/8/8/4P3/4K3 b - - 0 1"]

1... Kd7 2. e4 *
)");
    REQUIRE(game.startFen == "4k3/8/8/8/8/8/4P3/4K3 b - - 0 1");
    REQUIRE(game.moves.size() == 2);
    REQUIRE(game.moves[0].to_uci() == "e8d7");
}

TEST_CASE("PGN reader stops at the next game", "[pgn]")
{
    const pgn::Game game = pgn::read_game("[Event \"one\"]\n\n1. d4 d5\n[Event \"two\"]\n\n1. e4 *\n");
    REQUIRE(game.tags.at("Event") == "one");
    REQUIRE(game.sanMoves == std::vector<std::string>{"d4", "d5"});
    REQUIRE(game.result == "*");
}

TEST_CASE("PGN reader takes the result from the tag when movetext has none", "[pgn]")
{
    const pgn::Game game = pgn::read_game("[Result \"1/2-1/2\"]\n\n1. e4 e5\n");
    REQUIRE(game.result == "1/2-1/2");
    REQUIRE(game.moves.size() == 2);
}

TEST_CASE("PGN reader allows a game without moves", "[pgn]")
{
    const pgn::Game game = pgn::read_game("[Event \"empty\"]\n\n*\n");
    REQUIRE(game.moves.empty());
}

TEST_CASE("PGN reader rejects broken input", "[pgn]")
{
    REQUIRE_THROWS_AS(pgn::read_game(""), InvalidGameError);
    REQUIRE_THROWS_AS(pgn::read_game("1. e4 e4 *"), InvalidGameError);
    REQUIRE_THROWS_AS(pgn::read_game("1. e4 {never closed"), InvalidGameError);
    REQUIRE_THROWS_AS(pgn::read_game("1. e4 (1. d4"), InvalidGameError);
    REQUIRE_THROWS_AS(pgn::read_game("[FEN \"not a fen\"]\n\n*"), InvalidGameError);
    REQUIRE_THROWS_WITH(pgn::read_game("1. e4 e5 2. Ke3 *"), Catch::Contains("'Ke3' at ply 3"));
}

TEST_CASE("PGN reader reads files", "[pgn]")
{
    const std::filesystem::path path = std::filesystem::temp_directory_path() / "pgn_teleop_recorder_test.pgn";
    {
        std::ofstream out(path);
        out << "[Event \"file\"]\n\n1. c4 e5 *\n";
    }

    const pgn::Game game = pgn::read_game_file(path);
    REQUIRE(game.moves.size() == 2);
    std::filesystem::remove(path);

    REQUIRE_THROWS_AS(pgn::read_game_file(path), InvalidGameError);
}
