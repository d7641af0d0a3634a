#include <catch2/catch.hpp>

#include <optional>
#include <string>

#include "board.h"
#include "move.h"
#include "notation.h"

namespace
{
    std::string san_of(const std::string& fen, const std::string& token)
    {
        const Board board(fen);
        const std::optional<Move> move = san_to_move(board, token);
        REQUIRE(move.has_value());
        return move_to_san(board, *move);
    }
}

TEST_CASE("SAN of opening moves", "[notation]")
{
    REQUIRE(san_of(StartingFen, "e4") == "e4");
    REQUIRE(san_of(StartingFen, "Nf3") == "Nf3");
    REQUIRE(san_of(StartingFen, "Nc3") == "Nc3");
}

TEST_CASE("SAN disambiguates by file, then rank", "[notation]")
{
    REQUIRE(san_of("4k3/8/8/8/8/8/8/R4RK1 w - - 0 1", "Rad1") == "Rad1");
    REQUIRE(san_of("4k3/8/8/8/8/8/8/R4RK1 w - - 0 1", "Rfd1") == "Rfd1");
    REQUIRE(san_of("4k3/8/8/R7/8/8/8/R3K3 w - - 0 1", "R1a3") == "R1a3");
    REQUIRE(san_of("4k3/8/8/R7/8/8/8/R3K3 w - - 0 1", "R5a3") == "R5a3");
}

TEST_CASE("SAN of promotion with capture and check", "[notation]")
{
    REQUIRE(san_of("3r1k2/4P3/8/8/8/8/8/4K3 w - - 0 1", "exd8=Q") == "exd8=Q+");
    REQUIRE(san_of("3r1k2/4P3/8/8/8/8/8/4K3 w - - 0 1", "exd8N") == "exd8=N");
}

TEST_CASE("SAN marks checkmate", "[notation]")
{
    REQUIRE(san_of("rnbqkbnr/pppp1ppp/8/4p3/6P1/5P2/PPPPP2P/RNBQKBNR b KQkq - 0 2", "Qh4") == "Qh4#");
}

TEST_CASE("SAN castling in both spellings", "[notation]")
{
    const std::string fen = "r3k2r/8/8/8/8/8/8/R3K2R w KQkq - 0 1";
    REQUIRE(san_of(fen, "O-O") == "O-O");
    REQUIRE(san_of(fen, "0-0-0") == "O-O-O");

    const Board board(fen);
    const std::optional<Move> kingSide = san_to_move(board, "0-0");
    REQUIRE(kingSide.has_value());
    REQUIRE(kingSide->to_uci() == "e1g1");
}

TEST_CASE("SAN parsing ignores annotation glyphs", "[notation]")
{
    const Board board;
    const std::optional<Move> move = san_to_move(board, "e4!?");
    REQUIRE(move.has_value());
    REQUIRE(move->to_uci() == "e2e4");
}

TEST_CASE("SAN parsing rejects illegal, ambiguous and malformed tokens", "[notation]")
{
    const Board start;
    REQUIRE_FALSE(san_to_move(start, "Nf6").has_value());
    REQUIRE_FALSE(san_to_move(start, "e5").has_value());
    REQUIRE_FALSE(san_to_move(start, "O-O").has_value());
    REQUIRE_FALSE(san_to_move(start, "zz").has_value());
    REQUIRE_FALSE(san_to_move(start, "").has_value());

    const Board twoRooks("4k3/8/8/8/8/8/8/R4RK1 w - - 0 1");
    REQUIRE_FALSE(san_to_move(twoRooks, "Rd1").has_value());
}
