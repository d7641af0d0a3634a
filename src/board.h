#pragma once

#include <array>
#include <cstdint>
#include <string>
#include <vector>

#include "move.h"

enum class Color : std::uint8_t
{
    White,
    Black
};

enum class PieceType : std::uint8_t
{
    None,
    Pawn,
    Knight,
    Bishop,
    Rook,
    Queen,
    King
};

enum class Piece : std::uint8_t
{
    None = 0,
    WhitePawn,
    WhiteKnight,
    WhiteBishop,
    WhiteRook,
    WhiteQueen,
    WhiteKing,
    BlackPawn,
    BlackKnight,
    BlackBishop,
    BlackRook,
    BlackQueen,
    BlackKing
};

inline const std::string StartingFen = "rnbqkbnr/pppppppp/8/8/8/8/PPPPPPPP/RNBQKBNR w KQkq - 0 1";

inline bool is_white_piece(Piece piece) noexcept
{
    return piece >= Piece::WhitePawn && piece <= Piece::WhiteKing;
}

inline bool is_black_piece(Piece piece) noexcept
{
    return piece >= Piece::BlackPawn && piece <= Piece::BlackKing;
}

inline bool is_empty_piece(Piece piece) noexcept
{
    return piece == Piece::None;
}

inline Color opposite_color(Color color) noexcept
{
    return color == Color::White ? Color::Black : Color::White;
}

PieceType piece_type(Piece piece) noexcept;
Piece make_piece(Color color, PieceType type) noexcept;
bool is_color(Piece piece, Color color) noexcept;

// FEN letters: uppercase for white, lowercase for black, ' ' for an empty square.
Piece piece_from_char(char symbol) noexcept;
char char_from_piece(Piece piece) noexcept;

struct BoardState
{
    Color sideToMove{Color::White};
    std::uint8_t castlingRights{0};
    int enPassantSquare{NoSquare};
    int halfmoveClock{0};
    int fullmoveNumber{1};
};

class Board
{
public:
    Board();
    explicit Board(const std::string& fen);

    // Throws std::invalid_argument when any FEN field is malformed.
    void load_fen(const std::string& fen);

    // The en-passant field is only written when a legal en-passant capture exists.
    [[nodiscard]] std::string to_fen() const;

    [[nodiscard]] std::vector<Move> generate_legal_moves() const;

    void make_move(const Move& move);

    [[nodiscard]] Color side_to_move() const noexcept;
    [[nodiscard]] int fullmove_number() const noexcept;
    [[nodiscard]] Piece piece_at(int square) const noexcept;

    [[nodiscard]] bool is_in_check(Color side) const;
    [[nodiscard]] bool is_checkmate() const;

private:
    std::array<Piece, 64> squares_{};
    BoardState state_{};

    [[nodiscard]] std::vector<Move> generate_pseudo_legal_moves() const;
    void add_pawn_moves(int square, Piece piece, std::vector<Move>& moves) const;
    void add_step_moves(int square, Piece piece, const int (*deltas)[2], std::vector<Move>& moves) const;
    void add_slider_moves(int square,
                          Piece piece,
                          const int (*directions)[2],
                          int directionCount,
                          std::vector<Move>& moves) const;
    void add_castling_moves(int square, Piece piece, std::vector<Move>& moves) const;

    [[nodiscard]] bool is_square_attacked(int square, Color bySide) const;
    [[nodiscard]] int find_king_square(Color side) const;
    [[nodiscard]] bool has_legal_en_passant() const;
};
