#pragma once

#include <cstdint>
#include <string>

enum class Piece : std::uint8_t;

enum MoveFlags : std::uint8_t
{
    MoveFlagNone = 0,
    MoveFlagCapture = 1 << 0,
    MoveFlagDoublePawnPush = 1 << 1,
    MoveFlagEnPassant = 1 << 2,
    MoveFlagCastleKingSide = 1 << 3,
    MoveFlagCastleQueenSide = 1 << 4,
    MoveFlagPromotion = 1 << 5
};

struct Move
{
    int from{0};
    int to{0};
    Piece movingPiece{};
    Piece capturedPiece{};
    Piece promotionPiece{};
    std::uint8_t flags{0};

    Move() = default;

    Move(int fromSquare,
         int toSquare,
         Piece moving,
         Piece captured = Piece{},
         Piece promotion = Piece{},
         std::uint8_t flagsValue = 0);

    [[nodiscard]] bool is_capture() const noexcept { return (flags & MoveFlagCapture) != 0U; }
    [[nodiscard]] bool is_promotion() const noexcept { return (flags & MoveFlagPromotion) != 0U; }
    [[nodiscard]] bool is_castle() const noexcept
    {
        return (flags & (MoveFlagCastleKingSide | MoveFlagCastleQueenSide)) != 0U;
    }

    // Long algebraic form (e2e4, e7e8q).
    [[nodiscard]] std::string to_uci() const;

    bool operator==(const Move& other) const noexcept;
    bool operator!=(const Move& other) const noexcept { return !(*this == other); }
};

constexpr int NoSquare = -1;

int file_of(int square);
int rank_of(int square);
int make_square(int file, int rank);
bool is_valid_square(int square) noexcept;
std::string square_to_string(int square);

// Returns NoSquare for anything that is not a lowercase or uppercase "a1".."h8".
int square_from_string(const std::string& name);
