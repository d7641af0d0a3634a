#include "move.h"

#include <cassert>
#include <cctype>

#include "board.h"

namespace
{
    char promotion_char(Piece piece)
    {
        switch (piece_type(piece))
        {
        case PieceType::Queen: return 'q';
        case PieceType::Rook: return 'r';
        case PieceType::Bishop: return 'b';
        case PieceType::Knight: return 'n';
        default: return '\0';
        }
    }
}

Move::Move(int fromSquare,
           int toSquare,
           Piece moving,
           Piece captured,
           Piece promotion,
           std::uint8_t flagsValue)
    : from(fromSquare),
      to(toSquare),
      movingPiece(moving),
      capturedPiece(captured),
      promotionPiece(promotion),
      flags(flagsValue)
{
}

std::string Move::to_uci() const
{
    std::string result = square_to_string(from) + square_to_string(to);

    if (is_promotion())
    {
        const char promo = promotion_char(promotionPiece);
        if (promo != '\0')
        {
            result += promo;
        }
    }

    return result;
}

bool Move::operator==(const Move& other) const noexcept
{
    return from == other.from && to == other.to &&
           movingPiece == other.movingPiece &&
           promotionPiece == other.promotionPiece &&
           flags == other.flags;
}

int file_of(int square)
{
    assert(is_valid_square(square));
    return square % 8;
}

int rank_of(int square)
{
    assert(is_valid_square(square));
    return square / 8;
}

int make_square(int file, int rank)
{
    assert(file >= 0 && file < 8);
    assert(rank >= 0 && rank < 8);
    return rank * 8 + file;
}

bool is_valid_square(int square) noexcept
{
    return square >= 0 && square < 64;
}

std::string square_to_string(int square)
{
    if (!is_valid_square(square))
    {
        return {};
    }

    return {static_cast<char>('a' + file_of(square)), static_cast<char>('1' + rank_of(square))};
}

int square_from_string(const std::string& name)
{
    if (name.size() != 2)
    {
        return NoSquare;
    }

    const char fileChar = static_cast<char>(std::tolower(static_cast<unsigned char>(name[0])));
    const char rankChar = name[1];

    if (fileChar < 'a' || fileChar > 'h' || rankChar < '1' || rankChar > '8')
    {
        return NoSquare;
    }

    return make_square(fileChar - 'a', rankChar - '1');
}
