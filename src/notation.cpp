#include "notation.h"

#include <cstdlib>
#include <string>
#include <vector>

#include "board.h"
#include "move.h"

namespace
{
    char piece_letter(PieceType type)
    {
        switch (type)
        {
        case PieceType::King: return 'K';
        case PieceType::Queen: return 'Q';
        case PieceType::Rook: return 'R';
        case PieceType::Bishop: return 'B';
        case PieceType::Knight: return 'N';
        default: return '\0';
        }
    }

    PieceType type_from_letter(char letter)
    {
        switch (letter)
        {
        case 'K': return PieceType::King;
        case 'Q': return PieceType::Queen;
        case 'R': return PieceType::Rook;
        case 'B': return PieceType::Bishop;
        case 'N': return PieceType::Knight;
        default: return PieceType::None;
        }
    }

    bool is_annotation(char ch)
    {
        return ch == '+' || ch == '#' || ch == '!' || ch == '?';
    }

    std::string disambiguation(const Board& board, const Move& move)
    {
        std::vector<Move> rivals;
        for (const Move& candidate : board.generate_legal_moves())
        {
            if (candidate.to == move.to && candidate.from != move.from &&
                candidate.movingPiece == move.movingPiece)
            {
                rivals.push_back(candidate);
            }
        }

        if (rivals.empty())
        {
            return {};
        }

        bool fileUnique = true;
        bool rankUnique = true;
        for (const Move& rival : rivals)
        {
            fileUnique = fileUnique && file_of(rival.from) != file_of(move.from);
            rankUnique = rankUnique && rank_of(rival.from) != rank_of(move.from);
        }

        const std::string from = square_to_string(move.from);
        if (fileUnique)
        {
            return from.substr(0, 1);
        }
        if (rankUnique)
        {
            return from.substr(1, 1);
        }
        return from;
    }

    std::optional<Move> find_castle(const Board& board, std::uint8_t flag)
    {
        for (const Move& move : board.generate_legal_moves())
        {
            if (move.flags & flag)
            {
                return move;
            }
        }
        return std::nullopt;
    }
}

std::string move_to_san(const Board& positionBeforeMove, const Move& move)
{
    std::string san;

    if (move.flags & MoveFlagCastleKingSide)
    {
        san = "O-O";
    }
    else if (move.flags & MoveFlagCastleQueenSide)
    {
        san = "O-O-O";
    }
    else
    {
        const PieceType type = piece_type(move.movingPiece);

        if (type == PieceType::Pawn)
        {
            if (move.is_capture())
            {
                san += static_cast<char>('a' + file_of(move.from));
            }
        }
        else
        {
            san += piece_letter(type);
            san += disambiguation(positionBeforeMove, move);
        }

        if (move.is_capture())
        {
            san += 'x';
        }

        san += square_to_string(move.to);

        if (move.is_promotion())
        {
            san += '=';
            san += piece_letter(piece_type(move.promotionPiece));
        }
    }

    Board after = positionBeforeMove;
    after.make_move(move);
    if (after.is_checkmate())
    {
        san += '#';
    }
    else if (after.is_in_check(after.side_to_move()))
    {
        san += '+';
    }

    return san;
}

std::optional<Move> san_to_move(const Board& position, const std::string& san)
{
    std::string token = san;
    while (!token.empty() && is_annotation(token.back()))
    {
        token.pop_back();
    }

    if (token == "O-O" || token == "0-0")
    {
        return find_castle(position, MoveFlagCastleKingSide);
    }
    if (token == "O-O-O" || token == "0-0-0")
    {
        return find_castle(position, MoveFlagCastleQueenSide);
    }

    if (token.size() < 2)
    {
        return std::nullopt;
    }

    PieceType movingType = PieceType::Pawn;
    std::size_t begin = 0;
    if (type_from_letter(token.front()) != PieceType::None)
    {
        movingType = type_from_letter(token.front());
        begin = 1;
    }

    PieceType promotionType = PieceType::None;
    std::size_t end = token.size();
    if (movingType == PieceType::Pawn && type_from_letter(token.back()) != PieceType::None)
    {
        promotionType = type_from_letter(token.back());
        --end;
        if (end > 0 && token[end - 1] == '=')
        {
            --end;
        }
    }

    if (end < begin + 2)
    {
        return std::nullopt;
    }

    const int target = square_from_string(token.substr(end - 2, 2));
    if (target == NoSquare)
    {
        return std::nullopt;
    }

    int fromFile = -1;
    int fromRank = -1;
    bool capture = false;
    for (std::size_t i = begin; i < end - 2; ++i)
    {
        const char ch = token[i];
        if (ch >= 'a' && ch <= 'h')
        {
            fromFile = ch - 'a';
        }
        else if (ch >= '1' && ch <= '8')
        {
            fromRank = ch - '1';
        }
        else if (ch == 'x' || ch == ':')
        {
            capture = true;
        }
        else
        {
            return std::nullopt;
        }
    }

    std::optional<Move> match;
    for (const Move& move : position.generate_legal_moves())
    {
        if (move.to != target || move.is_castle() ||
            piece_type(move.movingPiece) != movingType ||
            piece_type(move.promotionPiece) != promotionType)
        {
            continue;
        }
        if ((fromFile != -1 && file_of(move.from) != fromFile) ||
            (fromRank != -1 && rank_of(move.from) != fromRank))
        {
            continue;
        }
        if (capture && !move.is_capture())
        {
            continue;
        }
        if (match)
        {
            return std::nullopt;
        }
        match = move;
    }

    return match;
}
