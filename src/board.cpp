#include "board.h"

#include <sstream>
#include <stdexcept>

#include "move.h"

namespace
{
    constexpr std::uint8_t CastleWhiteKing = 1 << 0;
    constexpr std::uint8_t CastleWhiteQueen = 1 << 1;
    constexpr std::uint8_t CastleBlackKing = 1 << 2;
    constexpr std::uint8_t CastleBlackQueen = 1 << 3;

    constexpr int KnightDeltas[8][2] = {
        {1, 2},  {2, 1},  {2, -1}, {1, -2},
        {-1, -2}, {-2, -1}, {-2, 1}, {-1, 2}};
    constexpr int KingDeltas[8][2] = {
        {1, 0},  {1, 1},  {0, 1},  {-1, 1},
        {-1, 0}, {-1, -1}, {0, -1}, {1, -1}};
    constexpr int BishopDirections[4][2] = {
        {1, 1},  {1, -1}, {-1, 1}, {-1, -1}};
    constexpr int RookDirections[4][2] = {
        {1, 0},  {-1, 0}, {0, 1},  {0, -1}};

    constexpr PieceType PromotionTypes[4] = {
        PieceType::Queen, PieceType::Rook, PieceType::Bishop, PieceType::Knight};

    bool on_board(int file, int rank)
    {
        return file >= 0 && file < 8 && rank >= 0 && rank < 8;
    }

    // Castling right lost when a piece leaves or is captured on one of the corner/king squares.
    std::uint8_t rights_touched_by(int square)
    {
        switch (square)
        {
        case 0: return CastleWhiteQueen;
        case 4: return CastleWhiteKing | CastleWhiteQueen;
        case 7: return CastleWhiteKing;
        case 56: return CastleBlackQueen;
        case 60: return CastleBlackKing | CastleBlackQueen;
        case 63: return CastleBlackKing;
        default: return 0;
        }
    }

    int parse_fen_counter(const std::string& text, const char* field)
    {
        std::size_t consumed = 0;
        int value = 0;
        try
        {
            value = std::stoi(text, &consumed);
        }
        catch (const std::exception&)
        {
            consumed = 0;
        }
        if (consumed != text.size() || value < 0)
        {
            throw std::invalid_argument(std::string("invalid FEN ") + field + ": '" + text + "'");
        }
        return value;
    }
}

PieceType piece_type(Piece piece) noexcept
{
    if (piece == Piece::None)
    {
        return PieceType::None;
    }
    const int index = (static_cast<int>(piece) - 1) % 6;
    return static_cast<PieceType>(index + 1);
}

Piece make_piece(Color color, PieceType type) noexcept
{
    if (type == PieceType::None)
    {
        return Piece::None;
    }
    const int offset = (color == Color::White) ? 0 : 6;
    return static_cast<Piece>(static_cast<int>(type) + offset);
}

bool is_color(Piece piece, Color color) noexcept
{
    return color == Color::White ? is_white_piece(piece) : is_black_piece(piece);
}

Piece piece_from_char(char symbol) noexcept
{
    switch (symbol)
    {
    case 'P': return Piece::WhitePawn;
    case 'N': return Piece::WhiteKnight;
    case 'B': return Piece::WhiteBishop;
    case 'R': return Piece::WhiteRook;
    case 'Q': return Piece::WhiteQueen;
    case 'K': return Piece::WhiteKing;
    case 'p': return Piece::BlackPawn;
    case 'n': return Piece::BlackKnight;
    case 'b': return Piece::BlackBishop;
    case 'r': return Piece::BlackRook;
    case 'q': return Piece::BlackQueen;
    case 'k': return Piece::BlackKing;
    default:  return Piece::None;
    }
}

char char_from_piece(Piece piece) noexcept
{
    static constexpr char Letters[] = " PNBRQKpnbrqk";
    return Letters[static_cast<int>(piece)];
}

Board::Board()
{
    load_fen(StartingFen);
}

Board::Board(const std::string& fen)
{
    load_fen(fen);
}

void Board::load_fen(const std::string& fen)
{
    std::istringstream stream(fen);
    std::string placement;
    std::string side;
    std::string castling;
    std::string enPassant;
    std::string halfmove = "0";
    std::string fullmove = "1";

    stream >> placement >> side >> castling >> enPassant;
    if (enPassant.empty())
    {
        throw std::invalid_argument("incomplete FEN: '" + fen + "'");
    }
    stream >> halfmove >> fullmove;

    std::array<Piece, 64> squares{};
    squares.fill(Piece::None);

    int rank = 7;
    int file = 0;
    int whiteKings = 0;
    int blackKings = 0;

    for (char symbol : placement)
    {
        if (symbol == '/')
        {
            if (file != 8 || rank == 0)
            {
                throw std::invalid_argument("invalid FEN placement: '" + placement + "'");
            }
            --rank;
            file = 0;
        }
        else if (symbol >= '1' && symbol <= '8')
        {
            file += symbol - '0';
            if (file > 8)
            {
                throw std::invalid_argument("invalid FEN placement: '" + placement + "'");
            }
        }
        else
        {
            const Piece piece = piece_from_char(symbol);
            if (piece == Piece::None || file >= 8)
            {
                throw std::invalid_argument("invalid FEN placement: '" + placement + "'");
            }
            whiteKings += piece == Piece::WhiteKing ? 1 : 0;
            blackKings += piece == Piece::BlackKing ? 1 : 0;
            squares[static_cast<std::size_t>(make_square(file, rank))] = piece;
            ++file;
        }
    }

    if (rank != 0 || file != 8)
    {
        throw std::invalid_argument("invalid FEN placement: '" + placement + "'");
    }
    if (whiteKings != 1 || blackKings != 1)
    {
        throw std::invalid_argument("FEN must have exactly one king per side: '" + placement + "'");
    }

    BoardState state;

    if (side == "w")
    {
        state.sideToMove = Color::White;
    }
    else if (side == "b")
    {
        state.sideToMove = Color::Black;
    }
    else
    {
        throw std::invalid_argument("invalid FEN side to move: '" + side + "'");
    }

    if (castling != "-")
    {
        for (char symbol : castling)
        {
            switch (symbol)
            {
            case 'K': state.castlingRights |= CastleWhiteKing; break;
            case 'Q': state.castlingRights |= CastleWhiteQueen; break;
            case 'k': state.castlingRights |= CastleBlackKing; break;
            case 'q': state.castlingRights |= CastleBlackQueen; break;
            default:
                throw std::invalid_argument("invalid FEN castling rights: '" + castling + "'");
            }
        }
    }

    // A right only survives while its king and rook are still on their home squares.
    const auto holds = [&squares](int square, Piece piece) {
        return squares[static_cast<std::size_t>(square)] == piece;
    };
    std::uint8_t lost = 0;
    if (!holds(4, Piece::WhiteKing) || !holds(7, Piece::WhiteRook)) lost |= CastleWhiteKing;
    if (!holds(4, Piece::WhiteKing) || !holds(0, Piece::WhiteRook)) lost |= CastleWhiteQueen;
    if (!holds(60, Piece::BlackKing) || !holds(63, Piece::BlackRook)) lost |= CastleBlackKing;
    if (!holds(60, Piece::BlackKing) || !holds(56, Piece::BlackRook)) lost |= CastleBlackQueen;
    state.castlingRights &= static_cast<std::uint8_t>(~lost);

    if (enPassant != "-")
    {
        const int square = square_from_string(enPassant);
        const int expectedRank = (state.sideToMove == Color::White) ? 5 : 2;
        if (square == NoSquare || rank_of(square) != expectedRank)
        {
            throw std::invalid_argument("invalid FEN en-passant square: '" + enPassant + "'");
        }
        state.enPassantSquare = square;
    }

    state.halfmoveClock = parse_fen_counter(halfmove, "halfmove clock");
    state.fullmoveNumber = parse_fen_counter(fullmove, "fullmove number");
    if (state.fullmoveNumber == 0)
    {
        state.fullmoveNumber = 1;
    }

    squares_ = squares;
    state_ = state;
}

std::string Board::to_fen() const
{
    std::ostringstream stream;

    for (int rank = 7; rank >= 0; --rank)
    {
        int emptyCount = 0;
        for (int file = 0; file < 8; ++file)
        {
            const Piece piece = squares_[static_cast<std::size_t>(make_square(file, rank))];
            if (piece == Piece::None)
            {
                ++emptyCount;
                continue;
            }
            if (emptyCount > 0)
            {
                stream << emptyCount;
                emptyCount = 0;
            }
            stream << char_from_piece(piece);
        }
        if (emptyCount > 0)
        {
            stream << emptyCount;
        }
        if (rank > 0)
        {
            stream << '/';
        }
    }

    stream << ' ' << (state_.sideToMove == Color::White ? 'w' : 'b') << ' ';

    if (state_.castlingRights == 0)
    {
        stream << '-';
    }
    else
    {
        if (state_.castlingRights & CastleWhiteKing) stream << 'K';
        if (state_.castlingRights & CastleWhiteQueen) stream << 'Q';
        if (state_.castlingRights & CastleBlackKing) stream << 'k';
        if (state_.castlingRights & CastleBlackQueen) stream << 'q';
    }

    stream << ' ';
    if (state_.enPassantSquare != NoSquare && has_legal_en_passant())
    {
        stream << square_to_string(state_.enPassantSquare);
    }
    else
    {
        stream << '-';
    }

    stream << ' ' << state_.halfmoveClock << ' ' << state_.fullmoveNumber;

    return stream.str();
}

std::vector<Move> Board::generate_legal_moves() const
{
    std::vector<Move> legalMoves;
    const std::vector<Move> pseudoMoves = generate_pseudo_legal_moves();

    legalMoves.reserve(pseudoMoves.size());

    for (const Move& move : pseudoMoves)
    {
        Board copy = *this;
        const Color movingSide = copy.side_to_move();
        copy.make_move(move);
        if (!copy.is_in_check(movingSide))
        {
            legalMoves.push_back(move);
        }
    }

    return legalMoves;
}

void Board::make_move(const Move& move)
{
    const Color movingSide = state_.sideToMove;
    const bool isPawn = piece_type(move.movingPiece) == PieceType::Pawn;

    if (movingSide == Color::Black)
    {
        ++state_.fullmoveNumber;
    }

    state_.halfmoveClock = (isPawn || move.is_capture()) ? 0 : state_.halfmoveClock + 1;
    state_.enPassantSquare = NoSquare;

    if (move.flags & MoveFlagEnPassant)
    {
        const int captureSquare = (movingSide == Color::White) ? move.to - 8 : move.to + 8;
        squares_[static_cast<std::size_t>(captureSquare)] = Piece::None;
    }

    if (move.is_castle())
    {
        const int homeRank = rank_of(move.from);
        const bool kingSide = (move.flags & MoveFlagCastleKingSide) != 0U;
        const int rookFrom = make_square(kingSide ? 7 : 0, homeRank);
        const int rookTo = make_square(kingSide ? 5 : 3, homeRank);
        squares_[static_cast<std::size_t>(rookTo)] = squares_[static_cast<std::size_t>(rookFrom)];
        squares_[static_cast<std::size_t>(rookFrom)] = Piece::None;
    }

    squares_[static_cast<std::size_t>(move.from)] = Piece::None;
    squares_[static_cast<std::size_t>(move.to)] = move.is_promotion() ? move.promotionPiece : move.movingPiece;

    state_.castlingRights &= static_cast<std::uint8_t>(~(rights_touched_by(move.from) | rights_touched_by(move.to)));

    if (isPawn && (move.flags & MoveFlagDoublePawnPush))
    {
        state_.enPassantSquare = (move.from + move.to) / 2;
    }

    state_.sideToMove = opposite_color(state_.sideToMove);
}

Color Board::side_to_move() const noexcept
{
    return state_.sideToMove;
}

int Board::fullmove_number() const noexcept
{
    return state_.fullmoveNumber;
}

Piece Board::piece_at(int square) const noexcept
{
    if (!is_valid_square(square))
    {
        return Piece::None;
    }
    return squares_[static_cast<std::size_t>(square)];
}

bool Board::is_in_check(Color side) const
{
    const int kingSquare = find_king_square(side);
    if (kingSquare == NoSquare)
    {
        return false;
    }

    return is_square_attacked(kingSquare, opposite_color(side));
}

bool Board::is_checkmate() const
{
    return is_in_check(state_.sideToMove) && generate_legal_moves().empty();
}

std::vector<Move> Board::generate_pseudo_legal_moves() const
{
    std::vector<Move> moves;
    moves.reserve(64);

    for (int square = 0; square < 64; ++square)
    {
        const Piece piece = squares_[static_cast<std::size_t>(square)];
        if (!is_color(piece, state_.sideToMove))
        {
            continue;
        }

        switch (piece_type(piece))
        {
        case PieceType::Pawn:
            add_pawn_moves(square, piece, moves);
            break;
        case PieceType::Knight:
            add_step_moves(square, piece, KnightDeltas, moves);
            break;
        case PieceType::Bishop:
            add_slider_moves(square, piece, BishopDirections, 4, moves);
            break;
        case PieceType::Rook:
            add_slider_moves(square, piece, RookDirections, 4, moves);
            break;
        case PieceType::Queen:
            add_slider_moves(square, piece, BishopDirections, 4, moves);
            add_slider_moves(square, piece, RookDirections, 4, moves);
            break;
        case PieceType::King:
            add_step_moves(square, piece, KingDeltas, moves);
            add_castling_moves(square, piece, moves);
            break;
        case PieceType::None:
            break;
        }
    }

    return moves;
}

void Board::add_pawn_moves(int square, Piece piece, std::vector<Move>& moves) const
{
    const Color us = state_.sideToMove;
    const int direction = (us == Color::White) ? 1 : -1;
    const int startRank = (us == Color::White) ? 1 : 6;
    const int lastRank = (us == Color::White) ? 7 : 0;

    const int file = file_of(square);
    const int targetRank = rank_of(square) + direction;
    if (targetRank < 0 || targetRank > 7)
    {
        return;
    }

    const auto push_with_promotions = [&](int target, Piece captured, std::uint8_t flags)
    {
        if (targetRank == lastRank)
        {
            for (PieceType type : PromotionTypes)
            {
                moves.emplace_back(square,
                                   target,
                                   piece,
                                   captured,
                                   make_piece(us, type),
                                   static_cast<std::uint8_t>(flags | MoveFlagPromotion));
            }
        }
        else
        {
            moves.emplace_back(square, target, piece, captured, Piece::None, flags);
        }
    };

    const int forward = make_square(file, targetRank);
    if (piece_at(forward) == Piece::None)
    {
        push_with_promotions(forward, Piece::None, MoveFlagNone);

        if (rank_of(square) == startRank)
        {
            const int doublePush = make_square(file, targetRank + direction);
            if (piece_at(doublePush) == Piece::None)
            {
                moves.emplace_back(square,
                                   doublePush,
                                   piece,
                                   Piece::None,
                                   Piece::None,
                                   static_cast<std::uint8_t>(MoveFlagDoublePawnPush));
            }
        }
    }

    for (int df : {-1, 1})
    {
        const int captureFile = file + df;
        if (captureFile < 0 || captureFile > 7)
        {
            continue;
        }

        const int target = make_square(captureFile, targetRank);
        const Piece targetPiece = piece_at(target);

        if (is_color(targetPiece, opposite_color(us)))
        {
            push_with_promotions(target, targetPiece, MoveFlagCapture);
        }
        else if (target == state_.enPassantSquare)
        {
            moves.emplace_back(square,
                               target,
                               piece,
                               make_piece(opposite_color(us), PieceType::Pawn),
                               Piece::None,
                               static_cast<std::uint8_t>(MoveFlagEnPassant | MoveFlagCapture));
        }
    }
}

void Board::add_step_moves(int square, Piece piece, const int (*deltas)[2], std::vector<Move>& moves) const
{
    const Color them = opposite_color(state_.sideToMove);

    for (int i = 0; i < 8; ++i)
    {
        const int targetFile = file_of(square) + deltas[i][0];
        const int targetRank = rank_of(square) + deltas[i][1];
        if (!on_board(targetFile, targetRank))
        {
            continue;
        }

        const int target = make_square(targetFile, targetRank);
        const Piece targetPiece = piece_at(target);
        if (is_empty_piece(targetPiece))
        {
            moves.emplace_back(square, target, piece);
        }
        else if (is_color(targetPiece, them))
        {
            moves.emplace_back(square,
                               target,
                               piece,
                               targetPiece,
                               Piece::None,
                               static_cast<std::uint8_t>(MoveFlagCapture));
        }
    }
}

void Board::add_slider_moves(int square,
                             Piece piece,
                             const int (*directions)[2],
                             int directionCount,
                             std::vector<Move>& moves) const
{
    const Color them = opposite_color(state_.sideToMove);

    for (int i = 0; i < directionCount; ++i)
    {
        int currentFile = file_of(square) + directions[i][0];
        int currentRank = rank_of(square) + directions[i][1];
        while (on_board(currentFile, currentRank))
        {
            const int target = make_square(currentFile, currentRank);
            const Piece targetPiece = piece_at(target);
            if (is_empty_piece(targetPiece))
            {
                moves.emplace_back(square, target, piece);
            }
            else
            {
                if (is_color(targetPiece, them))
                {
                    moves.emplace_back(square,
                                       target,
                                       piece,
                                       targetPiece,
                                       Piece::None,
                                       static_cast<std::uint8_t>(MoveFlagCapture));
                }
                break;
            }
            currentFile += directions[i][0];
            currentRank += directions[i][1];
        }
    }
}

void Board::add_castling_moves(int square, Piece piece, std::vector<Move>& moves) const
{
    const bool isWhite = piece == Piece::WhiteKing;
    const int homeRank = isWhite ? 0 : 7;
    const Color them = opposite_color(state_.sideToMove);

    if (square != make_square(4, homeRank) || is_square_attacked(square, them))
    {
        return;
    }

    const std::uint8_t kingSideRight = isWhite ? CastleWhiteKing : CastleBlackKing;
    const std::uint8_t queenSideRight = isWhite ? CastleWhiteQueen : CastleBlackQueen;
    const Piece rook = make_piece(state_.sideToMove, PieceType::Rook);

    if ((state_.castlingRights & kingSideRight) &&
        piece_at(make_square(7, homeRank)) == rook)
    {
        const int fSquare = make_square(5, homeRank);
        const int gSquare = make_square(6, homeRank);
        if (piece_at(fSquare) == Piece::None && piece_at(gSquare) == Piece::None &&
            !is_square_attacked(fSquare, them) && !is_square_attacked(gSquare, them))
        {
            moves.emplace_back(square,
                               gSquare,
                               piece,
                               Piece::None,
                               Piece::None,
                               static_cast<std::uint8_t>(MoveFlagCastleKingSide));
        }
    }

    if ((state_.castlingRights & queenSideRight) &&
        piece_at(make_square(0, homeRank)) == rook)
    {
        const int dSquare = make_square(3, homeRank);
        const int cSquare = make_square(2, homeRank);
        const int bSquare = make_square(1, homeRank);
        if (piece_at(dSquare) == Piece::None && piece_at(cSquare) == Piece::None &&
            piece_at(bSquare) == Piece::None &&
            !is_square_attacked(dSquare, them) && !is_square_attacked(cSquare, them))
        {
            moves.emplace_back(square,
                               cSquare,
                               piece,
                               Piece::None,
                               Piece::None,
                               static_cast<std::uint8_t>(MoveFlagCastleQueenSide));
        }
    }
}

bool Board::is_square_attacked(int square, Color bySide) const
{
    const int file = file_of(square);
    const int rank = rank_of(square);

    const auto piece_on = [this](int f, int r, PieceType type, Color color)
    {
        return on_board(f, r) && piece_at(make_square(f, r)) == make_piece(color, type);
    };

    const int pawnRank = rank + ((bySide == Color::White) ? -1 : 1);
    if (piece_on(file - 1, pawnRank, PieceType::Pawn, bySide) ||
        piece_on(file + 1, pawnRank, PieceType::Pawn, bySide))
    {
        return true;
    }

    for (const auto& delta : KnightDeltas)
    {
        if (piece_on(file + delta[0], rank + delta[1], PieceType::Knight, bySide))
        {
            return true;
        }
    }

    for (const auto& delta : KingDeltas)
    {
        if (piece_on(file + delta[0], rank + delta[1], PieceType::King, bySide))
        {
            return true;
        }
    }

    const auto slider_hits = [&](const int (*directions)[2], PieceType sliderType)
    {
        for (int i = 0; i < 4; ++i)
        {
            int currentFile = file + directions[i][0];
            int currentRank = rank + directions[i][1];
            while (on_board(currentFile, currentRank))
            {
                const Piece target = piece_at(make_square(currentFile, currentRank));
                if (!is_empty_piece(target))
                {
                    if (target == make_piece(bySide, sliderType) ||
                        target == make_piece(bySide, PieceType::Queen))
                    {
                        return true;
                    }
                    break;
                }
                currentFile += directions[i][0];
                currentRank += directions[i][1];
            }
        }
        return false;
    };

    return slider_hits(BishopDirections, PieceType::Bishop) ||
           slider_hits(RookDirections, PieceType::Rook);
}

int Board::find_king_square(Color side) const
{
    const Piece kingPiece = make_piece(side, PieceType::King);
    for (int square = 0; square < 64; ++square)
    {
        if (squares_[static_cast<std::size_t>(square)] == kingPiece)
        {
            return square;
        }
    }
    return NoSquare;
}

bool Board::has_legal_en_passant() const
{
    for (const Move& move : generate_legal_moves())
    {
        if (move.flags & MoveFlagEnPassant)
        {
            return true;
        }
    }
    return false;
}
