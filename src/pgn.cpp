#include "pgn.h"

#include <cctype>
#include <fstream>
#include <optional>
#include <sstream>
#include <stdexcept>

#include "board.h"
#include "errors.h"
#include "notation.h"

namespace
{
    bool is_result_token(const std::string& token)
    {
        return token == "1-0" || token == "0-1" || token == "1/2-1/2" || token == "*";
    }

    // Strips a leading move number ("12.", "12...") that may be glued to the move itself.
    std::string strip_move_number(const std::string& token)
    {
        std::size_t pos = 0;
        while (pos < token.size() && std::isdigit(static_cast<unsigned char>(token[pos])))
        {
            ++pos;
        }
        if (pos == 0 || pos == token.size() || token[pos] != '.')
        {
            return token;
        }
        while (pos < token.size() && token[pos] == '.')
        {
            ++pos;
        }
        return token.substr(pos);
    }

    class Scanner
    {
    public:
        explicit Scanner(const std::string& text)
            : text_(text)
        {
        }

        [[nodiscard]] bool at_end() const noexcept { return pos_ >= text_.size(); }
        [[nodiscard]] char peek() const noexcept { return at_end() ? '\0' : text_[pos_]; }

        void skip_space()
        {
            while (!at_end())
            {
                const char ch = peek();
                if (ch == '%' && at_line_start())
                {
                    skip_line();
                }
                else if (std::isspace(static_cast<unsigned char>(ch)))
                {
                    ++pos_;
                }
                else
                {
                    break;
                }
            }
        }

        [[nodiscard]] bool at_line_start() const noexcept
        {
            return pos_ == 0 || text_[pos_ - 1] == '\n' || text_[pos_ - 1] == '\r';
        }

        void skip_line()
        {
            while (!at_end() && peek() != '\n')
            {
                ++pos_;
            }
        }

        void skip_comment()
        {
            const std::size_t close = text_.find('}', pos_);
            if (close == std::string::npos)
            {
                throw InvalidGameError("unterminated '{' comment in PGN movetext");
            }
            pos_ = close + 1;
        }

        void skip_variation()
        {
            int depth = 0;
            while (!at_end())
            {
                const char ch = peek();
                if (ch == '{')
                {
                    skip_comment();
                    continue;
                }
                if (ch == ';')
                {
                    skip_line();
                    continue;
                }
                ++pos_;
                if (ch == '(')
                {
                    ++depth;
                }
                else if (ch == ')' && --depth == 0)
                {
                    return;
                }
            }
            throw InvalidGameError("unterminated '(' variation in PGN movetext");
        }

        std::pair<std::string, std::string> read_tag()
        {
            ++pos_;
            skip_space();
            std::string name;
            while (!at_end() && (std::isalnum(static_cast<unsigned char>(peek())) || peek() == '_'))
            {
                name += text_[pos_++];
            }
            skip_space();
            if (name.empty() || peek() != '"')
            {
                throw InvalidGameError("malformed PGN tag pair near offset " + std::to_string(pos_));
            }
            ++pos_;

            std::string value;
            while (!at_end() && peek() != '"')
            {
                if (peek() == '\\' && pos_ + 1 < text_.size())
                {
                    ++pos_;
                }
                value += text_[pos_++];
            }
            if (at_end())
            {
                throw InvalidGameError("unterminated value for PGN tag '" + name + "'");
            }
            ++pos_;
            skip_space();
            if (peek() != ']')
            {
                throw InvalidGameError("missing ']' after PGN tag '" + name + "'");
            }
            ++pos_;
            return {name, value};
        }

        std::string read_token()
        {
            std::string token;
            while (!at_end())
            {
                const char ch = peek();
                if (std::isspace(static_cast<unsigned char>(ch)) ||
                    ch == '{' || ch == '(' || ch == ')' || ch == ';' || ch == '[')
                {
                    break;
                }
                token += ch;
                ++pos_;
            }
            return token;
        }

        void advance() noexcept { ++pos_; }

    private:
        const std::string& text_;
        std::size_t pos_{0};
    };
}

namespace pgn
{
    Game read_game(const std::string& text)
    {
        Game game;
        Scanner scanner(text);

        scanner.skip_space();
        while (scanner.peek() == '[')
        {
            game.tags.insert(scanner.read_tag());
            scanner.skip_space();
        }

        const auto fenTag = game.tags.find("FEN");
        game.startFen = (fenTag != game.tags.end()) ? fenTag->second : StartingFen;

        Board board;
        try
        {
            board.load_fen(game.startFen);
        }
        catch (const std::invalid_argument& e)
        {
            throw InvalidGameError(std::string("bad FEN tag: ") + e.what());
        }

        bool sawMovetext = false;
        bool terminated = false;

        while (!terminated)
        {
            scanner.skip_space();
            if (scanner.at_end())
            {
                break;
            }

            const char ch = scanner.peek();
            if (ch == '[' && scanner.at_line_start())
            {
                // Start of the next game's tag section.
                break;
            }
            if (ch == '{')
            {
                scanner.skip_comment();
                continue;
            }
            if (ch == ';')
            {
                scanner.skip_line();
                continue;
            }
            if (ch == '(')
            {
                scanner.skip_variation();
                continue;
            }
            if (ch == ')' || ch == '[')
            {
                throw InvalidGameError(std::string("unexpected '") + ch + "' in PGN movetext");
            }

            const std::string raw = scanner.read_token();
            if (raw.empty())
            {
                scanner.advance();
                continue;
            }
            sawMovetext = true;

            if (is_result_token(raw))
            {
                game.result = raw;
                terminated = true;
                continue;
            }
            if (raw.front() == '$')
            {
                continue;
            }

            const std::string san = strip_move_number(raw);
            const bool bareNumber = !san.empty() &&
                                    std::isdigit(static_cast<unsigned char>(san.front())) &&
                                    san.find('-') == std::string::npos;
            if (san.empty() || bareNumber)
            {
                continue;
            }

            const std::optional<Move> move = san_to_move(board, san);
            if (!move)
            {
                throw InvalidGameError("illegal or ambiguous move '" + san + "' at ply " +
                                       std::to_string(game.moves.size() + 1));
            }

            game.moves.push_back(*move);
            game.sanMoves.push_back(san);
            board.make_move(*move);
        }

        if (game.tags.empty() && !sawMovetext)
        {
            throw InvalidGameError("no valid PGN game found");
        }

        if (!terminated)
        {
            const auto resultTag = game.tags.find("Result");
            if (resultTag != game.tags.end())
            {
                game.result = resultTag->second;
            }
        }

        return game;
    }

    Game read_game_file(const std::filesystem::path& path)
    {
        std::ifstream in(path);
        if (!in)
        {
            throw InvalidGameError("failed to open PGN file: " + path.string());
        }

        std::ostringstream contents;
        contents << in.rdbuf();
        return read_game(contents.str());
    }
}
