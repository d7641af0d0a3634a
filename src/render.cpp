#include "render.h"

#include <SDL.h>
#include <SDL_image.h>

#include <algorithm>
#include <array>
#include <cctype>
#include <cmath>
#include <cstring>
#include <memory>
#include <stdexcept>
#include <unordered_map>

#include "board.h"
#include "move.h"

namespace render
{
    namespace
    {
        const SDL_Color LightSquare{255, 206, 158, 255};
        const SDL_Color DarkSquare{209, 139, 71, 255};
        const SDL_Color WhiteMan{250, 250, 250, 255};
        const SDL_Color BlackMan{35, 35, 35, 255};
        const SDL_Color ArrowGreen{21, 120, 27, 128};

        struct SurfaceDeleter
        {
            void operator()(SDL_Surface* surface) const { SDL_FreeSurface(surface); }
        };

        struct RendererDeleter
        {
            void operator()(SDL_Renderer* renderer) const { SDL_DestroyRenderer(renderer); }
        };

        struct TextureDeleter
        {
            void operator()(SDL_Texture* texture) const { SDL_DestroyTexture(texture); }
        };

        using SurfacePtr = std::unique_ptr<SDL_Surface, SurfaceDeleter>;
        using RendererPtr = std::unique_ptr<SDL_Renderer, RendererDeleter>;
        using TexturePtr = std::unique_ptr<SDL_Texture, TextureDeleter>;

        struct Glyph
        {
            int width{5};
            std::array<std::uint8_t, 7> rows{};
        };

        Glyph glyph_for_piece(PieceType type)
        {
            switch (type)
            {
            case PieceType::King:   return {5, {0b10001, 0b10010, 0b10100, 0b11000, 0b10100, 0b10010, 0b10001}};
            case PieceType::Queen:  return {5, {0b01110, 0b10001, 0b10001, 0b10001, 0b10101, 0b10010, 0b01101}};
            case PieceType::Rook:   return {5, {0b11110, 0b10001, 0b10001, 0b11110, 0b10100, 0b10010, 0b10001}};
            case PieceType::Bishop: return {5, {0b11110, 0b10001, 0b10001, 0b11110, 0b10001, 0b10001, 0b11110}};
            case PieceType::Knight: return {5, {0b10001, 0b11001, 0b10101, 0b10011, 0b10001, 0b10001, 0b10001}};
            case PieceType::Pawn:   return {5, {0b11110, 0b10001, 0b10001, 0b11110, 0b10000, 0b10000, 0b10000}};
            default:
                return {5, {0, 0, 0, 0, 0, 0, 0}};
            }
        }

        std::string piece_texture_name(Piece piece)
        {
            if (piece == Piece::None)
            {
                return {};
            }
            const char color = is_white_piece(piece) ? 'w' : 'b';
            const char letter = static_cast<char>(std::toupper(static_cast<unsigned char>(char_from_piece(piece))));
            return std::string{color, letter} + ".png";
        }

        void fill_rect(SDL_Renderer* renderer, const SDL_Rect& rect, SDL_Color color)
        {
            SDL_SetRenderDrawColor(renderer, color.r, color.g, color.b, color.a);
            SDL_RenderFillRect(renderer, &rect);
        }

        SDL_Rect square_rect(int square, int squareSize)
        {
            return {file_of(square) * squareSize, (7 - rank_of(square)) * squareSize, squareSize, squareSize};
        }

        SDL_FPoint square_center(int square, int squareSize)
        {
            const SDL_Rect rect = square_rect(square, squareSize);
            return {static_cast<float>(rect.x + squareSize / 2), static_cast<float>(rect.y + squareSize / 2)};
        }

        void draw_glyph(SDL_Renderer* renderer, int x, int y, int scale, const Glyph& glyph, SDL_Color color)
        {
            SDL_SetRenderDrawColor(renderer, color.r, color.g, color.b, color.a);
            for (int row = 0; row < 7; ++row)
            {
                const std::uint8_t bits = glyph.rows[static_cast<std::size_t>(row)];
                for (int col = 0; col < glyph.width; ++col)
                {
                    if ((bits >> (glyph.width - 1 - col)) & 1U)
                    {
                        SDL_Rect pixel{x + col * scale, y + row * scale, scale, scale};
                        SDL_RenderFillRect(renderer, &pixel);
                    }
                }
            }
        }

        void draw_disc(SDL_Renderer* renderer, const SDL_FPoint& center, float radius, SDL_Color color)
        {
            SDL_SetRenderDrawColor(renderer, color.r, color.g, color.b, color.a);
            const int r = static_cast<int>(radius);
            for (int dy = -r; dy <= r; ++dy)
            {
                const int half = static_cast<int>(std::sqrt(radius * radius - static_cast<float>(dy * dy)));
                const int y = static_cast<int>(center.y) + dy;
                SDL_RenderDrawLine(renderer,
                                   static_cast<int>(center.x) - half,
                                   y,
                                   static_cast<int>(center.x) + half,
                                   y);
            }
        }

        void draw_glyph_piece(SDL_Renderer* renderer, int square, Piece piece, int squareSize)
        {
            const bool white = is_white_piece(piece);
            const SDL_FPoint center = square_center(square, squareSize);
            draw_disc(renderer, center, squareSize * 0.42f, white ? BlackMan : WhiteMan);
            draw_disc(renderer, center, squareSize * 0.38f, white ? WhiteMan : BlackMan);

            const Glyph glyph = glyph_for_piece(piece_type(piece));
            const int scale = std::max(1, squareSize / 12);
            const int x = static_cast<int>(center.x) - (glyph.width * scale) / 2;
            const int y = static_cast<int>(center.y) - (7 * scale) / 2;
            draw_glyph(renderer, x, y, scale, glyph, white ? BlackMan : WhiteMan);
        }

        void draw_filled_triangle(SDL_Renderer* renderer,
                                  const SDL_FPoint& p0,
                                  const SDL_FPoint& p1,
                                  const SDL_FPoint& p2,
                                  SDL_Color color)
        {
            SDL_SetRenderDrawColor(renderer, color.r, color.g, color.b, color.a);

            const int minX = static_cast<int>(std::floor(std::min({p0.x, p1.x, p2.x})));
            const int maxX = static_cast<int>(std::ceil(std::max({p0.x, p1.x, p2.x})));
            const int minY = static_cast<int>(std::floor(std::min({p0.y, p1.y, p2.y})));
            const int maxY = static_cast<int>(std::ceil(std::max({p0.y, p1.y, p2.y})));

            const auto edge = [](const SDL_FPoint& a, const SDL_FPoint& b, float x, float y)
            {
                return (x - a.x) * (b.y - a.y) - (y - a.y) * (b.x - a.x);
            };

            for (int y = minY; y <= maxY; ++y)
            {
                for (int x = minX; x <= maxX; ++x)
                {
                    const float fx = static_cast<float>(x);
                    const float fy = static_cast<float>(y);
                    const float w0 = edge(p1, p2, fx, fy);
                    const float w1 = edge(p2, p0, fx, fy);
                    const float w2 = edge(p0, p1, fx, fy);

                    if ((w0 >= 0 && w1 >= 0 && w2 >= 0) || (w0 <= 0 && w1 <= 0 && w2 <= 0))
                    {
                        SDL_RenderDrawPoint(renderer, x, y);
                    }
                }
            }
        }

        // Shaft is a filled quad, head a triangle.
        void draw_arrow(SDL_Renderer* renderer, int fromSquare, int toSquare, int squareSize, SDL_Color color)
        {
            if (fromSquare == toSquare || !is_valid_square(fromSquare) || !is_valid_square(toSquare))
            {
                return;
            }

            const SDL_FPoint from = square_center(fromSquare, squareSize);
            const SDL_FPoint to = square_center(toSquare, squareSize);

            const float dx = to.x - from.x;
            const float dy = to.y - from.y;
            const float len = std::sqrt(dx * dx + dy * dy);
            const float nx = dx / len;
            const float ny = dy / len;

            const float halfShaft = std::max(1.0f, squareSize * 0.08f);
            const float headLen = squareSize * 0.4f;
            const float halfHead = squareSize * 0.2f;

            const SDL_FPoint base{to.x - nx * headLen, to.y - ny * headLen};
            const SDL_FPoint a{from.x - ny * halfShaft, from.y + nx * halfShaft};
            const SDL_FPoint b{from.x + ny * halfShaft, from.y - nx * halfShaft};
            const SDL_FPoint c{base.x + ny * halfShaft, base.y - nx * halfShaft};
            const SDL_FPoint d{base.x - ny * halfShaft, base.y + nx * halfShaft};

            draw_filled_triangle(renderer, a, b, c, color);
            draw_filled_triangle(renderer, a, c, d, color);

            const SDL_FPoint left{base.x - ny * halfHead, base.y + nx * halfHead};
            const SDL_FPoint right{base.x + ny * halfHead, base.y - nx * halfHead};
            draw_filled_triangle(renderer, to, left, right, color);
        }

        std::unordered_map<Piece, TexturePtr> load_piece_textures(SDL_Renderer* renderer,
                                                                 const std::filesystem::path& dir)
        {
            std::unordered_map<Piece, TexturePtr> textures;
            if (dir.empty())
            {
                return textures;
            }

            for (int index = static_cast<int>(Piece::WhitePawn); index <= static_cast<int>(Piece::BlackKing); ++index)
            {
                const Piece piece = static_cast<Piece>(index);
                const std::filesystem::path path = dir / piece_texture_name(piece);
                std::error_code ec;
                if (!std::filesystem::exists(path, ec))
                {
                    continue;
                }
                SDL_Texture* texture = IMG_LoadTexture(renderer, path.string().c_str());
                if (texture)
                {
                    textures.emplace(piece, TexturePtr(texture));
                }
            }
            return textures;
        }
    }

    Image render_board(const std::string& fen, const Move& move, const RenderOptions& options)
    {
        const Board board(fen);
        const int squareSize = std::max(8, options.squareSize);
        const int size = squareSize * 8;

        SurfacePtr surface(SDL_CreateRGBSurfaceWithFormat(0, size, size, 32, SDL_PIXELFORMAT_RGBA32));
        if (!surface)
        {
            throw std::runtime_error(std::string("SDL_CreateRGBSurfaceWithFormat failed: ") + SDL_GetError());
        }

        RendererPtr renderer(SDL_CreateSoftwareRenderer(surface.get()));
        if (!renderer)
        {
            throw std::runtime_error(std::string("SDL_CreateSoftwareRenderer failed: ") + SDL_GetError());
        }
        SDL_SetRenderDrawBlendMode(renderer.get(), SDL_BLENDMODE_BLEND);

        const auto textures = load_piece_textures(renderer.get(), options.pieceAssetsDir);

        for (int square = 0; square < 64; ++square)
        {
            const bool dark = (file_of(square) + rank_of(square)) % 2 == 0;
            const SDL_Rect rect = square_rect(square, squareSize);
            fill_rect(renderer.get(), rect, dark ? DarkSquare : LightSquare);

            const Piece piece = board.piece_at(square);
            if (piece == Piece::None)
            {
                continue;
            }

            const auto it = textures.find(piece);
            if (it != textures.end())
            {
                SDL_RenderCopy(renderer.get(), it->second.get(), nullptr, &rect);
            }
            else
            {
                draw_glyph_piece(renderer.get(), square, piece, squareSize);
            }
        }

        draw_arrow(renderer.get(), move.from, move.to, squareSize, ArrowGreen);
        SDL_RenderPresent(renderer.get());

        Image image;
        image.width = size;
        image.height = size;
        image.pixels.resize(static_cast<std::size_t>(size) * static_cast<std::size_t>(size) * 4U);

        if (SDL_MUSTLOCK(surface.get()))
        {
            SDL_LockSurface(surface.get());
        }
        const auto* source = static_cast<const std::uint8_t*>(surface->pixels);
        const std::size_t rowBytes = static_cast<std::size_t>(size) * 4U;
        for (int row = 0; row < size; ++row)
        {
            std::memcpy(image.pixels.data() + static_cast<std::size_t>(row) * rowBytes,
                        source + static_cast<std::size_t>(row) * static_cast<std::size_t>(surface->pitch),
                        rowBytes);
        }
        if (SDL_MUSTLOCK(surface.get()))
        {
            SDL_UnlockSurface(surface.get());
        }

        return image;
    }

    void save_png(const Image& image, const std::filesystem::path& path)
    {
        if (image.empty())
        {
            throw std::runtime_error("cannot save an empty image to " + path.string());
        }

        // SDL only reads from the buffer.
        SurfacePtr surface(SDL_CreateRGBSurfaceWithFormatFrom(const_cast<std::uint8_t*>(image.pixels.data()),
                                                              image.width,
                                                              image.height,
                                                              32,
                                                              image.width * 4,
                                                              SDL_PIXELFORMAT_RGBA32));
        if (!surface)
        {
            throw std::runtime_error(std::string("SDL_CreateRGBSurfaceWithFormatFrom failed: ") + SDL_GetError());
        }

        if (IMG_SavePNG(surface.get(), path.string().c_str()) != 0)
        {
            throw std::runtime_error("failed to write " + path.string() + ": " + IMG_GetError());
        }
    }
}
