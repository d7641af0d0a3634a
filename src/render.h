#pragma once

#include <cstdint>
#include <filesystem>
#include <string>
#include <vector>

struct Move;

namespace render
{
    // Tightly packed RGBA, 4 bytes per pixel, rows top to bottom.
    struct Image
    {
        int width{0};
        int height{0};
        std::vector<std::uint8_t> pixels;

        [[nodiscard]] bool empty() const noexcept { return pixels.empty(); }
    };

    struct RenderOptions
    {
        int squareSize{48};
        // Directory holding wP.png .. bK.png; letter glyphs are drawn when empty or incomplete.
        std::filesystem::path pieceAssetsDir;
    };

    // Draws the position with an arrow from the move's source to its target square.
    // Uses the SDL software renderer, so no window or video driver is needed.
    // Throws std::runtime_error if SDL cannot allocate the drawing surface.
    Image render_board(const std::string& fen, const Move& move, const RenderOptions& options = {});

    void save_png(const Image& image, const std::filesystem::path& path);
}
