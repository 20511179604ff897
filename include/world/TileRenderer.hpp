/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#ifndef TILE_RENDERER_HPP
#define TILE_RENDERER_HPP

#include "collisions/FloatRect.hpp"
#include "world/Chunk.hpp"
#include "utils/Vector2D.hpp"
#include <SDL3/SDL.h>
#include <memory>
#include <string>
#include <unordered_map>
#include <vector>

namespace StrataEngine {

class ChunkManager;

/**
 * @brief Draws tile draw commands with an SDL renderer.
 *
 * Texture lookup order for a tile: a texture registered for its code, then
 * its cell in a loaded spritesheet, then a flat colour derived from the
 * code. Background tiles are drawn at half brightness.
 */
class TileRenderer {
public:
    TileRenderer() = default;

    TileRenderer(const TileRenderer&) = delete;
    TileRenderer& operator=(const TileRenderer&) = delete;

    // Load an image file as the spritesheet named sheetName (TileProperties::spritesheet)
    bool loadSpritesheet(SDL_Renderer* renderer, const std::string& sheetName, const std::string& path);

    void setTileTexture(char code, std::shared_ptr<SDL_Texture> texture);
    bool hasTileTexture(char code) const { return m_tileTextures.count(code) > 0; }
    bool hasSpritesheet(const std::string& sheetName) const { return m_spritesheets.count(sheetName) > 0; }

    // Draw commands in order, offset by the camera; null renderer is a no-op
    void render(SDL_Renderer* renderer, const std::vector<TileDrawCommand>& commands,
                const Vector2D& cameraOffset) const;

    // Collect and draw one layer of the loaded chunks visible from the camera
    void renderLayer(SDL_Renderer* renderer, const ChunkManager& chunks, ChunkLayer layer,
                     const FloatRect& view) const;

    // Fallback colour for untextured tiles
    static SDL_Color getTileColor(char code, ChunkLayer layer);

    void clear();

private:
    std::unordered_map<char, std::shared_ptr<SDL_Texture>> m_tileTextures;
    std::unordered_map<std::string, std::shared_ptr<SDL_Texture>> m_spritesheets;

    void drawTile(SDL_Renderer* renderer, const TileDrawCommand& command, const SDL_FRect& dest) const;
};

} // namespace StrataEngine

#endif // TILE_RENDERER_HPP
