/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#include "world/TileRenderer.hpp"
#include "core/Logger.hpp"
#include "managers/ChunkManager.hpp"
#include <SDL3_image/SDL_image.h>

namespace StrataEngine {

namespace {

constexpr Uint8 BACKGROUND_DIM = 128;

Uint8 dim(Uint8 channel) {
    return static_cast<Uint8>(channel * BACKGROUND_DIM / 255);
}

} // namespace

bool TileRenderer::loadSpritesheet(SDL_Renderer* renderer, const std::string& sheetName,
                                   const std::string& path) {
    if (!renderer) {
        RENDER_ERROR("TileRenderer::loadSpritesheet - no renderer for " + path);
        return false;
    }

    auto surface = std::unique_ptr<SDL_Surface, decltype(&SDL_DestroySurface)>(
        IMG_Load(path.c_str()), SDL_DestroySurface);
    if (!surface) {
        RENDER_ERROR("Could not load image: " + std::string(SDL_GetError()));
        return false;
    }

    auto texture = std::unique_ptr<SDL_Texture, decltype(&SDL_DestroyTexture)>(
        SDL_CreateTextureFromSurface(renderer, surface.get()), SDL_DestroyTexture);
    if (!texture) {
        RENDER_ERROR("Could not create texture: " + std::string(SDL_GetError()));
        return false;
    }

    // Nearest-pixel sampling keeps tile edges sharp when scaled
    SDL_SetTextureScaleMode(texture.get(), SDL_SCALEMODE_NEAREST);
    m_spritesheets[sheetName] = std::shared_ptr<SDL_Texture>(texture.release(), SDL_DestroyTexture);
    RENDER_INFO("Loaded spritesheet '" + sheetName + "' from " + path);
    return true;
}

void TileRenderer::setTileTexture(char code, std::shared_ptr<SDL_Texture> texture) {
    if (!texture) {
        m_tileTextures.erase(code);
        return;
    }
    m_tileTextures[code] = std::move(texture);
}

SDL_Color TileRenderer::getTileColor(char code, ChunkLayer layer) {
    // Spread codes over the colour cube so neighbouring codes differ
    const auto value = static_cast<unsigned char>(code);
    SDL_Color color{static_cast<Uint8>(64 + (value * 53) % 192), static_cast<Uint8>(64 + (value * 97) % 192),
                    static_cast<Uint8>(64 + (value * 29) % 192), 255};
    if (layer == ChunkLayer::Background) {
        color.r = dim(color.r);
        color.g = dim(color.g);
        color.b = dim(color.b);
    }
    return color;
}

void TileRenderer::render(SDL_Renderer* renderer, const std::vector<TileDrawCommand>& commands,
                          const Vector2D& cameraOffset) const {
    if (!renderer) {
        return;
    }

    for (const TileDrawCommand& command : commands) {
        if (!command.properties) {
            continue;
        }
        const SDL_FRect dest{command.dest.x - cameraOffset.getX(), command.dest.y - cameraOffset.getY(),
                             command.dest.width, command.dest.height};
        drawTile(renderer, command, dest);
    }
}

void TileRenderer::renderLayer(SDL_Renderer* renderer, const ChunkManager& chunks, ChunkLayer layer,
                               const FloatRect& view) const {
    if (!renderer) {
        return;
    }
    std::vector<TileDrawCommand> commands;
    chunks.collectDrawCommands(layer, view, commands);
    render(renderer, commands, Vector2D(view.x, view.y));
}

void TileRenderer::drawTile(SDL_Renderer* renderer, const TileDrawCommand& command, const SDL_FRect& dest) const {
    const TileProperties& tile = *command.properties;
    const bool background = command.layer == ChunkLayer::Background;

    auto tileTexture = m_tileTextures.find(tile.code);
    if (tileTexture != m_tileTextures.end()) {
        SDL_Texture* texture = tileTexture->second.get();
        const Uint8 mod = background ? BACKGROUND_DIM : 255;
        SDL_SetTextureColorMod(texture, mod, mod, mod);
        SDL_RenderTexture(renderer, texture, nullptr, &dest);
        return;
    }

    if (tile.hasTexture()) {
        auto sheet = m_spritesheets.find(tile.spritesheet);
        if (sheet != m_spritesheets.end()) {
            SDL_Texture* texture = sheet->second.get();
            const auto size = static_cast<float>(tile.spriteSize);
            const SDL_FRect src{tile.textureX * size, tile.textureY * size, size, size};
            const Uint8 mod = background ? BACKGROUND_DIM : 255;
            SDL_SetTextureColorMod(texture, mod, mod, mod);
            SDL_RenderTextureRotated(renderer, texture, &src, &dest, 90.0 * tile.textureRotation, nullptr,
                                     SDL_FLIP_NONE);
            return;
        }
    }

    const SDL_Color color = getTileColor(tile.code, command.layer);
    SDL_SetRenderDrawColor(renderer, color.r, color.g, color.b, color.a);
    SDL_RenderFillRect(renderer, &dest);
}

void TileRenderer::clear() {
    m_tileTextures.clear();
    m_spritesheets.clear();
}

} // namespace StrataEngine
