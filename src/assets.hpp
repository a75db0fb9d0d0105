#pragma once
#include <raylib.h>

// ---------------------------------------------------------------------------
// AssetResource — background and board textures.
//
// Stored as a World resource. LoadTexture() returns id 0 on a missing file;
// RenderSystem falls back to flat colours for any texture with id 0.
// ---------------------------------------------------------------------------

struct AssetResource {
    Texture2D background{};
    Texture2D board{};

    void load() {
        background = LoadTexture("resources/images/bg.png");
        board      = LoadTexture("resources/images/board_bg.png");
        if (background.id != 0) SetTextureFilter(background, TEXTURE_FILTER_BILINEAR);
        if (board.id != 0)      SetTextureFilter(board,      TEXTURE_FILTER_BILINEAR);
    }

    void unload() {
        if (background.id != 0) UnloadTexture(background);
        if (board.id != 0)      UnloadTexture(board);
        background = {};
        board      = {};
    }
};
