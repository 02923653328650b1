#include "gui_sdl/SinglePlayerScreen.hpp"

#include <algorithm>
#include <cfloat>
#include <cstdint>
#include <cstdio>
#include <memory>
#include <type_traits>
#include <variant>

#include <imgui.h>
#include <SDL.h>

#include "gui_sdl/Application.hpp"
#include "gui_sdl/StartScreen.hpp"
#include "controller/InputAction.hpp"
#include "core/PowerUpManager.hpp"
#include "core/Tetromino.hpp"
#include "core/Types.hpp"

namespace mergetris::gui_sdl {

using controller::InputAction;
using core::GameStatus;

// One colour per power of two, cycling after 2048.
static ImU32 colorForValue(core::CellValue value)
{
    static const ImU32 palette[] = {
        IM_COL32(238, 228, 218, 255), // 2
        IM_COL32(237, 224, 200, 255), // 4
        IM_COL32(242, 177, 121, 255), // 8
        IM_COL32(245, 149,  99, 255), // 16
        IM_COL32(246, 124,  95, 255), // 32
        IM_COL32(246,  94,  59, 255), // 64
        IM_COL32(237, 207, 114, 255), // 128
        IM_COL32(237, 204,  97, 255), // 256
        IM_COL32(237, 200,  80, 255), // 512
        IM_COL32(237, 197,  63, 255), // 1024
        IM_COL32(237, 194,  46, 255), // 2048
    };
    constexpr int paletteSize = static_cast<int>(sizeof(palette) / sizeof(palette[0]));

    int exponent = 0;
    while (value > 2U) {
        value >>= 1U;
        ++exponent;
    }
    return palette[exponent % paletteSize];
}

static void unpackImU32(ImU32 col, std::uint8_t& r, std::uint8_t& g, std::uint8_t& b, std::uint8_t& a)
{
    r = (col >> IM_COL32_R_SHIFT) & 0xFF;
    g = (col >> IM_COL32_G_SHIFT) & 0xFF;
    b = (col >> IM_COL32_B_SHIFT) & 0xFF;
    a = (col >> IM_COL32_A_SHIFT) & 0xFF;
}

static void setDrawColor(SDL_Renderer* renderer, ImU32 col)
{
    std::uint8_t r, g, b, a;
    unpackImU32(col, r, g, b, a);
    SDL_SetRenderDrawColor(renderer, r, g, b, a);
}

SinglePlayerScreen::SinglePlayerScreen(const core::GameConfig& config,
                                       core::IHighScoreStore* highScoreStore)
    : config_{config}
    , gameState_{config, highScoreStore}
    , controller_{gameState_}
{
    gameState_.start();
    controller_.resetTiming();
    collectEvents();
}

void SinglePlayerScreen::restart()
{
    gameState_.reset();
    gameState_.start();
    controller_.resetTiming();
    fractionalMs_ = 0.0f;
    log_.clear();
    collectEvents();
}

void SinglePlayerScreen::dispatchAction(InputAction action)
{
    controller_.handleAction(action);
}

void SinglePlayerScreen::collectEvents()
{
    char line[96];
    for (const auto& event : gameState_.drainEvents()) {
        line[0] = '\0';
        std::visit([&line](const auto& e) {
            using T = std::decay_t<decltype(e)>;
            if constexpr (std::is_same_v<T, core::MergeOccurred>) {
                std::snprintf(line, sizeof line, "Merged %u (combo x%d)",
                              static_cast<unsigned>(e.value), e.combo);
            } else if constexpr (std::is_same_v<T, core::ComboEnded>) {
                std::snprintf(line, sizeof line, "Combo of %d ended", e.combo);
            } else if constexpr (std::is_same_v<T, core::RowsCleared>) {
                std::snprintf(line, sizeof line, "Cleared %d row(s)", e.rows);
            } else if constexpr (std::is_same_v<T, core::LevelChanged>) {
                std::snprintf(line, sizeof line, "Level %d", e.level);
            } else if constexpr (std::is_same_v<T, core::PowerUpCollected>) {
                std::snprintf(line, sizeof line, "Collected %s", core::toString(e.type));
            } else if constexpr (std::is_same_v<T, core::PowerUpActivated>) {
                std::snprintf(line, sizeof line, "%s!", core::toString(e.type));
            } else if constexpr (std::is_same_v<T, core::PowerUpExpired>) {
                std::snprintf(line, sizeof line, "%s wore off", core::toString(e.type));
            } else if constexpr (std::is_same_v<T, core::CascadeLimitReached>) {
                std::snprintf(line, sizeof line, "Cascade stopped after %d passes", e.iterations);
            }
        }, event);

        if (line[0] != '\0') {
            log_.emplace_front(line);
            if (log_.size() > LogSize) {
                log_.pop_back();
            }
        }
    }
}

SinglePlayerScreen::Layout SinglePlayerScreen::computeLayout(int windowW, int windowH) const
{
    Layout L{};
    const int rows = gameState_.board().height();
    const int cols = gameState_.board().width();

    const int margin = 20;

    const int usableW = windowW - (margin * 3) - L.sideW;
    const int usableH = windowH - (margin * 2);

    int cell = std::min(usableW / cols, usableH / rows);
    cell = std::clamp(cell, 16, 44);

    L.cell = cell;
    L.boardW = cols * cell;
    L.boardH = rows * cell;

    const int groupW = L.boardW + margin + L.sideW;
    L.boardX = std::max(margin, (windowW - groupW) / 2);
    L.boardY = margin + std::max(0, (usableH - L.boardH) / 2);
    L.sideX = L.boardX + L.boardW + margin;
    return L;
}

SDL_Rect SinglePlayerScreen::cellRect(const Layout& L, int x, int y, int inset) const
{
    // Board row 0 is the bottom row, screen rows grow downwards
    const int screenRow = gameState_.board().height() - 1 - y;
    return SDL_Rect{L.boardX + x * L.cell + inset,
                    L.boardY + screenRow * L.cell + inset,
                    L.cell - 2 * inset,
                    L.cell - 2 * inset};
}

void SinglePlayerScreen::handleEvent(Application& app, const SDL_Event& e)
{
    if (e.type == SDL_KEYUP) {
        switch (e.key.keysym.sym) {
            case SDLK_DOWN:
            case SDLK_s:
                dispatchAction(InputAction::SoftDropReleased);
                break;
            default:
                break;
        }
        return;
    }

    if (e.type != SDL_KEYDOWN || e.key.repeat != 0) return;

    switch (e.key.keysym.sym) {
        case SDLK_LEFT:
        case SDLK_a:
            dispatchAction(InputAction::MoveLeft);
            break;
        case SDLK_RIGHT:
        case SDLK_d:
            dispatchAction(InputAction::MoveRight);
            break;
        case SDLK_DOWN:
        case SDLK_s:
            dispatchAction(InputAction::SoftDropPressed);
            break;
        case SDLK_SPACE:
            dispatchAction(InputAction::HardDrop);
            break;
        case SDLK_UP:
        case SDLK_w:
        case SDLK_x:
            dispatchAction(InputAction::RotateCW);
            break;
        case SDLK_e:
        case SDLK_LSHIFT:
            dispatchAction(InputAction::ActivatePowerUp);
            break;
        case SDLK_p:
        case SDLK_ESCAPE:
            dispatchAction(InputAction::PauseResume);
            break;
        case SDLK_r:
            if (gameState_.status() == GameStatus::GameOver) {
                restart();
            }
            break;
        case SDLK_BACKSPACE:
            app.setScreen(std::make_unique<StartScreen>(config_));
            break;
        default:
            break;
    }
}

void SinglePlayerScreen::onFocusLost(Application&)
{
    // Key-up events are lost with the focus
    dispatchAction(InputAction::SoftDropReleased);
    if (gameState_.status() == GameStatus::Running) {
        dispatchAction(InputAction::PauseResume);
    }
}

void SinglePlayerScreen::update(Application&, float dtSeconds)
{
    // Carry sub-millisecond remainders so high frame rates don't lose time
    fractionalMs_ += dtSeconds * 1000.0f;
    const int ms = static_cast<int>(fractionalMs_);
    fractionalMs_ -= static_cast<float>(ms);
    controller_.update(controller::GameController::Duration{ms});

    collectEvents();

    if (gameState_.status() != GameStatus::Running) {
        leftHoldSec_ = rightHoldSec_ = 0.0f;
        leftRepeatAccSec_ = rightRepeatAccSec_ = 0.0f;
        return;
    }

    const Uint8* keys = SDL_GetKeyboardState(nullptr);

    // Side hold DAS/ARR
    const bool leftHeld  = (keys[SDL_SCANCODE_LEFT] != 0) || (keys[SDL_SCANCODE_A] != 0);
    const bool rightHeld = (keys[SDL_SCANCODE_RIGHT] != 0) || (keys[SDL_SCANCODE_D] != 0);

    if (leftHeld == rightHeld) {
        leftHoldSec_ = rightHoldSec_ = 0.0f;
        leftRepeatAccSec_ = rightRepeatAccSec_ = 0.0f;
        return;
    }

    float& holdSec   = leftHeld ? leftHoldSec_ : rightHoldSec_;
    float& repeatAcc = leftHeld ? leftRepeatAccSec_ : rightRepeatAccSec_;
    const InputAction action = leftHeld ? InputAction::MoveLeft : InputAction::MoveRight;

    holdSec += dtSeconds;
    if (holdSec >= sideDasSec_) {
        repeatAcc += dtSeconds;
        while (repeatAcc >= sideArrSec_) {
            dispatchAction(action);
            repeatAcc -= sideArrSec_;
        }
    } else {
        repeatAcc = 0.0f;
    }

    // Releasing one side restarts the other side's delay
    if (leftHeld) {
        rightHoldSec_ = rightRepeatAccSec_ = 0.0f;
    } else {
        leftHoldSec_ = leftRepeatAccSec_ = 0.0f;
    }
}

void SinglePlayerScreen::render(Application& app)
{
    const SDL_Point win = app.windowSize();
    const Layout L = computeLayout(win.x, win.y);

    renderBoard(app.renderer(), L);
    renderCellValues(L);
    renderBoardOverlayText(L);

    renderNextPieceWindow(L.sideX, L.boardY, L.sideW);
    renderHUD(app, L.sideX, L.boardY + 150, L.sideW);
}

void SinglePlayerScreen::renderBoard(SDL_Renderer* renderer, const Layout& L) const
{
    const auto& board = gameState_.board();
    const int rows = board.height();
    const int cols = board.width();

    SDL_SetRenderDrawColor(renderer, 12, 12, 16, 255);
    SDL_Rect boardRect{L.boardX, L.boardY, L.boardW, L.boardH};
    SDL_RenderFillRect(renderer, &boardRect);

    SDL_SetRenderDrawColor(renderer, 40, 40, 55, 255);
    for (int r = 0; r <= rows; ++r) {
        SDL_RenderDrawLine(renderer, L.boardX, L.boardY + r * L.cell,
                           L.boardX + L.boardW, L.boardY + r * L.cell);
    }
    for (int c = 0; c <= cols; ++c) {
        SDL_RenderDrawLine(renderer, L.boardX + c * L.cell, L.boardY,
                           L.boardX + c * L.cell, L.boardY + L.boardH);
    }

    for (int y = 0; y < rows; ++y) {
        for (int x = 0; x < cols; ++x) {
            const auto block = board.get(x, y);
            if (!block) continue;

            setDrawColor(renderer, colorForValue(block->value));
            const SDL_Rect cell = cellRect(L, x, y, 1);
            SDL_RenderFillRect(renderer, &cell);
        }
    }

    if (const auto& active = gameState_.activeTetromino()) {
        // Ghost
        if (const auto ghostOrigin = gameState_.ghostPosition()) {
            core::Tetromino ghost = *active;
            ghost.setOrigin(*ghostOrigin);

            SDL_SetRenderDrawBlendMode(renderer, SDL_BLENDMODE_BLEND);
            SDL_SetRenderDrawColor(renderer, 255, 255, 255, 70);
            for (const auto& b : ghost.blocks()) {
                if (!board.isInside(b.x, b.y)) continue;
                const SDL_Rect rct = cellRect(L, b.x, b.y, 2);
                SDL_RenderDrawRect(renderer, &rct);
            }
            SDL_SetRenderDrawBlendMode(renderer, SDL_BLENDMODE_NONE);
        }

        // Active
        const auto blocks = active->blocks();
        const auto& values = active->values();
        for (std::size_t i = 0; i < blocks.size(); ++i) {
            const auto& b = blocks[i];
            if (!board.isInside(b.x, b.y)) continue;

            setDrawColor(renderer, colorForValue(values[i]));
            const SDL_Rect cell = cellRect(L, b.x, b.y, 1);
            SDL_RenderFillRect(renderer, &cell);

            SDL_SetRenderDrawColor(renderer, 255, 255, 255, 255);
            SDL_RenderDrawRect(renderer, &cell);
        }
    }

    if (gameState_.status() == GameStatus::Paused ||
        gameState_.status() == GameStatus::GameOver)
    {
        SDL_SetRenderDrawBlendMode(renderer, SDL_BLENDMODE_BLEND);
        SDL_SetRenderDrawColor(renderer, 0, 0, 0, 160);
        SDL_RenderFillRect(renderer, &boardRect);
        SDL_SetRenderDrawBlendMode(renderer, SDL_BLENDMODE_NONE);
    }
}

void SinglePlayerScreen::renderCellValues(const Layout& L) const
{
    // SDL_Renderer has no text; values are drawn on ImGui's background list
    ImDrawList* dl = ImGui::GetBackgroundDrawList();
    const auto& board = gameState_.board();
    char text[16];

    auto drawValue = [&](int x, int y, core::CellValue value) {
        std::snprintf(text, sizeof text, "%u", static_cast<unsigned>(value));
        const SDL_Rect r = cellRect(L, x, y, 0);
        const ImVec2 size = ImGui::CalcTextSize(text);
        dl->AddText(ImVec2(r.x + (r.w - size.x) * 0.5f, r.y + (r.h - size.y) * 0.5f),
                    value <= 4U ? IM_COL32(60, 58, 50, 255) : IM_COL32(250, 248, 240, 255),
                    text);
    };

    for (int y = 0; y < board.height(); ++y) {
        for (int x = 0; x < board.width(); ++x) {
            if (const auto block = board.get(x, y)) {
                drawValue(x, y, block->value);
            }
        }
    }

    if (const auto& active = gameState_.activeTetromino()) {
        const auto blocks = active->blocks();
        for (std::size_t i = 0; i < blocks.size(); ++i) {
            if (board.isInside(blocks[i].x, blocks[i].y)) {
                drawValue(blocks[i].x, blocks[i].y, active->values()[i]);
            }
        }
    }
}

void SinglePlayerScreen::renderBoardOverlayText(const Layout& L) const
{
    const auto status = gameState_.status();
    if (status != GameStatus::Paused && status != GameStatus::GameOver) return;

    const bool over = status == GameStatus::GameOver;

    char scoreLine[64] = "";
    if (over) {
        std::snprintf(scoreLine, sizeof(scoreLine), "%llu points%s",
                      static_cast<unsigned long long>(gameState_.score()),
                      gameState_.score() > 0 && gameState_.score() == gameState_.highScore()
                          ? ", new record" : "");
    }

    struct Caption {
        const char* text;
        bool large;
        ImU32 color;
    };
    const Caption captions[] = {
        {over ? "GAME OVER" : "PAUSED", true, IM_COL32(255, 255, 255, 255)},
        {scoreLine, false, IM_COL32(240, 200, 90, 255)},
        {over ? "R: play again   Backspace: menu" : "P / Esc: resume",
         false, IM_COL32(200, 200, 210, 255)},
    };

    // Fonts[1] is the optional caption font loaded by Application
    const ImGuiIO& io = ImGui::GetIO();
    ImFont* largeFont = io.Fonts->Fonts.Size > 1 ? io.Fonts->Fonts[1] : ImGui::GetFont();
    const float largeSize = std::max(largeFont->FontSize, L.cell * 1.1f);
    const float gap = L.cell * 0.3f;

    float height = 0.0f;
    for (const auto& c : captions) {
        if (*c.text == '\0') continue;
        height += (c.large ? largeSize : ImGui::GetFontSize()) + gap;
    }

    // Darken a band across the board, captions centred inside it
    ImDrawList* dl = ImGui::GetForegroundDrawList();
    const float centreX = L.boardX + L.boardW * 0.5f;
    float y = L.boardY + (L.boardH - height) * 0.5f;
    dl->AddRectFilled(ImVec2(static_cast<float>(L.boardX), y - gap),
                      ImVec2(static_cast<float>(L.boardX + L.boardW), y + height),
                      IM_COL32(10, 10, 14, 200));

    for (const auto& c : captions) {
        if (*c.text == '\0') continue;
        ImFont* font = c.large ? largeFont : ImGui::GetFont();
        const float size = c.large ? largeSize : ImGui::GetFontSize();
        const ImVec2 extent = font->CalcTextSizeA(size, FLT_MAX, 0.0f, c.text);
        dl->AddText(font, size, ImVec2(centreX - extent.x * 0.5f, y), c.color, c.text);
        y += size + gap;
    }
}

void SinglePlayerScreen::renderNextPieceWindow(int x, int y, int w) const
{
    ImGui::SetNextWindowPos(ImVec2((float)x, (float)y), ImGuiCond_Always);
    ImGui::SetNextWindowSize(ImVec2((float)w, 140.0f), ImGuiCond_Always);

    ImGuiWindowFlags flags =
        ImGuiWindowFlags_NoResize |
        ImGuiWindowFlags_NoCollapse |
        ImGuiWindowFlags_NoMove;

    ImGui::Begin("Next Piece", nullptr, flags);

    const auto& next = gameState_.nextTetromino();
    if (!next) {
        ImGui::TextUnformatted("No next piece");
        ImGui::End();
        return;
    }

    ImDrawList* dl = ImGui::GetWindowDrawList();
    const ImVec2 origin = ImGui::GetCursorScreenPos();

    const auto blocks = next->blocks();
    int minX = blocks[0].x, maxX = blocks[0].x;
    int minY = blocks[0].y, maxY = blocks[0].y;
    for (const auto& b : blocks) {
        minX = std::min(minX, b.x); maxX = std::max(maxX, b.x);
        minY = std::min(minY, b.y); maxY = std::max(maxY, b.y);
    }

    const float cell = 22.0f;
    const float areaW = (float)w - 20.0f;
    const float pieceW = (maxX - minX + 1) * cell;
    const float ox = origin.x + (areaW - pieceW) * 0.5f;

    char text[16];
    for (std::size_t i = 0; i < blocks.size(); ++i) {
        const auto& b = blocks[i];
        // y up on the board, y down on screen
        const float bx = ox + (b.x - minX) * cell;
        const float by = origin.y + (maxY - b.y) * cell;
        const ImVec2 p0(bx + 1, by + 1);
        const ImVec2 p1(bx + cell - 2, by + cell - 2);
        dl->AddRectFilled(p0, p1, colorForValue(next->values()[i]));
        dl->AddRect(p0, p1, IM_COL32(20, 20, 20, 255));

        std::snprintf(text, sizeof text, "%u", static_cast<unsigned>(next->values()[i]));
        dl->AddText(ImVec2(bx + 4, by + 3), IM_COL32(40, 40, 40, 255), text);
    }

    ImGui::Dummy(ImVec2(areaW, (maxY - minY + 1) * cell));
    ImGui::End();
}

void SinglePlayerScreen::renderHUD(Application& app, int x, int y, int w)
{
    ImGui::SetNextWindowPos(ImVec2((float)x, (float)y), ImGuiCond_Always);
    ImGui::SetNextWindowSizeConstraints(ImVec2((float)w, 0.0f), ImVec2((float)w, 600.0f));
    ImGui::Begin("Game", nullptr,
                 ImGuiWindowFlags_NoMove | ImGuiWindowFlags_NoCollapse |
                 ImGuiWindowFlags_AlwaysAutoResize);

    ImGui::Text("Score: %llu", (unsigned long long)gameState_.score());
    ImGui::Text("High score: %llu", (unsigned long long)gameState_.highScore());
    ImGui::Text("Level: %d", gameState_.level());
    ImGui::Text("Lines: %llu", (unsigned long long)gameState_.totalLines());
    if (gameState_.combo() > 1) {
        ImGui::TextColored(ImVec4(1.0f, 0.75f, 0.3f, 1.0f), "Combo x%d", gameState_.combo());
    } else {
        ImGui::TextUnformatted("Combo: -");
    }

    ImGui::Separator();

    switch (gameState_.status()) {
        case GameStatus::Running:
            ImGui::TextUnformatted(gameState_.isResolving() ? "Status: Merging..." : "Status: Running");
            break;
        case GameStatus::Paused:
            ImGui::TextColored(ImVec4(1.0f, 0.85f, 0.2f, 1.0f), "Status: Paused");
            break;
        case GameStatus::GameOver:
            ImGui::TextColored(ImVec4(1.0f, 0.25f, 0.25f, 1.0f), "Status: Game Over");
            break;
        default:
            ImGui::Text("Status: Not Started");
            break;
    }

    ImGui::Separator();
    ImGui::Text("Power-ups (%zu queued)", gameState_.queuedPowerUps());
    if (!gameState_.powerUpQueue().empty()) {
        ImGui::BulletText("Next: %s", core::toString(gameState_.powerUpQueue().front()));
    }
    for (const auto& effect : gameState_.activeEffects()) {
        ImGui::BulletText("%s %.1fs", core::toString(effect.type), effect.remaining);
    }

    ImGui::BeginDisabled(gameState_.queuedPowerUps() == 0 ||
                         gameState_.status() != GameStatus::Running ||
                         gameState_.isResolving());
    if (ImGui::Button("Activate (E)", ImVec2(-1, 0))) {
        dispatchAction(InputAction::ActivatePowerUp);
    }
    ImGui::EndDisabled();

    ImGui::Separator();
    for (const auto& line : log_) {
        ImGui::TextUnformatted(line.c_str());
    }

    ImGui::Separator();

    if (gameState_.status() == GameStatus::GameOver) {
        if (ImGui::Button("Restart", ImVec2(-1, 0))) {
            restart();
        }
    }

    if (ImGui::Button("Back to Menu", ImVec2(-1, 0))) {
        app.setScreen(std::make_unique<StartScreen>(config_));
    }

    if (ImGui::CollapsingHeader("Controls")) {
        ImGui::TextUnformatted("A/D or Left/Right: Move (hold)");
        ImGui::TextUnformatted("S or Down: Soft drop (hold)");
        ImGui::TextUnformatted("Space: Hard drop");
        ImGui::TextUnformatted("W/X or Up: Rotate");
        ImGui::TextUnformatted("E or Shift: Power-up");
        ImGui::TextUnformatted("P or ESC: Pause/Resume");
        ImGui::TextUnformatted("Backspace: Menu");
        ImGui::Text("FPS: %.1f", ImGui::GetIO().Framerate);
    }

    ImGui::End();
}

} // namespace mergetris::gui_sdl
