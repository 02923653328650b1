#pragma once

#include "Board.hpp"
#include "Tetromino.hpp"
#include "TetrominoFactory.hpp"
#include "PieceController.hpp"
#include "MergeEngine.hpp"
#include "ComboTracker.hpp"
#include "ScoreManager.hpp"
#include "PowerUpManager.hpp"
#include "GameConfig.hpp"
#include "GameEvents.hpp"
#include "IHighScoreStore.hpp"
#include <optional>

namespace mergetris::core {

enum class GameStatus {
    NotStarted,
    Running,
    Paused,
    GameOver
};

// Top-level simulation context: owns the board, the falling piece, the
// cascade, scoring and power-ups, and is the only path that mutates them.
class GameState {
public:
    /// The store (optional) is not owned; caller keeps it alive.
    explicit GameState(const GameConfig& config = GameConfig{},
                       IHighScoreStore* highScoreStore = nullptr);
    ~GameState();

    GameState(const GameState&) = delete;
    GameState& operator=(const GameState&) = delete;

    const GameConfig& config() const noexcept { return config_; }
    const Board& board() const noexcept { return board_; }
    const std::optional<Tetromino>& activeTetromino() const noexcept { return pieces_.active(); }
    const std::optional<Tetromino>& nextTetromino() const noexcept { return nextTetromino_; }
    std::optional<Position> ghostPosition() const { return pieces_.ghostPosition(); }
    PieceState pieceState() const noexcept { return pieces_.state(); }

    std::uint64_t score() const noexcept { return scoreManager_.score(); }
    std::uint64_t highScore() const noexcept { return scoreManager_.highScore(); }
    int level() const noexcept { return scoreManager_.level(); }
    std::uint64_t totalLines() const noexcept { return scoreManager_.levels().totalLinesCleared(); }
    int combo() const noexcept { return combo_.combo(); }
    GameStatus status() const noexcept { return status_; }
    std::uint64_t lockedPieces() const noexcept { return lockedPieces_; }
    bool isResolving() const noexcept { return merges_.isRunning(); }
    bool isSoftDropping() const noexcept { return softDrop_; }
    double elapsed() const noexcept { return clock_; }

    const std::vector<ActiveEffect>& activeEffects() const noexcept { return powerUps_.activeEffects(); }
    std::size_t queuedPowerUps() const noexcept { return powerUps_.queuedCount(); }
    const std::deque<PowerUpType>& powerUpQueue() const noexcept { return powerUps_.queue(); }

    // Control API for the controller / input layer
    void start();
    void pause();
    void resume();
    void reset();

    // One fixed simulation step of dt seconds.
    void tick(double dt);

    // Player actions. Ignored unless Running with a falling piece.
    bool moveLeft();
    bool moveRight();
    bool rotateClockwise();
    void setSoftDrop(bool enabled);
    int hardDrop();  // drop to the bottom and lock; returns rows travelled

    // Applies the oldest queued power-up. False when nothing was applied.
    bool activatePowerUp();

    // Adds a power-up to the queue without the row-clear roll.
    void grantPowerUp(PowerUpType type);

    // Seconds per gravity step with soft drop and power-ups applied;
    // +infinity while frozen.
    double currentDropInterval() const noexcept;

    // Notifications produced since the previous call.
    EventList drainEvents();

private:
    GameConfig config_;
    IHighScoreStore* highScoreStore_;
    std::uint64_t storedHighScore_{0}; // last value loaded from or written to the store

    Board board_;
    TetrominoFactory factory_;
    PieceController pieces_;
    MergeEngine merges_;
    ComboTracker combo_;
    ScoreManager scoreManager_;
    PowerUpManager powerUps_;

    std::optional<Tetromino> nextTetromino_;

    GameStatus status_{GameStatus::NotStarted};
    EventList events_;

    double clock_{0.0};
    double dropTimer_{0.0};
    bool softDrop_{false};
    std::uint64_t lockedPieces_{0};

    bool acceptsInput() const noexcept;
    Position spawnPosition() const noexcept;

    bool spawnNewTetromino();
    void spawnOrEndGame();
    void lockActiveTetromino();
    void advanceCascade(double dt);
    void onCascadeFinished(const CascadeResult& result);
    void enterGameOver();
    void clearSession();
    void persistHighScore();

    friend struct GameStateTestAccess;
};

} // namespace mergetris::core
