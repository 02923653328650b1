#include "core/GameState.hpp"

#include <limits>

namespace mergetris::core {

namespace {

TetrominoFactory makeFactory(const GameConfig& config) {
    if (config.seed) {
        return TetrominoFactory{*config.seed};
    }
    return TetrominoFactory{};
}

PowerUpManager makePowerUps(const GameConfig& config) {
    if (config.seed) {
        return PowerUpManager{config.powerUps, *config.seed + 1U};
    }
    return PowerUpManager{config.powerUps};
}

const GameConfig& validated(const GameConfig& config) {
    validate(config);
    return config;
}

} // namespace

GameState::GameState(const GameConfig& config, IHighScoreStore* highScoreStore)
    : config_{validated(config)}
    , highScoreStore_{highScoreStore}
    , board_{config.board.width, config.board.height}
    , factory_{makeFactory(config)}
    , pieces_{board_, config.timing.lockDelay}
    , merges_{config.merge}
    , combo_{config.merge.comboWindow, config.scoring.comboBonusPerMerge}
    , scoreManager_{config.scoring}
    , powerUps_{makePowerUps(config)}
    , nextTetromino_{}
    , status_{GameStatus::NotStarted}
{
    if (highScoreStore_) {
        scoreManager_.loadHighScore(highScoreStore_->loadHighScore());
        storedHighScore_ = scoreManager_.highScore();
    }
}

GameState::~GameState() {
    persistHighScore();
}

void GameState::persistHighScore() {
    if (!highScoreStore_ || highScore() <= storedHighScore_) return;

    highScoreStore_->saveHighScore(highScore());
    storedHighScore_ = highScore();
}

void GameState::clearSession() {
    scoreManager_.reset();
    combo_.reset();
    powerUps_.reset();
    merges_.reset();
    board_.clearAll();
    pieces_.clear();
    nextTetromino_.reset();

    clock_ = 0.0;
    dropTimer_ = 0.0;
    softDrop_ = false;
    lockedPieces_ = 0;
}

void GameState::start() {
    if (status_ == GameStatus::Running) return;

    clearSession();
    status_ = GameStatus::Running;

    events_.emplace_back(ScoreChanged{score()});
    events_.emplace_back(LevelChanged{level()});
    events_.emplace_back(LinesClearedChanged{0});

    if (!spawnNewTetromino()) {
        enterGameOver();
    }
}

void GameState::pause() {
    if (status_ == GameStatus::Running) {
        status_ = GameStatus::Paused;
    }
}

void GameState::resume() {
    if (status_ == GameStatus::Paused) {
        status_ = GameStatus::Running;
    }
}

void GameState::reset() {
    // A record set in an abandoned game is kept
    persistHighScore();
    clearSession();
    events_.clear();
    status_ = GameStatus::NotStarted;
}

void GameState::tick(double dt) {
    if (dt < 0.0) return;

    if (status_ == GameStatus::Running) {
        clock_ += dt;
        combo_.update(clock_, scoreManager_, events_);
        powerUps_.update(dt, events_);
    }

    // A started cascade always runs to its fixed point, even when paused;
    // nothing else moves meanwhile.
    if (merges_.isRunning()) {
        advanceCascade(dt);
        return;
    }

    if (status_ != GameStatus::Running) {
        return;
    }

    if (!pieces_.hasActive()) {
        spawnOrEndGame();
        return;
    }

    dropTimer_ += dt;
    if (dropTimer_ >= currentDropInterval()) {
        dropTimer_ = 0.0;
        pieces_.stepDown();
    }

    // Freeze holds the lock timer too. A piece slid off its ledge gets one
    // last chance to fall.
    const bool frozen = powerUps_.speedMultiplier() <= 0.0;
    if (!frozen && pieces_.advanceLockTimer(dt) && !pieces_.stepDown()) {
        lockActiveTetromino();
    }
}

bool GameState::acceptsInput() const noexcept {
    return status_ == GameStatus::Running && pieces_.hasActive() && !merges_.isRunning();
}

bool GameState::moveLeft() {
    if (!acceptsInput()) return false;
    return pieces_.move(Direction::Left);
}

bool GameState::moveRight() {
    if (!acceptsInput()) return false;
    return pieces_.move(Direction::Right);
}

bool GameState::rotateClockwise() {
    if (!acceptsInput()) return false;
    return pieces_.rotateClockwise();
}

void GameState::setSoftDrop(bool enabled) {
    softDrop_ = enabled;
}

int GameState::hardDrop() {
    if (!acceptsInput()) return 0;

    // Drop until we can't move further, then lock without delay
    const int cells = pieces_.hardDrop();
    scoreManager_.addScore(static_cast<std::int64_t>(cells) * config_.scoring.hardDropPointsPerCell,
                           events_);
    lockActiveTetromino();
    return cells;
}

bool GameState::activatePowerUp() {
    if (status_ != GameStatus::Running || merges_.isRunning()) {
        return false;
    }

    const auto type = powerUps_.activateNext(board_, events_);
    if (!type) {
        return false;
    }

    if (isDestructive(*type)) {
        merges_.begin(/*settleFirst=*/true);
        advanceCascade(0.0);
    }
    return true;
}

void GameState::grantPowerUp(PowerUpType type) {
    powerUps_.enqueue(type, events_);
}

double GameState::currentDropInterval() const noexcept {
    double interval = scoreManager_.dropInterval();
    if (softDrop_) {
        interval /= config_.timing.softDropMultiplier;
    }

    const double speed = powerUps_.speedMultiplier();
    if (speed <= 0.0) {
        return std::numeric_limits<double>::infinity();
    }
    return interval / speed;
}

EventList GameState::drainEvents() {
    EventList out;
    out.swap(events_);
    return out;
}

Position GameState::spawnPosition() const noexcept {
    // (4, 18) on the default 10x20 board
    return Position{board_.width() / 2 - 1, board_.height() - 2};
}

bool GameState::spawnNewTetromino() {
    const Position spawn = spawnPosition();

    if (!nextTetromino_) {
        nextTetromino_ = factory_.createRandom(spawn);
    }

    Tetromino piece = *nextTetromino_;
    piece.setOrigin(spawn);

    nextTetromino_ = factory_.createRandom(spawn);
    dropTimer_ = 0.0;

    // Cannot spawn -> game over
    return pieces_.spawn(piece);
}

void GameState::spawnOrEndGame() {
    if (board_.isTopRowOccupied() || !spawnNewTetromino()) {
        enterGameOver();
    }
}

void GameState::lockActiveTetromino() {
    if (!pieces_.hasActive()) return;

    const TetrominoType type = pieces_.active()->type();
    pieces_.lock(board_);
    ++lockedPieces_;
    dropTimer_ = 0.0;
    events_.emplace_back(PieceLocked{type});

    merges_.begin();
    advanceCascade(0.0);
}

void GameState::advanceCascade(double dt) {
    CascadeContext ctx{board_, combo_, scoreManager_, events_, clock_};
    if (const auto result = merges_.update(dt, ctx)) {
        onCascadeFinished(*result);
    }
}

void GameState::onCascadeFinished(const CascadeResult& result) {
    if (result.rowsCleared > 0) {
        powerUps_.trySpawn(result.rowsCleared, events_);
    }

    if (pieces_.hasActive()) {
        // Power-up cascade under a falling piece: blocks may have settled
        // into its cells.
        if (!pieces_.liftUntilFits()) {
            enterGameOver();
        }
        return;
    }

    if (status_ == GameStatus::Running) {
        spawnOrEndGame();
    }
}

void GameState::enterGameOver() {
    status_ = GameStatus::GameOver;
    pieces_.clear();
    softDrop_ = false;
    events_.emplace_back(GameOver{score()});

    persistHighScore();
}

} // namespace mergetris::core
