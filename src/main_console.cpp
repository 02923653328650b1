#include <cstdint>
#include <iomanip>
#include <iostream>
#include <sstream>
#include <stdexcept>
#include <string>
#include <type_traits>
#include <variant>
#include <vector>

#include "core/GameState.hpp"
#include "core/Board.hpp"
#include "core/Tetromino.hpp"
#include "core/Types.hpp"
#include "controller/GameController.hpp"
#include "storage/FileHighScoreStore.hpp"

using namespace mergetris::core;
using mergetris::controller::GameController;
using mergetris::controller::InputAction;

namespace {

constexpr int CellWidth = 5;

const char* statusName(GameStatus status) {
    switch (status) {
    case GameStatus::NotStarted: return "NotStarted";
    case GameStatus::Running:    return "Running";
    case GameStatus::Paused:     return "Paused";
    case GameStatus::GameOver:   return "GameOver";
    }
    return "?";
}

std::string formatCell(const char* open, CellValue value, const char* close) {
    std::ostringstream out;
    out << open << std::setw(CellWidth - 2) << value << close;
    return out.str();
}

// Helper: render the current board + active tetromino as ASCII.
// Locked blocks show their value, the falling piece is bracketed and the
// ghost landing cells are marked with ':'.
void printGame(const GameState& game) {
    const Board& board = game.board();
    const int width = board.width();
    const int height = board.height();

    std::vector<std::vector<std::string>> cells(
        height, std::vector<std::string>(width, std::string(CellWidth - 1, ' ') + "."));

    for (int y = 0; y < height; ++y) {
        for (int x = 0; x < width; ++x) {
            if (const auto block = board.get(x, y)) {
                cells[y][x] = formatCell(" ", block->value, " ");
            }
        }
    }

    if (const auto& piece = game.activeTetromino()) {
        if (const auto ghost = game.ghostPosition()) {
            Tetromino landed = *piece;
            landed.setOrigin(*ghost);
            for (const auto& b : landed.blocks()) {
                if (board.isInside(b.x, b.y)) {
                    cells[b.y][b.x] = std::string(CellWidth - 1, ' ') + ":";
                }
            }
        }

        const auto blocks = piece->blocks();
        const auto& values = piece->values();
        for (std::size_t i = 0; i < blocks.size(); ++i) {
            const auto& b = blocks[i];
            if (board.isInside(b.x, b.y)) {
                cells[b.y][b.x] = formatCell("[", values[i], "]");
            }
        }
    }

    std::cout << "\n==== MERGETRIS CONSOLE VIEW ====\n";
    std::cout << "Score: " << game.score()
              << " | High: " << game.highScore()
              << " | Level: " << game.level()
              << " | Lines: " << game.totalLines()
              << " | Combo: " << game.combo()
              << " | Status: " << statusName(game.status()) << '\n';

    if (const auto& next = game.nextTetromino()) {
        std::cout << "Next: " << toString(next->type()) << " (";
        for (std::size_t i = 0; i < next->values().size(); ++i) {
            std::cout << (i ? " " : "") << next->values()[i];
        }
        std::cout << ")\n";
    }

    std::cout << "Power-ups queued: " << game.queuedPowerUps();
    for (const auto type : game.powerUpQueue()) {
        std::cout << ' ' << toString(type);
    }
    for (const auto& effect : game.activeEffects()) {
        std::cout << " | " << toString(effect.type) << ' '
                  << std::fixed << std::setprecision(1) << effect.remaining << 's';
    }
    std::cout << '\n';

    // y grows upwards, so the top row is printed first
    const std::string border = '+' + std::string(width * CellWidth, '-') + "+\n";
    std::cout << border;
    for (int y = height - 1; y >= 0; --y) {
        std::cout << '|';
        for (int x = 0; x < width; ++x) {
            std::cout << cells[y][x];
        }
        std::cout << "|\n";
    }
    std::cout << border;

    std::cout << "Commands:\n"
              << "  a = left, d = right, w = rotate CW, s = toggle soft drop\n"
              << "  h = hard drop, e = activate power-up, t [ms] = advance time\n"
              << "  p = pause/resume, r = reset+start, q = quit\n";
}

void printEvents(EventList events) {
    for (const auto& event : events) {
        std::visit([](const auto& e) {
            using T = std::decay_t<decltype(e)>;
            if constexpr (std::is_same_v<T, MergeOccurred>) {
                std::cout << "  merge -> " << e.value << " at (" << e.at.x << ", " << e.at.y
                          << "), combo x" << e.combo << '\n';
            } else if constexpr (std::is_same_v<T, ComboEnded>) {
                std::cout << "  combo of " << e.combo << " ended\n";
            } else if constexpr (std::is_same_v<T, RowsCleared>) {
                std::cout << "  cleared " << e.rows << " row(s)\n";
            } else if constexpr (std::is_same_v<T, LevelChanged>) {
                std::cout << "  level " << e.level << '\n';
            } else if constexpr (std::is_same_v<T, HighScoreChanged>) {
                std::cout << "  new high score " << e.highScore << '\n';
            } else if constexpr (std::is_same_v<T, PowerUpCollected>) {
                std::cout << "  collected " << toString(e.type) << '\n';
            } else if constexpr (std::is_same_v<T, PowerUpActivated>) {
                std::cout << "  activated " << toString(e.type) << '\n';
            } else if constexpr (std::is_same_v<T, PowerUpExpired>) {
                std::cout << "  " << toString(e.type) << " wore off\n";
            } else if constexpr (std::is_same_v<T, CascadeLimitReached>) {
                std::cout << "  cascade stopped after " << e.iterations << " passes\n";
            } else if constexpr (std::is_same_v<T, GameOver>) {
                std::cout << "  final score " << e.finalScore << '\n';
            }
        }, event);
    }
}

// Lets a cascade started by the last command play out.
void settle(GameState& game, GameController& controller) {
    while (game.isResolving()) {
        controller.update(GameController::Step);
    }
}

int parseInt(const std::string& flag, const char* value) {
    try {
        return std::stoi(value);
    } catch (const std::exception&) {
        throw std::invalid_argument(flag + " expects an integer, got '" + value + "'");
    }
}

GameConfig parseArgs(int argc, char* argv[]) {
    GameConfig config;
    for (int i = 1; i < argc; ++i) {
        const std::string arg = argv[i];
        if ((arg == "--seed" || arg == "--level") && i + 1 < argc) {
            const int value = parseInt(arg, argv[++i]);
            if (arg == "--seed") {
                config.seed = static_cast<std::uint32_t>(value);
            } else {
                config.scoring.startingLevel = value;
            }
        } else {
            throw std::invalid_argument("unknown argument '" + arg + "'");
        }
    }
    validate(config);
    return config;
}

} // namespace

int main(int argc, char* argv[]) {
    GameConfig config;
    try {
        config = parseArgs(argc, argv);
    } catch (const std::invalid_argument& e) {
        std::cerr << "mergetris_console: " << e.what() << "\n"
                  << "Usage: " << argv[0] << " [--seed N] [--level N]\n";
        return 1;
    }

    mergetris::storage::FileHighScoreStore store{"mergetris_highscore.txt"};
    GameState game{config, &store};
    GameController controller{game};

    game.start(); // start immediately

    std::string line;
    printGame(game);

    while (true) {
        std::cout << "\nEnter command: ";
        if (!std::getline(std::cin, line)) {
            break; // EOF
        }
        if (line.empty()) {
            continue;
        }

        const char c = line[0];
        if (c == 'q' || c == 'Q') {
            std::cout << "Quitting.\n";
            break;
        }

        switch (c) {
        case 'a': case 'A':
            controller.handleAction(InputAction::MoveLeft);
            break;
        case 'd': case 'D':
            controller.handleAction(InputAction::MoveRight);
            break;
        case 's': case 'S':
            controller.handleAction(game.isSoftDropping() ? InputAction::SoftDropReleased
                                                          : InputAction::SoftDropPressed);
            break;
        case 'w': case 'W':
            controller.handleAction(InputAction::RotateCW);
            break;
        case 'h': case 'H':
            controller.handleAction(InputAction::HardDrop);
            settle(game, controller);
            break;
        case 'e': case 'E':
            if (!controller.handleAction(InputAction::ActivatePowerUp)) {
                std::cout << "No power-up to activate.\n";
            }
            settle(game, controller);
            break;
        case 't': case 'T': {
            // Default: one gravity interval at the current speed
            const double interval = game.currentDropInterval();
            int ms = interval < 60.0 ? static_cast<int>(interval * 1000.0) : 0;
            std::istringstream args{line.substr(1)};
            int requested = 0;
            if (args >> requested && requested > 0) {
                ms = requested;
            }
            if (ms <= 0) {
                std::cout << "Gravity is stopped; use 't <ms>'.\n";
                break;
            }
            controller.update(GameController::Duration{ms});
            settle(game, controller);
            break;
        }
        case 'p': case 'P':
            controller.handleAction(InputAction::PauseResume);
            break;
        case 'r': case 'R':
            game.reset();
            game.start();
            controller.resetTiming();
            break;
        default:
            std::cout << "Unknown command: " << c << '\n';
            break;
        }

        printEvents(game.drainEvents());
        printGame(game);

        if (game.status() == GameStatus::GameOver) {
            std::cout << "GAME OVER. Press 'r' to restart or 'q' to quit.\n";
        }
    }

    return 0;
}
