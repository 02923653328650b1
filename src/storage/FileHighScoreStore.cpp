#include "storage/FileHighScoreStore.hpp"

#include <fstream>
#include <iostream>
#include <utility>

namespace mergetris::storage {

FileHighScoreStore::FileHighScoreStore(std::string path)
    : path_{std::move(path)}
{
}

std::uint64_t FileHighScoreStore::loadHighScore() {
    std::ifstream in{path_};
    if (!in) {
        return 0;
    }

    std::uint64_t value = 0;
    if (!(in >> value)) {
        std::cerr << "FileHighScoreStore: ignoring malformed file " << path_ << "\n";
        return 0;
    }
    return value;
}

void FileHighScoreStore::saveHighScore(std::uint64_t highScore) {
    // Never overwrite a better score written by another session.
    if (loadHighScore() > highScore) {
        return;
    }

    std::ofstream out{path_, std::ios::trunc};
    if (!out) {
        std::cerr << "FileHighScoreStore: cannot open " << path_ << " for writing\n";
        return;
    }

    out << highScore << '\n';
    if (!out) {
        std::cerr << "FileHighScoreStore: write to " << path_ << " failed\n";
    }
}

} // namespace mergetris::storage
