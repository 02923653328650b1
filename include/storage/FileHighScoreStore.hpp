#pragma once

#include "core/IHighScoreStore.hpp"
#include <string>

namespace mergetris::storage {

// Keeps the high score as a single decimal integer in a text file.
// A missing or unreadable file counts as "no high score yet".
class FileHighScoreStore : public mergetris::core::IHighScoreStore {
public:
    explicit FileHighScoreStore(std::string path);

    std::uint64_t loadHighScore() override;
    void saveHighScore(std::uint64_t highScore) override;

    const std::string& path() const noexcept { return path_; }

private:
    std::string path_;
};

} // namespace mergetris::storage
