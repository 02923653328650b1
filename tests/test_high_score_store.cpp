#include <catch2/catch.hpp>

#include <filesystem>
#include <fstream>
#include <string>

#include "storage/FileHighScoreStore.hpp"

using mergetris::storage::FileHighScoreStore;

namespace {

// Unique file under the temp directory, removed on scope exit.
struct TempFile {
    std::filesystem::path path;

    explicit TempFile(const std::string& name)
        : path{std::filesystem::temp_directory_path() / name}
    {
        std::filesystem::remove(path);
    }

    ~TempFile() {
        std::error_code ec;
        std::filesystem::remove(path, ec);
    }
};

} // namespace

TEST_CASE("FileHighScoreStore reports zero without a file", "[storage]") {
    TempFile file{"mergetris_test_missing.txt"};
    FileHighScoreStore store{file.path.string()};

    CHECK(store.loadHighScore() == 0);
}

TEST_CASE("FileHighScoreStore round-trips a score", "[storage]") {
    TempFile file{"mergetris_test_roundtrip.txt"};

    {
        FileHighScoreStore store{file.path.string()};
        store.saveHighScore(12345);
    }

    FileHighScoreStore reopened{file.path.string()};
    CHECK(reopened.loadHighScore() == 12345);
}

TEST_CASE("FileHighScoreStore never overwrites a better score", "[storage]") {
    TempFile file{"mergetris_test_better.txt"};
    FileHighScoreStore store{file.path.string()};

    store.saveHighScore(900);
    store.saveHighScore(400);
    CHECK(store.loadHighScore() == 900);

    store.saveHighScore(1200);
    CHECK(store.loadHighScore() == 1200);
}

TEST_CASE("FileHighScoreStore treats a malformed file as empty", "[storage]") {
    TempFile file{"mergetris_test_malformed.txt"};
    {
        std::ofstream out{file.path};
        out << "not a number\n";
    }

    FileHighScoreStore store{file.path.string()};
    CHECK(store.loadHighScore() == 0);

    store.saveHighScore(42);
    CHECK(store.loadHighScore() == 42);
}
