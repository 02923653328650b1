#include "core/MergeEngine.hpp"

#include <iostream>
#include <stdexcept>

namespace mergetris::core {

MergeEngine::MergeEngine(const MergeConfig& config)
    : config_{config}
{
    if (config.maxIterations <= 0) {
        throw std::invalid_argument("MergeEngine: maxIterations must be positive");
    }
}

std::vector<MergePair> MergeEngine::findMergePairs(const Board& board) {
    std::vector<MergePair> pairs;

    const int w = board.width();
    const int h = board.height();
    std::vector<bool> used(static_cast<std::size_t>(w) * static_cast<std::size_t>(h), false);
    auto isUsed = [&](int x, int y) { return used[static_cast<std::size_t>(y * w + x)]; };
    auto markUsed = [&](int x, int y) { used[static_cast<std::size_t>(y * w + x)] = true; };

    // A neighbour qualifies if it is a locked, unpaired block of equal value.
    auto canPair = [&](const Block& block, int nx, int ny) {
        const auto other = board.get(nx, ny);
        return other && other->locked && !isUsed(nx, ny) && other->value == block.value;
    };

    for (int y = 0; y < h; ++y) {
        for (int x = 0; x < w; ++x) {
            const auto block = board.get(x, y);
            if (!block || !block->locked || isUsed(x, y)) {
                continue;
            }

            if (canPair(*block, x + 1, y)) {
                pairs.push_back(MergePair{{x, y}, {x + 1, y}});
                markUsed(x, y);
                markUsed(x + 1, y);
                continue;
            }

            if (canPair(*block, x, y + 1)) {
                pairs.push_back(MergePair{{x, y}, {x, y + 1}});
                markUsed(x, y);
                markUsed(x, y + 1);
            }
        }
    }

    return pairs;
}

CellValue MergeEngine::executeMerge(const MergePair& pair, CascadeContext& ctx) {
    const auto first = ctx.board.get(pair.first.x, pair.first.y);
    const auto second = ctx.board.get(pair.second.x, pair.second.y);
    if (!first || !second || first->value != second->value) {
        throw std::logic_error("MergeEngine::executeMerge on a stale pair");
    }

    const CellValue newValue = first->value * 2U;
    ctx.board.setValue(pair.first.x, pair.first.y, newValue);
    ctx.board.remove(pair.second.x, pair.second.y);

    const int combo = ctx.combo.registerMerge(ctx.now);
    ctx.events.emplace_back(MergeOccurred{pair.first, newValue, combo});
    ctx.score.addScore(ScoreManager::mergeScore(newValue, combo), ctx.events);

    return newValue;
}

void MergeEngine::begin(bool settleFirst) noexcept {
    phase_ = settleFirst ? Phase::Settle : Phase::Scan;
    timer_ = 0.0;
    iterations_ = 0;
    result_ = CascadeResult{};
}

bool MergeEngine::step(CascadeContext& ctx) {
    switch (phase_) {
    case Phase::Idle:
        return false;

    case Phase::Scan: {
        if (iterations_ >= config_.maxIterations) {
            // Previous pass still merged; stop here and keep playing.
            std::cerr << "MergeEngine: cascade stopped after " << iterations_
                      << " passes (iteration limit)\n";
            result_.hitIterationLimit = true;
            ctx.events.emplace_back(CascadeLimitReached{iterations_});
            phase_ = Phase::Finish;
            return step(ctx);
        }

        ++iterations_;
        const auto pairs = findMergePairs(ctx.board);
        if (pairs.empty()) {
            phase_ = Phase::Finish;
            return step(ctx);
        }

        for (const auto& pair : pairs) {
            executeMerge(pair, ctx);
        }
        ++result_.passes;
        result_.merges += static_cast<int>(pairs.size());

        phase_ = Phase::Settle;
        timer_ = config_.mergeDelay;
        return false;
    }

    case Phase::Settle:
        ctx.board.applyGravity();
        phase_ = Phase::Scan;
        timer_ = config_.mergeDelay;
        return false;

    case Phase::Finish: {
        const int rows = ctx.board.clearCompletedRows();
        result_.rowsCleared = rows;
        result_.comboAtClear = ctx.combo.combo();
        if (rows > 0) {
            ctx.events.emplace_back(RowsCleared{rows, result_.comboAtClear});
            ctx.score.addRowClearScore(rows, result_.comboAtClear, ctx.events);
        }
        phase_ = Phase::Idle;
        return true;
    }
    }
    return false;
}

std::optional<CascadeResult> MergeEngine::update(double dt, CascadeContext& ctx) {
    if (phase_ == Phase::Idle) {
        return std::nullopt;
    }

    timer_ -= dt;
    while (phase_ != Phase::Idle && timer_ <= 0.0) {
        if (step(ctx)) {
            return result_;
        }
    }
    return std::nullopt;
}

CascadeResult MergeEngine::resolve(CascadeContext& ctx, bool settleFirst) {
    begin(settleFirst);
    while (!step(ctx)) {
        // pacing is skipped
    }
    return result_;
}

void MergeEngine::reset() noexcept {
    phase_ = Phase::Idle;
    timer_ = 0.0;
    iterations_ = 0;
    result_ = CascadeResult{};
}

} // namespace mergetris::core
