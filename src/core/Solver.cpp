// ========================= src/core/Solver.cpp =========================
#include "Solver.hpp"
#include <deque>
#include <unordered_set>
#include <algorithm>

namespace pupu {

    SolveResult Solver::solve(const Board& start) const {
        SolveResult result;

        if (start.isSolved()) {
            result.solved = true;
            result.finalBoard = start;
            result.path = start.path;
            return result;
        }
        // nothing reachable from here can clear a lone tile
        if (!start.isSolvable()) return result;

        std::unordered_set<Board::Grid, GridHasher> visited;
        std::deque<Board> frontier;

        visited.insert(start.tiles);
        frontier.push_back(start);
        result.peakFrontier = 1;

        while (!frontier.empty()) {
            Board board = std::move(frontier.front());
            frontier.pop_front();
            ++result.boardsExamined;

            if (opt.onProgress && opt.progressInterval > 0 && result.boardsExamined % opt.progressInterval == 0) {
                opt.onProgress(SearchProgress{ result.boardsExamined, frontier.size(), visited.size() });
            }

            for (const Move& m : board.legalMoves()) {
                std::optional<Board> next = board.apply(m);
                if (!next) continue; // generator moves are always legal

                // first path to a layout wins; insert before any other check
                if (!visited.insert(next->tiles).second) continue;

                if (!next->isSolvable()) continue;

                if (next->isSolved()) {
                    result.solved = true;
                    result.path = next->path;
                    result.finalBoard = std::move(next);
                    result.statesVisited = visited.size();
                    return result;
                }

                frontier.push_back(std::move(*next));
                result.peakFrontier = std::max(result.peakFrontier, frontier.size());
            }

            if (opt.maxStates > 0 && visited.size() >= opt.maxStates && !frontier.empty()) {
                result.truncated = true;
                break;
            }
        }

        result.statesVisited = visited.size();
        return result;
    }

    std::optional<std::vector<Board>> Solver::replay(const Board& start, const std::vector<Move>& path) {
        std::vector<Board> steps;
        steps.reserve(path.size() + 1);
        steps.push_back(start);
        for (const Move& m : path) {
            std::optional<Board> next = steps.back().apply(m);
            if (!next) return std::nullopt;
            steps.push_back(std::move(*next));
        }
        return steps;
    }

} // namespace pupu
