// ========================= src/core/Solver.hpp =========================
#pragma once
#include "Board.hpp"
#include <functional>

namespace pupu {

    struct SearchProgress {
        long long boardsExamined{ 0 };
        size_t frontierSize{ 0 };
        size_t statesVisited{ 0 };
    };

    struct SolverOptions {
        size_t maxStates{ 0 };              // visited-set cap, 0 = unlimited
        long long progressInterval{ 100000 }; // report every N examined boards, 0 = never
        std::function<void(const SearchProgress&)> onProgress;
    };

    struct SolveResult {
        bool solved{ false };
        bool truncated{ false };            // stopped at maxStates before exhausting the search
        long long boardsExamined{ 0 };      // boards popped from the frontier
        size_t statesVisited{ 0 };
        size_t peakFrontier{ 0 };
        std::vector<Move> path;
        std::optional<Board> finalBoard;
    };

    // Breadth-first search over settled boards. Not optimal: stops at the first cleared board.
    class Solver {
    public:
        Solver() = default;
        explicit Solver(SolverOptions options) : opt(std::move(options)) {}

        SolveResult solve(const Board& start) const;

        // start board followed by one board per move; nullopt if a move is illegal
        static std::optional<std::vector<Board>> replay(const Board& start, const std::vector<Move>& path);

    private:
        SolverOptions opt;
    };

} // namespace pupu
