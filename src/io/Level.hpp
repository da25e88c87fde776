// ========================= src/io/Level.hpp =========================
#pragma once
#include "../core/Solver.hpp"
#include <string>
#include <vector>

namespace pupu {

    struct LevelParseResult {
        bool ok{ false };
        ErrorKind error{ ErrorKind::None };
        std::string message;
        Board board;
    };

    // Level text: kHeight lines of kWidth symbols from kSymbols. Blank lines and
    // surrounding whitespace are ignored.
    struct LevelIO {
        static LevelParseResult parse(const std::string& text);
        static LevelParseResult load(const std::string& path);
        static std::string format(const Board& b);

        static const std::string& sampleLevel(); // level 93
        static std::string usage();
    };

    struct SolutionIO {
        static std::string describe(const Move& m, int index); // "Step 1: (6,3)->(5,3)"
        static std::vector<std::string> describeAll(const std::vector<Move>& path);
        static bool save(const std::string& path, const Board& start, const SolveResult& result);
    };

} // namespace pupu
