// ========================= tests/TestBoards.hpp =========================
#pragma once
#include "io/Level.hpp"
#include <cassert>
#include <map>

namespace pupu::testing {

    // Empty playfield with the given rows replaced.
    inline Board makeBoard(const std::map<int, std::string>& rows) {
        std::string text;
        for (int y = 0; y < kHeight; ++y) {
            auto it = rows.find(y);
            text += (it != rows.end() ? it->second : std::string(kWidth, '.')) + "\n";
        }
        LevelParseResult r = LevelIO::parse(text);
        assert(r.ok);
        return r.board;
    }

    inline Board sampleBoard() {
        LevelParseResult r = LevelIO::parse(LevelIO::sampleLevel());
        assert(r.ok);
        return r.board;
    }

} // namespace pupu::testing
