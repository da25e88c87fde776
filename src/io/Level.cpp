// ========================= src/io/Level.cpp =========================
#include "Level.hpp"
#include <fstream>
#include <sstream>

namespace pupu {

    static std::vector<std::string> split(const std::string& s, char sep) {
        std::vector<std::string> out; std::string cur; std::istringstream iss(s);
        while (std::getline(iss, cur, sep)) out.push_back(cur);
        return out;
    }

    static std::string trim(const std::string& s) {
        const char* ws = " \t\r\n";
        size_t b = s.find_first_not_of(ws);
        if (b == std::string::npos) return "";
        size_t e = s.find_last_not_of(ws);
        return s.substr(b, e - b + 1);
    }

    static LevelParseResult fail(ErrorKind kind, std::string message) {
        LevelParseResult r;
        r.error = kind;
        r.message = std::move(message);
        return r;
    }

    LevelParseResult LevelIO::parse(const std::string& text) {
        std::vector<std::string> lines;
        for (const auto& raw : split(text, '\n')) {
            std::string l = trim(raw);
            if (!l.empty()) lines.push_back(l);
        }

        if ((int)lines.size() != kHeight) {
            return fail(ErrorKind::InvalidLevelDimensions,
                "expected " + std::to_string(kHeight) + " lines, got " + std::to_string(lines.size()));
        }

        LevelParseResult r;
        r.board = Board(Tile::Background);
        for (int y = 0; y < kHeight; ++y) {
            const auto& l = lines[y];
            if ((int)l.size() != kWidth) {
                return fail(ErrorKind::InvalidLevelDimensions,
                    "line " + std::to_string(y + 1) + " has " + std::to_string(l.size()) +
                    " chars, expected " + std::to_string(kWidth));
            }
            for (int x = 0; x < kWidth; ++x) {
                auto t = tileForSymbol(l[x]);
                if (!t) {
                    return fail(ErrorKind::UnknownTileSymbol,
                        std::string("'") + l[x] + "' is not a valid tile (line " + std::to_string(y + 1) +
                        ", column " + std::to_string(x + 1) + ")");
                }
                r.board.set(x, y, *t);
            }
        }
        r.ok = true;
        return r;
    }

    LevelParseResult LevelIO::load(const std::string& path) {
        std::ifstream f(path);
        if (!f) return fail(ErrorKind::FileUnreadable, "cannot open level file '" + path + "'");
        std::ostringstream oss;
        oss << f.rdbuf();
        return parse(oss.str());
    }

    std::string LevelIO::format(const Board& b) {
        std::string out;
        out.reserve((kWidth + 1) * kHeight);
        for (int y = 0; y < kHeight; ++y) {
            for (int x = 0; x < kWidth; ++x) out.push_back(symbolFor(b.get(x, y)));
            out.push_back('\n');
        }
        return out;
    }

    const std::string& LevelIO::sampleLevel() {
        static const std::string level =
            "PPPPPPPPPPPP\n"
            "PPPPPPPPPPPP\n"
            "PPPPP##PPPPP\n"
            "PPPP#.R#PPPP\n"
            "PPP#..2R#PPP\n"
            "PP#...S2F#PP\n"
            "PP#...FS1#PP\n"
            "PPP#..1R#PPP\n"
            "PPPP#.F#PPPP\n"
            "PPPPP##PPPPP\n"
            "PPPPPPPPPPPP\n"
            "PPPPPPPPPPPP\n";
        return level;
    }

    std::string LevelIO::usage() {
        std::ostringstream oss;
        oss << "Level data needs to be " << kHeight << " lines of " << kWidth << " chars per line.\n\n";
        oss << "Valid characters:\n\n";
        for (const auto& e : kSymbols) {
            oss << "  '" << e.symbol << "' -> " << tileName(e.tile) << "\n";
        }
        oss << "\nExample data (Level 93):\n\n" << sampleLevel();
        return oss.str();
    }

    std::string SolutionIO::describe(const Move& m, int index) {
        std::ostringstream oss;
        oss << "Step " << index + 1 << ": (" << m.fromX << ',' << m.y << ")->(" << m.toX << ',' << m.y << ')';
        return oss.str();
    }

    std::vector<std::string> SolutionIO::describeAll(const std::vector<Move>& path) {
        std::vector<std::string> out;
        out.reserve(path.size());
        for (size_t i = 0; i < path.size(); ++i) out.push_back(describe(path[i], (int)i));
        return out;
    }

    bool SolutionIO::save(const std::string& path, const Board& start, const SolveResult& result) {
        std::ofstream f(path, std::ios::out | std::ios::trunc);
        if (!f) return false;
        f << LevelIO::format(start) << "\n";
        f << result.boardsExamined << " playfields analyzed.\n";
        if (!result.solved) {
            f << (result.truncated ? "Search stopped at the state limit.\n" : "No solution found.\n");
            return bool(f);
        }
        f << "Solution found:\n";
        for (const auto& line : describeAll(result.path)) f << line << "\n";
        return bool(f);
    }

} // namespace pupu
