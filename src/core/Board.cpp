// ========================= src/core/Board.cpp =========================
#include "Board.hpp"

namespace pupu {

    Board::Board(Tile fill) {
        tiles.fill(Tile::Wall);
        for (int y = 0; y < kHeight; ++y)
            for (int x = 0; x < kWidth; ++x) set(x, y, fill);
    }

    bool Board::canApply(const Move& m) const {
        if (m.y < 0 || m.y >= kHeight) return false;
        if (m.fromX < 0 || m.fromX >= kWidth || m.toX < 0 || m.toX >= kWidth) return false;
        if (m.fromX == m.toX) return false;

        Tile t = get(m.fromX, m.y);
        if (!isMobile(t)) return false;

        int dir = m.toX > m.fromX ? 1 : -1;
        for (int x2 = m.fromX + dir; get(x2, m.y) == Tile::Empty; x2 += dir) {
            if (x2 == m.toX) return true;
            Tile below = get(x2, m.y + 1);
            if (below == Tile::Empty || below == t) return false; // the tile stops here
        }
        return false;
    }

    std::vector<Move> Board::legalMoves() const {
        std::vector<Move> moves;
        for (int y = 0; y < kHeight; ++y) {
            for (int x = 0; x < kWidth; ++x) {
                Tile t = get(x, y);
                if (!isMobile(t)) continue;

                for (int dir : { -1, 1 }) {
                    for (int x2 = x + dir; get(x2, y) == Tile::Empty; x2 += dir) {
                        moves.push_back(Move{ y, x, x2 });
                        // falls down here, or lands next to its twin
                        Tile below = get(x2, y + 1);
                        if (below == Tile::Empty || below == t) break;
                    }
                }
            }
        }
        return moves;
    }

    std::optional<Board> Board::apply(const Move& m, ErrorKind* outError) const {
        if (!canApply(m)) {
            if (outError) *outError = ErrorKind::IllegalMove;
            return std::nullopt;
        }

        Board next = *this;
        next.path.push_back(m);

        Tile t = next.get(m.fromX, m.y);
        next.set(m.fromX, m.y, Tile::Empty);
        next.set(m.toX, m.y, t);
        next.settle();

        if (outError) *outError = ErrorKind::None;
        return next;
    }

    bool Board::settle() {
        bool any = false;
        for (;;) {
            bool changed = dropTiles();
            changed |= removeTiles();
            if (!changed) return any;
            any = true;
        }
    }

    bool Board::dropTiles() {
        bool changed = false;
        // bottom row rests on the border
        for (int y = kHeight - 2; y >= 0; --y) {
            for (int x = 0; x < kWidth; ++x) {
                Tile t = get(x, y);
                if (!isMobile(t) || get(x, y + 1) != Tile::Empty) continue;
                int y2 = y + 1;
                while (get(x, y2 + 1) == Tile::Empty) ++y2;
                set(x, y, Tile::Empty);
                set(x, y2, t);
                changed = true;
            }
        }
        return changed;
    }

    bool Board::removeTiles() {
        bool changed = false;
        std::array<bool, kCells> decided{};
        std::vector<int> stack;
        std::vector<int> component;
        const int neighbours[4] = { -1, 1, -kStride, kStride };

        for (int y = 0; y < kHeight; ++y) {
            for (int x = 0; x < kWidth; ++x) {
                int start = index(x, y);
                Tile t = tiles[start];
                if (!isErasable(t) || decided[start]) continue;

                // flood fill over equal tiles; the wall border stops it at the edges
                component.clear();
                stack.assign(1, start);
                decided[start] = true;
                while (!stack.empty()) {
                    int cur = stack.back(); stack.pop_back();
                    component.push_back(cur);
                    for (int d : neighbours) {
                        int n = cur + d;
                        if (decided[n] || tiles[n] != t) continue;
                        decided[n] = true;
                        stack.push_back(n);
                    }
                }

                if (component.size() >= 2) {
                    for (int c : component) tiles[c] = Tile::Empty;
                    changed = true;
                }
            }
        }
        return changed;
    }

    bool Board::isSolved() const {
        for (int y = 0; y < kHeight; ++y)
            for (int x = 0; x < kWidth; ++x)
                if (isErasable(get(x, y))) return false;
        return true;
    }

    std::array<int, kErasableKinds> Board::tileCounts() const {
        std::array<int, kErasableKinds> counts{};
        for (int y = 0; y < kHeight; ++y) {
            for (int x = 0; x < kWidth; ++x) {
                Tile t = get(x, y);
                if (isErasable(t)) ++counts[kindIndex(t)];
            }
        }
        return counts;
    }

    bool Board::isSolvable() const {
        // a lone tile of a kind can never be matched
        for (int c : tileCounts()) if (c == 1) return false;
        return true;
    }

    size_t Board::hashGrid(const Grid& g) {
        uint64_t h = 1469598103934665603ull;
        for (Tile t : g) {
            h ^= static_cast<uint64_t>(t);
            h *= 1099511628211ull;
        }
        return size_t(h);
    }

} // namespace pupu
