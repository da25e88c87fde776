// ========================= src/core/Board.hpp =========================
#pragma once
#include "Types.hpp"
#include <array>

namespace pupu {

    struct Board {
        static constexpr int kStride = kWidth + 2;
        static constexpr int kCells = kStride * (kHeight + 2);

        // Playfield plus a one-cell wall border; this is the visited-set key.
        using Grid = std::array<Tile, kCells>;

        Grid tiles;
        std::vector<Move> path; // moves from the initial board, oldest first

        // All playfield cells set to `fill`, border set to Wall.
        explicit Board(Tile fill = Tile::Background);

        // x in [-1, kWidth], y in [-1, kHeight]; -1 and kWidth/kHeight address the border
        Tile get(int x, int y) const { return tiles[index(x, y)]; }
        void set(int x, int y, Tile t) { tiles[index(x, y)] = t; }

        // move legality, same rule the generator uses
        bool canApply(const Move& m) const;
        std::vector<Move> legalMoves() const;

        // New settled board with `m` appended to its path; nullopt (and IllegalMove) if not legal.
        std::optional<Board> apply(const Move& m, ErrorKind* outError = nullptr) const;

        // gravity + removal until nothing changes; returns true if anything changed
        bool settle();
        bool dropTiles();
        bool removeTiles();

        bool isSolved() const;
        bool isSolvable() const;
        std::array<int, kErasableKinds> tileCounts() const;

        size_t hash() const { return hashGrid(tiles); }
        static size_t hashGrid(const Grid& g);

    private:
        static constexpr int index(int x, int y) { return (y + 1) * kStride + (x + 1); }
    };

    struct GridHasher {
        size_t operator()(const Board::Grid& g) const noexcept { return Board::hashGrid(g); }
    };

} // namespace pupu
