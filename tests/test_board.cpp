#undef NDEBUG
#include <cassert>
#include <iostream>

#include "TestBoards.hpp"

using namespace pupu;
using pupu::testing::makeBoard;

namespace {

void TestBorderIsWall() {
    Board b(Tile::Empty);
    for (int x = -1; x <= kWidth; ++x) {
        assert(b.get(x, -1) == Tile::Wall);
        assert(b.get(x, kHeight) == Tile::Wall);
    }
    for (int y = -1; y <= kHeight; ++y) {
        assert(b.get(-1, y) == Tile::Wall);
        assert(b.get(kWidth, y) == Tile::Wall);
    }
    assert(b.get(0, 0) == Tile::Empty);
}

void TestTileClasses() {
    assert(isMobile(Tile::Heart) && isErasable(Tile::Heart));
    assert(isMobile(Tile::Frame) && isErasable(Tile::Frame));
    assert(isMobile(Tile::Glass) && !isErasable(Tile::Glass));
    assert(!isMobile(Tile::Wall) && !isMobile(Tile::Background) && !isMobile(Tile::Empty));
}

void TestMovesStopAtTwin() {
    Board b = makeBoard({ { 10, "H..........." }, { 11, "##H#########" } });
    auto moves = b.legalMoves();
    assert(moves.size() == 2);
    assert((moves[0] == Move{ 10, 0, 1 }));
    assert((moves[1] == Move{ 10, 0, 2 }));
}

void TestMovesStopAtLedge() {
    Board b = makeBoard({ { 10, "H..........." }, { 11, "##.#########" } });
    auto moves = b.legalMoves();
    assert(moves.size() == 2);
    assert((moves[1] == Move{ 10, 0, 2 }));
    assert(b.canApply(Move{ 10, 0, 2 }));
    assert(!b.canApply(Move{ 10, 0, 3 })); // past the ledge
}

void TestMovesOnlyIntoEmptyCells() {
    Board b = makeBoard({ { 11, "HDP#G......." } });
    for (const auto& m : b.legalMoves()) {
        assert(b.get(m.toX, m.y) == Tile::Empty);
        assert(isMobile(b.get(m.fromX, m.y)));
        assert(b.canApply(m));
    }
    // glass moves like any other mobile tile
    assert(b.canApply(Move{ 11, 4, 5 }));
}

void TestIllegalMovesRejected() {
    Board b = makeBoard({ { 10, "HD.........." }, { 11, "############" } });
    ErrorKind err = ErrorKind::None;
    assert(!b.apply(Move{ 10, 0, 1 }, &err));  // destination occupied
    assert(err == ErrorKind::IllegalMove);
    assert(!b.apply(Move{ 11, 0, 1 }, &err));  // wall source
    assert(!b.apply(Move{ 10, 2, 3 }, &err));  // empty source
    assert(!b.apply(Move{ 10, 1, 1 }, &err));  // no slide
    assert(!b.apply(Move{ 12, 1, 2 }, &err));  // off the board
    assert(b.apply(Move{ 10, 1, 2 }, &err));
    assert(err == ErrorKind::None);
}

void TestSingleRemovalNoGravity() {
    Board b = makeBoard({ { 11, "H.H........." } });
    auto next = b.apply(Move{ 11, 0, 1 });
    assert(next);
    assert(next->isSolved());
    assert(next->path.size() == 1);
    // input board untouched
    assert(b.get(0, 11) == Tile::Heart);
    assert(b.get(2, 11) == Tile::Heart);
    assert(b.path.empty());
}

void TestTileFallsThenMatches() {
    Board b = makeBoard({ { 0, "H..........." }, { 11, "..H........." } });
    auto moves = b.legalMoves();
    assert((moves[0] == Move{ 0, 0, 1 }));
    auto next = b.apply(moves[0]);
    assert(next && next->isSolved());
}

void TestChainReaction() {
    Board b = makeBoard({
        { 9,  "....D......." },
        { 10, "...DH.H....." },
        { 11, "############" } });
    auto next = b.apply(Move{ 10, 6, 5 });
    assert(next);
    // hearts clear, the diamond drops onto the row and clears with its twin
    assert(next->isSolved());
    assert(next->get(4, 10) == Tile::Empty);
}

void TestGravityFillsColumn() {
    Board b = makeBoard({ { 2, "G..........." }, { 3, "D..........." }, { 11, "#..........." } });
    assert(b.settle());
    assert(b.get(0, 9) == Tile::Glass);
    assert(b.get(0, 10) == Tile::Diamond);
    assert(b.get(0, 11) == Tile::Wall);
    assert(!b.settle());
}

void TestLargeComponentClears() {
    Board b = makeBoard({
        { 9,  "RRR........." },
        { 10, "R.R.GG......" },
        { 11, "RRR.T#......" } });
    b.settle();
    for (int x = 0; x < 3; ++x) assert(b.get(x, 11) == Tile::Empty);
    assert(b.get(1, 10) == Tile::Empty);
    // glass never matches, a lone triangle stays
    assert(b.get(4, 10) == Tile::Glass && b.get(5, 10) == Tile::Glass);
    assert(b.get(4, 11) == Tile::Triangle);
    assert(!b.isSolved());
    assert(!b.isSolvable());
}

void TestSolvability() {
    Board b = makeBoard({ { 11, "HH.D.D.G...." } });
    assert(b.isSolvable());
    auto counts = b.tileCounts();
    assert(counts[kindIndex(Tile::Heart)] == 2);
    assert(counts[kindIndex(Tile::Diamond)] == 2);
    assert(counts[kindIndex(Tile::Ring)] == 0);

    Board lone = makeBoard({ { 11, "HH.D........" } });
    assert(!lone.isSolvable());

    Board glassOnly = makeBoard({ { 11, "G..........." } });
    assert(glassOnly.isSolved());
}

void TestContentKeyIgnoresHistory() {
    Board a = makeBoard({ { 11, "H.H.D.D....." } });
    Board b = makeBoard({ { 11, "H.H.D.D....." } });
    b.path.push_back(Move{ 11, 0, 1 });
    assert(a.tiles == b.tiles);
    assert(a.hash() == b.hash());
    assert(GridHasher{}(a.tiles) == GridHasher{}(b.tiles));

    // same layout reached by different moves
    auto viaLeft = a.apply(Move{ 11, 2, 1 });
    auto viaRight = a.apply(Move{ 11, 0, 1 });
    assert(viaLeft && viaRight);
    assert(viaLeft->tiles == viaRight->tiles);
    assert(viaLeft->path != viaRight->path);
}

void TestSettledBoardsStayStableAndOnlyLoseTiles() {
    Board b = pupu::testing::sampleBoard();
    for (int depth = 0; depth < 4; ++depth) {
        auto moves = b.legalMoves();
        assert(!moves.empty());
        auto before = b.tileCounts();
        Board next = *b.apply(moves.back());

        Board again = next;
        assert(!again.settle());
        assert(again.tiles == next.tiles);

        auto after = next.tileCounts();
        for (int k = 0; k < kErasableKinds; ++k) assert(after[k] <= before[k]);
        b = next;
    }
}

}  // namespace

int main() {
    TestBorderIsWall();
    TestTileClasses();
    TestMovesStopAtTwin();
    TestMovesStopAtLedge();
    TestMovesOnlyIntoEmptyCells();
    TestIllegalMovesRejected();
    TestSingleRemovalNoGravity();
    TestTileFallsThenMatches();
    TestChainReaction();
    TestGravityFillsColumn();
    TestLargeComponentClears();
    TestSolvability();
    TestContentKeyIgnoresHistory();
    TestSettledBoardsStayStableAndOnlyLoseTiles();
    std::cout << "All board tests passed.\n";
    return 0;
}
