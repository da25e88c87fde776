// ========================= src/cli/SolveCli.cpp =========================
#include "../io/Level.hpp"
#include "../io/Options.hpp"
#include <cstdio>

using namespace pupu;

static bool loadStart(const AppOptions& o, Board& out) {
    LevelParseResult lr;
    if (o.useSample) lr = LevelIO::parse(LevelIO::sampleLevel());
    else if (!o.levelFile.empty()) lr = LevelIO::load(o.levelFile);
    else lr = LevelIO::parse(o.levelData);

    if (!lr.ok) {
        std::fprintf(stderr, "%s: %s\n\n", errorName(lr.error), lr.message.c_str());
        if (lr.error != ErrorKind::FileUnreadable) std::fprintf(stderr, "%s", LevelIO::usage().c_str());
        return false;
    }
    out = lr.board;
    return true;
}

int main(int argc, char** argv) {
    OptionsParseResult pr = parseOptions(argc, argv);
    if (!pr.ok) {
        std::fprintf(stderr, "%s\n\n%s", pr.message.c_str(), optionsUsage(argv[0]).c_str());
        return 2;
    }
    const AppOptions& o = pr.options;
    if (o.showHelp) {
        std::printf("%s\n%s", optionsUsage(argv[0]).c_str(), LevelIO::usage().c_str());
        return 0;
    }

    Board start;
    if (!loadStart(o, start)) return 2;

    SolverOptions so;
    so.maxStates = o.maxStates;
    so.progressInterval = o.progressInterval;
    if (!o.quiet) {
        std::printf("%s\n", LevelIO::format(start).c_str());
        so.onProgress = [](const SearchProgress& p) {
            std::printf("%lld playfields analysed, current queue size %zu\n", p.boardsExamined, p.frontierSize);
        };
    }

    SolveResult res = Solver(so).solve(start);
    std::printf("%lld playfields analyzed.\n", res.boardsExamined);

    if (!res.solved) {
        if (res.truncated) std::printf("Search stopped after %zu distinct playfields.\n", res.statesVisited);
        else std::printf("No solution found.\n");
    } else {
        std::printf("Solution found:\n");
        for (const auto& line : SolutionIO::describeAll(res.path)) std::printf("%s\n", line.c_str());
    }

    if (!o.outPath.empty() && !SolutionIO::save(o.outPath, start, res)) {
        std::fprintf(stderr, "cannot write '%s'\n", o.outPath.c_str());
        return 2;
    }
    return res.solved ? 0 : 1;
}
