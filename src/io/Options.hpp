// ========================= src/io/Options.hpp =========================
#pragma once
#include "../core/Types.hpp"
#include <string>

namespace pupu {

    struct AppOptions {
        std::string levelData;      // --level
        std::string levelFile;      // --level-file
        bool useSample{ false };    // --sample
        size_t maxStates{ 0 };      // --max-states, 0 = unlimited
        long long progressInterval{ 100000 };
        int zoom{ 3 };              // 1..10
        std::string outPath;        // --out
        bool quiet{ false };
        bool showHelp{ false };
    };

    struct OptionsParseResult {
        bool ok{ false };
        ErrorKind error{ ErrorKind::None };
        std::string message;
        AppOptions options;
    };

    // requireLevel: fail when no level source is given (the viewer can start empty)
    OptionsParseResult parseOptions(int argc, const char* const* argv, bool requireLevel = true);
    std::string optionsUsage(const char* program);

} // namespace pupu
