// ========================= src/io/Options.cpp =========================
#include "Options.hpp"
#include <cstdlib>
#include <cstring>
#include <sstream>

namespace pupu {

    static bool parseNumber(const char* text, long long& out) {
        if (!text || !*text) return false;
        char* end = nullptr;
        long long v = std::strtoll(text, &end, 10);
        if (*end != '\0' || v < 0) return false;
        out = v;
        return true;
    }

    static OptionsParseResult bad(std::string message) {
        OptionsParseResult r;
        r.error = ErrorKind::BadOption;
        r.message = std::move(message);
        return r;
    }

    OptionsParseResult parseOptions(int argc, const char* const* argv, bool requireLevel) {
        OptionsParseResult r;
        AppOptions& o = r.options;

        for (int i = 1; i < argc; ++i) {
            const char* a = argv[i];
            bool hasValue = i + 1 < argc;
            long long n = 0;
            if (std::strcmp(a, "--level") == 0 && hasValue) {
                o.levelData = argv[++i];
            } else if (std::strcmp(a, "--level-file") == 0 && hasValue) {
                o.levelFile = argv[++i];
            } else if (std::strcmp(a, "--sample") == 0) {
                o.useSample = true;
            } else if (std::strcmp(a, "--max-states") == 0 && hasValue) {
                if (!parseNumber(argv[++i], n)) return bad("--max-states expects a non-negative number");
                o.maxStates = static_cast<size_t>(n);
            } else if (std::strcmp(a, "--progress") == 0 && hasValue) {
                if (!parseNumber(argv[++i], n)) return bad("--progress expects a non-negative number");
                o.progressInterval = n;
            } else if (std::strcmp(a, "--zoom") == 0 && hasValue) {
                if (!parseNumber(argv[++i], n) || n < 1 || n > 10) return bad("Zoom value must be between 1 and 10.");
                o.zoom = static_cast<int>(n);
            } else if (std::strcmp(a, "--out") == 0 && hasValue) {
                o.outPath = argv[++i];
            } else if (std::strcmp(a, "-q") == 0 || std::strcmp(a, "--quiet") == 0) {
                o.quiet = true;
            } else if (std::strcmp(a, "-h") == 0 || std::strcmp(a, "--help") == 0) {
                o.showHelp = true;
                r.ok = true;
                return r;
            } else {
                return bad(std::string("unknown or incomplete option '") + a + "'");
            }
        }

        int sources = (o.levelData.empty() ? 0 : 1) + (o.levelFile.empty() ? 0 : 1) + (o.useSample ? 1 : 0);
        if (sources > 1) return bad("use only one of --level, --level-file and --sample");
        if (sources == 0 && requireLevel) return bad("Either --level, --level-file or --sample need to be set.");

        r.ok = true;
        return r;
    }

    std::string optionsUsage(const char* program) {
        std::ostringstream oss;
        oss << "Usage: " << program << " [options]\n"
            << "  --level <data>        Level data, 12 lines of 12 chars\n"
            << "  --level-file <path>   Read level data from a file\n"
            << "  --sample              Use the built-in level 93\n"
            << "  --max-states <n>      Stop after n distinct boards (0 = unlimited)\n"
            << "  --progress <n>        Report every n boards analysed (0 = off)\n"
            << "  --zoom <1..10>        Viewer zoom factor (default 3)\n"
            << "  --out <path>          Write the solution to a file\n"
            << "  -q, --quiet           Only print the result\n"
            << "  -h, --help            Show this help\n";
        return oss.str();
    }

} // namespace pupu
