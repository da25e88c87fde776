// ========================= src/main.cpp =========================
#include "ui/App.hpp"
#include <SDL.h>
#include <cstdio>

int main(int argc, char* argv[]) {
    pupu::OptionsParseResult pr = pupu::parseOptions(argc, argv, /*requireLevel=*/false);
    if (!pr.ok) {
        std::fprintf(stderr, "%s\n\n%s", pr.message.c_str(), pupu::optionsUsage(argv[0]).c_str());
        return 1;
    }
    if (pr.options.showHelp) {
        std::printf("%s\n%s", pupu::optionsUsage(argv[0]).c_str(), pupu::LevelIO::usage().c_str());
        return 0;
    }
    pupu::AppUI app(pr.options);
    return app.run();
}
