// ========================= src/ui/App.hpp =========================
#pragma once
#include "../io/Level.hpp"
#include "../io/Options.hpp"
#include <atomic>
#include <mutex>
#include <string>
#include <thread>

namespace pupu {

    class AppUI {
    public:
        explicit AppUI(const AppOptions& options);
        ~AppUI();
        int run(); // SDL2 + ImGui main loop

    private:
        AppOptions opt;
        std::string levelText;          // editor buffer
        std::vector<Board> steps;       // replayed boards, steps[0] == start
        std::vector<Move> moves;
        bool solved{ false };
        bool haveResult{ false };
        long long examined{ 0 };
        int playbackStep{ 0 };
        int maxStatesInput{ 0 };

        // background solve
        std::thread solveThread;
        std::atomic<bool> isSolving{ false };
        std::atomic<long long> progressBoards{ 0 };
        std::mutex pendingMutex;
        std::optional<SolveResult> pendingResult;
        std::optional<Board> pendingStart;

        std::mutex statusMutex;
        std::string statusMessage;
        void setStatus(const std::string& msg);
        std::string getStatus();

        // UI helpers
        void drawControls();
        void drawViewer();
        void startSolve();
        void collectResult();
        void step(int delta);
    };

} // namespace pupu
