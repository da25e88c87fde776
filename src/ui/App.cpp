// ========================= src/ui/App.cpp =========================
#include "App.hpp"
#include <SDL.h>
#include "imgui.h"
#include "backends/imgui_impl_sdl2.h"
#include "backends/imgui_impl_sdlrenderer2.h"
#include <algorithm> // for std::clamp
#include <cstdio>
#include <vector>

namespace pupu {

    AppUI::AppUI(const AppOptions& options) : opt(options) {
        maxStatesInput = static_cast<int>(std::min<size_t>(opt.maxStates, 100000000));
        if (!opt.levelFile.empty()) {
            LevelParseResult lr = LevelIO::load(opt.levelFile);
            if (lr.ok) levelText = LevelIO::format(lr.board);
            else setStatus(std::string(errorName(lr.error)) + ": " + lr.message);
        }
        else if (!opt.levelData.empty()) levelText = opt.levelData;
        else levelText = LevelIO::sampleLevel();
    }

    AppUI::~AppUI() {
        if (solveThread.joinable()) {
            solveThread.join();
        }
    }

    void AppUI::setStatus(const std::string& msg) {
        std::lock_guard<std::mutex> lock(statusMutex);
        statusMessage = msg;
    }

    std::string AppUI::getStatus() {
        std::lock_guard<std::mutex> lock(statusMutex);
        return statusMessage;
    }

    void AppUI::startSolve() {
        if (isSolving.load()) return;
        LevelParseResult lr = LevelIO::parse(levelText);
        if (!lr.ok) {
            setStatus(std::string(errorName(lr.error)) + ": " + lr.message);
            return;
        }
        if (solveThread.joinable()) solveThread.join();

        isSolving.store(true);
        progressBoards.store(0);
        setStatus("Solving...");

        SolverOptions so;
        so.maxStates = static_cast<size_t>(std::max(0, maxStatesInput));
        so.progressInterval = opt.progressInterval > 0 ? std::min<long long>(opt.progressInterval, 10000) : 10000;
        so.onProgress = [this](const SearchProgress& p) {
            progressBoards.store(p.boardsExamined);
            if (!opt.quiet) std::printf("%lld playfields analysed, current queue size %zu\n", p.boardsExamined, p.frontierSize);
        };

        Board board = lr.board;
        solveThread = std::thread([this, board, so]() {
            SolveResult res = Solver(so).solve(board);
            {
                std::lock_guard<std::mutex> lock(pendingMutex);
                pendingResult = std::move(res);
                pendingStart = board;
            }
            isSolving.store(false);
        });
    }

    void AppUI::collectResult() {
        if (!isSolving.load() && solveThread.joinable()) {
            solveThread.join();
        }

        std::optional<SolveResult> res;
        std::optional<Board> board;
        {
            std::lock_guard<std::mutex> lock(pendingMutex);
            res.swap(pendingResult);
            board.swap(pendingStart);
        }
        if (!res || !board) return;

        solved = res->solved;
        examined = res->boardsExamined;
        moves = res->path;
        playbackStep = 0;
        haveResult = true;

        auto replayed = Solver::replay(*board, moves);
        if (replayed) steps = std::move(*replayed);
        else steps.assign(1, *board);

        std::printf("%lld playfields analyzed.\n", examined);
        if (solved) {
            std::printf("Solution found:\n");
            for (const auto& line : SolutionIO::describeAll(moves)) std::printf("%s\n", line.c_str());
            setStatus("Solved in " + std::to_string(moves.size()) + " moves, " + std::to_string(examined) + " playfields analyzed");
        }
        else {
            std::printf("No solution found.\n");
            setStatus(res->truncated ? "Stopped at the state limit" : "No solution found");
        }

        if (!opt.outPath.empty() && !SolutionIO::save(opt.outPath, *board, *res)) {
            setStatus("cannot write '" + opt.outPath + "'");
        }
    }

    void AppUI::step(int delta) {
        int maxStep = (int)moves.size();
        playbackStep = std::clamp(playbackStep + delta, 0, maxStep);
    }

    static bool InputIntClamped(const char* label, int* value, int minValue, int maxValue, int step = 1, int stepFast = 5) {
        if (minValue > maxValue) std::swap(minValue, maxValue);
        int before = *value;
        bool interacted = ImGui::InputInt(label, value, step, stepFast);
        if (*value < minValue) *value = minValue;
        if (*value > maxValue) *value = maxValue;

        return interacted || *value != before;
    }

    void AppUI::drawControls() {
        collectResult();

        ImGui::Begin("Level");
        bool busy = isSolving.load();

        // InputTextMultiline needs a fixed buffer; levels are tiny
        std::vector<char> buf(levelText.begin(), levelText.end());
        buf.resize(std::max<size_t>(buf.size() + 1, 512), '\0');
        if (busy) ImGui::BeginDisabled();
        if (ImGui::InputTextMultiline("##level", buf.data(), buf.size(), ImVec2(160.0f, 220.0f))) {
            levelText = buf.data();
        }
        if (ImGui::Button("Sample (level 93)")) levelText = LevelIO::sampleLevel();
        InputIntClamped("Max states (0 = off)", &maxStatesInput, 0, 100000000, 1000, 100000);
        if (ImGui::Button("Solve")) startSolve();
        if (busy) ImGui::EndDisabled();

        if (busy) ImGui::Text("%lld playfields analysed...", progressBoards.load());
        std::string status = getStatus();
        if (!status.empty()) ImGui::TextWrapped("%s", status.c_str());
        ImGui::End();
    }

    static ImU32 colorFor(Tile t) {
        static const ImU32 table[] = {
            IM_COL32(230,60,80,255),   // Heart
            IM_COL32(80,200,250,255),  // Diamond
            IM_COL32(250,210,60,255),  // Triangle
            IM_COL32(250,140,40,255),  // Ring
            IM_COL32(120,220,90,255),  // Cross1
            IM_COL32(200,120,240,255), // Sandglass
            IM_COL32(40,150,90,255),   // Cross2
            IM_COL32(170,110,60,255),  // Frame
            IM_COL32(190,220,230,255), // Glass
            IM_COL32(110,110,120,255), // Wall
            IM_COL32(35,40,60,255),    // Background
            IM_COL32(15,15,18,255),    // Empty
        };
        return table[static_cast<size_t>(t)];
    }

    void AppUI::drawViewer() {
        ImGui::Begin("Viewer");
        if (!haveResult || steps.empty()) { ImGui::Text("Press Solve to search for a solution"); ImGui::End(); return; }

        int maxStep = (int)moves.size();
        playbackStep = std::clamp(playbackStep, 0, maxStep);

        if (!solved) {
            ImGui::Text("NO SOLUTION FOUND!");
        }
        else if (playbackStep < maxStep) {
            const auto& m = moves[playbackStep];
            ImGui::Text("Step %d of %d: Move (%d,%d) to (%d,%d)", playbackStep + 1, maxStep + 1, m.fromX, m.y, m.toX, m.y);
        }
        else {
            ImGui::Text("Step %d of %d: SOLVED!", playbackStep + 1, maxStep + 1);
        }
        ImGui::Text("%lld playfields analyzed", examined);

        if (maxStep > 0) {
            bool canPrev = playbackStep > 0;
            bool canNext = playbackStep < maxStep;
            if (!canPrev) ImGui::BeginDisabled();
            if (ImGui::Button("Prev")) { step(-1); }
            if (!canPrev) ImGui::EndDisabled();
            ImGui::SameLine();
            if (!canNext) ImGui::BeginDisabled();
            if (ImGui::Button("Next")) { step(1); }
            if (!canNext) ImGui::EndDisabled();
            ImGui::SameLine();
            if (ImGui::Button("Reset")) { playbackStep = 0; }
            int stepInput = playbackStep;
            if (InputIntClamped("Step", &stepInput, 0, maxStep)) {
                playbackStep = stepInput;
            }
        }

        const Board& b = steps[std::min<size_t>(playbackStep, steps.size() - 1)];
        float cell = 16.0f * opt.zoom;
        ImDrawList* dl = ImGui::GetWindowDrawList();
        ImVec2 origin = ImGui::GetCursorScreenPos();

        for (int y = 0; y < kHeight; ++y) {
            for (int x = 0; x < kWidth; ++x) {
                Tile t = b.get(x, y);
                ImVec2 p0(origin.x + x * cell, origin.y + y * cell);
                ImVec2 p1(p0.x + cell, p0.y + cell);
                if (isMobile(t)) {
                    dl->AddRectFilled(p0, p1, colorFor(Tile::Empty));
                    dl->AddRectFilled(ImVec2(p0.x + 2, p0.y + 2), ImVec2(p1.x - 2, p1.y - 2), colorFor(t), 3.0f);
                    char mark[2] = { symbolFor(t), '\0' };
                    ImVec2 textSize = ImGui::CalcTextSize(mark);
                    dl->AddText(ImVec2(p0.x + (cell - textSize.x) * 0.5f, p0.y + (cell - textSize.y) * 0.5f), IM_COL32(20, 20, 20, 255), mark);
                }
                else {
                    dl->AddRectFilled(p0, p1, colorFor(t));
                }
            }
        }

        // current move: source and destination markers
        if (solved && playbackStep < maxStep) {
            const auto& m = moves[playbackStep];
            for (int x : { m.fromX, m.toX }) {
                ImVec2 c(origin.x + (x + 0.5f) * cell, origin.y + (m.y + 0.5f) * cell);
                dl->AddRect(ImVec2(c.x - cell / 4, c.y - cell / 4), ImVec2(c.x + cell / 4, c.y + cell / 4), IM_COL32(0, 255, 55, 255), 0.0f, 0, 2.0f);
            }
        }
        ImGui::Dummy(ImVec2(kWidth * cell, kHeight * cell));

        ImGui::End();
    }

    int AppUI::run() {
        // SDL2 init
        if (SDL_Init(SDL_INIT_VIDEO) != 0) {
            std::fprintf(stderr, "SDL_Init failed: %s\n", SDL_GetError());
            return 3;
        }
        int winW = std::max(900, kWidth * 16 * opt.zoom + 420);
        int winH = std::max(700, kHeight * 16 * opt.zoom + 160);
        SDL_Window* window = SDL_CreateWindow("Pupu64 Solver: Use Crsr-Left and Crsr-Right, Q to quit", SDL_WINDOWPOS_CENTERED, SDL_WINDOWPOS_CENTERED, winW, winH, SDL_WINDOW_SHOWN);
        if (!window) {
            std::fprintf(stderr, "Failed to create window: %s\n", SDL_GetError());
            SDL_Quit();
            return 3;
        }
        SDL_Renderer* renderer = SDL_CreateRenderer(window, -1, SDL_RENDERER_ACCELERATED | SDL_RENDERER_PRESENTVSYNC);
        if (!renderer) {
            std::fprintf(stderr, "Failed to create renderer: %s\n", SDL_GetError());
            SDL_DestroyWindow(window);
            SDL_Quit();
            return 3;
        }

        IMGUI_CHECKVERSION();
        ImGui::CreateContext();

        ImGuiIO& io = ImGui::GetIO();
        ImGui::StyleColorsDark();

        ImGui_ImplSDL2_InitForSDLRenderer(window, renderer);
        ImGui_ImplSDLRenderer2_Init(renderer);

        if (!levelText.empty()) startSolve();

        bool running = true; SDL_Event e;
        while (running) {
            while (SDL_PollEvent(&e)) {
                ImGui_ImplSDL2_ProcessEvent(&e);
                if (e.type == SDL_QUIT) running = false;
                if (e.type == SDL_KEYDOWN && !io.WantTextInput) {
                    switch (e.key.keysym.sym) {
                    case SDLK_q: running = false; break;
                    case SDLK_RIGHT: step(1); break;
                    case SDLK_LEFT: step(-1); break;
                    default: break;
                    }
                }
            }
            ImGui_ImplSDLRenderer2_NewFrame();
            ImGui_ImplSDL2_NewFrame();
            ImGui::NewFrame();

            drawControls();
            drawViewer();

            ImGui::Render();
            SDL_SetRenderDrawColor(renderer, 0, 255, 55, 255);
            SDL_RenderClear(renderer);
            ImGui_ImplSDLRenderer2_RenderDrawData(ImGui::GetDrawData(), renderer);
            SDL_RenderPresent(renderer);
        }

        ImGui_ImplSDLRenderer2_Shutdown();
        ImGui_ImplSDL2_Shutdown();
        ImGui::DestroyContext();
        SDL_DestroyRenderer(renderer);
        SDL_DestroyWindow(window);
        SDL_Quit();
        return 0;
    }

} // namespace pupu
