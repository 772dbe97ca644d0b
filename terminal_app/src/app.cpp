#include "GameSession.h"
#include "SudokuGenerator.h"
#include "SudokuSolver.h"
#include "app_config.h"
#include "board_view.h"
#include "log.h"
#include "terminal.h"

#include <cstdio>
#include <memory>
#include <sstream>
#include <stdexcept>

#include <fmt/format.h>
#include <ncurses.h>

namespace {

class SudokuTerminalApp
{
    Terminal& terminal;
    GameSession& session;
    BoardView view;
    int stepDelayMs;
    std::string status;

    StepCallback animation()
    {
        bool fastForward = false;
        return [this, fastForward](const SolveStep& step, const SudokuGrid& grid) mutable {
            if (fastForward) {
                return true;
            }
            view.renderSearch(session, grid, step);

            const int key = terminal.readKey(stepDelayMs);
            if (key == 'q') {
                return false;
            }
            if (key != ERR && key != KEY_RESIZE) {
                fastForward = true;
            }
            return true;
        };
    }

    /**
     * Returns false if the game should end.
     */
    bool runCommand()
    {
        const auto line = terminal.readLine(view.commandLine(), ":", 32);
        if (line.empty()) {
            return true;
        }

        status = "Working...";
        view.render(session, status);
        const auto result = session.execute(line, animation());
        status = result.message;
        return !result.quit;
    }

    void enterDigit(cell_t value)
    {
        const auto result = session.enterDigit(value);
        status = result.ok ? "" : result.message;
    }

  public:
    SudokuTerminalApp(Terminal& terminal, GameSession& session, int stepDelayMs)
      : terminal(terminal)
      , session(session)
      , view(terminal)
      , stepDelayMs(stepDelayMs)
      , status("Press ':' for commands, q to quit.")
    {}

    void loop()
    {
        bool running = true;
        while (running) {
            view.render(session, status);

            const int key = terminal.readKey();
            switch (key) {
                case KEY_UP:
                    session.moveCursor(-1, 0);
                    break;
                case KEY_DOWN:
                    session.moveCursor(1, 0);
                    break;
                case KEY_LEFT:
                    session.moveCursor(0, -1);
                    break;
                case KEY_RIGHT:
                    session.moveCursor(0, 1);
                    break;
                case '0':
                case ' ':
                case KEY_BACKSPACE:
                case KEY_DC:
                case 127:
                case '\b':
                    enterDigit(0);
                    break;
                case ':':
                    running = runCommand();
                    break;
                case 'q':
                    running = false;
                    break;
                case KEY_RESIZE:
                case ERR:
                    break;
                default:
                    if (key >= '1' && key <= '9') {
                        enterDigit(key - '0');
                    }
            }
        }
    }
};

void
printPuzzle(SudokuGenerator& generator, Difficulty difficulty)
{
    const auto puzzle = generator.generate(difficulty);

    std::stringstream grid;
    SudokuGrid::printGrid(grid, puzzle->grid, false);
    std::stringstream solution;
    SudokuGrid::printGrid(solution, puzzle->solution, false);

    fmt::print("{} puzzle with {} clues:\n{}\nSolution:\n{}",
               difficultyName(puzzle->difficulty),
               puzzle->clueCount(),
               grid.str(),
               solution.str());
}

}

int
main(int argc, char* argv[])
{
    AppConfig config;
    try {
        config = parseAppConfig(makeOptionsParser(argc, argv));
    } catch (const std::invalid_argument& e) {
        fmt::print(stderr, "{}\n\n{}", e.what(), usageText);
        return 1;
    }

    if (config.showHelp) {
        fmt::print("{}", usageText);
        return 0;
    }

    setLogLevel(config.logLevel);
    try {
        if (!config.logFile.empty()) {
            openLogFile(config.logFile);
        } else if (config.printOnly) {
            setLogSink(stderr);
        }

        auto generator = config.seed ? std::make_unique<SudokuGenerator>(*config.seed)
                                     : std::make_unique<SudokuGenerator>();
        if (config.printOnly) {
            printPuzzle(*generator, config.difficulty);
            closeLogFile();
            return 0;
        }

        LOGI("Starting {} game", difficultyName(config.difficulty));
        GameSession session(std::move(generator), SudokuSolver::create(), config.difficulty);
        Terminal terminal;
        SudokuTerminalApp app(terminal, session, config.stepDelayMs);
        app.loop();
        LOGI("Game ended");
    } catch (const std::runtime_error& e) {
        LOGE("Fatal: {}", e.what());
        fmt::print(stderr, "Error: {}\n", e.what());
        closeLogFile();
        return 1;
    }

    closeLogFile();
    return 0;
}
