#ifndef SUDOKUTERM_TERMINAL_H
#define SUDOKUTERM_TERMINAL_H

#include <memory>
#include <string>

/**
 * RAII wrapper around the curses screen. Construction switches the terminal to cbreak, no-echo mode with keypad
 * translation, destruction restores it.
 */
class Terminal
{
    struct Impl;
    std::unique_ptr<Impl> pimpl;

  public:
    enum ColorPair
    {
        Default = 0,
        Error = 1,
        Search = 2,
    };

    /**
     * @throws std::runtime_error if the terminal cannot be initialized
     */
    Terminal();
    Terminal(const Terminal&) = delete;
    ~Terminal();
    Terminal& operator=(const Terminal&) = delete;

    [[nodiscard]] bool hasColors() const noexcept;
    [[nodiscard]] int rows() const;
    [[nodiscard]] int cols() const;

    /**
     * Waits for a key press.
     * @param timeoutMs maximum time to wait, negative to wait forever
     * @return The key code or ERR if the timeout expired
     */
    int readKey(int timeoutMs = -1);

    /**
     * Shows the prompt in the given line and reads a line of text with echo enabled.
     */
    std::string readLine(int y, const std::string& prompt, int maxLen);
};

#endif // SUDOKUTERM_TERMINAL_H
