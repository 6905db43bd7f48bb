#ifndef COMICONV_TERMINAL_HPP
#define COMICONV_TERMINAL_HPP

#include <sys/ioctl.h>
#include <unistd.h>

#define RESET  "\033[0m"
#define RED    "\033[31m"
#define GREEN  "\033[32m"
#define YELLOW "\033[33m"
#define CYAN   "\033[36m"

/**
 * @brief Width of the terminal attached to stderr, 80 if it is not a terminal.
 */
inline unsigned get_terminal_width() {
    winsize ws{};
    if (isatty(STDERR_FILENO) && ioctl(STDERR_FILENO, TIOCGWINSZ, &ws) == 0 && ws.ws_col > 0) {
        return ws.ws_col;
    }
    return 80;
}

#endif // COMICONV_TERMINAL_HPP
