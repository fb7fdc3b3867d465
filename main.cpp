#include <cstdlib>
#include <exception>
#include <iostream>
#include <optional>
#include <string>

#include "calculator.hpp"

#ifdef MEMOCALC_USE_READLINE
#include <readline/history.h>
#include <readline/readline.h>
#endif

namespace memocalc {

std::optional<std::string> readInput(const std::string& prompt) {
#ifdef MEMOCALC_USE_READLINE
    char* line = ::readline(prompt.c_str());
    if (!line) {
        return std::nullopt;
    }
    std::string text(line);
    free(line);
    if (!text.empty()) {
        add_history(text.c_str());
    }
    return text;
#else
    std::cout << prompt << std::flush;
    std::string text;
    if (!std::getline(std::cin, text)) {
        return std::nullopt;
    }
    return text;
#endif
}

void repl() {
    Calculator calculator;
    std::cout << "memocalc (type 'help' for usage, 'exit' to leave)\n";
    while (true) {
        auto maybeLine = readInput("memocalc> ");
        if (!maybeLine.has_value()) {
            break;
        }
        ExecResult result = calculator.execute(*maybeLine);
        if (result.exit) {
            break;
        }
        if (!result.output.empty()) {
            std::cout << result.output << '\n';
        }
    }
    std::cout << "Goodbye.\n";
}

} // namespace memocalc

int main() {
    std::ios::sync_with_stdio(false);
    std::cin.tie(nullptr);
    try {
        memocalc::repl();
    } catch (const std::exception& ex) {
        std::cerr << "Internal error: " << ex.what() << '\n';
        return EXIT_FAILURE;
    }
    return 0;
}
