#include <QCoreApplication>
#include <cstdlib>
#include <iostream>
#include <unistd.h>
#include "command_line.hpp"

int main(int argc, char *argv[]) {
    QCoreApplication app(argc, argv);
    QCoreApplication::setApplicationName("todo");
    QCoreApplication::setApplicationVersion(TODO_VERSION);

    try {
        const bool color = isatty(STDOUT_FILENO) && std::getenv("NO_COLOR") == nullptr;
        CommandLine cli(std::cout, std::cerr, color);
        return static_cast<int>(cli.run(QCoreApplication::arguments()));
    } catch (const std::exception& e) {
        std::cerr << "[FATAL] " << e.what() << std::endl;
        return static_cast<int>(ExitCode::Storage);
    }
}
