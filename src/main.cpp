#include "ShortenerApp.hpp"
#include <iostream>
#include <csignal>
#include <cstdlib>

namespace {

// SIGINT/SIGTERM останавливают HTTP сервер, незавершённые редиректы дорабатывают
shortener::ShortenerApp* runningApp = nullptr;

void onShutdownSignal(int signal) {
    std::cout << "\n[main] Signal " << signal << ": stopping url-shortener" << std::endl;
    if (runningApp) {
        runningApp->stop();
    }
}

void printBanner() {
    const char* storage = std::getenv("SHORTENER_STORAGE");
    std::cout << "========================================" << std::endl;
    std::cout << "  URL Shortener v1.0.0" << std::endl;
    std::cout << "  storage: " << (storage ? storage : "postgres") << std::endl;
    std::cout << "  POST/GET /api/v1/links, GET /{code}" << std::endl;
    std::cout << "========================================" << std::endl;
}

} // namespace

int main(int argc, char* argv[]) {
    printBanner();

    try {
        shortener::ShortenerApp app;
        runningApp = &app;

        std::signal(SIGINT, onShutdownSignal);
        std::signal(SIGTERM, onShutdownSignal);

        // Настройки, выбор хранилища и маршруты - в ShortenerApp::configureInjection
        app.run(argc, argv);

        runningApp = nullptr;
        std::cout << "[main] url-shortener stopped" << std::endl;
        return 0;

    } catch (const std::invalid_argument& e) {
        // Неверная конфигурация SHORTENER_*
        std::cerr << "[main] Configuration error: " << e.what() << std::endl;
        return 2;
    } catch (const std::exception& e) {
        std::cerr << "[main] Fatal error: " << e.what() << std::endl;
        return 1;
    }
}
