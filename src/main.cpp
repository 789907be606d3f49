#include "resmon/console.hpp"
#include "resmon/resource_monitor.hpp"
#include <csignal>
#include <iostream>
#include <memory>
#include <signal.h>

static volatile std::sig_atomic_t g_interrupted = 0;

// No SA_RESTART: SIGINT interrupts the blocking menu read so main can shut down.
// A signal that lands while rendering is caught by the console's flag check.
static void signal_handler(int) {
    g_interrupted = 1;
}

static void install_signal_handlers() {
    struct sigaction action {};
    action.sa_handler = signal_handler;
    sigemptyset(&action.sa_mask);
    action.sa_flags = 0;
    sigaction(SIGINT, &action, nullptr);
    sigaction(SIGTERM, &action, nullptr);
}

void print_usage(const char* program_name) {
    std::cout << "Usage: " << program_name << " [config_file]\n";
    std::cout << "\n";
    std::cout << "Options:\n";
    std::cout << "  config_file    Path to YAML configuration file (default: config/resmon.yaml)\n";
    std::cout << "  -h, --help     Show this help message\n";
    std::cout << "\n";
    std::cout << "Examples:\n";
    std::cout << "  " << program_name << "\n";
    std::cout << "  " << program_name << " config/resmon.yaml\n";
    std::cout << "\n";
}

int main(int argc, char* argv[]) {
    // Parse command-line arguments
    std::string config_path = "config/resmon.yaml";

    if (argc > 1) {
        std::string arg = argv[1];
        if (arg == "-h" || arg == "--help") {
            print_usage(argv[0]);
            return 0;
        }
        config_path = arg;
    }

    install_signal_handlers();

    auto monitor = std::make_unique<resmon::ResourceMonitor>(config_path);
    if (!monitor->initialize()) {
        std::cerr << "Failed to initialize resource monitor\n";
        return 1;
    }

    resmon::Console console(*monitor, std::cin, std::cout);
    console.set_interrupt_flag(&g_interrupted);
    monitor->set_notifier([&console](const resmon::TriggerEvent& event) { console.notify(event); });
    monitor->start_monitoring();

    console.run();

    std::cout << "\nStopping monitor...\n";
    monitor->stop();
    monitor->set_notifier(nullptr);

    std::cout << "resmon stopped.\n";
    return 0;
}
