#include "app/cli.hpp"

#include <atomic>
#include <csignal>
#include <string>
#include <vector>

static std::atomic<bool> g_stop{false};
static void on_signal(int) { g_stop.store(true); }

int main(int argc, char** argv) {
    std::signal(SIGINT, on_signal);
    std::signal(SIGTERM, on_signal);

    const std::vector<std::string> args(argv + 1, argv + argc);
    return whispercore::run_cli(args, g_stop);
}
