#include "app/Cli.hpp"
#include <chrono>
#include <csignal>
#include <iostream>
#include <thread>
#include <spdlog/spdlog.h>

namespace {

volatile std::sig_atomic_t gInterrupted = 0;

extern "C" void onInterrupt(int) {
    gInterrupted = 1;
}

} // namespace

int main(int argc, char* argv[]) {
    try {
        // 解析命令行
        auto optsResult = seamlod::app::parseCommandLine(argc, argv);
        if (!optsResult) {
            std::cerr << "Error: " << optsResult.error() << std::endl;
            return 1;
        }
        const auto opts = *optsResult;

        // 设置日志
        seamlod::app::setupLogging(opts);

        // Ctrl+C 请求协作式取消
        std::stop_source stopSource;
        std::signal(SIGINT, onInterrupt);
        std::jthread watcher([&stopSource](std::stop_token own) {
            while (!own.stop_requested()) {
                if (gInterrupted) {
                    spdlog::warn("Interrupt received, stopping after the current level");
                    stopSource.request_stop();
                    return;
                }
                std::this_thread::sleep_for(std::chrono::milliseconds(100));
            }
        });

        return seamlod::app::runCli(opts, stopSource.get_token());

    } catch (const std::exception& e) {
        spdlog::error("Fatal error: {}", e.what());
        return 1;
    }
}
