#include <atomic>
#include <csignal>
#include <cstdlib>
#include <iostream>
#include <thread>

#include <spdlog/spdlog.h>

#include "device_pool/configuration.hpp"
#include "device_pool/logging.hpp"
#include "device_pool/pool_runtime.hpp"
#include "device_pool/version.hpp"

namespace {
std::atomic<bool> should_terminate{false};

void handle_signal(int) {
    should_terminate.store(true);
}
}  // namespace

int main() {
    using namespace device_pool;

    std::signal(SIGINT, handle_signal);
    std::signal(SIGTERM, handle_signal);

    try {
        Configuration configuration = ConfigurationLoader::load();

        if (const char* desired_level = std::getenv("DEVICE_POOL_LOG_LEVEL"); desired_level != nullptr) {
            set_log_level(desired_level);
        }

        PoolRuntime runtime{configuration};
        get_logger()->info(R"({{"component":"pool_daemon","action":"starting","version":"{}"}})", k_version);
        runtime.initialize();
        runtime.run();

        while (!should_terminate.load()) {
            std::this_thread::sleep_for(std::chrono::seconds(1));
        }

        runtime.shutdown();
        (void)runtime.export_gateways_to(runtime.configuration().export_path);
    } catch (const std::exception& exc) {
        try {
            auto logger = get_logger();
            logger->critical(R"({{"component":"pool_daemon","fatal":{}}})", json_quote(exc.what()));
        } catch (const std::exception&) {
            std::cerr << "Fatal error before logger initialization: " << exc.what() << '\n';
        }
        return EXIT_FAILURE;
    }

    return EXIT_SUCCESS;
}
