/**
 * wifishare - Entry Point
 *
 * Takes the base directory from the command line, loads the optional config,
 * starts the relay node on an ephemeral port and hands the terminal to the
 * console shell until the user quits.
 */

#include <cstdlib>
#include <filesystem>
#include <iostream>
#include <string>
#include <system_error>
#include <thread>
#include <vector>

#include <asio.hpp>
#include <spdlog/spdlog.h>

#include "config/config.h"
#include "node/node.h"
#include "ui/console_shell.h"

namespace fs = std::filesystem;

static RelayConfig load_config_or_exit(const std::string& path) {
    try {
        return load_config(path);
    } catch (const ConfigError& e) {
        spdlog::error("{}", e.what());
        std::exit(1);
    }
}

int main(int argc, char* argv[]) {
    spdlog::set_level(spdlog::level::info);
    spdlog::info("WiFiShare server starting...");

    if (argc < 2) {
        spdlog::error("No base directory given. Exiting.");
        std::cerr << "usage: wifishare <base-directory> [config.json]\n";
        return 1;
    }

    RelayConfig config = (argc > 2) ? load_config_or_exit(argv[2]) : RelayConfig{};
    spdlog::set_level(spdlog::level::from_str(config.log_level));
    if (argc > 2) {
        spdlog::info("Loaded config from {}", argv[2]);
    }

    std::error_code ec;
    const fs::path base_dir = fs::absolute(argv[1], ec);
    if (!ec) {
        fs::create_directories(base_dir, ec);
    }
    if (ec || !fs::is_directory(base_dir)) {
        spdlog::error("Unusable base directory {}: {}", argv[1],
                      ec ? ec.message() : "not a directory");
        return 1;
    }

    asio::io_context io;
    auto work = asio::make_work_guard(io);

    Node node(io, base_dir, config);
    try {
        node.start();
    } catch (const std::system_error& e) {
        spdlog::error("Cannot start server: {}", e.what());
        return 1;
    }

    std::vector<std::thread> workers;
    workers.reserve(config.worker_threads);
    for (unsigned i = 0; i < config.worker_threads; ++i) {
        workers.emplace_back([&io] { io.run(); });
    }

    ConsoleShell shell(node, std::cin, std::cout);
    shell.run();

    node.stop();
    work.reset();
    io.stop();
    for (auto& t : workers) {
        t.join();
    }
    return 0;
}
