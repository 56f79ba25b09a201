/*
 * redraft - Segmented Rewrite Pipeline
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#include "redraft/config.hpp"
#include "redraft/llama_model.hpp"
#include "redraft/logger.hpp"
#include "redraft/server.hpp"
#include <cerrno>
#include <chrono>
#include <csignal>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <optional>
#include <set>
#include <string>
#include <thread>
#include <unistd.h>

using namespace redraft;

constexpr const char* VERSION = "0.1.0";

// Async-signal-safe: only set flag, no complex operations
static volatile sig_atomic_t g_shutdown_requested = 0;

void signalHandler(int signal) {
    (void)signal;
    g_shutdown_requested = 1;
}

void printUsage(const char* progName) {
    std::cout << "redraft daemon v" << VERSION << "\n\n";
    std::cout << "Usage: " << progName << " <workspace> [options]\n";
    std::cout << "       " << progName << " --help | --version\n\n";
    std::cout << "Options:\n";
    std::cout << "  --models-dir <dir>   Directory holding GGUF models\n";
    std::cout << "  -c, --concurrency <n> Maximum simultaneous jobs\n";
    std::cout << "  --follow             Print job events as they happen\n";
    std::cout << "  --no-preload         Load models on first use\n";
    std::cout << "  -h, --help           Show this help message\n";
    std::cout << "  -v, --version        Show version\n\n";
    std::cout << "Environment Variables:\n";
    std::cout << "  REDRAFT_MODELS_DIR                Models directory\n";
    std::cout << "  REDRAFT_MAX_CONCURRENT            Concurrency limit (default 5)\n";
    std::cout << "  REDRAFT_POLISH_MODEL              Model for the polish stage\n";
    std::cout << "  REDRAFT_ENHANCE_MODEL             Model for the enhance stage\n";
    std::cout << "  REDRAFT_EMOTION_MODEL             Model for the emotion_polish stage\n";
    std::cout << "  REDRAFT_COMPRESSION_MODEL         Model for history compression\n";
    std::cout << "  REDRAFT_SEGMENT_MAX_SIZE          Segment budget in measured characters\n";
    std::cout << "  REDRAFT_HISTORY_THRESHOLD         History size that triggers compression\n";
    std::cout << "  REDRAFT_SCAN_INTERVAL_MS          Inbox scan interval (default 1000)\n";
    std::cout << "  REDRAFT_LOG_LEVEL                 Log level (ERROR, WARN, INFO, DEBUG, TRACE)\n\n";
    std::cout << "Submit with rdsub, inspect and control with rdctl.\n";
}

std::optional<pid_t> readPidFile(const std::filesystem::path& path) {
    std::ifstream file(path);
    if (!file) {
        return std::nullopt;
    }
    long pid = 0;
    file >> pid;
    if (pid <= 0) {
        return std::nullopt;
    }
    return static_cast<pid_t>(pid);
}

bool isProcessAlive(pid_t pid) {
    if (pid <= 0) {
        return false;
    }
    if (::kill(pid, 0) == 0) {
        return true;
    }
    return errno == EPERM;
}

std::filesystem::path resolveModelsDir(const char* argv0) {
    if (const char* env = std::getenv("REDRAFT_MODELS_DIR")) {
        return std::filesystem::path(env);
    }

    std::filesystem::path exePath(argv0 ? argv0 : "");
    if (!exePath.empty()) {
        std::error_code ec;
        exePath = std::filesystem::absolute(exePath, ec);
        if (!ec && std::filesystem::exists(exePath)) {
            auto base = exePath.parent_path();
            if (std::filesystem::exists(base / "models")) {
                return base / "models";
            }
            if (std::filesystem::exists(base.parent_path() / "models")) {
                return base.parent_path() / "models";
            }
        }
    }

    return std::filesystem::current_path() / "models";
}

int main(int argc, char* argv[]) {
    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg == "-h" || arg == "--help") {
            printUsage(argv[0]);
            return 0;
        }
        if (arg == "-v" || arg == "--version") {
            std::cout << VERSION << "\n";
            return 0;
        }
    }

    if (argc < 2) {
        printUsage(argv[0]);
        return 1;
    }

    Logger::initFromEnv();

    std::filesystem::path workspace = argv[1];
    std::filesystem::path modelsDir = resolveModelsDir(argv[0]);
    Settings settings = Settings::fromEnv();
    bool follow = false;
    bool preload = true;

    for (int i = 2; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg == "--models-dir" && i + 1 < argc) {
            modelsDir = argv[++i];
        } else if ((arg == "-c" || arg == "--concurrency") && i + 1 < argc) {
            try {
                settings.maxConcurrent = std::stoi(argv[++i]);
            } catch (const std::exception&) {
                std::cerr << "Error: Invalid concurrency limit\n";
                return 1;
            }
            if (settings.maxConcurrent < 1) {
                std::cerr << "Error: Concurrency limit must be at least 1\n";
                return 1;
            }
        } else if (arg == "--follow") {
            follow = true;
        } else if (arg == "--no-preload") {
            preload = false;
        } else {
            std::cerr << "Error: Unknown option: " << arg << "\n";
            return 1;
        }
    }

    std::filesystem::path pidPath = workspace / ".redraftd.pid";
    if (auto pid = readPidFile(pidPath); pid && isProcessAlive(*pid) && *pid != getpid()) {
        std::cerr << "Error: Daemon already running on " << workspace.string() << " (pid " << *pid << ")\n";
        return 1;
    }

    std::signal(SIGINT, signalHandler);
    std::signal(SIGTERM, signalHandler);

    try {
        LlamaModel model(modelsDir);

        if (preload) {
            std::set<std::string> names{settings.polish.model, settings.enhance.model,
                                        settings.emotion.model, settings.compression.model};
            for (const auto& name : names) {
                std::cout << "  Loading " << name << "\n" << std::flush;
                if (!model.preload(name)) {
                    // Jobs using this model fail per segment and can be retried
                    LOG_WARN("Model not available yet: " + name);
                }
            }
        }

        Server server(workspace, model, settings);
        server.setFollow(follow);
        server.setScanInterval(std::chrono::milliseconds(env::getInt("REDRAFT_SCAN_INTERVAL_MS", 1000)));

        if (!server.start()) {
            std::cout << "  \033[31mFailed to start\033[0m\n";
            return 1;
        }

        {
            std::ofstream pf(pidPath);
            if (pf) {
                pf << getpid();
            }
        }

        std::cout << "\n";
        std::cout << "  \033[1mRUNNING\033[0m\n\n";
        std::cout << "    Workspace    " << workspace.string() << "\n";
        std::cout << "    Models       " << modelsDir.string() << "\n";
        std::cout << "    Concurrency  " << settings.maxConcurrent << "\n";
        std::cout << "\n";
        std::cout << "  Submit:  rdsub " << workspace.string() << " <file>\n";
        std::cout << "  Status:  rdctl " << workspace.string() << " status <job-id>\n\n" << std::flush;

        while (!g_shutdown_requested && server.isRunning()) {
            std::this_thread::sleep_for(std::chrono::milliseconds(100));
        }

        if (g_shutdown_requested) {
            std::cout << "\nShutdown requested, stopping server..." << std::endl;
        }
        {
            std::error_code ec;
            std::filesystem::remove(pidPath, ec);
        }
        server.shutdown();

    } catch (const std::exception& e) {
        LOG_ERROR("Server error: " + std::string(e.what()));
        return 1;
    }

    LOG_DEBUG("redraft daemon stopped");
    return 0;
}
