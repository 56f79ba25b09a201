/*
 * redraft - Segmented Rewrite Pipeline
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#include "redraft/fsio.hpp"
#include "redraft/logger.hpp"
#include "redraft/work.hpp"
#include <filesystem>
#include <iostream>
#include <iterator>
#include <map>
#include <optional>
#include <sstream>
#include <unistd.h>
#include <vector>

using namespace redraft;

constexpr const char* VERSION = "0.1.0";

void printUsage(const char* progName) {
    std::cout << "redraft document submission tool v" << VERSION << "\n\n";
    std::cout << "Usage: " << progName << " <workspace> <text...> [options]\n";
    std::cout << "       " << progName << " <workspace> --file <path> [options]\n";
    std::cout << "       " << progName << " <workspace> -     (read document from stdin)\n";
    std::cout << "       " << progName << " --help | --version\n\n";
    std::cout << "Options:\n";
    std::cout << "  --file <path>             Read the document from a file\n";
    std::cout << "  --mode <mode>             paper_polish | paper_polish_enhance | emotion_polish\n";
    std::cout << "                            (default paper_polish_enhance)\n";
    std::cout << "  --<stage>-model <name>    Model for one stage (polish, enhance, emotion_polish)\n";
    std::cout << "  --<stage>-api-key <key>   API key for one stage\n";
    std::cout << "  --<stage>-base-url <url>  Endpoint for one stage\n";
    std::cout << "  -h, --help                Show this help message\n";
    std::cout << "  -v, --version             Show version\n\n";
    std::cout << "Examples:\n";
    std::cout << "  " << progName << " ./workspace --file draft.md --mode paper_polish\n";
    std::cout << "  " << progName << " ./workspace --file essay.txt --mode emotion_polish --emotion_polish-model warm.gguf\n";
    std::cout << "  cat draft.md | " << progName << " ./workspace -\n";
}

// "--polish-model" -> (polish, model)
bool parseOverrideFlag(const std::string& arg, Stage& stage, std::string& field) {
    static const std::map<std::string, std::string> suffixes{
        {"-model", "model"}, {"-api-key", "api_key"}, {"-base-url", "base_url"}};
    if (arg.rfind("--", 0) != 0) {
        return false;
    }
    for (const auto& [suffix, name] : suffixes) {
        if (arg.size() > suffix.size() + 2 &&
            arg.compare(arg.size() - suffix.size(), suffix.size(), suffix) == 0) {
            auto parsed = parseStage(arg.substr(2, arg.size() - 2 - suffix.size()));
            if (!parsed) {
                return false;
            }
            stage = *parsed;
            field = name;
            return true;
        }
    }
    return false;
}

int main(int argc, char* argv[]) {
    // Default to WARN for clean piping; REDRAFT_LOG_LEVEL overrides
    if (!std::getenv("REDRAFT_LOG_LEVEL"))
        Logger::setLevel(LogLevel::WARN);

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

    std::string workspace = argv[1];
    std::string mode = "paper_polish_enhance";
    std::optional<std::filesystem::path> file;
    std::map<Stage, ModelConfig> overrides;
    std::vector<std::string> words;
    bool readStdin = (argc == 2 && !isatty(fileno(stdin)));

    for (int i = 2; i < argc; ++i) {
        std::string arg = argv[i];
        Stage stage;
        std::string field;
        if (arg == "-") {
            readStdin = true;
        } else if (arg == "--mode" || arg == "--file") {
            if (i + 1 >= argc) {
                std::cerr << "Error: " << arg << " requires a value\n";
                return 1;
            }
            if (arg == "--mode") {
                mode = argv[++i];
            } else {
                file = std::filesystem::path(argv[++i]);
            }
        } else if (parseOverrideFlag(arg, stage, field)) {
            if (i + 1 >= argc) {
                std::cerr << "Error: " << arg << " requires a value\n";
                return 1;
            }
            std::string value = argv[++i];
            ModelConfig& config = overrides[stage];
            if (field == "model") config.model = value;
            else if (field == "api_key") config.apiKey = value;
            else config.baseUrl = value;
        } else if (arg.rfind("--", 0) == 0) {
            std::cerr << "Error: Unknown option: " << arg << "\n";
            return 1;
        } else {
            words.push_back(arg);
        }
    }

    std::string text;
    if (file) {
        auto content = fsio::readFile(*file);
        if (!content) {
            std::cerr << "Error: Cannot read " << file->string() << "\n";
            return 1;
        }
        text = std::move(*content);
    } else if (readStdin) {
        text.assign((std::istreambuf_iterator<char>(std::cin)),
                    std::istreambuf_iterator<char>());
    } else {
        std::ostringstream textStream;
        bool first = true;
        for (const auto& word : words) {
            if (!first) textStream << " ";
            textStream << word;
            first = false;
        }
        text = textStream.str();
    }

    if (text.empty()) {
        std::cerr << "Error: Empty document provided\n";
        return 1;
    }

    try {
        Work work(workspace, true); // Create workspace if missing

        SubmitResult result = work.submit(text, mode, overrides);
        if (result.ok) {
            // Just the job ID - clean for piping, no noise
            std::cout << result.id << std::endl;
            return 0;
        }
        std::cerr << "Error: " << result.message << std::endl;
        return 1;

    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        return 1;
    }
}
