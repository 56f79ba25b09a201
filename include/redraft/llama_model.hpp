/*
 * redraft - Segmented Rewrite Pipeline
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */
#pragma once
#include <cstdint>
#include <filesystem>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

#include "redraft/model.hpp"

struct llama_model;
struct llama_context_params;
struct llama_sampler;

namespace redraft {

// Local chat completion through llama.cpp. ModelConfig::model names a GGUF
// file, absolute or relative to the models directory; apiKey and baseUrl are
// not used by this backend. Loaded models are shared by all calls, each call
// runs in its own context.
class LlamaModel final : public LanguageModel {
public:
    explicit LlamaModel(const std::filesystem::path& modelsDir);
    ~LlamaModel() override = default;

    LlamaModel(const LlamaModel&) = delete;
    LlamaModel& operator=(const LlamaModel&) = delete;
    LlamaModel(LlamaModel&&) = delete;
    LlamaModel& operator=(LlamaModel&&) = delete;

    [[nodiscard]] RunResult complete(const ChatRequest& request) noexcept override;

    // Loads a model ahead of the first job so load errors surface at startup.
    [[nodiscard]] bool preload(const std::string& model);

    [[nodiscard]] std::filesystem::path resolvePath(const std::string& model) const;

private:
    struct SamplingConfig {
        int n_predict = 0;
        int max_ctx = 0;
        float temp = 0.7f;
        int top_k = 40;
        float top_p = 0.9f;
        float min_p = 0.05f;
        float repeat_penalty = 1.1f;
        int repeat_last_n = 64;
        uint32_t seed = 0;
    };

    [[nodiscard]] std::shared_ptr<llama_model> acquireModel(const std::string& model, std::string& error);
    [[nodiscard]] SamplingConfig buildSamplingConfig(const llama_model* model, const ChatRequest& request) const;
    void buildContextParams(int n_prompt, const SamplingConfig& config, llama_context_params& params) const;
    [[nodiscard]] llama_sampler* buildSampler(const SamplingConfig& config) const;
    [[nodiscard]] std::string formatPrompt(const llama_model* model, const std::vector<ChatMessage>& messages) const;
    [[nodiscard]] RunResult generate(llama_model* model, const std::string& prompt, SamplingConfig config);

    std::filesystem::path modelsDir_;
    std::mutex modelsMutex_;
    std::map<std::string, std::shared_ptr<llama_model>> models_;
};

}
