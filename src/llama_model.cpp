/*
 * redraft - Segmented Rewrite Pipeline
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#include "redraft/llama_model.hpp"
#include "redraft/config.hpp"
#include "redraft/logger.hpp"
#include "llama.h"
#include <algorithm>
#include <cstdio>
#include <cstdlib>
#include <regex>

namespace redraft {

namespace {

std::once_flag g_backend_once;

// Strip <think>...</think> blocks from reasoning models (DeepSeek-R1, QwQ, etc.)
std::string stripThinkBlocks(const std::string& text) {
    static const std::regex thinkRegex("<think>[\\s\\S]*?</think>\\s*");
    std::string result = std::regex_replace(text, thinkRegex, "");
    size_t start = result.find_first_not_of(" \t\n\r");
    size_t end = result.find_last_not_of(" \t\n\r");
    return (start == std::string::npos) ? "" : result.substr(start, end - start + 1);
}

// Configurable llama.cpp log filtering - keep daemon output readable
void filtered_llama_log(enum ggml_log_level level, const char* text, void* /*user_data*/) {
    // Skip progress dots and other noise
    if (!text || text[0] == '.' || text[0] == '\n' || text[0] == '\0') {
        return;
    }

    // Job threads log concurrently; the level is resolved once
    static const int filter_level = [] {
        const char* env = std::getenv("LLAMA_LOG_LEVEL");
        if (!env) return static_cast<int>(GGML_LOG_LEVEL_ERROR);
        std::string value(env);
        if (value == "info") return static_cast<int>(GGML_LOG_LEVEL_INFO);
        if (value == "warn") return static_cast<int>(GGML_LOG_LEVEL_WARN);
        if (value == "debug") return static_cast<int>(GGML_LOG_LEVEL_DEBUG);
        return static_cast<int>(GGML_LOG_LEVEL_ERROR);
    }();

    if (level >= filter_level) {
        fprintf(stderr, "%s", text);
    }
}

// Fallback for base models without a chat template
std::string plainTranscript(const std::vector<ChatMessage>& messages) {
    std::string out;
    for (const auto& message : messages) {
        out += message.role + ": " + message.content + "\n\n";
    }
    out += "assistant: ";
    return out;
}

}

LlamaModel::LlamaModel(const std::filesystem::path& modelsDir)
    : modelsDir_(modelsDir) {
    std::call_once(g_backend_once, [] {
        llama_log_set(filtered_llama_log, nullptr);
        ggml_backend_load_all();
    });
    LOG_DEBUG("LlamaModel created, models directory: " + modelsDir_.string());
}

std::filesystem::path LlamaModel::resolvePath(const std::string& model) const {
    std::filesystem::path path(model);
    if (path.is_absolute() || modelsDir_.empty()) {
        return path;
    }
    return modelsDir_ / path;
}

bool LlamaModel::preload(const std::string& model) {
    std::string error;
    if (!acquireModel(model, error)) {
        LOG_ERROR(error);
        return false;
    }
    return true;
}

std::shared_ptr<llama_model> LlamaModel::acquireModel(const std::string& model, std::string& error) {
    if (model.empty()) {
        error = "No model configured";
        return nullptr;
    }
    const std::string path = resolvePath(model).string();

    // Loading is serialized; the loaded model is shared by all callers
    std::lock_guard<std::mutex> lock(modelsMutex_);
    auto it = models_.find(path);
    if (it != models_.end()) {
        return it->second;
    }

    if (!std::filesystem::exists(path)) {
        error = "Model file not found: " + path;
        return nullptr;
    }

    LOG_INFO("Loading model: " + path);
    llama_model_params model_params = llama_model_default_params();

    #if defined(__APPLE__)
        model_params.n_gpu_layers = env::getInt("REDRAFT_GPU_LAYERS", 99);
    #else
        model_params.n_gpu_layers = env::getInt("REDRAFT_GPU_LAYERS", 0);
    #endif

    llama_model* raw = llama_model_load_from_file(path.c_str(), model_params);
    if (!raw) {
        error = "Failed to load model: " + path;
        return nullptr;
    }

    auto loaded = std::shared_ptr<llama_model>(raw, llama_model_free);
    models_[path] = loaded;
    LOG_INFO("Model loaded successfully: " + path);
    return loaded;
}

LlamaModel::SamplingConfig LlamaModel::buildSamplingConfig(const llama_model* model, const ChatRequest& request) const {
    SamplingConfig config;
    const int n_ctx_train = llama_model_n_ctx_train(model);

    config.temp = request.temperature;
    config.top_k = env::getInt("REDRAFT_TOP_K", 40);
    config.top_p = env::getFloat("REDRAFT_TOP_P", 0.9f);
    config.min_p = env::getFloat("REDRAFT_MIN_P", 0.05f);
    config.repeat_penalty = env::getFloat("REDRAFT_REPEAT_PENALTY", 1.1f);
    config.repeat_last_n = env::getInt("REDRAFT_REPEAT_LAST_N", 64);
    config.seed = static_cast<uint32_t>(env::getInt("REDRAFT_SEED", 0));

    config.max_ctx = std::min(n_ctx_train, env::getInt("REDRAFT_MAX_CTX", 8192));
    config.n_predict = request.maxTokens ? *request.maxTokens : env::getInt("REDRAFT_PREDICT", 2048);

    LOG_DEBUG("Model context: " + std::to_string(n_ctx_train) +
              ", using max_ctx=" + std::to_string(config.max_ctx) +
              ", n_predict=" + std::to_string(config.n_predict));
    return config;
}

void LlamaModel::buildContextParams(int n_prompt, const SamplingConfig& config, llama_context_params& params) const {
    params = llama_context_default_params();
    params.n_ctx = std::min(n_prompt + config.n_predict + 64, config.max_ctx);
    params.n_batch = std::max(params.n_ctx, static_cast<uint32_t>(env::getInt("REDRAFT_BATCH", 2048)));
    params.no_perf = true;
}

llama_sampler* LlamaModel::buildSampler(const SamplingConfig& config) const {
    auto sparams = llama_sampler_chain_default_params();
    sparams.no_perf = true;
    llama_sampler* smpl = llama_sampler_chain_init(sparams);

    llama_sampler_chain_add(smpl, llama_sampler_init_penalties(
        config.repeat_last_n,
        config.repeat_penalty,
        0.0f,
        0.0f
    ));

    llama_sampler_chain_add(smpl, llama_sampler_init_top_k(config.top_k));
    llama_sampler_chain_add(smpl, llama_sampler_init_top_p(config.top_p, 1));
    llama_sampler_chain_add(smpl, llama_sampler_init_min_p(config.min_p, 1));
    llama_sampler_chain_add(smpl, llama_sampler_init_temp(config.temp));
    llama_sampler_chain_add(smpl, llama_sampler_init_dist(config.seed));

    return smpl;
}

std::string LlamaModel::formatPrompt(const llama_model* model, const std::vector<ChatMessage>& messages) const {
    // Apply chat template if model has one (instruct models)
    const char* tmpl = llama_model_chat_template(model, nullptr);
    if (!tmpl) {
        return plainTranscript(messages);
    }

    std::vector<llama_chat_message> chat;
    chat.reserve(messages.size());
    for (const auto& message : messages) {
        chat.push_back({message.role.c_str(), message.content.c_str()});
    }

    int len = llama_chat_apply_template(tmpl, chat.data(), chat.size(), true, nullptr, 0);
    if (len < 0) {
        LOG_WARN("Chat template not supported, using plain transcript");
        return plainTranscript(messages);
    }

    std::vector<char> buf(len + 1);
    int res = llama_chat_apply_template(tmpl, chat.data(), chat.size(), true, buf.data(), buf.size());
    return (res > 0) ? std::string(buf.data(), res) : plainTranscript(messages);
}

RunResult LlamaModel::complete(const ChatRequest& request) noexcept {
    try {
        std::string error;
        std::shared_ptr<llama_model> model = acquireModel(request.model.model, error);
        if (!model) {
            LOG_ERROR(error);
            return RunResult::failed(FailureKind::Transport, error);
        }

        SamplingConfig config = buildSamplingConfig(model.get(), request);
        std::string prompt = formatPrompt(model.get(), request.messages);
        return generate(model.get(), prompt, config);
    } catch (const std::exception& e) {
        LOG_ERROR("Inference error: " + std::string(e.what()));
        return RunResult::failed(FailureKind::Transport, "Inference error: " + std::string(e.what()));
    }
}

RunResult LlamaModel::generate(llama_model* model, const std::string& prompt, SamplingConfig config) {
    const llama_vocab* vocab = llama_model_get_vocab(model);
    const int n_prompt = -llama_tokenize(vocab, prompt.c_str(), prompt.size(), NULL, 0, true, true);
    if (n_prompt <= 0) {
        return RunResult::failed(FailureKind::Status, "Failed to tokenize input");
    }

    int max_predict = config.max_ctx - n_prompt - 64;
    if (max_predict <= 0) {
        return RunResult::failed(FailureKind::Status,
            "Prompt of " + std::to_string(n_prompt) + " tokens does not fit the context window");
    }
    if (config.n_predict > max_predict) {
        config.n_predict = max_predict;
    }

    std::vector<llama_token> prompt_tokens(n_prompt);
    if (llama_tokenize(vocab, prompt.c_str(), prompt.size(), prompt_tokens.data(), prompt_tokens.size(), true, true) < 0) {
        return RunResult::failed(FailureKind::Status, "Failed to tokenize the prompt");
    }

    llama_context_params ctx_params;
    buildContextParams(n_prompt, config, ctx_params);
    std::unique_ptr<llama_context, decltype(&llama_free)> context(
        llama_init_from_model(model, ctx_params), llama_free);
    if (!context) {
        return RunResult::failed(FailureKind::Transport, "Failed to create context");
    }
    std::unique_ptr<llama_sampler, decltype(&llama_sampler_free)> smpl(buildSampler(config), llama_sampler_free);

    LOG_DEBUG("Context: " + std::to_string(ctx_params.n_ctx) + " tokens, prompt: " + std::to_string(n_prompt));

    llama_batch batch = llama_batch_get_one(prompt_tokens.data(), prompt_tokens.size());

    llama_token decoder_start_token_id = 0;
    if (llama_model_has_encoder(model)) {
        if (llama_encode(context.get(), batch)) {
            return RunResult::failed(FailureKind::Status, "Failed to encode");
        }
        decoder_start_token_id = llama_model_decoder_start_token(model);
        if (decoder_start_token_id == LLAMA_TOKEN_NULL) {
            decoder_start_token_id = llama_vocab_bos(vocab);
        }
        batch = llama_batch_get_one(&decoder_start_token_id, 1);
    }

    std::string output;
    llama_token new_token_id;
    int n_pos = 0;

    for (; n_pos + batch.n_tokens < n_prompt + config.n_predict; ) {
        if (llama_decode(context.get(), batch)) {
            return RunResult::failed(FailureKind::Status, "Failed to decode");
        }
        n_pos += batch.n_tokens;

        new_token_id = llama_sampler_sample(smpl.get(), context.get(), -1);
        llama_sampler_accept(smpl.get(), new_token_id);

        if (llama_vocab_is_eog(vocab, new_token_id)) {
            break;
        }

        char buf[128];
        int n = llama_token_to_piece(vocab, new_token_id, buf, sizeof(buf), 0, true);
        if (n < 0) {
            return RunResult::failed(FailureKind::Status, "Failed to convert token to piece");
        }
        output.append(buf, n);

        batch = llama_batch_get_one(&new_token_id, 1);
    }

    LOG_DEBUG("Generated " + std::to_string(output.size()) + " bytes");
    output = stripThinkBlocks(output);
    if (output.empty()) {
        return RunResult::failed(FailureKind::MissingContent, "Model returned no content");
    }
    return RunResult::success(std::move(output));
}

}
