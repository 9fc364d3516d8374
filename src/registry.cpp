#include "tokenrank/registry.hpp"

#include <map>
#include <mutex>
#include <utility>

#include "tokenrank/errors.hpp"
#include "tokenrank/vocab_loader.hpp"

namespace tokenrank {

namespace {

const char* const kBlobBase = "https://openaipublic.blob.core.windows.net/";

const char* const kGpt2Pattern =
    R"('s|'t|'re|'ve|'m|'ll|'d| ?\p{L}+| ?\p{N}+| ?[^\s\p{L}\p{N}]+|\s+(?!\S)|\s+)";

const char* const kCl100kPattern =
    R"((?i:'s|'t|'re|'ve|'m|'ll|'d)|[^\r\n\p{L}\p{N}]?\p{L}+|\p{N}{1,3}| ?[^\s\p{L}\p{N}]+[\r\n]*|\s*[\r\n]+|\s+(?!\S)|\s+)";

const char* const kEndOfText = "<|endoftext|>";
const char* const kFimPrefix = "<|fim_prefix|>";
const char* const kFimMiddle = "<|fim_middle|>";
const char* const kFimSuffix = "<|fim_suffix|>";
const char* const kEndOfPrompt = "<|endofprompt|>";

EncoderMap load_tiktoken_ranks(const std::string& name, const Config& cfg) {
    EncoderMap ranks;
    std::string err;
    std::string blob = std::string(kBlobBase) + "encodings/" + name + ".tiktoken";
    if (!load_tiktoken_bpe_file(blob, cfg.vocab_cache_dir, ranks, err, cfg.http_timeout_sec)) {
        throw Error("failed to load " + name + " ranks: " + err);
    }
    return ranks;
}

EncodingSpec gpt2(const Config& cfg) {
    EncodingSpec spec;
    spec.name = "gpt2";
    spec.pattern = kGpt2Pattern;
    std::string err;
    std::string base = std::string(kBlobBase) + "gpt-2/encodings/main/";
    if (!load_data_gym_files(base + "vocab.bpe", base + "encoder.json", cfg.vocab_cache_dir, spec.mergeable_ranks,
                             err, cfg.http_timeout_sec)) {
        throw Error("failed to load gpt2 ranks: " + err);
    }
    spec.special_tokens.emplace(kEndOfText, 50256);
    spec.explicit_n_vocab = 50257;
    return spec;
}

EncodingSpec r50k_base(const Config& cfg) {
    EncodingSpec spec;
    spec.name = "r50k_base";
    spec.pattern = kGpt2Pattern;
    spec.mergeable_ranks = load_tiktoken_ranks("r50k_base", cfg);
    spec.special_tokens.emplace(kEndOfText, 50256);
    spec.explicit_n_vocab = 50257;
    return spec;
}

EncodingSpec p50k_base(const Config& cfg) {
    EncodingSpec spec;
    spec.name = "p50k_base";
    spec.pattern = kGpt2Pattern;
    spec.mergeable_ranks = load_tiktoken_ranks("p50k_base", cfg);
    spec.special_tokens.emplace(kEndOfText, 50256);
    spec.explicit_n_vocab = 50281;
    return spec;
}

EncodingSpec p50k_edit(const Config& cfg) {
    EncodingSpec spec;
    spec.name = "p50k_edit";
    spec.pattern = kGpt2Pattern;
    spec.mergeable_ranks = load_tiktoken_ranks("p50k_base", cfg);
    spec.special_tokens.emplace(kEndOfText, 50256);
    spec.special_tokens.emplace(kFimPrefix, 50281);
    spec.special_tokens.emplace(kFimMiddle, 50282);
    spec.special_tokens.emplace(kFimSuffix, 50283);
    return spec;
}

EncodingSpec cl100k_base(const Config& cfg) {
    EncodingSpec spec;
    spec.name = "cl100k_base";
    spec.pattern = kCl100kPattern;
    spec.mergeable_ranks = load_tiktoken_ranks("cl100k_base", cfg);
    spec.special_tokens.emplace(kEndOfText, 100257);
    spec.special_tokens.emplace(kFimPrefix, 100258);
    spec.special_tokens.emplace(kFimMiddle, 100259);
    spec.special_tokens.emplace(kFimSuffix, 100260);
    spec.special_tokens.emplace(kEndOfPrompt, 100276);
    return spec;
}

struct Slot {
    EncodingConstructor ctor;
    std::once_flag once;
    std::shared_ptr<const Encoding> encoding;
};

class Registry {
public:
    static Registry& instance() {
        static Registry registry;
        return registry;
    }

    bool add(const std::string& name, EncodingConstructor ctor) {
        if (name.empty() || !ctor) {
            return false;
        }
        std::lock_guard<std::mutex> lock(mu_);
        auto slot = std::make_unique<Slot>();
        slot->ctor = std::move(ctor);
        return slots_.emplace(name, std::move(slot)).second;
    }

    std::vector<std::string> names() const {
        std::lock_guard<std::mutex> lock(mu_);
        std::vector<std::string> out;
        out.reserve(slots_.size());
        for (const auto& kv : slots_) {
            out.push_back(kv.first);
        }
        return out;
    }

    std::shared_ptr<const Encoding> get(const std::string& name) {
        Slot* slot = nullptr;
        {
            std::lock_guard<std::mutex> lock(mu_);
            auto it = slots_.find(name);
            if (it == slots_.end()) {
                throw ConfigError("unknown encoding: " + name);
            }
            slot = it->second.get();
        }
        // A constructor that throws leaves the flag unset; the next caller retries.
        std::call_once(slot->once, [slot]() {
            Config cfg = Config::from_environment();
            slot->encoding = std::make_shared<Encoding>(slot->ctor(cfg), cfg);
        });
        return slot->encoding;
    }

private:
    Registry() {
        add("gpt2", gpt2);
        add("r50k_base", r50k_base);
        add("p50k_base", p50k_base);
        add("p50k_edit", p50k_edit);
        add("cl100k_base", cl100k_base);
    }

    mutable std::mutex mu_;
    std::map<std::string, std::unique_ptr<Slot>> slots_;
};

const std::map<std::string, std::string>& model_to_encoding() {
    static const std::map<std::string, std::string> table = {
        // chat
        {"gpt-4", "cl100k_base"},
        {"gpt-3.5-turbo", "cl100k_base"},
        // text
        {"text-davinci-003", "p50k_base"},
        {"text-davinci-002", "p50k_base"},
        {"text-davinci-001", "r50k_base"},
        {"text-curie-001", "r50k_base"},
        {"text-babbage-001", "r50k_base"},
        {"text-ada-001", "r50k_base"},
        {"davinci", "r50k_base"},
        {"curie", "r50k_base"},
        {"babbage", "r50k_base"},
        {"ada", "r50k_base"},
        // code
        {"code-davinci-002", "p50k_base"},
        {"code-davinci-001", "p50k_base"},
        {"code-cushman-002", "p50k_base"},
        {"code-cushman-001", "p50k_base"},
        {"davinci-codex", "p50k_base"},
        {"cushman-codex", "p50k_base"},
        // edit
        {"text-davinci-edit-001", "p50k_edit"},
        {"code-davinci-edit-001", "p50k_edit"},
        // embeddings
        {"text-embedding-ada-002", "cl100k_base"},
        // old embeddings
        {"text-similarity-davinci-001", "r50k_base"},
        {"text-similarity-curie-001", "r50k_base"},
        {"text-similarity-babbage-001", "r50k_base"},
        {"text-similarity-ada-001", "r50k_base"},
        {"text-search-davinci-doc-001", "r50k_base"},
        {"text-search-curie-doc-001", "r50k_base"},
        {"text-search-babbage-doc-001", "r50k_base"},
        {"text-search-ada-doc-001", "r50k_base"},
        {"code-search-babbage-code-001", "r50k_base"},
        {"code-search-ada-code-001", "r50k_base"},
        // open source
        {"gpt2", "gpt2"},
    };
    return table;
}

const std::vector<std::pair<std::string, std::string>>& model_prefix_to_encoding() {
    static const std::vector<std::pair<std::string, std::string>> table = {
        {"gpt-4-", "cl100k_base"},
        {"gpt-3.5-turbo-", "cl100k_base"},
    };
    return table;
}

} // namespace

std::vector<std::string> list_encoding_names() { return Registry::instance().names(); }

bool register_encoding(const std::string& name, EncodingConstructor ctor) {
    return Registry::instance().add(name, std::move(ctor));
}

std::shared_ptr<const Encoding> get_encoding(const std::string& name) { return Registry::instance().get(name); }

std::string encoding_name_for_model(const std::string& model) {
    const auto& exact = model_to_encoding();
    auto it = exact.find(model);
    if (it != exact.end()) {
        return it->second;
    }
    for (const auto& [prefix, name] : model_prefix_to_encoding()) {
        if (model.rfind(prefix, 0) == 0) {
            return name;
        }
    }
    throw ConfigError("could not automatically map " + model +
                      " to a tokeniser. Please use get_encoding to explicitly get the tokeniser you expect.");
}

std::shared_ptr<const Encoding> encoding_for_model(const std::string& model) {
    return get_encoding(encoding_name_for_model(model));
}

} // namespace tokenrank
