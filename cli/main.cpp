#include "tokenrank/batch.hpp"
#include "tokenrank/config.hpp"
#include "tokenrank/corpus_reader.hpp"
#include "tokenrank/errors.hpp"
#include "tokenrank/progress.hpp"
#include "tokenrank/registry.hpp"

#include <cstdlib>
#include <iostream>
#include <sstream>
#include <string>
#include <unordered_set>
#include <vector>

using namespace tokenrank;

namespace {

struct CliArgs {
    std::string command;
    std::string encoding = "cl100k_base";
    std::string model;
    std::string allowed_special = "none";
    std::string input;
    std::string text_field;
    std::string env_file;
    std::size_t threads = 0;
    bool threads_set = false;
    bool lossy = false;
    std::vector<std::string> positional;
};

void print_usage() {
    std::cerr << "Usage:\n"
              << "  tokenrank_cli <command> [options] [text | ranks...]\n\n"
              << "Commands:\n"
              << "  encode            Text to ranks, special literals per --allowed-special\n"
              << "  encode-ordinary   Text to ranks, no special-token recognition\n"
              << "  decode            Ranks to text\n"
              << "  count             Number of tokens per record and in total\n"
              << "  list              Known encoding names\n"
              << "  model <name>      Encoding used by a model\n\n"
              << "Options:\n"
              << "  --encoding <name>           Encoding name (default: cl100k_base)\n"
              << "  --model <name>              Pick the encoding by model name\n"
              << "  --allowed-special <spec>    all | none | comma-separated literals (default: none)\n"
              << "  --input <path>              .txt/.jsonl/.json, optionally .gz/.xz; one record per line or JSON field\n"
              << "  --text-field <name>         JSON field holding the text (default: text, content)\n"
              << "  --threads <n>               Worker threads for --input (0=auto)\n"
              << "  --env-file <path>           KEY=VALUE overrides (TOKENRANK_*, TIKTOKEN_CACHE_DIR)\n"
              << "  --lossy                     decode: replace ill-formed UTF-8 with U+FFFD\n"
              << "  --help                      Show this help\n";
}

std::vector<std::string> split_csv(const std::string& s) {
    std::vector<std::string> out;
    std::string cur;
    for (char c : s) {
        if (c == ',') {
            if (!cur.empty()) {
                out.push_back(cur);
                cur.clear();
            }
            continue;
        }
        cur.push_back(c);
    }
    if (!cur.empty()) {
        out.push_back(cur);
    }
    return out;
}

bool parse_size_value(const std::string& s, std::size_t& out) {
    if (s.empty() || s.find('-') != std::string::npos) {
        return false;
    }
    char* end = nullptr;
    unsigned long long v = std::strtoull(s.c_str(), &end, 10);
    if (*end != '\0') {
        return false;
    }
    out = static_cast<std::size_t>(v);
    return true;
}

bool parse_args(int argc, char** argv, CliArgs& args, std::string& err, bool& show_help) {
    show_help = false;
    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        auto require_value = [&](const std::string& name) -> const char* {
            if (i + 1 >= argc) {
                err = "missing value for " + name;
                return nullptr;
            }
            return argv[++i];
        };

        if (arg == "--help" || arg == "-h") {
            show_help = true;
            return false;
        }
        if (arg == "--lossy") {
            args.lossy = true;
            continue;
        }
        if (arg == "--encoding" || arg == "--model" || arg == "--allowed-special" || arg == "--input" ||
            arg == "--text-field" || arg == "--env-file" || arg == "--threads") {
            const char* v = require_value(arg);
            if (!v) {
                return false;
            }
            if (arg == "--encoding") {
                args.encoding = v;
            } else if (arg == "--model") {
                args.model = v;
            } else if (arg == "--allowed-special") {
                args.allowed_special = v;
            } else if (arg == "--input") {
                args.input = v;
            } else if (arg == "--text-field") {
                args.text_field = v;
            } else if (arg == "--env-file") {
                args.env_file = v;
            } else {
                if (!parse_size_value(v, args.threads)) {
                    err = "invalid --threads: " + std::string(v);
                    return false;
                }
                args.threads_set = true;
            }
            continue;
        }
        if (arg.rfind("--", 0) == 0) {
            err = "unknown option: " + arg;
            return false;
        }
        if (args.command.empty()) {
            args.command = arg;
        } else {
            args.positional.push_back(arg);
        }
    }
    if (args.command.empty()) {
        err = "missing command";
        return false;
    }
    return true;
}

SpecialPolicy make_policy(const std::string& spec) {
    if (spec == "all") {
        return SpecialPolicy::all();
    }
    if (spec == "none" || spec.empty()) {
        return SpecialPolicy::none();
    }
    auto literals = split_csv(spec);
    return SpecialPolicy::only(std::unordered_set<std::string>(literals.begin(), literals.end()));
}

std::string join_positional(const std::vector<std::string>& parts) {
    std::string out;
    for (std::size_t i = 0; i < parts.size(); ++i) {
        if (i > 0) {
            out.push_back(' ');
        }
        out += parts[i];
    }
    return out;
}

bool collect_records(const CliArgs& args, std::vector<std::string>& records, std::string& err) {
    if (!args.input.empty()) {
        CorpusReadOptions opts;
        if (!args.text_field.empty()) {
            opts.json_text_fields = {args.text_field};
        }
        CorpusReader reader(opts);
        return reader.for_each_record(args.input, [&](const std::string& r) { records.push_back(r); }, err);
    }
    if (!args.positional.empty()) {
        records.push_back(join_positional(args.positional));
        return true;
    }
    std::ostringstream oss;
    oss << std::cin.rdbuf();
    records.push_back(oss.str());
    return true;
}

void print_tokens(const Tokens& tokens) {
    std::ostringstream oss;
    for (std::size_t i = 0; i < tokens.size(); ++i) {
        if (i > 0) {
            oss << ' ';
        }
        oss << tokens[i];
    }
    oss << '\n';
    std::cout << oss.str();
}

bool parse_ranks(const std::string& text, Tokens& out, std::string& err) {
    std::istringstream iss(text);
    std::string word;
    while (iss >> word) {
        std::size_t v = 0;
        if (!parse_size_value(word, v) || v >= kNoRank) {
            err = "invalid rank: " + word;
            return false;
        }
        out.push_back(static_cast<Rank>(v));
    }
    return true;
}

int run_encode(const CliArgs& args, const Encoding& enc, bool ordinary, bool count_only) {
    std::vector<std::string> records;
    std::string err;
    if (!collect_records(args, records, err)) {
        std::cerr << "[tokenrank] " << err << "\n";
        return 2;
    }

    Config cfg = Config::from_environment(args.env_file);
    BatchDriver driver(args.threads_set ? args.threads : cfg.threads);
    SpecialPolicy policy = make_policy(args.allowed_special);

    std::vector<Tokens> results(records.size());
    ProgressTracker progress(records.size(), count_only ? "count" : "encode", 1000);
    bool show_progress = !args.input.empty();
    driver.run(records.size(), [&](std::size_t i) {
        results[i] = ordinary ? enc.encode_ordinary(records[i]) : enc.encode(records[i], policy);
        if (show_progress) {
            progress.add(1, results[i].size());
        }
    });
    if (show_progress) {
        progress.finish();
    }

    std::uint64_t total = 0;
    for (const auto& tokens : results) {
        total += tokens.size();
        if (count_only) {
            std::cout << tokens.size() << "\n";
        } else {
            print_tokens(tokens);
        }
    }
    if (count_only && results.size() > 1) {
        std::cout << "total " << total << "\n";
    }
    return 0;
}

int run_decode(const CliArgs& args, const Encoding& enc) {
    std::vector<std::string> lines;
    if (!args.positional.empty()) {
        lines.push_back(join_positional(args.positional));
    } else {
        std::string line;
        while (std::getline(std::cin, line)) {
            lines.push_back(line);
        }
    }
    DecodeMode mode = args.lossy ? DecodeMode::replace : DecodeMode::strict;
    for (const auto& line : lines) {
        Tokens tokens;
        std::string err;
        if (!parse_ranks(line, tokens, err)) {
            std::cerr << "[tokenrank] " << err << "\n";
            return 2;
        }
        std::cout << enc.decode(tokens, mode) << "\n";
    }
    return 0;
}

} // namespace

int main(int argc, char** argv) {
    CliArgs args;
    std::string err;
    bool show_help = false;
    if (!parse_args(argc, argv, args, err, show_help)) {
        if (!show_help) {
            std::cerr << "[tokenrank] " << err << "\n";
        }
        print_usage();
        return show_help ? 0 : 1;
    }

    if (!args.env_file.empty()) {
        setenv("TOKENRANK_ENV_FILE", args.env_file.c_str(), 1);
    }

    try {
        if (args.command == "list") {
            for (const auto& name : list_encoding_names()) {
                std::cout << name << "\n";
            }
            return 0;
        }
        if (args.command == "model") {
            std::string model = args.positional.empty() ? args.model : args.positional.front();
            if (model.empty()) {
                std::cerr << "[tokenrank] model: missing model name\n";
                return 1;
            }
            std::cout << encoding_name_for_model(model) << "\n";
            return 0;
        }

        std::shared_ptr<const Encoding> enc =
            args.model.empty() ? get_encoding(args.encoding) : encoding_for_model(args.model);

        if (args.command == "encode") {
            return run_encode(args, *enc, false, false);
        }
        if (args.command == "encode-ordinary") {
            return run_encode(args, *enc, true, false);
        }
        if (args.command == "count") {
            return run_encode(args, *enc, false, true);
        }
        if (args.command == "decode") {
            return run_decode(args, *enc);
        }
    } catch (const SpecialTokenViolation& e) {
        std::cerr << "[tokenrank] " << e.what() << " (pass --allowed-special to encode it as a special token)\n";
        return 3;
    } catch (const Error& e) {
        std::cerr << "[tokenrank] " << e.what() << "\n";
        return 3;
    }

    std::cerr << "[tokenrank] unknown command: " << args.command << "\n";
    print_usage();
    return 1;
}
