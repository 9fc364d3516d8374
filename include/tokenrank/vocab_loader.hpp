#pragma once

#include <string>
#include <string_view>

#include "tokenrank/types.hpp"

namespace tokenrank {

bool decode_base64(std::string_view in, std::string& out);

// "<base64 token> <rank>" per line.
bool load_tiktoken_bpe(std::string_view contents, EncoderMap& out, std::string& err);

// GPT-2 style vocab.bpe (merge list) plus encoder.json. Single bytes get
// ranks 0..255 in the data-gym printable-first order, then each merge line
// gets the next rank. encoder.json must agree with the result.
bool data_gym_to_mergeable_bpe_ranks(std::string_view vocab_bpe, std::string_view encoder_json, EncoderMap& out,
                                     std::string& err);

// Same, reading each file through read_file_cached().
bool load_tiktoken_bpe_file(const std::string& blob_path, const std::string& cache_dir, EncoderMap& out,
                            std::string& err, int timeout_sec = 60);
bool load_data_gym_files(const std::string& vocab_bpe_path, const std::string& encoder_json_path,
                         const std::string& cache_dir, EncoderMap& out, std::string& err,
                         int timeout_sec = 60);

} // namespace tokenrank
