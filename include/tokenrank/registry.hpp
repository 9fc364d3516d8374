#pragma once

#include <functional>
#include <memory>
#include <string>
#include <vector>

#include "tokenrank/encoding.hpp"

namespace tokenrank {

using EncodingConstructor = std::function<EncodingSpec(const Config&)>;

// Sorted names of every known encoding, built-in or registered.
std::vector<std::string> list_encoding_names();

// Adds a named encoding. Returns false if the name is already taken.
bool register_encoding(const std::string& name, EncodingConstructor ctor);

// The process-wide instance for `name`, built on first use with
// Config::from_environment() and kept until exit. Throws ConfigError for an
// unknown name and Error when the vocabulary cannot be loaded.
std::shared_ptr<const Encoding> get_encoding(const std::string& name);

// Exact model names first, then known prefixes such as "gpt-4-". Throws
// ConfigError when nothing matches.
std::string encoding_name_for_model(const std::string& model);
std::shared_ptr<const Encoding> encoding_for_model(const std::string& model);

} // namespace tokenrank
