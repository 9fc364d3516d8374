#pragma once

#include <cstddef>
#include <stdexcept>
#include <string>
#include <vector>

#include "tokenrank/types.hpp"

namespace tokenrank {

class Error : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

// Construction-time failure: incomplete byte coverage, overlapping rank
// ranges, bad pattern, unknown encoding name.
class ConfigError : public Error {
public:
    using Error::Error;
};

class SpecialTokenViolation : public Error {
public:
    explicit SpecialTokenViolation(std::vector<std::string> literals);

    const std::string& literal() const { return literals_.front(); }
    const std::vector<std::string>& literals() const { return literals_; }

private:
    std::vector<std::string> literals_;
};

class DecodeError : public Error {
public:
    enum class Kind { unknown_rank, invalid_utf8 };

    static DecodeError unknown_rank(Rank rank);
    static DecodeError invalid_utf8(std::size_t offset);

    Kind kind() const { return kind_; }
    Rank rank() const { return rank_; }
    std::size_t offset() const { return offset_; }

private:
    DecodeError(Kind kind, Rank rank, std::size_t offset, const std::string& what);

    Kind kind_;
    Rank rank_ = 0;
    std::size_t offset_ = 0;
};

} // namespace tokenrank
