#include "tokenrank/errors.hpp"

#include <utility>

namespace tokenrank {

namespace {
std::string violation_message(const std::vector<std::string>& literals) {
    std::string msg = "encountered text corresponding to disallowed special token";
    if (literals.empty()) {
        return msg;
    }
    msg += " '" + literals.front() + "'";
    if (literals.size() > 1) {
        msg += " (and " + std::to_string(literals.size() - 1) + " more)";
    }
    msg += "; allow it in the special-token policy to encode it as a special token, "
           "or use encode_ordinary to encode it as plain text";
    return msg;
}
} // namespace

SpecialTokenViolation::SpecialTokenViolation(std::vector<std::string> literals)
    : Error(violation_message(literals)), literals_(std::move(literals)) {
    if (literals_.empty()) {
        literals_.emplace_back();
    }
}

DecodeError::DecodeError(Kind kind, Rank rank, std::size_t offset, const std::string& what)
    : Error(what), kind_(kind), rank_(rank), offset_(offset) {}

DecodeError DecodeError::unknown_rank(Rank rank) {
    return DecodeError(Kind::unknown_rank, rank, 0, "token " + std::to_string(rank) + " not found");
}

DecodeError DecodeError::invalid_utf8(std::size_t offset) {
    return DecodeError(Kind::invalid_utf8, 0, offset,
                       "decoded bytes are not valid UTF-8 (invalid sequence at byte " + std::to_string(offset) + ")");
}

} // namespace tokenrank
