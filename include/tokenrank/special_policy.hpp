#pragma once

#include <string>
#include <string_view>
#include <unordered_set>
#include <utility>

namespace tokenrank {

// Which special-token literals encode() may turn into special ranks. Any
// known literal found in the input that the policy does not permit makes
// encode() throw SpecialTokenViolation.
class SpecialPolicy {
public:
    enum class Kind { allow_all, allow_set, allow_none };

    static SpecialPolicy all() { return SpecialPolicy(Kind::allow_all, {}); }
    static SpecialPolicy none() { return SpecialPolicy(Kind::allow_none, {}); }
    static SpecialPolicy only(std::unordered_set<std::string> allowed) {
        return SpecialPolicy(Kind::allow_set, std::move(allowed));
    }

    Kind kind() const { return kind_; }
    const std::unordered_set<std::string>& allowed() const { return allowed_; }

    bool permits(std::string_view literal) const {
        switch (kind_) {
        case Kind::allow_all:
            return true;
        case Kind::allow_set:
            return allowed_.count(std::string(literal)) != 0;
        case Kind::allow_none:
            return false;
        }
        return false;
    }

private:
    SpecialPolicy(Kind kind, std::unordered_set<std::string> allowed)
        : kind_(kind), allowed_(std::move(allowed)) {}

    Kind kind_;
    std::unordered_set<std::string> allowed_;
};

} // namespace tokenrank
