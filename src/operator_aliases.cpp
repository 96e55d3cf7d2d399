#include "operator_aliases.hpp"

#include "text_utils.hpp"

namespace linecalc {

const std::vector<AliasEntry>& operatorAliases() {
    static const std::vector<AliasEntry> kAliases = {
        {"+", {"plus", "add"}},
        {"-", {"minus", "subtract"}},
        {"*", {"multiply", "times"}},
        {"/", {"divide", "division"}},
        {"%", {"mod", "modulus"}},
        {"^", {"power", "exponent"}},
    };
    return kAliases;
}

std::optional<std::string> canonicalOf(std::string_view token) {
    const std::string lowered = toLower(token);
    for (const auto& entry : operatorAliases()) {
        if (lowered == entry.canonical) {
            return entry.canonical;
        }
        for (const auto& alias : entry.aliases) {
            if (lowered == alias) {
                return entry.canonical;
            }
        }
    }
    return std::nullopt;
}

bool isCanonicalOperator(std::string_view text) {
    for (const auto& entry : operatorAliases()) {
        if (text == entry.canonical) {
            return true;
        }
    }
    return false;
}

} // namespace linecalc
