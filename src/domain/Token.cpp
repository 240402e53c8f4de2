#include "clearhouse/domain/Token.hpp"

#include <cctype>

namespace clearhouse {

bool normalize_address(const std::string& raw, TokenAddress& out) {
    if (raw.size() != 42 || raw[0] != '0' || (raw[1] != 'x' && raw[1] != 'X')) {
        return false;
    }

    std::string norm = "0x";
    norm.reserve(42);
    for (std::size_t i = 2; i < raw.size(); ++i) {
        unsigned char c = static_cast<unsigned char>(raw[i]);
        if (!std::isxdigit(c)) return false;
        norm.push_back(static_cast<char>(std::tolower(c)));
    }
    out = std::move(norm);
    return true;
}

} // namespace clearhouse
