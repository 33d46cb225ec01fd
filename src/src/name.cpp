#include <gql/name.h>
#include <stdexcept>

namespace gql {

namespace {
    bool is_name_start(char c) {
        return c == '_' or ('A' <= c and c <= 'Z') or ('a' <= c and c <= 'z');
    }

    bool is_name_continue(char c) { return is_name_start(c) or ('0' <= c and c <= '9'); }
}

Name::Name(const std::string& text) : text_(text) {
    if (not isValid(text)) {
        throw std::invalid_argument("invalid GraphQL name: '" + text + "'");
    }
}

std::optional<Name> Name::makeName(const std::string& text) {
    if (not isValid(text)) return std::nullopt;
    return Name(Unchecked{}, text);
}

bool Name::isValid(const std::string& text) noexcept {
    if (text.empty()) return false;
    if (not is_name_start(text[0])) return false;
    for (size_t i = 1; i < text.size(); ++i) {
        if (not is_name_continue(text[i])) return false;
    }
    return true;
}

}  // namespace gql
