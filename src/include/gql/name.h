#pragma once

#include <cstddef>
#include <functional>
#include <optional>
#include <ostream>
#include <string>
#include <utility>

namespace gql {

// A validated GraphQL identifier, /[_A-Za-z][_0-9A-Za-z]*/.
// Used as Object keys and Enum values.
class Name {
  public:
    // Throws std::invalid_argument if `text` is not a valid identifier.
    explicit Name(const std::string& text);

    static std::optional<Name> makeName(const std::string& text);
    static bool isValid(const std::string& text) noexcept;

    const std::string& str() const noexcept { return text_; }

    bool operator==(const Name& rhs) const noexcept { return text_ == rhs.text_; }
    bool operator!=(const Name& rhs) const noexcept { return text_ != rhs.text_; }
    bool operator<(const Name& rhs) const noexcept { return text_ < rhs.text_; }
    bool operator>(const Name& rhs) const noexcept { return rhs < *this; }
    bool operator<=(const Name& rhs) const noexcept { return not(rhs < *this); }
    bool operator>=(const Name& rhs) const noexcept { return not(*this < rhs); }

  private:
    struct Unchecked {};
    Name(Unchecked, std::string text) : text_(std::move(text)) {}

    std::string text_;
};

inline std::ostream& operator<<(std::ostream& os, const Name& n) { return os << n.str(); }

}  // namespace gql

namespace std {
template <>
struct hash<gql::Name> {
    std::size_t operator()(const gql::Name& n) const noexcept {
        return std::hash<std::string>()(n.str());
    }
};
}  // namespace std
