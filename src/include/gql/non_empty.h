#pragma once

#include <cstddef>
#include <optional>
#include <utility>
#include <vector>

namespace gql {

// A sequence with at least one element.
template <typename T>
class NonEmptyList {
  public:
    using const_iterator = typename std::vector<T>::const_iterator;

    explicit NonEmptyList(T head, std::vector<T> tail = {}) {
        values_.reserve(tail.size() + 1);
        values_.push_back(std::move(head));
        for (auto& x : tail) values_.push_back(std::move(x));
    }

    static std::optional<NonEmptyList> fromVector(std::vector<T> values) {
        if (values.empty()) return std::nullopt;
        return NonEmptyList(Checked{}, std::move(values));
    }

    const T& head() const { return values_.front(); }
    const std::vector<T>& toVector() const noexcept { return values_; }

    std::size_t size() const noexcept { return values_.size(); }
    const_iterator begin() const noexcept { return values_.begin(); }
    const_iterator end() const noexcept { return values_.end(); }

    bool operator==(const NonEmptyList& rhs) const { return values_ == rhs.values_; }
    bool operator!=(const NonEmptyList& rhs) const { return values_ != rhs.values_; }

  private:
    struct Checked {};
    NonEmptyList(Checked, std::vector<T> values) : values_(std::move(values)) {}

    std::vector<T> values_;
};

}  // namespace gql
