/**
 * @file non_empty_list.h
 * @brief Ordered sequence that always holds at least one element
 *
 * There is no constructor taking zero elements, so an empty list cannot be
 * built. Used as the error payload of an invalid Validated.
 */

#pragma once

#include <cstddef>
#include <optional>
#include <ostream>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

namespace person::validation {

template<typename T>
class NonEmptyList {
private:
    std::vector<T> items_;

    explicit NonEmptyList(std::vector<T> items) : items_(std::move(items)) {}

public:
    using value_type = T;
    using const_iterator = typename std::vector<T>::const_iterator;

    /**
     * @brief Single-element list
     */
    explicit NonEmptyList(T head) {
        items_.push_back(std::move(head));
    }

    /**
     * @brief List of head followed by tail, in order
     */
    template<typename... Rest>
    static NonEmptyList of(T head, Rest... tail) {
        std::vector<T> items;
        items.reserve(1 + sizeof...(tail));
        items.push_back(std::move(head));
        (items.push_back(T(std::move(tail))), ...);
        return NonEmptyList(std::move(items));
    }

    /**
     * @brief Build from a possibly-empty vector
     * @return std::nullopt if items is empty
     */
    static std::optional<NonEmptyList> fromVector(std::vector<T> items) {
        if (items.empty()) {
            return std::nullopt;
        }
        return NonEmptyList(std::move(items));
    }

    [[nodiscard]] const T& head() const noexcept { return items_.front(); }
    [[nodiscard]] const T& last() const noexcept { return items_.back(); }
    [[nodiscard]] std::size_t size() const noexcept { return items_.size(); }

    /**
     * @brief Element at index
     * @throws std::out_of_range if index >= size()
     */
    [[nodiscard]] const T& at(std::size_t index) const {
        if (index >= items_.size()) {
            throw std::out_of_range("NonEmptyList index " + std::to_string(index) +
                                    " out of range (size " + std::to_string(items_.size()) + ")");
        }
        return items_[index];
    }

    /**
     * @brief Checked element access, same as at()
     * @throws std::out_of_range if index >= size()
     */
    const T& operator[](std::size_t index) const { return at(index); }

    [[nodiscard]] bool contains(const T& value) const {
        for (const auto& item : items_) {
            if (item == value) return true;
        }
        return false;
    }

    /**
     * @brief Append all elements of other, preserving order
     */
    void append(const NonEmptyList& other) {
        items_.insert(items_.end(), other.items_.begin(), other.items_.end());
    }

    [[nodiscard]] const std::vector<T>& toVector() const noexcept { return items_; }

    const_iterator begin() const noexcept { return items_.begin(); }
    const_iterator end() const noexcept { return items_.end(); }

    bool operator==(const NonEmptyList& other) const { return items_ == other.items_; }
    bool operator!=(const NonEmptyList& other) const { return !(*this == other); }
};

template<typename T>
std::ostream& operator<<(std::ostream& os, const NonEmptyList<T>& list) {
    os << "NonEmptyList(";
    bool first = true;
    for (const auto& item : list) {
        if (!first) os << ", ";
        os << item;
        first = false;
    }
    return os << ")";
}

} // namespace person::validation
