/**
 * @file Person.hpp
 * @brief Validated person record
 */

#pragma once

#include <cstddef>
#include <functional>
#include <ostream>
#include <string>
#include <utility>

namespace person::validation {
class PersonValidator;
} // namespace person::validation

namespace person::domain {

/**
 * @brief Immutable person record
 *
 * The constructor is private: the only way to obtain a Person is through
 * validation::PersonValidator, so every instance satisfies all three rules
 * (non-blank name, 0 <= age <= MAX_AGE) for its whole lifetime.
 *
 * The name is stored exactly as supplied, without trimming.
 */
class Person {
private:
    std::string name_;
    int age_;

    Person(std::string name, int age) : name_(std::move(name)), age_(age) {}

    friend class validation::PersonValidator;

public:
    // Copyable and movable, but never reassigned
    Person(const Person&) = default;
    Person& operator=(const Person&) = delete;
    Person(Person&&) noexcept = default;
    Person& operator=(Person&&) noexcept = delete;

    [[nodiscard]] const std::string& getName() const noexcept { return name_; }
    [[nodiscard]] int getAge() const noexcept { return age_; }

    /**
     * @brief "Person(name=<name>, age=<age>)"
     */
    [[nodiscard]] std::string toString() const;

    bool operator==(const Person& other) const {
        return age_ == other.age_ && name_ == other.name_;
    }

    bool operator!=(const Person& other) const {
        return !(*this == other);
    }
};

inline std::ostream& operator<<(std::ostream& os, const Person& p) {
    return os << p.toString();
}

} // namespace person::domain

namespace std {
    template<>
    struct hash<person::domain::Person> {
        size_t operator()(const person::domain::Person& p) const {
            size_t seed = hash<string>{}(p.getName());
            return seed ^ (hash<int>{}(p.getAge()) + 0x9e3779b9 + (seed << 6) + (seed >> 2));
        }
    };
}
