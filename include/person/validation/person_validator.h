/**
 * @file person_validator.h
 * @brief Person validation: accumulating and fail-fast entry points
 *
 * Three fixed rules, evaluated in this order:
 *   1. BlankName      - name is absent or trims to ""
 *   2. NegativeAge    - age < 0
 *   3. MaxAgeExceeded - age > MAX_AGE (130 itself is valid)
 *
 * validate() evaluates every rule and returns all failures as a value.
 * validateOrThrow() stops at the first failure and throws.
 */

#pragma once

#include "person/domain/Person.hpp"
#include "person/validation/types.h"
#include "person/validation/validated.h"

#include <array>
#include <optional>
#include <string>

namespace person::validation {

/// @brief Valid(Person) or Invalid(ordered, non-empty ValidationError list)
using ValidationResult = Validated<ValidationError, domain::Person>;

/// @brief A named check over PersonInput
struct ValidationRule {
    using Predicate = bool (*)(const PersonInput&);

    ValidationError error;  ///< Reported when the predicate does not hold
    Predicate holds;        ///< Pure, total over PersonInput
};

class PersonValidator {
public:
    /**
     * @brief The three rules in evaluation order
     */
    static const std::array<ValidationRule, 3>& rules();

    /**
     * @brief Evaluate every rule and accumulate all failures
     *
     * Pure: no I/O, no shared state, never throws for invalid input.
     *
     * @param input Candidate name and age
     * @return Valid(Person) with the untrimmed name, or Invalid(errors) in rule order
     */
    static ValidationResult validate(const PersonInput& input);

    /**
     * @brief Evaluate rules in order and stop at the first failure
     *
     * @param input Candidate name and age
     * @return Person when all rules hold
     * @throws exception::ValidationException carrying the first failing rule
     */
    static domain::Person validateOrThrow(const PersonInput& input);
};

inline ValidationResult validate(const PersonInput& input) {
    return PersonValidator::validate(input);
}

inline ValidationResult validate(std::optional<std::string> name, int age) {
    return PersonValidator::validate(PersonInput{std::move(name), age});
}

inline domain::Person validateOrThrow(const PersonInput& input) {
    return PersonValidator::validateOrThrow(input);
}

inline domain::Person validateOrThrow(std::optional<std::string> name, int age) {
    return PersonValidator::validateOrThrow(PersonInput{std::move(name), age});
}

} // namespace person::validation
