/**
 * @file person_validator.cpp
 * @brief Person validation implementation
 */

#include "person/validation/person_validator.h"
#include "person/exception/ValidationException.hpp"
#include "person/utils/string_utils.h"

#include <spdlog/spdlog.h>

namespace person::validation {

namespace {

bool hasNonBlankName(const PersonInput& input) {
    return input.name.has_value() && !utils::isBlank(*input.name);
}

bool hasNonNegativeAge(const PersonInput& input) {
    return input.age >= 0;
}

bool isWithinMaxAge(const PersonInput& input) {
    return input.age <= MAX_AGE;
}

} // namespace

const std::array<ValidationRule, 3>& PersonValidator::rules() {
    static const std::array<ValidationRule, 3> kRules = {{
        {ValidationError::BlankName, &hasNonBlankName},
        {ValidationError::NegativeAge, &hasNonNegativeAge},
        {ValidationError::MaxAgeExceeded, &isWithinMaxAge},
    }};
    return kRules;
}

ValidationResult PersonValidator::validate(const PersonInput& input) {
    const auto& [nameRule, minAgeRule, maxAgeRule] = rules();

    auto validName = check(nameRule.holds(input), nameRule.error, input.name.value_or(std::string()));
    auto validMinAge = check(minAgeRule.holds(input), minAgeRule.error, input.age);
    auto validMaxAge = check(maxAgeRule.holds(input), maxAgeRule.error, input.age);

    return zipOrAccumulate(
        [](const std::string& name, const int& age, const int&) -> domain::Person {
            return domain::Person(name, age);
        },
        validName, validMinAge, validMaxAge);
}

domain::Person PersonValidator::validateOrThrow(const PersonInput& input) {
    for (const auto& rule : rules()) {
        if (!rule.holds(input)) {
            spdlog::debug("Person rejected: {} (age={})", errorCode(rule.error), input.age);
            throw exception::ValidationException(rule.error);
        }
    }
    return domain::Person(*input.name, input.age);
}

} // namespace person::validation
