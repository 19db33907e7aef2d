/**
 * @file validation_ops.cpp
 */

#include "person/validation/validation_ops.h"
#include "person/utils/string_utils.h"

#include <vector>
#include <spdlog/spdlog.h>

namespace person::validation {

std::string joinErrors(const NonEmptyList<ValidationError>& errors, const std::string& separator) {
    std::vector<std::string> messages;
    messages.reserve(errors.size());
    for (ValidationError e : errors) {
        messages.push_back(errorMessage(e));
    }
    return utils::join(messages, separator);
}

std::string joinErrorCodes(const NonEmptyList<ValidationError>& errors) {
    std::vector<std::string> codes;
    codes.reserve(errors.size());
    for (ValidationError e : errors) {
        codes.push_back(errorCode(e));
    }
    return utils::join(codes, ",");
}

std::string describe(const ValidationResult& result) {
    return result.fold(
        [](const NonEmptyList<ValidationError>& errors) {
            return "Invalid: " + joinErrors(errors);
        },
        [](const domain::Person& p) {
            return "Valid: " + p.toString();
        });
}

void logOutcome(const ValidationResult& result) {
    if (result.isValid()) {
        spdlog::debug("Person validated: {}", result.value().toString());
        return;
    }
    const auto& errors = result.errors();
    spdlog::warn("Person validation failed: {} error(s) [{}]: {}",
                 errors.size(), joinErrorCodes(errors), joinErrors(errors));
}

} // namespace person::validation
