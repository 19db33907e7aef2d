/**
 * @file ValidationException.hpp
 * @brief Fail-fast validation exception
 */

#pragma once

#include "person/exception/DomainException.hpp"
#include "person/validation/types.h"

namespace person::exception {

/**
 * @brief Thrown by the fail-fast entry point on the first violated rule
 *
 * Never thrown by the accumulating entry point.
 */
class ValidationException : public DomainException {
private:
    validation::ValidationError error_;

public:
    explicit ValidationException(validation::ValidationError error)
        : DomainException(validation::errorCode(error), validation::errorMessage(error)),
          error_(error) {}

    [[nodiscard]] validation::ValidationError getError() const noexcept {
        return error_;
    }
};

} // namespace person::exception
