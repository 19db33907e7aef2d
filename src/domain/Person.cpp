/**
 * @file Person.cpp
 */

#include "person/domain/Person.hpp"

namespace person::domain {

std::string Person::toString() const {
    return "Person(name=" + name_ + ", age=" + std::to_string(age_) + ")";
}

} // namespace person::domain
