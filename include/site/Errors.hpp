#pragma once

#include <stdexcept>
#include <string>

namespace site {

/*
  Biography errors are recoverable: the emitter turns them into warnings
  and still writes the profile. WriteError aborts the run.
*/

class AmbiguousBiographyMatchError : public std::runtime_error {
public:
    AmbiguousBiographyMatchError(const std::string& individual_id, const std::string& msg)
        : std::runtime_error(msg), m_individual_id(individual_id) {}

    const std::string& individual_id() const { return m_individual_id; }

private:
    std::string m_individual_id;
};

class BiographyReadError : public std::runtime_error {
public:
    explicit BiographyReadError(const std::string& msg) : std::runtime_error(msg) {}
};

class WriteError : public std::runtime_error {
public:
    explicit WriteError(const std::string& msg) : std::runtime_error(msg) {}
};

}  // namespace site
