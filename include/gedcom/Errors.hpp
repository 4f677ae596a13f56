#pragma once

#include <stdexcept>
#include <string>

namespace gedcom {

/*
  Parse and resolve errors. All of them are fatal: the build command
  aborts before any document is written.
*/

class MalformedLineError : public std::runtime_error {
public:
    MalformedLineError(int line, const std::string& msg)
        : std::runtime_error("line " + std::to_string(line) + ": " + msg), m_line(line) {}

    int line() const { return m_line; }

private:
    int m_line;
};

// level jumps, duplicate ids, overfull families
class StructuralError : public std::runtime_error {
public:
    StructuralError(int line, const std::string& msg)
        : std::runtime_error("line " + std::to_string(line) + ": " + msg), m_line(line) {}

    int line() const { return m_line; }

private:
    int m_line;
};

class DanglingReferenceError : public std::runtime_error {
public:
    DanglingReferenceError(const std::string& id, const std::string& msg)
        : std::runtime_error(msg), m_id(id) {}

    const std::string& id() const { return m_id; }

private:
    std::string m_id;
};

}  // namespace gedcom
