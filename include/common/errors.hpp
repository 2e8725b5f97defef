#pragma once

#include <stdexcept>
#include <string>

namespace vqhuff {

// Base of every coder/container failure. All of them abort the current
// operation; none are retried.
class VqhuffError : public std::runtime_error {
public:
    explicit VqhuffError(const std::string& what) : std::runtime_error(what) {}
};

// Nothing to compress (empty symbol sequence or empty frequency table).
class EmptyInputError : public VqhuffError {
public:
    explicit EmptyInputError(const std::string& what) : VqhuffError(what) {}
};

// Invalid frequency data or code table (zero count, duplicate symbol,
// non-prefix-free codes). Caller bug, not a data issue.
class DegenerateTableError : public VqhuffError {
public:
    explicit DegenerateTableError(const std::string& what) : VqhuffError(what) {}
};

class UnknownSymbolError : public VqhuffError {
public:
    explicit UnknownSymbolError(const std::string& what) : VqhuffError(what) {}
};

// Unpacking consumed the wrong number of bits or produced the wrong
// number of symbols.
class CorruptStreamError : public VqhuffError {
public:
    explicit CorruptStreamError(const std::string& what) : VqhuffError(what) {}
};

// A required container field is missing or invalid.
class MalformedContainerError : public VqhuffError {
public:
    MalformedContainerError(const std::string& field, const std::string& detail)
        : VqhuffError("container: invalid field '" + field + "': " + detail), field_(field) {}

    const std::string& field() const { return field_; }

private:
    std::string field_;
};

class ShapeMismatchError : public VqhuffError {
public:
    explicit ShapeMismatchError(const std::string& what) : VqhuffError(what) {}
};

} // namespace vqhuff
