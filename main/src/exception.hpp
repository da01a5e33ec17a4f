#pragma once

#include <stdexcept>
#include <string>

class GenhdlistException : public std::runtime_error {
public:
    explicit GenhdlistException(const std::string& message)
        : std::runtime_error(message) {}
};

// Malformed or unsupported compression filter. Raised before any I/O.
class InvalidFilterError : public GenhdlistException {
public:
    using GenhdlistException::GenhdlistException;
};

// The same package name was recorded twice in one build.
class DuplicatePackageError : public GenhdlistException {
public:
    using GenhdlistException::GenhdlistException;
};

// A mandatory package field is absent.
class MissingFieldError : public GenhdlistException {
public:
    using GenhdlistException::GenhdlistException;
};

// Disk or stream failure while writing an artifact.
class IOFailure : public GenhdlistException {
public:
    using GenhdlistException::GenhdlistException;
};

// Dependency flags with no defined operator (less and greater together).
class InvalidDependencyError : public GenhdlistException {
public:
    using GenhdlistException::GenhdlistException;
};

class HeaderParseError : public GenhdlistException {
public:
    using GenhdlistException::GenhdlistException;
};
