#pragma once

#include <stdexcept>
#include <string>

class DepsizeException : public std::runtime_error {
public:
    explicit DepsizeException(const std::string& message)
        : std::runtime_error(message) {}
};

// A manifest path given to the analyzer does not exist.
class ManifestNotFound : public DepsizeException {
public:
    explicit ManifestNotFound(const std::string& message)
        : DepsizeException(message) {}
};

// Manifest content cannot be decoded as the declared format.
class ParseError : public DepsizeException {
public:
    explicit ParseError(const std::string& message)
        : DepsizeException(message) {}
};

class UnsupportedEcosystem : public DepsizeException {
public:
    explicit UnsupportedEcosystem(const std::string& message)
        : DepsizeException(message) {}
};
