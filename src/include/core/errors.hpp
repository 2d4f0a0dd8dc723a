#pragma once
#include <stdexcept>
#include <string>

namespace pdfstack {

// Grid has fewer than 2 points, non-uniform spacing, or is too short
// to hold the widest truncated kernel.
class InvalidGrid : public std::invalid_argument {
public:
    explicit InvalidGrid(const std::string& what)
        : std::invalid_argument("InvalidGrid: " + what) {}
};

// Sigma grid has fewer than 2 points, a non-positive entry, or non-uniform spacing.
class InvalidSigmaGrid : public std::invalid_argument {
public:
    explicit InvalidSigmaGrid(const std::string& what)
        : std::invalid_argument("InvalidSigmaGrid: " + what) {}
};

// Neither raw (value, sigma) pairs nor pre-quantized indices were supplied.
class MissingInput : public std::invalid_argument {
public:
    explicit MissingInput(const std::string& what)
        : std::invalid_argument("MissingInput: " + what) {}
};

} // namespace pdfstack
