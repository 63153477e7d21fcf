#pragma once

#include <stdexcept>

// Raised when a batch source yields no samples, so no per-sample mean can be formed.
class EmptyDataSourceError : public std::runtime_error {
    using std::runtime_error::runtime_error;
};

class ShapeMismatchError : public std::runtime_error {
    using std::runtime_error::runtime_error;
};

class DataFormatError : public std::runtime_error {
    using std::runtime_error::runtime_error;
};
