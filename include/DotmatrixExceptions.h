#ifndef DOTMATRIX_EXCEPTIONS_H
#define DOTMATRIX_EXCEPTIONS_H

#include <stdexcept>
#include <string>

namespace Dotmatrix {

class DotmatrixException : public std::runtime_error {
public:
    explicit DotmatrixException(const std::string& message) : std::runtime_error(message) {}
};

class IOException : public DotmatrixException {
public:
    explicit IOException(const std::string& message) : DotmatrixException("IO Error: " + message) {}
};

class DatasetException : public DotmatrixException {
public:
    explicit DatasetException(const std::string& message) : DotmatrixException("Dataset Error: " + message) {}
};

class ConfigurationException : public DotmatrixException {
public:
    explicit ConfigurationException(const std::string& message) : DotmatrixException("Configuration Error: " + message) {}
};

class InvalidArgumentException : public DotmatrixException {
public:
    explicit InvalidArgumentException(const std::string& message) : DotmatrixException("Invalid Argument: " + message) {}
};

class MissingKeyException : public DotmatrixException {
public:
    explicit MissingKeyException(const std::string& message) : DotmatrixException("Missing Key: " + message) {}
};

class RenderException : public DotmatrixException {
public:
    explicit RenderException(const std::string& message) : DotmatrixException("Render Error: " + message) {}
};

} // namespace Dotmatrix

#endif // DOTMATRIX_EXCEPTIONS_H
