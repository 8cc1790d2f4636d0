#ifndef AUGUR_EXCEPTIONS_H
#define AUGUR_EXCEPTIONS_H

#include <stdexcept>
#include <string>

namespace Augur {

class AugurException : public std::runtime_error {
public:
    explicit AugurException(const std::string& message) : std::runtime_error(message) {}
};

class IOException : public AugurException {
public:
    explicit IOException(const std::string& message) : AugurException("IO Error: " + message) {}
};

class DatasetException : public AugurException {
public:
    explicit DatasetException(const std::string& message) : AugurException("Dataset Error: " + message) {}
};

class ConfigurationException : public AugurException {
public:
    explicit ConfigurationException(const std::string& message) : AugurException("Configuration Error: " + message) {}
};

class PlanException : public AugurException {
public:
    explicit PlanException(const std::string& message) : AugurException("Plan Error: " + message) {}
};

class JsonException : public AugurException {
public:
    explicit JsonException(const std::string& message) : AugurException("JSON Error: " + message) {}
};

/**
 * @brief Raised by the snippet lexer/parser. Carries the 1-based source line.
 */
class ScriptSyntaxError : public AugurException {
public:
    ScriptSyntaxError(const std::string& message, int line)
        : AugurException("SyntaxError: " + message + " (line " + std::to_string(line) + ")"), line_(line) {}

    int line() const noexcept { return line_; }

private:
    int line_;
};

/**
 * @brief Raised while evaluating a snippet. The message already carries the
 * Python-style category prefix (NameError, KeyError, TypeError, ValueError).
 */
class ScriptError : public AugurException {
public:
    explicit ScriptError(const std::string& message) : AugurException(message) {}
};

} // namespace Augur

#endif // AUGUR_EXCEPTIONS_H
