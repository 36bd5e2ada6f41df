/**
 * @file Errors.hpp
 * @brief Exception types for fluent collection errors
 *
 * Error taxonomy:
 * - CollectionError: Base class
 * - InvalidOperatorError: Unsupported comparison operator
 * - UnchainedSortError: then_by without a preceding sort_by
 * - ItemNotFoundError: first_or_fail found nothing
 * - InvalidSourceError: Lazy collection built from a single-shot sequence
 * - BadMethodCallError: Unregistered macro called
 * - InvalidArgumentError: Argument outside an operation's domain
 * - FileNotFoundError / ParseError: Data file loading failures
 */

#ifndef FLUENT_ERRORS_HPP
#define FLUENT_ERRORS_HPP

#include <stdexcept>
#include <string>

namespace fluent {

/**
 * @brief Base class for all fluent exceptions
 */
class CollectionError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

/**
 * @brief Comparison operator string is not one of the supported operators
 */
class InvalidOperatorError : public CollectionError {
public:
    /**
     * @brief Construct with the rejected operator
     * @param op Operator string as given by the caller
     */
    explicit InvalidOperatorError(std::string op)
        : CollectionError("Invalid operator: '" + op + "'")
        , op_(std::move(op))
    {}

    /**
     * @brief Get the rejected operator string
     */
    const std::string& op() const noexcept {
        return op_;
    }

private:
    std::string op_;
};

/**
 * @brief then_by called on a collection that carries no sort chain
 */
class UnchainedSortError : public CollectionError {
public:
    /**
     * @brief Construct with the refining method that was called
     * @param method Method name ("then_by" or "then_by_desc")
     */
    explicit UnchainedSortError(std::string method)
        : CollectionError("Can't use " + method + " without using sort_by or sort_by_desc")
        , method_(std::move(method))
    {}

    const std::string& method() const noexcept {
        return method_;
    }

private:
    std::string method_;
};

/**
 * @brief No element satisfied a first_or_fail lookup
 */
class ItemNotFoundError : public CollectionError {
public:
    ItemNotFoundError()
        : CollectionError("Item not found")
    {}
};

/**
 * @brief Lazy collection source cannot be iterated more than once
 *
 * Raised at construction time so that a non-restartable source never
 * reaches a second iteration.
 */
class InvalidSourceError : public CollectionError {
public:
    explicit InvalidSourceError(std::string reason)
        : CollectionError("Invalid lazy collection source: " + reason)
        , reason_(std::move(reason))
    {}

    const std::string& reason() const noexcept {
        return reason_;
    }

private:
    std::string reason_;
};

/**
 * @brief A macro was called by a name nobody registered
 */
class BadMethodCallError : public CollectionError {
public:
    /**
     * @brief Construct with the receiving type and the method name
     * @param type Receiving type name (e.g., "Collection")
     * @param method Macro name that was called
     */
    BadMethodCallError(std::string type, std::string method)
        : CollectionError("Method " + type + "::" + method + " does not exist")
        , type_(std::move(type))
        , method_(std::move(method))
    {}

    const std::string& type() const noexcept {
        return type_;
    }

    const std::string& method() const noexcept {
        return method_;
    }

private:
    std::string type_;
    std::string method_;
};

/**
 * @brief Argument outside the domain of an operation
 *
 * Examples: a range step of zero, combining keys and values of
 * different lengths.
 */
class InvalidArgumentError : public CollectionError {
public:
    using CollectionError::CollectionError;
};

/**
 * @brief Data file not found
 */
class FileNotFoundError : public CollectionError {
public:
    /**
     * @brief Construct with file path
     * @param path Path to the missing file
     */
    explicit FileNotFoundError(std::string path)
        : CollectionError("Data file not found: " + path)
        , path_(std::move(path))
    {}

    /**
     * @brief Get the file path that was not found
     */
    const std::string& path() const noexcept {
        return path_;
    }

private:
    std::string path_;
};

/**
 * @brief Data file parse error (JSON/TOML syntax)
 */
class ParseError : public CollectionError {
public:
    /**
     * @brief Construct with file path and error details
     * @param file Path to the file with parse error
     * @param details Detailed error message from parser
     */
    ParseError(std::string file, std::string details)
        : CollectionError("Parse error in '" + file + "': " + details)
        , file_(std::move(file))
        , details_(std::move(details))
    {}

    /**
     * @brief Get the file path with parse error
     */
    const std::string& file() const noexcept {
        return file_;
    }

    /**
     * @brief Get detailed error message
     */
    const std::string& details() const noexcept {
        return details_;
    }

private:
    std::string file_;
    std::string details_;
};

} // namespace fluent

#endif // FLUENT_ERRORS_HPP
