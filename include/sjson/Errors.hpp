/**
 * @file Errors.hpp
 * @brief Exception types for sjson mutation errors
 *
 * Error taxonomy:
 * - SjsonError: Base class
 * - EmptyPathError: Path has no segments
 * - InvalidPathError: Segment cannot be resolved against an array
 * - NonNumericArrayKeyError: Array segment is not an integer
 * - NoChangeError: Delete found nothing to remove
 * - JsonMustBeObjectOrArrayError: Document root is a scalar
 * - MalformedJsonError: Source document or raw value rejected by the parser
 * - SerializationError: Mutated tree could not be encoded
 * - FileNotFoundError: Options file or input document not found
 * - ConfigParseError: Options file syntax errors
 * - UsageError: Command-line arguments do not form a valid command
 */

#ifndef SJSON_ERRORS_HPP
#define SJSON_ERRORS_HPP

#include <stdexcept>
#include <string>
#include <utility>

namespace sjson {

/**
 * @brief Base class for all sjson exceptions
 */
class SjsonError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

/**
 * @brief Path supplied to set/delete has no segments
 */
class EmptyPathError : public SjsonError {
public:
    EmptyPathError() : SjsonError("path cannot be empty") {}
};

/**
 * @brief Segment cannot be resolved as an index against an array
 *
 * Raised when a negative index exceeds the array length, or (through
 * NonNumericArrayKeyError) when the segment is not an integer at all.
 */
class InvalidPathError : public SjsonError {
public:
    /**
     * @brief Construct with the offending segment and a message
     * @param segment The segment that failed to resolve
     * @param message Full error message
     */
    InvalidPathError(std::string segment, const std::string& message)
        : SjsonError(message)
        , segment_(std::move(segment))
    {}

    /**
     * @brief Get the segment that failed to resolve
     */
    const std::string& segment() const noexcept {
        return segment_;
    }

private:
    std::string segment_;
};

/**
 * @brief Array traversal met a segment that is not an integer
 *
 * Arrays cannot take a non-numeric key. This is a kind of InvalidPathError
 * so callers that only care about path validity can catch the base.
 */
class NonNumericArrayKeyError : public InvalidPathError {
public:
    explicit NonNumericArrayKeyError(const std::string& key)
        : InvalidPathError(key,
              "cannot set array element for non-numeric key '" + key + "'")
    {}

    /**
     * @brief Get the non-numeric key
     */
    const std::string& key() const noexcept {
        return segment();
    }
};

/**
 * @brief Delete targeted a key/index that does not exist
 *
 * Also raised when the path traverses a node that cannot contain the
 * remaining segments.
 */
class NoChangeError : public SjsonError {
public:
    explicit NoChangeError(std::string path)
        : SjsonError("no change: nothing to delete at path '" + path + "'")
        , path_(std::move(path))
    {}

    /**
     * @brief Get the path that resolved to nothing
     */
    const std::string& path() const noexcept {
        return path_;
    }

private:
    std::string path_;
};

/**
 * @brief Document root is a string, number or boolean
 */
class JsonMustBeObjectOrArrayError : public SjsonError {
public:
    JsonMustBeObjectOrArrayError() : SjsonError("json must be an object or array") {}
};

/**
 * @brief The parser rejected the source document or a raw value
 */
class MalformedJsonError : public SjsonError {
public:
    /**
     * @brief Construct with parser details
     * @param details Message from the JSON parser
     * @param is_value true when the rejected text was a raw value rather
     *                 than the source document
     */
    explicit MalformedJsonError(std::string details, bool is_value = false)
        : SjsonError(std::string(is_value ? "Invalid JSON value: " : "Invalid JSON: ") + details)
        , details_(std::move(details))
        , is_value_(is_value)
    {}

    /**
     * @brief Get detailed error message from the parser
     */
    const std::string& details() const noexcept {
        return details_;
    }

    /**
     * @brief Whether the rejected text was the raw value
     */
    bool is_value() const noexcept {
        return is_value_;
    }

private:
    std::string details_;
    bool is_value_;
};

/**
 * @brief The serializer could not encode a tree or value
 */
class SerializationError : public SjsonError {
public:
    explicit SerializationError(const std::string& details)
        : SjsonError("Failed to serialize: " + details)
    {}
};

/**
 * @brief Options file or input document not found
 */
class FileNotFoundError : public SjsonError {
public:
    /**
     * @brief Construct with file path
     * @param path Path to the missing file
     */
    explicit FileNotFoundError(std::string path)
        : SjsonError("File not found: " + path)
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
 * @brief Options file parse error (JSON/TOML syntax or bad field type)
 */
class ConfigParseError : public SjsonError {
public:
    /**
     * @brief Construct with file path and error details
     * @param file Path to the file with parse error
     * @param details Detailed error message from parser
     */
    ConfigParseError(std::string file, std::string details)
        : SjsonError("Parse error in '" + file + "': " + details)
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

/**
 * @brief Command-line arguments do not form a valid command
 */
class UsageError : public SjsonError {
public:
    explicit UsageError(const std::string& message)
        : SjsonError(message)
    {}
};

} // namespace sjson

#endif // SJSON_ERRORS_HPP
