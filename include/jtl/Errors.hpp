/**
 * @file Errors.hpp
 * @brief Exception types for jtl transformation errors
 *
 * Error taxonomy:
 * - TransformError: Base class, carries step/mapping location
 * - SyntaxError: Malformed destination path
 * - TypeMismatchError: Container/segment kind conflict while navigating
 * - FormatError: Malformed ETL or chain spec shape
 * - MissingRequiredFieldError: Mapping or step lacks a required key
 * - InvalidChainStateError: "$prev" used before any step produced output
 * - UnsupportedModeError: Mode outside {upsert, replace}
 * - ExpressionError: Evaluator syntax or runtime failure
 * - EvaluationTimeout: Evaluation exceeded its deadline
 * - ConfigError: Invalid chain or engine configuration
 * - FileNotFoundError / ParseError: File loading failures
 *
 * Every error aborts the whole run. Locations are attached while the error
 * propagates, so what() reads e.g. "step 2, mapping 3: <message>".
 */

#ifndef JTL_ERRORS_HPP
#define JTL_ERRORS_HPP

#include <chrono>
#include <cstddef>
#include <optional>
#include <sstream>
#include <stdexcept>
#include <string>

namespace jtl {

/**
 * @brief Base class for all jtl exceptions
 */
class TransformError : public std::runtime_error {
public:
    explicit TransformError(const std::string& message)
        : std::runtime_error(message)
        , full_message_(message)
    {}

    const char* what() const noexcept override {
        return full_message_.c_str();
    }

    /**
     * @brief Message without the location prefix
     */
    const char* message() const noexcept {
        return std::runtime_error::what();
    }

    /// 1-based index of the chain step that failed, if known
    std::optional<std::size_t> step() const noexcept { return step_; }

    /// 1-based index of the mapping that failed, if known
    std::optional<std::size_t> mapping() const noexcept { return mapping_; }

    void set_step(std::size_t step) {
        step_ = step;
        rebuild();
    }

    void set_mapping(std::size_t mapping) {
        mapping_ = mapping;
        rebuild();
    }

private:
    std::optional<std::size_t> step_;
    std::optional<std::size_t> mapping_;
    std::string full_message_;

    void rebuild() {
        std::ostringstream oss;
        if (step_) {
            oss << "step " << *step_;
            if (mapping_) oss << ", ";
        }
        if (mapping_) oss << "mapping " << *mapping_;
        oss << ": " << message();
        full_message_ = oss.str();
    }
};

/**
 * @brief Malformed destination path
 */
class SyntaxError : public TransformError {
public:
    /**
     * @param path Full path text
     * @param offset Offset of the first character that could not be matched
     * @param reason What went wrong
     */
    SyntaxError(std::string path, std::size_t offset, const std::string& reason)
        : TransformError(reason + " near '" + remainder_of(path, offset) +
                         "' at offset " + std::to_string(offset) +
                         " (full: '" + path + "')")
        , path_(std::move(path))
        , offset_(offset)
    {}

    const std::string& path() const noexcept { return path_; }
    std::size_t offset() const noexcept { return offset_; }

    /// Unparsed remainder of the path starting at offset()
    std::string remainder() const { return remainder_of(path_, offset_); }

private:
    std::string path_;
    std::size_t offset_;

    static std::string remainder_of(const std::string& path, std::size_t offset) {
        return offset < path.size() ? path.substr(offset) : std::string{};
    }
};

/**
 * @brief Container/segment kind conflict during navigation
 *
 * Raised when an integer segment meets a non-array or a string segment
 * meets a non-object.
 */
class TypeMismatchError : public TransformError {
public:
    /**
     * @param path Full path text being navigated
     * @param segment_index 0-based index of the conflicting segment
     * @param expected Container kind the segment requires ("array"/"object")
     * @param actual Type actually found
     */
    TypeMismatchError(std::string path, std::size_t segment_index,
                      std::string expected, std::string actual)
        : TransformError("Cannot navigate into " + actual + " (expected " +
                         expected + ") at segment " +
                         std::to_string(segment_index) + " of path '" + path + "'")
        , path_(std::move(path))
        , segment_index_(segment_index)
        , expected_(std::move(expected))
        , actual_(std::move(actual))
    {}

    const std::string& path() const noexcept { return path_; }
    std::size_t segment_index() const noexcept { return segment_index_; }
    const std::string& expected() const noexcept { return expected_; }
    const std::string& actual() const noexcept { return actual_; }

private:
    std::string path_;
    std::size_t segment_index_;
    std::string expected_;
    std::string actual_;
};

/**
 * @brief Malformed ETL or chain spec shape
 */
class FormatError : public TransformError {
public:
    using TransformError::TransformError;
};

/**
 * @brief Mapping lacking src/dst, or chain step lacking etl/src
 */
class MissingRequiredFieldError : public TransformError {
public:
    /**
     * @param field Name of the missing key
     * @param owner What should have carried it ("mapping", "step")
     */
    MissingRequiredFieldError(std::string field, const std::string& owner)
        : TransformError(owner + " is missing required field '" + field + "'")
        , field_(std::move(field))
    {}

    const std::string& field() const noexcept { return field_; }

private:
    std::string field_;
};

/**
 * @brief "$prev" sentinel used before any step produced an output
 */
class InvalidChainStateError : public TransformError {
public:
    using TransformError::TransformError;
};

/**
 * @brief Mapping mode outside {upsert, replace}
 */
class UnsupportedModeError : public TransformError {
public:
    explicit UnsupportedModeError(std::string mode)
        : TransformError("Unsupported mode: '" + mode + "' (expected upsert or replace)")
        , mode_(std::move(mode))
    {}

    const std::string& mode() const noexcept { return mode_; }

private:
    std::string mode_;
};

/**
 * @brief Expression evaluation failed (syntax or runtime)
 */
class ExpressionError : public TransformError {
public:
    /**
     * @param expression Program text handed to the evaluator
     * @param details Evaluator's description of the failure
     */
    ExpressionError(std::string expression, std::string details)
        : TransformError("Expression error in '" + expression + "': " + details)
        , expression_(std::move(expression))
        , details_(std::move(details))
    {}

    const std::string& expression() const noexcept { return expression_; }
    const std::string& details() const noexcept { return details_; }

private:
    std::string expression_;
    std::string details_;
};

/**
 * @brief Evaluation ran past the configured deadline
 */
class EvaluationTimeout : public TransformError {
public:
    EvaluationTimeout(std::string expression, std::chrono::milliseconds limit)
        : TransformError("Evaluation of '" + expression + "' exceeded " +
                         std::to_string(limit.count()) + " ms")
        , expression_(std::move(expression))
        , limit_(limit)
    {}

    const std::string& expression() const noexcept { return expression_; }
    std::chrono::milliseconds limit() const noexcept { return limit_; }

private:
    std::string expression_;
    std::chrono::milliseconds limit_;
};

/**
 * @brief Invalid chain or engine configuration
 */
class ConfigError : public TransformError {
public:
    using TransformError::TransformError;
};

/**
 * @brief Referenced file not found
 */
class FileNotFoundError : public TransformError {
public:
    explicit FileNotFoundError(std::string path)
        : TransformError("File not found: " + path)
        , path_(std::move(path))
    {}

    const std::string& path() const noexcept { return path_; }

private:
    std::string path_;
};

/**
 * @brief File parse error (JSON/TOML syntax)
 */
class ParseError : public TransformError {
public:
    ParseError(std::string file, std::string details)
        : TransformError("Parse error in '" + file + "': " + details)
        , file_(std::move(file))
        , details_(std::move(details))
    {}

    const std::string& file() const noexcept { return file_; }
    const std::string& details() const noexcept { return details_; }

private:
    std::string file_;
    std::string details_;
};

} // namespace jtl

#endif // JTL_ERRORS_HPP
