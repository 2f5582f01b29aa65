/**
 * @file errors.hpp
 * @brief Exception types raised by the traversal engine
 */

#pragma once

#include <stdexcept>
#include <string>

namespace Lexigraph {

/**
 * @brief Base of every error the engine raises on purpose.
 */
class LexigraphError : public std::runtime_error {
public:
    explicit LexigraphError(const std::string& message) : std::runtime_error(message) {}
};

/**
 * @brief A referenced word id (or word text) does not exist in the store.
 */
class NotFoundError : public LexigraphError {
public:
    explicit NotFoundError(const std::string& message) : LexigraphError(message) {}
};

/**
 * @brief Malformed bound parameters or malformed input documents.
 */
class InvalidArgumentError : public LexigraphError {
public:
    explicit InvalidArgumentError(const std::string& message) : LexigraphError(message) {}
};

/**
 * @brief The store's underlying I/O failed. Traversal is aborted, never retried.
 */
class StoreUnavailableError : public LexigraphError {
public:
    explicit StoreUnavailableError(const std::string& message) : LexigraphError(message) {}
};

} // namespace Lexigraph
