#pragma once
#include <stdexcept>
#include <string>

// Bad caller input (quality out of range, malformed config). Never retried.
class ValidationError : public std::runtime_error {
public:
    explicit ValidationError(const std::string& msg) : std::runtime_error(msg) {}
};

// Unknown item id, e.g. a stale reference to deleted content.
class NotFoundError : public std::runtime_error {
public:
    explicit NotFoundError(const std::string& msg) : std::runtime_error(msg) {}
};

// Optimistic-concurrency race; caller re-reads and retries.
class ConflictError : public std::runtime_error {
public:
    explicit ConflictError(const std::string& msg) : std::runtime_error(msg) {}
};

// Persistence failure (I/O, encryption, corrupt file).
class StorageError : public std::runtime_error {
public:
    explicit StorageError(const std::string& msg) : std::runtime_error(msg) {}
};
