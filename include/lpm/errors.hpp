#ifndef LPM_ERRORS_HPP
#define LPM_ERRORS_HPP

#include <stdexcept>
#include <string>
#include <utility>

namespace lpm {

// =============================================================================
// Error Codes
// =============================================================================

enum class ErrorCode {
    OutOfBoundsTick,
    InvalidRange,
    InvalidInput,
    NoPriceData,
    Arithmetic,
    Config,
    Transient,
    Chain,
    Revert,
    Unauthorized,
    PositionIdNotFound,
};

const char* error_code_name(ErrorCode code);

// Base for every error raised by the library
class LpmError : public std::runtime_error {
public:
    LpmError(ErrorCode code, const std::string& msg)
        : std::runtime_error(msg), code_(code) {}

    [[nodiscard]] ErrorCode code() const { return code_; }

private:
    ErrorCode code_;
};

// =============================================================================
// Invalid input (refused before any mutating call)
// =============================================================================

class OutOfBoundsTick : public LpmError {
public:
    explicit OutOfBoundsTick(const std::string& msg)
        : LpmError(ErrorCode::OutOfBoundsTick, msg) {}
};

class InvalidRange : public LpmError {
public:
    explicit InvalidRange(const std::string& msg)
        : LpmError(ErrorCode::InvalidRange, msg) {}
};

class InvalidInput : public LpmError {
public:
    explicit InvalidInput(const std::string& msg)
        : LpmError(ErrorCode::InvalidInput, msg) {}
};

class NoPriceData : public LpmError {
public:
    explicit NoPriceData(const std::string& msg)
        : LpmError(ErrorCode::NoPriceData, msg) {}
};

class ArithmeticError : public LpmError {
public:
    explicit ArithmeticError(const std::string& msg)
        : LpmError(ErrorCode::Arithmetic, msg) {}
};

class ConfigError : public LpmError {
public:
    explicit ConfigError(const std::string& msg)
        : LpmError(ErrorCode::Config, msg) {}
};

// =============================================================================
// Chain errors
// =============================================================================

// Rate limiting and timeouts; the only class the retry policy retries
class TransientError : public LpmError {
public:
    explicit TransientError(const std::string& msg)
        : LpmError(ErrorCode::Transient, msg) {}
};

class ChainError : public LpmError {
public:
    explicit ChainError(const std::string& msg)
        : LpmError(ErrorCode::Chain, msg) {}
};

class RevertError : public LpmError {
public:
    RevertError(const std::string& msg, std::string tx_hash = {})
        : LpmError(ErrorCode::Revert, msg), tx_hash_(std::move(tx_hash)) {}

    [[nodiscard]] const std::string& tx_hash() const { return tx_hash_; }

private:
    std::string tx_hash_;
};

class UnauthorizedError : public LpmError {
public:
    explicit UnauthorizedError(const std::string& msg)
        : LpmError(ErrorCode::Unauthorized, msg) {}
};

class PositionIdNotFound : public LpmError {
public:
    PositionIdNotFound(const std::string& msg, std::string tx_hash)
        : LpmError(ErrorCode::PositionIdNotFound, msg), tx_hash_(std::move(tx_hash)) {}

    [[nodiscard]] const std::string& tx_hash() const { return tx_hash_; }

private:
    std::string tx_hash_;
};

} // namespace lpm

#endif // LPM_ERRORS_HPP
