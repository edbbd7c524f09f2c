#pragma once

#include <stdexcept>
#include <string>

namespace stocktrade {

class TradingError : public std::runtime_error {
public:
    explicit TradingError(const std::string& message) : std::runtime_error(message) {}
};

// ===== Data errors (recovered as "no signal" / skipped symbol) =====

class InsufficientDataError : public TradingError {
public:
    InsufficientDataError(const std::string& symbol, size_t have, size_t need)
        : TradingError("insufficient data for " + symbol + ": have " +
                       std::to_string(have) + " bars, need " + std::to_string(need)),
          have_(have), need_(need) {}

    size_t have() const { return have_; }
    size_t need() const { return need_; }

private:
    size_t have_;
    size_t need_;
};

class MissingIndicatorError : public TradingError {
public:
    MissingIndicatorError(const std::string& symbol, const std::string& column)
        : TradingError("missing indicator '" + column + "' for " + symbol), column_(column) {}

    const std::string& column() const { return column_; }

private:
    std::string column_;
};

class DataUnavailableError : public TradingError {
public:
    explicit DataUnavailableError(const std::string& message) : TradingError(message) {}
};

// ===== Risk-constraint violations =====

class InsufficientCashError : public TradingError {
public:
    explicit InsufficientCashError(const std::string& message) : TradingError(message) {}
};

// ===== State-invariant violations =====

class SymbolAlreadyOpenError : public TradingError {
public:
    explicit SymbolAlreadyOpenError(const std::string& symbol)
        : TradingError("position already open for " + symbol) {}
};

class PositionNotFoundError : public TradingError {
public:
    explicit PositionNotFoundError(const std::string& symbol)
        : TradingError("no open position for " + symbol) {}
};

// ===== Configuration errors (fatal at run start) =====

class ConfigError : public TradingError {
public:
    explicit ConfigError(const std::string& message) : TradingError("config: " + message) {}
};

} // namespace stocktrade
