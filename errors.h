#pragma once
#include <stdexcept>
#include <string>

// every error the engine raises derives from SlotError
class SlotError : public std::runtime_error {
public:
    explicit SlotError(const std::string& what) : std::runtime_error(what) {}
};

// rejected at construction / reconfiguration, never mid-spin
class ConfigError : public SlotError {
public:
    explicit ConfigError(const std::string& what) : SlotError("invalid config: " + what) {}
};

// bet outside [minBet, maxBet]; thrown before any randomness is drawn
class BetError : public SlotError {
public:
    explicit BetError(const std::string& what) : SlotError("invalid bet: " + what) {}
};

class UnsupportedError : public SlotError {
public:
    explicit UnsupportedError(const std::string& what) : SlotError("unsupported: " + what) {}
};

class NotFoundError : public SlotError {
public:
    explicit NotFoundError(const std::string& what) : SlotError("not found: " + what) {}
};
