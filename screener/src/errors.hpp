#pragma once

#include <stdexcept>
#include <string>

class ScreenerError : public std::runtime_error {
public:
    explicit ScreenerError(const std::string& what) : std::runtime_error(what) {}
};

// Series too short for one indicator. Degrades that indicator only.
class InsufficientHistory : public ScreenerError {
public:
    InsufficientHistory(const std::string& indicator, size_t have, size_t need)
        : ScreenerError(indicator + ": need " + std::to_string(need) +
                        " points, have " + std::to_string(have))
        , indicator_(indicator) {}

    const std::string& indicator() const { return indicator_; }

private:
    std::string indicator_;
};

// Transient fetch failure (timeout, rate limit, 5xx). The symbol keeps its
// previous snapshot for this generation.
class ProviderUnavailable : public ScreenerError {
public:
    using ScreenerError::ScreenerError;
};

// Unknown or delisted symbol. The symbol is dropped from the generation.
class ProviderFatal : public ScreenerError {
public:
    using ScreenerError::ScreenerError;
};

// No symbol produced fresh data; the previous generation stays in place.
class RefreshFailed : public ScreenerError {
public:
    using ScreenerError::ScreenerError;
};
