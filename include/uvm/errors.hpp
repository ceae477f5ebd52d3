#pragma once

#include <stdexcept>
#include <string>

namespace uvm {

class Error : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

// Human-supplied oto parameters violating consonant >= offset or preutterance >= offset.
class InvalidTimingError : public Error {
public:
    InvalidTimingError(std::string field, double value, double offset);

    [[nodiscard]] const std::string& field() const { return field_; }
    [[nodiscard]] double shortfall() const { return shortfall_; }

private:
    std::string field_;
    double shortfall_ = 0.0;
};

// Entry fields that cannot be written as an oto.ini line.
class OtoValidationError : public Error {
public:
    using Error::Error;
};

class OtoEntryExistsError : public Error {
public:
    using Error::Error;
};

class OtoNotFoundError : public Error {
public:
    using Error::Error;
};

class SessionNotFoundError : public Error {
public:
    using Error::Error;
};

class SessionStateError : public Error {
public:
    using Error::Error;
};

class SessionValidationError : public Error {
public:
    using Error::Error;
};

class AlignmentError : public Error {
public:
    using Error::Error;
};

class AudioError : public Error {
public:
    using Error::Error;
};

class StoreError : public Error {
public:
    using Error::Error;
};

class ConfigError : public Error {
public:
    using Error::Error;
};

}  // namespace uvm
