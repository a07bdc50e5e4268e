#pragma once
#include <stdexcept>
#include <string>

namespace etcalc {

// Root of every error raised by the calculator core
class EtcError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

// Malformed or incompatible scene description
class ConfigurationError : public EtcError {
public:
    using EtcError::EtcError;
};

// Spectral resampling outside the source range
class DomainError : public EtcError {
public:
    using EtcError::EtcError;
};

// Detector well capacity exceeded
class SaturationError : public EtcError {
public:
    using EtcError::EtcError;
};

// Root finder did not converge / no physical root
class NoSolutionError : public EtcError {
public:
    using EtcError::EtcError;
};

// Arithmetic between incompatible physical dimensions
class UnitMismatchError : public EtcError {
public:
    using EtcError::EtcError;
};

} // namespace etcalc
