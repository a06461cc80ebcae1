#pragma once

#include <stdexcept>

namespace coastvi::cvi::core {

//! Structurally invalid top-level input (coastline, sampling parameters, transect set). Fatal for the run.
class InputError : public std::runtime_error {
public:
	using std::runtime_error::runtime_error;
};

//! No coastline segments were supplied.
class EmptyInputError : public InputError {
public:
	using InputError::InputError;
};

//! Malformed or missing threshold/palette configuration. Raised when tables are built.
class ConfigError : public std::runtime_error {
public:
	using std::runtime_error::runtime_error;
};

} // namespace coastvi::cvi::core
