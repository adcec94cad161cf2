/**
@file
@brief Namespaces documentation.
*/

/**
@namespace devlog
@brief Development logging utilities.

@namespace devlog::level
@brief Dev log levels.

@namespace util
@brief Utility functions and types.

@namespace pulsekey
@brief Pulsekey core namespace.

@namespace pulsekey::core
@brief Core types and configuration.

@namespace pulsekey::core::config
@brief Configuration enumerations.

@namespace pulsekey::input
@brief Keyboard keys, key actuation, motion samples and the axis-to-key engines.

@namespace pulsekey::sys
@brief The per-device bridge that ties the input components together.

@namespace pulsekey::version
@brief Library version information.
*/
