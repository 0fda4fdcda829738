#pragma once

#include <stdexcept>
#include <string>

// Open/read/seek failures on the source file or its temporary copy.
class IOError : public std::runtime_error {
public:
  explicit IOError(const std::string &what) : std::runtime_error(what) {}
};

// Invalid user configuration (delimiter, command-line options).
class ConfigError : public std::runtime_error {
public:
  explicit ConfigError(const std::string &what) : std::runtime_error(what) {}
};

// A record that cannot be split with the configured delimiter.
class ParseError : public std::runtime_error {
public:
  explicit ParseError(const std::string &what) : std::runtime_error(what) {}
};

// "<context>: <path>: <strerror(errno)>"
std::string errno_message(const std::string &context, const std::string &path);
