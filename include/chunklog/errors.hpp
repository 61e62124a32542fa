#pragma once
#include <stdexcept>
#include <string>

namespace chunklog {

// Base of every error raised by the library.
class Error : public std::runtime_error {
public:
  explicit Error(const std::string &what) : std::runtime_error(what) {}
};

// Bad arguments, bad environment values, codec mismatch on append.
class ConfigurationError : public Error {
public:
  using Error::Error;
};

// Not a .clog file: bad magic, bad version, truncated header or chunk.
class MalformedFileError : public Error {
public:
  using Error::Error;
};

// Unknown compression code, or a codec this build does not provide.
class UnsupportedCompressionError : public Error {
public:
  using Error::Error;
};

class ReadError : public Error {
public:
  using Error::Error;
};

class WriteError : public Error {
public:
  using Error::Error;
};

} // namespace chunklog
