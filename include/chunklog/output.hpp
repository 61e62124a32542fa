#pragma once
#include <chunklog/format.hpp>

#include <filesystem>
#include <memory>
#include <string_view>

namespace chunklog {

// Byte sink for exported text, optionally compressed as a whole file.
class OutputFile {
public:
  virtual ~OutputFile() = default;
  // Throws WriteError.
  virtual void write(std::string_view data) = 0;
  // Finishes the stream (trailers, flush). Idempotent.
  virtual void close() = 0;
};

// Throws WriteError when the file cannot be created and
// UnsupportedCompressionError when the codec is not available.
std::unique_ptr<OutputFile> open_output(const std::filesystem::path &path,
                                        Compression c);

} // namespace chunklog
