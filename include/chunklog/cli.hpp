#pragma once
#include <chunklog/format.hpp>

#include <optional>
#include <string>
#include <variant>

namespace chunklog {

enum class ExportFormat : uint8_t { TEXT, JSON };

struct CmdExport {
  std::string  input;
  std::string  output;
  ExportFormat format = ExportFormat::TEXT;
  Compression  compress = Compression::NONE;
};
struct CmdTail {
  std::string file;
  size_t      lines = 10;
  bool        follow = false;
};
struct CmdGrep {
  std::string pattern;
  std::string file;
  bool        ignore_case = false;
};
struct CmdHelp {};
struct CmdVersion {};

using Command = std::variant<CmdExport, CmdTail, CmdGrep, CmdHelp, CmdVersion>;

struct ParseResult {
  std::optional<Command> cmd;
  std::string error;
};

ParseResult parse_cli(int argc, char **argv);

} // namespace chunklog
