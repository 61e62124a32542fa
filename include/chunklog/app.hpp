#pragma once
#include <chunklog/cli.hpp>
#include <chunklog/format.hpp>

#include <string>

namespace chunklog {

// "ts|level|message"; continuation lines of a multi-line message are
// indented to the message column.
std::string render_text(const Record &r);
// {"timestamp": ..., "level": ..., "message": ...}
std::string render_json(const Record &r);
std::string json_escape(std::string_view s);

class App {
public:
  int run(int argc, char **argv);

private:
  int do_export(const CmdExport &c);
  int do_tail(const CmdTail &c);
  int do_grep(const CmdGrep &c);
};

} // namespace chunklog
