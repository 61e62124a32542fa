#include <chunklog/cli.hpp>
#include <chunklog/config.hpp>

#include <string_view>

namespace chunklog {

static bool has_arg(int i, int argc) { return i + 1 < argc; }

// -i/-o/-f/-c options shared by "export" and the legacy form.
static ParseResult parse_export_opts(int i, int argc, char **argv,
                                     const char *what) {
  ParseResult r{};
  CmdExport c{};
  for (; i < argc; i++) {
    std::string_view a = argv[i];
    if ((a == "-i" || a == "--input") && has_arg(i, argc)) {
      c.input = argv[++i];
    } else if ((a == "-o" || a == "--output") && has_arg(i, argc)) {
      c.output = argv[++i];
    } else if ((a == "-f" || a == "--format") && has_arg(i, argc)) {
      std::string_view v = argv[++i];
      if (v == "text")
        c.format = ExportFormat::TEXT;
      else if (v == "json")
        c.format = ExportFormat::JSON;
      else {
        r.error = std::string(what) + ": --format must be text or json";
        return r;
      }
    } else if ((a == "-c" || a == "--compress") && has_arg(i, argc)) {
      auto comp = parse_compression(argv[++i]);
      if (!comp) {
        r.error = std::string(what) + ": --compress must be none, gzip or zstd";
        return r;
      }
      c.compress = *comp;
    } else {
      r.error = std::string(what) + ": unexpected argument " + std::string(a);
      return r;
    }
  }
  if (c.input.empty() || c.output.empty()) {
    r.error = std::string(what) + ": both --input/-i and --output/-o required";
    return r;
  }
  r.cmd = c;
  return r;
}

ParseResult parse_cli(int argc, char **argv) {
  ParseResult r{};
  if (argc < 2) {
    r.cmd = CmdHelp{};
    return r;
  }

  std::string cmd = argv[1];
  if (cmd == "--help" || cmd == "-h" || cmd == "help") {
    r.cmd = CmdHelp{};
    return r;
  }
  if (cmd == "--version" || cmd == "version") {
    r.cmd = CmdVersion{};
    return r;
  }

  if (cmd == "export")
    return parse_export_opts(2, argc, argv, "export");

  if (cmd == "tail") {
    CmdTail c{};
    for (int i = 2; i < argc; i++) {
      std::string_view a = argv[i];
      if ((a == "-n" || a == "--lines") && has_arg(i, argc)) {
        auto n = parse_u64(argv[++i]);
        if (!n) {
          r.error = "tail: --lines expects a non-negative number";
          return r;
        }
        c.lines = static_cast<size_t>(*n);
      } else if (a == "-f" || a == "--follow") {
        c.follow = true;
      } else if (c.file.empty() && !a.starts_with("-")) {
        c.file = a;
      } else {
        r.error = "tail: unexpected argument " + std::string(a);
        return r;
      }
    }
    if (c.file.empty()) {
      r.error = "tail: file required";
      return r;
    }
    r.cmd = c;
    return r;
  }

  if (cmd == "grep") {
    CmdGrep c{};
    int positional = 0;
    for (int i = 2; i < argc; i++) {
      std::string_view a = argv[i];
      if (a == "-i" || a == "--ignore-case") {
        c.ignore_case = true;
      } else if (positional == 0) {
        c.pattern = a;
        ++positional;
      } else if (positional == 1) {
        c.file = a;
        ++positional;
      } else {
        r.error = "grep: unexpected argument " + std::string(a);
        return r;
      }
    }
    if (positional < 2) {
      r.error = "grep: pattern and file required";
      return r;
    }
    r.cmd = c;
    return r;
  }

  // legacy form: chunklog -i IN -o OUT [-f ..] [-c ..]
  if (!cmd.empty() && cmd[0] == '-')
    return parse_export_opts(1, argc, argv, "export");

  r.error = "unknown command: " + cmd;
  return r;
}

} // namespace chunklog
