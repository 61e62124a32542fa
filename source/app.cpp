#include <chunklog/app.hpp>
#include <chunklog/errors.hpp>
#include <chunklog/output.hpp>
#include <chunklog/reader.hpp>

#include <fmt/format.h>
#include <spdlog/spdlog.h>

#include <cstdio>
#include <filesystem>
#include <iostream>
#include <regex>

#ifndef CHUNKLOG_VERSION
#define CHUNKLOG_VERSION "unknown"
#endif

namespace fs = std::filesystem;

namespace chunklog {

static void print_help() {
  std::cout <<
      R"(chunklog - inspect .clog files

Usage:
  chunklog export -i <in.clog> -o <out> [-f text|json] [-c none|gzip|zstd]
  chunklog tail <file.clog> [-n N] [-f]
  chunklog grep <pattern> <file.clog> [-i]
  chunklog -i <in.clog> -o <out> [-f text|json] [-c none|gzip|zstd]

Environment:
  SPDLOG_LEVEL   diagnostics level (e.g. debug)
)";
}

std::string json_escape(std::string_view s) {
  std::string o;
  o.reserve(s.size() + 8);
  for (char c : s) {
    switch (c) {
    case '\"': o += "\\\""; break;
    case '\\': o += "\\\\"; break;
    case '\b': o += "\\b"; break;
    case '\f': o += "\\f"; break;
    case '\n': o += "\\n"; break;
    case '\r': o += "\\r"; break;
    case '\t': o += "\\t"; break;
    default:
      if (static_cast<unsigned char>(c) < 0x20)
        o += fmt::format("\\u{:04x}", static_cast<unsigned>(c));
      else
        o += c;
    }
  }
  return o;
}

std::string render_text(const Record &r) {
  const std::string pad(r.timestamp.size() + 1 + r.level.size() + 1, ' ');
  std::string msg;
  msg.reserve(r.message.size());
  for (char c : r.message) {
    msg += c;
    if (c == '\n') msg += pad;
  }
  return fmt::format("{}|{}|{}", r.timestamp, r.level, msg);
}

std::string render_json(const Record &r) {
  return fmt::format(R"({{"timestamp": "{}", "level": "{}", "message": "{}"}})",
                     json_escape(r.timestamp), json_escape(r.level),
                     json_escape(r.message));
}

static bool require_file(const std::string &p) {
  std::error_code ec;
  if (fs::exists(p, ec)) return true;
  spdlog::error("cannot open '{}': file does not exist", p);
  return false;
}

int App::do_export(const CmdExport &c) {
  if (!require_file(c.input)) return 1;

  Reader reader(c.input);
  auto out = open_output(c.output, c.compress);
  auto records = reader.read_records();

  bool first = true;
  if (c.format == ExportFormat::JSON) {
    out->write("[\n");
    while (auto r = records.next()) {
      if (!first) out->write(",\n");
      out->write("  " + render_json(*r));
      first = false;
    }
    out->write("\n]");
  } else {
    while (auto r = records.next()) {
      if (!first) out->write("\n");
      out->write(render_text(*r));
      first = false;
    }
  }
  out->close();

  spdlog::info("exported '{}' to '{}' (format: {}, compression: {})", c.input,
               c.output, c.format == ExportFormat::JSON ? "json" : "text",
               compression_name(c.compress));
  return 0;
}

int App::do_tail(const CmdTail &c) {
  if (!require_file(c.file)) return 1;

  Reader reader(c.file);
  for (const auto &r : reader.tail(c.lines))
    fmt::print("{}\n", render_text(r));
  std::fflush(stdout);

  if (c.follow) {
    // tail() left the position at the end; pick up from there
    auto records = reader.read_records(ReadOptions{.follow = true});
    while (auto r = records.next()) {
      fmt::print("{}\n", render_text(*r));
      std::fflush(stdout);
    }
  }
  return 0;
}

int App::do_grep(const CmdGrep &c) {
  if (!require_file(c.file)) return 1;

  auto flags = std::regex::ECMAScript;
  if (c.ignore_case) flags |= std::regex::icase;
  const std::regex re(c.pattern, flags);

  Reader reader(c.file);
  auto records = reader.read_records();
  while (auto r = records.next()) {
    const std::string line = render_text(*r);
    if (std::regex_search(line, re))
      fmt::print("{}\n", line);
  }
  return 0;
}

int App::run(int argc, char **argv) {
  auto pr = parse_cli(argc, argv);
  if (!pr.cmd) {
    spdlog::error("{}", pr.error);
    print_help();
    return 1;
  }

  try {
    if (std::holds_alternative<CmdHelp>(*pr.cmd)) {
      print_help();
      return argc < 2 ? 1 : 0;
    }
    if (std::holds_alternative<CmdVersion>(*pr.cmd)) {
      std::cout << "chunklog " << CHUNKLOG_VERSION << "\n";
      return 0;
    }
    if (auto *c = std::get_if<CmdExport>(&*pr.cmd)) return do_export(*c);
    if (auto *c = std::get_if<CmdTail>(&*pr.cmd)) return do_tail(*c);
    if (auto *c = std::get_if<CmdGrep>(&*pr.cmd)) return do_grep(*c);
  } catch (const MalformedFileError &e) {
    spdlog::error("not a recognized .clog file: {}", e.what());
  } catch (const UnsupportedCompressionError &e) {
    spdlog::error("unsupported compression: {}", e.what());
  } catch (const ReadError &e) {
    spdlog::error("read failed: {}", e.what());
  } catch (const WriteError &e) {
    spdlog::error("write failed: {}", e.what());
  } catch (const ConfigurationError &e) {
    spdlog::error("{}", e.what());
  } catch (const std::regex_error &e) {
    spdlog::error("bad pattern: {}", e.what());
  } catch (const std::exception &e) {
    spdlog::error("{}", e.what());
  }
  return 1;
}

} // namespace chunklog
