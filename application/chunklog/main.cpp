#include <chunklog/app.hpp>
#include <spdlog/cfg/env.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

int main(int argc, char** argv) {
  // stdout carries records; diagnostics go to stderr
  spdlog::set_default_logger(spdlog::stderr_color_mt("cli"));
  spdlog::set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%^%l%$] %v");
  spdlog::cfg::load_env_levels();
  return chunklog::App{}.run(argc, argv);
}
