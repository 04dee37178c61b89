#include "terminal.hpp"
#include "frontend.hpp"
#include "file_reader.hpp"
#include "logging.hpp"
#include "options.hpp"
#include <cstdio>
#include <filesystem>
#include <spdlog/spdlog.h>

int main(int argc, char** argv) {
  if (argc < 2) {
    std::fprintf(stderr, "usage: %s <trace>\n", argv[0]);
    return 2;
  }
  FrontendOptions opts;
  OptionLoader loader(opts);
  std::vector<std::string> rc_messages;
  std::string msg;
  if (auto rc = rc_path()) {
    if (!loader.load_file(*rc, rc_messages, msg)) rc_messages.push_back(msg);
  }
  if (!setup_logging(opts.log_file, opts.log_level, msg)) {
    std::fprintf(stderr, "%s\n", msg.c_str());
    return 1;
  }
  for (const auto& m : rc_messages) spdlog::warn("rc: {}", m);

  std::vector<std::string> trace;
  if (!mmap_readlines(std::filesystem::path(argv[1]), trace, msg)) {
    spdlog::error("{}", msg);
    std::fprintf(stderr, "%s\n", msg.c_str());
    return 1;
  }
  spdlog::info("replaying {} ({} lines)", argv[1], trace.size());

  Terminal term(opts.mouse);
  Frontend fe(opts, std::move(trace));
  fe.run();
  return 0;
}
