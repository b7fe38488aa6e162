#include "dnl/queuemgt.hpp"
#include "dnl/requests.hpp"
#include "dnl/shared.hpp"
#include "kbharvest.hpp"
#include <CLI/CLI.hpp>
#include <cerrno>
#include <cstdlib>
#include <cstring>
#include <exception>
#include <filesystem>
#include <fmt/format.h>
#include <fstream>
#include <iostream>
#include <stdexcept>
#include <string>
#include <system_error>

void define_options(CLI::App& app, kbharvest::dnl::cli_config_t& cli) {

  app.add_option("-i,--input", cli.input_filename,
                 "File input: a file containing one URL per line. If not set urls are read from "
                 "STDIN.");

  app.add_option("-o,--output-dir", cli.output_dir,
                 "Output directory. Created if it does not exist.")
      ->required();

  app.add_option("-w,--workers", cli.workers,
                 fmt::format("Number of downloads in flight at once (default: {})", cli.workers))
      ->check(CLI::PositiveNumber);

  app.add_flag("-n,--nocheck{false}", cli.check,
               "Don't check that each file starts with a valid KBART header before downloading it.");

  app.add_flag("--debug", cli.debug,
               "Send verbose thread debug output to stderr. Turns off progress.");

  app.add_flag("--progress,!--no-progress", cli.progress, "Show a progress meter on stderr.");

  app.add_flag("--quiet", cli.quiet, "Only report failures.");
}

void prepare_output_dir(const kbharvest::dnl::cli_config_t& cli) {
  std::error_code ec;
  std::filesystem::create_directories(cli.output_dir, ec);
  if (ec) {
    throw std::runtime_error(
        fmt::format("Error creating output directory '{}'. Because: \"{}\".", cli.output_dir,
                    ec.message()));
  }
  if (!std::filesystem::is_directory(cli.output_dir)) {
    throw std::runtime_error(fmt::format("'{}' is not a directory.", cli.output_dir));
  }
}

kbharvest::harvest_summary launch(const kbharvest::dnl::cli_config_t& cli) {
  using kbharvest::dnl::logger;

  kbharvest::dnl::curl_transport tp;

  if (cli.input_filename.empty()) {
    logger.info("reading urls from stdin");
    return kbharvest::dnl::run(cli, std::cin, tp);
  }

  auto input_stream = std::ifstream(cli.input_filename);
  if (!input_stream) {
    throw std::runtime_error(fmt::format("Error opening '{}' for reading. Because: \"{}\".",
                                         cli.input_filename,
                                         std::strerror(errno))); // NOLINT errno
  }
  logger.info(fmt::format("reading urls from {}", cli.input_filename));
  return kbharvest::dnl::run(cli, input_stream, tp);
}

int main(int argc, char* argv[]) {
  kbharvest::dnl::cli_config_t cli;

  CLI::App app("KBART file harvester");
  define_options(app, cli);
  CLI11_PARSE(app, argc, argv);

  if (cli.debug) cli.progress = false;

  kbharvest::dnl::logger.debug = cli.debug;
  kbharvest::dnl::logger.quiet = cli.quiet;

  try {
    prepare_output_dir(cli);
    auto summary = launch(cli);
    kbharvest::dnl::logger.info(fmt::format("harvested {} files into {}, {} failed",
                                            summary.succeeded, cli.output_dir, summary.failed));
  } catch (const std::exception& e) {
    std::cerr << fmt::format("Error: {}\n", e.what());
    return EXIT_FAILURE;
  }
  return EXIT_SUCCESS;
}
