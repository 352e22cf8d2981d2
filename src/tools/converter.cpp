#include <boost/program_options.hpp>
#include <spdlog/spdlog.h>
#include <ypbank/codec/error.hpp>
#include <ypbank/codec/format.hpp>
#include <ypbank/common/logging.hpp>

#include <exception>
#include <fstream>
#include <iostream>
#include <optional>
#include <string>

namespace {

namespace po = boost::program_options;

std::optional<ypbank::codec::format_t> get_format(const po::variables_map& vm,
                                                  const std::string& name) {
  auto value = vm[name].as<std::string>();
  auto format = ypbank::schema::try_from_string<ypbank::codec::format_t>(value);
  if (!format) {
    spdlog::error("Unknown --{} '{}' (expected binary|text|csv|dummy)", name,
                  value);
  }
  return format;
}

int run(const po::variables_map& vm) {
  auto input_path = vm["input"].as<std::string>();
  auto input_format = get_format(vm, "input-format");
  auto output_format = get_format(vm, "output-format");
  if (!input_format || !output_format) {
    return 1;
  }

  spdlog::info("Converting from '{}':{} to :{}", input_path,
               ypbank::codec::to_string(*input_format),
               ypbank::codec::to_string(*output_format));

  auto input = std::ifstream{input_path, std::ios::binary};
  if (!input.good()) {
    spdlog::error("Failed opening input file '{}'", input_path);
    return 1;
  }
  auto records = ypbank::codec::parse_records(*input_format, input);
  spdlog::info("{} records successfully ingested", records.size());

  if (!vm.contains("output")) {
    ypbank::codec::write_records(*output_format, std::cout, records);
    std::cout.flush();
    return 0;
  }

  auto output_path = vm["output"].as<std::string>();
  auto output =
      std::ofstream{output_path, std::ios::binary | std::ios::trunc};
  if (!output.good()) {
    spdlog::error("Failed opening output file '{}'", output_path);
    return 1;
  }
  ypbank::codec::write_records(*output_format, output, records);
  output.flush();
  if (!output.good()) {
    spdlog::error("Failed writing output file '{}'", output_path);
    return 1;
  }
  spdlog::info("Wrote {} records to '{}'", records.size(), output_path);
  return 0;
}

}  // namespace

int main(int argc, const char** argv) {
  auto options = po::options_description{"ypbank_converter options"};
  options.add_options()("help,h", "show help")(
      "input,i", po::value<std::string>(), "input file path")(
      "input-format", po::value<std::string>(), "binary|text|csv|dummy")(
      "output-format", po::value<std::string>(), "binary|text|csv|dummy")(
      "output,o", po::value<std::string>(),
      "output file path (stdout when omitted)")("verbose,v",
                                                "enable debug logging");

  auto vm = po::variables_map{};
  try {
    po::store(po::parse_command_line(argc, argv, options), vm);
    po::notify(vm);
  } catch (const po::error& ex) {
    std::cerr << ex.what() << "\n" << options << std::endl;
    return 1;
  }

  if (vm.contains("help")) {
    std::cout << options << std::endl;
    return 0;
  }

  ypbank::common::configure_logging("converter", vm.contains("verbose"));

  if (!vm.contains("input") || !vm.contains("input-format") ||
      !vm.contains("output-format")) {
    spdlog::error(
        "--input, --input-format and --output-format are all required");
    std::cerr << options << std::endl;
    spdlog::shutdown();
    return 1;
  }

  auto status = 1;
  try {
    status = run(vm);
  } catch (const ypbank::codec::app_error& ex) {
    spdlog::error("Error occurred during conversion: {}", ex.what());
  } catch (const std::exception& ex) {
    spdlog::error("Unexpected failure: {}", ex.what());
  }

  spdlog::shutdown();
  return status;
}
