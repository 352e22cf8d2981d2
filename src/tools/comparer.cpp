#include <boost/program_options.hpp>
#include <spdlog/spdlog.h>
#include <ypbank/codec/error.hpp>
#include <ypbank/codec/format.hpp>
#include <ypbank/common/logging.hpp>
#include <ypbank/compare/comparer.hpp>

#include <exception>
#include <fstream>
#include <iostream>
#include <optional>
#include <string>
#include <vector>

namespace {

namespace po = boost::program_options;

struct input_file final {
  std::string path;
  ypbank::codec::format_t format{};
};

std::optional<input_file> get_input(const po::variables_map& vm,
                                    const std::string& file_option,
                                    const std::string& format_option) {
  auto path = vm[file_option].as<std::string>();
  auto format_name = vm[format_option].as<std::string>();
  auto format =
      ypbank::schema::try_from_string<ypbank::codec::format_t>(format_name);
  if (!format) {
    spdlog::error("Unknown --{} '{}' (expected binary|text|csv|dummy)",
                  format_option, format_name);
    return std::nullopt;
  }
  return input_file{.path = path, .format = *format};
}

std::optional<std::vector<ypbank::schema::tx_record_t>> read_records(
    const input_file& file) {
  auto input = std::ifstream{file.path, std::ios::binary};
  if (!input.good()) {
    spdlog::error("Failed opening input file '{}'", file.path);
    return std::nullopt;
  }
  auto records = ypbank::codec::parse_records(file.format, input);
  spdlog::debug("Read {} records from '{}'", records.size(), file.path);
  return records;
}

int run(const po::variables_map& vm) {
  auto first = get_input(vm, "file1", "format1");
  auto second = get_input(vm, "file2", "format2");
  if (!first || !second) {
    return 1;
  }

  std::cout << "Comparing 2 files\n\t1:'" << first->path
            << "':" << ypbank::codec::to_string(first->format) << "\n\t2:'"
            << second->path
            << "':" << ypbank::codec::to_string(second->format) << "\n\n";

  auto first_records = read_records(*first);
  if (!first_records) {
    return 1;
  }
  auto second_records = read_records(*second);
  if (!second_records) {
    return 1;
  }

  auto result = ypbank::compare::compare_records(*first_records,
                                                 *second_records);
  if (result.identical()) {
    std::cout << "All transaction records are identical." << std::endl;
    return 0;
  }

  std::cout << "There are " << result.unmatched.size()
            << " unique transactions that don't match between the files\n";
  for (const auto& unmatched : result.unmatched) {
    auto lacking = unmatched.surplus_in == ypbank::compare::record_source_t::first
                       ? "#2"
                       : "#1";
    std::cout << "There is no equivalent for transaction "
              << unmatched.record.id << " in the file '" << lacking << "'\n";
  }
  std::cout.flush();
  return 0;
}

}  // namespace

int main(int argc, const char** argv) {
  auto options = po::options_description{"ypbank_comparer options"};
  options.add_options()("help,h", "show help")(
      "file1", po::value<std::string>(), "first input file path")(
      "format1", po::value<std::string>(), "binary|text|csv|dummy")(
      "file2", po::value<std::string>(), "second input file path")(
      "format2", po::value<std::string>(), "binary|text|csv|dummy")(
      "verbose,v", "enable debug logging");

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

  ypbank::common::configure_logging("comparer", vm.contains("verbose"));

  if (!vm.contains("file1") || !vm.contains("format1") ||
      !vm.contains("file2") || !vm.contains("format2")) {
    spdlog::error("--file1, --format1, --file2 and --format2 are required");
    std::cerr << options << std::endl;
    spdlog::shutdown();
    return 1;
  }

  auto status = 1;
  try {
    status = run(vm);
  } catch (const ypbank::codec::app_error& ex) {
    spdlog::error("Error occurred during comparison: {}", ex.what());
  } catch (const std::exception& ex) {
    spdlog::error("Unexpected failure: {}", ex.what());
  }

  spdlog::shutdown();
  return status;
}
