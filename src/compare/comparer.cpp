#include <spdlog/spdlog.h>
#include <ypbank/compare/comparer.hpp>

#include <unordered_map>

namespace ypbank::compare {

comparison_result_t compare_records(
    const std::vector<schema::tx_record_t>& first,
    const std::vector<schema::tx_record_t>& second) {
  auto counts = std::unordered_map<schema::tx_record_t, int64_t>{};
  auto order = std::vector<const schema::tx_record_t*>{};
  counts.reserve(first.size() + second.size());

  auto tally = [&](const schema::tx_record_t& record, const int64_t delta) {
    auto [it, inserted] = counts.try_emplace(record, 0);
    if (inserted) {
      order.push_back(&it->first);
    }
    it->second += delta;
  };
  for (const auto& record : first) {
    tally(record, 1);
  }
  for (const auto& record : second) {
    tally(record, -1);
  }

  auto result = comparison_result_t{};
  for (const auto* record : order) {
    auto count = counts.at(*record);
    if (count == 0) {
      continue;
    }
    result.unmatched.push_back(unmatched_record_t{
        .record = *record,
        .net_count = count,
        .surplus_in = count > 0 ? record_source_t::first
                                : record_source_t::second});
  }

  spdlog::debug("Compared {} and {} record(s): {} distinct unmatched",
                first.size(), second.size(), result.unmatched.size());
  return result;
}

}  // namespace ypbank::compare
