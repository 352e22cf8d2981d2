#pragma once
#include <ypbank/schema/transaction_record.hpp>

#include <cstdint>
#include <vector>

namespace ypbank::compare {

enum class record_source_t : uint8_t { first = 1, second = 2 };

/// A distinct record whose occurrence counts differ between the inputs.
struct unmatched_record final {
  schema::tx_record_t record;
  /// Occurrences in the first collection minus occurrences in the second.
  int64_t net_count{};
  /// Collection holding the surplus occurrences.
  record_source_t surplus_in{record_source_t::first};
};

using unmatched_record_t = unmatched_record;

struct comparison_result final {
  std::vector<unmatched_record_t> unmatched;

  bool identical() const noexcept { return unmatched.empty(); }
};

using comparison_result_t = comparison_result;

/// Multiset difference keyed by full record equality.
///
/// Unmatched records are reported in the order they were first seen, first
/// collection before second.
comparison_result_t compare_records(
    const std::vector<schema::tx_record_t>& first,
    const std::vector<schema::tx_record_t>& second);

}  // namespace ypbank::compare
