#include <gtest/gtest.h>
#include <ypbank/schema/transaction_record.hpp>
#include <ypbank/testing/common.hpp>

#include <functional>
#include <unordered_set>

using ypbank::schema::tx_record_t;

TEST(transaction_record, equality_covers_every_field) {
  auto base = ypbank::testing::make_record(7);
  EXPECT_EQ(base, ypbank::testing::make_record(7));

  auto changed = base;
  changed.timestamp += 1;
  EXPECT_NE(base, changed);

  changed = base;
  changed.description += " ";
  EXPECT_NE(base, changed);

  changed = base;
  changed.status = ypbank::schema::transaction_status_t::pending;
  EXPECT_NE(base, changed);
}

TEST(transaction_record, equal_records_hash_equal) {
  auto hasher = std::hash<tx_record_t>{};
  EXPECT_EQ(hasher(ypbank::testing::make_record(3)),
            hasher(ypbank::testing::make_record(3)));

  auto set = std::unordered_set<tx_record_t>{};
  set.insert(ypbank::testing::make_record(1));
  set.insert(ypbank::testing::make_record(1));
  set.insert(ypbank::testing::make_record(2));
  EXPECT_EQ(set.size(), 2u);
}

TEST(transaction_record, default_record) {
  auto record = tx_record_t{};
  EXPECT_EQ(record.id, 0u);
  EXPECT_EQ(record.kind, ypbank::schema::transaction_kind_t::deposit);
  EXPECT_EQ(record.status, ypbank::schema::transaction_status_t::success);
  EXPECT_TRUE(record.description.empty());
}
