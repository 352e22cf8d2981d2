#pragma once

#include <ypbank/schema/primitives.hpp>
#include <ypbank/schema/transaction_kind.hpp>
#include <ypbank/schema/transaction_status.hpp>

#include <string>
#include <string_view>

// Token parsers shared by the text and CSV codecs. Every function throws
// parser_error; callers attach the location.
namespace ypbank::codec {

schema::tx_id_t parse_tx_id(std::string_view value);
schema::account_id_t parse_account_id(std::string_view value);
schema::amount_t parse_amount(std::string_view value);
schema::timestamp_milliseconds_t parse_timestamp(std::string_view value);
schema::transaction_kind_t parse_transaction_kind(std::string_view value);
schema::transaction_status_t parse_transaction_status(std::string_view value);

/// Strip one pair of surrounding double quotes; shall_be_quoted otherwise.
std::string_view unquote(std::string_view value);
std::string quote(std::string_view value);

}  // namespace ypbank::codec
