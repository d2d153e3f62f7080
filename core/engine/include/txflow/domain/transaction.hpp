#pragma once

#include <nlohmann/json.hpp>

#include <cstdint>
#include <string>
#include <vector>

namespace txflow {
namespace domain {

// -----------------------------------------------------------------------------
// Transaction: one user deposit into an investment
// -----------------------------------------------------------------------------
// Entity data only. The lifecycle state lives in the Transaction's
// StateMachineInstance (machine "transaction"), keyed by the same id.
//
// Amounts are integer cents.
// -----------------------------------------------------------------------------
struct Transaction {
  std::string id;
  std::string bank_transaction_id;  // Parent BankTransaction
  std::int64_t amount_cents{0};
  std::string user_email;
};

// -----------------------------------------------------------------------------
// BankTransaction: one bank transfer funding several Transactions
// -----------------------------------------------------------------------------
// total_cents is the sum of the linked Transactions' amounts; it grows as
// Transactions are attached while the BankTransaction is still in draft.
// -----------------------------------------------------------------------------
struct BankTransaction {
  std::string id;
  std::int64_t total_cents{0};
  std::vector<std::string> transaction_ids;
};

inline nlohmann::json toJson(const Transaction& t) {
  nlohmann::json j;
  j["id"] = t.id;
  j["bank_transaction_id"] = t.bank_transaction_id;
  j["amount_cents"] = t.amount_cents;
  j["user_email"] = t.user_email;
  return j;
}

inline nlohmann::json toJson(const BankTransaction& b) {
  nlohmann::json j;
  j["id"] = b.id;
  j["total_cents"] = b.total_cents;
  j["transaction_ids"] = b.transaction_ids;
  return j;
}

}  // namespace domain
}  // namespace txflow
