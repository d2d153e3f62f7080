#pragma once

#include "txflow/fsm/action_registry.hpp"
#include "txflow/fsm/hierarchical_bridge.hpp"
#include "txflow/fsm/machine_spec.hpp"
#include "txflow/jobs/i_job_queue.hpp"

#include <nlohmann/json.hpp>

#include <functional>
#include <string>

namespace txflow {
namespace domain {

// -----------------------------------------------------------------------------
// Transaction / BankTransaction lifecycle
// -----------------------------------------------------------------------------
//
// Transaction ("transaction"):
//
//   draft --depositing_via_api / bank_transaction_created--> depositing
//   depositing --bank_transaction_succeeded--> deposited
//        after: job start_next_transfer
//   deposited --investing_via_api--> investing
//   investing --bank_transaction_succeeded--> invested (terminal)
//        after: job notify_invested
//
// BankTransaction ("bank_transaction"):
//
//   draft --create_requested--> creating
//   creating --created_via_api--> pending
//        after: broadcast bank_transaction_created to Transactions
//   pending --settled_via_api [all Transactions depositing]--> settled (terminal)
//        after: broadcast bank_transaction_succeeded to Transactions
//   creating | pending --failed_via_api--> failed (terminal)
//
// The settle guard reads the children's states through the
// HierarchicalBridge, so a BankTransaction cannot settle while one of its
// Transactions missed the "created" broadcast.
// -----------------------------------------------------------------------------

namespace machine {
inline constexpr char kTransaction[] = "transaction";
inline constexpr char kBankTransaction[] = "bank_transaction";
}  // namespace machine

namespace tx_state {
inline constexpr char kDraft[] = "draft";
inline constexpr char kDepositing[] = "depositing";
inline constexpr char kDeposited[] = "deposited";
inline constexpr char kInvesting[] = "investing";
inline constexpr char kInvested[] = "invested";
}  // namespace tx_state

namespace bank_state {
inline constexpr char kDraft[] = "draft";
inline constexpr char kCreating[] = "creating";
inline constexpr char kPending[] = "pending";
inline constexpr char kSettled[] = "settled";
inline constexpr char kFailed[] = "failed";
}  // namespace bank_state

namespace tx_event {
inline constexpr char kDepositingViaApi[] = "depositing_via_api";
inline constexpr char kBankTransactionCreated[] = "bank_transaction_created";
inline constexpr char kBankTransactionSucceeded[] =
    "bank_transaction_succeeded";
inline constexpr char kInvestingViaApi[] = "investing_via_api";
}  // namespace tx_event

namespace bank_event {
inline constexpr char kCreateRequested[] = "create_requested";
inline constexpr char kCreatedViaApi[] = "created_via_api";
inline constexpr char kSettledViaApi[] = "settled_via_api";
inline constexpr char kFailedViaApi[] = "failed_via_api";
}  // namespace bank_event

// Background job types handed to the IJobQueue.
namespace job {
inline constexpr char kStartNextTransfer[] = "start_next_transfer";
inline constexpr char kNotifyInvested[] = "notify_invested";
}  // namespace job

// Names under which registerLifecycleActions() registers functions.
namespace action {
inline constexpr char kEnqueueStartNextTransfer[] =
    "enqueue_start_next_transfer";
inline constexpr char kEnqueueNotifyInvested[] = "enqueue_notify_invested";
inline constexpr char kBroadcastCreated[] = "broadcast_bank_transaction_created";
inline constexpr char kBroadcastSucceeded[] =
    "broadcast_bank_transaction_succeeded";
inline constexpr char kAllTransactionsDepositing[] =
    "all_transactions_depositing";
}  // namespace action

MachineSpec transactionMachineSpec();
MachineSpec bankTransactionMachineSpec();

// Entity data to attach to a job payload, keyed by entity id. May return an
// empty object.
using EntityLookup = std::function<nlohmann::json(const std::string&)>;

// -----------------------------------------------------------------------------
// registerLifecycleActions(registry, bridge, jobs, lookup)
// -----------------------------------------------------------------------------
//
// @brief  Registers every guard and action the two lifecycle specs name.
//
// @details
// Job actions enqueue {type, entity_id, commit_version, payload} where
// commit_version is the commit that scheduled the action (not the live
// instance version) and the payload is lookup(entity_id) plus the trigger's
// source. A failing enqueue
// throws, which the executor reports as an after-phase ActionError.
// Broadcast actions and the settle guard go through `bridge`.
//
// registry, bridge and jobs must outlive every definition built from the
// registry.
// -----------------------------------------------------------------------------
void registerLifecycleActions(ActionRegistry& registry,
                              HierarchicalBridge& bridge, IJobQueue& jobs,
                              EntityLookup lookup = nullptr);

}  // namespace domain
}  // namespace txflow
