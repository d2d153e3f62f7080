#include "txflow/domain/lifecycle.hpp"

#include "txflow/fsm/state_machine_instance.hpp"

#include <utility>

namespace txflow {
namespace domain {

// -----------------------------------------------------------------------------
// transactionMachineSpec()
// -----------------------------------------------------------------------------
MachineSpec transactionMachineSpec() {
  MachineSpec spec;
  spec.name = machine::kTransaction;
  spec.states = {
      {tx_state::kDraft, true, false},
      {tx_state::kDepositing, false, false},
      {tx_state::kDeposited, false, false},
      {tx_state::kInvesting, false, false},
      {tx_state::kInvested, false, true},
  };
  spec.events = {
      tx_event::kDepositingViaApi,
      tx_event::kBankTransactionCreated,
      tx_event::kBankTransactionSucceeded,
      tx_event::kInvestingViaApi,
  };
  spec.transitions = {
      {tx_state::kDraft, tx_event::kDepositingViaApi, tx_state::kDepositing,
       "", {}, {}},
      {tx_state::kDraft, tx_event::kBankTransactionCreated,
       tx_state::kDepositing, "", {}, {}},
      {tx_state::kDepositing, tx_event::kBankTransactionSucceeded,
       tx_state::kDeposited, "", {}, {action::kEnqueueStartNextTransfer}},
      {tx_state::kDeposited, tx_event::kInvestingViaApi, tx_state::kInvesting,
       "", {}, {}},
      {tx_state::kInvesting, tx_event::kBankTransactionSucceeded,
       tx_state::kInvested, "", {}, {action::kEnqueueNotifyInvested}},
  };
  return spec;
}

// -----------------------------------------------------------------------------
// bankTransactionMachineSpec()
// -----------------------------------------------------------------------------
MachineSpec bankTransactionMachineSpec() {
  MachineSpec spec;
  spec.name = machine::kBankTransaction;
  spec.states = {
      {bank_state::kDraft, true, false},
      {bank_state::kCreating, false, false},
      {bank_state::kPending, false, false},
      {bank_state::kSettled, false, true},
      {bank_state::kFailed, false, true},
  };
  spec.events = {
      bank_event::kCreateRequested,
      bank_event::kCreatedViaApi,
      bank_event::kSettledViaApi,
      bank_event::kFailedViaApi,
  };
  spec.transitions = {
      {bank_state::kDraft, bank_event::kCreateRequested, bank_state::kCreating,
       "", {}, {}},
      {bank_state::kCreating, bank_event::kCreatedViaApi, bank_state::kPending,
       "", {}, {action::kBroadcastCreated}},
      {bank_state::kPending, bank_event::kSettledViaApi, bank_state::kSettled,
       action::kAllTransactionsDepositing, {}, {action::kBroadcastSucceeded}},
      {bank_state::kCreating, bank_event::kFailedViaApi, bank_state::kFailed,
       "", {}, {}},
      {bank_state::kPending, bank_event::kFailedViaApi, bank_state::kFailed,
       "", {}, {}},
  };
  return spec;
}

// -----------------------------------------------------------------------------
// registerLifecycleActions()
// -----------------------------------------------------------------------------
void registerLifecycleActions(ActionRegistry& registry,
                              HierarchicalBridge& bridge, IJobQueue& jobs,
                              EntityLookup lookup) {
  auto enqueueJob = [&jobs, lookup](std::string type) -> Action {
    return [&jobs, lookup, type = std::move(type)](
               StateMachineInstance& instance,
               const TransitionContext& context) {
      Job job;
      job.type = type;
      job.entity_id = instance.id();
      job.commit_version = context.commit_version;
      if (lookup) {
        job.payload = lookup(instance.id());
      }
      if (!job.payload.is_object()) {
        job.payload = nlohmann::json::object();
      }
      job.payload["source"] = context.source;
      jobs.enqueue(std::move(job));
    };
  };

  registry.registerAction(action::kEnqueueStartNextTransfer,
                          enqueueJob(job::kStartNextTransfer));
  registry.registerAction(action::kEnqueueNotifyInvested,
                          enqueueJob(job::kNotifyInvested));

  registry.registerAction(
      action::kBroadcastCreated,
      bridge.broadcastAction(tx_event::kBankTransactionCreated));
  registry.registerAction(
      action::kBroadcastSucceeded,
      bridge.broadcastAction(tx_event::kBankTransactionSucceeded));

  registry.registerGuard(action::kAllTransactionsDepositing,
                         bridge.allChildrenInGuard(tx_state::kDepositing));
}

}  // namespace domain
}  // namespace txflow
