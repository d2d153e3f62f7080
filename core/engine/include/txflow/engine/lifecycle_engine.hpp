#pragma once

#include "txflow/config/engine_config.hpp"
#include "txflow/domain/lifecycle.hpp"
#include "txflow/domain/transaction.hpp"
#include "txflow/eventbus/event_bus.hpp"
#include "txflow/fsm/action_dispatcher.hpp"
#include "txflow/fsm/action_registry.hpp"
#include "txflow/fsm/hierarchical_bridge.hpp"
#include "txflow/fsm/state_machine_definition.hpp"
#include "txflow/fsm/state_machine_instance.hpp"
#include "txflow/fsm/transition_executor.hpp"
#include "txflow/jobs/i_job_queue.hpp"
#include "txflow/network/ipc_server.hpp"
#include "txflow/persistence/in_memory_state_store.hpp"
#include "txflow/time/i_time_provider.hpp"

#include <chrono>
#include <cstdint>
#include <memory>
#include <optional>
#include <shared_mutex>
#include <string>
#include <unordered_map>
#include <vector>

namespace txflow {

// -----------------------------------------------------------------------------
// LifecycleEngine
// -----------------------------------------------------------------------------
//
// @brief  Orchestrator that owns the FSM runtime for the Transaction /
//         BankTransaction lifecycle and exposes it to callers, tests and
//         the IPC command channel.
//
// @details
// Construction is configuration time: the machine definitions are built
// (from the built-in specs or EngineConfig::machine_config_path) and any
// DefinitionError propagates out of the constructor. No thread is started
// and no IPC socket is opened until start(). fire() works before start();
// with async_after_actions the after-actions then run inline, because the
// dispatcher is not accepting batches yet.
//
// Entities are created through createBankTransaction() and
// createTransaction(); the latter links the Transaction under its
// BankTransaction in the HierarchicalBridge. Entity data (amounts, emails)
// is kept beside the instances and attached to background job payloads.
//
// Thread model:
//   start()/stop() from one thread (main). createX(), fire(), instance()
//   and executeCommand() are safe from any thread; the IpcServer calls
//   executeCommand() from its own thread.
//
// Ownership:
//   LifecycleEngine
//    ├── bus_          (EventBus: value member, outlives everything)
//    ├── store_        (InMemoryStateStore: value member)
//    ├── jobs_         (unique_ptr<IJobQueue>: in-memory or ZeroMQ PUSH)
//    ├── bridge_       (HierarchicalBridge: value member)
//    ├── dispatcher_   (unique_ptr<ActionDispatcher>: async mode only)
//    ├── executor_     (TransitionExecutor: borrows store/bus/dispatcher)
//    ├── registry_     (ActionRegistry: domain guards and actions)
//    ├── definitions   (shared_ptr<const StateMachineDefinition> x2)
//    ├── instances_    (shared_ptr<StateMachineInstance> by entity id)
//    └── ipc_server_   (shared_ptr<IpcServer>: created in start())
//
// Members are declared in that order so destruction runs in reverse: the
// IPC server and instances go first, the bus last. The destructor calls
// stop(), which drains the dispatcher before any member is destroyed.
// -----------------------------------------------------------------------------
class LifecycleEngine {
 public:
  // Throws DefinitionError for an invalid machine document and
  // zmq::error_t if the job endpoint cannot be bound.
  explicit LifecycleEngine(const ITimeProvider& clock,
                           EngineConfig config = {});

  ~LifecycleEngine();

  LifecycleEngine(const LifecycleEngine&) = delete;
  LifecycleEngine& operator=(const LifecycleEngine&) = delete;
  LifecycleEngine(LifecycleEngine&&) = delete;
  LifecycleEngine& operator=(LifecycleEngine&&) = delete;

  // Starts the ActionDispatcher (async mode) and the IpcServer (when both
  // endpoints are configured). Idempotent.
  void start();

  // Closes IPC command intake, drains and joins the dispatcher, then
  // detaches telemetry and releases the IpcServer. Idempotent.
  void stop();

  bool running() const { return running_; }

  // ---  Entities --------------------------------------------------------------

  // Creates a BankTransaction in draft. Throws std::invalid_argument for an
  // empty or already used id.
  std::shared_ptr<StateMachineInstance> createBankTransaction(
      const std::string& id);

  // -------------------------------------------------------------------------
  // createTransaction(id, bank_transaction_id, amount_cents, user_email)
  // -------------------------------------------------------------------------
  // @brief  Creates a Transaction in draft and links it under its
  //         BankTransaction.
  //
  // @details
  // Throws std::invalid_argument for an empty or used id, an unknown
  // BankTransaction or a non-positive amount, and std::logic_error when
  // the BankTransaction has left draft (its set of Transactions is fixed
  // once the bank transfer is being created). The draft check is repeated
  // after linking, so a concurrent create_requested either sees the new
  // child or makes this call throw with nothing attached.
  // -------------------------------------------------------------------------
  std::shared_ptr<StateMachineInstance> createTransaction(
      const std::string& id, const std::string& bank_transaction_id,
      std::int64_t amount_cents, const std::string& user_email = "");

  // nullptr for an unknown id.
  std::shared_ptr<StateMachineInstance> instance(const std::string& id) const;

  std::optional<domain::Transaction> transaction(const std::string& id) const;
  std::optional<domain::BankTransaction> bankTransaction(
      const std::string& id) const;

  // -------------------------------------------------------------------------
  // fire(entity_id, event, context)
  // -------------------------------------------------------------------------
  // @brief  Fires an event on the entity's instance.
  //
  // @details
  // Applies EngineConfig::default_timeout_ms when the context carries no
  // timeout. An unknown entity is reported as a NoTransition error rather
  // than an exception, since it usually comes from an external trigger.
  // -------------------------------------------------------------------------
  FireResult fire(const std::string& entity_id, const std::string& event,
                  TransitionContext context = {});

  // Blocks until queued after-actions have run. Returns true immediately
  // when after-actions are inline.
  bool waitIdle(std::chrono::milliseconds timeout);

  // -------------------------------------------------------------------------
  // executeCommand(cmd)
  // -------------------------------------------------------------------------
  // @brief  IPC command handler. Always returns a JSON object with a
  //         "status" of "ok", "rejected" or "error".
  //
  // Commands:
  //   PING                       -> {"status":"ok","response":"PONG"}
  //   STATUS                     -> every entity's state and version
  //   STATUS <entity_id>         -> state, version, available events,
  //                                 history, parent/children, entity data
  //   FIRE <entity_id> <event>   -> FireResult as JSON
  // -------------------------------------------------------------------------
  std::string executeCommand(const std::string& cmd);

  // ---  Accessors -------------------------------------------------------------

  EventBus& eventBus() { return bus_; }
  InMemoryStateStore& store() { return store_; }
  HierarchicalBridge& bridge() { return bridge_; }
  TransitionExecutor& executor() { return executor_; }
  IJobQueue& jobs() { return *jobs_; }

  // The job queue when no job endpoint is configured, else nullptr.
  InMemoryJobQueue* inMemoryJobs() { return in_memory_jobs_; }

  // nullptr unless async_after_actions is set.
  ActionDispatcher* dispatcher() { return dispatcher_.get(); }

  const EngineConfig& config() const { return config_; }
  const StateMachineDefinition& transactionDefinition() const {
    return *transaction_def_;
  }
  const StateMachineDefinition& bankTransactionDefinition() const {
    return *bank_transaction_def_;
  }

 private:
  void buildDefinitions();
  nlohmann::json entityJson(const std::string& id) const;
  nlohmann::json statusJson(const StateMachineInstance& instance) const;
  static nlohmann::json fireResultJson(const FireResult& result);

  const ITimeProvider& clock_;
  EngineConfig config_;

  EventBus bus_;
  InMemoryStateStore store_;
  std::unique_ptr<IJobQueue> jobs_;
  InMemoryJobQueue* in_memory_jobs_{nullptr};
  HierarchicalBridge bridge_;
  std::unique_ptr<ActionDispatcher> dispatcher_;
  TransitionExecutor executor_;
  ActionRegistry registry_;

  std::shared_ptr<const StateMachineDefinition> transaction_def_;
  std::shared_ptr<const StateMachineDefinition> bank_transaction_def_;

  mutable std::shared_mutex entities_mutex_;
  std::unordered_map<std::string, std::shared_ptr<StateMachineInstance>>
      instances_;
  std::unordered_map<std::string, domain::Transaction> transactions_;
  std::unordered_map<std::string, domain::BankTransaction> bank_transactions_;
  std::vector<std::string> creation_order_;

  std::vector<EventBus::SubscriptionId> telemetry_subscriptions_;
  std::shared_ptr<IpcServer> ipc_server_;

  bool running_{false};
};

}  // namespace txflow
