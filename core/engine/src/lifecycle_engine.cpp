#include "txflow/engine/lifecycle_engine.hpp"

#include "txflow/fsm/errors.hpp"
#include "txflow/fsm/machine_spec_json.hpp"
#include "txflow/jobs/zmq_job_queue.hpp"

#include <iostream>
#include <mutex>
#include <sstream>
#include <stdexcept>
#include <utility>

namespace txflow {

namespace {

std::unique_ptr<IJobQueue> makeJobQueue(const EngineConfig& config) {
  if (config.job_endpoint.empty()) {
    return std::make_unique<InMemoryJobQueue>();
  }
  return std::make_unique<ZmqJobQueue>(config.job_endpoint);
}

const MachineSpec* findSpec(const std::vector<MachineSpec>& specs,
                            const std::string& name) {
  for (const auto& spec : specs) {
    if (spec.name == name) {
      return &spec;
    }
  }
  return nullptr;
}

}  // namespace

// -----------------------------------------------------------------------------
// Constructor: build collaborators and definitions (no threads, no IPC)
// -----------------------------------------------------------------------------
LifecycleEngine::LifecycleEngine(const ITimeProvider& clock,
                                 EngineConfig config)
    : clock_(clock),
      config_(std::move(config)),
      jobs_(makeJobQueue(config_)),
      bridge_(clock_, &bus_),
      dispatcher_(config_.async_after_actions
                      ? std::make_unique<ActionDispatcher>(clock_, &bus_)
                      : nullptr),
      executor_(clock_, &store_, &bus_, dispatcher_.get()) {
  in_memory_jobs_ = dynamic_cast<InMemoryJobQueue*>(jobs_.get());

  domain::registerLifecycleActions(
      registry_, bridge_, *jobs_,
      [this](const std::string& id) { return entityJson(id); });
  buildDefinitions();

  bus_.subscribe<TransitionCommittedEvent>(
      [](const TransitionCommittedEvent& e) {
        std::cout << "[LifecycleEngine] " << e.machine << " " << e.entity_id
                  << ": " << e.from_state << " -> " << e.to_state << " on '"
                  << e.event << "' (v" << e.version << ")\n";
      });
}

LifecycleEngine::~LifecycleEngine() { stop(); }

// -----------------------------------------------------------------------------
// buildDefinitions(): built-in specs unless a machine document is configured
// -----------------------------------------------------------------------------
void LifecycleEngine::buildDefinitions() {
  MachineSpec transaction_spec = domain::transactionMachineSpec();
  MachineSpec bank_spec = domain::bankTransactionMachineSpec();

  if (!config_.machine_config_path.empty()) {
    const auto specs = loadMachineSpecs(config_.machine_config_path);
    const MachineSpec* tx = findSpec(specs, domain::machine::kTransaction);
    const MachineSpec* bank =
        findSpec(specs, domain::machine::kBankTransaction);
    if (tx == nullptr || bank == nullptr) {
      throw DefinitionError(config_.machine_config_path + " must define '" +
                            domain::machine::kTransaction + "' and '" +
                            domain::machine::kBankTransaction + "'");
    }
    transaction_spec = *tx;
    bank_spec = *bank;
    std::cout << "[LifecycleEngine] machines loaded from "
              << config_.machine_config_path << "\n";
  }

  transaction_def_ = defineMachine(transaction_spec, registry_);
  bank_transaction_def_ = defineMachine(bank_spec, registry_);
}

// -----------------------------------------------------------------------------
// start()
// -----------------------------------------------------------------------------
void LifecycleEngine::start() {
  if (running_) {
    return;
  }

  // ---  1) After-action worker ----------------------------------------------
  if (dispatcher_) {
    dispatcher_->start();
  }

  // ---  2) IpcServer (telemetry + commands) ---------------------------------
  if (!config_.ipc_cmd_endpoint.empty() && !config_.ipc_pub_endpoint.empty()) {
    ipc_server_ = std::make_shared<IpcServer>(
        [this](const std::string& cmd) { return executeCommand(cmd); },
        config_.ipc_cmd_endpoint, config_.ipc_pub_endpoint);
    ipc_server_->start();

    // Telemetry bridge: every lifecycle event goes to the IPC queue. The
    // callback owns a reference: a publish already in flight on another
    // thread may still invoke it after unsubscribe().
    telemetry_subscriptions_.push_back(bus_.subscribe(
        [server = ipc_server_](const Event& e) { server->pushTelemetry(e); }));
  }

  running_ = true;

  std::cout << "[LifecycleEngine] started. after-actions="
            << (dispatcher_ ? "async" : "inline")
            << " ipc=" << (ipc_server_ ? "on" : "off") << "\n";
}

// -----------------------------------------------------------------------------
// stop()
// -----------------------------------------------------------------------------
void LifecycleEngine::stop() {
  if (!running_) {
    return;
  }

  // ---  1) Close command intake (joins the IPC thread) ----------------------
  if (ipc_server_) {
    ipc_server_->stop();
  }

  // ---  2) Drain pending after-actions --------------------------------------
  if (dispatcher_) {
    dispatcher_->stop();
  }

  // ---  3) Detach telemetry and release the server ---------------------------
  for (auto id : telemetry_subscriptions_) {
    bus_.unsubscribe(id);
  }
  telemetry_subscriptions_.clear();
  ipc_server_.reset();

  running_ = false;

  std::cout << "[LifecycleEngine] stopped.\n";
}

// -----------------------------------------------------------------------------
// Entities
// -----------------------------------------------------------------------------
std::shared_ptr<StateMachineInstance> LifecycleEngine::createBankTransaction(
    const std::string& id) {
  if (id.empty()) {
    throw std::invalid_argument("bank transaction id must not be empty");
  }

  std::unique_lock lock(entities_mutex_);
  if (instances_.count(id) > 0) {
    throw std::invalid_argument("entity id already used: " + id);
  }

  auto inst = bindInstance(bank_transaction_def_, id, executor_, std::nullopt,
                           config_.history_capacity);
  instances_.emplace(id, inst);
  bank_transactions_.emplace(id, domain::BankTransaction{id, 0, {}});
  creation_order_.push_back(id);
  return inst;
}

std::shared_ptr<StateMachineInstance> LifecycleEngine::createTransaction(
    const std::string& id, const std::string& bank_transaction_id,
    std::int64_t amount_cents, const std::string& user_email) {
  if (id.empty()) {
    throw std::invalid_argument("transaction id must not be empty");
  }
  if (amount_cents <= 0) {
    throw std::invalid_argument("transaction " + id +
                                ": amount must be positive");
  }

  std::unique_lock lock(entities_mutex_);
  if (instances_.count(id) > 0) {
    throw std::invalid_argument("entity id already used: " + id);
  }
  auto bank_it = bank_transactions_.find(bank_transaction_id);
  if (bank_it == bank_transactions_.end()) {
    throw std::invalid_argument("unknown bank transaction: " +
                                bank_transaction_id);
  }
  auto parent = instances_.at(bank_transaction_id);
  if (parent->currentState() != domain::bank_state::kDraft) {
    throw std::logic_error("bank transaction " + bank_transaction_id +
                           " is " + parent->currentState() +
                           "; transactions can only be attached in draft");
  }

  auto inst = bindInstance(transaction_def_, id, executor_, std::nullopt,
                           config_.history_capacity);
  bridge_.link(parent, inst);

  // The parent may have left draft between the check above and the link.
  // Any transition after this point sees the child.
  const std::string parent_state = parent->currentState();
  if (parent_state != domain::bank_state::kDraft) {
    bridge_.unlink(bank_transaction_id, id);
    throw std::logic_error("bank transaction " + bank_transaction_id +
                           " left draft (now " + parent_state +
                           ") while " + id + " was being attached");
  }

  instances_.emplace(id, inst);
  transactions_.emplace(id, domain::Transaction{id, bank_transaction_id,
                                                amount_cents, user_email});
  bank_it->second.total_cents += amount_cents;
  bank_it->second.transaction_ids.push_back(id);
  creation_order_.push_back(id);
  return inst;
}

std::shared_ptr<StateMachineInstance> LifecycleEngine::instance(
    const std::string& id) const {
  std::shared_lock lock(entities_mutex_);
  auto it = instances_.find(id);
  return it == instances_.end() ? nullptr : it->second;
}

std::optional<domain::Transaction> LifecycleEngine::transaction(
    const std::string& id) const {
  std::shared_lock lock(entities_mutex_);
  auto it = transactions_.find(id);
  if (it == transactions_.end()) {
    return std::nullopt;
  }
  return it->second;
}

std::optional<domain::BankTransaction> LifecycleEngine::bankTransaction(
    const std::string& id) const {
  std::shared_lock lock(entities_mutex_);
  auto it = bank_transactions_.find(id);
  if (it == bank_transactions_.end()) {
    return std::nullopt;
  }
  return it->second;
}

// -----------------------------------------------------------------------------
// fire()
// -----------------------------------------------------------------------------
FireResult LifecycleEngine::fire(const std::string& entity_id,
                                 const std::string& event,
                                 TransitionContext context) {
  auto inst = instance(entity_id);
  if (!inst) {
    TransitionError error;
    error.kind = TransitionErrorKind::NoTransition;
    error.entity_id = entity_id;
    error.event = event;
    error.message = "unknown entity '" + entity_id + "'";
    return FireResult::failure(std::move(error), 0);
  }

  if (!context.timeout && config_.default_timeout_ms > 0) {
    context.timeout = std::chrono::milliseconds(config_.default_timeout_ms);
  }
  return inst->fire(event, context);
}

bool LifecycleEngine::waitIdle(std::chrono::milliseconds timeout) {
  if (!dispatcher_) {
    return true;
  }
  return dispatcher_->waitIdle(timeout);
}

// -----------------------------------------------------------------------------
// executeCommand(): handle IPC command requests
// -----------------------------------------------------------------------------
std::string LifecycleEngine::executeCommand(const std::string& cmd) {
  std::istringstream in(cmd);
  std::string verb;
  std::string entity_id;
  std::string event;
  in >> verb >> entity_id >> event;

  nlohmann::json response;

  if (verb == "PING") {
    response["status"] = "ok";
    response["response"] = "PONG";
  } else if (verb == "STATUS" && entity_id.empty()) {
    nlohmann::json entities = nlohmann::json::array();
    std::vector<std::shared_ptr<StateMachineInstance>> snapshot;
    {
      std::shared_lock lock(entities_mutex_);
      for (const auto& id : creation_order_) {
        snapshot.push_back(instances_.at(id));
      }
    }
    for (const auto& inst : snapshot) {
      nlohmann::json e;
      e["entity_id"] = inst->id();
      e["machine"] = inst->definition().name();
      const auto snap = inst->snapshot();
      e["state"] = snap.state;
      e["version"] = snap.version;
      entities.push_back(std::move(e));
    }
    response["status"] = "ok";
    response["entities"] = std::move(entities);
  } else if (verb == "STATUS") {
    auto inst = instance(entity_id);
    if (!inst) {
      response["status"] = "error";
      response["response"] = "unknown entity: " + entity_id;
    } else {
      response = statusJson(*inst);
      response["status"] = "ok";
    }
  } else if (verb == "FIRE") {
    if (entity_id.empty() || event.empty()) {
      response["status"] = "error";
      response["response"] = "usage: FIRE <entity_id> <event>";
    } else {
      TransitionContext context;
      context.source = "ipc";
      FireResult result = fire(entity_id, event, std::move(context));
      response = fireResultJson(result);
      response["status"] = result.ok() ? "ok" : "rejected";
    }
  } else {
    response["status"] = "error";
    response["response"] = "unknown command: " + cmd;
  }

  return response.dump();
}

// -----------------------------------------------------------------------------
// JSON helpers
// -----------------------------------------------------------------------------
nlohmann::json LifecycleEngine::entityJson(const std::string& id) const {
  if (auto t = transaction(id)) {
    return domain::toJson(*t);
  }
  if (auto b = bankTransaction(id)) {
    return domain::toJson(*b);
  }
  return nlohmann::json::object();
}

nlohmann::json LifecycleEngine::statusJson(
    const StateMachineInstance& inst) const {
  nlohmann::json j;
  const auto snap = inst.snapshot();
  j["entity_id"] = inst.id();
  j["machine"] = inst.definition().name();
  j["state"] = snap.state;
  j["version"] = snap.version;
  j["terminal"] = inst.definition().isTerminal(snap.state);
  j["available_events"] = inst.definition().eventsFrom(snap.state);

  nlohmann::json history = nlohmann::json::array();
  for (const auto& record : inst.history()) {
    nlohmann::json r;
    r["from"] = record.from;
    r["event"] = record.event;
    r["to"] = record.to;
    r["version"] = record.version;
    r["timestamp_ms"] = record.timestamp_ms;
    history.push_back(std::move(r));
  }
  j["history"] = std::move(history);

  if (auto parent = bridge_.parentOf(inst.id())) {
    j["parent"] = parent->id();
  }
  nlohmann::json children = nlohmann::json::array();
  for (const auto& child : bridge_.children(inst.id())) {
    nlohmann::json c;
    c["entity_id"] = child->id();
    c["state"] = child->currentState();
    children.push_back(std::move(c));
  }
  if (!children.empty()) {
    j["children"] = std::move(children);
  }

  j["data"] = entityJson(inst.id());
  return j;
}

nlohmann::json LifecycleEngine::fireResultJson(const FireResult& result) {
  nlohmann::json j;
  j["from"] = result.from_state;
  j["version"] = result.version;

  if (result.ok()) {
    j["state"] = *result.state;
    j["after_actions_deferred"] = result.after_actions_deferred;
    nlohmann::json failures = nlohmann::json::array();
    for (const auto& failure : result.after_action_failures) {
      nlohmann::json f;
      f["action"] = failure.action;
      f["message"] = failure.message;
      nlohmann::json kids = nlohmann::json::array();
      for (const auto& child : failure.child_failures) {
        kids.push_back(child.child_id);
      }
      f["failed_children"] = std::move(kids);
      failures.push_back(std::move(f));
    }
    j["after_action_failures"] = std::move(failures);
  } else {
    nlohmann::json error;
    error["kind"] = toString(result.error->kind);
    error["message"] = result.error->message;
    if (result.error->action) {
      error["action"] = result.error->action->action;
      error["phase"] = toString(result.error->action->phase);
    }
    j["error"] = std::move(error);
  }
  return j;
}

}  // namespace txflow
