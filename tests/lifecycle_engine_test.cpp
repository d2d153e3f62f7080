// =============================================================================
// lifecycle_engine_test.cpp
// =============================================================================
// Tests for txflow::LifecycleEngine and the IpcServer telemetry encoding.
//
// Validates:
//   - Lifecycle: start() / stop() idempotency without IPC endpoints
//   - Entity creation rules and BankTransaction totals
//   - fire() on unknown entities, jobs carrying entity data
//   - executeCommand(): PING, STATUS, STATUS <id>, FIRE, errors
//   - Asynchronous after-actions through the engine's dispatcher
//   - Machine definitions loaded from a JSON document
//   - IpcServer::formatTelemetry() JSON shape
//   - ZmqJobQueue::formatJob() wire format
//   - Concurrent attach and create_requested never half-attach a child
//   - stop() with IPC and async after-actions in flight
//
// Only StopWithDeferredBroadcasts opens sockets, on inproc:// endpoints
// private to the server's own context. Every other test leaves the IPC and
// job endpoints empty.
// =============================================================================

#include "txflow/config/engine_config.hpp"
#include "txflow/domain/lifecycle.hpp"
#include "txflow/engine/lifecycle_engine.hpp"
#include "txflow/fsm/errors.hpp"
#include "txflow/fsm/machine_spec_json.hpp"
#include "txflow/jobs/zmq_job_queue.hpp"
#include "txflow/network/ipc_server.hpp"
#include "txflow/time/simulation_time_provider.hpp"

#include <gtest/gtest.h>
#include <nlohmann/json.hpp>

#include <chrono>
#include <fstream>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

namespace d = txflow::domain;
using json = nlohmann::json;

class LifecycleEngineTest : public ::testing::Test {
 protected:
  // bt-1 with tx-1 ($100) and tx-2 ($150).
  static void populate(txflow::LifecycleEngine& engine) {
    engine.createBankTransaction("bt-1");
    engine.createTransaction("tx-1", "bt-1", 10000, "ada@example.com");
    engine.createTransaction("tx-2", "bt-1", 15000, "grace@example.com");
  }

  static json command(txflow::LifecycleEngine& engine, const std::string& cmd) {
    return json::parse(engine.executeCommand(cmd));
  }

  txflow::SimulationTimeProvider clock{1700000000000};
};

// -----------------------------------------------------------------------------
// 1. Default configuration: inline after-actions, in-memory jobs, and
//    idempotent start/stop.
// -----------------------------------------------------------------------------
TEST_F(LifecycleEngineTest, DefaultLifecycle) {
  txflow::LifecycleEngine engine(clock);

  EXPECT_FALSE(engine.running());
  EXPECT_EQ(engine.dispatcher(), nullptr);
  ASSERT_NE(engine.inMemoryJobs(), nullptr);
  EXPECT_EQ(engine.transactionDefinition().name(), d::machine::kTransaction);
  EXPECT_EQ(engine.bankTransactionDefinition().name(),
            d::machine::kBankTransaction);

  engine.start();
  engine.start();
  EXPECT_TRUE(engine.running());
  EXPECT_TRUE(engine.waitIdle(std::chrono::milliseconds(10)));
  engine.stop();
  engine.stop();
  EXPECT_FALSE(engine.running());
}

// -----------------------------------------------------------------------------
// 2. Entity creation: links, totals and the argument rules.
// -----------------------------------------------------------------------------
TEST_F(LifecycleEngineTest, CreateEntities) {
  txflow::LifecycleEngine engine(clock);
  populate(engine);

  auto bank = engine.bankTransaction("bt-1");
  ASSERT_TRUE(bank.has_value());
  EXPECT_EQ(bank->total_cents, 25000);
  EXPECT_EQ(bank->transaction_ids,
            (std::vector<std::string>{"tx-1", "tx-2"}));

  auto tx = engine.transaction("tx-2");
  ASSERT_TRUE(tx.has_value());
  EXPECT_EQ(tx->bank_transaction_id, "bt-1");
  EXPECT_EQ(tx->user_email, "grace@example.com");

  EXPECT_EQ(engine.bridge().parentOf("tx-1"), engine.instance("bt-1"));
  EXPECT_EQ(engine.bridge().children("bt-1").size(), 2u);
  EXPECT_EQ(engine.instance("tx-1")->currentState(), d::tx_state::kDraft);
  EXPECT_EQ(engine.instance("nobody"), nullptr);
  EXPECT_FALSE(engine.transaction("bt-1").has_value());

  EXPECT_THROW(engine.createBankTransaction(""), std::invalid_argument);
  EXPECT_THROW(engine.createBankTransaction("tx-1"), std::invalid_argument);
  EXPECT_THROW(engine.createTransaction("tx-3", "bt-404", 100),
               std::invalid_argument);
  EXPECT_THROW(engine.createTransaction("tx-3", "bt-1", 0),
               std::invalid_argument);
  EXPECT_THROW(engine.createTransaction("tx-1", "bt-1", 100),
               std::invalid_argument);
}

// -----------------------------------------------------------------------------
// 3. Transactions can only be attached while the BankTransaction is draft.
// -----------------------------------------------------------------------------
TEST_F(LifecycleEngineTest, AttachOnlyInDraft) {
  txflow::LifecycleEngine engine(clock);
  populate(engine);
  ASSERT_TRUE(engine.fire("bt-1", d::bank_event::kCreateRequested).ok());

  EXPECT_THROW(engine.createTransaction("tx-3", "bt-1", 500),
               std::logic_error);
  EXPECT_FALSE(engine.instance("tx-3"));
  EXPECT_EQ(engine.bankTransaction("bt-1")->total_cents, 25000);
}

// -----------------------------------------------------------------------------
// 4. An unknown entity is a NoTransition result, not an exception.
// -----------------------------------------------------------------------------
TEST_F(LifecycleEngineTest, FireUnknownEntity) {
  txflow::LifecycleEngine engine(clock);

  auto result = engine.fire("tx-404", d::tx_event::kDepositingViaApi);

  ASSERT_FALSE(result.ok());
  EXPECT_EQ(result.error->kind, txflow::TransitionErrorKind::NoTransition);
  EXPECT_EQ(result.error->entity_id, "tx-404");
}

// -----------------------------------------------------------------------------
// 5. The full bank flow through the engine; jobs carry the entity data.
// -----------------------------------------------------------------------------
TEST_F(LifecycleEngineTest, BankFlowEnqueuesJobsWithEntityData) {
  txflow::LifecycleEngine engine(clock);
  populate(engine);

  ASSERT_TRUE(engine.fire("bt-1", d::bank_event::kCreateRequested).ok());
  ASSERT_TRUE(engine.fire("bt-1", d::bank_event::kCreatedViaApi).ok());
  ASSERT_TRUE(engine.fire("bt-1", d::bank_event::kSettledViaApi).ok());

  EXPECT_EQ(engine.instance("tx-1")->currentState(), d::tx_state::kDeposited);
  EXPECT_EQ(engine.instance("tx-2")->currentState(), d::tx_state::kDeposited);

  auto jobs = engine.inMemoryJobs()->jobsOfType(d::job::kStartNextTransfer);
  ASSERT_EQ(jobs.size(), 2u);
  EXPECT_EQ(jobs[1].entity_id, "tx-2");
  EXPECT_EQ(jobs[1].payload["amount_cents"].get<std::int64_t>(), 15000);
  EXPECT_EQ(jobs[1].payload["user_email"].get<std::string>(),
            "grace@example.com");
  EXPECT_EQ(jobs[1].payload["bank_transaction_id"].get<std::string>(), "bt-1");
  EXPECT_EQ(jobs[1].payload["source"].get<std::string>(), "broadcast:bt-1");
}

// -----------------------------------------------------------------------------
// 6. PING / STATUS / FIRE / unknown commands.
// Why: This is the operator interface served over the REP socket.
// -----------------------------------------------------------------------------
TEST_F(LifecycleEngineTest, ExecuteCommand) {
  txflow::LifecycleEngine engine(clock);
  populate(engine);

  auto ping = command(engine, "PING");
  EXPECT_EQ(ping["status"].get<std::string>(), "ok");
  EXPECT_EQ(ping["response"].get<std::string>(), "PONG");

  auto all = command(engine, "STATUS");
  EXPECT_EQ(all["status"].get<std::string>(), "ok");
  ASSERT_EQ(all["entities"].size(), 3u);
  EXPECT_EQ(all["entities"][0]["entity_id"].get<std::string>(), "bt-1");
  EXPECT_EQ(all["entities"][2]["state"].get<std::string>(),
            d::tx_state::kDraft);

  auto fired = command(engine, "FIRE tx-1 depositing_via_api");
  EXPECT_EQ(fired["status"].get<std::string>(), "ok");
  EXPECT_EQ(fired["state"].get<std::string>(), d::tx_state::kDepositing);
  EXPECT_EQ(fired["from"].get<std::string>(), d::tx_state::kDraft);
  EXPECT_EQ(fired["version"].get<std::int64_t>(), 1);

  auto rejected = command(engine, "FIRE tx-1 investing_via_api");
  EXPECT_EQ(rejected["status"].get<std::string>(), "rejected");
  EXPECT_EQ(rejected["error"]["kind"].get<std::string>(), "NoTransition");

  auto status = command(engine, "STATUS tx-1");
  EXPECT_EQ(status["status"].get<std::string>(), "ok");
  EXPECT_EQ(status["machine"].get<std::string>(), d::machine::kTransaction);
  EXPECT_EQ(status["state"].get<std::string>(), d::tx_state::kDepositing);
  EXPECT_FALSE(status["terminal"].get<bool>());
  EXPECT_EQ(status["parent"].get<std::string>(), "bt-1");
  EXPECT_EQ(status["data"]["amount_cents"].get<std::int64_t>(), 10000);
  ASSERT_EQ(status["history"].size(), 1u);
  EXPECT_EQ(status["history"][0]["event"].get<std::string>(),
            d::tx_event::kDepositingViaApi);
  EXPECT_EQ(status["available_events"].get<std::vector<std::string>>(),
            std::vector<std::string>{d::tx_event::kBankTransactionSucceeded});

  auto parent = command(engine, "STATUS bt-1");
  ASSERT_EQ(parent["children"].size(), 2u);
  EXPECT_EQ(parent["data"]["total_cents"].get<std::int64_t>(), 25000);

  EXPECT_EQ(command(engine, "STATUS ghost")["status"].get<std::string>(),
            "error");
  EXPECT_EQ(command(engine, "FIRE tx-1")["status"].get<std::string>(), "error");
  EXPECT_EQ(command(engine, "FIRE ghost depositing_via_api")["status"]
                .get<std::string>(),
            "rejected");
  EXPECT_EQ(command(engine, "DANCE")["status"].get<std::string>(), "error");
}

// -----------------------------------------------------------------------------
// 7. Async mode: broadcasts run on the dispatcher; waitIdle() waits for
//    them, including the children's own deferred after-actions.
// -----------------------------------------------------------------------------
TEST_F(LifecycleEngineTest, AsyncAfterActions) {
  txflow::EngineConfig config;
  config.async_after_actions = true;
  txflow::LifecycleEngine engine(clock, config);
  ASSERT_NE(engine.dispatcher(), nullptr);
  populate(engine);
  engine.start();

  ASSERT_TRUE(engine.fire("bt-1", d::bank_event::kCreateRequested).ok());
  auto created = engine.fire("bt-1", d::bank_event::kCreatedViaApi);
  ASSERT_TRUE(created.ok());
  EXPECT_TRUE(created.after_actions_deferred);
  ASSERT_TRUE(engine.waitIdle(std::chrono::seconds(2)));
  EXPECT_EQ(engine.instance("tx-1")->currentState(), d::tx_state::kDepositing);
  EXPECT_EQ(engine.instance("tx-2")->currentState(), d::tx_state::kDepositing);

  ASSERT_TRUE(engine.fire("bt-1", d::bank_event::kSettledViaApi).ok());
  ASSERT_TRUE(engine.waitIdle(std::chrono::seconds(2)));
  EXPECT_EQ(engine.inMemoryJobs()->size(), 2u);

  engine.stop();
  EXPECT_FALSE(engine.dispatcher()->running());
}

// -----------------------------------------------------------------------------
// 8. Definitions from a machine document; a document missing a machine is
//    a DefinitionError at construction.
// -----------------------------------------------------------------------------
TEST_F(LifecycleEngineTest, MachineDocument) {
  txflow::EngineConfig config;
  config.machine_config_path = "config/machines.json";
  txflow::LifecycleEngine engine(clock, config);
  EXPECT_EQ(engine.transactionDefinition().transitions().size(), 5u);

  const std::string partial = ::testing::TempDir() + "txflow_partial.json";
  {
    std::ofstream out(partial);
    json doc;
    doc["machines"] = json::array(
        {txflow::machineSpecToJson(d::transactionMachineSpec())});
    out << doc.dump(2);
  }
  config.machine_config_path = partial;
  EXPECT_THROW(txflow::LifecycleEngine{clock, config},
               txflow::DefinitionError);

  config.machine_config_path = "/nonexistent/machines.json";
  EXPECT_THROW(txflow::LifecycleEngine{clock, config},
               txflow::DefinitionError);
}

// -----------------------------------------------------------------------------
// 9. Telemetry encoding of a committed transition.
// -----------------------------------------------------------------------------
TEST(IpcServerTest, FormatsTelemetry) {
  txflow::TransitionCommittedEvent e;
  e.machine = "transaction";
  e.entity_id = "tx-1";
  e.event = "depositing_via_api";
  e.from_state = "draft";
  e.to_state = "depositing";
  e.version = 1;
  e.timestamp_ms = 42;

  auto j = json::parse(txflow::IpcServer::formatTelemetry(txflow::Event{e}));
  EXPECT_EQ(j["type"].get<std::string>(), "transition_committed");
  EXPECT_EQ(j["entity_id"].get<std::string>(), "tx-1");
  EXPECT_EQ(j["from"].get<std::string>(), "draft");
  EXPECT_EQ(j["to"].get<std::string>(), "depositing");
  EXPECT_EQ(j["version"].get<std::int64_t>(), 1);

  txflow::BroadcastCompletedEvent b;
  b.parent_id = "bt-1";
  b.attempted = 2;
  b.succeeded = 1;
  b.failed_children = {"tx-2"};
  auto broadcast = json::parse(txflow::IpcServer::formatTelemetry(b));
  EXPECT_EQ(broadcast["type"].get<std::string>(), "broadcast_completed");
  EXPECT_EQ(broadcast["failed_children"].get<std::vector<std::string>>(),
            std::vector<std::string>{"tx-2"});
}

// -----------------------------------------------------------------------------
// 10. Job wire format pushed to external workers.
// Why: Workers drop duplicates by (entity_id, type, commit_version).
// -----------------------------------------------------------------------------
TEST(ZmqJobQueueTest, FormatsJob) {
  txflow::Job job;
  job.type = d::job::kStartNextTransfer;
  job.entity_id = "tx-1";
  job.commit_version = 2;
  job.payload = {{"amount_cents", 10000}, {"source", "broadcast:bt-1"}};

  auto j = json::parse(txflow::ZmqJobQueue::formatJob(job));

  EXPECT_EQ(j["type"].get<std::string>(), d::job::kStartNextTransfer);
  EXPECT_EQ(j["entity_id"].get<std::string>(), "tx-1");
  EXPECT_EQ(j["commit_version"].get<std::uint64_t>(), 2u);
  EXPECT_EQ(j["payload"]["amount_cents"].get<std::int64_t>(), 10000);
  EXPECT_EQ(j["payload"]["source"].get<std::string>(), "broadcast:bt-1");
  EXPECT_EQ(j.size(), 4u);
}

// -----------------------------------------------------------------------------
// 11. createTransaction() racing create_requested: a call either attaches
//     a child the bank transaction keeps, or throws with nothing attached.
// -----------------------------------------------------------------------------
TEST_F(LifecycleEngineTest, ConcurrentAttachNeverHalfAttaches) {
  constexpr int kRounds = 50;
  for (int round = 0; round < kRounds; ++round) {
    txflow::LifecycleEngine engine(clock);
    engine.createBankTransaction("bt-1");

    std::thread requester([&engine] {
      EXPECT_TRUE(engine.fire("bt-1", d::bank_event::kCreateRequested).ok());
    });
    std::vector<std::string> attached;
    for (int i = 0; i < 20; ++i) {
      const std::string id = "tx-" + std::to_string(i);
      try {
        engine.createTransaction(id, "bt-1", 100);
        attached.push_back(id);
      } catch (const std::logic_error&) {
        break;
      }
    }
    requester.join();

    auto bt = engine.bankTransaction("bt-1");
    ASSERT_TRUE(bt.has_value());
    EXPECT_EQ(bt->transaction_ids, attached);
    const auto expected_cents = static_cast<std::int64_t>(attached.size());
    EXPECT_EQ(bt->total_cents, expected_cents * 100);
    EXPECT_EQ(engine.bridge().children("bt-1").size(), attached.size());
    EXPECT_EQ(engine.instance("bt-1")->currentState(),
              d::bank_state::kCreating);
  }
}

// -----------------------------------------------------------------------------
// 12. stop() while deferred broadcasts are still publishing telemetry.
// Why: The dispatcher worker publishes to the telemetry subscriber; stop()
//      must drain it before the server is released.
// -----------------------------------------------------------------------------
TEST_F(LifecycleEngineTest, StopWithDeferredBroadcasts) {
  txflow::EngineConfig config;
  config.async_after_actions = true;
  config.ipc_cmd_endpoint = "inproc://txflow-cmd";
  config.ipc_pub_endpoint = "inproc://txflow-pub";
  txflow::LifecycleEngine engine(clock, config);
  populate(engine);
  engine.start();
  const std::size_t subscribers = engine.eventBus().subscriberCount();

  ASSERT_TRUE(engine.fire("bt-1", d::bank_event::kCreateRequested).ok());
  ASSERT_TRUE(engine.fire("bt-1", d::bank_event::kCreatedViaApi)
                  .after_actions_deferred);
  engine.stop();

  EXPECT_FALSE(engine.running());
  EXPECT_EQ(engine.eventBus().subscriberCount(), subscribers - 1);
  EXPECT_EQ(engine.instance("tx-1")->currentState(), d::tx_state::kDepositing);
  EXPECT_EQ(engine.instance("tx-2")->currentState(), d::tx_state::kDepositing);

  // Events after stop() have no telemetry subscriber left to reach.
  EXPECT_TRUE(engine.fire("tx-1", d::tx_event::kBankTransactionSucceeded).ok());
}
