// -----------------------------------------------------------------------------
// txflow_demo: single executable entry point.
//
// Usage:
//   txflow_demo [engine_config.json] [--serve]
//
// Scenario mode (default):
//   1) Load EngineConfig (defaults when no path is given).
//   2) Create the LifecycleEngine and subscribe logging callbacks.
//   3) Create BankTransaction bt-1 with two Transactions ($100, $150).
//   4) Walk bt-1 through create_requested / created_via_api, which
//      broadcasts bank_transaction_created to both Transactions.
//   5) Settle bt-1 (guarded by "all Transactions depositing"), which
//      broadcasts bank_transaction_succeeded and enqueues the next-transfer
//      jobs.
//   6) Show a rejected duplicate fire, then shut down.
//
// Serve mode (--serve):
//   Runs the scenario, then keeps the engine (and its IpcServer, if
//   configured) alive until Ctrl-C so operators can send PING / STATUS /
//   FIRE commands.
// -----------------------------------------------------------------------------

#include "txflow/config/engine_config.hpp"
#include "txflow/domain/lifecycle.hpp"
#include "txflow/engine/lifecycle_engine.hpp"
#include "txflow/fsm/errors.hpp"
#include "txflow/time/live_time_provider.hpp"

#include <atomic>
#include <chrono>
#include <csignal>
#include <iostream>
#include <string>
#include <thread>

namespace {

// Set by the SIGINT handler; polled by the serve loop. std::atomic<bool> is
// lock-free on every supported target, so the store is signal-safe.
std::atomic<bool> g_stop_requested{false};

void sigint_handler(int /*signum*/) { g_stop_requested.store(true); }

void printResult(const std::string& label, const txflow::FireResult& result) {
  if (result.ok()) {
    std::cout << "[main] " << label << " -> " << *result.state << " (v"
              << result.version << ")";
    if (result.after_actions_deferred) {
      std::cout << " [after-actions deferred]";
    }
    std::cout << "\n";
    for (const auto& failure : result.after_action_failures) {
      std::cout << "[main]   after-action '" << failure.action
                << "' failed: " << failure.message << "\n";
      for (const auto& child : failure.child_failures) {
        std::cout << "[main]     child " << child.child_id << ": "
                  << child.message << "\n";
      }
    }
  } else {
    std::cout << "[main] " << label << " rejected: "
              << txflow::toString(result.error->kind) << " ("
              << result.error->message << ")\n";
  }
}

}  // namespace

int main(int argc, char* argv[]) {
  namespace d = txflow::domain;

  std::string config_path;
  bool serve = false;
  for (int i = 1; i < argc; ++i) {
    std::string arg = argv[i];
    if (arg == "--serve") {
      serve = true;
    } else {
      config_path = arg;
    }
  }

  // -------------------------------------------------------------------------
  // 1) Configuration. Errors here are fatal: nothing has started yet.
  // -------------------------------------------------------------------------
  txflow::EngineConfig config;
  if (!config_path.empty()) {
    try {
      config = txflow::loadEngineConfig(config_path);
    } catch (const std::exception& e) {
      std::cerr << "[main] cannot load " << config_path << ": " << e.what()
                << "\n";
      return 1;
    }
  }

  txflow::LiveTimeProvider clock;

  try {
    // -----------------------------------------------------------------------
    // 2) Engine. Machine definitions are validated in the constructor.
    // -----------------------------------------------------------------------
    txflow::LifecycleEngine engine(clock, config);

    engine.eventBus().subscribe<txflow::BroadcastCompletedEvent>(
        [](const txflow::BroadcastCompletedEvent& e) {
          std::cout << "[Broadcast] " << e.parent_id << " '" << e.event
                    << "': " << e.succeeded << "/" << e.attempted
                    << " child(ren) moved\n";
        });
    engine.eventBus().subscribe<txflow::ActionFailedEvent>(
        [](const txflow::ActionFailedEvent& e) {
          std::cout << "[ActionFailed] " << e.entity_id << " '" << e.action
                    << "' (" << e.phase << "): " << e.message << "\n";
        });

    engine.start();

    // -----------------------------------------------------------------------
    // 3) Entities
    // -----------------------------------------------------------------------
    engine.createBankTransaction("bt-1");
    engine.createTransaction("tx-1", "bt-1", 10000, "ada@example.com");
    engine.createTransaction("tx-2", "bt-1", 15000, "grace@example.com");

    txflow::TransitionContext api;
    api.source = "api";

    // -----------------------------------------------------------------------
    // 4) Bank transfer created: children move to depositing
    // -----------------------------------------------------------------------
    printResult("bt-1 create_requested",
                engine.fire("bt-1", d::bank_event::kCreateRequested, api));
    printResult("bt-1 created_via_api",
                engine.fire("bt-1", d::bank_event::kCreatedViaApi, api));
    engine.waitIdle(std::chrono::seconds(2));

    // -----------------------------------------------------------------------
    // 5) Bank transfer settled: children move to deposited, jobs enqueued
    // -----------------------------------------------------------------------
    printResult("bt-1 settled_via_api",
                engine.fire("bt-1", d::bank_event::kSettledViaApi, api));
    engine.waitIdle(std::chrono::seconds(2));

    // -----------------------------------------------------------------------
    // 6) A duplicate delivery of the same trigger is rejected
    // -----------------------------------------------------------------------
    printResult("tx-1 bank_transaction_succeeded (duplicate)",
                engine.fire("tx-1", d::tx_event::kBankTransactionSucceeded,
                            api));

    if (auto* jobs = engine.inMemoryJobs()) {
      for (const auto& job : jobs->jobs()) {
        std::cout << "[main] job " << job.type << " for " << job.entity_id
                  << " v" << job.commit_version << " " << job.payload.dump()
                  << "\n";
      }
    }
    std::cout << "[main] " << engine.executeCommand("STATUS") << "\n";

    if (serve) {
      std::signal(SIGINT, sigint_handler);
      std::cout << "[main] Serving. Press Ctrl-C to shut down.\n";
      while (!g_stop_requested.load()) {
        std::this_thread::sleep_for(std::chrono::milliseconds(100));
      }
      std::cout << "\n[main] SIGINT received. Shutting down...\n";
    }

    engine.stop();
  } catch (const txflow::DefinitionError& e) {
    std::cerr << "[main] invalid machine definition: " << e.what() << "\n";
    return 1;
  } catch (const std::exception& e) {
    std::cerr << "[main] fatal: " << e.what() << "\n";
    return 1;
  }

  return 0;
}
