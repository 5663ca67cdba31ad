// -----------------------------------------------------------------------------
// zk_receipts: single executable entry point.
//
//   1) Load policy documents (--policy-dir, or the built-in defaults).
//   2) Build a ReceiptEngine with a synthetic adapter for every venue, the
//      SP1 MVP prover and the offchain verifier, on the live clock.
//   3) --demo: submit one ORDER_PLACED and one TRADE_EXECUTED request, wait
//      for both, print the receipts as JSON and exit.
//      otherwise: serve commands on --cmd (REP) and telemetry on --pub (PUB)
//      until SIGINT/SIGTERM.
//
// Thread layout (server mode):
//   main thread        → waits for the shutdown flag
//   WorkerPool (N)     → receipt pipelines
//   server thread      → ReceiptServer command/telemetry loop
// -----------------------------------------------------------------------------

#include "zkr/adapter/synthetic_venue_adapter.hpp"
#include "zkr/domain/receipt_json.hpp"
#include "zkr/engine/command_dispatcher.hpp"
#include "zkr/engine/receipt_engine.hpp"
#include "zkr/network/receipt_server.hpp"
#include "zkr/policy/policy_documents.hpp"
#include "zkr/policy/policy_engine.hpp"
#include "zkr/prover/sp1_mvp_prover.hpp"
#include "zkr/time/live_time_provider.hpp"
#include "zkr/verifier/offchain_verifier.hpp"

#include <atomic>
#include <chrono>
#include <csignal>
#include <initializer_list>
#include <iostream>
#include <memory>
#include <string>
#include <thread>

namespace {

// Set from the signal handler; polled by main(). Lock-free atomic store is
// async-signal-safe.
std::atomic<bool> g_shutdown_requested{false};

void shutdown_handler(int /*signum*/) { g_shutdown_requested.store(true); }

struct Options {
  std::string policy_dir;
  std::string cmd_endpoint{"tcp://127.0.0.1:5556"};
  std::string pub_endpoint{"tcp://127.0.0.1:5557"};
  bool demo{false};
};

void print_usage(const char* argv0) {
  std::cerr << "usage: " << argv0
            << " [--policy-dir <dir>] [--cmd <endpoint>] [--pub <endpoint>]"
               " [--demo]\n";
}

// Returns false on an unknown flag or a flag missing its value.
bool parse_options(int argc, char** argv, Options& options) {
  for (int i = 1; i < argc; ++i) {
    const std::string arg = argv[i];
    const bool has_value = i + 1 < argc;

    if (arg == "--demo") {
      options.demo = true;
    } else if (arg == "--policy-dir" && has_value) {
      options.policy_dir = argv[++i];
    } else if (arg == "--cmd" && has_value) {
      options.cmd_endpoint = argv[++i];
    } else if (arg == "--pub" && has_value) {
      options.pub_endpoint = argv[++i];
    } else {
      return false;
    }
  }
  return true;
}

void run_demo(zkr::ReceiptEngine& engine) {
  zkr::domain::ProofRequest placed;
  placed.venue = zkr::domain::Venue::Hyperliquid;
  placed.claim_type = zkr::domain::ClaimType::OrderPlaced;
  placed.account_ref = "acct-demo";
  placed.order_ref = "order-demo-1";

  zkr::domain::ProofRequest executed;
  executed.venue = zkr::domain::Venue::Base;
  executed.claim_type = zkr::domain::ClaimType::TradeExecuted;
  executed.account_ref = "acct-demo";
  executed.order_ref = "order-demo-2";
  executed.execution_ref = "exec-demo-2";

  for (const auto& request : {placed, executed}) {
    const auto receipt_id = engine.submit(request);
    const auto receipt =
        engine.wait_for_receipt(receipt_id, std::chrono::seconds(5));
    std::cout << nlohmann::json(receipt).dump(2) << "\n";
  }
}

}  // namespace

int main(int argc, char** argv) {
  Options options;
  if (!parse_options(argc, argv, options)) {
    print_usage(argv[0]);
    return 2;
  }

  try {
    // -----------------------------------------------------------------------
    // 1) Policy.
    // -----------------------------------------------------------------------
    zkr::policy::PolicyEngine policy =
        options.policy_dir.empty()
            ? zkr::policy::PolicyEngine::withDefaults()
            : zkr::policy::PolicyEngine::fromDirectory(options.policy_dir);

    // -----------------------------------------------------------------------
    // 2) Engine.
    // -----------------------------------------------------------------------
    zkr::LiveTimeProvider clock;

    zkr::ReceiptEngine::AdapterList adapters;
    for (auto venue : zkr::domain::kAllVenues) {
      adapters.push_back(
          std::make_shared<zkr::adapter::SyntheticVenueAdapter>(venue, clock));
    }

    zkr::ReceiptEngine engine(adapters, std::move(policy),
                              std::make_shared<zkr::prover::Sp1MvpProver>(),
                              std::make_shared<zkr::verifier::OffchainVerifier>(),
                              clock);
    engine.start();

    if (options.demo) {
      run_demo(engine);
      engine.stop();
      return 0;
    }

    // -----------------------------------------------------------------------
    // 3) Server mode.
    // -----------------------------------------------------------------------
    zkr::CommandDispatcher dispatcher(engine);
    zkr::ReceiptServer server(
        [&dispatcher](const std::string& message) {
          return dispatcher.execute(message);
        },
        options.cmd_endpoint, options.pub_endpoint);

    const auto telemetry = engine.eventBus().subscribe<zkr::ReceiptFinalizedEvent>(
        [&server](const zkr::ReceiptFinalizedEvent& e) {
          server.pushTelemetry(e);
        });

    std::signal(SIGINT, shutdown_handler);
    std::signal(SIGTERM, shutdown_handler);

    try {
      server.start();
    } catch (...) {
      // server is destroyed before engine; detach it from the bus first.
      engine.eventBus().unsubscribe(telemetry);
      throw;
    }

    while (!g_shutdown_requested.load()) {
      std::this_thread::sleep_for(std::chrono::milliseconds(100));
    }

    std::cout << "\n[main] shutdown requested.\n";

    // Server first: it calls into the engine.
    server.stop();
    engine.stop();
  } catch (const std::exception& e) {
    std::cerr << "[main] fatal: " << e.what() << "\n";
    return 1;
  }

  return 0;
}
