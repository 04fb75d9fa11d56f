/**
 * Basic Dispatch Example
 *
 * Demonstrates the hot path end to end:
 * - Registering hooks with each operation kind and publishing them
 * - Submitting events from several producers onto running lanes
 * - Completing deferred Synchronization branches from a worker
 * - Draining receipts into folds and reading telemetry
 */

#include <tickhook/engine.hpp>
#include <tickhook/receipt_fold.hpp>
#include <algorithm>
#include <iostream>
#include <thread>
#include <atomic>
#include <mutex>
#include <vector>
#include <chrono>

using namespace tickhook;

namespace {

constexpr Term PRED_ORDER = 100;
constexpr Term PRED_PAYMENT = 200;
constexpr Term PRED_SHIPMENT = 300;

HookEntry make_hook(HookId id, const char* name, OperationKind kind, Term predicate) {
    HookEntry entry;
    entry.id = id;
    entry.name = name;
    entry.operation_kind = kind;
    entry.predicate_pattern = TermPattern::exact(predicate);
    return entry;
}

Branch branch(const char* name, BranchGuard guard, BranchHandler handler) {
    Branch b;
    b.name = name;
    b.guard = std::move(guard);
    b.handler = std::move(handler);
    return b;
}

} // namespace

int main() {
    std::cout << "=== Basic Dispatch Example ===\n\n";

    EngineConfig config;
    config.lanes = std::max(1u, std::min(4u, std::thread::hardware_concurrency()));
    config.tick_budget = 1u << 20;
    config.cycles_per_tick = 1;
    config.sync_deadline_ticks = 1u << 30;

    Engine engine(config);
    std::cout << "Engine with " << config.lanes << " lanes, matcher backend '"
              << matcher_backend_name(engine.matcher().backend()) << "'\n\n";

    // Example 1: one hook per operation kind
    std::atomic<int> small_orders{0}, large_orders{0}, payments{0}, audits{0};

    engine.register_hook(
        make_hook(1, "route_order", OperationKind::Discriminator, PRED_ORDER),
        {branch("large", [](const Event& e) { return e.object >= 1000; },
                [&](const BranchContext&) { large_orders.fetch_add(1); return BranchOutcome::Done; }),
         branch("small", nullptr,
                [&](const BranchContext&) { small_orders.fetch_add(1); return BranchOutcome::Done; })});

    engine.register_hook(
        make_hook(2, "record_payment", OperationKind::ParallelSplit, PRED_PAYMENT),
        {branch("ledger", nullptr,
                [&](const BranchContext&) { payments.fetch_add(1); return BranchOutcome::Done; }),
         branch("audit", nullptr,
                [&](const BranchContext&) { audits.fetch_add(1); return BranchOutcome::Done; })});

    // Shipment waits on a carrier confirmation delivered later by token
    std::mutex pending_mutex;
    std::vector<SyncToken> pending;
    engine.register_hook(
        make_hook(3, "ship", OperationKind::Synchronization, PRED_SHIPMENT),
        {branch("reserve_stock", nullptr,
                [](const BranchContext&) { return BranchOutcome::Done; }),
         branch("carrier_confirm", nullptr,
                [&](const BranchContext& ctx) {
                    std::lock_guard<std::mutex> lock(pending_mutex);
                    pending.push_back(ctx.token);
                    return BranchOutcome::Deferred;
                })});

    std::cout << "Published hook epoch " << engine.publish() << "\n\n";
    engine.start();

    // Example 2: producers and a completion worker
    std::cout << "=== Submitting events ===\n";
    std::atomic<bool> running{true};
    std::atomic<int> late_confirmations{0};
    std::thread carrier([&]() {
        while (running.load()) {
            std::vector<SyncToken> batch;
            {
                std::lock_guard<std::mutex> lock(pending_mutex);
                batch.swap(pending);
            }
            for (SyncToken token : batch) {
                if (engine.complete_branch(token, 1) != Status::Ok) {
                    late_confirmations.fetch_add(1);
                }
            }
            std::this_thread::sleep_for(std::chrono::microseconds(100));
        }
    });

    const Term predicates[] = {PRED_ORDER, PRED_PAYMENT, PRED_SHIPMENT};
    std::vector<std::thread> producers;
    for (size_t p = 0; p < 2; ++p) {
        producers.emplace_back([&, p]() {
            for (EventId i = 0; i < 3000; ++i) {
                Event e;
                e.id = p * 100000 + i;
                e.subject = p;
                e.predicate = predicates[i % 3];
                e.object = (i * 37) % 2000;
                while (engine.submit(e, p) == Status::Full) {
                    std::this_thread::yield();
                }
            }
        });
    }
    for (auto& t : producers) {
        t.join();
    }
    if (!engine.wait_until_drained(std::chrono::seconds(10))) {
        std::cerr << "Lanes did not drain: " << engine.lane_error() << "\n";
    }
    while (engine.open_synchronizations() > 0) {
        std::this_thread::sleep_for(std::chrono::milliseconds(1));
    }
    running.store(false);
    carrier.join();
    engine.stop();

    std::cout << "Orders: " << large_orders.load() << " large, " << small_orders.load() << " small\n";
    std::cout << "Payments: " << payments.load() << " ledger, " << audits.load() << " audit\n";
    std::cout << "Late carrier confirmations: " << late_confirmations.load() << "\n\n";

    // Example 3: receipts folded for the audit trail
    std::cout << "=== Receipt folds ===\n";
    ReceiptFolder folder(10);
    auto print_fold = [](const ReceiptFold& fold) {
        std::cout << "fold of " << fold.count << " receipts, root 0x" << std::hex
                  << fold.root_hash << std::dec << ", " << fold.total_ticks << " ticks, "
                  << fold.budget_violations << " over budget\n";
    };
    engine.drain_receipts([&](const ReceiptEntry& receipt) {
        if (auto fold = folder.add(receipt)) {
            print_fold(*fold);
        }
    });
    if (auto fold = folder.flush()) {
        print_fold(*fold);
    }

    TelemetrySnapshot t = engine.telemetry();
    std::cout << "\n=== Telemetry ===\n";
    std::cout << "processed " << t.events_processed << " / submitted " << t.events_submitted << "\n";
    for (size_t k = 0; k < OPERATION_KIND_COUNT; ++k) {
        std::cout << operation_kind_name(static_cast<OperationKind>(k)) << " dispatches: "
                  << t.dispatches[k] << "\n";
    }
    std::cout << "demoted " << t.total_demotions() << ", budget violations "
              << t.budget_violations << ", receipts " << t.receipts_emitted << "\n";
    for (size_t b = 0; b < CARDINALITY_BUCKETS; ++b) {
        if (t.cardinality[b] > 0) {
            std::cout << "candidates " << cardinality_bucket_label(b) << ": " << t.cardinality[b] << "\n";
        }
    }

    return 0;
}
