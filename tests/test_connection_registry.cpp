/**
 * Admission control and bookkeeping of ConnectionRegistry.
 * Asserts:
 * - The limit holds under concurrent registration.
 * - Register/unregister storms converge to zero.
 * - Unknown ids and double unregisters are no-ops.
 *
 * Run from build dir: ./test_connection_registry
 */

#include "connection_registry.h"
#include "logger.h"
#include <atomic>
#include <iostream>
#include <string>
#include <thread>
#include <vector>

using namespace voice_relay;

static int failed = 0;

#define ASSERT(cond) do { if (!(cond)) { std::cerr << "FAIL: " << #cond << " (line " << __LINE__ << ")\n"; failed++; } } while(0)

int main() {
    Logger::initialize(LogLevel::ERROR);

    // --- Register, inspect, unregister ---
    {
        ConnectionRegistry registry(10);
        ASSERT(registry.max_connections() == 10);
        ASSERT(registry.register_connection("test-123", std::string("caller-456"), ConnectionType::Telephony));
        ASSERT(registry.active_count() == 1);

        auto entry = registry.get("test-123");
        ASSERT(entry.has_value());
        ASSERT(entry->caller_id == std::string("caller-456"));
        ASSERT(entry->connection_type == ConnectionType::Telephony);
        ASSERT(entry->status == "connected");

        registry.unregister_connection("test-123");
        ASSERT(registry.active_count() == 0);
        ASSERT(!registry.get("test-123").has_value());
    }

    // --- max_connections = 5: conn-0..conn-4 succeed, conn-5 refused ---
    {
        ConnectionRegistry registry(5);
        for (int i = 0; i < 5; ++i) {
            ASSERT(registry.register_connection("conn-" + std::to_string(i), std::nullopt, ConnectionType::Web));
        }
        ASSERT(!registry.register_connection("conn-5", std::nullopt, ConnectionType::Web));
        ASSERT(registry.active_count() == 5);
        ASSERT(!registry.get("conn-5").has_value());

        // A freed slot can be reused
        registry.unregister_connection("conn-0");
        ASSERT(registry.register_connection("conn-5", std::nullopt, ConnectionType::Web));
        ASSERT(registry.active_count() == 5);
    }

    // --- Unknown id and double unregister are no-ops ---
    {
        ConnectionRegistry registry(3);
        registry.unregister_connection("nonexistent");
        ASSERT(registry.active_count() == 0);

        ASSERT(registry.register_connection("a", std::nullopt, ConnectionType::Web));
        ASSERT(registry.register_connection("b", std::nullopt, ConnectionType::Web));
        registry.unregister_connection("a");
        registry.unregister_connection("a");
        ASSERT(registry.active_count() == 1);
        ASSERT(registry.get("b").has_value());
    }

    // --- Snapshot of all entries, with types tracked ---
    {
        ConnectionRegistry registry(10);
        registry.register_connection("conn-0", std::string("c0"), ConnectionType::Telephony);
        registry.register_connection("conn-1", std::nullopt, ConnectionType::Web);
        auto all = registry.all();
        ASSERT(all.size() == 2);
        ASSERT(all["conn-0"].connection_type == ConnectionType::Telephony);
        ASSERT(all["conn-1"].connection_type == ConnectionType::Web);
        ASSERT(!all["conn-1"].caller_id.has_value());

        // Snapshot is a copy
        registry.unregister_connection("conn-0");
        ASSERT(all.size() == 2);
        ASSERT(registry.all().size() == 1);
    }

    // --- set_max_connections ---
    {
        ConnectionRegistry registry(2);
        registry.set_max_connections(0);
        ASSERT(registry.max_connections() == 2);
        registry.set_max_connections(-3);
        ASSERT(registry.max_connections() == 2);

        ASSERT(registry.register_connection("x", std::nullopt, ConnectionType::Web));
        ASSERT(registry.register_connection("y", std::nullopt, ConnectionType::Web));
        registry.set_max_connections(1);
        ASSERT(registry.active_count() == 2);  // no eviction
        registry.unregister_connection("x");
        ASSERT(!registry.register_connection("z", std::nullopt, ConnectionType::Web));
        registry.set_max_connections(3);
        ASSERT(registry.register_connection("z", std::nullopt, ConnectionType::Web));
        ASSERT(registry.active_count() == 2);
    }

    // --- Concurrent registrations never exceed the limit ---
    {
        const int limit = 10;
        const int offered = 40;
        ConnectionRegistry registry(limit);
        std::atomic<int> accepted{0};
        std::vector<std::thread> threads;
        for (int i = 0; i < offered; ++i) {
            threads.emplace_back([&registry, &accepted, i] {
                if (registry.register_connection("conn-" + std::to_string(i), std::nullopt, ConnectionType::Web)) {
                    accepted++;
                }
            });
        }
        for (auto& t : threads) t.join();
        ASSERT(accepted == limit);
        ASSERT(registry.active_count() == limit);
    }

    // --- Concurrent register/unregister converges to zero ---
    {
        const int n = 50;
        ConnectionRegistry registry(n);
        std::vector<std::thread> threads;
        for (int i = 0; i < n; ++i) {
            threads.emplace_back([&registry, i] {
                std::string id = "conn-" + std::to_string(i);
                registry.register_connection(id, std::nullopt, ConnectionType::Telephony);
                registry.unregister_connection(id);
            });
        }
        for (auto& t : threads) t.join();
        ASSERT(registry.active_count() == 0);
    }

    if (failed) {
        std::cerr << failed << " assertion(s) failed.\n";
        return 1;
    }
    std::cout << "All connection registry tests passed.\n";
    return 0;
}
