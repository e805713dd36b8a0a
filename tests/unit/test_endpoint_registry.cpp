// Prism Endpoint Registry Tests

#include <catch2/catch_test_macros.hpp>

#include <atomic>
#include <thread>
#include <vector>

#include "../../src/core/errors.hpp"
#include "../../src/gateway/endpoint_registry.hpp"
#include "test_support.hpp"

using namespace prism;
using namespace prism::gateway;
using prism::testing::make_endpoint;

TEST_CASE("Endpoint registration", "[gateway][registry]") {
    EndpointRegistry registry;

    SECTION("ids are assigned in order") {
        uint64_t a = 0;
        uint64_t b = 0;
        REQUIRE_FALSE(registry.register_endpoint(make_endpoint(ProtocolKind::Http, 8080), a));
        REQUIRE_FALSE(registry.register_endpoint(make_endpoint(ProtocolKind::Tcp, 9000), b));
        REQUIRE(a != 0);
        REQUIRE(b > a);
        REQUIRE(registry.size() == 2);

        auto found = registry.find(b);
        REQUIRE(found.has_value());
        REQUIRE(found->protocol == ProtocolKind::Tcp);
        REQUIRE(found->address() == "127.0.0.1:9000");
    }

    SECTION("invalid endpoints are rejected") {
        uint64_t id = 0;
        auto zero_weight = make_endpoint(ProtocolKind::Http, 8080, 0);
        REQUIRE(registry.register_endpoint(zero_weight, id) == core::GatewayErrc::invalid_argument);

        auto zero_port = make_endpoint(ProtocolKind::Http, 0);
        REQUIRE(registry.register_endpoint(zero_port, id) == core::GatewayErrc::invalid_argument);

        auto no_capacity = make_endpoint(ProtocolKind::Http, 8080);
        no_capacity.max_load = 0;
        REQUIRE(registry.register_endpoint(no_capacity, id) == core::GatewayErrc::invalid_argument);

        auto no_host = make_endpoint(ProtocolKind::Http, 8080);
        no_host.host.clear();
        REQUIRE(registry.register_endpoint(no_host, id) == core::GatewayErrc::invalid_argument);

        REQUIRE(registry.size() == 0);
    }

    SECTION("caller supplied load is ignored") {
        auto endpoint = make_endpoint(ProtocolKind::Http, 8080);
        endpoint.current_load = 50;
        uint64_t id = 0;
        REQUIRE_FALSE(registry.register_endpoint(endpoint, id));
        REQUIRE(registry.find(id)->current_load == 0);
    }
}

TEST_CASE("Endpoint snapshots", "[gateway][registry]") {
    EndpointRegistry registry;
    uint64_t http_a = 0;
    uint64_t tcp = 0;
    uint64_t http_b = 0;
    REQUIRE_FALSE(registry.register_endpoint(make_endpoint(ProtocolKind::Http, 8080), http_a));
    REQUIRE_FALSE(registry.register_endpoint(make_endpoint(ProtocolKind::Tcp, 9000), tcp));
    REQUIRE_FALSE(registry.register_endpoint(make_endpoint(ProtocolKind::Http, 8081), http_b));

    auto http = registry.snapshot(ProtocolKind::Http);
    REQUIRE(http.size() == 2);
    REQUIRE(http[0].id == http_a);
    REQUIRE(http[1].id == http_b);
    REQUIRE(registry.snapshot(ProtocolKind::Udp).empty());
    REQUIRE(registry.all().size() == 3);

    SECTION("health updates") {
        REQUIRE(registry.healthy_count(ProtocolKind::Http) == 2);
        REQUIRE(registry.set_healthy(http_a, false));
        REQUIRE(registry.healthy_count(ProtocolKind::Http) == 1);
        REQUIRE_FALSE(registry.find(http_a)->healthy);

        // Snapshots are copies
        REQUIRE(http[0].healthy);

        REQUIRE_FALSE(registry.set_healthy(9999, false));
    }

    SECTION("deregistration") {
        REQUIRE(registry.deregister_endpoint(tcp));
        REQUIRE_FALSE(registry.deregister_endpoint(tcp));
        REQUIRE_FALSE(registry.find(tcp).has_value());
        REQUIRE(registry.size() == 2);
    }
}

TEST_CASE("Endpoint load accounting", "[gateway][registry][lease]") {
    EndpointRegistry registry;
    uint64_t id = 0;
    REQUIRE_FALSE(registry.register_endpoint(make_endpoint(ProtocolKind::WebSocket, 8080), id));

    SECTION("acquire and release") {
        REQUIRE(registry.acquire(id));
        REQUIRE(registry.acquire(id));
        REQUIRE(registry.find(id)->current_load == 2);
        registry.release(id);
        registry.release(id);
        registry.release(id);  // Never below zero
        REQUIRE(registry.find(id)->current_load == 0);
        REQUIRE_FALSE(registry.acquire(9999));
    }

    SECTION("leases release on destruction") {
        {
            auto lease = registry.lease(id);
            REQUIRE(lease);
            REQUIRE(lease.endpoint_id() == id);
            REQUIRE(registry.find(id)->current_load == 1);
        }
        REQUIRE(registry.find(id)->current_load == 0);
    }

    SECTION("moved leases release once") {
        auto first = registry.lease(id);
        EndpointLease second = std::move(first);
        REQUIRE_FALSE(first);
        REQUIRE(second);

        EndpointLease third;
        third = std::move(second);
        REQUIRE(registry.find(id)->current_load == 1);

        third.release();
        third.release();
        REQUIRE(registry.find(id)->current_load == 0);
    }

    SECTION("lease on a removed endpoint is empty") {
        auto lease = registry.lease(id);
        REQUIRE(registry.deregister_endpoint(id));
        lease.release();  // No-op on a missing endpoint
        REQUIRE_FALSE(registry.lease(id));
    }

    SECTION("leases stop at max_load") {
        auto capped = make_endpoint(ProtocolKind::WebSocket, 8081);
        capped.max_load = 2;
        uint64_t capped_id = 0;
        REQUIRE_FALSE(registry.register_endpoint(capped, capped_id));

        auto first = registry.lease(capped_id);
        auto second = registry.lease(capped_id);
        REQUIRE(first);
        REQUIRE(second);
        REQUIRE_FALSE(registry.lease(capped_id));
        REQUIRE_FALSE(registry.acquire(capped_id));
        REQUIRE(registry.find(capped_id)->current_load == 2);

        second.release();
        REQUIRE(registry.lease(capped_id));
    }

    SECTION("concurrent leases never exceed max_load") {
        auto capped = make_endpoint(ProtocolKind::WebSocket, 8082);
        capped.max_load = 1;
        uint64_t capped_id = 0;
        REQUIRE_FALSE(registry.register_endpoint(capped, capped_id));

        std::atomic<int64_t> peak{0};
        std::vector<std::thread> threads;
        for (int t = 0; t < 8; ++t) {
            threads.emplace_back([&] {
                for (int i = 0; i < 200; ++i) {
                    auto lease = registry.lease(capped_id);
                    int64_t load = registry.find(capped_id)->current_load;
                    int64_t seen = peak.load();
                    while (load > seen && !peak.compare_exchange_weak(seen, load)) {
                    }
                }
            });
        }
        for (auto& thread : threads) {
            thread.join();
        }
        REQUIRE(peak.load() <= 1);
        REQUIRE(registry.find(capped_id)->current_load == 0);
    }

    SECTION("concurrent leases balance out") {
        std::vector<std::thread> threads;
        for (int t = 0; t < 8; ++t) {
            threads.emplace_back([&] {
                for (int i = 0; i < 500; ++i) {
                    auto lease = registry.lease(id);
                }
            });
        }
        for (auto& thread : threads) {
            thread.join();
        }
        REQUIRE(registry.find(id)->current_load == 0);
    }
}
