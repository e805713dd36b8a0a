// Prism Logging Unit Tests

#include <catch2/catch_test_macros.hpp>

#include <algorithm>
#include <set>
#include <string>
#include <mutex>
#include <thread>
#include <vector>

#include "../../src/core/logging.hpp"

using namespace prism::logging;

TEST_CASE("Session id generation", "[logging][session_id]") {
    SECTION("uuid and counter separated by '#'") {
        std::string id = generate_session_id();

        REQUIRE(std::count(id.begin(), id.end(), '#') == 1);
        REQUIRE(is_valid_session_id(id));

        size_t hash_pos = id.find('#');
        std::string uuid_part = id.substr(0, hash_pos);
        std::string counter_part = id.substr(hash_pos + 1);

        REQUIRE(uuid_part.length() == 36);
        REQUIRE(uuid_part[8] == '-');
        REQUIRE(uuid_part[13] == '-');
        REQUIRE(uuid_part[18] == '-');
        REQUIRE(uuid_part[23] == '-');
        REQUIRE(uuid_part[14] == '4');  // Version 4

        REQUIRE_FALSE(counter_part.empty());
        for (char c : counter_part) {
            REQUIRE((c >= '0' && c <= '9'));
        }
    }

    SECTION("same thread shares the base, counter increments") {
        std::string first = generate_session_id();
        std::string second = generate_session_id();

        REQUIRE(first != second);
        REQUIRE(first.substr(0, first.find('#')) == second.substr(0, second.find('#')));

        uint64_t a = std::stoull(first.substr(first.find('#') + 1));
        uint64_t b = std::stoull(second.substr(second.find('#') + 1));
        REQUIRE(b == a + 1);
    }

    SECTION("ids from different threads do not collide") {
        std::set<std::string> ids;
        std::mutex mutex;
        std::vector<std::thread> threads;
        for (int t = 0; t < 4; ++t) {
            threads.emplace_back([&] {
                for (int i = 0; i < 50; ++i) {
                    auto id = generate_session_id();
                    std::lock_guard<std::mutex> lock(mutex);
                    ids.insert(id);
                }
            });
        }
        for (auto& thread : threads) {
            thread.join();
        }
        REQUIRE(ids.size() == 200);
    }
}

TEST_CASE("Session id validation", "[logging][validation]") {
    SECTION("accepts well-formed ids") {
        REQUIRE(is_valid_session_id("550e8400-e29b-41d4-a716-446655440000#0"));
        REQUIRE(is_valid_session_id("550e8400-e29b-41d4-a716-446655440000#123456"));
        REQUIRE(is_valid_session_id("ABCDEF12-3456-4789-ABCD-EF0123456789#42"));
    }

    SECTION("rejects malformed ids") {
        REQUIRE_FALSE(is_valid_session_id(""));
        REQUIRE_FALSE(is_valid_session_id("550e8400-e29b-41d4-a716-446655440000"));
        REQUIRE_FALSE(is_valid_session_id("550e8400-e29b-41d4-a716-446655440000#"));
        REQUIRE_FALSE(is_valid_session_id("550e8400-e29b-41d4-a716-446655440000#12a"));
        REQUIRE_FALSE(is_valid_session_id("550e8400e29b41d4a716446655440000#0"));
        REQUIRE_FALSE(is_valid_session_id("550e8400-e29b-31d4-a716-446655440000#0"));  // Version 3
        REQUIRE_FALSE(is_valid_session_id("550e8400-e29b-41d4-c716-446655440000#0"));  // Variant c
        REQUIRE_FALSE(is_valid_session_id("550g8400-e29b-41d4-a716-446655440000#0"));
        REQUIRE_FALSE(is_valid_session_id("550e8400-e29b-41d4-a716-446655440000#1#2"));
    }
}

TEST_CASE("Process logger", "[logging][logger]") {
    auto* logger = get_logger();
    REQUIRE(logger != nullptr);
    REQUIRE(get_logger() == logger);

    // Domain macros format without throwing
    LOG_SESSION_EVENT(logger, "opened", generate_session_id(), "tcp", "connected");
    LOG_ENDPOINT_EVENT(logger, "healthy", 7, "127.0.0.1", 9000, "http");
}
