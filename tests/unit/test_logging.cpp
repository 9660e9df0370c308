// Bastion Logging Unit Tests

#include <catch2/catch_test_macros.hpp>

#include <algorithm>
#include <string>
#include <string_view>
#include <thread>

#include "../../src/core/logging.hpp"

using namespace bastion::logging;

namespace {

// Correlation ID format ({8-4-4-4-12}#{digits}, UUID v4)
bool is_valid_uuid(std::string_view uuid) {
    // Example: 550e8400-e29b-41d4-a716-446655440000#42
    size_t hash_pos = uuid.rfind('#');
    if (hash_pos == std::string_view::npos) {
        return false;
    }

    std::string_view uuid_part = uuid.substr(0, hash_pos);
    std::string_view counter_part = uuid.substr(hash_pos + 1);

    if (uuid_part.length() != 36) {
        return false;
    }

    if (uuid_part[8] != '-' || uuid_part[13] != '-' || uuid_part[18] != '-' ||
        uuid_part[23] != '-') {
        return false;
    }

    // Version nibble
    if (uuid_part[14] != '4') {
        return false;
    }

    // Variant nibble
    char variant = uuid_part[19];
    if (variant != '8' && variant != '9' && variant != 'a' && variant != 'b' &&
        variant != 'A' && variant != 'B') {
        return false;
    }

    auto is_hex = [](char c) {
        return (c >= '0' && c <= '9') || (c >= 'a' && c <= 'f') || (c >= 'A' && c <= 'F');
    };

    for (size_t i = 0; i < 36; ++i) {
        if (i == 8 || i == 13 || i == 18 || i == 23)
            continue;
        if (!is_hex(uuid_part[i])) return false;
    }

    if (counter_part.empty()) {
        return false;
    }

    for (char c : counter_part) {
        if (c < '0' || c > '9') {
            return false;
        }
    }

    return true;
}

}  // namespace

TEST_CASE("Correlation ID generation", "[logging][correlation_id]") {
    SECTION("generates valid UUID format") {
        std::string correlation_id = generate_correlation_id();

        // Should contain exactly one '#' separator
        size_t hash_count = std::count(correlation_id.begin(), correlation_id.end(), '#');
        REQUIRE(hash_count == 1);

        // Should validate as a proper correlation ID
        REQUIRE(is_valid_uuid(correlation_id));
    }

    SECTION("generates unique IDs with incrementing counter") {
        std::string id1 = generate_correlation_id();
        std::string id2 = generate_correlation_id();
        std::string id3 = generate_correlation_id();

        // All should be different
        REQUIRE(id1 != id2);
        REQUIRE(id2 != id3);
        REQUIRE(id1 != id3);

        // All should be valid
        REQUIRE(is_valid_uuid(id1));
        REQUIRE(is_valid_uuid(id2));
        REQUIRE(is_valid_uuid(id3));

        // Should have same UUID base but different counters
        size_t hash_pos1 = id1.find('#');
        size_t hash_pos2 = id2.find('#');

        std::string base1 = id1.substr(0, hash_pos1);
        std::string base2 = id2.substr(0, hash_pos2);

        // Same thread should have same base UUID
        REQUIRE(base1 == base2);

        // But different counters
        std::string counter1 = id1.substr(hash_pos1 + 1);
        std::string counter2 = id2.substr(hash_pos2 + 1);
        REQUIRE(counter1 != counter2);
    }

    SECTION("format matches expected pattern") {
        std::string correlation_id = generate_correlation_id();

        // Split by '#'
        size_t hash_pos = correlation_id.find('#');
        REQUIRE(hash_pos != std::string::npos);

        std::string uuid_part = correlation_id.substr(0, hash_pos);
        std::string counter_part = correlation_id.substr(hash_pos + 1);

        // UUID part should be 36 characters (8-4-4-4-12 with hyphens)
        REQUIRE(uuid_part.length() == 36);

        // Should have hyphens at correct positions
        REQUIRE(uuid_part[8] == '-');
        REQUIRE(uuid_part[13] == '-');
        REQUIRE(uuid_part[18] == '-');
        REQUIRE(uuid_part[23] == '-');

        // Version should be 4
        REQUIRE(uuid_part[14] == '4');

        // Variant should be 8, 9, a, or b
        char variant = uuid_part[19];
        REQUIRE((variant == '8' || variant == '9' || variant == 'a' || variant == 'b' ||
                 variant == 'A' || variant == 'B'));

        // Counter should be all digits
        REQUIRE(!counter_part.empty());
        for (char c : counter_part) {
            REQUIRE((c >= '0' && c <= '9'));
        }
    }
}

TEST_CASE("Generated correlation IDs are well formed", "[logging][validation]") {
    SECTION("validates generated correlation IDs") {
        // Generate multiple IDs and validate all of them
        for (int i = 0; i < 100; ++i) {
            std::string correlation_id = generate_correlation_id();
            REQUIRE(is_valid_uuid(correlation_id));
        }
    }
}

TEST_CASE("Correlation IDs differ across threads", "[logging][correlation_id]") {
    std::string main_id = generate_correlation_id();
    std::string other_id;
    std::thread worker([&other_id]() { other_id = generate_correlation_id(); });
    worker.join();

    REQUIRE(is_valid_uuid(other_id));
    REQUIRE(main_id.substr(0, main_id.find('#')) != other_id.substr(0, other_id.find('#')));
}

TEST_CASE("Process logger access", "[logging][logger]") {
    SECTION("initialized once and shared by every thread") {
        auto* logger = get_current_logger();
        REQUIRE(logger != nullptr);

        quill::Logger* seen = nullptr;
        std::thread worker([&seen]() { seen = get_current_logger(); });
        worker.join();
        REQUIRE(seen == logger);
    }

    SECTION("logging macros accept structured fields") {
        auto* logger = get_current_logger();
        REQUIRE(logger != nullptr);
        LOG_DECISION(logger, "deny", "GET", "/bob", 403, "alice", generate_correlation_id());
        LOG_ERROR_CTX(logger, "Test failure", generate_correlation_id(), "test_error", "detail");
        LOG_UPSTREAM(logger, "upstream_timeout", "alice-api", "127.0.0.1", 9001,
                     generate_correlation_id());
    }
}
