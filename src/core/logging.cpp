#include "logging.hpp"

#include <fmt/format.h>

#include <algorithm>
#include <array>
#include <atomic>
#include <chrono>
#include <cstdint>
#include <filesystem>
#include <mutex>
#include <random>

#include "../control/config.hpp"

namespace prism::logging {

namespace {

std::once_flag g_backend_once;
std::atomic<quill::Logger*> g_logger{nullptr};

quill::LogLevel parse_level(std::string level) {
    std::transform(level.begin(), level.end(), level.begin(), ::tolower);

    if (level == "debug") {
        return quill::LogLevel::Debug;
    }
    if (level == "warning" || level == "warn") {
        return quill::LogLevel::Warning;
    }
    if (level == "error") {
        return quill::LogLevel::Error;
    }
    return quill::LogLevel::Info;
}

// Generate base UUID v4 (once per thread)
std::string generate_base_uuid() {
    std::mt19937 rng(std::random_device{}() ^
                     static_cast<uint32_t>(
                         std::chrono::steady_clock::now().time_since_epoch().count()));
    std::uniform_int_distribution<uint32_t> dist;

    std::array<uint8_t, 16> bytes{};
    for (size_t i = 0; i < bytes.size(); i += 4) {
        uint32_t random_val = dist(rng);
        bytes[i] = static_cast<uint8_t>(random_val & 0xFF);
        bytes[i + 1] = static_cast<uint8_t>((random_val >> 8) & 0xFF);
        bytes[i + 2] = static_cast<uint8_t>((random_val >> 16) & 0xFF);
        bytes[i + 3] = static_cast<uint8_t>((random_val >> 24) & 0xFF);
    }

    // Version 4, RFC 4122 variant
    bytes[6] = (bytes[6] & 0x0F) | 0x40;
    bytes[8] = (bytes[8] & 0x3F) | 0x80;

    std::string out;
    out.reserve(36);
    for (size_t i = 0; i < bytes.size(); ++i) {
        if (i == 4 || i == 6 || i == 8 || i == 10) {
            out.push_back('-');
        }
        out += fmt::format("{:02x}", bytes[i]);
    }
    return out;
}

bool is_hex(char c) {
    return (c >= '0' && c <= '9') || (c >= 'a' && c <= 'f') || (c >= 'A' && c <= 'F');
}

}  // namespace

void init_logging_system() {
    std::call_once(g_backend_once, [] { quill::Backend::start(); });
}

quill::Logger* init_logger(const control::LogConfig& log_config) {
    init_logging_system();

    quill::Logger* logger = nullptr;

    if (log_config.output.empty()) {
        auto console_sink = quill::Frontend::create_or_get_sink<quill::ConsoleSink>("prism_console");
        logger = quill::Frontend::create_or_get_logger("prism", std::move(console_sink));
    } else {
        std::filesystem::create_directories(log_config.output);

        quill::RotatingFileSinkConfig config;
        config.set_rotation_max_file_size(
            static_cast<size_t>(log_config.rotation.max_size_mb) * 1'000'000);
        config.set_max_backup_files(log_config.rotation.max_files);
        config.set_open_mode('a');

        if (log_config.format == "json") {
            auto json_sink = quill::Frontend::create_or_get_sink<quill::RotatingJsonFileSink>(
                fmt::format("{}/prism.json", log_config.output), config);
            logger = quill::Frontend::create_or_get_logger("prism", std::move(json_sink));
        } else {
            auto file_sink = quill::Frontend::create_or_get_sink<quill::RotatingFileSink>(
                fmt::format("{}/prism.log", log_config.output), config);
            logger = quill::Frontend::create_or_get_logger("prism", std::move(file_sink));
        }
    }

    logger->set_log_level(parse_level(log_config.level));
    g_logger.store(logger, std::memory_order_release);
    return logger;
}

quill::Logger* get_logger() {
    quill::Logger* logger = g_logger.load(std::memory_order_acquire);
    if (logger) {
        return logger;
    }

    init_logging_system();
    auto console_sink = quill::Frontend::create_or_get_sink<quill::ConsoleSink>("prism_console");
    logger = quill::Frontend::create_or_get_logger("prism_default", std::move(console_sink));

    quill::Logger* expected = nullptr;
    if (!g_logger.compare_exchange_strong(expected, logger, std::memory_order_acq_rel)) {
        return expected;
    }
    return logger;
}

void shutdown_logging() {
    if (quill::Logger* logger = g_logger.load(std::memory_order_acquire)) {
        logger->flush_log();
    }
    quill::Backend::stop();
}

std::string generate_session_id() {
    // Base UUID once per thread, counter appended per session
    static thread_local std::string base_uuid = generate_base_uuid();
    static thread_local uint64_t counter = 0;

    return fmt::format("{}#{}", base_uuid, counter++);
}

bool is_valid_session_id(std::string_view id) {
    // Format: {uuid}#{counter}, e.g. 550e8400-e29b-41d4-a716-446655440000#42
    size_t hash_pos = id.rfind('#');
    if (hash_pos == std::string_view::npos) {
        return false;
    }

    std::string_view uuid_part = id.substr(0, hash_pos);
    std::string_view counter_part = id.substr(hash_pos + 1);

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

    char variant = uuid_part[19];
    if (variant != '8' && variant != '9' && variant != 'a' && variant != 'b' &&
        variant != 'A' && variant != 'B') {
        return false;
    }

    for (size_t i = 0; i < uuid_part.size(); ++i) {
        if (i == 8 || i == 13 || i == 18 || i == 23) {
            continue;
        }
        if (!is_hex(uuid_part[i])) {
            return false;
        }
    }

    if (counter_part.empty()) {
        return false;
    }
    return std::all_of(counter_part.begin(), counter_part.end(),
                       [](char c) { return c >= '0' && c <= '9'; });
}

}  // namespace prism::logging
