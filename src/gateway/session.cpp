/*
 * Copyright 2025 Prism Contributors
 *
 * Licensed under the Apache License, Version 2.0 (the "License");
 * you may not use this file except in compliance with the License.
 * You may obtain a copy of the License at
 *
 *     http://www.apache.org/licenses/LICENSE-2.0
 *
 * Unless required by applicable law or agreed to in writing, software
 * distributed under the License is distributed on an "AS IS" BASIS,
 * WITHOUT WARRANTIES OR CONDITIONS OF ANY KIND, either express or implied.
 * See the License for the specific language governing permissions and
 * limitations under the License.
 */

// Prism Session - Implementation

#include "session.hpp"

#include <atomic>
#include <utility>

#include "../core/errors.hpp"
#include "../core/logging.hpp"
#include "migrator.hpp"

namespace prism::gateway {

namespace {

/// Decrements a counter on scope exit
struct InFlightGuard {
    std::atomic<uint32_t>& counter;
    explicit InFlightGuard(std::atomic<uint32_t>& c) : counter(c) {
        counter.fetch_add(1, std::memory_order_acq_rel);
    }
    ~InFlightGuard() { counter.fetch_sub(1, std::memory_order_acq_rel); }
};

int64_t ticks(Clock::time_point t) noexcept {
    return t.time_since_epoch().count();
}

}  // namespace

// BoundConnection

BoundConnection::BoundConnection(protocol::ProtocolAdapter& adapter,
                                 protocol::Connection connection, EndpointLease lease)
    : adapter_(adapter),
      connection_(std::move(connection)),
      lease_(std::move(lease)),
      protocol_(connection_.protocol),
      endpoint_id_(connection_.endpoint_id),
      connection_id_(connection_.id),
      fd_(connection_.fd) {}

BoundConnection::~BoundConnection() {
    close();
}

std::error_code BoundConnection::exchange(std::span<const uint8_t> payload,
                                          std::chrono::milliseconds timeout, Message& reply) {
    InFlightGuard guard(in_flight_);
    std::lock_guard<std::mutex> lock(io_mutex_);

    if (closed_.load(std::memory_order_acquire) || !adapter_.is_connected(connection_)) {
        return core::GatewayErrc::connection_closed;
    }

    std::error_code ec = adapter_.send(connection_, payload);
    if (!ec) {
        ec = adapter_.receive(connection_, timeout, reply);
    }
    open_.store(adapter_.is_connected(connection_), std::memory_order_release);
    return ec;
}

void BoundConnection::close() noexcept {
    if (closed_.exchange(true, std::memory_order_acq_rel)) {
        return;
    }
    open_.store(false, std::memory_order_release);

    std::unique_lock<std::mutex> lock(io_mutex_, std::try_to_lock);
    if (!lock.owns_lock()) {
        // An exchange is blocked on the socket: wake it, then close behind it
        core::shutdown_socket(fd_.load(std::memory_order_acquire));
        lock.lock();
    }
    adapter_.disconnect(connection_);
    lease_.release();
}

bool BoundConnection::is_open() const {
    return !closed_.load(std::memory_order_acquire) && open_.load(std::memory_order_acquire);
}

// Session

Session::Session(std::string id, ProtocolKind protocol)
    : id_(std::move(id)),
      protocol_(protocol),
      created_at_(Clock::now()),
      last_activity_(ticks(created_at_)) {}

Session::~Session() = default;

nlohmann::json Session::application_state() const {
    std::lock_guard<std::mutex> lock(state_mutex_);
    return application_state_;
}

void Session::set_application_state(nlohmann::json state) {
    std::lock_guard<std::mutex> lock(state_mutex_);
    application_state_ = std::move(state);
}

void Session::update_application_state(std::string_view key, nlohmann::json value) {
    std::lock_guard<std::mutex> lock(state_mutex_);
    if (!application_state_.is_object()) {
        application_state_ = nlohmann::json::object();
    }
    application_state_[std::string(key)] = std::move(value);
}

std::shared_ptr<BoundConnection> Session::binding() const {
    std::lock_guard<std::mutex> lock(binding_mutex_);
    return binding_;
}

std::shared_ptr<BoundConnection> Session::swap_binding(std::shared_ptr<BoundConnection> next) {
    std::lock_guard<std::mutex> lock(binding_mutex_);
    if (overlap_ && overlap_ == next) {
        overlap_.reset();
    }
    std::swap(binding_, next);
    return next;
}

void Session::set_overlap(std::shared_ptr<BoundConnection> pending) {
    std::lock_guard<std::mutex> lock(binding_mutex_);
    overlap_ = std::move(pending);
}

size_t Session::bound_connections() const {
    std::lock_guard<std::mutex> lock(binding_mutex_);
    size_t count = 0;
    if (binding_ && binding_->is_open()) {
        count++;
    }
    if (overlap_ && overlap_->is_open()) {
        count++;
    }
    return count;
}

void Session::stage_binding(std::shared_ptr<BoundConnection> staged) {
    std::lock_guard<std::mutex> lock(binding_mutex_);
    staged_ = std::move(staged);
}

std::shared_ptr<BoundConnection> Session::take_staged_binding() {
    std::lock_guard<std::mutex> lock(binding_mutex_);
    return std::exchange(staged_, nullptr);
}

void Session::begin_plan(std::unique_ptr<MigrationPlan> plan) {
    plan_ = std::move(plan);
}

std::unique_ptr<MigrationPlan> Session::end_plan() {
    return std::move(plan_);
}

bool Session::try_begin_migration() noexcept {
    bool expected = false;
    return migrating_.compare_exchange_strong(expected, true, std::memory_order_acq_rel);
}

void Session::end_migration() noexcept {
    migrating_.store(false, std::memory_order_release);
}

void Session::pause_traffic() {
    std::lock_guard<std::mutex> lock(gate_mutex_);
    accepting_ = false;
}

void Session::resume_traffic() {
    {
        std::lock_guard<std::mutex> lock(gate_mutex_);
        accepting_ = true;
    }
    gate_cv_.notify_all();
}

bool Session::accepting() const {
    std::lock_guard<std::mutex> lock(gate_mutex_);
    return accepting_;
}

uint32_t Session::wait_drained(Deadline deadline) {
    std::unique_lock<std::mutex> lock(gate_mutex_);
    gate_cv_.wait_until(lock, deadline, [this] { return in_flight_ == 0; });
    return in_flight_;
}

uint32_t Session::in_flight() const {
    std::lock_guard<std::mutex> lock(gate_mutex_);
    return in_flight_;
}

std::error_code Session::exchange(std::span<const uint8_t> payload,
                                  std::chrono::milliseconds timeout, Message& reply) {
    Deadline deadline = core::deadline_after(timeout);
    {
        std::unique_lock<std::mutex> lock(gate_mutex_);
        if (!gate_cv_.wait_until(lock, deadline, [this] { return accepting_; })) {
            return core::GatewayErrc::session_unavailable;
        }
        in_flight_++;
    }

    std::error_code ec;
    auto bound = binding();
    int remaining = core::remaining_ms(deadline);
    if (!bound) {
        ec = core::GatewayErrc::session_unavailable;
    } else if (remaining <= 0) {
        ec = core::GatewayErrc::receive_timeout;
    } else {
        ec = bound->exchange(payload, std::chrono::milliseconds(remaining), reply);
    }

    {
        std::lock_guard<std::mutex> lock(gate_mutex_);
        in_flight_--;
    }
    gate_cv_.notify_all();

    touch();
    if (!ec) {
        messages_.fetch_add(1, std::memory_order_relaxed);
    }
    return ec;
}

Clock::time_point Session::last_activity() const noexcept {
    return Clock::time_point(Clock::duration(last_activity_.load(std::memory_order_acquire)));
}

void Session::touch() noexcept {
    last_activity_.store(ticks(Clock::now()), std::memory_order_release);
}

uint32_t Session::record_failure() noexcept {
    return consecutive_failures_.fetch_add(1, std::memory_order_acq_rel) + 1;
}

nlohmann::json Session::describe() const {
    auto bound = binding();
    nlohmann::json out = {
        {"id", id_},
        {"state", std::string(to_string(state()))},
        {"protocol", std::string(protocol::to_string(current_protocol()))},
        {"messages", messages()},
        {"consecutive_failures", consecutive_failures()},
        {"migrating", migrating()},
        {"bound_connections", bound_connections()},
    };
    if (bound) {
        out["endpoint_id"] = bound->endpoint_id();
        out["connection_id"] = bound->connection_id();
    }
    return out;
}

// SessionRegistry

std::shared_ptr<Session> SessionRegistry::create(ProtocolKind protocol) {
    std::unique_lock lock(mutex_);
    std::string id;
    do {
        id = logging::generate_session_id();
    } while (sessions_.contains(id));

    auto session = std::make_shared<Session>(id, protocol);
    sessions_.emplace(std::move(id), session);
    return session;
}

std::shared_ptr<Session> SessionRegistry::find(std::string_view id) const {
    std::shared_lock lock(mutex_);
    auto it = sessions_.find(std::string(id));
    return it == sessions_.end() ? nullptr : it->second;
}

std::shared_ptr<Session> SessionRegistry::remove(std::string_view id) {
    std::unique_lock lock(mutex_);
    auto it = sessions_.find(std::string(id));
    if (it == sessions_.end()) {
        return nullptr;
    }
    auto session = std::move(it->second);
    sessions_.erase(it);
    return session;
}

std::vector<std::shared_ptr<Session>> SessionRegistry::list() const {
    std::shared_lock lock(mutex_);
    std::vector<std::shared_ptr<Session>> out;
    out.reserve(sessions_.size());
    for (const auto& [id, session] : sessions_) {
        out.push_back(session);
    }
    return out;
}

size_t SessionRegistry::size() const {
    std::shared_lock lock(mutex_);
    return sessions_.size();
}

}  // namespace prism::gateway
