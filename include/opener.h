#pragma once

#include "engine_context.h"
#include "scorer.h"
#include <atomic>
#include <expected>
#include <functional>
#include <memory>
#include <mutex>
#include <stop_token>
#include <thread>
#include <vector>

namespace wick {

enum class OpenError { Capacity, AlreadyReserved, NoTouch, ExchangeError, Cancelled };

// Entry geometry for one candidate (prices not yet tick-rounded)
struct EntryPlan {
    double tail_frac{};
    double tp_pct{};
    double entry{};
    double stop{};
    double target{};
    double touch_band{};
};

// Retrace `tail_frac` of the way from the wick extreme back to the body;
// better score margins retrace deeper and aim further
EntryPlan plan_entry(const CandidateSignal &, double score_margin, double tick_size);

// Price tolerance around the entry for the live touch check
double touch_band(double entry, double tick_size, double tail, double atr);

bool has_capacity(const EngineContext &);

// Synchronous open: settle wait, tick rounding, touch check, then record.
// The caller keeps the reservation until this returns.
std::expected<Position, OpenError> open_position(EngineContext &, const CandidateSignal &,
                                                 double side_threshold, double tick_size,
                                                 std::stop_token);

// Background units of work; each owns its resources for its whole lifetime
class TaskGroup {
public:
    TaskGroup() = default;
    TaskGroup(const TaskGroup &) = delete;
    TaskGroup &operator=(const TaskGroup &) = delete;
    ~TaskGroup();

    void spawn(std::move_only_function<void(std::stop_token)>);

    // Join tasks that have finished
    void reap();

    std::size_t running() const;

    // Request stop on every task and wait for all of them
    void stop_all();

    // Wait for every task without requesting stop
    void wait_all();

private:
    struct Task {
        std::jthread thread;
        std::shared_ptr<std::atomic<bool>> done;
    };

    mutable std::mutex mutex_;
    std::vector<Task> tasks_;
};

// Reserve, then open on a background task that owns the reservation; the
// reservation is released when the task ends, whatever its outcome
std::expected<void, OpenError> dispatch_open(EngineContext &, TaskGroup &,
                                             const CandidateSignal &, double side_threshold,
                                             double tick_size);

std::string_view to_string(OpenError);

} // namespace wick
