#ifndef LANE_SYSTEM_LANE_SYSTEM_HPP
#define LANE_SYSTEM_LANE_SYSTEM_HPP

#include <atomic>
#include <cstddef>
#include <functional>
#include <memory>
#include <new>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

namespace lane_system {

// Error types that can escape a lane step
enum class ErrorType {
    None = 0,
    OutOfMemory,   // std::bad_alloc caught
    Exception,     // std::exception caught
    Unhandled      // Non-std::exception type caught
};

// Fixed pool of OS threads ("lanes"). Every lane repeatedly runs the same
// step function with its own lane id. A step runs to completion and reports
// whether it found work; lanes never block inside a step and only back off
// (spin, then yield) when a step reports no work.
class LaneSystem {
public:
    // Returns true if the step did useful work
    using StepFn = std::function<bool(std::size_t lane_id)>;

    static constexpr std::size_t IDLE_SPINS_BEFORE_YIELD = 64;

private:
    struct alignas(64) LaneData {
        std::thread thread;
        std::atomic<std::size_t> steps_executed{0};
        std::atomic<std::size_t> idle_steps{0};
    };

    std::vector<std::unique_ptr<LaneData>> lanes_;
    std::atomic<bool> is_running_{false};
    std::atomic<bool> stop_{false};
    StepFn step_;
    std::string error_message_;
    std::atomic<bool> error_message_set_{false};

    std::atomic<ErrorType> error_type_{ErrorType::None};

    void record_error(ErrorType type, const char* message) {
        ErrorType expected = ErrorType::None;
        if (error_type_.compare_exchange_strong(expected, type, std::memory_order_acq_rel)) {
            error_message_ = message;
            error_message_set_.store(true, std::memory_order_release);
        }
        stop_.store(true, std::memory_order_release);
    }

    void lane_loop(std::size_t lane_id, LaneData* data) {
        std::size_t idle_streak = 0;

        while (!stop_.load(std::memory_order_acquire)) {
            bool did_work = false;

            // Steps must not throw; anything that escapes stops the pool
            try {
                did_work = step_(lane_id);
            } catch (const std::bad_alloc&) {
                record_error(ErrorType::OutOfMemory, "Out of memory");
                break;
            } catch (const std::exception& e) {
                record_error(ErrorType::Exception, e.what());
                break;
            } catch (...) {
                record_error(ErrorType::Unhandled, "Unhandled exception type");
                break;
            }

            if (did_work) {
                data->steps_executed.fetch_add(1, std::memory_order_relaxed);
                idle_streak = 0;
                continue;
            }

            data->idle_steps.fetch_add(1, std::memory_order_relaxed);
            if (++idle_streak > IDLE_SPINS_BEFORE_YIELD) {
                std::this_thread::yield();
            }
        }
    }

public:
    explicit LaneSystem(std::size_t num_lanes) {
        if (num_lanes == 0) {
            throw std::invalid_argument("LaneSystem requires at least one lane");
        }
        lanes_.reserve(num_lanes);
        for (std::size_t i = 0; i < num_lanes; ++i) {
            lanes_.emplace_back(std::make_unique<LaneData>());
        }
    }

    ~LaneSystem() {
        shutdown();
    }

    LaneSystem(const LaneSystem&) = delete;
    LaneSystem& operator=(const LaneSystem&) = delete;

    void start(StepFn step) {
        if (is_running_.load()) {
            if (!has_error()) {
                throw std::runtime_error("LaneSystem is already running");
            }
            // Lanes already stopped on an error; reap them first
            shutdown();
        }
        if (!step) {
            throw std::invalid_argument("LaneSystem requires a step function");
        }

        step_ = std::move(step);
        stop_.store(false);
        error_type_.store(ErrorType::None, std::memory_order_relaxed);
        error_message_set_.store(false, std::memory_order_relaxed);

        for (std::size_t i = 0; i < lanes_.size(); ++i) {
            auto* lane = lanes_[i].get();
            lane->thread = std::thread([this, i, lane] {
                lane_loop(i, lane);
            });
        }

        is_running_.store(true);
    }

    void shutdown() {
        if (!is_running_.load()) return;

        stop_.store(true, std::memory_order_release);
        for (auto& lane : lanes_) {
            if (lane->thread.joinable()) {
                lane->thread.join();
            }
        }

        is_running_.store(false);
    }

    std::size_t get_num_lanes() const {
        return lanes_.size();
    }

    // False once an error has stopped the lanes, even before shutdown()
    bool is_running() const {
        return is_running_.load() && !has_error();
    }

    ErrorType get_error_type() const {
        return error_type_.load(std::memory_order_acquire);
    }

    bool has_error() const {
        return get_error_type() != ErrorType::None;
    }

    const char* get_error_description() const {
        switch (get_error_type()) {
            case ErrorType::None: return "No error";
            case ErrorType::OutOfMemory: return "Out of memory";
            case ErrorType::Exception: return "Exception thrown";
            case ErrorType::Unhandled: return "Unhandled exception type";
        }
        return "Unknown error";
    }

    // Message of the first error (empty if none)
    std::string get_error_message() const {
        if (!error_message_set_.load(std::memory_order_acquire)) {
            return {};
        }
        return error_message_;
    }

    struct LaneStatistics {
        std::size_t total_steps_executed;
        std::size_t total_idle_steps;
    };

    LaneStatistics get_statistics() const {
        LaneStatistics stats{0, 0};
        for (const auto& lane : lanes_) {
            stats.total_steps_executed += lane->steps_executed.load(std::memory_order_relaxed);
            stats.total_idle_steps += lane->idle_steps.load(std::memory_order_relaxed);
        }
        return stats;
    }
};

} // namespace lane_system

#endif // LANE_SYSTEM_LANE_SYSTEM_HPP
