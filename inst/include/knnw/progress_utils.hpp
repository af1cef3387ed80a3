// progress_utils.hpp
#ifndef KNNW_PROGRESS_UTILS_HPP_
#define KNNW_PROGRESS_UTILS_HPP_

#include <cstddef>
#include <cstdio>
#include <chrono>

using std::size_t;

namespace knnw {

/// Receives fully formatted log text. Must not throw.
using progress_sink_t = void (*)(const char* text);

/// Installs a new sink for all progress output; nullptr restores the stderr sink.
void set_progress_sink(progress_sink_t sink);
void progress_write(const char* text);

void elapsed_time(std::chrono::time_point<std::chrono::steady_clock> start_time,
                  const char* message,
                  bool with_brackets = false);
void elapsed_time(std::chrono::time_point<std::chrono::steady_clock> start_time,
                  const char* message,
                  bool with_brackets,
                  bool with_timestamp);

void progress_log(const char* fmt, ...);

struct progress_tracker_t {
    std::chrono::steady_clock::time_point start_time;
    std::chrono::steady_clock::time_point last_update;
    size_t total_steps;
    size_t current_step;
    size_t update_frequency;  // How often to show progress (in steps)
    const char* task_name;

    progress_tracker_t(size_t total, const char* name, size_t freq = 10)
        : start_time(std::chrono::steady_clock::now()),
          last_update(start_time),
          total_steps(total),
          current_step(0),
          update_frequency(freq == 0 ? 1 : freq),
          task_name(name) {}

    void update(size_t step, bool force = false) {
        current_step = step;
        auto now = std::chrono::steady_clock::now();

        if (step == 0 || total_steps == 0) return;

        if (force || step % update_frequency == 0) {
            double progress = static_cast<double>(step) / total_steps * 100;
            auto elapsed = std::chrono::duration_cast<std::chrono::seconds>(now - start_time).count();
            auto est_total = elapsed * static_cast<long long>(total_steps) / static_cast<long long>(step);
            auto remaining = est_total - elapsed;

            char buf[256];
            std::snprintf(buf, sizeof(buf), "\r%s: %.1f%% complete. Est. remaining: %ds",
                          task_name, progress, static_cast<int>(remaining));
            progress_write(buf);
            last_update = now;
        }
    }

    void finish() {
        auto total_time = std::chrono::steady_clock::now() - start_time;
        auto seconds = std::chrono::duration_cast<std::chrono::seconds>(total_time).count();
        char buf[256];
        std::snprintf(buf, sizeof(buf), "\n%s completed in %ds\n", task_name, static_cast<int>(seconds));
        progress_write(buf);
    }
};

} // namespace knnw

#endif // KNNW_PROGRESS_UTILS_HPP_
