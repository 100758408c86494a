#pragma once

#include <atomic>
#include <condition_variable>
#include <cstddef>
#include <cstdint>
#include <deque>
#include <fstream>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <thread>

namespace alerter::sinks
{

  // What AsyncJsonWriter discards when a line arrives at a full queue.
  enum class DropPolicy
  {
    // Evict the queued line that has waited longest, keep the new one.
    DropOldest,
    // Discard the new line, keep the queue as is.
    DropNewest
  };

  /**
   * Look up a drop policy by its config spelling.
   * @param text "drop_oldest" or "drop_newest"; matching is case sensitive.
   * @return The policy, or std::nullopt for any other text.
   */
  [[nodiscard]] std::optional<DropPolicy> parse_drop_policy(std::string_view text);
  [[nodiscard]] std::string_view to_string(DropPolicy policy);

  /** Configuration for AsyncJsonWriter. */
  struct AsyncJsonWriterOptions
  {
    std::size_t queue_size = 10000;
    DropPolicy drop_policy = DropPolicy::DropOldest;
    std::string output_path = "logs/alerter.log.json";
  };

  /**
   * Background writer for rendered JSON lines with a bounded queue.
   *
   * Shared by every JsonSink derived from the same root. Lines dropped on
   * overflow are counted and reported as a "dropped_logs" entry after the
   * batch they were dropped from. Falls back to std::cerr when the output
   * file cannot be opened.
   */
  class AsyncJsonWriter
  {
  public:
    /**
     * Open the output and start the background writer thread.
     * @param options Writer configuration options.
     */
    explicit AsyncJsonWriter(AsyncJsonWriterOptions options);
    /**
     * Drain the queue, flush and stop the background writer thread.
     */
    ~AsyncJsonWriter();

    AsyncJsonWriter(const AsyncJsonWriter &) = delete;
    AsyncJsonWriter &operator=(const AsyncJsonWriter &) = delete;
    AsyncJsonWriter(AsyncJsonWriter &&) = delete;
    AsyncJsonWriter &operator=(AsyncJsonWriter &&) = delete;

    /**
     * Enqueue one rendered line (without trailing newline).
     * @param line JSON object text.
     * @return void.
     */
    void write(std::string line);

  private:
    void run();
    void write_batch(std::deque<std::string> &batch);
    void write_dropped_summary(std::uint64_t dropped);
    void ensure_output_path();

    AsyncJsonWriterOptions options_;

    std::mutex mutex_;
    std::condition_variable cv_;
    std::deque<std::string> queue_;
    bool stop_ = false;
    std::atomic<std::uint64_t> dropped_count_{0};

    std::ofstream file_;
    std::ostream *out_;
    std::thread worker_;
  };

  // Milliseconds since the Unix epoch.
  [[nodiscard]] std::uint64_t now_ms();

} // namespace alerter::sinks
