#include "alerter/sinks/async_json_writer.hpp"

#include <array>
#include <chrono>
#include <filesystem>
#include <iostream>
#include <system_error>
#include <utility>

namespace alerter::sinks
{

  namespace
  {

    struct DropPolicyName
    {
      DropPolicy policy;
      std::string_view name;
    };

    constexpr std::array<DropPolicyName, 2> kDropPolicyNames{{
        {DropPolicy::DropOldest, "drop_oldest"},
        {DropPolicy::DropNewest, "drop_newest"},
    }};

  } // namespace

  std::optional<DropPolicy> parse_drop_policy(std::string_view text)
  {
    for (const auto &entry : kDropPolicyNames)
    {
      if (entry.name == text)
      {
        return entry.policy;
      }
    }
    return std::nullopt;
  }

  std::string_view to_string(DropPolicy policy)
  {
    for (const auto &entry : kDropPolicyNames)
    {
      if (entry.policy == policy)
      {
        return entry.name;
      }
    }
    return "unknown";
  }

  std::uint64_t now_ms()
  {
    return static_cast<std::uint64_t>(
        std::chrono::duration_cast<std::chrono::milliseconds>(
            std::chrono::system_clock::now().time_since_epoch())
            .count());
  }

  AsyncJsonWriter::AsyncJsonWriter(AsyncJsonWriterOptions options)
      : options_(std::move(options)), out_(nullptr)
  {
    if (options_.queue_size == 0)
    {
      options_.queue_size = 1;
    }
    ensure_output_path();
    file_.open(options_.output_path, std::ios::out | std::ios::app);
    if (!file_.is_open())
    {
      out_ = &std::cerr;
    }
    else
    {
      out_ = &file_;
    }
    worker_ = std::thread(&AsyncJsonWriter::run, this);
  }

  AsyncJsonWriter::~AsyncJsonWriter()
  {
    {
      std::scoped_lock lock(mutex_);
      stop_ = true;
    }
    cv_.notify_all();
    if (worker_.joinable())
    {
      worker_.join();
    }
    if (file_.is_open())
    {
      file_.flush();
    }
  }

  void AsyncJsonWriter::write(std::string line)
  {
    std::unique_lock<std::mutex> lock(mutex_);
    if (queue_.size() >= options_.queue_size)
    {
      if (options_.drop_policy == DropPolicy::DropOldest)
      {
        queue_.pop_front();
        dropped_count_.fetch_add(1);
      }
      else
      {
        dropped_count_.fetch_add(1);
        return;
      }
    }
    queue_.push_back(std::move(line));
    lock.unlock();
    cv_.notify_one();
  }

  void AsyncJsonWriter::run()
  {
    for (;;)
    {
      std::deque<std::string> batch;
      bool stopping = false;
      {
        std::unique_lock<std::mutex> lock(mutex_);
        cv_.wait(lock, [this]
                 { return stop_ || !queue_.empty(); });
        batch.swap(queue_);
        stopping = stop_;
      }

      write_batch(batch);

      auto dropped = dropped_count_.exchange(0);
      if (dropped > 0)
      {
        write_dropped_summary(dropped);
      }

      out_->flush();

      if (stopping)
      {
        break;
      }
    }
  }

  void AsyncJsonWriter::write_batch(std::deque<std::string> &batch)
  {
    for (auto &line : batch)
    {
      line += '\n';
      (*out_) << line;
    }
  }

  void AsyncJsonWriter::write_dropped_summary(std::uint64_t dropped)
  {
    std::string line;
    line.reserve(128);
    line += "{\"ts_ms\":";
    line += std::to_string(now_ms());
    line += ",\"kind\":\"error\",\"logger\":\"alerter\",\"msg\":\"dropped_logs\",\"error\":null,\"dropped\":";
    line += std::to_string(dropped);
    line += "}\n";
    (*out_) << line;
  }

  void AsyncJsonWriter::ensure_output_path()
  {
    std::filesystem::path path(options_.output_path);
    if (!path.has_parent_path())
    {
      return;
    }
    std::error_code ec;
    std::filesystem::create_directories(path.parent_path(), ec);
  }

} // namespace alerter::sinks
