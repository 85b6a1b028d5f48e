#include "planforge/util/log.hpp"

#include <unistd.h>

#include <vector>

namespace planforge::log {

Logger::~Logger() {
  stop();
  std::scoped_lock lock(output_mu_);
  if (owned_file_) {
    std::fclose(owned_file_);
  }
}

auto Logger::format_line(Level level, std::string_view message)
    -> std::string {
  auto now = std::chrono::floor<std::chrono::milliseconds>(
      std::chrono::system_clock::now());
  auto tid = std::hash<std::thread::id>{}(std::this_thread::get_id()) % 1000000;
  return std::format("[{:%Y-%m-%d %H:%M:%S}] [{}{}{}] [{}] {}\n", now,
                     level_color(level), level_name(level), "\o{33}[0m", tid,
                     message);
}

auto Logger::start() -> void {
  if (running_.exchange(true, std::memory_order_acq_rel)) {
    return;
  }
  queue_ctx_.restart();
  auto channel =
      std::make_shared<LineChannel>(queue_ctx_.get_executor(), kQueueCapacity);
  queue_.store(channel, std::memory_order_release);
  writer_ = std::jthread(
      [this, channel]() mutable { writer_loop(std::move(channel)); });
}

auto Logger::stop() -> void {
  if (!running_.exchange(false, std::memory_order_acq_rel)) {
    return;
  }
  if (auto queue = queue_.exchange(nullptr, std::memory_order_acq_rel)) {
    queue->close();
  }
  if (writer_.joinable()) {
    writer_.join();
  }
}

auto Logger::submit(std::string line) -> void {
  auto queue = queue_.load(std::memory_order_acquire);
  if (queue && queue->try_send(boost::system::error_code{}, std::move(line))) {
    return;
  }
  if (queue) {
    // Queue full: dropping beats blocking the caller's event loop.
    dropped_.fetch_add(1, std::memory_order_relaxed);
    return;
  }
  write_lines(std::span<const std::string>(&line, 1));
}

auto Logger::write_lines(std::span<const std::string> lines) -> void {
  std::scoped_lock lock(output_mu_);
  for (const auto &line : lines) {
    std::fwrite(line.data(), 1, line.size(), output_);
  }
  std::fflush(output_);
}

auto Logger::writer_loop(std::shared_ptr<LineChannel> queue) -> void {
  std::vector<std::string> batch;
  batch.reserve(kBatchSize);

  for (;;) {
    boost::system::error_code recv_ec;
    queue->async_receive(
        [&](const boost::system::error_code &ec, std::string line) {
          recv_ec = ec;
          if (!ec) {
            batch.push_back(std::move(line));
          }
        });
    queue_ctx_.restart();
    (void)queue_ctx_.run_one();

    while (batch.size() < kBatchSize &&
           queue->try_receive(
               [&](const boost::system::error_code &ec, std::string line) {
                 if (!ec) {
                   batch.push_back(std::move(line));
                 }
               })) {
    }

    if (!batch.empty()) {
      write_lines(batch);
      batch.clear();
    }
    if (recv_ec) {
      break;
    }
  }
}

auto Logger::replace_output(FILE *out, FILE *owned) -> void {
  std::scoped_lock lock(output_mu_);
  std::fflush(output_);
  if (owned_file_ && owned_file_ != owned) {
    std::fclose(owned_file_);
  }
  owned_file_ = owned;
  output_ = out;
}

auto Logger::set_output_stdout() -> void { replace_output(stdout, nullptr); }

auto Logger::set_output_stderr() -> void { replace_output(stderr, nullptr); }

auto Logger::set_output_file(std::string_view path) -> bool {
  if (path.empty()) {
    set_output_stdout();
    return true;
  }
  FILE *f = std::fopen(std::string(path).c_str(), "a");
  if (!f) {
    return false;
  }
  std::setvbuf(f, nullptr, _IOLBF, 0);
  replace_output(f, f);
  return true;
}

auto logger() -> Logger & {
  static Logger instance;
  return instance;
}

} // namespace planforge::log
