// logging.cpp - Async file logger with a bounded MPMC ring
// Producers never block: a full ring counts a drop and returns.

#include "common/logging.h"
#include "common/time_utils.h"
#include "common/macros.h"
#include <algorithm>
#include <atomic>
#include <cerrno>
#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <cstdint>
#include <cstdio>
#include <cstring>
#include <filesystem>
#include <functional>
#include <memory>
#include <mutex>
#include <strings.h>
#include <system_error>
#include <thread>
#include <vector>

namespace Trace::Common {

// ---------- Vyukov MPMC bounded queue ----------
class LogQueue {
public:
  struct LogRecord {
    uint64_t wall_nanos{0};
    uint32_t thread_id{0};
    uint16_t level{0};
    uint16_t len{0};
    char msg[Logger::MAX_MSG_SIZE]{};
  };

  explicit LogQueue(std::size_t capacity)
  : size_(roundUpPow2(capacity)),
    mask_(size_ - 1),
    cells_(size_) {
    for (std::size_t i = 0; i < size_; ++i) {
      cells_[i].seq.store(i, std::memory_order_relaxed);
    }
  }

  LogQueue(const LogQueue&) = delete;
  LogQueue& operator=(const LogQueue&) = delete;

  bool enqueue(const LogRecord& rec) noexcept {
    std::size_t pos = tail_.load(std::memory_order_relaxed);
    for (;;) {
      Cell& c = cells_[pos & mask_];
      std::size_t seq = c.seq.load(std::memory_order_acquire);
      intptr_t diff = static_cast<intptr_t>(seq) - static_cast<intptr_t>(pos);
      if (diff == 0) {
        if (tail_.compare_exchange_weak(pos, pos + 1, std::memory_order_relaxed)) {
          c.data = rec;
          c.seq.store(pos + 1, std::memory_order_release);
          return true;
        }
      } else if (diff < 0) {
        return false;
      } else {
        pos = tail_.load(std::memory_order_relaxed);
      }
    }
  }

  bool dequeue(LogRecord& out) noexcept {
    std::size_t pos = head_.load(std::memory_order_relaxed);
    for (;;) {
      Cell& c = cells_[pos & mask_];
      std::size_t seq = c.seq.load(std::memory_order_acquire);
      intptr_t diff = static_cast<intptr_t>(seq) - static_cast<intptr_t>(pos + 1);
      if (diff == 0) {
        if (head_.compare_exchange_weak(pos, pos + 1, std::memory_order_relaxed)) {
          out = c.data;
          c.seq.store(pos + size_, std::memory_order_release);
          return true;
        }
      } else if (diff < 0) {
        return false;
      } else {
        pos = head_.load(std::memory_order_relaxed);
      }
    }
  }

  bool empty() const noexcept {
    return head_.load(std::memory_order_acquire) ==
           tail_.load(std::memory_order_acquire);
  }

private:
  struct Cell {
    CACHE_ALIGNED std::atomic<std::size_t> seq{0};
    LogRecord data{};
  };

  static std::size_t roundUpPow2(std::size_t n) noexcept {
    std::size_t p = 2;
    while (p < n) p <<= 1;
    return p;
  }

  CACHE_ALIGNED std::atomic<std::size_t> head_{0};
  CACHE_ALIGNED std::atomic<std::size_t> tail_{0};
  std::size_t size_;
  std::size_t mask_;
  std::vector<Cell> cells_;
};

// ---------- Writer ----------
class AsyncLoggerImpl {
public:
  AsyncLoggerImpl(const AsyncLoggerImpl&) = delete;
  AsyncLoggerImpl& operator=(const AsyncLoggerImpl&) = delete;

  AsyncLoggerImpl(const char* path, std::size_t capacity)
  : file_(nullptr),
    queue_(capacity),
    writer_thread_(),
    mutex_(),
    cv_(),
    running_(true) {
    std::filesystem::path p(path);
    if (p.has_parent_path()) {
      std::error_code ec;
      std::filesystem::create_directories(p.parent_path(), ec);
      // fopen reports the failure below
    }

    file_ = std::fopen(path, "a");
    if (!file_) {
      std::fprintf(stderr, "Warning: cannot open log file %s: %s\n", path, std::strerror(errno));
    }

    writer_thread_ = std::thread([this] { writerLoop(); });
  }

  ~AsyncLoggerImpl() {
    running_.store(false, std::memory_order_release);
    cv_.notify_all();
    if (writer_thread_.joinable()) {
      writer_thread_.join();
    }
    if (file_) {
      std::fflush(file_);
      std::fclose(file_);
    }
  }

  bool isOpen() const noexcept { return file_ != nullptr; }

  void log(uint16_t level, const char* msg, std::size_t len) noexcept {
    LogQueue::LogRecord rec{};
    rec.wall_nanos = getWallClockNanos();
    rec.thread_id = static_cast<uint32_t>(std::hash<std::thread::id>{}(std::this_thread::get_id()));
    rec.level = level;
    rec.len = static_cast<uint16_t>(std::min(len, sizeof(rec.msg) - 1));
    std::memcpy(rec.msg, msg, rec.len);
    rec.msg[rec.len] = '\0';

    if (!queue_.enqueue(rec)) {
      drops_.fetch_add(1, std::memory_order_relaxed);
      return;
    }
    cv_.notify_one();
  }

  uint64_t getDrops() const noexcept { return drops_.load(std::memory_order_relaxed); }
  uint64_t getWritten() const noexcept { return written_.load(std::memory_order_relaxed); }
  uint64_t getBytes() const noexcept { return bytes_.load(std::memory_order_relaxed); }

private:
  void writerLoop() noexcept {
    LogQueue::LogRecord rec;
    std::unique_lock<std::mutex> lock(mutex_);

    while (running_.load(std::memory_order_acquire) || !queue_.empty()) {
      cv_.wait_for(lock, std::chrono::milliseconds(10), [this] {
        return !running_.load(std::memory_order_acquire) || !queue_.empty();
      });
      lock.unlock();

      bool wrote = false;
      while (queue_.dequeue(rec)) {
        if (file_) {
          writeRecord(rec);
          wrote = true;
        }
      }
      if (wrote) {
        std::fflush(file_);
      }

      lock.lock();
    }
  }

  void writeRecord(const LogQueue::LogRecord& rec) noexcept {
    auto seconds = static_cast<unsigned long long>(rec.wall_nanos / 1'000'000'000ULL);
    auto nanos = static_cast<unsigned long long>(rec.wall_nanos % 1'000'000'000ULL);
    int n = std::fprintf(file_, "[%llu.%09llu][%s][T%u] %s\n",
                         seconds, nanos, levelToString(rec.level), rec.thread_id, rec.msg);
    if (n > 0) {
      written_.fetch_add(1, std::memory_order_relaxed);
      bytes_.fetch_add(static_cast<uint64_t>(n), std::memory_order_relaxed);
    }
  }

  static const char* levelToString(uint16_t level) noexcept {
    switch (level) {
      case Logger::DEBUG: return "DEBUG";
      case Logger::INFO:  return "INFO ";
      case Logger::WARN:  return "WARN ";
      case Logger::ERROR: return "ERROR";
      case Logger::FATAL: return "FATAL";
      default: return "UNKN ";
    }
  }

  FILE* file_;
  LogQueue queue_;
  std::thread writer_thread_;
  std::mutex mutex_;
  std::condition_variable cv_;
  std::atomic<bool> running_;
  CACHE_ALIGNED std::atomic<uint64_t> drops_{0};
  CACHE_ALIGNED std::atomic<uint64_t> written_{0};
  CACHE_ALIGNED std::atomic<uint64_t> bytes_{0};
};

namespace {

constexpr std::size_t DEFAULT_QUEUE_CAPACITY = 4096;

std::unique_ptr<AsyncLoggerImpl> g_logger_impl;
std::unique_ptr<Logger> g_logger_front;
std::mutex g_logger_mutex;

} // namespace

Logger* g_logger = nullptr;

Logger::Logger(const char* filename)
    : filename_() {
    if (filename) {
        std::strncpy(filename_, filename, sizeof(filename_) - 1);
    }
    filename_[sizeof(filename_) - 1] = '\0';
}

void Logger::emit(Level level, const char* msg, size_t len) noexcept {
    if (g_logger_impl) {
        g_logger_impl->log(static_cast<uint16_t>(level), msg, len);
    }
}

Logger::Stats Logger::getStats() const noexcept {
    Stats stats;
    std::lock_guard<std::mutex> lock(g_logger_mutex);
    if (g_logger_impl) {
        stats.messages_written = g_logger_impl->getWritten();
        stats.messages_dropped = g_logger_impl->getDrops();
        stats.bytes_written = g_logger_impl->getBytes();
    }
    return stats;
}

bool initLogging(const char* log_file) noexcept {
    if (!log_file || !log_file[0]) {
        return false;
    }

    std::lock_guard<std::mutex> lock(g_logger_mutex);

    // Re-init replaces the previous instance
    g_logger = nullptr;
    g_logger_front.reset();
    g_logger_impl.reset();

    try {
        g_logger_impl = std::make_unique<AsyncLoggerImpl>(log_file, DEFAULT_QUEUE_CAPACITY);
        g_logger_front = std::make_unique<Logger>(log_file);
    } catch (const std::exception& e) {
        std::fprintf(stderr, "Warning: logger init failed: %s\n", e.what());
        g_logger_front.reset();
        g_logger_impl.reset();
        return false;
    }

    g_logger = g_logger_front.get();
    return g_logger_impl->isOpen();
}

void shutdownLogging() noexcept {
    std::lock_guard<std::mutex> lock(g_logger_mutex);
    g_logger = nullptr;
    g_logger_front.reset();
    g_logger_impl.reset();
}

bool parseLogLevel(const char* name, Logger::Level* level) noexcept {
    if (!name || !level) {
        return false;
    }
    if (strcasecmp(name, "DEBUG") == 0) {
        *level = Logger::DEBUG;
    } else if (strcasecmp(name, "INFO") == 0) {
        *level = Logger::INFO;
    } else if (strcasecmp(name, "WARN") == 0 || strcasecmp(name, "WARNING") == 0) {
        *level = Logger::WARN;
    } else if (strcasecmp(name, "ERROR") == 0) {
        *level = Logger::ERROR;
    } else {
        return false;
    }
    return true;
}

} // namespace Trace::Common
