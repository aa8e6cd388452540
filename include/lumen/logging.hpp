#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <mutex>
#include <ostream>
#include <string>
#include <vector>

namespace lumen {

enum class log_level {
    debug,
    info,
    warn,
    error
};

struct log_record {
    std::uint64_t sequence = 0;
    std::chrono::steady_clock::time_point ts{};
    log_level level = log_level::info;
    std::string category;
    std::string message;
};

class log_sink {
public:
    virtual ~log_sink() = default;
    virtual void write(const log_record& rec) = 0;
};

class memory_log_sink final : public log_sink {
public:
    explicit memory_log_sink(std::size_t capacity_records);

    void write(const log_record& rec) override;
    std::vector<log_record> snapshot() const;
    std::size_t size() const;
    std::size_t capacity() const;
    void clear();

private:
    std::size_t capacity_;
    std::vector<log_record> records_;
    std::uint64_t sequence_ = 0;
    mutable std::mutex mutex_;
};

class stream_log_sink final : public log_sink {
public:
    explicit stream_log_sink(std::ostream& out);

    void write(const log_record& rec) override;

private:
    std::ostream& out_;
    std::uint64_t sequence_ = 0;
    std::mutex mutex_;
};

void log_to(log_sink* sink, log_level level, const std::string& category, const std::string& message);

const char* log_level_name(log_level level) noexcept;

}  // namespace lumen
