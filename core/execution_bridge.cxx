/* -*- Mode: C++; tab-width: 4; c-basic-offset: 4; indent-tabs-mode: nil -*- */
/*
 *   Copyright 2024-Present The cosmos-cxx-bridge Authors
 *
 *   Licensed under the Apache License, Version 2.0 (the "License");
 *   you may not use this file except in compliance with the License.
 *   You may obtain a copy of the License at
 *
 *       http://www.apache.org/licenses/LICENSE-2.0
 *
 *   Unless required by applicable law or agreed to in writing, software
 *   distributed under the License is distributed on an "AS IS" BASIS,
 *   WITHOUT WARRANTIES OR CONDITIONS OF ANY KIND, either express or implied.
 *   See the License for the specific language governing permissions and
 *   limitations under the License.
 */


#include "execution_bridge.hxx"

#include "core/logger/logger.hxx"

#include <algorithm>
#include <charconv>
#include <cstdlib>
#include <string_view>
#include <system_error>

namespace cosmos::core
{
namespace
{
std::atomic_size_t construction_counter{ 0 };

constexpr std::chrono::milliseconds shutdown_poll_interval{ 100 };

auto
read_positive_number(const char* name, std::size_t fallback) -> std::size_t
{
  const char* raw = std::getenv(name);
  if (raw == nullptr) {
    return fallback;
  }
  const std::string_view text{ raw };
  std::size_t value{ 0 };
  if (auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), value);
      ec != std::errc{} || ptr != text.data() + text.size() || value == 0) {
    CS_LOG_WARNING(R"(ignoring invalid value "{}" of {}, using {})", text, name, fallback);
    return fallback;
  }
  return value;
}
} // namespace

auto
execution_bridge_config::from_environment() -> execution_bridge_config
{
  execution_bridge_config config{};
  config.io_threads = read_positive_number(
    "COSMOS_CXX_BRIDGE_IO_THREADS",
    std::max<std::size_t>(2, std::thread::hardware_concurrency()));
  config.async_workers =
    read_positive_number("COSMOS_CXX_BRIDGE_ASYNC_WORKERS", default_async_workers);
  return config;
}

auto
execution_bridge::instance() -> execution_bridge&
{
  static execution_bridge bridge{ execution_bridge_config::from_environment() };
  return bridge;
}

auto
execution_bridge::construction_count() -> std::size_t
{
  return construction_counter.load();
}

execution_bridge::execution_bridge(execution_bridge_config config)
  : config_{ config }
  , work_guard_{ asio::make_work_guard(io_) }
  , workers_{ config.async_workers }
{
  ++construction_counter;
  io_threads_.reserve(config_.io_threads);
  for (std::size_t i = 0; i < config_.io_threads; ++i) {
    io_threads_.emplace_back([&io = io_] {
      io.run();
    });
  }
  CS_LOG_DEBUG("execution bridge started, io_threads={}, async_workers={}",
               config_.io_threads,
               config_.async_workers);
}

execution_bridge::~execution_bridge()
{
  stopping_ = true;
  workers_.join();
  work_guard_.reset();
  io_.stop();
  for (auto& thread : io_threads_) {
    if (thread.joinable()) {
      thread.join();
    }
  }
}

auto
execution_bridge::running_in_runtime_thread() -> bool
{
  return io_.get_executor().running_in_this_thread();
}

void
execution_bridge::wait_for_completion(async_control& control)
{
  while (!control.wait_until_done(shutdown_poll_interval)) {
    if (stopping_) {
      // the runtime is going away, the callback may never come
      control.cancel();
      return;
    }
  }
}
} // namespace cosmos::core
