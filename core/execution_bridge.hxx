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


#pragma once

#include "async_control.hxx"
#include "pending_operation.hxx"

#include "core/logger/logger.hxx"

#include <cosmos/async_result.hxx>
#include <cosmos/error.hxx>
#include <cosmos/error_codes.hxx>

#include <asio/executor_work_guard.hpp>
#include <asio/io_context.hpp>
#include <asio/post.hpp>
#include <asio/thread_pool.hpp>
#include <tl/expected.hpp>

#include <atomic>
#include <chrono>
#include <cstddef>
#include <functional>
#include <future>
#include <memory>
#include <optional>
#include <string>
#include <thread>
#include <utility>
#include <variant>
#include <vector>

namespace cosmos::core
{
template<typename T>
using operation_result = tl::expected<T, error>;

template<typename T>
using completion_handler = std::function<void(operation_result<T>)>;

/**
 * Starts the work and arranges for the handler to be invoked exactly once.
 *
 * The returned pending operation (may be null) is used for best effort cancellation.
 */
template<typename T>
using operation = std::function<std::shared_ptr<pending_operation>(completion_handler<T>)>;

struct execution_bridge_config {
  static constexpr std::size_t default_async_workers{ 4 };

  std::size_t io_threads{ 2 };
  std::size_t async_workers{ default_async_workers };

  /**
   * Reads COSMOS_CXX_BRIDGE_IO_THREADS and COSMOS_CXX_BRIDGE_ASYNC_WORKERS. Missing or invalid
   * values fall back to max(2, hardware concurrency) and 4.
   */
  static auto from_environment() -> execution_bridge_config;
};

namespace detail
{
template<typename T>
struct async_traits {
  using public_type = T;
  using value_type = std::pair<error, std::optional<T>>;

  static auto success(T value) -> value_type
  {
    return { error{}, std::move(value) };
  }

  static auto failure(error err) -> value_type
  {
    return { std::move(err), std::nullopt };
  }
};

template<>
struct async_traits<std::monostate> {
  using public_type = void;
  using value_type = error;

  static auto success(std::monostate /* value */) -> value_type
  {
    return {};
  }

  static auto failure(error err) -> value_type
  {
    return err;
  }
};
} // namespace detail

/**
 * Process-wide runtime that runs transport operations.
 *
 * Owns the io_context shared by all transports and its I/O threads, plus a bounded pool of
 * workers for the asynchronous facade. Constructed lazily on first use, destroyed at exit.
 */
class execution_bridge
{
public:
  static auto instance() -> execution_bridge&;

  /**
   * @return how many times the bridge has been constructed in this process
   */
  static auto construction_count() -> std::size_t;

  execution_bridge(const execution_bridge&) = delete;
  execution_bridge(execution_bridge&&) = delete;
  auto operator=(const execution_bridge&) -> execution_bridge& = delete;
  auto operator=(execution_bridge&&) -> execution_bridge& = delete;
  ~execution_bridge();

  auto io_context() -> asio::io_context&
  {
    return io_;
  }

  [[nodiscard]] auto config() const -> const execution_bridge_config&
  {
    return config_;
  }

  [[nodiscard]] auto running_in_runtime_thread() -> bool;

  /**
   * Runs the operation on the runtime and blocks the calling thread until it completes.
   *
   * Fails with errc::client::blocking_on_runtime_thread when called from an I/O thread, where
   * waiting would never end.
   */
  template<typename T>
  auto run_blocking(operation<T> op) -> operation_result<T>
  {
    if (running_in_runtime_thread()) {
      return tl::unexpected(error{
        errc::client::blocking_on_runtime_thread,
        "blocking operation invoked from a thread of the shared runtime, use the *_async variant",
      });
    }
    auto barrier = std::make_shared<std::promise<operation_result<T>>>();
    auto future = barrier->get_future();
    asio::post(io_, [op = std::move(op), barrier]() mutable {
      op([barrier](operation_result<T> result) {
        barrier->set_value(std::move(result));
      });
    });
    return future.get();
  }

  /**
   * Queues the operation for one of the async workers and returns immediately.
   *
   * The worker starts the operation on the runtime and stays with it until it completes or is
   * canceled, so at most async_workers operations are in flight through this path.
   */
  template<typename T>
  auto run_async(operation<T> op) -> async_result<typename detail::async_traits<T>::public_type>
  {
    using traits = detail::async_traits<T>;

    auto barrier = std::make_shared<std::promise<typename traits::value_type>>();
    auto control = std::make_shared<async_control>();
    control->on_cancel([barrier]() {
      CS_LOG_DEBUG("asynchronous operation canceled by the observer");
      barrier->set_value(
        traits::failure(error{ errc::client::request_canceled, "operation canceled" }));
    });
    async_result<typename traits::public_type> result{ control, barrier->get_future() };

    asio::post(workers_, [this, op = std::move(op), barrier, control]() mutable {
      if (!control->try_start()) {
        CS_LOG_DEBUG("skipping asynchronous operation canceled before start");
        return;
      }
      asio::post(io_, [op = std::move(op), barrier, control]() mutable {
        control->attach(op([barrier, control](operation_result<T> outcome) {
          if (!control->try_complete()) {
            CS_LOG_DEBUG("ignoring late completion of canceled operation, success={}",
                         outcome.has_value());
            return;
          }
          if (outcome) {
            barrier->set_value(traits::success(std::move(outcome.value())));
          } else {
            barrier->set_value(traits::failure(std::move(outcome.error())));
          }
        }));
      });
      wait_for_completion(*control);
    });
    return result;
  }

  /**
   * @return already resolved result, for operations that failed before any work was queued
   */
  template<typename T>
  static auto failed(error err) -> async_result<typename detail::async_traits<T>::public_type>
  {
    using traits = detail::async_traits<T>;

    auto control = std::make_shared<async_control>();
    control->try_start();
    control->try_complete();
    std::promise<typename traits::value_type> barrier;
    barrier.set_value(traits::failure(std::move(err)));
    return { std::move(control), barrier.get_future() };
  }

private:
  explicit execution_bridge(execution_bridge_config config);

  void wait_for_completion(async_control& control);

  execution_bridge_config config_;
  std::atomic_bool stopping_{ false };
  asio::io_context io_{};
  asio::executor_work_guard<asio::io_context::executor_type> work_guard_;
  std::vector<std::thread> io_threads_{};
  asio::thread_pool workers_;
};
} // namespace cosmos::core
