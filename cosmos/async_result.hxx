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

#include <cosmos/error.hxx>

#include <chrono>
#include <future>
#include <memory>
#include <optional>
#include <utility>

namespace cosmos
{
#ifndef COSMOS_CXX_BRIDGE_DOXYGEN
namespace core
{
class async_control;

namespace impl
{
[[noreturn]] void
throw_error(const error& err);
} // namespace impl
} // namespace core
#endif

/**
 * Cancellation part shared by all @ref async_result instantiations.
 *
 * @since 1.0.0
 * @committed
 */
class async_result_base
{
public:
  /**
   * Requests cancellation of the operation.
   *
   * Best effort only. An operation that is still waiting for a worker is never sent. An operation
   * in flight is asked to stop, but the request may still reach the service and its side effect
   * may still happen. Either way the result resolves with @ref operation_canceled_error.
   *
   * @return true if this call canceled the operation, false if it had already completed or was
   * canceled before
   *
   * @since 1.0.0
   * @committed
   */
  auto cancel() -> bool;

  [[nodiscard]] auto is_canceled() const -> bool;

protected:
  explicit async_result_base(std::shared_ptr<core::async_control> control);

private:
  std::shared_ptr<core::async_control> control_;
};

/**
 * Future of an operation started through one of the *_async methods.
 *
 * @since 1.0.0
 * @committed
 */
template<typename T>
class async_result : public async_result_base
{
public:
  async_result(std::shared_ptr<core::async_control> control,
               std::future<std::pair<error, std::optional<T>>> future)
    : async_result_base{ std::move(control) }
    , future_{ std::move(future) }
  {
  }

  /**
   * Waits for the operation and returns its value. Can be called once.
   *
   * @throws the same exceptions as the blocking counterpart, and @ref operation_canceled_error
   */
  auto get() -> T
  {
    auto [err, value] = future_.get();
    if (err) {
      core::impl::throw_error(err);
    }
    return std::move(value.value());
  }

  void wait() const
  {
    future_.wait();
  }

  template<typename Rep, typename Period>
  auto wait_for(const std::chrono::duration<Rep, Period>& timeout) const -> std::future_status
  {
    return future_.wait_for(timeout);
  }

  [[nodiscard]] auto valid() const -> bool
  {
    return future_.valid();
  }

private:
  std::future<std::pair<error, std::optional<T>>> future_;
};

template<>
class async_result<void> : public async_result_base
{
public:
  async_result(std::shared_ptr<core::async_control> control, std::future<error> future)
    : async_result_base{ std::move(control) }
    , future_{ std::move(future) }
  {
  }

  void get()
  {
    if (auto err = future_.get(); err) {
      core::impl::throw_error(err);
    }
  }

  void wait() const
  {
    future_.wait();
  }

  template<typename Rep, typename Period>
  auto wait_for(const std::chrono::duration<Rep, Period>& timeout) const -> std::future_status
  {
    return future_.wait_for(timeout);
  }

  [[nodiscard]] auto valid() const -> bool
  {
    return future_.valid();
  }

private:
  std::future<error> future_;
};
} // namespace cosmos
