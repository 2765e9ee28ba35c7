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


#include "async_control.hxx"

#include <cosmos/async_result.hxx>

#include <utility>

namespace cosmos
{
namespace core
{
void
async_control::on_cancel(std::function<void()> handler)
{
  const std::scoped_lock lock(mutex_);
  on_cancel_ = std::move(handler);
}

auto
async_control::try_start() -> bool
{
  const std::scoped_lock lock(mutex_);
  if (state_ != state::queued) {
    return false;
  }
  state_ = state::running;
  return true;
}

void
async_control::attach(std::shared_ptr<pending_operation> operation)
{
  if (operation == nullptr) {
    return;
  }
  {
    const std::scoped_lock lock(mutex_);
    if (state_ == state::running) {
      operation_ = std::move(operation);
      return;
    }
    if (state_ == state::completed) {
      return;
    }
  }
  operation->cancel();
}

auto
async_control::try_complete() -> bool
{
  {
    const std::scoped_lock lock(mutex_);
    if (state_ != state::running) {
      return false;
    }
    state_ = state::completed;
    operation_.reset();
  }
  done_.notify_all();
  return true;
}

auto
async_control::cancel() -> bool
{
  std::shared_ptr<pending_operation> operation{};
  std::function<void()> handler{};
  {
    const std::scoped_lock lock(mutex_);
    if (state_ == state::completed || state_ == state::canceled) {
      return false;
    }
    state_ = state::canceled;
    std::swap(operation, operation_);
    std::swap(handler, on_cancel_);
  }
  done_.notify_all();
  if (operation) {
    operation->cancel();
  }
  if (handler) {
    handler();
  }
  return true;
}

auto
async_control::current_state() const -> state
{
  const std::scoped_lock lock(mutex_);
  return state_;
}

auto
async_control::wait_until_done(std::chrono::milliseconds timeout) -> bool
{
  std::unique_lock lock(mutex_);
  return done_.wait_for(lock, timeout, [this] {
    return state_ == state::completed || state_ == state::canceled;
  });
}
} // namespace core

async_result_base::async_result_base(std::shared_ptr<core::async_control> control)
  : control_{ std::move(control) }
{
}

auto
async_result_base::cancel() -> bool
{
  return control_->cancel();
}

auto
async_result_base::is_canceled() const -> bool
{
  return control_->current_state() == core::async_control::state::canceled;
}
} // namespace cosmos
