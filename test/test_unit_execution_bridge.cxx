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


#include "test_helper.hxx"

#include "core/execution_bridge.hxx"

#include <cosmos/error_codes.hxx>
#include <cosmos/exceptions.hxx>

#include <asio/post.hpp>

#include <atomic>
#include <future>
#include <thread>
#include <vector>

namespace
{
class recording_operation : public cosmos::core::pending_operation
{
public:
  void cancel() override
  {
    canceled = true;
  }

  std::atomic_bool canceled{ false };
};

/**
 * Operation that only ends when canceled.
 */
auto
never_completes(std::shared_ptr<recording_operation> pending,
                std::shared_ptr<std::atomic_int> starts) -> cosmos::core::operation<int>
{
  return [pending = std::move(pending), starts = std::move(starts)](
           cosmos::core::completion_handler<int> /* handler */)
           -> std::shared_ptr<cosmos::core::pending_operation> {
    ++(*starts);
    return pending;
  };
}
} // namespace

TEST_CASE("unit: execution bridge is constructed once", "[unit]")
{
  test::utils::init_logger();

  std::vector<std::thread> threads{};
  std::vector<cosmos::core::execution_bridge*> seen(16, nullptr);
  for (std::size_t i = 0; i < seen.size(); ++i) {
    threads.emplace_back([&seen, i]() {
      seen[i] = &cosmos::core::execution_bridge::instance();
    });
  }
  for (auto& thread : threads) {
    thread.join();
  }
  for (const auto* bridge : seen) {
    CHECK(bridge == seen.front());
  }
  CHECK(cosmos::core::execution_bridge::construction_count() == 1);
  CHECK(cosmos::core::execution_bridge::instance().config().io_threads >= 1);
  CHECK(cosmos::core::execution_bridge::instance().config().async_workers >= 1);
}

TEST_CASE("unit: blocking execution", "[unit]")
{
  test::utils::init_logger();
  auto& bridge = cosmos::core::execution_bridge::instance();

  SECTION("value is handed back to the caller")
  {
    auto result = bridge.run_blocking<int>(
      [](cosmos::core::completion_handler<int> handler)
        -> std::shared_ptr<cosmos::core::pending_operation> {
        handler(7);
        return nullptr;
      });
    EXPECT_SUCCESS(result);
    CHECK(result.value() == 7);
  }

  SECTION("operation runs on the runtime")
  {
    auto result = bridge.run_blocking<bool>(
      [&bridge](cosmos::core::completion_handler<bool> handler)
        -> std::shared_ptr<cosmos::core::pending_operation> {
        handler(bridge.running_in_runtime_thread());
        return nullptr;
      });
    EXPECT_SUCCESS(result);
    CHECK(result.value());
    CHECK_FALSE(bridge.running_in_runtime_thread());
  }

  SECTION("errors are handed back as well")
  {
    auto result = bridge.run_blocking<int>(
      [](cosmos::core::completion_handler<int> handler)
        -> std::shared_ptr<cosmos::core::pending_operation> {
        handler(tl::unexpected(cosmos::error{ cosmos::errc::client::transport_error, "reset" }));
        return nullptr;
      });
    REQUIRE_FALSE(result);
    CHECK(result.error().ec() == cosmos::errc::client::transport_error);
  }

  SECTION("blocking from a runtime thread is refused")
  {
    std::promise<cosmos::core::operation_result<int>> barrier;
    auto f = barrier.get_future();
    asio::post(bridge.io_context(), [&bridge, &barrier]() {
      barrier.set_value(bridge.run_blocking<int>(
        [](cosmos::core::completion_handler<int> handler)
          -> std::shared_ptr<cosmos::core::pending_operation> {
          handler(1);
          return nullptr;
        }));
    });
    auto result = f.get();
    REQUIRE_FALSE(result);
    CHECK(result.error().ec() == cosmos::errc::client::blocking_on_runtime_thread);
  }
}

TEST_CASE("unit: asynchronous execution", "[unit]")
{
  test::utils::init_logger();
  auto& bridge = cosmos::core::execution_bridge::instance();

  SECTION("result is delivered through the future")
  {
    auto result = bridge.run_async<int>(
      [](cosmos::core::completion_handler<int> handler)
        -> std::shared_ptr<cosmos::core::pending_operation> {
        handler(11);
        return nullptr;
      });
    CHECK(result.get() == 11);
  }

  SECTION("void operations")
  {
    auto result = bridge.run_async<std::monostate>(
      [](cosmos::core::completion_handler<std::monostate> handler)
        -> std::shared_ptr<cosmos::core::pending_operation> {
        handler(tl::unexpected(cosmos::error{ cosmos::errc::http::resource_not_found, "gone", 404 }));
        return nullptr;
      });
    REQUIRE_THROWS_AS(result.get(), cosmos::resource_not_found_error);
  }

  SECTION("cancel reaches the operation in flight")
  {
    auto pending = std::make_shared<recording_operation>();
    auto starts = std::make_shared<std::atomic_int>(0);
    auto result = bridge.run_async<int>(never_completes(pending, starts));

    REQUIRE(test::utils::wait_until([starts]() { return starts->load() == 1; }));
    CHECK(result.cancel());
    CHECK_FALSE(result.cancel());
    CHECK(result.is_canceled());
    REQUIRE_THROWS_AS(result.get(), cosmos::operation_canceled_error);
    REQUIRE(test::utils::wait_until([pending]() { return pending->canceled.load(); }));
  }

  SECTION("canceled while queued is never started")
  {
    const auto workers = bridge.config().async_workers;
    auto starts = std::make_shared<std::atomic_int>(0);
    std::vector<std::shared_ptr<recording_operation>> blockers_pending{};
    std::vector<cosmos::async_result<int>> blockers{};
    for (std::size_t i = 0; i < workers; ++i) {
      blockers_pending.emplace_back(std::make_shared<recording_operation>());
      blockers.emplace_back(bridge.run_async<int>(never_completes(blockers_pending.back(), starts)));
    }
    REQUIRE(test::utils::wait_until([starts, workers]() {
      return starts->load() == static_cast<int>(workers);
    }));

    auto queued_starts = std::make_shared<std::atomic_int>(0);
    auto queued = bridge.run_async<int>(
      never_completes(std::make_shared<recording_operation>(), queued_starts));
    CHECK(queued.cancel());
    REQUIRE_THROWS_AS(queued.get(), cosmos::operation_canceled_error);

    for (auto& blocker : blockers) {
      blocker.cancel();
    }
    for (auto& blocker : blockers) {
      REQUIRE_THROWS_AS(blocker.get(), cosmos::operation_canceled_error);
    }
    // a worker picks the canceled entry up once the blockers are gone, and skips it
    std::this_thread::sleep_for(std::chrono::milliseconds(200));
    CHECK(queued_starts->load() == 0);
  }

  SECTION("already failed results resolve immediately")
  {
    auto result = cosmos::core::execution_bridge::failed<int>(
      cosmos::error{ cosmos::errc::client::client_closed, "closed" });
    CHECK(result.wait_for(std::chrono::seconds(0)) == std::future_status::ready);
    CHECK_FALSE(result.cancel());
    REQUIRE_THROWS_AS(result.get(), cosmos::client_closed_error);
  }
}
