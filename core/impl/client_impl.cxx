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


#include "client_impl.hxx"

#include "core/execution_bridge.hxx"
#include "core/logger/logger.hxx"
#include "core/meta/version.hxx"

#include <cosmos/error_codes.hxx>

#include <system_error>

namespace cosmos
{
client_impl::client_impl(std::string endpoint,
                         cosmos::credential credential,
                         client_options::built options)
  : endpoint_{ std::move(endpoint) }
  , credential_{ std::move(credential) }
  , options_{ std::move(options) }
  , resolver_{ options_.partition_key_candidates }
{
}

client_impl::~client_impl()
{
  close();
}

void
client_impl::open()
{
  core::connection_config config{
    endpoint_,
    credential_,
    core::meta::user_agent(options_.user_agent_suffix),
  };
  auto transport = options_.transport(core::execution_bridge::instance().io_context(), config);
  if (!transport) {
    throw std::system_error(errc::client::invalid_argument,
                            "transport factory did not produce a document client");
  }
  CS_LOG_DEBUG(R"(client opened, endpoint="{}", user_agent="{}", build={})",
               endpoint_,
               config.user_agent,
               core::meta::sdk_build_info_json());
  const std::scoped_lock lock(transport_mutex_);
  transport_ = std::move(transport);
}

void
client_impl::close()
{
  std::shared_ptr<core::document_client> transport{};
  {
    const std::scoped_lock lock(transport_mutex_);
    std::swap(transport, transport_);
  }
  if (transport) {
    CS_LOG_DEBUG(R"(closing client, endpoint="{}")", endpoint_);
    transport->close();
  }
}

auto
client_impl::is_open() const -> bool
{
  const std::scoped_lock lock(transport_mutex_);
  return transport_ != nullptr;
}

auto
client_impl::transport() const -> tl::expected<std::shared_ptr<core::document_client>, error>
{
  const std::scoped_lock lock(transport_mutex_);
  if (!transport_) {
    return tl::unexpected(error{ errc::client::client_closed, "client is closed" });
  }
  return transport_;
}

auto
client_impl::cache_for(const std::string& database_id, const std::string& container_id)
  -> std::shared_ptr<container_cache>
{
  const std::scoped_lock lock(containers_mutex_);
  auto& entry = containers_[{ database_id, container_id }];
  if (!entry) {
    entry = std::make_shared<container_cache>();
  }
  return entry;
}

void
client_impl::forget_container(const std::string& database_id, const std::string& container_id)
{
  const std::scoped_lock lock(containers_mutex_);
  if (auto it = containers_.find({ database_id, container_id }); it != containers_.end()) {
    it->second->forget();
    containers_.erase(it);
  }
}

void
client_impl::forget_database(const std::string& database_id)
{
  const std::scoped_lock lock(containers_mutex_);
  for (auto it = containers_.begin(); it != containers_.end();) {
    if (it->first.first == database_id) {
      it->second->forget();
      it = containers_.erase(it);
    } else {
      ++it;
    }
  }
}
} // namespace cosmos
