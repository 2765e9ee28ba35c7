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

namespace cosmos::core
{
/**
 * Handle of an operation started by the transport.
 */
class pending_operation
{
public:
  virtual ~pending_operation() = default;

  /**
   * Requests cancellation. Best effort: the request may still reach the service and its side
   * effect may still happen. The completion callback is invoked at most once either way.
   */
  virtual void cancel() = 0;
};
} // namespace cosmos::core
