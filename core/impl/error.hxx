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

namespace cosmos::core::impl
{
/**
 * Raises the error as the exception type associated with its error code.
 *
 * Must not be called with an empty error.
 *
 * @throws http_response_error or one of its subclasses for codes in the cosmos.http category
 * @throws transport_error, invalid_payload_error, type_mismatch_error,
 *   missing_partition_key_error, client_closed_error, operation_canceled_error for the
 *   corresponding codes in the cosmos.client category
 * @throws std::system_error for everything else
 */
[[noreturn]] void
throw_error(const error& err);
} // namespace cosmos::core::impl
