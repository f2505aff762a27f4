/*
 * Part of the HeaderVerify (HV) project.
 *
 * SPDX-FileCopyrightText: 2025 HeaderVerify contributors
 * SPDX-License-Identifier: Apache-2.0
 *
 * This file is part of HeaderVerify (HV). See LICENSE for details.
 */

#pragma once
#include <cstddef>
#include <cstdint>

namespace hv {

// Wire transport used by server and client.
enum class Transport {
    Plain,  // HTTP/1.1 over TCP
    Tls     // HTTP/1.1 over TLS 1.2+
};

} // namespace hv
