#pragma once

// Copyright © 2026 The rdt Authors
// SPDX-License-Identifier: MIT

#include <cmath>

#include "Timer.hpp"
#include "VLU.hpp"
#include "packet.hpp"

namespace rdt {

const uintmax_t FIRST_PACKET_ID         = 1;
const size_t    MAX_DIGEST_LENGTH       = 32;
const size_t    MAX_PACKET_LENGTH       = 8192; // UdpChannel::RECEIVE_BUFFER_LENGTH
const size_t    MAX_PACKET_OVERHEAD     = PACKET_FIXED_HEADER_LENGTH + 2 * VLU::MAX_VLU_SIZE + MAX_DIGEST_LENGTH;
const size_t    MAX_SEGMENT_SIZE_LIMIT  = MAX_PACKET_LENGTH - MAX_PACKET_OVERHEAD;

// SessionConfig defaults.
const size_t    DEFAULT_MAX_SEGMENT_SIZE = 1450; // fits a 1500 byte MTU with IPv4 + UDP + header
const size_t    DEFAULT_WINDOW_CAPACITY  = 16;
const Duration  DEFAULT_INITIAL_RTO      = 1.0;  // RFC 6298 §2.1
const Duration  DEFAULT_MIN_RTO          = 0.200;
const Duration  DEFAULT_MAX_RTO          = 10.0;
const Duration  DEFAULT_RTO_GRANULARITY  = 0.001; // RunLoop timer resolution
const size_t    DEFAULT_MAX_RETRIES      = 8;
const double    DEFAULT_RTO_ALPHA        = 0.125;
const double    DEFAULT_RTO_BETA         = 0.25;
const double    DEFAULT_RTO_K            = 4.0;
const size_t    DEFAULT_REORDER_WINDOW   = 0; // discard anything ahead of next expected
const Duration  DEFAULT_IDLE_LIMIT       = INFINITY;

const double    RTO_BACKOFF_FACTOR       = 2.0;

} // namespace rdt
