#pragma once

// Copyright © 2026 The rdt Authors
// SPDX-License-Identifier: MIT

#include "Timer.hpp"

namespace rdt {

struct SessionConfig;

// Smoothed round-trip time and retransmission timeout, RFC 6298 style.
//
//   RTTVAR <- (1 - beta) * RTTVAR + beta * |SRTT - R|
//   SRTT   <- (1 - alpha) * SRTT + alpha * R
//   RTO    <- SRTT + max(G, K * RTTVAR), clamped to [minRTO, maxRTO]
//
// Before the first sample the timeout is initialRTO. Only samples from packets
// that were never retransmitted may be fed in (Karn's algorithm).
class RTOEstimator {
public:
	RTOEstimator(const SessionConfig &config);

	Duration currentTimeout() const;

	void onSample(Duration rtt);

	// Answer the timeout for the next retransmission of a packet whose last
	// transmission timed out after previousTimeout. SRTT and RTTVAR are not
	// changed; the backoff belongs to that packet only.
	Duration onTimeoutBackoff(Duration previousTimeout) const;

	bool     hasSample() const;
	Duration getSRTT() const;   // -1 before the first sample
	Duration getRTTVariance() const;
	size_t   getSampleCount() const;

protected:
	Duration clamp(Duration rto) const;

	Duration m_initialRTO;
	Duration m_minRTO;
	Duration m_maxRTO;
	Duration m_granularity;
	double   m_alpha;
	double   m_beta;
	double   m_k;

	Duration m_srtt;
	Duration m_rttvar;
	Duration m_rto;
	size_t   m_sampleCount;
};

} // namespace rdt
