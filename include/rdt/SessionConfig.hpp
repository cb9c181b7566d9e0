#pragma once

// Copyright © 2026 The rdt Authors
// SPDX-License-Identifier: MIT

#include <string>

#include "params.hpp"

namespace rdt {

// Fixed for the lifetime of a session. Every field starts at its default from
// params.hpp. Options can also be set by name:
//
//   max_segment_size, window_capacity, initial_rto, min_rto, max_rto,
//   max_retries_per_packet, rto_alpha, rto_beta, rto_k, rto_granularity,
//   reorder_window, idle_limit
//
// Durations are in seconds.
struct SessionConfig {
	SessionConfig();

	size_t   maxSegmentSize;
	size_t   windowCapacity;
	Duration initialRTO;
	Duration minRTO;
	Duration maxRTO;
	Duration rtoGranularity;
	size_t   maxRetriesPerPacket;
	double   rtoAlpha;
	double   rtoBeta;
	double   rtoK;
	size_t   reorderWindow;
	Duration idleLimit;

	// Answer true if usable. Otherwise answer false and describe the first
	// problem in outReason.
	bool validate(std::string *outReason = nullptr) const;

	// Set one option by name from its text form. Answer false (with a reason)
	// for an unknown name or an unparsable value. Ranges are checked by validate().
	bool setOption(const std::string &name, const std::string &value, std::string *outReason = nullptr);

	// "name=value" form of setOption().
	bool parseOption(const std::string &option, std::string *outReason = nullptr);

	// One line per option, "name=value".
	std::string describe() const;
};

} // namespace rdt
