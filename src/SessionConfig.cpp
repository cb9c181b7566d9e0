// Copyright © 2026 The rdt Authors
// SPDX-License-Identifier: MIT

#include <cerrno>
#include <cmath>
#include <cstdint>
#include <cstdio>
#include <cstdlib>

#include "../include/rdt/SessionConfig.hpp"

namespace rdt {

namespace {

bool fail(std::string *outReason, const std::string &reason)
{
	if(outReason)
		*outReason = reason;
	return false;
}

bool parseSize(const std::string &value, size_t *dst)
{
	const char *str = value.c_str();
	char *end = nullptr;

	if(value.empty() or ('-' == value[0]))
		return false;

	errno = 0;
	unsigned long long v = strtoull(str, &end, 10);
	if(errno or (*end) or (v > (unsigned long long)SIZE_MAX))
		return false;

	*dst = (size_t)v;
	return true;
}

bool parseDouble(const std::string &value, double *dst)
{
	const char *str = value.c_str();
	char *end = nullptr;

	if(value.empty())
		return false;

	errno = 0;
	double v = strtod(str, &end);
	if(errno or (*end) or std::isnan(v))
		return false;

	*dst = v;
	return true;
}

bool parseDuration(const std::string &value, Duration *dst)
{
	double v;
	if(not parseDouble(value, &v))
		return false;
	*dst = v;
	return true;
}

}

SessionConfig::SessionConfig() :
	maxSegmentSize(DEFAULT_MAX_SEGMENT_SIZE),
	windowCapacity(DEFAULT_WINDOW_CAPACITY),
	initialRTO(DEFAULT_INITIAL_RTO),
	minRTO(DEFAULT_MIN_RTO),
	maxRTO(DEFAULT_MAX_RTO),
	rtoGranularity(DEFAULT_RTO_GRANULARITY),
	maxRetriesPerPacket(DEFAULT_MAX_RETRIES),
	rtoAlpha(DEFAULT_RTO_ALPHA),
	rtoBeta(DEFAULT_RTO_BETA),
	rtoK(DEFAULT_RTO_K),
	reorderWindow(DEFAULT_REORDER_WINDOW),
	idleLimit(DEFAULT_IDLE_LIMIT)
{ }

bool SessionConfig::validate(std::string *outReason) const
{
	if(0 == maxSegmentSize)
		return fail(outReason, "max_segment_size must be at least 1");
	if(maxSegmentSize > MAX_SEGMENT_SIZE_LIMIT)
		return fail(outReason, "max_segment_size must be at most " + std::to_string(MAX_SEGMENT_SIZE_LIMIT));
	if(0 == windowCapacity)
		return fail(outReason, "window_capacity must be at least 1");
	if(not (minRTO > 0))
		return fail(outReason, "min_rto must be positive");
	if(not (maxRTO >= minRTO) or std::isinf(maxRTO))
		return fail(outReason, "max_rto must be finite and not less than min_rto");
	if(not ((initialRTO > 0) and (initialRTO <= maxRTO)))
		return fail(outReason, "initial_rto must be positive and not more than max_rto");
	if(not (rtoGranularity >= 0) or std::isinf(rtoGranularity))
		return fail(outReason, "rto_granularity must be finite and not negative");
	if(not ((rtoAlpha > 0) and (rtoAlpha <= 1)))
		return fail(outReason, "rto_alpha must be in (0, 1]");
	if(not ((rtoBeta > 0) and (rtoBeta <= 1)))
		return fail(outReason, "rto_beta must be in (0, 1]");
	if(not (rtoK > 0) or std::isinf(rtoK))
		return fail(outReason, "rto_k must be positive and finite");
	if(not (idleLimit > 0))
		return fail(outReason, "idle_limit must be positive");

	return true;
}

bool SessionConfig::setOption(const std::string &name, const std::string &value, std::string *outReason)
{
	bool ok;

	if("max_segment_size" == name)
		ok = parseSize(value, &maxSegmentSize);
	else if("window_capacity" == name)
		ok = parseSize(value, &windowCapacity);
	else if("initial_rto" == name)
		ok = parseDuration(value, &initialRTO);
	else if("min_rto" == name)
		ok = parseDuration(value, &minRTO);
	else if("max_rto" == name)
		ok = parseDuration(value, &maxRTO);
	else if("rto_granularity" == name)
		ok = parseDuration(value, &rtoGranularity);
	else if("max_retries_per_packet" == name)
		ok = parseSize(value, &maxRetriesPerPacket);
	else if("rto_alpha" == name)
		ok = parseDouble(value, &rtoAlpha);
	else if("rto_beta" == name)
		ok = parseDouble(value, &rtoBeta);
	else if("rto_k" == name)
		ok = parseDouble(value, &rtoK);
	else if("reorder_window" == name)
		ok = parseSize(value, &reorderWindow);
	else if("idle_limit" == name)
		ok = parseDuration(value, &idleLimit);
	else
		return fail(outReason, "unknown option " + name);

	if(not ok)
		return fail(outReason, "can't parse value '" + value + "' for " + name);

	return true;
}

bool SessionConfig::parseOption(const std::string &option, std::string *outReason)
{
	size_t equals = option.find('=');
	if((std::string::npos == equals) or (0 == equals))
		return fail(outReason, "expected name=value, got '" + option + "'");

	return setOption(option.substr(0, equals), option.substr(equals + 1), outReason);
}

std::string SessionConfig::describe() const
{
	char buf[512];

	snprintf(buf, sizeof(buf),
		"max_segment_size=%lu\n"
		"window_capacity=%lu\n"
		"initial_rto=%g\n"
		"min_rto=%g\n"
		"max_rto=%g\n"
		"rto_granularity=%g\n"
		"max_retries_per_packet=%lu\n"
		"rto_alpha=%g\n"
		"rto_beta=%g\n"
		"rto_k=%g\n"
		"reorder_window=%lu\n"
		"idle_limit=%g\n",
		(unsigned long)maxSegmentSize, (unsigned long)windowCapacity,
		(double)initialRTO, (double)minRTO, (double)maxRTO, (double)rtoGranularity,
		(unsigned long)maxRetriesPerPacket, rtoAlpha, rtoBeta, rtoK,
		(unsigned long)reorderWindow, (double)idleLimit);

	return std::string(buf);
}

} // namespace rdt
