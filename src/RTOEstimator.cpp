// Copyright © 2026 The rdt Authors
// SPDX-License-Identifier: MIT

#include <algorithm>
#include <cmath>

#include "../include/rdt/RTOEstimator.hpp"
#include "../include/rdt/SessionConfig.hpp"
#include "../include/rdt/params.hpp"

namespace rdt {

RTOEstimator::RTOEstimator(const SessionConfig &config) :
	m_initialRTO(config.initialRTO),
	m_minRTO(config.minRTO),
	m_maxRTO(config.maxRTO),
	m_granularity(config.rtoGranularity),
	m_alpha(config.rtoAlpha),
	m_beta(config.rtoBeta),
	m_k(config.rtoK),
	m_srtt(-1),
	m_rttvar(0),
	m_sampleCount(0)
{
	m_rto = clamp(m_initialRTO);
}

Duration RTOEstimator::currentTimeout() const
{
	return m_rto;
}

void RTOEstimator::onSample(Duration rtt)
{
	if(rtt < 0)
		return;

	if(m_srtt >= 0.0)
	{
		Duration rtt_delta = std::fabs(m_srtt - rtt);
		m_rttvar = ((1.0 - m_beta) * m_rttvar) + (m_beta * rtt_delta);
		m_srtt = ((1.0 - m_alpha) * m_srtt) + (m_alpha * rtt);
	}
	else
	{
		m_srtt = rtt;
		m_rttvar = rtt / 2.0;
	}

	m_sampleCount++;
	m_rto = clamp(m_srtt + std::max(m_granularity, m_k * m_rttvar));
}

Duration RTOEstimator::onTimeoutBackoff(Duration previousTimeout) const
{
	return clamp(std::max(previousTimeout, m_rto) * RTO_BACKOFF_FACTOR);
}

bool RTOEstimator::hasSample() const
{
	return m_sampleCount > 0;
}

Duration RTOEstimator::getSRTT() const
{
	return m_srtt;
}

Duration RTOEstimator::getRTTVariance() const
{
	return m_rttvar;
}

size_t RTOEstimator::getSampleCount() const
{
	return m_sampleCount;
}

Duration RTOEstimator::clamp(Duration rto) const
{
	return std::min(m_maxRTO, std::max(m_minRTO, rto));
}

} // namespace rdt
