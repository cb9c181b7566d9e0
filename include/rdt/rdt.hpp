#pragma once

// Copyright © 2026 The rdt Authors
// SPDX-License-Identifier: MIT

// Reliable, ordered, exactly-once delivery over an unreliable datagram
// Channel, by positive acknowledgment with per-packet retransmission.

#include "DeliveryReceipt.hpp"
#include "Packet.hpp"
#include "RTOEstimator.hpp"
#include "Receiver.hpp"
#include "Sender.hpp"
#include "Session.hpp"
#include "SessionConfig.hpp"
#include "params.hpp"
