#pragma once

// Copyright © 2026 The rdt Authors
// SPDX-License-Identifier: MIT

// Wire format constants.
//
//   version (1) | kind (1) | id (VLU) | [ payload length (VLU) | payload ] | digest (N)
//
// The payload fields are present only for KIND_DATA. The digest covers every
// byte before it, and its length N is fixed by the session's ChecksumAdapter.

#include <cstddef>
#include <cstdint>

namespace rdt {

const uint8_t WIRE_VERSION = 0x01;

enum PacketKind : uint8_t {
	KIND_DATA = 0x10,
	KIND_ACK  = 0x50
};

const size_t PACKET_FIXED_HEADER_LENGTH = 2; // version and kind

} // namespace rdt
