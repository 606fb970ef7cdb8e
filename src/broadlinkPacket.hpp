/*
 *  Client interface for local Broadlink device access
 *
 *  Packet framing and checksums
 *
 *  All multi-byte fields on the wire are little endian. Command packets
 *  start with a fixed 0x38 byte header:
 *
 *	0x00	magic 5a a5 aa 55 5a a5 aa 55
 *	0x20	checksum over the complete packet (this field counted as zero)
 *	0x22	status, signed, non-zero in replies indicates a device error
 *	0x24	device type
 *	0x26	command
 *	0x28	packet counter
 *	0x2a	device MAC address, reversed
 *	0x30	session id
 *	0x34	checksum over the plain text payload
 *	0x38	encrypted payload
 *
 *
 *  Copyright 2024-2026 - broadlinkpp contributors
 *
 *  Licensed under GNU General Public License 3.0 or later.
 *  Some rights reserved. See COPYING, AUTHORS.
 *
 *  @license GPL-3.0+ <https://www.gnu.org/licenses/gpl-3.0.html>
 */

#ifndef _broadlinkPacket
#define _broadlinkPacket

#define BROADLINK_HEADER_SIZE 0x38
#define BROADLINK_CHECKSUM_SEED 0xBEAF
#define BROADLINK_CHECKSUM_OFFSET 0x20
#define BROADLINK_STATUS_OFFSET 0x22
#define BROADLINK_COMMAND_OFFSET 0x26

#ifndef BROADLINK_MAX_PACKET_SIZE
#define BROADLINK_MAX_PACKET_SIZE 4096
#endif

// Broadlink packet types
#define BROADLINK_DISCOVER 0x06
#define BROADLINK_DISCOVER_RESPONSE 0x07
#define BROADLINK_SETUP 0x14
#define BROADLINK_AUTH 0x65
#define BROADLINK_COMMAND 0x6A

#include "broadlinkErrors.hpp"
#include <string>
#include <cstdint>


namespace Broadlink {

  struct Header {
    int16_t status;
    uint16_t devtype;
    uint16_t command;
    uint16_t count;
    unsigned char mac[6];		// display order, reversed on the wire
    uint32_t id;
    uint16_t payload_checksum;
  };

  namespace Packet {
    uint16_t ComputeChecksum(const unsigned char *data, const int size);
    uint16_t FrameChecksum(const unsigned char *buffer, const int size);
    void SealPacket(unsigned char *buffer, const int size);
    bool VerifyPacket(const unsigned char *buffer, const int size);

    // one's complement of the 16 bit word sum, used inside HVAC payloads
    uint16_t InvertedChecksum(const unsigned char *data, const int size);

    int BuildPacket(unsigned char *buffer, const int maxsize, const Header &header, const std::string &payload);
    Error::value ValidateAndStrip(const unsigned char *buffer, const int size, Header &header, std::string &payload);

    void put_le16(unsigned char *dst, const uint16_t value);
    void put_le32(unsigned char *dst, const uint32_t value);
    uint16_t get_le16(const unsigned char *src);
    uint32_t get_le32(const unsigned char *src);
  }; // namespace Packet

}; // namespace Broadlink

#endif // _broadlinkPacket
