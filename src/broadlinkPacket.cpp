/*
 *  Client interface for local Broadlink device access
 *
 *  Packet framing and checksums
 *
 *
 *  Copyright 2024-2026 - broadlinkpp contributors
 *
 *  Licensed under GNU General Public License 3.0 or later.
 *  Some rights reserved. See COPYING, AUTHORS.
 *
 *  @license GPL-3.0+ <https://www.gnu.org/licenses/gpl-3.0.html>
 */

#include "broadlinkPacket.hpp"
#include <cstring>

#ifdef DEBUG
#include <iostream>
#include <cstdio>
#endif


namespace Broadlink {
  namespace Packet {
    static const unsigned char MAGIC[8] = { 0x5a, 0xa5, 0xaa, 0x55, 0x5a, 0xa5, 0xaa, 0x55 };
  }; // namespace Packet
}; // namespace Broadlink


void Broadlink::Packet::put_le16(unsigned char *dst, const uint16_t value)
{
	dst[0] = (value & 0x00FF);
	dst[1] = (value & 0xFF00) >> 8;
}


void Broadlink::Packet::put_le32(unsigned char *dst, const uint32_t value)
{
	dst[0] = (value & 0x000000FF);
	dst[1] = (value & 0x0000FF00) >> 8;
	dst[2] = (value & 0x00FF0000) >> 16;
	dst[3] = (value & 0xFF000000) >> 24;
}


uint16_t Broadlink::Packet::get_le16(const unsigned char *src)
{
	return (uint16_t)(src[0] + (src[1] << 8));
}


uint32_t Broadlink::Packet::get_le32(const unsigned char *src)
{
	return (uint32_t)src[0] + ((uint32_t)src[1] << 8) + ((uint32_t)src[2] << 16) + ((uint32_t)src[3] << 24);
}


uint16_t Broadlink::Packet::ComputeChecksum(const unsigned char *data, const int size)
{
	uint32_t sum = BROADLINK_CHECKSUM_SEED;
	for (int i = 0; i < size; i++)
		sum += data[i];
	return (uint16_t)(sum & 0xFFFF);
}


uint16_t Broadlink::Packet::FrameChecksum(const unsigned char *buffer, const int size)
{
	uint32_t sum = BROADLINK_CHECKSUM_SEED;
	for (int i = 0; i < size; i++)
	{
		if ((i == BROADLINK_CHECKSUM_OFFSET) || (i == BROADLINK_CHECKSUM_OFFSET + 1))
			continue;
		sum += buffer[i];
	}
	return (uint16_t)(sum & 0xFFFF);
}


void Broadlink::Packet::SealPacket(unsigned char *buffer, const int size)
{
	put_le16(&buffer[BROADLINK_CHECKSUM_OFFSET], FrameChecksum(buffer, size));
}


bool Broadlink::Packet::VerifyPacket(const unsigned char *buffer, const int size)
{
	if (size < BROADLINK_CHECKSUM_OFFSET + 2)
		return false;
	return (get_le16(&buffer[BROADLINK_CHECKSUM_OFFSET]) == FrameChecksum(buffer, size));
}


uint16_t Broadlink::Packet::InvertedChecksum(const unsigned char *data, const int size)
{
	uint32_t sum = 0;
	for (int i = 0; i < size; i++)
	{
		if (i & 0x1)
			sum += (uint32_t)data[i] << 8;
		else
			sum += data[i];
	}
	while (sum >> 16)
		sum = (sum & 0xFFFF) + (sum >> 16);
	return (uint16_t)(~sum & 0xFFFF);
}


int Broadlink::Packet::BuildPacket(unsigned char *cMessageBuffer, const int maxsize, const Header &header, const std::string &szPayload)
{
	int buffersize = BROADLINK_HEADER_SIZE + (int)szPayload.length();
	if (buffersize > maxsize)
		return -1;

	memset(cMessageBuffer, 0, BROADLINK_HEADER_SIZE);
	memcpy(cMessageBuffer, MAGIC, sizeof(MAGIC));

	put_le16(&cMessageBuffer[BROADLINK_STATUS_OFFSET], (uint16_t)header.status);
	put_le16(&cMessageBuffer[0x24], header.devtype);
	put_le16(&cMessageBuffer[BROADLINK_COMMAND_OFFSET], header.command);
	put_le16(&cMessageBuffer[0x28], header.count);
	for (int i = 0; i < 6; i++)
		cMessageBuffer[0x2a + i] = header.mac[5 - i];
	put_le32(&cMessageBuffer[0x30], header.id);
	put_le16(&cMessageBuffer[0x34], header.payload_checksum);

	memcpy(&cMessageBuffer[BROADLINK_HEADER_SIZE], szPayload.data(), szPayload.length());
	SealPacket(cMessageBuffer, buffersize);

#ifdef DEBUG
	std::cout << "dbg: complete message (size=" << buffersize << "): ";
	for (int i = 0; i < buffersize; ++i)
		printf("%.2x", (uint8_t)cMessageBuffer[i]);
	std::cout << "\n";
#endif

	return buffersize;
}


Broadlink::Error::value Broadlink::Packet::ValidateAndStrip(const unsigned char *cMessageBuffer, const int buffersize, Header &header, std::string &szPayload)
{
	if (buffersize < BROADLINK_HEADER_SIZE)
		return Error::CHECKSUM;

	uint16_t crc_sent = get_le16(&cMessageBuffer[BROADLINK_CHECKSUM_OFFSET]);
	uint16_t crc = FrameChecksum(cMessageBuffer, buffersize);
	if (crc != crc_sent)
	{
#ifdef DEBUG
		std::cout << "dbg: checksum error, expected " << crc << " got " << crc_sent << "\n";
#endif
		return Error::CHECKSUM;
	}

	header.status = (int16_t)get_le16(&cMessageBuffer[BROADLINK_STATUS_OFFSET]);
	header.devtype = get_le16(&cMessageBuffer[0x24]);
	header.command = get_le16(&cMessageBuffer[BROADLINK_COMMAND_OFFSET]);
	header.count = get_le16(&cMessageBuffer[0x28]);
	for (int i = 0; i < 6; i++)
		header.mac[i] = cMessageBuffer[0x2f - i];
	header.id = get_le32(&cMessageBuffer[0x30]);
	header.payload_checksum = get_le16(&cMessageBuffer[0x34]);

	szPayload.assign((const char*)&cMessageBuffer[BROADLINK_HEADER_SIZE], buffersize - BROADLINK_HEADER_SIZE);
	return Error::NONE;
}
