/*
 *  Client interface for local Broadlink device access
 *
 *  Device discovery
 *
 *
 *  Copyright 2024-2026 - broadlinkpp contributors
 *
 *  Licensed under GNU General Public License 3.0 or later.
 *  Some rights reserved. See COPYING, AUTHORS.
 *
 *  @license GPL-3.0+ <https://www.gnu.org/licenses/gpl-3.0.html>
 */

#include "broadlinkDiscovery.hpp"
#include "broadlinkPacket.hpp"
#include "broadlinkUDP.hpp"
#include <cstring>
#include <cstdio>
#include <arpa/inet.h>

#ifdef DEBUG
#include <iostream>
#endif


Broadlink::DeviceInfo::DeviceInfo()
{
	port = BROADLINK_DEVICE_PORT;
	memset(mac, 0, sizeof(mac));
	devtype = 0;
	locked = false;
}


std::string Broadlink::FormatMAC(const unsigned char *mac)
{
	char cMAC[18];
	sprintf(cMAC, "%.2X:%.2X:%.2X:%.2X:%.2X:%.2X", mac[0], mac[1], mac[2], mac[3], mac[4], mac[5]);
	return std::string(cMAC);
}


int Broadlink::Discovery::BuildDiscoveryMessage(unsigned char *cMessageBuffer, const std::string &szLocalAddress, const uint16_t local_port, const struct tm &tmLocal, const int tz_hours)
{
	struct in_addr local_addr;
	local_addr.s_addr = 0;
	if (!szLocalAddress.empty() && (inet_pton(AF_INET, szLocalAddress.c_str(), &local_addr) != 1))
		return -1;

	memset(cMessageBuffer, 0, BROADLINK_DISCOVERY_SIZE);
	Packet::put_le32(&cMessageBuffer[0x08], (uint32_t)tz_hours);
	int year = tmLocal.tm_year + 1900;
	Packet::put_le16(&cMessageBuffer[0x0c], (uint16_t)year);
	cMessageBuffer[0x0e] = (uint8_t)tmLocal.tm_min;
	cMessageBuffer[0x0f] = (uint8_t)tmLocal.tm_hour;
	cMessageBuffer[0x10] = (uint8_t)(year % 100);
	cMessageBuffer[0x11] = (uint8_t)((tmLocal.tm_wday == 0) ? 7 : tmLocal.tm_wday);  // monday is 1
	cMessageBuffer[0x12] = (uint8_t)tmLocal.tm_mday;
	cMessageBuffer[0x13] = (uint8_t)(tmLocal.tm_mon + 1);

	// local address in reverse octet order
	const unsigned char *octets = (const unsigned char*)&local_addr.s_addr;
	for (int i = 0; i < 4; i++)
		cMessageBuffer[0x18 + i] = octets[3 - i];
	Packet::put_le16(&cMessageBuffer[0x1c], local_port);
	cMessageBuffer[BROADLINK_COMMAND_OFFSET] = BROADLINK_DISCOVER;

	Packet::SealPacket(cMessageBuffer, BROADLINK_DISCOVERY_SIZE);
	return BROADLINK_DISCOVERY_SIZE;
}


int Broadlink::Discovery::BuildDiscoveryMessage(unsigned char *cMessageBuffer, const std::string &szLocalAddress, const uint16_t local_port)
{
	time_t now = time(NULL);
	struct tm tmLocal;
	if (!localtime_r(&now, &tmLocal))
		return -1;
	return BuildDiscoveryMessage(cMessageBuffer, szLocalAddress, local_port, tmLocal, (int)(tmLocal.tm_gmtoff / 3600));
}


Broadlink::Error::value Broadlink::Discovery::ParseDiscoveryResponse(const unsigned char *cMessageBuffer, const int buffersize, const std::string &szSource, DeviceInfo &info)
{
	if (buffersize < BROADLINK_DISCOVERY_RESPONSE_SIZE)
	{
#ifdef DEBUG
		std::cout << "dbg: discovery response from " << szSource << " too short (" << buffersize << " bytes)\n";
#endif
		return Error::DISCOVERY_MALFORMED;
	}

	struct in_addr source_addr;
	if (inet_pton(AF_INET, szSource.c_str(), &source_addr) != 1)
		return Error::DISCOVERY_MALFORMED;

	info.address = szSource;
	info.port = BROADLINK_DEVICE_PORT;
	info.devtype = Packet::get_le16(&cMessageBuffer[0x34]);
	for (int i = 0; i < 6; i++)
		info.mac[i] = cMessageBuffer[0x3f - i];

	// name is NUL terminated within 0x40 .. 0x7e
	int namesize = 0;
	while ((namesize < 0x3f) && (cMessageBuffer[0x40 + namesize] != 0))
		namesize++;
	info.name.assign((const char*)&cMessageBuffer[0x40], namesize);
	info.locked = (cMessageBuffer[0x7f] != 0);
	return Error::NONE;
}


Broadlink::Error::value Broadlink::Discovery::FromAddress(const std::string &szAddress, const std::string &szLocalAddress, DeviceInfo &info, broadlinkTransport *transport)
{
	std::string local_address = szLocalAddress;
	if (local_address.empty())
		local_address = broadlinkUDP::GetLocalAddress();

	broadlinkTransport *udp = transport;
	if (!udp)
		udp = new broadlinkUDP(szLocalAddress);

	unsigned char cMessageBuffer[BROADLINK_DISCOVERY_SIZE];
	unsigned char cResponseBuffer[BROADLINK_MAX_PACKET_SIZE];
	Error::value result = Error::NONE;
	int numbytes = BuildDiscoveryMessage(cMessageBuffer, local_address, udp->getLocalPort());
	if (numbytes < 0)
		result = Error::VALIDATION;
	else
		result = udp->SendAndReceive(szAddress, BROADLINK_DEVICE_PORT, cMessageBuffer, numbytes, cResponseBuffer, BROADLINK_MAX_PACKET_SIZE, &numbytes);

	if (result == Error::TRANSPORT_TIMEOUT)
		result = Error::DISCOVERY_NO_REPLY;
	else if (result == Error::NONE)
		result = ParseDiscoveryResponse(cResponseBuffer, numbytes, szAddress, info);

	if (!transport)
		delete udp;
	return result;
}


broadlinkScanner::broadlinkScanner(const std::string &local_address, const int window_ms, broadlinkTransport *transport)
{
	m_transport = transport;
	m_ownTransport = false;
	m_local_address = local_address;
	m_window = window_ms;
	m_active = false;
}


broadlinkScanner::~broadlinkScanner()
{
	if (m_ownTransport)
		delete m_transport;
}


Broadlink::Error::value broadlinkScanner::Start(const std::string &target)
{
	// every cycle starts on a fresh socket
	if (m_ownTransport)
	{
		delete m_transport;
		m_transport = nullptr;
	}
	if (!m_transport)
	{
		m_transport = new broadlinkUDP(m_local_address);
		m_ownTransport = true;
	}

	std::string local_address = m_local_address;
	if (local_address.empty())
		local_address = broadlinkUDP::GetLocalAddress();

	m_active = false;
	m_seen.clear();

	unsigned char cMessageBuffer[BROADLINK_DISCOVERY_SIZE];
	int numbytes = Broadlink::Discovery::BuildDiscoveryMessage(cMessageBuffer, local_address, m_transport->getLocalPort());
	if (numbytes < 0)
		return Broadlink::Error::VALIDATION;
	if (m_transport->send(target, BROADLINK_DEVICE_PORT, cMessageBuffer, numbytes) < 0)
		return Broadlink::Error::TRANSPORT_IO;

	m_deadline = std::chrono::steady_clock::now() + std::chrono::milliseconds(m_window);
	m_active = true;
	return Broadlink::Error::NONE;
}


bool broadlinkScanner::Next(Broadlink::DeviceInfo &info)
{
	unsigned char cResponseBuffer[BROADLINK_MAX_PACKET_SIZE];
	while (m_active)
	{
		int remaining = (int)std::chrono::duration_cast<std::chrono::milliseconds>(m_deadline - std::chrono::steady_clock::now()).count();
		if (remaining <= 0)
			break;

		std::string source;
		int numbytes = m_transport->receive(cResponseBuffer, BROADLINK_MAX_PACKET_SIZE, source, remaining);
		if (numbytes <= 0)
			break;

		if (m_seen.count(source))
			continue;
		if (Broadlink::Discovery::ParseDiscoveryResponse(cResponseBuffer, numbytes, source, info) != Broadlink::Error::NONE)
			continue;

		m_seen.insert(source);
		return true;
	}
	m_active = false;
	return false;
}


int broadlinkScanner::ListDevices(std::vector<Broadlink::DeviceInfo> &devices)
{
	devices.clear();
	if (Start() != Broadlink::Error::NONE)
		return 0;

	Broadlink::DeviceInfo info;
	while (Next(info))
		devices.push_back(info);
	return (int)devices.size();
}
