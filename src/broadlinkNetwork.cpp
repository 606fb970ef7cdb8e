/*
 *  Client interface for local Broadlink device access
 *
 *  Wireless network provisioning
 *
 *
 *  Copyright 2024-2026 - broadlinkpp contributors
 *
 *  Licensed under GNU General Public License 3.0 or later.
 *  Some rights reserved. See COPYING, AUTHORS.
 *
 *  @license GPL-3.0+ <https://www.gnu.org/licenses/gpl-3.0.html>
 */

#include "broadlinkNetwork.hpp"
#include "broadlinkPacket.hpp"
#include "broadlinkUDP.hpp"
#include <cstring>

#ifdef DEBUG
#include <iostream>
#endif


int Broadlink::Network::BuildSetupMessage(unsigned char *cMessageBuffer, const NetworkCredentials &credentials)
{
	std::string szPassword;
	if (credentials.security != Security::NONE)
		szPassword = credentials.password;

	if (credentials.ssid.empty() || (credentials.ssid.length() > BROADLINK_SETUP_FIELD_SIZE) || (szPassword.length() > BROADLINK_SETUP_FIELD_SIZE))
		return -1;
	if ((credentials.security < Security::NONE) || (credentials.security > Security::WPA))
		return -1;

	memset(cMessageBuffer, 0, BROADLINK_SETUP_SIZE);
	cMessageBuffer[BROADLINK_COMMAND_OFFSET] = BROADLINK_SETUP;
	memcpy(&cMessageBuffer[0x44], credentials.ssid.c_str(), credentials.ssid.length());
	memcpy(&cMessageBuffer[0x64], szPassword.c_str(), szPassword.length());
	cMessageBuffer[0x84] = (unsigned char)credentials.ssid.length();
	cMessageBuffer[0x85] = (unsigned char)szPassword.length();
	cMessageBuffer[0x86] = (unsigned char)credentials.security;

	Packet::SealPacket(cMessageBuffer, BROADLINK_SETUP_SIZE);
	return BROADLINK_SETUP_SIZE;
}


Broadlink::Error::value Broadlink::Network::ConnectToNetwork(const NetworkCredentials &credentials, broadlinkTransport *transport)
{
	unsigned char cMessageBuffer[BROADLINK_SETUP_SIZE];
	int numbytes = BuildSetupMessage(cMessageBuffer, credentials);
	if (numbytes < 0)
		return Error::VALIDATION;

	broadlinkTransport *udp = transport;
	if (!udp)
		udp = new broadlinkUDP();

	// a single short window, the reply content carries no information
	int timeout = udp->getTimeout();
	uint8_t retries = udp->getRetries();
	udp->setTimeout(BROADLINK_SETUP_WINDOW_MS);
	udp->setRetries(0);

	unsigned char cResponseBuffer[BROADLINK_MAX_PACKET_SIZE];
	Error::value result = udp->SendAndReceive(BROADLINK_BROADCAST_ADDRESS, BROADLINK_DEVICE_PORT, cMessageBuffer, numbytes, cResponseBuffer, BROADLINK_MAX_PACKET_SIZE, &numbytes, true);

	udp->setTimeout(timeout);
	udp->setRetries(retries);
	if (!transport)
		delete udp;

	if (result == Error::TRANSPORT_TIMEOUT)
	{
#ifdef DEBUG
		std::cout << "dbg: no device confirmed the network setup\n";
#endif
		return Error::PROVISIONING_NO_CONFIRMATION;
	}
	return result;
}
