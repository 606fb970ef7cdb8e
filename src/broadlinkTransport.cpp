/*
 *  Client interface for local Broadlink device access
 *
 *  Datagram transport base class
 *
 *
 *  Copyright 2024-2026 - broadlinkpp contributors
 *
 *  Licensed under GNU General Public License 3.0 or later.
 *  Some rights reserved. See COPYING, AUTHORS.
 *
 *  @license GPL-3.0+ <https://www.gnu.org/licenses/gpl-3.0.html>
 */

#include "broadlinkTransport.hpp"
#include <chrono>

#ifdef DEBUG
#include <iostream>
#endif


broadlinkTransport::broadlinkTransport()
{
	m_timeout = BROADLINK_SOCKET_TIMEOUT_MS;
	m_retries = BROADLINK_SOCKET_RETRIES;
}


void broadlinkTransport::setTimeout(const int timeout_ms)
{
	m_timeout = timeout_ms;
}


void broadlinkTransport::setRetries(const uint8_t retries)
{
	m_retries = retries;
}


Broadlink::Error::value broadlinkTransport::SendAndReceive(const std::string &address, const uint16_t port, const unsigned char *buffer, const int size, unsigned char *reply, const int maxsize, int *replysize, const bool anysource)
{
	*replysize = 0;
	for (int attempt = 0; attempt <= (int)m_retries; attempt++)
	{
		if (send(address, port, buffer, size) < 0)
			return Broadlink::Error::TRANSPORT_IO;

		std::chrono::steady_clock::time_point deadline = std::chrono::steady_clock::now() + std::chrono::milliseconds(m_timeout);
		while (true)
		{
			int remaining = (int)std::chrono::duration_cast<std::chrono::milliseconds>(deadline - std::chrono::steady_clock::now()).count();
			if (remaining < 0)
				remaining = 0;

			std::string source;
			int numbytes = receive(reply, maxsize, source, remaining);
			if (numbytes < 0)
				return Broadlink::Error::TRANSPORT_IO;
			if (numbytes == 0)
				break;

			if (!anysource && (source != address))
			{
				// stray datagram from another host, keep waiting for ours
#ifdef DEBUG
				std::cout << "dbg: ignoring " << numbytes << " bytes from " << source << "\n";
#endif
				continue;
			}

			*replysize = numbytes;
			return Broadlink::Error::NONE;
		}
#ifdef DEBUG
		std::cout << "dbg: no response from " << address << " (attempt " << (attempt + 1) << ")\n";
#endif
	}
	return Broadlink::Error::TRANSPORT_TIMEOUT;
}
