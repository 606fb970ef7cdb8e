/*
 *  Client interface for local Broadlink device access
 *
 *  Datagram transport base class
 *
 *  Implementations provide the raw `send` and `receive` primitives; the
 *  request/response exchange with timeout and bounded retry is common:
 *
 *	 - SendAndReceive(address, port, buffer, size, reply, maxsize, &replysize)
 *		Sends one datagram and waits for one reply from `address`. On
 *		timeout the datagram is sent again, up to `retries` times.
 *		Setting `anysource` accepts a reply from any host, which is
 *		needed when talking to a broadcast address.
 *		Returns Broadlink::Error::NONE, TRANSPORT_TIMEOUT or TRANSPORT_IO
 *
 *
 *  Copyright 2024-2026 - broadlinkpp contributors
 *
 *  Licensed under GNU General Public License 3.0 or later.
 *  Some rights reserved. See COPYING, AUTHORS.
 *
 *  @license GPL-3.0+ <https://www.gnu.org/licenses/gpl-3.0.html>
 */

#ifndef _broadlinkTransport
#define _broadlinkTransport

// Broadlink devices listen on the HTTP port for UDP datagrams
#ifndef BROADLINK_DEVICE_PORT
#define BROADLINK_DEVICE_PORT 80
#endif

#ifndef BROADLINK_SOCKET_TIMEOUT_MS
#define BROADLINK_SOCKET_TIMEOUT_MS 10000
#endif

#ifndef BROADLINK_SOCKET_RETRIES
#define BROADLINK_SOCKET_RETRIES 2
#endif

#define BROADLINK_BROADCAST_ADDRESS "255.255.255.255"

#include "broadlinkErrors.hpp"
#include <string>
#include <cstdint>


class broadlinkTransport
{

public:
	broadlinkTransport();
	virtual ~broadlinkTransport() {}

	void setTimeout(const int timeout_ms);
	void setRetries(const uint8_t retries);
	int getTimeout() const { return m_timeout; }
	uint8_t getRetries() const { return m_retries; }

	// Returns `size` on success or -1 if an error occurred
	virtual int send(const std::string &address, const uint16_t port, const unsigned char *buffer, const int size) = 0;
	// Returns number of bytes received, 0 on timeout or -1 if an error occurred
	virtual int receive(unsigned char *buffer, const int maxsize, std::string &source, const int timeout_ms) = 0;
	virtual int getlasterror() = 0;
	virtual uint16_t getLocalPort() { return 0; }

	Broadlink::Error::value SendAndReceive(const std::string &address, const uint16_t port, const unsigned char *buffer, const int size, unsigned char *reply, const int maxsize, int *replysize, const bool anysource = false);

protected:
	int m_timeout;
	uint8_t m_retries;
};

#endif // _broadlinkTransport
