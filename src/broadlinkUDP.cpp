/*
 *	Client interface for local Broadlink device access
 *
 *	This is the UDP communication class.
 *
 *
 *	Copyright 2024-2026 - broadlinkpp contributors
 *
 *	Licensed under GNU General Public License 3.0 or later.
 *	Some rights reserved. See COPYING, AUTHORS.
 *
 *	@license GPL-3.0+ <https://www.gnu.org/licenses/gpl-3.0.html>
 */

#include "broadlinkUDP.hpp"
#include <unistd.h>
#include <cstring>
#include <sys/socket.h>
#include <netinet/in.h>
#include <arpa/inet.h>
#include <ifaddrs.h>
#include <errno.h>
#include <poll.h>

#ifdef DEBUG
#include <iostream>
#include <cstdio>
#endif


broadlinkUDP::broadlinkUDP(const std::string &local_address, const uint16_t local_port)
{
	m_sockfd = -1;
	m_lasterror = 0;
	m_local_address = local_address;
	m_local_port = local_port;
	m_socketState = Broadlink::UDP::Socket::CLOSED;
}


broadlinkUDP::~broadlinkUDP()
{
	disconnect();
}


bool broadlinkUDP::Open()
{
	if (m_socketState == Broadlink::UDP::Socket::OPEN)
		return true;
	if (m_sockfd >= 0)
		disconnect();

	struct sockaddr_in local_addr;
	memset(&local_addr, 0, sizeof(local_addr));
	local_addr.sin_family = AF_INET;
	local_addr.sin_port = htons(m_local_port);
	local_addr.sin_addr.s_addr = htonl(INADDR_ANY);
	if (!m_local_address.empty())
	{
		if (inet_pton(AF_INET, m_local_address.c_str(), &local_addr.sin_addr) != 1)
		{
			m_socketState = Broadlink::UDP::Socket::NO_SUCH_HOST;
			return false;
		}
	}

	m_sockfd = socket(AF_INET, SOCK_DGRAM, IPPROTO_UDP);
	if (m_sockfd < 0)
	{
		m_lasterror = errno;
		m_socketState = Broadlink::UDP::Socket::NO_SOCK_AVAIL;
		return false;
	}

	int set = 1;
	if ((setsockopt(m_sockfd, SOL_SOCKET, SO_BROADCAST, (char*)&set, sizeof(set)) < 0) ||
	    (setsockopt(m_sockfd, SOL_SOCKET, SO_REUSEADDR, (char*)&set, sizeof(set)) < 0) ||
	    (bind(m_sockfd, (const sockaddr*)&local_addr, sizeof(local_addr)) < 0))
	{
		m_lasterror = errno;
#ifdef DEBUG
		std::cout << "{\"msg\":\"" << strerror(m_lasterror) << "\",\"code\":" << m_lasterror << "}\n";
#endif
		close(m_sockfd);
		m_sockfd = -1;
		m_socketState = Broadlink::UDP::Socket::FAILED;
		return false;
	}

	m_socketState = Broadlink::UDP::Socket::OPEN;
	return true;
}


int broadlinkUDP::send(const std::string &address, const uint16_t port, const unsigned char *buffer, const int size)
{
	if (!Open())
		return -1;

	struct sockaddr_in dest_addr;
	memset(&dest_addr, 0, sizeof(dest_addr));
	dest_addr.sin_family = AF_INET;
	dest_addr.sin_port = htons(port);
	if (inet_pton(AF_INET, address.c_str(), &dest_addr.sin_addr) != 1)
	{
		m_lasterror = EINVAL;
		return -1;
	}

	int numbytes = (int)sendto(m_sockfd, buffer, size, 0, (const sockaddr*)&dest_addr, sizeof(dest_addr));
	if (numbytes < 0)
		m_lasterror = errno;

#ifdef DEBUG
	std::cout << "dbg: sent " << numbytes << " bytes to " << address << ":" << port << "\n";
#endif
	return numbytes;
}


int broadlinkUDP::receive(unsigned char *buffer, const int maxsize, std::string &source, const int timeout_ms)
{
	if (m_socketState != Broadlink::UDP::Socket::OPEN)
	{
		m_lasterror = ENOTCONN;
		return -1;
	}

	int events = getSocketEvents(POLLIN, timeout_ms);
	if (events < 0)
		return -1;
	if (events == 0)
		return 0;

	struct sockaddr_in src_addr;
	socklen_t addrlen = sizeof(src_addr);
	int numbytes = (int)recvfrom(m_sockfd, buffer, maxsize, 0, (sockaddr*)&src_addr, &addrlen);
	if (numbytes < 0)
	{
		m_lasterror = errno;
		return -1;
	}

	char cAddress[INET_ADDRSTRLEN];
	if (inet_ntop(AF_INET, &src_addr.sin_addr, cAddress, sizeof(cAddress)))
		source = cAddress;
	else
		source.clear();

#ifdef DEBUG
	std::cout << "dbg: received " << numbytes << " bytes from " << source << ": ";
	for (int i = 0; i < numbytes; ++i)
		printf("%.2x", (uint8_t)buffer[i]);
	std::cout << "\n";
#endif
	return numbytes;
}


int broadlinkUDP::getlasterror()
{
	return m_lasterror;
}


void broadlinkUDP::disconnect()
{
	if (m_sockfd >= 0)
		close(m_sockfd);
	m_sockfd = -1;
	m_socketState = Broadlink::UDP::Socket::CLOSED;
}


uint16_t broadlinkUDP::getLocalPort()
{
	if (!Open())
		return 0;

	struct sockaddr_in local_addr;
	socklen_t addrlen = sizeof(local_addr);
	if (getsockname(m_sockfd, (sockaddr*)&local_addr, &addrlen) < 0)
	{
		m_lasterror = errno;
		return 0;
	}
	return ntohs(local_addr.sin_port);
}


std::string broadlinkUDP::GetLocalAddress()
{
	std::string result;
	struct ifaddrs *ifaddr;
	if (getifaddrs(&ifaddr) < 0)
		return result;

	for (struct ifaddrs *ifa = ifaddr; ifa != nullptr; ifa = ifa->ifa_next)
	{
		if ((ifa->ifa_addr == nullptr) || (ifa->ifa_addr->sa_family != AF_INET))
			continue;
		struct sockaddr_in *saddr = (struct sockaddr_in *)ifa->ifa_addr;
		if ((ntohl(saddr->sin_addr.s_addr) >> 24) == 127)
			continue;

		char cAddress[INET_ADDRSTRLEN];
		if (inet_ntop(AF_INET, &saddr->sin_addr, cAddress, sizeof(cAddress)))
		{
			result = cAddress;
			break;
		}
	}
	freeifaddrs(ifaddr);
	return result;
}


// Returns 1 if one of the requested events fired, 0 on timeout and -1 on error
/* private */ int broadlinkUDP::getSocketEvents(short events, int timeout_ms)
{
	struct pollfd fds;
	fds.fd = m_sockfd;
	fds.events = events;
	fds.revents = 0;
	int result = poll(&fds, 1, timeout_ms);
	while ((result < 0) && (errno == EINTR))
		result = poll(&fds, 1, timeout_ms);
	if (result < 0)
	{
		m_lasterror = errno;
		disconnect();
		m_socketState = Broadlink::UDP::Socket::FAILED;
		return -1;
	}
	if (result == 0)
		return 0;

	if (fds.revents & POLLNVAL)
	{
		// descriptor is gone already, do not close a number that may have been reused
		m_lasterror = EBADF;
		m_sockfd = -1;
		m_socketState = Broadlink::UDP::Socket::FAILED;
		return -1;
	}

	if (fds.revents & POLLERR)
	{
		// try to get socket error
		int sockerr = 0;
		socklen_t len = sizeof sockerr;
		if ((getsockopt(m_sockfd, SOL_SOCKET, SO_ERROR, (char *)&sockerr, &len) >= 0) && (sockerr > 0))
			m_lasterror = sockerr;
		return -1;
	}
	if (fds.revents & events)
	{
		m_lasterror = 0;
		return 1;
	}
	return 0;
}
