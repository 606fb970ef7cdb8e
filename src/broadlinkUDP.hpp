/*
 *	Client interface for local Broadlink device access
 *
 *	This is the UDP communication class. One instance owns one socket,
 *	which is opened on first use and closed on destruction.
 *
 *	Functions:
 *	 - Open()
 *		Creates the socket, enables broadcast and binds it to the local
 *		address and port given at construction (any, if empty/zero)
 *		Returns true|false indicating success or failure
 *	 - send(address, port, buffer[], size)
 *		Sends `size` bytes of `buffer` to `address`:`port`
 *		Returns `size` on success or -1 if an error occurred
 *	 - receive(buffer[], maxsize, source, timeout_ms)
 *		Waits up to `timeout_ms` for one datagram and fills `buffer`
 *		with it. `source` is set to the sender's IPv4 address
 *		Returns number of bytes received, 0 on timeout or -1 on error
 *	 - disconnect()
 *		Closes the socket
 *	 - getlasterror()
 *		Use this instead of referencing `errno`, which may be polluted
 *		Returns the last error state of the socket
 *	 - getLocalPort()
 *		Opens the socket if needed and returns the port it is bound to
 *		Returns 0 if the socket could not be opened
 *	 - GetLocalAddress()
 *		Returns the first non-loopback IPv4 address of this host
 *
 *
 *	Copyright 2024-2026 - broadlinkpp contributors
 *
 *	Licensed under GNU General Public License 3.0 or later.
 *	Some rights reserved. See COPYING, AUTHORS.
 *
 *	@license GPL-3.0+ <https://www.gnu.org/licenses/gpl-3.0.html>
 */

#ifndef _broadlinkUDP
#define _broadlinkUDP

#include "broadlinkTransport.hpp"
#include <string>
#include <cstdint>


namespace Broadlink {
  namespace UDP {
    namespace Socket {
      enum value {
        NO_SUCH_HOST,
        NO_SOCK_AVAIL,
        FAILED,
        CLOSED,
        OPEN
      }; // enum value
    }; // namespace Socket
  }; // namespace UDP
}; // namespace Broadlink


class broadlinkUDP : public broadlinkTransport
{

public:
	broadlinkUDP(const std::string &local_address = "", const uint16_t local_port = 0);
	~broadlinkUDP();

	bool Open();
	int send(const std::string &address, const uint16_t port, const unsigned char *buffer, const int size) override;
	int receive(unsigned char *buffer, const int maxsize, std::string &source, const int timeout_ms) override;
	int getlasterror() override;
	void disconnect();

	Broadlink::UDP::Socket::value getSocketState() const { return m_socketState; }
	uint16_t getLocalPort() override;

	static std::string GetLocalAddress();

private:
	int getSocketEvents(short events, int timeout_ms);

	int m_sockfd;
	int m_lasterror;
	std::string m_local_address;
	uint16_t m_local_port;
	Broadlink::UDP::Socket::value m_socketState;
};

#endif // _broadlinkUDP
