/*
 *  Client interface for local Broadlink device access
 *
 *  Device discovery
 *
 *  A scanner broadcasts a plain text probe and yields the devices that
 *  answer within the listening window, one at a time:
 *
 *	broadlinkScanner scanner(local_ip);
 *	if (scanner.Start() == Broadlink::Error::NONE)
 *	{
 *		Broadlink::DeviceInfo info;
 *		while (scanner.Next(info))
 *			...
 *	}
 *
 *  Calling Start() again begins a fresh probe/collect cycle. Malformed
 *  replies and repeated replies from the same address are skipped.
 *
 *
 *  Copyright 2024-2026 - broadlinkpp contributors
 *
 *  Licensed under GNU General Public License 3.0 or later.
 *  Some rights reserved. See COPYING, AUTHORS.
 *
 *  @license GPL-3.0+ <https://www.gnu.org/licenses/gpl-3.0.html>
 */

#ifndef _broadlinkDiscovery
#define _broadlinkDiscovery

#define BROADLINK_DISCOVERY_SIZE 0x30
#define BROADLINK_DISCOVERY_RESPONSE_SIZE 0x80

#ifndef BROADLINK_DISCOVERY_WINDOW_MS
#define BROADLINK_DISCOVERY_WINDOW_MS 5000
#endif

#include "broadlinkErrors.hpp"
#include "broadlinkTransport.hpp"
#include <string>
#include <vector>
#include <set>
#include <chrono>
#include <cstdint>
#include <ctime>


namespace Broadlink {

  struct DeviceInfo {
    std::string address;
    uint16_t port;
    unsigned char mac[6];
    uint16_t devtype;
    std::string name;
    bool locked;

    DeviceInfo();
  };

  std::string FormatMAC(const unsigned char *mac);

  namespace Discovery {
    int BuildDiscoveryMessage(unsigned char *buffer, const std::string &local_address, const uint16_t local_port, const struct tm &tmLocal, const int tz_hours);
    int BuildDiscoveryMessage(unsigned char *buffer, const std::string &local_address, const uint16_t local_port);
    Error::value ParseDiscoveryResponse(const unsigned char *buffer, const int size, const std::string &source, DeviceInfo &info);

    // Probe a single known address. Fails with DISCOVERY_NO_REPLY or
    // DISCOVERY_MALFORMED instead of returning an empty result.
    Error::value FromAddress(const std::string &address, const std::string &local_address, DeviceInfo &info, broadlinkTransport *transport = nullptr);
  }; // namespace Discovery

}; // namespace Broadlink


class broadlinkScanner
{

public:
	broadlinkScanner(const std::string &local_address = "", const int window_ms = BROADLINK_DISCOVERY_WINDOW_MS, broadlinkTransport *transport = nullptr);
	~broadlinkScanner();

	Broadlink::Error::value Start(const std::string &target = BROADLINK_BROADCAST_ADDRESS);
	bool Next(Broadlink::DeviceInfo &info);

	// Runs one complete cycle and returns the number of devices found
	int ListDevices(std::vector<Broadlink::DeviceInfo> &devices);

private:
	broadlinkTransport *m_transport;
	bool m_ownTransport;
	std::string m_local_address;
	int m_window;
	bool m_active;
	std::chrono::steady_clock::time_point m_deadline;
	std::set<std::string> m_seen;
};

#endif // _broadlinkDiscovery
