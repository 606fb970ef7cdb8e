/*
 *  Client interface for local Broadlink device access
 *
 *  Wireless network provisioning
 *
 *  A device in AP mode (factory reset, blinking fast) accepts a single
 *  broadcast datagram with the credentials of the network to join.
 *
 *
 *  Copyright 2024-2026 - broadlinkpp contributors
 *
 *  Licensed under GNU General Public License 3.0 or later.
 *  Some rights reserved. See COPYING, AUTHORS.
 *
 *  @license GPL-3.0+ <https://www.gnu.org/licenses/gpl-3.0.html>
 */


#ifndef _broadlinkNetwork
#define _broadlinkNetwork

#define BROADLINK_SETUP_SIZE 0x88
#define BROADLINK_SETUP_FIELD_SIZE 32

#ifndef BROADLINK_SETUP_WINDOW_MS
#define BROADLINK_SETUP_WINDOW_MS 3000
#endif

#include "broadlinkErrors.hpp"
#include "broadlinkTransport.hpp"

#include <string>
#include <cstdint>


namespace Broadlink {
  namespace Security {
    enum value {
      NONE = 0,
      WEP = 1,
      WPA1 = 2,
      WPA2 = 3,
      WPA = 4		// WPA1 and WPA2
    }; // enum value
  }; // namespace Security

  struct NetworkCredentials {
    Security::value security;
    std::string ssid;
    std::string password;	// ignored for open networks

    NetworkCredentials() : security(Security::WPA2) {}
    NetworkCredentials(const Security::value mode, const std::string &szSSID, const std::string &szPassword = "")
      : security(mode), ssid(szSSID), password(szPassword) {}
  };

  namespace Network {
    // Returns the message size or a negative value on invalid credentials
    int BuildSetupMessage(unsigned char *buffer, const NetworkCredentials &credentials);

    // Broadcasts the credentials and waits for any device to answer
    Error::value ConnectToNetwork(const NetworkCredentials &credentials, broadlinkTransport *transport = nullptr);
  }; // namespace Network

}; // namespace Broadlink

#endif // _broadlinkNetwork
