/*
 *  Client interface for local Broadlink device access
 *
 *  Broadlink device base class
 *
 *  The base class implements the authentication handshake and the
 *  encrypted command envelope shared by all device families. Device
 *  families with additional commands derive from it; create() selects
 *  the class from the device type code reported in discovery.
 *
 *
 *  Copyright 2024-2026 - broadlinkpp contributors
 *
 *  Licensed under GNU General Public License 3.0 or later.
 *  Some rights reserved. See COPYING, AUTHORS.
 *
 *  @license GPL-3.0+ <https://www.gnu.org/licenses/gpl-3.0.html>
 */

#ifndef _broadlinkDevice
#define _broadlinkDevice

#define BROADLINK_AUTH_PAYLOAD_SIZE 0x50
#define BROADLINK_AUTH_RESPONSE_SIZE 0x14

#include "broadlinkErrors.hpp"
#include "broadlinkCipher.hpp"
#include "broadlinkDiscovery.hpp"
#include "broadlinkTransport.hpp"
#include <string>
#include <cstdint>


namespace Broadlink {
  namespace Family {
    enum value {
      GENERIC,
      REMOTE,
      CLIMATE
    }; // enum value
  }; // namespace Family

  struct Model {
    uint16_t devtype;
    Family::value family;
    bool rm4;			// remote uses the length prefixed RM4 framing
    const char *name;
  };

  // Returns nullptr for device types that are not in the table
  const Model* LookupModel(const uint16_t devtype);
}; // namespace Broadlink


class broadlinkDevice
{

public:
	broadlinkDevice(const Broadlink::DeviceInfo &info, broadlinkTransport *transport = nullptr);
	virtual ~broadlinkDevice();

	// Caller owns the returned object. A null transport makes the device
	// open its own UDP socket.
	static broadlinkDevice* create(const Broadlink::DeviceInfo &info, broadlinkTransport *transport = nullptr);
	static Broadlink::Family::value Classify(const uint16_t devtype);
	static std::string ModelName(const uint16_t devtype);
	static std::string BuildAuthenticationPayload(const std::string &szName);

	Broadlink::Family::value getFamily() const { return m_family; }
	const Broadlink::DeviceInfo& getInfo() const { return m_info; }
	std::string ToString() const;

	Broadlink::Error::value Authenticate();
	bool isAuthenticated() const { return m_authenticated; }
	uint32_t getSessionID() const { return m_session_id; }
	const broadlinkCipher& getCipher() const { return m_cipher; }

	// Sends an encrypted command payload and returns the decrypted reply
	Broadlink::Error::value SendCommand(const std::string &szPayload, std::string &szResponse);

	// Returns the status field of the last reply, negative values are device errors
	int getlasterror() const { return m_lasterror; }
	broadlinkTransport* getTransport() { return m_transport; }

protected:
	Broadlink::Error::value Exchange(const uint16_t command, const std::string &szPayload, const broadlinkCipher &cipher, const uint32_t id, std::string &szResponse);

	Broadlink::DeviceInfo m_info;
	Broadlink::Family::value m_family;
	int m_lasterror;

private:
	broadlinkCipher m_cipher;
	uint32_t m_session_id;
	bool m_authenticated;
	uint16_t m_count;
	broadlinkTransport *m_transport;
	bool m_ownTransport;
};

#endif // _broadlinkDevice
