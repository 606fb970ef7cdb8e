/*
 *  Client interface for local Broadlink device access
 *
 *  Error values shared by all protocol components
 *
 *
 *  Copyright 2024-2026 - broadlinkpp contributors
 *
 *  Licensed under GNU General Public License 3.0 or later.
 *  Some rights reserved. See COPYING, AUTHORS.
 *
 *  @license GPL-3.0+ <https://www.gnu.org/licenses/gpl-3.0.html>
 */

#include "broadlinkErrors.hpp"


const char* Broadlink::ErrorString(const Broadlink::Error::value error)
{
	switch (error)
	{
		case Error::NONE:
			return "success";
		case Error::CHECKSUM:
			return "checksum mismatch";
		case Error::CRYPTO:
			return "error decrypting payload";
		case Error::TRANSPORT_TIMEOUT:
			return "no response within timeout";
		case Error::TRANSPORT_IO:
			return "socket error";
		case Error::AUTH_HANDSHAKE_FAILED:
			return "authentication failed";
		case Error::AUTH_NOT_AUTHENTICATED:
			return "device is not authenticated";
		case Error::DISCOVERY_NO_REPLY:
			return "device did not answer discovery";
		case Error::DISCOVERY_MALFORMED:
			return "malformed discovery response";
		case Error::PROTOCOL_MALFORMED:
			return "malformed response";
		case Error::PROTOCOL_DEVICE_REJECTED:
			return "device returned error";
		case Error::PROTOCOL_TIMEOUT:
			return "operation timed out";
		case Error::VALIDATION:
			return "invalid value";
		case Error::PROVISIONING_NO_CONFIRMATION:
			return "no confirmation from device";
	}
	return "unknown error";
}
