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

#ifndef _broadlinkErrors
#define _broadlinkErrors


namespace Broadlink {
  namespace Error {
    enum value {
      NONE = 0,
      CHECKSUM,                      // frame checksum mismatch
      CRYPTO,                        // decrypt failure or bad block alignment
      TRANSPORT_TIMEOUT,             // no reply after all retries
      TRANSPORT_IO,                  // socket level failure, see getlasterror()
      AUTH_HANDSHAKE_FAILED,
      AUTH_NOT_AUTHENTICATED,
      DISCOVERY_NO_REPLY,
      DISCOVERY_MALFORMED,
      PROTOCOL_MALFORMED,
      PROTOCOL_DEVICE_REJECTED,      // non-zero status in reply header
      PROTOCOL_TIMEOUT,              // learn cycle ran out of attempts
      VALIDATION,                    // local range/enum check, nothing was sent
      PROVISIONING_NO_CONFIRMATION
    }; // enum value
  }; // namespace Error

  const char* ErrorString(const Error::value error);
}; // namespace Broadlink

#endif // _broadlinkErrors
