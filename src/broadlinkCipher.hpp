/*
 *  Client interface for local Broadlink device access
 *
 *  Payload encryption context
 *
 *  Holds one AES-128 key and IV pair. A default constructed context
 *  carries the pre-shared values every device accepts before the
 *  authentication handshake; afterwards a device specific context is
 *  built from the key returned by the device.
 *
 *
 *  Copyright 2024-2026 - broadlinkpp contributors
 *
 *  Licensed under GNU General Public License 3.0 or later.
 *  Some rights reserved. See COPYING, AUTHORS.
 *
 *  @license GPL-3.0+ <https://www.gnu.org/licenses/gpl-3.0.html>
 */

#ifndef _broadlinkCipher
#define _broadlinkCipher

#define BROADLINK_BLOCK_SIZE 16

#include "broadlinkErrors.hpp"
#include <string>
#include <cstdint>


class broadlinkCipher
{

public:
	broadlinkCipher();
	broadlinkCipher(const unsigned char *key, const unsigned char *iv);

	Broadlink::Error::value Encrypt(const std::string &szPayload, std::string &szEncrypted) const;
	Broadlink::Error::value Decrypt(const std::string &szEncrypted, std::string &szPayload) const;

	const unsigned char* getKey() const { return m_key; }
	const unsigned char* getIV() const { return m_iv; }
	bool isDefault() const;

private:
	unsigned char m_key[BROADLINK_BLOCK_SIZE];
	unsigned char m_iv[BROADLINK_BLOCK_SIZE];
};

#endif // _broadlinkCipher
