/*
 *  Client interface for local Broadlink device access
 *
 *  Payload encryption context
 *
 *
 *  Copyright 2024-2026 - broadlinkpp contributors
 *
 *  Licensed under GNU General Public License 3.0 or later.
 *  Some rights reserved. See COPYING, AUTHORS.
 *
 *  @license GPL-3.0+ <https://www.gnu.org/licenses/gpl-3.0.html>
 */

#include "broadlinkCipher.hpp"
#include <cstring>
#include "crypt/aes_128_cbc.hpp"

#ifdef DEBUG
#include <iostream>
#include <cstdio>
#endif


namespace Broadlink {
  namespace Crypto {
    static const unsigned char DEFAULT_KEY[BROADLINK_BLOCK_SIZE] = {
      0x09, 0x76, 0x28, 0x34, 0x3f, 0xe9, 0x9e, 0x23, 0x76, 0x5c, 0x15, 0x13, 0xac, 0xcf, 0x8b, 0x02
    };
    static const unsigned char DEFAULT_IV[BROADLINK_BLOCK_SIZE] = {
      0x56, 0x2e, 0x17, 0x99, 0x6d, 0x09, 0x3d, 0x28, 0xdd, 0xb3, 0xba, 0x69, 0x5a, 0x2e, 0x6f, 0x58
    };
  }; // namespace Crypto
}; // namespace Broadlink


broadlinkCipher::broadlinkCipher()
{
	memcpy(m_key, Broadlink::Crypto::DEFAULT_KEY, BROADLINK_BLOCK_SIZE);
	memcpy(m_iv, Broadlink::Crypto::DEFAULT_IV, BROADLINK_BLOCK_SIZE);
}


broadlinkCipher::broadlinkCipher(const unsigned char *key, const unsigned char *iv)
{
	memcpy(m_key, key, BROADLINK_BLOCK_SIZE);
	memcpy(m_iv, iv, BROADLINK_BLOCK_SIZE);
}


bool broadlinkCipher::isDefault() const
{
	return ((memcmp(m_key, Broadlink::Crypto::DEFAULT_KEY, BROADLINK_BLOCK_SIZE) == 0) &&
		(memcmp(m_iv, Broadlink::Crypto::DEFAULT_IV, BROADLINK_BLOCK_SIZE) == 0));
}


Broadlink::Error::value broadlinkCipher::Encrypt(const std::string &szPayload, std::string &szEncrypted) const
{
	// zero pad to a whole number of blocks
	int payloadSize = (int)szPayload.length();
	int paddedSize = (payloadSize + BROADLINK_BLOCK_SIZE - 1) & ~(BROADLINK_BLOCK_SIZE - 1);
	szEncrypted.clear();
	if (paddedSize == 0)
		return Broadlink::Error::NONE;

	std::string szPadded = szPayload;
	szPadded.append(paddedSize - payloadSize, '\0');

	unsigned char* cEncryptedPayload = new unsigned char[paddedSize + BROADLINK_BLOCK_SIZE];
	int encryptedSize = 0;
	if (!Broadlink::aes_128_cbc_crypt(true, m_key, m_iv, (const unsigned char*)szPadded.data(), paddedSize, cEncryptedPayload, &encryptedSize))
	{
		delete[] cEncryptedPayload;
		return Broadlink::Error::CRYPTO;
	}
	szEncrypted.assign((char*)cEncryptedPayload, encryptedSize);
	delete[] cEncryptedPayload;
	return Broadlink::Error::NONE;
}


Broadlink::Error::value broadlinkCipher::Decrypt(const std::string &szEncrypted, std::string &szPayload) const
{
	int payloadSize = (int)szEncrypted.length();
	szPayload.clear();
	if (payloadSize % BROADLINK_BLOCK_SIZE)
	{
#ifdef DEBUG
		std::cout << "dbg: encrypted payload size " << payloadSize << " is not a multiple of the block size\n";
#endif
		return Broadlink::Error::CRYPTO;
	}
	if (payloadSize == 0)
		return Broadlink::Error::NONE;

	unsigned char* cDecryptedPayload = new unsigned char[payloadSize + BROADLINK_BLOCK_SIZE];
	int decryptedSize = 0;
	if (!Broadlink::aes_128_cbc_crypt(false, m_key, m_iv, (const unsigned char*)szEncrypted.data(), payloadSize, cDecryptedPayload, &decryptedSize))
	{
		delete[] cDecryptedPayload;
		return Broadlink::Error::CRYPTO;
	}
	szPayload.assign((char*)cDecryptedPayload, decryptedSize);
	delete[] cDecryptedPayload;

#ifdef DEBUG
	std::cout << "dbg: decrypted payload (size=" << decryptedSize << "): ";
	for (int i = 0; i < decryptedSize; ++i)
		printf("%.2x", (uint8_t)szPayload[i]);
	std::cout << "\n";
#endif

	return Broadlink::Error::NONE;
}
