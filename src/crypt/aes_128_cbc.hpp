/*
 *  Client interface for local Broadlink device access
 *
 *  AES-128 CBC encrypt/decrypt module
 *
 *  Padding is handled by the caller: input sizes must be a multiple of
 *  the 16 byte block size.
 *
 *
 *  Copyright 2024-2026 - broadlinkpp contributors
 *
 *  Licensed under GNU General Public License 3.0 or later.
 *  Some rights reserved. See COPYING, AUTHORS.
 *
 *  @license GPL-3.0+ <https://www.gnu.org/licenses/gpl-3.0.html>
 */

#ifndef _broadlink_aes_128_cbc
#define _broadlink_aes_128_cbc

#ifndef USE_MBEDTLS

// select default encryption routines
#define USE_OPENSSL

#endif


#ifdef USE_OPENSSL

#include <openssl/evp.h>

namespace Broadlink {

static bool aes_128_cbc_crypt(const bool encrypt, const unsigned char *cEncryptionKey, const unsigned char *cIV, const unsigned char *cInputBuffer, int inputSize, unsigned char *cOutputBuffer, int *outputSize)
{
	int len;
	*outputSize = 0;

	EVP_CIPHER_CTX* ctx = EVP_CIPHER_CTX_new();
	if (!ctx)
		return false;

	if (EVP_CipherInit_ex(ctx, EVP_aes_128_cbc(), nullptr, cEncryptionKey, cIV, encrypt ? 1 : 0) == 1)
	{
		EVP_CIPHER_CTX_set_padding(ctx, 0);  // zero padding is applied by the caller
		if (EVP_CipherUpdate(ctx, cOutputBuffer, &len, cInputBuffer, inputSize) == 1)
		{
			*outputSize = len;
			if (EVP_CipherFinal_ex(ctx, cOutputBuffer + len, &len) == 1)
			{
				*outputSize += len;
				EVP_CIPHER_CTX_free(ctx);
				return true;
			}
		}
	}

	EVP_CIPHER_CTX_free(ctx);
	return false;
}

}; // namespace Broadlink

#endif // USE_OPENSSL


#ifdef USE_MBEDTLS

#include <cstring>
#include "mbedtls/aes.h"

namespace Broadlink {

static bool aes_128_cbc_crypt(const bool encrypt, const unsigned char *cEncryptionKey, const unsigned char *cIV, const unsigned char *cInputBuffer, int inputSize, unsigned char *cOutputBuffer, int *outputSize)
{
	*outputSize = 0;
	if (inputSize & 0xF)
		return false;

	// mbedtls updates the IV in place
	unsigned char iv[16];
	memcpy(iv, cIV, 16);

	mbedtls_aes_context aes;
	mbedtls_aes_init(&aes);
	int ret;
	if (encrypt)
		ret = mbedtls_aes_setkey_enc(&aes, cEncryptionKey, 128);
	else
		ret = mbedtls_aes_setkey_dec(&aes, cEncryptionKey, 128);
	if (ret == 0)
		ret = mbedtls_aes_crypt_cbc(&aes, encrypt ? MBEDTLS_AES_ENCRYPT : MBEDTLS_AES_DECRYPT, inputSize, iv, cInputBuffer, cOutputBuffer);
	mbedtls_aes_free(&aes);

	if (ret != 0)
		return false;
	*outputSize = inputSize;
	return true;
}

}; // namespace Broadlink

#endif // USE_MBEDTLS

#endif // _broadlink_aes_128_cbc
