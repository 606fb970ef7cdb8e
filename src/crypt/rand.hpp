/*
 *  Client interface for local Broadlink device access
 *
 *  Random bytes from the crypto backend's generator
 *
 *
 *  Copyright 2024-2026 - broadlinkpp contributors
 *
 *  Licensed under GNU General Public License 3.0 or later.
 *  Some rights reserved. See COPYING, AUTHORS.
 *
 *  @license GPL-3.0+ <https://www.gnu.org/licenses/gpl-3.0.html>
 */

#ifndef _broadlink_rand
#define _broadlink_rand

#ifndef USE_MBEDTLS

// select default encryption routines
#define USE_OPENSSL

#endif


#ifdef USE_OPENSSL

#include <openssl/rand.h>

namespace Broadlink {
/*
 * Fills `buffer` with `len` bytes from the OpenSSL CSPRNG.
 * Returns false when the generator is not seeded.
 */
static bool random_bytes(unsigned char *buffer, const int len)
{
	if (len <= 0)
		return true;
	return (RAND_bytes(buffer, len) == 1);
}
}; // namespace Broadlink

#endif // USE_OPENSSL


#ifdef USE_MBEDTLS

#include <mbedtls/entropy.h>
#include <mbedtls/ctr_drbg.h>
#include <cstring>

namespace Broadlink {
/*
 * Fills `buffer` with `len` bytes from a CTR-DRBG seeded from the platform
 * entropy source. Requests are split to stay within the DRBG request limit.
 */
static bool random_bytes(unsigned char *buffer, const int len)
{
	static const char *personalization = "broadlinkpp";

	mbedtls_entropy_context entropy;
	mbedtls_ctr_drbg_context drbg;
	mbedtls_entropy_init(&entropy);
	mbedtls_ctr_drbg_init(&drbg);

	int ret = mbedtls_ctr_drbg_seed(&drbg, mbedtls_entropy_func, &entropy, (const unsigned char*)personalization, strlen(personalization));
	int offset = 0;
	while ((ret == 0) && (offset < len))
	{
		int chunk = len - offset;
		if (chunk > MBEDTLS_CTR_DRBG_MAX_REQUEST)
			chunk = MBEDTLS_CTR_DRBG_MAX_REQUEST;
		ret = mbedtls_ctr_drbg_random(&drbg, &buffer[offset], chunk);
		offset += chunk;
	}

	mbedtls_ctr_drbg_free(&drbg);
	mbedtls_entropy_free(&entropy);
	return (ret == 0);
}
}; // namespace Broadlink

#endif // USE_MBEDTLS

#endif // _broadlink_rand
