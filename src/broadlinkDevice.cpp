/*
 *  Client interface for local Broadlink device access
 *
 *  Broadlink device base class
 *
 *
 *  Copyright 2024-2026 - broadlinkpp contributors
 *
 *  Licensed under GNU General Public License 3.0 or later.
 *  Some rights reserved. See COPYING, AUTHORS.
 *
 *  @license GPL-3.0+ <https://www.gnu.org/licenses/gpl-3.0.html>
 */

#include "broadlinkDevice.hpp"
#include "broadlinkRemote.hpp"
#include "broadlinkClimate.hpp"
#include "broadlinkPacket.hpp"
#include "broadlinkUDP.hpp"
#include <cstring>
#include <sstream>
#include "crypt/rand.hpp"

#ifdef DEBUG
#include <iostream>
#endif


namespace Broadlink {
  namespace Models {
    static const Model TABLE[] = {
      // RM mini and RM pro, legacy framing
      { 0x2712, Family::REMOTE, false, "RM pro/pro+" },
      { 0x272A, Family::REMOTE, false, "RM pro" },
      { 0x2737, Family::REMOTE, false, "RM mini 3" },
      { 0x273D, Family::REMOTE, false, "RM pro" },
      { 0x277C, Family::REMOTE, false, "RM home" },
      { 0x2783, Family::REMOTE, false, "RM home" },
      { 0x2787, Family::REMOTE, false, "RM pro" },
      { 0x278B, Family::REMOTE, false, "RM plus" },
      { 0x278F, Family::REMOTE, false, "RM mini" },
      { 0x2797, Family::REMOTE, false, "RM pro+" },
      { 0x279D, Family::REMOTE, false, "RM pro+" },
      { 0x27A1, Family::REMOTE, false, "RM plus" },
      { 0x27A6, Family::REMOTE, false, "RM plus" },
      { 0x27A9, Family::REMOTE, false, "RM pro+" },
      { 0x27C2, Family::REMOTE, false, "RM mini 3" },
      { 0x27C3, Family::REMOTE, false, "RM pro+" },
      { 0x27C7, Family::REMOTE, false, "RM mini 3" },
      { 0x27CC, Family::REMOTE, false, "RM mini 3" },
      { 0x27CD, Family::REMOTE, false, "RM mini 3" },
      { 0x27D0, Family::REMOTE, false, "RM mini 3" },
      { 0x27D1, Family::REMOTE, false, "RM mini 3" },
      { 0x27D3, Family::REMOTE, false, "RM mini 3" },
      { 0x27DC, Family::REMOTE, false, "RM mini 3" },
      { 0x27DE, Family::REMOTE, false, "RM mini 3" },
      // RM4 family, length prefixed framing
      { 0x51DA, Family::REMOTE, true, "RM4 mini" },
      { 0x5209, Family::REMOTE, true, "RM4 TV mate" },
      { 0x520C, Family::REMOTE, true, "RM4 mini" },
      { 0x520D, Family::REMOTE, true, "RM4C mini" },
      { 0x5211, Family::REMOTE, true, "RM4C mate" },
      { 0x5212, Family::REMOTE, true, "RM4 TV mate" },
      { 0x5213, Family::REMOTE, true, "RM4 pro" },
      { 0x5216, Family::REMOTE, true, "RM4 mini" },
      { 0x5218, Family::REMOTE, true, "RM4C pro" },
      { 0x521C, Family::REMOTE, true, "RM4 mini" },
      { 0x5F36, Family::REMOTE, true, "RM mini 3" },
      { 0x6026, Family::REMOTE, true, "RM4 pro" },
      { 0x6070, Family::REMOTE, true, "RM4C mini" },
      { 0x610E, Family::REMOTE, true, "RM4 mini" },
      { 0x610F, Family::REMOTE, true, "RM4C mini" },
      { 0x6184, Family::REMOTE, true, "RMC4 pro" },
      { 0x61A2, Family::REMOTE, true, "RM4 pro" },
      { 0x62BC, Family::REMOTE, true, "RM4 mini" },
      { 0x62BE, Family::REMOTE, true, "RM4C mini" },
      { 0x6364, Family::REMOTE, true, "RM4S" },
      { 0x648D, Family::REMOTE, true, "RM4 mini" },
      { 0x649B, Family::REMOTE, true, "RM4 pro" },
      { 0x6539, Family::REMOTE, true, "RM4C mini" },
      { 0x653A, Family::REMOTE, true, "RM4 mini" },
      { 0x653C, Family::REMOTE, true, "RM4 pro" },
      // air conditioners
      { 0x4E2A, Family::CLIMATE, false, "Licensed manufacturer" }
    };
  }; // namespace Models
}; // namespace Broadlink


const Broadlink::Model* Broadlink::LookupModel(const uint16_t devtype)
{
	for (size_t i = 0; i < sizeof(Models::TABLE) / sizeof(Models::TABLE[0]); i++)
	{
		if (Models::TABLE[i].devtype == devtype)
			return &Models::TABLE[i];
	}
	return nullptr;
}


broadlinkDevice::broadlinkDevice(const Broadlink::DeviceInfo &info, broadlinkTransport *transport)
{
	m_info = info;
	m_family = Broadlink::Family::GENERIC;
	m_lasterror = 0;
	m_session_id = 0;
	m_authenticated = false;

	unsigned char cCount[2];
	if (Broadlink::random_bytes(cCount, 2))
		m_count = (uint16_t)(cCount[0] + (cCount[1] << 8)) | 0x8000;
	else
		m_count = 0x8000;

	m_transport = transport;
	m_ownTransport = false;
	if (!m_transport)
	{
		m_transport = new broadlinkUDP();
		m_ownTransport = true;
	}
}


broadlinkDevice::~broadlinkDevice()
{
	if (m_ownTransport)
		delete m_transport;
}


broadlinkDevice* broadlinkDevice::create(const Broadlink::DeviceInfo &info, broadlinkTransport *transport)
{
	switch (Classify(info.devtype))
	{
		case Broadlink::Family::REMOTE:
			return new broadlinkRemote(info, transport);
		case Broadlink::Family::CLIMATE:
			return new broadlinkClimate(info, transport);
		default:
			break;
	}
	return new broadlinkDevice(info, transport);
}


Broadlink::Family::value broadlinkDevice::Classify(const uint16_t devtype)
{
	const Broadlink::Model *model = Broadlink::LookupModel(devtype);
	if (!model)
		return Broadlink::Family::GENERIC;
	return model->family;
}


std::string broadlinkDevice::ModelName(const uint16_t devtype)
{
	const Broadlink::Model *model = Broadlink::LookupModel(devtype);
	if (!model)
		return "Unknown";
	return model->name;
}


std::string broadlinkDevice::ToString() const
{
	std::stringstream ss;
	ss << m_info.name << " [";
	switch (m_family)
	{
		case Broadlink::Family::REMOTE:
			ss << "Remote";
			break;
		case Broadlink::Family::CLIMATE:
			ss << "HVAC";
			break;
		default:
			ss << "Generic";
			break;
	}
	ss << " " << ModelName(m_info.devtype) << " 0x" << std::hex << m_info.devtype << std::dec << "]";
	ss << " (address = " << m_info.address << ", mac = " << Broadlink::FormatMAC(m_info.mac);
	ss << ", locked? = " << (m_info.locked ? "true" : "false") << ")";
	return ss.str();
}


std::string broadlinkDevice::BuildAuthenticationPayload(const std::string &szName)
{
	std::string szPayload(BROADLINK_AUTH_PAYLOAD_SIZE, '\0');
	// client identifier, the vendor app sends the phone's IMEI here
	szPayload.replace(0x04, 16, 16, '1');
	szPayload[0x1e] = 0x01;
	szPayload[0x2d] = 0x01;
	size_t namesize = szName.length();
	if (namesize > 0x20)
		namesize = 0x20;
	szPayload.replace(0x30, namesize, szName, 0, namesize);
	return szPayload;
}


Broadlink::Error::value broadlinkDevice::Authenticate()
{
	broadlinkCipher defaultCipher;
	std::string szResponse;
	Broadlink::Error::value result = Exchange(BROADLINK_AUTH, BuildAuthenticationPayload(m_info.name), defaultCipher, 0, szResponse);
	switch (result)
	{
		case Broadlink::Error::NONE:
			break;
		case Broadlink::Error::TRANSPORT_TIMEOUT:
		case Broadlink::Error::TRANSPORT_IO:
			return result;
		default:
#ifdef DEBUG
			std::cout << "dbg: authentication failed: " << Broadlink::ErrorString(result) << "\n";
#endif
			return Broadlink::Error::AUTH_HANDSHAKE_FAILED;
	}

	if (szResponse.length() < BROADLINK_AUTH_RESPONSE_SIZE)
		return Broadlink::Error::AUTH_HANDSHAKE_FAILED;

	const unsigned char *cResponse = (const unsigned char*)szResponse.data();
	m_session_id = Broadlink::Packet::get_le32(cResponse);
	m_cipher = broadlinkCipher(&cResponse[0x04], defaultCipher.getIV());
	m_authenticated = true;
	return Broadlink::Error::NONE;
}


Broadlink::Error::value broadlinkDevice::SendCommand(const std::string &szPayload, std::string &szResponse)
{
	if (!m_authenticated)
		return Broadlink::Error::AUTH_NOT_AUTHENTICATED;
	return Exchange(BROADLINK_COMMAND, szPayload, m_cipher, m_session_id, szResponse);
}


Broadlink::Error::value broadlinkDevice::Exchange(const uint16_t command, const std::string &szPayload, const broadlinkCipher &cipher, const uint32_t id, std::string &szResponse)
{
	szResponse.clear();
	m_lasterror = 0;

	Broadlink::Header header;
	header.status = 0;
	header.devtype = m_info.devtype;
	header.command = command;
	m_count = (uint16_t)((m_count + 1) | 0x8000);
	header.count = m_count;
	memcpy(header.mac, m_info.mac, 6);
	header.id = id;
	header.payload_checksum = Broadlink::Packet::ComputeChecksum((const unsigned char*)szPayload.data(), (int)szPayload.length());

	std::string szEncrypted;
	Broadlink::Error::value result = cipher.Encrypt(szPayload, szEncrypted);
	if (result != Broadlink::Error::NONE)
		return result;

	unsigned char cMessageBuffer[BROADLINK_MAX_PACKET_SIZE];
	int buffersize = Broadlink::Packet::BuildPacket(cMessageBuffer, BROADLINK_MAX_PACKET_SIZE, header, szEncrypted);
	if (buffersize < 0)
		return Broadlink::Error::VALIDATION;

	unsigned char cResponseBuffer[BROADLINK_MAX_PACKET_SIZE];
	int numbytes = 0;
	result = m_transport->SendAndReceive(m_info.address, m_info.port, cMessageBuffer, buffersize, cResponseBuffer, BROADLINK_MAX_PACKET_SIZE, &numbytes);
	if (result != Broadlink::Error::NONE)
		return result;

	Broadlink::Header reply;
	result = Broadlink::Packet::ValidateAndStrip(cResponseBuffer, numbytes, reply, szEncrypted);
	if (result != Broadlink::Error::NONE)
		return result;

	m_lasterror = reply.status;
	if (reply.status != 0)
	{
#ifdef DEBUG
		std::cout << "{\"msg\":\"device returned error " << reply.status << "\"}\n";
#endif
		return Broadlink::Error::PROTOCOL_DEVICE_REJECTED;
	}

	result = cipher.Decrypt(szEncrypted, szResponse);
	if (result != Broadlink::Error::NONE)
		return result;

	// decryption under a stale key still yields whole blocks, only the plaintext checksum tells
	if (Broadlink::Packet::ComputeChecksum((const unsigned char*)szResponse.data(), (int)szResponse.length()) != reply.payload_checksum)
	{
#ifdef DEBUG
		std::cout << "{\"msg\":\"payload checksum mismatch\"}\n";
#endif
		szResponse.clear();
		return Broadlink::Error::CRYPTO;
	}
	return Broadlink::Error::NONE;
}
