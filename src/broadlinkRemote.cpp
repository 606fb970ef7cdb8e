/*
 *  Client interface for local Broadlink device access
 *
 *  IR/RF remote module
 *
 *
 *  Copyright 2024-2026 - broadlinkpp contributors
 *
 *  Licensed under GNU General Public License 3.0 or later.
 *  Some rights reserved. See COPYING, AUTHORS.
 *
 *  @license GPL-3.0+ <https://www.gnu.org/licenses/gpl-3.0.html>
 */

#include "broadlinkRemote.hpp"
#include "broadlinkPacket.hpp"

#include <chrono>
#include <thread>

#ifdef DEBUG
#include <iostream>
#endif


/* Remote payload framing
 *
 *  RM4:     u16 length (data + 4) | u32 command | data
 *  legacy:  u32 command | data
 */
std::string Broadlink::Remote::EncodePayload(const bool rm4, const uint32_t command, const std::string &szData)
{
	std::string szPayload;
	unsigned char cHeader[6];
	int headersize = 0;
	if (rm4)
	{
		Packet::put_le16(cHeader, (uint16_t)(szData.length() + 4));
		headersize = 2;
	}
	Packet::put_le32(&cHeader[headersize], command);
	headersize += 4;
	szPayload.append((char*)cHeader, headersize);
	szPayload.append(szData);
	return szPayload;
}


Broadlink::Error::value Broadlink::Remote::DecodePayload(const bool rm4, const std::string &szResponse, std::string &szData)
{
	szData.clear();
	if (!rm4)
	{
		if (szResponse.length() > 4)
			szData = szResponse.substr(4);
		return Error::NONE;
	}

	// devices without data reply with a few bytes of filler
	if (szResponse.length() < 6)
		return Error::NONE;

	size_t endpos = (size_t)Packet::get_le16((const unsigned char*)szResponse.data()) + 2;
	if (endpos <= 6)
		return Error::NONE;
	if (endpos > szResponse.length())
		return Error::PROTOCOL_MALFORMED;
	szData = szResponse.substr(6, endpos - 6);
	return Error::NONE;
}


Broadlink::Remote::CodeKind::value Broadlink::LearnedCode::kind() const
{
	if (m_bytes.empty())
		return Remote::CodeKind::UNKNOWN;
	switch ((unsigned char)m_bytes[0])
	{
		case 0x26:
			return Remote::CodeKind::IR;
		case 0xB2:
			return Remote::CodeKind::RF433;
		case 0xD7:
			return Remote::CodeKind::RF315;
		default:
			break;
	}
	return Remote::CodeKind::UNKNOWN;
}


std::string Broadlink::LearnedCode::ToHex() const
{
	static const char HEXDIGITS[] = "0123456789abcdef";
	std::string szHex;
	szHex.reserve(m_bytes.length() * 2);
	for (size_t i = 0; i < m_bytes.length(); i++)
	{
		unsigned char c = (unsigned char)m_bytes[i];
		szHex.append(1, HEXDIGITS[c >> 4]);
		szHex.append(1, HEXDIGITS[c & 0x0F]);
	}
	return szHex;
}


static int hexvalue(const char c)
{
	if ((c >= '0') && (c <= '9'))
		return c - '0';
	if ((c >= 'a') && (c <= 'f'))
		return c - 'a' + 10;
	if ((c >= 'A') && (c <= 'F'))
		return c - 'A' + 10;
	return -1;
}


bool Broadlink::LearnedCode::FromHex(const std::string &szHex, LearnedCode &code)
{
	if (szHex.length() & 0x1)
		return false;
	std::string szBytes;
	szBytes.reserve(szHex.length() / 2);
	for (size_t i = 0; i < szHex.length(); i += 2)
	{
		int high = hexvalue(szHex[i]);
		int low = hexvalue(szHex[i + 1]);
		if ((high < 0) || (low < 0))
			return false;
		szBytes.append(1, (char)((high << 4) | low));
	}
	code = LearnedCode(szBytes);
	return true;
}


broadlinkRemote::broadlinkRemote(const Broadlink::DeviceInfo &info, broadlinkTransport *transport) : broadlinkDevice(info, transport)
{
	m_family = Broadlink::Family::REMOTE;
	const Broadlink::Model *model = Broadlink::LookupModel(info.devtype);
	m_rm4 = (model && model->rm4);
	m_learn_attempts = BROADLINK_LEARN_ATTEMPTS;
	m_learn_interval = BROADLINK_LEARN_INTERVAL_MS;
}


void broadlinkRemote::setLearnTimeout(const int attempts, const int interval_ms)
{
	m_learn_attempts = (attempts > 0) ? attempts : 1;
	m_learn_interval = (interval_ms > 0) ? interval_ms : 0;
}


void broadlinkRemote::Wait()
{
	if (m_learn_interval > 0)
		std::this_thread::sleep_for(std::chrono::milliseconds(m_learn_interval));
}


Broadlink::Error::value broadlinkRemote::SendRemoteCommand(const uint32_t command, const std::string &szData, std::string &szResult)
{
	std::string szResponse;
	Broadlink::Error::value result = SendCommand(Broadlink::Remote::EncodePayload(m_rm4, command, szData), szResponse);
	if (result != Broadlink::Error::NONE)
		return result;
	return Broadlink::Remote::DecodePayload(m_rm4, szResponse, szResult);
}


Broadlink::Error::value broadlinkRemote::EnterLearningMode()
{
	std::string szResult;
	return SendRemoteCommand(Broadlink::Remote::Command::ENTER_LEARNING, "", szResult);
}


Broadlink::Error::value broadlinkRemote::CheckLearnedCode(Broadlink::LearnedCode &code, bool &captured)
{
	captured = false;
	std::string szResult;
	Broadlink::Error::value result = SendRemoteCommand(Broadlink::Remote::Command::CHECK_DATA, "", szResult);
	if (result == Broadlink::Error::PROTOCOL_DEVICE_REJECTED)
	{
		if ((m_lasterror == BROADLINK_STATUS_STORAGE_ERROR) || (m_lasterror == BROADLINK_STATUS_READ_ERROR))
			return Broadlink::Error::NONE;
	}
	if (result != Broadlink::Error::NONE)
		return result;

	// legacy replies are not length prefixed, zero fill is all we get without a code
	if (szResult.find_first_not_of('\0') == std::string::npos)
		return Broadlink::Error::NONE;

	code = Broadlink::LearnedCode(szResult);
	captured = true;
	return Broadlink::Error::NONE;
}


Broadlink::Error::value broadlinkRemote::PollLearnedCode(Broadlink::LearnedCode &code)
{
	for (int attempt = 0; attempt < m_learn_attempts; attempt++)
	{
		Wait();
		bool captured = false;
		Broadlink::Error::value result = CheckLearnedCode(code, captured);
		if (result != Broadlink::Error::NONE)
			return result;
		if (captured)
			return Broadlink::Error::NONE;
#ifdef DEBUG
		std::cout << "dbg: no code captured yet (attempt " << attempt + 1 << " of " << m_learn_attempts << ")\n";
#endif
	}
	return Broadlink::Error::PROTOCOL_TIMEOUT;
}


Broadlink::Error::value broadlinkRemote::LearnIR(Broadlink::LearnedCode &code)
{
	Broadlink::Error::value result = EnterLearningMode();
	if (result != Broadlink::Error::NONE)
		return result;
	return PollLearnedCode(code);
}


Broadlink::Error::value broadlinkRemote::LearnRF(Broadlink::LearnedCode &code)
{
	std::string szResult;
	Broadlink::Error::value result = SendRemoteCommand(Broadlink::Remote::Command::SWEEP_FREQUENCY, "", szResult);
	if (result != Broadlink::Error::NONE)
		return result;

	bool locked = false;
	for (int attempt = 0; attempt < m_learn_attempts; attempt++)
	{
		Wait();
		result = SendRemoteCommand(Broadlink::Remote::Command::CHECK_FREQUENCY, "", szResult);
		if (result != Broadlink::Error::NONE)
			return result;
		if (!szResult.empty() && (szResult[0] == 1))
		{
			locked = true;
			break;
		}
	}

	if (!locked)
	{
		// leave the device in its normal state; a silent device still reports the timeout
		result = SendRemoteCommand(Broadlink::Remote::Command::CANCEL_SWEEP, "", szResult);
#ifdef DEBUG
		std::cout << "dbg: frequency sweep timed out, cancel returned " << Broadlink::ErrorString(result) << "\n";
#endif
		if ((result != Broadlink::Error::NONE) && (result != Broadlink::Error::TRANSPORT_TIMEOUT))
			return result;
		return Broadlink::Error::PROTOCOL_TIMEOUT;
	}

	result = SendRemoteCommand(Broadlink::Remote::Command::FIND_RF_PACKET, "", szResult);
	if (result != Broadlink::Error::NONE)
		return result;
	return PollLearnedCode(code);
}


Broadlink::Error::value broadlinkRemote::SendCode(const Broadlink::LearnedCode &code)
{
	if (code.empty())
		return Broadlink::Error::VALIDATION;
	std::string szResult;
	return SendRemoteCommand(Broadlink::Remote::Command::SEND_DATA, code.bytes(), szResult);
}
