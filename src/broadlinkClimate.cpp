/*
 *  Client interface for local Broadlink device access
 *
 *  Climate (HVAC) module
 *
 *
 *  Copyright 2024-2026 - broadlinkpp contributors
 *
 *  Licensed under GNU General Public License 3.0 or later.
 *  Some rights reserved. See COPYING, AUTHORS.
 *
 *  @license GPL-3.0+ <https://www.gnu.org/licenses/gpl-3.0.html>
 */

#include "broadlinkClimate.hpp"
#include "broadlinkPacket.hpp"

#include <cmath>
#include <sstream>

#ifdef DEBUG
#include <iostream>
#include <cstdio>
#endif


namespace Broadlink {
  namespace Climate {
    namespace Frame {
      static const uint16_t MAGIC1 = 0x00BB;
      static const uint16_t MAGIC2 = 0x8006;
      static const uint16_t MAGIC3 = 0x0000;
    }; // namespace Frame
  }; // namespace Climate
}; // namespace Broadlink


std::string Broadlink::Climate::EncodeFrame(const Command::value command, const std::string &szData)
{
	uint16_t d_len = (uint16_t)(2 + szData.length());
	uint16_t p_len = (uint16_t)(10 + d_len);

	std::string szFrame(BROADLINK_CLIMATE_FRAME_HEADER_SIZE, '\0');
	unsigned char *cFrame = (unsigned char*)&szFrame[0];
	Packet::put_le16(cFrame, p_len);
	Packet::put_le16(&cFrame[0x02], Frame::MAGIC1);
	Packet::put_le16(&cFrame[0x04], Frame::MAGIC2);
	Packet::put_le16(&cFrame[0x06], Frame::MAGIC3);
	Packet::put_le16(&cFrame[0x08], d_len);
	Packet::put_le16(&cFrame[0x0a], (uint16_t)(0x0100 | (command << 4) | 1));
	szFrame.append(szData);

	unsigned char cChecksum[2];
	Packet::put_le16(cChecksum, Packet::InvertedChecksum((const unsigned char*)&szFrame[2], p_len - 2));
	szFrame.append((char*)cChecksum, 2);
	return szFrame;
}


Broadlink::Error::value Broadlink::Climate::DecodeFrame(const std::string &szFrame, std::string &szData)
{
	szData.clear();
	if (szFrame.length() < BROADLINK_CLIMATE_FRAME_HEADER_SIZE + 2)
		return Error::PROTOCOL_MALFORMED;

	const unsigned char *cFrame = (const unsigned char*)szFrame.data();
	size_t p_len = Packet::get_le16(cFrame);
	size_t d_len = Packet::get_le16(&cFrame[0x08]);
	if ((p_len < BROADLINK_CLIMATE_FRAME_HEADER_SIZE) || (p_len + 2 > szFrame.length()))
		return Error::PROTOCOL_MALFORMED;
	if ((d_len < 2) || (BROADLINK_CLIMATE_FRAME_HEADER_SIZE + d_len - 2 > p_len))
		return Error::PROTOCOL_MALFORMED;

	uint16_t checksum = Packet::get_le16(&cFrame[p_len]);
	if (checksum != Packet::InvertedChecksum(&cFrame[2], (int)p_len - 2))
	{
#ifdef DEBUG
		printf("dbg: climate frame checksum 0x%04x does not match\n", checksum);
#endif
		return Error::CHECKSUM;
	}

	// the two bytes before the data echo the command word
	szData = szFrame.substr(BROADLINK_CLIMATE_FRAME_HEADER_SIZE, d_len - 2);
	return Error::NONE;
}


bool Broadlink::Climate::isValidMode(const int mode)
{
	return ((mode >= Mode::AUTO) && (mode <= Mode::FAN));
}


bool Broadlink::Climate::isValidSpeed(const int speed)
{
	switch (speed)
	{
		case Speed::NONE:
		case Speed::HIGH:
		case Speed::MID:
		case Speed::LOW:
		case Speed::AUTO:
			return true;
		default:
			break;
	}
	return false;
}


bool Broadlink::Climate::isValidPreset(const int preset)
{
	return ((preset >= Preset::NORMAL) && (preset <= Preset::MUTE));
}


bool Broadlink::Climate::isValidSwingH(const int swing)
{
	switch (swing)
	{
		case SwingH::ON:
		case SwingH::OFF:
		case SwingH::LEFT_FIX:
		case SwingH::RIGHT_FLAP:
		case SwingH::RIGHT_FIX:
		case SwingH::LEFT_RIGHT_FIX:
			return true;
		default:
			break;
	}
	return false;
}


bool Broadlink::Climate::isValidSwingV(const int swing)
{
	return (((swing >= SwingV::ON) && (swing <= SwingV::POS5)) || (swing == SwingV::OFF));
}


Broadlink::ClimateState::ClimateState()
{
	m_power = false;
	m_mode = Climate::Mode::AUTO;
	m_speed = Climate::Speed::AUTO;
	m_preset = Climate::Preset::NORMAL;
	m_swing_h = Climate::SwingH::OFF;
	m_swing_v = Climate::SwingV::OFF;
	m_half_degrees = 48;
	m_sleep = false;
	m_ifeel = false;
	m_health = false;
	m_clean = false;
	m_display = false;
	m_mildew = false;
}


Broadlink::Error::value Broadlink::ClimateState::setMode(const Climate::Mode::value mode)
{
	if (!Climate::isValidMode(mode))
		return Error::VALIDATION;
	m_mode = mode;
	return Error::NONE;
}


Broadlink::Error::value Broadlink::ClimateState::setSpeed(const Climate::Speed::value speed)
{
	if (!Climate::isValidSpeed(speed))
		return Error::VALIDATION;
	m_speed = speed;
	return Error::NONE;
}


Broadlink::Error::value Broadlink::ClimateState::setPreset(const Climate::Preset::value preset)
{
	if (!Climate::isValidPreset(preset))
		return Error::VALIDATION;
	m_preset = preset;
	return Error::NONE;
}


Broadlink::Error::value Broadlink::ClimateState::setSwingH(const Climate::SwingH::value swing)
{
	if (!Climate::isValidSwingH(swing))
		return Error::VALIDATION;
	m_swing_h = swing;
	return Error::NONE;
}


Broadlink::Error::value Broadlink::ClimateState::setSwingV(const Climate::SwingV::value swing)
{
	if (!Climate::isValidSwingV(swing))
		return Error::VALIDATION;
	m_swing_v = swing;
	return Error::NONE;
}


Broadlink::Error::value Broadlink::ClimateState::setTargetTemperature(const double temperature)
{
	if (std::isnan(temperature) || (temperature < BROADLINK_CLIMATE_MIN_TEMPERATURE) || (temperature > BROADLINK_CLIMATE_MAX_TEMPERATURE))
		return Error::VALIDATION;
	double halfdegrees = temperature * 2;
	if (halfdegrees != std::floor(halfdegrees))
		return Error::VALIDATION;
	m_half_degrees = (int)halfdegrees;
	return Error::NONE;
}


/* State record layout
 *
 *  b0   target temperature - 8 (5 bits) | vertical swing (3 bits)
 *  b1   horizontal swing (3 bits) | 0x0F
 *  b2   half degree flag (bit 7) | 0x02
 *  b3   fan speed (3 bits)
 *  b4   preset (2 bits)
 *  b5   mode (3 bits) | ifeel (bit 3) | sleep (bit 2)
 *  b8   power (bit 5) | clean (bit 2) | health (bit 1)
 *  b10  display (bit 4) | mildew (bit 3)
 *  b12  0x05
 */
// Byte layout of python-broadlink's hvac class (climate.py): the 0x0F magic
// sits in byte 1 beside the horizontal swing, preset in the top two bits of
// byte 4. This is not the packed-bitfield layout with the magic in byte 2.
std::string Broadlink::ClimateState::Encode() const
{
	std::string szRecord(BROADLINK_CLIMATE_STATE_SIZE, '\0');
	int temperature = m_half_degrees / 2;
	szRecord[0] = (char)(((temperature - 8) << 3) | m_swing_v);
	szRecord[1] = (char)((m_swing_h << 5) | 0x0F);
	szRecord[2] = (char)(((m_half_degrees & 0x01) << 7) | 0x02);
	szRecord[3] = (char)(m_speed << 5);
	szRecord[4] = (char)(m_preset << 6);
	szRecord[5] = (char)((m_mode << 5) | (m_ifeel << 3) | (m_sleep << 2));
	szRecord[8] = (char)((m_power << 5) | (m_clean << 2) | (m_health << 1));
	szRecord[10] = (char)((m_display << 4) | (m_mildew << 3));
	szRecord[12] = 0x05;
	return szRecord;
}


Broadlink::Error::value Broadlink::ClimateState::Decode(const std::string &szRecord, ClimateState &state)
{
	if (szRecord.length() < BROADLINK_CLIMATE_STATE_SIZE)
		return Error::PROTOCOL_MALFORMED;

	const unsigned char *cRecord = (const unsigned char*)szRecord.data();
	int halfdegrees = (((cRecord[0] >> 3) + 8) * 2) + (cRecord[2] >> 7);
	int swing_v = cRecord[0] & 0x07;
	int swing_h = cRecord[1] >> 5;
	int speed = cRecord[3] >> 5;
	int preset = cRecord[4] >> 6;
	int mode = cRecord[5] >> 5;

	if ((halfdegrees < BROADLINK_CLIMATE_MIN_TEMPERATURE * 2) || (halfdegrees > BROADLINK_CLIMATE_MAX_TEMPERATURE * 2) ||
	    !Climate::isValidSwingV(swing_v) || !Climate::isValidSwingH(swing_h) || !Climate::isValidSpeed(speed) ||
	    !Climate::isValidPreset(preset) || !Climate::isValidMode(mode))
	{
#ifdef DEBUG
		std::cout << "dbg: climate state record out of range\n";
#endif
		return Error::PROTOCOL_MALFORMED;
	}

	ClimateState decoded;
	decoded.m_half_degrees = halfdegrees;
	decoded.m_swing_v = (Climate::SwingV::value)swing_v;
	decoded.m_swing_h = (Climate::SwingH::value)swing_h;
	decoded.m_speed = (Climate::Speed::value)speed;
	decoded.m_preset = (Climate::Preset::value)preset;
	decoded.m_mode = (Climate::Mode::value)mode;
	decoded.m_ifeel = ((cRecord[5] >> 3) & 0x01);
	decoded.m_sleep = ((cRecord[5] >> 2) & 0x01);
	decoded.m_power = ((cRecord[8] >> 5) & 0x01);
	decoded.m_clean = ((cRecord[8] >> 2) & 0x01);
	decoded.m_health = ((cRecord[8] >> 1) & 0x01);
	decoded.m_display = ((cRecord[10] >> 4) & 0x01);
	decoded.m_mildew = ((cRecord[10] >> 3) & 0x01);
	state = decoded;
	return Error::NONE;
}


bool Broadlink::ClimateState::operator==(const ClimateState &other) const
{
	return ((m_power == other.m_power) && (m_mode == other.m_mode) && (m_speed == other.m_speed) &&
		(m_preset == other.m_preset) && (m_swing_h == other.m_swing_h) && (m_swing_v == other.m_swing_v) &&
		(m_half_degrees == other.m_half_degrees) && (m_sleep == other.m_sleep) && (m_ifeel == other.m_ifeel) &&
		(m_health == other.m_health) && (m_clean == other.m_clean) && (m_display == other.m_display) &&
		(m_mildew == other.m_mildew));
}


std::string Broadlink::ClimateState::ToString() const
{
	static const char* MODES[] = { "auto", "cool", "dry", "heat", "fan" };
	static const char* PRESETS[] = { "normal", "turbo", "mute" };
	std::stringstream ss;
	ss << "power = " << (m_power ? "on" : "off");
	ss << ", mode = " << MODES[m_mode];
	ss << ", target = " << getTargetTemperature();
	ss << ", speed = " << (int)m_speed;
	ss << ", preset = " << PRESETS[m_preset];
	ss << ", swing h/v = " << (int)m_swing_h << "/" << (int)m_swing_v;
	ss << ", sleep = " << m_sleep << ", ifeel = " << m_ifeel << ", health = " << m_health;
	ss << ", clean = " << m_clean << ", display = " << m_display << ", mildew = " << m_mildew;
	return ss.str();
}


/* Info record
 *
 *  b1   power (bit 0)
 *  b5   ambient temperature, integer part (5 bits)
 *  b21  ambient temperature, tenths (5 bits)
 */
Broadlink::Error::value Broadlink::ClimateInfo::Decode(const std::string &szRecord, ClimateInfo &info)
{
	if (szRecord.length() < BROADLINK_CLIMATE_INFO_SIZE)
		return Error::PROTOCOL_MALFORMED;

	const unsigned char *cRecord = (const unsigned char*)szRecord.data();
	info.power = (cRecord[1] & 0x01);
	info.ambient_temperature = (cRecord[5] & 0x1F) + (cRecord[21] & 0x1F) / 10.0;
	return Error::NONE;
}


broadlinkClimate::broadlinkClimate(const Broadlink::DeviceInfo &info, broadlinkTransport *transport) : broadlinkDevice(info, transport)
{
	m_family = Broadlink::Family::CLIMATE;
}


Broadlink::Error::value broadlinkClimate::SendClimateCommand(const Broadlink::Climate::Command::value command, const std::string &szData, std::string &szResult)
{
	std::string szResponse;
	Broadlink::Error::value result = SendCommand(Broadlink::Climate::EncodeFrame(command, szData), szResponse);
	if (result != Broadlink::Error::NONE)
		return result;
	return Broadlink::Climate::DecodeFrame(szResponse, szResult);
}


Broadlink::Error::value broadlinkClimate::GetState(Broadlink::ClimateState &state)
{
	std::string szRecord;
	Broadlink::Error::value result = SendClimateCommand(Broadlink::Climate::Command::GET_STATE, "", szRecord);
	if (result != Broadlink::Error::NONE)
		return result;
	return Broadlink::ClimateState::Decode(szRecord, state);
}


Broadlink::Error::value broadlinkClimate::SetState(const Broadlink::ClimateState &state)
{
	std::string szRecord;
	return SendClimateCommand(Broadlink::Climate::Command::SET_STATE, state.Encode(), szRecord);
}


Broadlink::Error::value broadlinkClimate::GetInfo(Broadlink::ClimateInfo &info)
{
	std::string szRecord;
	Broadlink::Error::value result = SendClimateCommand(Broadlink::Climate::Command::GET_INFO, "", szRecord);
	if (result != Broadlink::Error::NONE)
		return result;
	return Broadlink::ClimateInfo::Decode(szRecord, info);
}
