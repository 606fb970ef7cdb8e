/*
 *  Client interface for local Broadlink device access
 *
 *  Climate (HVAC) module
 *
 *  Air conditioners with a Broadlink module wrap their commands in an
 *  inner frame that carries its own length fields and checksum:
 *
 *    u16 p_len | 0x00BB | 0x8006 | 0x0000 | u16 d_len | u16 command | data | u16 checksum
 *
 *
 *  Copyright 2024-2026 - broadlinkpp contributors
 *
 *  Licensed under GNU General Public License 3.0 or later.
 *  Some rights reserved. See COPYING, AUTHORS.
 *
 *  @license GPL-3.0+ <https://www.gnu.org/licenses/gpl-3.0.html>
 */


#ifndef _broadlinkClimate
#define _broadlinkClimate

#define BROADLINK_CLIMATE_FRAME_HEADER_SIZE 0x0C
#define BROADLINK_CLIMATE_STATE_SIZE 13
#define BROADLINK_CLIMATE_INFO_SIZE 22

#define BROADLINK_CLIMATE_MIN_TEMPERATURE 16.0
#define BROADLINK_CLIMATE_MAX_TEMPERATURE 32.0

#include "broadlinkDevice.hpp"

#include <string>
#include <cstdint>


namespace Broadlink {
  namespace Climate {
    namespace Command {
      enum value {
        SET_STATE = 0,
        GET_STATE = 1,
        GET_INFO = 2
      }; // enum value
    }; // namespace Command

    namespace Mode {
      enum value {
        AUTO = 0,
        COOL = 1,
        DRY = 2,
        HEAT = 3,
        FAN = 4
      }; // enum value
    }; // namespace Mode

    namespace Speed {
      enum value {
        NONE = 0,
        HIGH = 1,
        MID = 2,
        LOW = 3,
        AUTO = 5
      }; // enum value
    }; // namespace Speed

    namespace Preset {
      enum value {
        NORMAL = 0,
        TURBO = 1,
        MUTE = 2
      }; // enum value
    }; // namespace Preset

    namespace SwingH {
      enum value {
        ON = 0,
        OFF = 1,
        LEFT_FIX = 2,
        RIGHT_FLAP = 5,
        RIGHT_FIX = 6,
        LEFT_RIGHT_FIX = 7
      }; // enum value
    }; // namespace SwingH

    namespace SwingV {
      enum value {
        ON = 0,
        POS1 = 1,
        POS2 = 2,
        POS3 = 3,
        POS4 = 4,
        POS5 = 5,
        OFF = 7
      }; // enum value
    }; // namespace SwingV

    std::string EncodeFrame(const Command::value command, const std::string &szData);
    // Trailing bytes past the checksum (cipher zero fill) are ignored
    Error::value DecodeFrame(const std::string &szFrame, std::string &szData);

    bool isValidMode(const int mode);
    bool isValidSpeed(const int speed);
    bool isValidPreset(const int preset);
    bool isValidSwingH(const int swing);
    bool isValidSwingV(const int swing);
  }; // namespace Climate


  class ClimateState
  {

  public:
	ClimateState();

	bool getPower() const { return m_power; }
	Climate::Mode::value getMode() const { return m_mode; }
	Climate::Speed::value getSpeed() const { return m_speed; }
	Climate::Preset::value getPreset() const { return m_preset; }
	Climate::SwingH::value getSwingH() const { return m_swing_h; }
	Climate::SwingV::value getSwingV() const { return m_swing_v; }
	double getTargetTemperature() const { return m_half_degrees / 2.0; }
	bool getSleep() const { return m_sleep; }
	bool getIFeel() const { return m_ifeel; }
	bool getHealth() const { return m_health; }
	bool getClean() const { return m_clean; }
	bool getDisplay() const { return m_display; }
	bool getMildew() const { return m_mildew; }

	// Setters leave the record untouched when they return VALIDATION
	void setPower(const bool power) { m_power = power; }
	Error::value setMode(const Climate::Mode::value mode);
	Error::value setSpeed(const Climate::Speed::value speed);
	Error::value setPreset(const Climate::Preset::value preset);
	Error::value setSwingH(const Climate::SwingH::value swing);
	Error::value setSwingV(const Climate::SwingV::value swing);
	Error::value setTargetTemperature(const double temperature);
	void setSleep(const bool enabled) { m_sleep = enabled; }
	void setIFeel(const bool enabled) { m_ifeel = enabled; }
	void setHealth(const bool enabled) { m_health = enabled; }
	void setClean(const bool enabled) { m_clean = enabled; }
	void setDisplay(const bool enabled) { m_display = enabled; }
	void setMildew(const bool enabled) { m_mildew = enabled; }

	std::string Encode() const;
	static Error::value Decode(const std::string &szRecord, ClimateState &state);

	std::string ToString() const;
	bool operator==(const ClimateState &other) const;
	bool operator!=(const ClimateState &other) const { return !(*this == other); }

  private:
	bool m_power;
	Climate::Mode::value m_mode;
	Climate::Speed::value m_speed;
	Climate::Preset::value m_preset;
	Climate::SwingH::value m_swing_h;
	Climate::SwingV::value m_swing_v;
	int m_half_degrees;
	bool m_sleep;
	bool m_ifeel;
	bool m_health;
	bool m_clean;
	bool m_display;
	bool m_mildew;
  };


  struct ClimateInfo {
    bool power;
    double ambient_temperature;

    ClimateInfo() : power(false), ambient_temperature(0) {}
    static Error::value Decode(const std::string &szRecord, ClimateInfo &info);
  };

}; // namespace Broadlink


class broadlinkClimate : public broadlinkDevice
{

public:
	broadlinkClimate(const Broadlink::DeviceInfo &info, broadlinkTransport *transport = nullptr);

	Broadlink::Error::value GetState(Broadlink::ClimateState &state);
	// The wire format has no partial update, the complete record is always sent
	Broadlink::Error::value SetState(const Broadlink::ClimateState &state);
	Broadlink::Error::value GetInfo(Broadlink::ClimateInfo &info);

private:
	Broadlink::Error::value SendClimateCommand(const Broadlink::Climate::Command::value command, const std::string &szData, std::string &szResult);
};

#endif // _broadlinkClimate
