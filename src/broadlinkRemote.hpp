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


#ifndef _broadlinkRemote
#define _broadlinkRemote

#ifndef BROADLINK_LEARN_ATTEMPTS
#define BROADLINK_LEARN_ATTEMPTS 10
#endif

#ifndef BROADLINK_LEARN_INTERVAL_MS
#define BROADLINK_LEARN_INTERVAL_MS 3000
#endif

// device status codes that mean the capture buffer is still empty
#define BROADLINK_STATUS_STORAGE_ERROR -5
#define BROADLINK_STATUS_READ_ERROR -10

#include "broadlinkDevice.hpp"

#include <string>
#include <cstdint>


namespace Broadlink {
  namespace Remote {
    namespace Command {
      enum value {
        SEND_DATA = 0x02,
        ENTER_LEARNING = 0x03,
        CHECK_DATA = 0x04,
        SWEEP_FREQUENCY = 0x19,
        CHECK_FREQUENCY = 0x1A,
        FIND_RF_PACKET = 0x1B,
        CANCEL_SWEEP = 0x1E
      }; // enum value
    }; // namespace Command

    namespace CodeKind {
      enum value {
        UNKNOWN,
        IR,
        RF433,
        RF315
      }; // enum value
    }; // namespace CodeKind

    std::string EncodePayload(const bool rm4, const uint32_t command, const std::string &szData);
    Error::value DecodePayload(const bool rm4, const std::string &szResponse, std::string &szData);
  }; // namespace Remote


  class LearnedCode
  {

  public:
	LearnedCode() {}
	explicit LearnedCode(const std::string &bytes) : m_bytes(bytes) {}

	const std::string& bytes() const { return m_bytes; }
	bool empty() const { return m_bytes.empty(); }
	size_t size() const { return m_bytes.size(); }
	Remote::CodeKind::value kind() const;

	std::string ToHex() const;
	// Returns false on odd length or non hex characters
	static bool FromHex(const std::string &szHex, LearnedCode &code);

  private:
	std::string m_bytes;
  };

}; // namespace Broadlink


class broadlinkRemote : public broadlinkDevice
{

public:
	broadlinkRemote(const Broadlink::DeviceInfo &info, broadlinkTransport *transport = nullptr);

	bool isRM4() const { return m_rm4; }
	void setLearnTimeout(const int attempts, const int interval_ms);

	Broadlink::Error::value EnterLearningMode();
	Broadlink::Error::value CheckLearnedCode(Broadlink::LearnedCode &code, bool &captured);
	Broadlink::Error::value LearnIR(Broadlink::LearnedCode &code);
	Broadlink::Error::value LearnRF(Broadlink::LearnedCode &code);
	Broadlink::Error::value SendCode(const Broadlink::LearnedCode &code);

private:
	Broadlink::Error::value SendRemoteCommand(const uint32_t command, const std::string &szData, std::string &szResult);
	Broadlink::Error::value PollLearnedCode(Broadlink::LearnedCode &code);
	void Wait();

	bool m_rm4;
	int m_learn_attempts;
	int m_learn_interval;
};

#endif // _broadlinkRemote
