#include <cassert>
#include <cstring>
#include <iostream>
#include <string>

#include "broadlinkClimate.hpp"
#include "broadlinkPacket.hpp"
#include "fake_device.hpp"

using namespace Broadlink;

static std::string bytes(const unsigned char *data, const size_t size) {
    return std::string((const char*)data, size);
}

static DeviceInfo make_info() {
    DeviceInfo info;
    info.address = "192.168.1.50";
    info.devtype = 0x4E2A;
    info.name = "Bedroom AC";
    return info;
}

// cool, 22.5 degrees, high fan, turbo, swing pos3/left fix, sleep, health, display
static ClimateState make_state() {
    ClimateState state;
    state.setPower(true);
    assert(state.setMode(Climate::Mode::COOL) == Error::NONE);
    assert(state.setSpeed(Climate::Speed::HIGH) == Error::NONE);
    assert(state.setPreset(Climate::Preset::TURBO) == Error::NONE);
    assert(state.setSwingH(Climate::SwingH::LEFT_FIX) == Error::NONE);
    assert(state.setSwingV(Climate::SwingV::POS3) == Error::NONE);
    assert(state.setTargetTemperature(22.5) == Error::NONE);
    state.setSleep(true);
    state.setHealth(true);
    state.setDisplay(true);
    return state;
}

static const unsigned char STATE_RECORD[13] = {
    0x73, 0x4F, 0x82, 0x20, 0x40, 0x24, 0x00, 0x00, 0x22, 0x00, 0x10, 0x00, 0x05
};

void test_frame() {
    std::cout << "Testing inner frame...\n";

    {
        const unsigned char expected[14] = { 12, 0, 187, 0, 6, 128, 0, 0, 2, 0, 17, 1, 43, 126 };
        assert(Climate::EncodeFrame(Climate::Command::GET_STATE, "") == bytes(expected, 14));
        std::cout << "  ✓ Get state request\n";
    }

    {
        std::string szFrame = Climate::EncodeFrame(Climate::Command::SET_STATE, bytes(STATE_RECORD, 13));
        assert(szFrame.length() == 12 + 13 + 2);
        assert(Packet::get_le16((const unsigned char*)szFrame.data()) == 25);
        assert(Packet::get_le16((const unsigned char*)szFrame.data() + 8) == 15);
        assert(Packet::get_le16((const unsigned char*)szFrame.data() + 10) == 0x0101);
        assert(Packet::get_le16((const unsigned char*)szFrame.data() + 25) == Packet::InvertedChecksum((const unsigned char*)szFrame.data() + 2, 23));

        // decoding ignores the cipher zero fill
        szFrame.append(5, '\0');
        std::string szData;
        assert(Climate::DecodeFrame(szFrame, szData) == Error::NONE);
        assert(szData == bytes(STATE_RECORD, 13));
        std::cout << "  ✓ Set state request and decode\n";
    }

    {
        std::string szData;
        std::string szFrame = Climate::EncodeFrame(Climate::Command::GET_INFO, "abcd");
        szFrame[13] ^= 0x10;
        assert(Climate::DecodeFrame(szFrame, szData) == Error::CHECKSUM);

        szFrame = Climate::EncodeFrame(Climate::Command::GET_INFO, "abcd");
        szFrame.resize(szFrame.length() - 1);
        assert(Climate::DecodeFrame(szFrame, szData) == Error::PROTOCOL_MALFORMED);
        assert(Climate::DecodeFrame(std::string(8, '\0'), szData) == Error::PROTOCOL_MALFORMED);
        std::cout << "  ✓ Damaged frames rejected\n";
    }

    std::cout << "All frame tests passed!\n\n";
}

void test_state_codec() {
    std::cout << "Testing state record...\n";

    ClimateState state = make_state();
    assert(state.Encode() == bytes(STATE_RECORD, 13));
    std::cout << "  ✓ Bit layout\n";

    {
        ClimateState muted = state;
        assert(muted.setPreset(Climate::Preset::MUTE) == Error::NONE);
        std::string szRecord = muted.Encode();
        assert(((unsigned char)szRecord[1] & 0x0F) == 0x0F);
        assert(((unsigned char)szRecord[2] & 0x0F) == 0x02);
        assert((unsigned char)szRecord[4] == (Climate::Preset::MUTE << 6));
        std::cout << "  ✓ Magic nibble and preset placement\n";
    }

    ClimateState decoded;
    assert(ClimateState::Decode(bytes(STATE_RECORD, 13), decoded) == Error::NONE);
    assert(decoded == state);
    assert(decoded.getTargetTemperature() == 22.5);
    assert(decoded.getMode() == Climate::Mode::COOL);
    assert(decoded.getSwingV() == Climate::SwingV::POS3);
    assert(decoded.getPower());
    assert(!decoded.getIFeel());
    std::cout << "  ✓ Decode\n";

    {
        ClimateState other;
        assert(other.setTargetTemperature(16) == Error::NONE);
        assert(other.setSpeed(Climate::Speed::AUTO) == Error::NONE);
        assert(other.setSwingH(Climate::SwingH::LEFT_RIGHT_FIX) == Error::NONE);
        assert(other.setSwingV(Climate::SwingV::OFF) == Error::NONE);
        other.setIFeel(true);
        other.setClean(true);
        other.setMildew(true);
        ClimateState copy;
        assert(ClimateState::Decode(other.Encode(), copy) == Error::NONE);
        assert(copy == other);
        assert(copy != state);

        assert(other.setTargetTemperature(32) == Error::NONE);
        assert(ClimateState::Decode(other.Encode(), copy) == Error::NONE);
        assert(copy.getTargetTemperature() == 32);
        std::cout << "  ✓ Range limits survive a round trip\n";
    }

    {
        ClimateState out;
        std::string szRecord = bytes(STATE_RECORD, 13);
        szRecord[3] = (char)(4 << 5);   // no fan speed 4
        assert(ClimateState::Decode(szRecord, out) == Error::PROTOCOL_MALFORMED);

        szRecord = bytes(STATE_RECORD, 13);
        szRecord[0] = (char)((31 << 3) | 3);  // 39 degrees
        assert(ClimateState::Decode(szRecord, out) == Error::PROTOCOL_MALFORMED);

        szRecord = bytes(STATE_RECORD, 13);
        szRecord[4] = (char)(3 << 6);
        assert(ClimateState::Decode(szRecord, out) == Error::PROTOCOL_MALFORMED);

        szRecord = bytes(STATE_RECORD, 13);
        szRecord[5] = (char)(5 << 5);
        assert(ClimateState::Decode(szRecord, out) == Error::PROTOCOL_MALFORMED);

        assert(ClimateState::Decode(bytes(STATE_RECORD, 12), out) == Error::PROTOCOL_MALFORMED);
        assert(out == ClimateState());
        std::cout << "  ✓ Out of range fields rejected\n";
    }

    std::cout << "All state record tests passed!\n\n";
}

void test_setters() {
    std::cout << "Testing setter validation...\n";

    ClimateState state = make_state();
    const ClimateState before = state;

    assert(state.setTargetTemperature(15.5) == Error::VALIDATION);
    assert(state.setTargetTemperature(32.5) == Error::VALIDATION);
    assert(state.setTargetTemperature(20.3) == Error::VALIDATION);
    assert(state.setMode((Climate::Mode::value)7) == Error::VALIDATION);
    assert(state.setSpeed((Climate::Speed::value)4) == Error::VALIDATION);
    assert(state.setPreset((Climate::Preset::value)3) == Error::VALIDATION);
    assert(state.setSwingH((Climate::SwingH::value)3) == Error::VALIDATION);
    assert(state.setSwingV((Climate::SwingV::value)6) == Error::VALIDATION);
    assert(state == before);
    std::cout << "  ✓ Invalid values leave the record untouched\n";

    assert(state.setTargetTemperature(16.0) == Error::NONE);
    assert(state.setTargetTemperature(20.5) == Error::NONE);
    assert(state.getTargetTemperature() == 20.5);
    std::cout << "  ✓ Half degree steps accepted\n";

    std::cout << "All setter tests passed!\n\n";
}

void test_info() {
    std::cout << "Testing info record...\n";

    std::string szRecord(22, '\0');
    szRecord[1] = 0x01;
    szRecord[5] = (char)(0xE0 | 23);
    szRecord[21] = 5;
    ClimateInfo info;
    assert(ClimateInfo::Decode(szRecord, info) == Error::NONE);
    assert(info.power);
    assert(info.ambient_temperature > 23.49 && info.ambient_temperature < 23.51);

    assert(ClimateInfo::Decode(std::string(21, '\0'), info) == Error::PROTOCOL_MALFORMED);
    std::cout << "  ✓ Power and ambient temperature\n";

    std::cout << "All info tests passed!\n\n";
}

void test_device() {
    std::cout << "Testing climate device...\n";

    {
        FakeDevice fake;
        broadlinkClimate climate(make_info(), &fake);
        ClimateState state;
        assert(climate.GetState(state) == Error::AUTH_NOT_AUTHENTICATED);
        assert(climate.SetState(state) == Error::AUTH_NOT_AUTHENTICATED);
        assert(fake.datagrams().empty());
        std::cout << "  ✓ Refused before the handshake\n";
    }

    FakeDevice fake;
    broadlinkClimate climate(make_info(), &fake);
    assert(climate.getFamily() == Family::CLIMATE);
    assert(climate.Authenticate() == Error::NONE);

    {
        fake.script(0, Climate::EncodeFrame(Climate::Command::GET_STATE, bytes(STATE_RECORD, 13)));
        ClimateState state;
        assert(climate.GetState(state) == Error::NONE);
        assert(state == make_state());
        std::string szRequest = Climate::EncodeFrame(Climate::Command::GET_STATE, "");
        assert(fake.commands().back().compare(0, szRequest.length(), szRequest) == 0);
        std::cout << "  ✓ Get state\n";
    }

    {
        fake.script(0, Climate::EncodeFrame(Climate::Command::SET_STATE, ""));
        ClimateState state = make_state();
        assert(climate.SetState(state) == Error::NONE);
        std::string szRequest = Climate::EncodeFrame(Climate::Command::SET_STATE, state.Encode());
        assert(fake.commands().back().compare(0, szRequest.length(), szRequest) == 0);
        std::cout << "  ✓ Set state sends the full record\n";
    }

    {
        fake.script(-3, "");
        assert(climate.SetState(make_state()) == Error::PROTOCOL_DEVICE_REJECTED);
        std::cout << "  ✓ Rejected write reported\n";
    }

    {
        std::string szRecord = bytes(STATE_RECORD, 13);
        szRecord[5] = (char)(6 << 5);
        fake.script(0, Climate::EncodeFrame(Climate::Command::GET_STATE, szRecord));
        ClimateState state;
        assert(climate.GetState(state) == Error::PROTOCOL_MALFORMED);
        std::cout << "  ✓ Malformed state reply\n";
    }

    {
        std::string szRecord(22, '\0');
        szRecord[5] = 19;
        szRecord[21] = 2;
        fake.script(0, Climate::EncodeFrame(Climate::Command::GET_INFO, szRecord));
        ClimateInfo info;
        assert(climate.GetInfo(info) == Error::NONE);
        assert(!info.power);
        assert(info.ambient_temperature > 19.19 && info.ambient_temperature < 19.21);
        std::cout << "  ✓ Get info\n";
    }

    std::cout << "All device tests passed!\n\n";
}

int main() {
    std::cout << "=== Climate tests ===\n\n";

    try {
        test_frame();
        test_state_codec();
        test_setters();
        test_info();
        test_device();

        std::cout << "=== All tests passed! ===\n";
        return 0;
    } catch (const std::exception& e) {
        std::cerr << "Test failed with exception: " << e.what() << "\n";
        return 1;
    }
}
