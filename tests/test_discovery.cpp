#include <cassert>
#include <cstring>
#include <ctime>
#include <iostream>
#include <string>
#include <vector>

#include "broadlinkDiscovery.hpp"
#include "broadlinkPacket.hpp"
#include "fake_device.hpp"

using namespace Broadlink;

// 1.2.3.4:42424, 2000-02-14 10:30:55 (a monday), UTC-5
static const unsigned char DISCOVERY_PROBE[48] = {
    0,0,0,0,0,0,0,0,251,255,255,255,208,7,30,10,0,1,14,2,0,0,0,0,
    4,3,2,1,184,165,0,0,36,197,0,0,0,0,6,0,0,0,0,0,0,0,0,0
};

void test_probe() {
    std::cout << "Testing discovery probe...\n";

    struct tm tmLocal;
    memset(&tmLocal, 0, sizeof(tmLocal));
    tmLocal.tm_year = 100;
    tmLocal.tm_mon = 1;
    tmLocal.tm_mday = 14;
    tmLocal.tm_hour = 10;
    tmLocal.tm_min = 30;
    tmLocal.tm_sec = 55;
    tmLocal.tm_wday = 1;

    unsigned char buffer[BROADLINK_DISCOVERY_SIZE];
    assert(Discovery::BuildDiscoveryMessage(buffer, "1.2.3.4", 42424, tmLocal, -5) == BROADLINK_DISCOVERY_SIZE);
    assert(memcmp(buffer, DISCOVERY_PROBE, 48) == 0);
    std::cout << "  ✓ Probe matches reference capture\n";

    // sunday is day 7
    tmLocal.tm_wday = 0;
    assert(Discovery::BuildDiscoveryMessage(buffer, "1.2.3.4", 42424, tmLocal, 0) == BROADLINK_DISCOVERY_SIZE);
    assert(buffer[0x11] == 7);
    assert(Packet::VerifyPacket(buffer, BROADLINK_DISCOVERY_SIZE));

    assert(Discovery::BuildDiscoveryMessage(buffer, "not an address", 42424, tmLocal, 0) == -1);
    std::cout << "  ✓ Weekday and address handling\n";

    std::cout << "All probe tests passed!\n\n";
}

void test_parse_response() {
    std::cout << "Testing discovery replies...\n";

    {
        unsigned char reply[BROADLINK_DISCOVERY_RESPONSE_SIZE];
        memset(reply, 0, sizeof(reply));
        Packet::put_le16(&reply[0x34], 0x649B);
        const unsigned char mac[6] = { 0xAA, 0xBB, 0xCC, 0xDD, 0xEE, 0xFF };
        for (int i = 0; i < 6; i++)
            reply[0x3f - i] = mac[i];
        memcpy(&reply[0x40], "Kitchen", 7);
        reply[0x7f] = 1;

        DeviceInfo info;
        assert(Discovery::ParseDiscoveryResponse(reply, sizeof(reply), "192.168.1.20", info) == Error::NONE);
        assert(info.address == "192.168.1.20");
        assert(info.port == 80);
        assert(info.devtype == 0x649B);
        assert(memcmp(info.mac, mac, 6) == 0);
        assert(FormatMAC(info.mac) == "AA:BB:CC:DD:EE:FF");
        assert(info.name == "Kitchen");
        assert(info.locked);
        std::cout << "  ✓ Device type, MAC, name and lock flag\n";

        // name without terminator stops before the lock flag
        memset(&reply[0x40], 'x', 0x3f);
        reply[0x7f] = 0;
        assert(Discovery::ParseDiscoveryResponse(reply, sizeof(reply), "192.168.1.20", info) == Error::NONE);
        assert(info.name == std::string(63, 'x'));
        assert(!info.locked);

        assert(Discovery::ParseDiscoveryResponse(reply, BROADLINK_DISCOVERY_RESPONSE_SIZE - 1, "192.168.1.20", info) == Error::DISCOVERY_MALFORMED);
        std::cout << "  ✓ Name limits and short replies\n";
    }

    std::cout << "All reply tests passed!\n\n";
}

void test_from_address() {
    std::cout << "Testing direct discovery...\n";

    {
        FakeDevice fake("192.168.1.20");
        fake.addResponder(FakeDevice::MakeResponder("192.168.1.20", 0x2737, "Den", 0x01));
        DeviceInfo info;
        assert(Discovery::FromAddress("192.168.1.20", "192.168.1.2", info, &fake) == Error::NONE);
        assert(info.devtype == 0x2737);
        assert(info.name == "Den");
        assert(info.mac[5] == 0x01);
        assert(fake.destinations()[0].first == "192.168.1.20");
        assert(fake.destinations()[0].second == 80);

        // probe carries the local address and port
        const unsigned char *probe = (const unsigned char*)fake.datagrams()[0].data();
        assert(probe[0x18] == 2 && probe[0x1b] == 192);
        assert(Packet::get_le16(&probe[0x1c]) == 42424);
        std::cout << "  ✓ Known address answers\n";
    }

    {
        FakeDevice fake("192.168.1.20");
        fake.setSilent(true);
        DeviceInfo info;
        assert(Discovery::FromAddress("192.168.1.20", "192.168.1.2", info, &fake) == Error::DISCOVERY_NO_REPLY);
        std::cout << "  ✓ Silent address reports no reply\n";
    }

    {
        FakeDevice fake("192.168.1.20");
        FakeDevice::Responder r = FakeDevice::MakeResponder("192.168.1.20", 0x2737, "Den", 0x01);
        r.size = 0x40;
        fake.addResponder(r);
        DeviceInfo info;
        assert(Discovery::FromAddress("192.168.1.20", "192.168.1.2", info, &fake) == Error::DISCOVERY_MALFORMED);
        std::cout << "  ✓ Truncated answer reported as malformed\n";
    }

    std::cout << "All direct discovery tests passed!\n\n";
}

void test_scanner() {
    std::cout << "Testing scanner...\n";

    FakeDevice fake;
    fake.addResponder(FakeDevice::MakeResponder("192.168.1.20", 0x649B, "Kitchen", 0x20));
    fake.addResponder(FakeDevice::MakeResponder("192.168.1.21", 0x4E2A, "Bedroom", 0x21));
    fake.addResponder(FakeDevice::MakeResponder("192.168.1.20", 0x649B, "Kitchen", 0x20));
    FakeDevice::Responder broken = FakeDevice::MakeResponder("192.168.1.22", 0x2737, "Broken", 0x22);
    broken.size = 0x30;
    fake.addResponder(broken);

    broadlinkScanner scanner("192.168.1.2", 1000, &fake);
    {
        assert(scanner.Start() == Error::NONE);
        assert(fake.destinations().back().first == BROADLINK_BROADCAST_ADDRESS);
        assert(fake.destinations().back().second == 80);

        DeviceInfo info;
        assert(scanner.Next(info));
        assert(info.address == "192.168.1.20");
        assert(info.name == "Kitchen");
        assert(scanner.Next(info));
        assert(info.address == "192.168.1.21");
        assert(info.devtype == 0x4E2A);
        assert(!scanner.Next(info));
        assert(!scanner.Next(info));
        std::cout << "  ✓ Lazy iteration skips duplicates and malformed replies\n";
    }

    {
        std::vector<DeviceInfo> devices;
        assert(scanner.ListDevices(devices) == 2);
        assert(devices.size() == 2);
        assert(fake.datagrams().size() == 2);
        std::cout << "  ✓ Every cycle sends a fresh probe\n";
    }

    {
        FakeDevice quiet;
        quiet.setSilent(true);
        broadlinkScanner empty("192.168.1.2", 1000, &quiet);
        std::vector<DeviceInfo> devices;
        assert(empty.ListDevices(devices) == 0);
        assert(devices.empty());
        std::cout << "  ✓ Empty network\n";
    }

    std::cout << "All scanner tests passed!\n\n";
}

int main() {
    std::cout << "=== Discovery tests ===\n\n";

    try {
        test_probe();
        test_parse_response();
        test_from_address();
        test_scanner();

        std::cout << "=== All tests passed! ===\n";
        return 0;
    } catch (const std::exception& e) {
        std::cerr << "Test failed with exception: " << e.what() << "\n";
        return 1;
    }
}
