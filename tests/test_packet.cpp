#include <cassert>
#include <cstring>
#include <iostream>
#include <string>

#include "broadlinkPacket.hpp"
#include "broadlinkCipher.hpp"
#include "broadlinkDevice.hpp"

using namespace Broadlink;

// Reference captures from python-broadlink

static const unsigned char COMMAND_PACKET[72] = {
    90,165,170,85,90,165,170,85,0,0,0,0,0,0,0,0,0,0,0,0,0,0,0,0,0,0,0,0,0,0,0,0,
    205,209,0,0,155,100,101,0,52,146,6,5,4,3,2,1,171,239,205,171,220,190,0,0,
    165,197,88,183,43,70,174,88,109,241,187,8,228,74,30,218
};

static const unsigned char AUTH_PAYLOAD[0x50] = {
    0,0,0,0,49,49,49,49,49,49,49,49,49,49,49,49,49,49,49,49,0,0,0,0,0,0,0,0,0,0,1,0,
    0,0,0,0,0,0,0,0,0,0,0,0,0,1,0,0,84,101,115,116,32,49,0,0,0,0,0,0,0,0,0,0,
    0,0,0,0,0,0,0,0,0,0,0,0,0,0,0,0
};

static Header make_header() {
    Header header;
    header.status = 0;
    header.devtype = 0x649B;
    header.command = BROADLINK_AUTH;
    header.count = 0x9234;
    for (int i = 0; i < 6; i++)
        header.mac[i] = (unsigned char)(i + 1);
    header.id = 0xABCDEFAB;
    header.payload_checksum = 0;
    return header;
}

void test_checksum() {
    std::cout << "Testing checksums...\n";

    assert(Packet::ComputeChecksum(nullptr, 0) == 0xBEAF);
    {
        unsigned char data[10] = { 0, 1, 2, 3, 4, 5, 6, 7, 8, 9 };
        assert(Packet::ComputeChecksum(data, 10) == 0xBEDC);
    }
    {
        // wraps modulo 65536
        unsigned char data[256];
        memset(data, 0xFF, sizeof(data));
        assert(Packet::ComputeChecksum(data, 256) == (uint16_t)((0xBEAF + 256 * 0xFF) & 0xFFFF));
    }
    std::cout << "  ✓ Running sum seeded with 0xBEAF\n";

    {
        unsigned char data[4] = { 0x01, 0x02, 0x03, 0x04 };
        assert(Packet::InvertedChecksum(data, 4) == 0xF9FB);
    }
    {
        // end around carry
        unsigned char data[4] = { 0xFF, 0xFF, 0x01, 0x00 };
        assert(Packet::InvertedChecksum(data, 4) == 0xFFFE);
    }
    {
        // odd trailing byte is the low half of a word
        unsigned char data[3] = { 0x00, 0x00, 0x10 };
        assert(Packet::InvertedChecksum(data, 3) == 0xFFEF);
    }
    std::cout << "  ✓ Inverted word checksum\n";

    std::cout << "All checksum tests passed!\n\n";
}

void test_build_packet() {
    std::cout << "Testing packet building...\n";

    {
        unsigned char plain[10] = { 0, 1, 2, 3, 4, 5, 6, 7, 8, 9 };
        std::string szPlain((const char*)plain, 10);
        Header header = make_header();
        header.payload_checksum = Packet::ComputeChecksum(plain, 10);

        broadlinkCipher cipher;
        std::string szEncrypted;
        assert(cipher.Encrypt(szPlain, szEncrypted) == Error::NONE);
        assert(szEncrypted.length() == 16);

        unsigned char buffer[BROADLINK_MAX_PACKET_SIZE];
        int size = Packet::BuildPacket(buffer, BROADLINK_MAX_PACKET_SIZE, header, szEncrypted);
        assert(size == 72);
        assert(memcmp(buffer, COMMAND_PACKET, 72) == 0);
        std::cout << "  ✓ Command packet matches reference capture\n";
    }

    {
        Header header = make_header();
        std::string szPayload(100, 'x');
        unsigned char buffer[128];
        assert(Packet::BuildPacket(buffer, sizeof(buffer), header, szPayload) == -1);
        std::cout << "  ✓ Oversized payload refused\n";
    }

    {
        std::string szPayload = broadlinkDevice::BuildAuthenticationPayload("Test 1");
        assert(szPayload.length() == 0x50);
        assert(memcmp(szPayload.data(), AUTH_PAYLOAD, 0x50) == 0);

        // long names are cut at the end of the field
        szPayload = broadlinkDevice::BuildAuthenticationPayload(std::string(40, 'n'));
        assert(szPayload.length() == 0x50);
        assert(szPayload[0x4f] == 'n');
        std::cout << "  ✓ Authentication payload matches reference capture\n";
    }

    std::cout << "All build tests passed!\n\n";
}

void test_validate_and_strip() {
    std::cout << "Testing packet validation...\n";

    {
        Header header;
        std::string szPayload;
        assert(Packet::ValidateAndStrip(COMMAND_PACKET, 72, header, szPayload) == Error::NONE);
        assert(header.status == 0);
        assert(header.devtype == 0x649B);
        assert(header.command == BROADLINK_AUTH);
        assert(header.count == 0x9234);
        for (int i = 0; i < 6; i++)
            assert(header.mac[i] == i + 1);
        assert(header.id == 0xABCDEFAB);
        assert(header.payload_checksum == 0xBEDC);
        assert(szPayload.length() == 16);
        assert(memcmp(szPayload.data(), &COMMAND_PACKET[0x38], 16) == 0);
        std::cout << "  ✓ Header fields recovered\n";
    }

    {
        unsigned char corrupted[72];
        memcpy(corrupted, COMMAND_PACKET, 72);
        corrupted[0x40] ^= 0x01;
        Header header;
        std::string szPayload;
        assert(Packet::ValidateAndStrip(corrupted, 72, header, szPayload) == Error::CHECKSUM);
        std::cout << "  ✓ Flipped payload bit rejected\n";
    }

    {
        Header header;
        std::string szPayload;
        assert(Packet::ValidateAndStrip(COMMAND_PACKET, BROADLINK_HEADER_SIZE - 1, header, szPayload) == Error::CHECKSUM);
        std::cout << "  ✓ Truncated header rejected\n";
    }

    {
        // checksum slot is not part of the sum
        unsigned char packet[72];
        memcpy(packet, COMMAND_PACKET, 72);
        packet[0x20] = 0;
        packet[0x21] = 0;
        assert(Packet::FrameChecksum(packet, 72) == 0xD1CD);
        Packet::SealPacket(packet, 72);
        assert(Packet::VerifyPacket(packet, 72));
        assert(memcmp(packet, COMMAND_PACKET, 72) == 0);
        std::cout << "  ✓ Seal and verify\n";
    }

    std::cout << "All validation tests passed!\n\n";
}

int main() {
    std::cout << "=== Packet framing tests ===\n\n";

    try {
        test_checksum();
        test_build_packet();
        test_validate_and_strip();

        std::cout << "=== All tests passed! ===\n";
        return 0;
    } catch (const std::exception& e) {
        std::cerr << "Test failed with exception: " << e.what() << "\n";
        return 1;
    }
}
