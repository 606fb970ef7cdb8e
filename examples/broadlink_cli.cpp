/*
 *  Command line example for local Broadlink client
 *
 *  Copyright 2024-2026 - broadlinkpp contributors
 *
 *  Licensed under GNU General Public License 3.0 or later.
 *  Some rights reserved. See COPYING, AUTHORS.
 *
 *  @license GPL-3.0+ <https://www.gnu.org/licenses/gpl-3.0.html>
 */

//#define APPDEBUG

#ifndef BROADLINK_DEVICES_FILE
#define BROADLINK_DEVICES_FILE "broadlink-devices.json"
#endif

#include "broadlinkDevice.hpp"
#include "broadlinkDiscovery.hpp"
#include "broadlinkRemote.hpp"
#include "broadlinkNetwork.hpp"
#include <iostream>
#include <cstdio>
#include <cstdlib>
#include <string.h>
#include <json/json.h>

#include <fstream>
#include <memory>
#include <vector>


void usage(const char *progname)
{
	fprintf(stderr, "usage %s list [local_ip]\n", progname);
	fprintf(stderr, "      %s <device> info\n", progname);
	fprintf(stderr, "      %s <device> learn ir|rf\n", progname);
	fprintf(stderr, "      %s <device> blast <hexcode>\n", progname);
	fprintf(stderr, "      %s connect <ssid> <password> [none|wep|wpa1|wpa2|wpa]\n", progname);
	exit(1);
}


int fail(const std::string &action, const Broadlink::Error::value error)
{
	std::cerr << "ERROR " << action << ": " << Broadlink::ErrorString(error) << "\n";
	return 1;
}


// Looks the device up in the devices file. Unknown names are used as address.
bool get_device_by_name(const std::string name, std::string &address, std::string &local_ip)
{
	std::string szFileContent;
	std::ifstream myfile (BROADLINK_DEVICES_FILE);
	if ( myfile.is_open() )
	{
		std::string line;
		while ( getline (myfile,line) )
		{
			szFileContent.append(line);
			szFileContent.append("\n");
		}
		myfile.close();
	}

	Json::Value jDevices;
	Json::CharReaderBuilder jBuilder;
	std::unique_ptr<Json::CharReader> jReader(jBuilder.newCharReader());
	std::string szErrors;
	if (!szFileContent.empty() && !jReader->parse(szFileContent.c_str(), szFileContent.c_str() + szFileContent.size(), &jDevices, &szErrors))
		std::cerr << "warning: " << BROADLINK_DEVICES_FILE << ": " << szErrors << "\n";

	std::string lowername = name;
	for (int i=0;i<(int)lowername.length();i++)
	{
		if (lowername[i] & 0x40)
			lowername[i] = lowername[i] | 0x20;
	}

	if (jDevices["devices"].isArray())
	{
		for (int i=0;i<(int)jDevices["devices"].size();i++)
		{
			if (jDevices["devices"][i]["name"].asString() == lowername)
			{
				address = jDevices["devices"][i]["address"].asString();
				local_ip = jDevices["devices"][i]["local_ip"].asString();
				return true;
			}
		}
	}

	address = name;
	local_ip = "";
	return false;
}


int list_devices(const std::string &local_ip)
{
	broadlinkScanner scanner(local_ip);
	Broadlink::Error::value result = scanner.Start();
	if (result != Broadlink::Error::NONE)
		return fail("starting discovery", result);

	int count = 0;
	Broadlink::DeviceInfo info;
	while (scanner.Next(info))
	{
		std::unique_ptr<broadlinkDevice> device(broadlinkDevice::create(info));
		std::cout << device->ToString() << "\n";
		count++;
	}
	std::cout << count << " device(s) found\n";
	return 0;
}


int connect_network(int argc, char *argv[])
{
	if (argc < 4)
		usage(argv[0]);

	Broadlink::Security::value security = Broadlink::Security::WPA2;
	if (argc > 4)
	{
		std::string mode = argv[4];
		if (mode == "none")
			security = Broadlink::Security::NONE;
		else if (mode == "wep")
			security = Broadlink::Security::WEP;
		else if (mode == "wpa1")
			security = Broadlink::Security::WPA1;
		else if (mode == "wpa2")
			security = Broadlink::Security::WPA2;
		else if (mode == "wpa")
			security = Broadlink::Security::WPA;
		else
			usage(argv[0]);
	}

	Broadlink::NetworkCredentials credentials(security, argv[2], argv[3]);
	Broadlink::Error::value result = Broadlink::Network::ConnectToNetwork(credentials);
	if (result != Broadlink::Error::NONE)
		return fail("sending network credentials", result);
	std::cout << "device acknowledged network " << credentials.ssid << "\n";
	return 0;
}


int main(int argc, char *argv[])
{
	if (argc < 2)
		usage(argv[0]);

	std::string command = argv[1];
	if (command == "list")
		return list_devices((argc > 2) ? argv[2] : "");
	if (command == "connect")
		return connect_network(argc, argv);
	if (argc < 3)
		usage(argv[0]);

	std::string device_address, local_ip;
	bool known = get_device_by_name(std::string(argv[1]), device_address, local_ip);
#ifdef APPDEBUG
	std::cout << "dbg: address : " << device_address << (known ? "" : " (not in devices file)") << "\n";
	std::cout << "dbg: local ip : " << local_ip << "\n";
#else
	(void)known;
#endif

	Broadlink::DeviceInfo info;
	Broadlink::Error::value result = Broadlink::Discovery::FromAddress(device_address, local_ip, info);
	if (result != Broadlink::Error::NONE)
		return fail("contacting " + device_address, result);

	std::unique_ptr<broadlinkDevice> device(broadlinkDevice::create(info));
	std::string action = argv[2];
	if (action == "info")
	{
		std::cout << device->ToString() << "\n";
		return 0;
	}

	result = device->Authenticate();
	if (result != Broadlink::Error::NONE)
		return fail("authenticating", result);

	broadlinkRemote *remote = dynamic_cast<broadlinkRemote*>(device.get());
	if (!remote)
	{
		std::cerr << "ERROR: " << info.name << " is not a remote\n";
		return 1;
	}

	if (action == "learn")
	{
		std::string kind = (argc > 3) ? argv[3] : "ir";
		Broadlink::LearnedCode code;
		if (kind == "ir")
		{
			std::cout << "point the remote at the device and press a button\n";
			result = remote->LearnIR(code);
		}
		else if (kind == "rf")
		{
			std::cout << "hold a button on the remote until the frequency is found\n";
			result = remote->LearnRF(code);
		}
		else
			usage(argv[0]);

		if (result != Broadlink::Error::NONE)
			return fail("learning code", result);
		std::cout << code.ToHex() << "\n";
		return 0;
	}

	if (action == "blast")
	{
		if (argc < 4)
			usage(argv[0]);
		Broadlink::LearnedCode code;
		if (!Broadlink::LearnedCode::FromHex(argv[3], code))
		{
			std::cerr << "ERROR: code is not a hex string\n";
			return 1;
		}
		result = remote->SendCode(code);
		if (result != Broadlink::Error::NONE)
			return fail("sending code", result);
		return 0;
	}

	usage(argv[0]);
	return 1;
}
