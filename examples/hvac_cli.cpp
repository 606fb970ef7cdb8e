/*
 *  Air conditioner example for local Broadlink client
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

#include "broadlinkClimate.hpp"
#include "broadlinkDiscovery.hpp"
#include <iostream>
#include <cstdio>
#include <cstdlib>
#include <string.h>
#include <json/json.h>

#include <fstream>
#include <memory>


void usage(const char *progname)
{
	fprintf(stderr, "usage %s <device> info|on|off|toggle|temp <degrees>\n", progname);
	exit(1);
}


int fail(const std::string &action, const Broadlink::Error::value error)
{
	std::cerr << "ERROR " << action << ": " << Broadlink::ErrorString(error) << "\n";
	return 1;
}


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


int main(int argc, char *argv[])
{
	if (argc < 3)
		usage(argv[0]);

	std::string device_address, local_ip;
	get_device_by_name(std::string(argv[1]), device_address, local_ip);

	Broadlink::DeviceInfo info;
	Broadlink::Error::value result = Broadlink::Discovery::FromAddress(device_address, local_ip, info);
	if (result != Broadlink::Error::NONE)
		return fail("contacting " + device_address, result);

	if (broadlinkDevice::Classify(info.devtype) != Broadlink::Family::CLIMATE)
	{
		std::cerr << "ERROR: " << info.name << " (" << broadlinkDevice::ModelName(info.devtype) << ") is not an air conditioner\n";
		return 1;
	}

	broadlinkClimate hvac(info);
	result = hvac.Authenticate();
	if (result != Broadlink::Error::NONE)
		return fail("authenticating", result);

	std::string action = argv[2];
	if (action == "info")
	{
		Broadlink::ClimateInfo acinfo;
		result = hvac.GetInfo(acinfo);
		if (result != Broadlink::Error::NONE)
			return fail("reading info", result);
		std::cout << hvac.ToString() << "\n";
		std::cout << "power: " << (acinfo.power ? "on" : "off") << ", ambient temperature: " << acinfo.ambient_temperature << "\n";
	}

	Broadlink::ClimateState state;
	result = hvac.GetState(state);
	if (result != Broadlink::Error::NONE)
		return fail("reading state", result);
#ifdef APPDEBUG
	std::cout << "dbg: current state: " << state.ToString() << "\n";
#endif

	if (action == "info")
	{
		std::cout << state.ToString() << "\n";
		return 0;
	}

	if (action == "on")
		state.setPower(true);
	else if (action == "off")
		state.setPower(false);
	else if (action == "toggle")
		state.setPower(!state.getPower());
	else if (action == "temp")
	{
		if (argc < 4)
			usage(argv[0]);
		result = state.setTargetTemperature(atof(argv[3]));
		if (result != Broadlink::Error::NONE)
		{
			std::cerr << "ERROR: temperature must be between 16 and 32 in steps of 0.5\n";
			return 1;
		}
	}
	else
		usage(argv[0]);

	result = hvac.SetState(state);
	if (result != Broadlink::Error::NONE)
		return fail("writing state", result);

	std::cout << state.ToString() << "\n";
	return 0;
}
