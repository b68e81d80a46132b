/*
 * mac_address.cpp
 *
 *  Created on: 2026. 10. 16.
 */

#include "mac_address.hh"
#include <boost/functional/hash.hpp>
#include <stdio.h>
#include <memory.h>

const MacAddress MacAddress::NONE;

MacAddress::MacAddress()
{
	memset(octet, 0, sizeof(octet));
}

MacAddress::MacAddress(const uint8_t* bytes)
{
	memcpy(octet, bytes, sizeof(octet));
}

const uint8_t* MacAddress::getBytes() const
{
	return octet;
}

bool MacAddress::isZero() const
{
	for(int k = 0; k < ETH_ALEN; k++)
		if(octet[k] != 0)
			return false;
	return true;
}

char* MacAddress::printMAC(char* buf, int len) const
{
	snprintf(buf, len, "%02X:%02X:%02X:%02X:%02X:%02X",
			octet[0], octet[1], octet[2],
			octet[3], octet[4], octet[5]);
	return buf;
}

std::string MacAddress::toString() const
{
	char buf[32];
	return std::string(printMAC(buf, sizeof(buf)));
}

static int hex_to_byte(unsigned char hex)
{
	if(hex >= 'a' && hex <= 'f')
		return hex + 10 - 'a';
	if(hex >= 'A' && hex <= 'F')
		return hex + 10 - 'A';
	if(hex >= '0' && hex <= '9')
		return hex - '0';
	return -1;
}

bool MacAddress::readMAC(const char* buf, MacAddress* mac)
{
	if(buf == 0)
		return false;

	uint8_t temp[ETH_ALEN];
	for(int k = 0; k < ETH_ALEN; k++)
	{
		int high = hex_to_byte(buf[0]);
		if(high == -1)
			return false;
		int low = hex_to_byte(buf[1]);
		if(low == -1)
			return false;
		temp[k] = (uint8_t)((high << 4) | low);
		buf += 2;

		if(k < ETH_ALEN - 1)
		{
			if(*buf != ':')
				return false;
			buf++;
		}
	}
	if(*buf != '\0')
		return false;

	*mac = MacAddress(temp);
	return true;
}

bool MacAddress::operator==(const MacAddress& other) const
{
	return memcmp(octet, other.octet, sizeof(octet)) == 0;
}

bool MacAddress::operator!=(const MacAddress& other) const
{
	return !(*this == other);
}

bool MacAddress::operator<(const MacAddress& other) const
{
	return memcmp(octet, other.octet, sizeof(octet)) < 0;
}

std::size_t hash_value(const MacAddress& mac)
{
	return boost::hash_range(mac.getBytes(), mac.getBytes() + ETH_ALEN);
}
