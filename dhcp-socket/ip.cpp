/*
 * ip.cpp
 *
 *  Created on: 2026. 10. 16.
 */

#include "ip.hh"
#include <arpa/inet.h>
#include <stdio.h>

const struct in_addr IP::ANY = { 0x00000000 };
const struct in_addr IP::BROADCAST = { 0xFFFFFFFF };

uint32_t IP::toHost(struct in_addr addr)
{
	return ntohl(addr.s_addr);
}

struct in_addr IP::fromHost(uint32_t addr)
{
	struct in_addr ret;
	ret.s_addr = htonl(addr);
	return ret;
}

bool IP::isZero(struct in_addr addr)
{
	return addr.s_addr == 0;
}

struct in_addr IP::netmask(int prefix)
{
	if(prefix <= 0)
		return fromHost(0);
	if(prefix >= 32)
		return fromHost(0xFFFFFFFFu);
	return fromHost(0xFFFFFFFFu << (32 - prefix));
}

struct in_addr IP::broadcast(struct in_addr network, int prefix)
{
	uint32_t mask = toHost(netmask(prefix));
	return fromHost((toHost(network) & mask) | ~mask);
}

bool IP::contains(struct in_addr network, int prefix, struct in_addr addr)
{
	uint32_t mask = toHost(netmask(prefix));
	return (toHost(network) & mask) == (toHost(addr) & mask);
}

char* IP::printIP(struct in_addr addr, char* buf, int len)
{
	if(inet_ntop(AF_INET, &addr, buf, len) == 0)
		snprintf(buf, len, "?");
	return buf;
}

std::string IP::toString(struct in_addr addr)
{
	char buf[INET_ADDRSTRLEN];
	return std::string(printIP(addr, buf, sizeof(buf)));
}

bool IP::readIP(const char* buf, struct in_addr* addr)
{
	if(buf == 0)
		return false;
	return inet_pton(AF_INET, buf, addr) == 1;
}
