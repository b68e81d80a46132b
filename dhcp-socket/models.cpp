/*
 * models.cpp
 *
 *  Created on: 2026. 10. 16.
 */

#include "models.hh"
#include "ip.hh"
#include <boost/algorithm/string.hpp>

Subnet::Subnet()
{
	id = 0;
	network = IP::ANY;
	prefix = 0;
	gateway = IP::ANY;
	enabled = true;
}

struct in_addr Subnet::netmask() const
{
	return IP::netmask(prefix);
}

struct in_addr Subnet::broadcast() const
{
	return IP::broadcast(network, prefix);
}

bool Subnet::contains(struct in_addr addr) const
{
	return IP::contains(network, prefix, addr);
}

bool Subnet::isReserved(struct in_addr addr) const
{
	struct in_addr base = IP::fromHost(IP::toHost(network) & IP::toHost(netmask()));
	return addr == base || addr == gateway || addr == broadcast();
}

DynamicRange::DynamicRange()
{
	id = 0;
	subnetId = 0;
	start = IP::ANY;
	end = IP::ANY;
	enabled = true;
}

bool DynamicRange::contains(struct in_addr addr) const
{
	uint32_t value = IP::toHost(addr);
	return IP::toHost(start) <= value && value <= IP::toHost(end);
}

StaticIP::StaticIP()
{
	id = 0;
	subnetId = 0;
	address = IP::ANY;
	enabled = true;
}

Lease::Lease()
{
	id = 0;
	subnetId = 0;
	address = IP::ANY;
	start = 0;
	end = 0;
	active = true;
}

bool Lease::isActive(time_t now) const
{
	return active && end > now;
}

std::vector<struct in_addr> parseAddressList(const std::string& text)
{
	std::vector<std::string> parts;
	boost::algorithm::split(parts, text, boost::algorithm::is_any_of(","));

	std::vector<struct in_addr> ret;
	for(std::vector<std::string>::iterator iter = parts.begin(); iter != parts.end(); ++iter)
	{
		boost::algorithm::trim(*iter);
		struct in_addr addr;
		if(IP::readIP(iter->c_str(), &addr))
			ret.push_back(addr);
	}
	return ret;
}
