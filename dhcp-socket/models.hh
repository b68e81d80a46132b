/*
 * models.hh
 *
 *  Created on: 2026. 10. 16.
 */

#ifndef MODELS_HH_
#define MODELS_HH_

#include "mac_address.hh"
#include <boost/optional.hpp>
#include <netinet/in.h>
#include <stdint.h>
#include <time.h>
#include <string>
#include <vector>

struct Subnet
{
	int64_t id;
	struct in_addr network;
	int prefix;
	struct in_addr gateway;
	std::vector<struct in_addr> dnsServers;
	boost::optional<std::string> domainName;
	bool enabled;

	Subnet();

	struct in_addr netmask() const;
	struct in_addr broadcast() const;
	bool contains(struct in_addr addr) const;

	// network, gateway and broadcast are never handed out
	bool isReserved(struct in_addr addr) const;
};

struct DynamicRange
{
	int64_t id;
	int64_t subnetId;
	struct in_addr start;
	struct in_addr end;
	bool enabled;

	DynamicRange();

	bool contains(struct in_addr addr) const;
};

struct StaticIP
{
	int64_t id;
	int64_t subnetId;
	MacAddress mac;
	struct in_addr address;
	boost::optional<std::string> hostname;
	bool enabled;

	StaticIP();
};

struct Lease
{
	int64_t id;
	int64_t subnetId;
	MacAddress mac;
	struct in_addr address;
	time_t start;
	time_t end;
	boost::optional<std::string> hostname;
	bool active;

	Lease();

	bool isActive(time_t now) const;
};

// "8.8.8.8,8.8.4.4" as stored in the subnets table. Unparsable entries are skipped.
std::vector<struct in_addr> parseAddressList(const std::string& text);

#endif /* MODELS_HH_ */
