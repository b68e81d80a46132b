/*
 * allocator.cpp
 *
 *  Created on: 2026. 10. 16.
 */

#include "allocator.hh"
#include "ip.hh"
#include <boost/unordered_set.hpp>
#include <syslog.h>
#include <time.h>

using namespace std;

LeasePolicy::LeasePolicy()
{
	leaseTime = DEFAULT_LEASE_TIME;
	maxLeaseTime = DEFAULT_MAX_LEASE_TIME;
	offerTime = DEFAULT_OFFER_TIME;
	declineTime = DEFAULT_DECLINE_TIME;
	silentNak = false;
	inform = true;
}

Allocator::Allocator(LeaseStore* store, const LeasePolicy& policy)
{
	this->store = store;
	this->policy = policy;
}

static bool find_subnet(const vector<Subnet>& subnets, int64_t id, Subnet* out)
{
	for(vector<Subnet>::const_iterator iter = subnets.begin(); iter != subnets.end(); ++iter)
	{
		if(iter->id == id)
		{
			*out = *iter;
			return true;
		}
	}
	return false;
}

static bool find_subnet_containing(const vector<Subnet>& subnets, struct in_addr addr, Subnet* out)
{
	for(vector<Subnet>::const_iterator iter = subnets.begin(); iter != subnets.end(); ++iter)
	{
		if(iter->contains(addr))
		{
			*out = *iter;
			return true;
		}
	}
	return false;
}

vector<Subnet> Allocator::reachableSubnets(struct in_addr local)
{
	vector<Subnet> all = store->listSubnets();
	vector<Subnet> ret;
	for(vector<Subnet>::iterator iter = all.begin(); iter != all.end(); ++iter)
	{
		if(!iter->enabled)
			continue;
		if(IP::isZero(local) || iter->contains(local))
			ret.push_back(*iter);
	}
	return ret;
}

/*
 * The client's enabled static assignment in a reachable subnet. A MAC may
 * have one per subnet, so the store-wide lookup is only a shortcut.
 */
boost::optional<StaticIP> Allocator::findStatic(const MacAddress& mac, const vector<Subnet>& reachable, Subnet* subnet)
{
	boost::optional<StaticIP> first = store->getStaticByMac(mac);
	if(!first)
		return boost::none;
	if(find_subnet(reachable, first->subnetId, subnet))
		return first;

	for(vector<Subnet>::const_iterator iter = reachable.begin(); iter != reachable.end(); ++iter)
	{
		vector<StaticIP> statics = store->listEnabledStaticIPs(iter->id);
		for(vector<StaticIP>::iterator s = statics.begin(); s != statics.end(); ++s)
		{
			if(s->mac == mac)
			{
				*subnet = *iter;
				return *s;
			}
		}
	}
	return boost::none;
}

uint32_t Allocator::leaseDuration(const DHCPPacket& request) const
{
	uint32_t duration = policy.leaseTime;
	boost::optional<uint32_t> requested = request.getLeaseTime();
	if(requested && *requested > 0)
		duration = *requested;
	if(duration > policy.maxLeaseTime)
		duration = policy.maxLeaseTime;
	return duration;
}

void Allocator::makeReply(const DHCPPacket& request, MessageType type, DHCPPacket* reply) const
{
	DHCPPacket packet;
	packet.op = BOOTREPLY;
	packet.htype = HTYPE_ETHER;
	packet.hlen = ETH_ALEN;
	packet.hops = 0;
	packet.xid = request.xid;
	packet.secs = 0;
	packet.flags = request.flags;
	packet.giaddr = request.giaddr;
	packet.chaddr = request.chaddr;
	packet.options.push_back(MessageTypeOption(type));
	*reply = packet;
}

void Allocator::addNetworkOptions(const Subnet& subnet, DHCPPacket* reply) const
{
	reply->options.push_back(SubnetMaskOption(subnet.netmask()));
	reply->options.push_back(RouterOption(vector<struct in_addr>(1, subnet.gateway)));
	if(!subnet.dnsServers.empty())
		reply->options.push_back(DNSServerOption(subnet.dnsServers));
	if(subnet.domainName)
		reply->options.push_back(DomainNameOption(*subnet.domainName));
}

bool Allocator::makeOffer(const DHCPPacket& request, const Subnet& subnet, struct in_addr address, uint32_t duration, DHCPPacket* reply)
{
	makeReply(request, DHCPOFFER, reply);
	reply->yiaddr = address;
	reply->siaddr = subnet.gateway;
	reply->options.push_back(ServerIdentifierOption(subnet.gateway));
	reply->options.push_back(LeaseTimeOption(duration));
	addNetworkOptions(subnet, reply);

	char mac_buf[32];
	char ip_buf[32];
	syslog(LOG_INFO, "DHCP offer: MAC(%s), IP(%s), ID(%X)",
			request.chaddr.printMAC(mac_buf, sizeof(mac_buf)),
			IP::printIP(address, ip_buf, sizeof(ip_buf)), request.xid);
	return true;
}

bool Allocator::makeAck(const DHCPPacket& request, const Subnet& subnet, struct in_addr address, uint32_t duration, DHCPPacket* reply)
{
	makeReply(request, DHCPACK, reply);
	reply->yiaddr = address;
	reply->siaddr = subnet.gateway;
	reply->options.push_back(ServerIdentifierOption(subnet.gateway));
	reply->options.push_back(LeaseTimeOption(duration));
	reply->options.push_back(RenewalTimeOption(duration / 2));
	reply->options.push_back(RebindingTimeOption((uint32_t)(((uint64_t)duration * 7) / 8)));
	addNetworkOptions(subnet, reply);

	char mac_buf[32];
	char ip_buf[32];
	syslog(LOG_INFO, "DHCP accepted: MAC(%s), IP(%s), %u seconds",
			request.chaddr.printMAC(mac_buf, sizeof(mac_buf)),
			IP::printIP(address, ip_buf, sizeof(ip_buf)), duration);
	return true;
}

bool Allocator::makeNak(const DHCPPacket& request, const Subnet& subnet, DHCPPacket* reply)
{
	char mac_buf[32];
	request.chaddr.printMAC(mac_buf, sizeof(mac_buf));
	if(policy.silentNak)
	{
		syslog(LOG_INFO, "DHCP request refused silently: MAC(%s)", mac_buf);
		return false;
	}

	makeReply(request, DHCPNAK, reply);
	reply->options.push_back(ServerIdentifierOption(subnet.gateway));
	syslog(LOG_INFO, "DHCP refused: MAC(%s)", mac_buf);
	return true;
}

bool Allocator::handleDiscover(const DHCPPacket& request, struct in_addr local, DHCPPacket* reply)
{
	char mac_buf[32];
	request.chaddr.printMAC(mac_buf, sizeof(mac_buf));

	vector<Subnet> reachable = reachableSubnets(local);
	uint32_t duration = leaseDuration(request);
	Subnet subnet;

	boost::optional<StaticIP> staticIP = findStatic(request.chaddr, reachable, &subnet);
	if(staticIP)
		return makeOffer(request, subnet, staticIP->address, duration, reply);

	time_t now = time(0);
	boost::optional<std::string> hostname = request.getHostname();

	boost::optional<Lease> lease = store->getActiveLease(request.chaddr);
	if(lease && find_subnet(reachable, lease->subnetId, &subnet))
	{
		// keep the address held until the client can answer this offer
		if(lease->end >= now + (time_t)policy.offerTime
				|| store->createOrExtendLease(request.chaddr, lease->subnetId, lease->address,
						lease->start, now + policy.offerTime, hostname))
			return makeOffer(request, subnet, lease->address, duration, reply);
	}

	for(vector<Subnet>::iterator iter = reachable.begin(); iter != reachable.end(); ++iter)
	{
		boost::unordered_set<uint32_t> taken;

		vector<StaticIP> statics = store->listEnabledStaticIPs(iter->id);
		for(vector<StaticIP>::iterator s = statics.begin(); s != statics.end(); ++s)
			taken.insert(IP::toHost(s->address));

		vector<Lease> leases = store->listActiveLeasesForSubnet(iter->id);
		for(vector<Lease>::iterator l = leases.begin(); l != leases.end(); ++l)
			taken.insert(IP::toHost(l->address));

		vector<DynamicRange> ranges = store->listEnabledRanges(iter->id);
		for(vector<DynamicRange>::iterator range = ranges.begin(); range != ranges.end(); ++range)
		{
			uint64_t first = IP::toHost(range->start);
			uint64_t last = IP::toHost(range->end);
			for(uint64_t value = first; value <= last; value++)
			{
				struct in_addr candidate = IP::fromHost((uint32_t)value);
				if(!iter->contains(candidate) || iter->isReserved(candidate))
					continue;
				if(taken.find((uint32_t)value) != taken.end())
					continue;

				boost::optional<Lease> hold = store->createOrExtendLease(request.chaddr, iter->id,
						candidate, now, now + policy.offerTime, hostname);
				if(!hold)
				{
					// taken by a concurrent allocation
					taken.insert((uint32_t)value);
					continue;
				}
				return makeOffer(request, *iter, candidate, duration, reply);
			}
		}
	}

	syslog(LOG_INFO, "No available IP for DHCP discover MAC(%s)", mac_buf);
	return false;
}

bool Allocator::handleRequest(const DHCPPacket& request, struct in_addr local, DHCPPacket* reply)
{
	char mac_buf[32];
	char ip_buf[32];
	request.chaddr.printMAC(mac_buf, sizeof(mac_buf));

	// renewing and rebinding clients name their address in ciaddr only
	boost::optional<struct in_addr> requested = request.getRequestedIP();
	if(!requested && !IP::isZero(request.ciaddr))
		requested = request.ciaddr;
	if(!requested)
	{
		syslog(LOG_DEBUG, "DHCP request without requested address: MAC(%s)", mac_buf);
		return false;
	}
	IP::printIP(*requested, ip_buf, sizeof(ip_buf));

	vector<Subnet> reachable = reachableSubnets(local);
	uint32_t duration = leaseDuration(request);
	Subnet subnet;

	boost::optional<StaticIP> staticIP = findStatic(request.chaddr, reachable, &subnet);
	if(staticIP && staticIP->address == *requested)
		return makeAck(request, subnet, staticIP->address, duration, reply);

	if(!find_subnet_containing(reachable, *requested, &subnet))
	{
		if(reachable.empty())
		{
			syslog(LOG_DEBUG, "No subnet for DHCP request MAC(%s), IP(%s)", mac_buf, ip_buf);
			return false;
		}
		subnet = reachable.front();
	}

	boost::optional<struct in_addr> serverID = request.getServerIdentifier();
	if(serverID && *serverID != subnet.gateway)
	{
		syslog(LOG_DEBUG, "DHCP request for another server: MAC(%s)", mac_buf);
		return false;
	}

	if(staticIP)
	{
		syslog(LOG_INFO, "Static MAC(%s) requested foreign IP(%s)", mac_buf, ip_buf);
		return makeNak(request, subnet, reply);
	}

	if(!subnet.contains(*requested) || subnet.isReserved(*requested))
		return makeNak(request, subnet, reply);

	bool inRange = false;
	vector<DynamicRange> ranges = store->listEnabledRanges(subnet.id);
	for(vector<DynamicRange>::iterator iter = ranges.begin(); iter != ranges.end(); ++iter)
	{
		if(iter->contains(*requested))
		{
			inRange = true;
			break;
		}
	}
	if(!inRange)
		return makeNak(request, subnet, reply);

	vector<StaticIP> statics = store->listEnabledStaticIPs(subnet.id);
	for(vector<StaticIP>::iterator iter = statics.begin(); iter != statics.end(); ++iter)
	{
		if(iter->address == *requested && iter->mac != request.chaddr)
		{
			syslog(LOG_INFO, "MAC(%s) requested static IP(%s) of another client", mac_buf, ip_buf);
			return makeNak(request, subnet, reply);
		}
	}

	time_t now = time(0);
	boost::optional<Lease> lease = store->createOrExtendLease(request.chaddr, subnet.id,
			*requested, now, now + duration, request.getHostname());
	if(!lease)
	{
		syslog(LOG_INFO, "IP(%s) is leased to another client, MAC(%s)", ip_buf, mac_buf);
		return makeNak(request, subnet, reply);
	}

	return makeAck(request, subnet, lease->address, duration, reply);
}

bool Allocator::handleRelease(const DHCPPacket& request)
{
	char mac_buf[32];
	request.chaddr.printMAC(mac_buf, sizeof(mac_buf));

	boost::optional<Lease> lease = store->getActiveLease(request.chaddr);
	if(!lease)
	{
		syslog(LOG_DEBUG, "DHCP release without lease: MAC(%s)", mac_buf);
		return false;
	}

	store->expireLease(lease->id);

	char ip_buf[32];
	syslog(LOG_INFO, "DHCP released: MAC(%s), IP(%s)", mac_buf,
			IP::printIP(lease->address, ip_buf, sizeof(ip_buf)));
	return false;
}

bool Allocator::handleDecline(const DHCPPacket& request, struct in_addr local)
{
	char mac_buf[32];
	request.chaddr.printMAC(mac_buf, sizeof(mac_buf));

	boost::optional<struct in_addr> declined = request.getRequestedIP();
	if(!declined)
		return false;

	char ip_buf[32];
	IP::printIP(*declined, ip_buf, sizeof(ip_buf));

	int64_t subnetId = 0;
	boost::optional<Lease> lease = store->getActiveLease(request.chaddr);
	if(lease && lease->address == *declined)
	{
		store->expireLease(lease->id);
		subnetId = lease->subnetId;
	}
	else
	{
		Subnet subnet;
		if(find_subnet_containing(reachableSubnets(local), *declined, &subnet))
			subnetId = subnet.id;
	}

	if(subnetId == 0)
	{
		syslog(LOG_INFO, "DHCP decline for unknown IP(%s): MAC(%s)", ip_buf, mac_buf);
		return false;
	}

	time_t now = time(0);
	boost::optional<Lease> quarantine = store->createOrExtendLease(MacAddress::NONE, subnetId,
			*declined, now, now + policy.declineTime, boost::none);
	syslog(LOG_WARNING, "DHCP declined: MAC(%s), IP(%s)%s", mac_buf, ip_buf,
			quarantine ? ", quarantined" : "");
	return false;
}

bool Allocator::handleInform(const DHCPPacket& request, struct in_addr local, DHCPPacket* reply)
{
	if(!policy.inform || IP::isZero(request.ciaddr))
		return false;

	Subnet subnet;
	if(!find_subnet_containing(reachableSubnets(local), request.ciaddr, &subnet))
		return false;

	makeReply(request, DHCPACK, reply);
	reply->ciaddr = request.ciaddr;
	reply->siaddr = subnet.gateway;
	reply->options.push_back(ServerIdentifierOption(subnet.gateway));
	addNetworkOptions(subnet, reply);

	char mac_buf[32];
	char ip_buf[32];
	syslog(LOG_INFO, "DHCP inform: MAC(%s), IP(%s)",
			request.chaddr.printMAC(mac_buf, sizeof(mac_buf)),
			IP::printIP(request.ciaddr, ip_buf, sizeof(ip_buf)));
	return true;
}

bool Allocator::handle(const DHCPPacket& request, struct in_addr local, DHCPPacket* reply)
{
	if(request.op != BOOTREQUEST || request.htype != HTYPE_ETHER || request.hlen != ETH_ALEN)
		return false;

	char mac_buf[32];
	request.chaddr.printMAC(mac_buf, sizeof(mac_buf));
	if(request.chaddr.isZero())
	{
		syslog(LOG_WARNING, "Dropped DHCP packet with empty MAC, ID(%X)", request.xid);
		return false;
	}

	boost::optional<MessageType> type = request.getMessageType();
	if(!type)
	{
		syslog(LOG_DEBUG, "Dropped DHCP packet without message type: MAC(%s)", mac_buf);
		return false;
	}

	syslog(LOG_DEBUG, "DHCP %s received: MAC(%s), ID(%X)", messageTypeName(*type), mac_buf, request.xid);
	try
	{
		switch(*type)
		{
		case DHCPDISCOVER:
			return handleDiscover(request, local, reply);
		case DHCPREQUEST:
			return handleRequest(request, local, reply);
		case DHCPRELEASE:
			return handleRelease(request);
		case DHCPDECLINE:
			return handleDecline(request, local);
		case DHCPINFORM:
			return handleInform(request, local, reply);
		default:
			return false;
		}
	}
	catch(StoreError &e)
	{
		syslog(LOG_ERR, "Lease store error on DHCP %s, MAC(%s): %s", messageTypeName(*type), mac_buf, e.what());
	}
	return false;
}
