/*
 * allocator.hh
 *
 *  Created on: 2026. 10. 16.
 */

#ifndef ALLOCATOR_HH_
#define ALLOCATOR_HH_

#include "dhcp.hh"
#include "lease_store.hh"
#include <boost/optional.hpp>
#include <netinet/in.h>
#include <stdint.h>
#include <vector>

#define DEFAULT_LEASE_TIME 86400
#define DEFAULT_MAX_LEASE_TIME 604800
#define DEFAULT_OFFER_TIME 60
#define DEFAULT_DECLINE_TIME 3600

struct LeasePolicy
{
	uint32_t leaseTime;
	uint32_t maxLeaseTime;
	uint32_t offerTime;
	uint32_t declineTime;
	bool silentNak;
	bool inform;

	LeasePolicy();
};

class Allocator
{
private:
	LeaseStore* store;
	LeasePolicy policy;

	std::vector<Subnet> reachableSubnets(struct in_addr local);
	boost::optional<StaticIP> findStatic(const MacAddress& mac, const std::vector<Subnet>& reachable, Subnet* subnet);
	uint32_t leaseDuration(const DHCPPacket& request) const;

	void makeReply(const DHCPPacket& request, MessageType type, DHCPPacket* reply) const;
	void addNetworkOptions(const Subnet& subnet, DHCPPacket* reply) const;

	bool makeOffer(const DHCPPacket& request, const Subnet& subnet, struct in_addr address, uint32_t duration, DHCPPacket* reply);
	bool makeAck(const DHCPPacket& request, const Subnet& subnet, struct in_addr address, uint32_t duration, DHCPPacket* reply);
	bool makeNak(const DHCPPacket& request, const Subnet& subnet, DHCPPacket* reply);

	bool handleDiscover(const DHCPPacket& request, struct in_addr local, DHCPPacket* reply);
	bool handleRequest(const DHCPPacket& request, struct in_addr local, DHCPPacket* reply);
	bool handleRelease(const DHCPPacket& request);
	bool handleDecline(const DHCPPacket& request, struct in_addr local);
	bool handleInform(const DHCPPacket& request, struct in_addr local, DHCPPacket* reply);

public:
	Allocator(LeaseStore* store, const LeasePolicy& policy);

	/*
	 * Decide the answer to one client packet received on the listener
	 * bound to local. Returns true when reply must be sent.
	 */
	bool handle(const DHCPPacket& request, struct in_addr local, DHCPPacket* reply);
};

#endif /* ALLOCATOR_HH_ */
