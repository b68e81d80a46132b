/*
 * memory_store.hh
 *
 *  Created on: 2026. 10. 16.
 */

#ifndef MEMORY_STORE_HH_
#define MEMORY_STORE_HH_

#include "lease_store.hh"
#include <boost/unordered_map.hpp>
#include <pthread.h>
#include <map>

class MemoryStore : public LeaseStore
{
private:
	pthread_mutex_t lock;

	int64_t lastSubnetID;
	int64_t lastRangeID;
	int64_t lastStaticID;
	int64_t lastLeaseID;

	std::map<int64_t, Subnet> subnets;
	std::map<int64_t, DynamicRange> ranges;
	std::map<int64_t, StaticIP> staticIPs;
	std::map<int64_t, Lease> leases;

	// every lease id ever issued, by host-order address
	boost::unordered_multimap<uint32_t, int64_t> leaseByAddress;

	MemoryStore(const MemoryStore&);
	MemoryStore& operator=(const MemoryStore&);
public:
	MemoryStore();
	virtual ~MemoryStore();

	// Administrative inserts; the id field is assigned and returned.
	int64_t addSubnet(const Subnet& subnet);
	int64_t addRange(const DynamicRange& range);
	int64_t addStaticIP(const StaticIP& staticIP);
	int64_t addLease(const Lease& lease);

	std::vector<Lease> listLeases();

	virtual boost::optional<StaticIP> getStaticByMac(const MacAddress& mac);
	virtual boost::optional<Lease> getActiveLease(const MacAddress& mac);
	virtual boost::optional<Lease> createOrExtendLease(const MacAddress& mac, int64_t subnetId,
			struct in_addr address, time_t start, time_t end,
			const boost::optional<std::string>& hostname);
	virtual void expireLease(int64_t leaseId);
	virtual boost::optional<Subnet> getSubnet(int64_t subnetId);
	virtual std::vector<Subnet> listSubnets();
	virtual std::vector<DynamicRange> listEnabledRanges(int64_t subnetId);
	virtual std::vector<StaticIP> listEnabledStaticIPs(int64_t subnetId);
	virtual std::vector<Lease> listActiveLeasesForSubnet(int64_t subnetId);
};

#endif /* MEMORY_STORE_HH_ */
