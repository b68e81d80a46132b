/*
 * memory_store.cpp
 *
 *  Created on: 2026. 10. 16.
 */

#include "memory_store.hh"
#include "ip.hh"

using namespace std;

typedef boost::unordered_multimap<uint32_t, int64_t> AddressIndex;

MemoryStore::MemoryStore()
{
	lastSubnetID = 0;
	lastRangeID = 0;
	lastStaticID = 0;
	lastLeaseID = 0;
	pthread_mutex_init(&this->lock, NULL);
}

MemoryStore::~MemoryStore()
{
	pthread_mutex_destroy(&this->lock);
}

int64_t MemoryStore::addSubnet(const Subnet& subnet)
{
	pthread_mutex_lock(&this->lock);
	Subnet copy = subnet;
	copy.id = ++lastSubnetID;
	subnets[copy.id] = copy;
	pthread_mutex_unlock(&this->lock);
	return copy.id;
}

int64_t MemoryStore::addRange(const DynamicRange& range)
{
	pthread_mutex_lock(&this->lock);
	DynamicRange copy = range;
	copy.id = ++lastRangeID;
	ranges[copy.id] = copy;
	pthread_mutex_unlock(&this->lock);
	return copy.id;
}

int64_t MemoryStore::addStaticIP(const StaticIP& staticIP)
{
	pthread_mutex_lock(&this->lock);
	StaticIP copy = staticIP;
	copy.id = ++lastStaticID;
	staticIPs[copy.id] = copy;
	pthread_mutex_unlock(&this->lock);
	return copy.id;
}

int64_t MemoryStore::addLease(const Lease& lease)
{
	pthread_mutex_lock(&this->lock);
	Lease copy = lease;
	copy.id = ++lastLeaseID;
	leases[copy.id] = copy;
	leaseByAddress.insert(AddressIndex::value_type(IP::toHost(copy.address), copy.id));
	pthread_mutex_unlock(&this->lock);
	return copy.id;
}

vector<Lease> MemoryStore::listLeases()
{
	vector<Lease> ret;
	pthread_mutex_lock(&this->lock);
	for(map<int64_t, Lease>::const_iterator iter = leases.begin(); iter != leases.end(); ++iter)
		ret.push_back(iter->second);
	pthread_mutex_unlock(&this->lock);
	return ret;
}

boost::optional<StaticIP> MemoryStore::getStaticByMac(const MacAddress& mac)
{
	boost::optional<StaticIP> ret;
	pthread_mutex_lock(&this->lock);
	for(map<int64_t, StaticIP>::const_iterator iter = staticIPs.begin(); iter != staticIPs.end(); ++iter)
	{
		if(iter->second.enabled && iter->second.mac == mac)
		{
			ret = iter->second;
			break;
		}
	}
	pthread_mutex_unlock(&this->lock);
	return ret;
}

boost::optional<Lease> MemoryStore::getActiveLease(const MacAddress& mac)
{
	time_t now = time(0);
	boost::optional<Lease> ret;
	pthread_mutex_lock(&this->lock);
	for(map<int64_t, Lease>::const_iterator iter = leases.begin(); iter != leases.end(); ++iter)
	{
		const Lease& lease = iter->second;
		if(lease.mac != mac || !lease.isActive(now))
			continue;
		if(!ret || lease.end > ret->end)
			ret = lease;
	}
	pthread_mutex_unlock(&this->lock);
	return ret;
}

boost::optional<Lease> MemoryStore::createOrExtendLease(const MacAddress& mac, int64_t subnetId,
		struct in_addr address, time_t start, time_t end,
		const boost::optional<std::string>& hostname)
{
	time_t now = time(0);
	boost::optional<Lease> ret;

	pthread_mutex_lock(&this->lock);

	Lease* own = 0;
	bool conflict = false;
	std::pair<AddressIndex::iterator, AddressIndex::iterator> holders =
			leaseByAddress.equal_range(IP::toHost(address));
	for(AddressIndex::iterator iter = holders.first; iter != holders.second; ++iter)
	{
		Lease& lease = leases[iter->second];
		if(!lease.isActive(now))
			continue;
		if(lease.mac == mac)
			own = &lease;
		else
			conflict = true;
	}

	if(conflict)
	{
		pthread_mutex_unlock(&this->lock);
		return ret;
	}

	if(own)
	{
		own->end = end;
		if(hostname)
			own->hostname = hostname;
		ret = *own;
		pthread_mutex_unlock(&this->lock);
		return ret;
	}

	if(!mac.isZero())
	{
		for(map<int64_t, Lease>::iterator iter = leases.begin(); iter != leases.end(); ++iter)
		{
			if(iter->second.mac == mac && iter->second.active)
				iter->second.active = false;
		}
	}

	Lease lease;
	lease.id = ++lastLeaseID;
	lease.subnetId = subnetId;
	lease.mac = mac;
	lease.address = address;
	lease.start = start;
	lease.end = end;
	lease.hostname = hostname;
	lease.active = true;
	leases[lease.id] = lease;
	leaseByAddress.insert(AddressIndex::value_type(IP::toHost(address), lease.id));
	ret = lease;

	pthread_mutex_unlock(&this->lock);
	return ret;
}

void MemoryStore::expireLease(int64_t leaseId)
{
	pthread_mutex_lock(&this->lock);
	map<int64_t, Lease>::iterator iter = leases.find(leaseId);
	if(iter != leases.end())
		iter->second.active = false;
	pthread_mutex_unlock(&this->lock);
}

boost::optional<Subnet> MemoryStore::getSubnet(int64_t subnetId)
{
	boost::optional<Subnet> ret;
	pthread_mutex_lock(&this->lock);
	map<int64_t, Subnet>::const_iterator iter = subnets.find(subnetId);
	if(iter != subnets.end())
		ret = iter->second;
	pthread_mutex_unlock(&this->lock);
	return ret;
}

vector<Subnet> MemoryStore::listSubnets()
{
	vector<Subnet> ret;
	pthread_mutex_lock(&this->lock);
	for(map<int64_t, Subnet>::const_iterator iter = subnets.begin(); iter != subnets.end(); ++iter)
		ret.push_back(iter->second);
	pthread_mutex_unlock(&this->lock);
	return ret;
}

vector<DynamicRange> MemoryStore::listEnabledRanges(int64_t subnetId)
{
	vector<DynamicRange> ret;
	pthread_mutex_lock(&this->lock);
	for(map<int64_t, DynamicRange>::const_iterator iter = ranges.begin(); iter != ranges.end(); ++iter)
	{
		if(iter->second.subnetId == subnetId && iter->second.enabled)
			ret.push_back(iter->second);
	}
	pthread_mutex_unlock(&this->lock);
	return ret;
}

vector<StaticIP> MemoryStore::listEnabledStaticIPs(int64_t subnetId)
{
	vector<StaticIP> ret;
	pthread_mutex_lock(&this->lock);
	for(map<int64_t, StaticIP>::const_iterator iter = staticIPs.begin(); iter != staticIPs.end(); ++iter)
	{
		if(iter->second.subnetId == subnetId && iter->second.enabled)
			ret.push_back(iter->second);
	}
	pthread_mutex_unlock(&this->lock);
	return ret;
}

vector<Lease> MemoryStore::listActiveLeasesForSubnet(int64_t subnetId)
{
	time_t now = time(0);
	vector<Lease> ret;
	pthread_mutex_lock(&this->lock);
	for(map<int64_t, Lease>::const_iterator iter = leases.begin(); iter != leases.end(); ++iter)
	{
		if(iter->second.subnetId == subnetId && iter->second.isActive(now))
			ret.push_back(iter->second);
	}
	pthread_mutex_unlock(&this->lock);
	return ret;
}
