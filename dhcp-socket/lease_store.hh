/*
 * lease_store.hh
 *
 *  Created on: 2026. 10. 16.
 */

#ifndef LEASE_STORE_HH_
#define LEASE_STORE_HH_

#include "models.hh"
#include <boost/optional.hpp>
#include <stdexcept>
#include <string>
#include <vector>

class StoreError : public std::runtime_error
{
public:
	explicit StoreError(const std::string& what) : std::runtime_error(what) {}
};

/*
 * Persistence seen by the allocator. Every call may throw StoreError.
 * "Active" always means active flag set and end > now.
 */
class LeaseStore
{
public:
	virtual ~LeaseStore() {}

	// Enabled entries only; lowest id wins when a MAC is bound in several subnets.
	virtual boost::optional<StaticIP> getStaticByMac(const MacAddress& mac) = 0;

	// Latest-ending active lease of the MAC.
	virtual boost::optional<Lease> getActiveLease(const MacAddress& mac) = 0;

	/*
	 * Empty when the address is actively held by another MAC.
	 * Extends the MAC's active lease on that address if there is one.
	 * Otherwise deactivates the MAC's other active leases and inserts a new one.
	 * The all-zero MAC (quarantine) may hold any number of leases.
	 */
	virtual boost::optional<Lease> createOrExtendLease(const MacAddress& mac, int64_t subnetId,
			struct in_addr address, time_t start, time_t end,
			const boost::optional<std::string>& hostname) = 0;

	virtual void expireLease(int64_t leaseId) = 0;

	virtual boost::optional<Subnet> getSubnet(int64_t subnetId) = 0;
	virtual std::vector<Subnet> listSubnets() = 0;
	virtual std::vector<DynamicRange> listEnabledRanges(int64_t subnetId) = 0;
	virtual std::vector<StaticIP> listEnabledStaticIPs(int64_t subnetId) = 0;
	virtual std::vector<Lease> listActiveLeasesForSubnet(int64_t subnetId) = 0;
};

#endif /* LEASE_STORE_HH_ */
