/*
 * database.hh
 *
 *  Created on: 2026. 10. 16.
 */

#ifndef DATABASE_HH_
#define DATABASE_HH_

#include "lease_store.hh"
#include <cppconn/driver.h>
#include <cppconn/connection.h>
#include <cppconn/exception.h>
#include <cppconn/prepared_statement.h>
#include <pthread.h>
#include <string>

/*
 * LeaseStore over the tables of sql/schema.sql. One connection shared by
 * all workers; lease writes additionally hold a per-address GET_LOCK so
 * that several servers on the same schema serialize too.
 */
class Database : public LeaseStore
{
private:
	sql::Driver* driver;
	sql::Connection* conn;
	pthread_mutex_t connLock;

	std::string host;
	std::string userName;
	std::string passwd;
	std::string dbName;
	int timeout;

	sql::PreparedStatement* selectStaticByMAC;
	sql::PreparedStatement* selectActiveLease;
	sql::PreparedStatement* selectLeaseByID;
	sql::PreparedStatement* selectLeaseHolders;
	sql::PreparedStatement* selectSubnet;
	sql::PreparedStatement* selectAllSubnets;
	sql::PreparedStatement* selectEnabledRanges;
	sql::PreparedStatement* selectEnabledStatics;
	sql::PreparedStatement* selectActiveLeases;
	sql::PreparedStatement* updateLeaseEnd;
	sql::PreparedStatement* deactivateMACLeases;
	sql::PreparedStatement* insertLease;
	sql::PreparedStatement* selectInsertID;
	sql::PreparedStatement* expireLeaseByID;
	sql::PreparedStatement* getLock;
	sql::PreparedStatement* releaseLock;

	void connect();
	void disconnect();
	void ensureConnected();
	bool recover(sql::SQLException &e, int attempt);

	boost::optional<Lease> findLease(int64_t leaseId);
	boost::optional<Lease> writeLease(const MacAddress& mac, int64_t subnetId,
			struct in_addr address, time_t start, time_t end,
			const boost::optional<std::string>& hostname);

	Database(const Database&);
	Database& operator=(const Database&);
public:
	/*
	 * Throws StoreError when the connection cannot be established. A
	 * connection lost later is re-established on the next failing call,
	 * which is then retried once.
	 */
	Database(const char* host, const char* userName, const char* passwd, const char* dbName,
			int timeout);
	virtual ~Database();

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

#endif /* DATABASE_HH_ */
