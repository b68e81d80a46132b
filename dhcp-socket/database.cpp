/*
 * database.cpp
 *
 *  Created on: 2026. 10. 16.
 */

#include "database.hh"
#include "ip.hh"
#include <cppconn/driver.h>
#include <cppconn/datatype.h>
#include <cppconn/exception.h>
#include <cppconn/resultset.h>
#include <cppconn/statement.h>
#include <cppconn/prepared_statement.h>
#include <boost/scoped_ptr.hpp>
#include <stdio.h>
#include <syslog.h>
#include <time.h>
#include <vector>

using namespace std;
using namespace sql;

#define SUBNET_COLUMNS "`id`, `network`, `prefix_len`, `gateway`, `dns_servers`, `domain_name`, `enabled`"
#define RANGE_COLUMNS "`id`, `subnet_id`, `range_start`, `range_end`, `enabled`"
#define STATIC_COLUMNS "`id`, `subnet_id`, `mac_address`, `ip_address`, `hostname`, `enabled`"
// client error codes for a dropped connection
#define MYSQL_SERVER_GONE 2006
#define MYSQL_SERVER_LOST 2013

#define LEASE_COLUMNS "`id`, `subnet_id`, `mac_address`, `ip_address`, `lease_start`, `lease_end`, `hostname`, `active`"

class ConnectionGuard
{
private:
	pthread_mutex_t* lock;
public:
	explicit ConnectionGuard(pthread_mutex_t* lock) : lock(lock) { pthread_mutex_lock(lock); }
	~ConnectionGuard() { pthread_mutex_unlock(lock); }
};

static StoreError store_error(const char* operation, sql::SQLException &e)
{
	char buf[512];
	snprintf(buf, sizeof(buf), "SQL error on %s(%d, %s): %s",
			operation, e.getErrorCode(), e.getSQLStateCStr(), e.what());
	return StoreError(buf);
}

static struct in_addr read_ip(ResultSet* result, const char* column)
{
	struct in_addr addr;
	SQLString text = result->getString(column);
	if(!IP::readIP(text.c_str(), &addr))
	{
		syslog(LOG_WARNING, "Invalid IP (%s) in column %s", text.c_str(), column);
		addr = IP::ANY;
	}
	return addr;
}

static boost::optional<std::string> read_text(ResultSet* result, const char* column)
{
	if(result->isNull(column))
		return boost::none;
	return std::string(result->getString(column).c_str());
}

static void set_text(PreparedStatement* statement, int index, const boost::optional<std::string>& text)
{
	if(text)
		statement->setString(index, *text);
	else
		statement->setNull(index, sql::DataType::VARCHAR);
}

static Subnet read_subnet(ResultSet* result)
{
	Subnet subnet;
	subnet.id = result->getInt64("id");
	subnet.network = read_ip(result, "network");
	subnet.prefix = result->getInt("prefix_len");
	subnet.gateway = read_ip(result, "gateway");
	subnet.dnsServers = parseAddressList(result->getString("dns_servers").c_str());
	subnet.domainName = read_text(result, "domain_name");
	subnet.enabled = result->getBoolean("enabled");
	return subnet;
}

static DynamicRange read_range(ResultSet* result)
{
	DynamicRange range;
	range.id = result->getInt64("id");
	range.subnetId = result->getInt64("subnet_id");
	range.start = read_ip(result, "range_start");
	range.end = read_ip(result, "range_end");
	range.enabled = result->getBoolean("enabled");
	return range;
}

static bool read_static(ResultSet* result, StaticIP* staticIP)
{
	SQLString mac_str = result->getString("mac_address");
	if(!MacAddress::readMAC(mac_str.c_str(), &staticIP->mac))
	{
		syslog(LOG_WARNING, "Invalid MAC (%s) in static_ips", mac_str.c_str());
		return false;
	}
	staticIP->id = result->getInt64("id");
	staticIP->subnetId = result->getInt64("subnet_id");
	staticIP->address = read_ip(result, "ip_address");
	staticIP->hostname = read_text(result, "hostname");
	staticIP->enabled = result->getBoolean("enabled");
	return true;
}

static bool read_lease(ResultSet* result, Lease* lease)
{
	SQLString mac_str = result->getString("mac_address");
	if(!MacAddress::readMAC(mac_str.c_str(), &lease->mac))
	{
		syslog(LOG_WARNING, "Invalid MAC (%s) in leases", mac_str.c_str());
		return false;
	}
	lease->id = result->getInt64("id");
	lease->subnetId = result->getInt64("subnet_id");
	lease->address = read_ip(result, "ip_address");
	lease->start = (time_t)result->getInt64("lease_start");
	lease->end = (time_t)result->getInt64("lease_end");
	lease->hostname = read_text(result, "hostname");
	lease->active = result->getBoolean("active");
	return true;
}

Database::Database(const char* host, const char* userName, const char* passwd, const char* dbName,
		int timeout)
{
	this->host = host;
	this->userName = userName;
	this->passwd = passwd;
	this->dbName = dbName;
	this->timeout = timeout;

	driver = 0;
	conn = 0;

	selectStaticByMAC = 0;
	selectActiveLease = 0;
	selectLeaseByID = 0;
	selectLeaseHolders = 0;
	selectSubnet = 0;
	selectAllSubnets = 0;
	selectEnabledRanges = 0;
	selectEnabledStatics = 0;
	selectActiveLeases = 0;
	updateLeaseEnd = 0;
	deactivateMACLeases = 0;
	insertLease = 0;
	selectInsertID = 0;
	expireLeaseByID = 0;
	getLock = 0;
	releaseLock = 0;

	try
	{
		driver = get_driver_instance();
		connect();
	}
	catch(sql::SQLException &e)
	{
		throw store_error("connecting database", e);
	}

	pthread_mutex_init(&this->connLock, NULL);
	syslog(LOG_INFO, "Connected to database %s on %s", dbName, host);
}

/*
 * Opens the connection and prepares every statement. Statement handles
 * do not survive a reconnect, so the driver's own reconnect stays off and
 * recover() redoes all of this instead.
 */
void Database::connect()
{
	try
	{
		ConnectOptionsMap options;
		options["hostName"] = SQLString(host);
		options["userName"] = SQLString(userName);
		options["password"] = SQLString(passwd);
		options["schema"] = SQLString(dbName);
		options["OPT_CONNECT_TIMEOUT"] = timeout;
		options["OPT_READ_TIMEOUT"] = timeout;
		options["OPT_WRITE_TIMEOUT"] = timeout;
		options["OPT_RECONNECT"] = false;
		conn = driver->connect(options);

		selectStaticByMAC = conn->prepareStatement("SELECT " STATIC_COLUMNS " FROM `static_ips` WHERE `mac_address` = ? AND `enabled` = 1 ORDER BY `id` LIMIT 1");
		selectActiveLease = conn->prepareStatement("SELECT " LEASE_COLUMNS " FROM `leases` WHERE `mac_address` = ? AND `active` = 1 AND `lease_end` > ? ORDER BY `lease_end` DESC LIMIT 1");
		selectLeaseByID = conn->prepareStatement("SELECT " LEASE_COLUMNS " FROM `leases` WHERE `id` = ?");
		selectLeaseHolders = conn->prepareStatement("SELECT " LEASE_COLUMNS " FROM `leases` WHERE `ip_address` = ? AND `active` = 1 AND `lease_end` > ? FOR UPDATE");
		selectSubnet = conn->prepareStatement("SELECT " SUBNET_COLUMNS " FROM `subnets` WHERE `id` = ?");
		selectAllSubnets = conn->prepareStatement("SELECT " SUBNET_COLUMNS " FROM `subnets` ORDER BY `id`");
		selectEnabledRanges = conn->prepareStatement("SELECT " RANGE_COLUMNS " FROM `dynamic_ranges` WHERE `subnet_id` = ? AND `enabled` = 1 ORDER BY `id`");
		selectEnabledStatics = conn->prepareStatement("SELECT " STATIC_COLUMNS " FROM `static_ips` WHERE `subnet_id` = ? AND `enabled` = 1 ORDER BY `id`");
		selectActiveLeases = conn->prepareStatement("SELECT " LEASE_COLUMNS " FROM `leases` WHERE `subnet_id` = ? AND `active` = 1 AND `lease_end` > ? ORDER BY `id`");

		updateLeaseEnd = conn->prepareStatement("UPDATE `leases` SET `lease_end` = ?, `hostname` = COALESCE(?, `hostname`) WHERE `id` = ?");
		deactivateMACLeases = conn->prepareStatement("UPDATE `leases` SET `active` = 0 WHERE `mac_address` = ? AND `active` = 1");
		insertLease = conn->prepareStatement("INSERT INTO `leases` (`subnet_id`, `mac_address`, `ip_address`, `lease_start`, `lease_end`, `hostname`, `active`) VALUES (?, ?, ?, ?, ?, ?, 1)");
		selectInsertID = conn->prepareStatement("SELECT LAST_INSERT_ID() AS `id`");
		expireLeaseByID = conn->prepareStatement("UPDATE `leases` SET `active` = 0 WHERE `id` = ?");

		getLock = conn->prepareStatement("SELECT GET_LOCK(?, ?) AS `locked`");
		releaseLock = conn->prepareStatement("SELECT RELEASE_LOCK(?) AS `released`");
	}
	catch(sql::SQLException &)
	{
		disconnect();
		throw;
	}
}

void Database::disconnect()
{
	delete selectStaticByMAC;
	delete selectActiveLease;
	delete selectLeaseByID;
	delete selectLeaseHolders;
	delete selectSubnet;
	delete selectAllSubnets;
	delete selectEnabledRanges;
	delete selectEnabledStatics;
	delete selectActiveLeases;
	delete updateLeaseEnd;
	delete deactivateMACLeases;
	delete insertLease;
	delete selectInsertID;
	delete expireLeaseByID;
	delete getLock;
	delete releaseLock;

	selectStaticByMAC = 0;
	selectActiveLease = 0;
	selectLeaseByID = 0;
	selectLeaseHolders = 0;
	selectSubnet = 0;
	selectAllSubnets = 0;
	selectEnabledRanges = 0;
	selectEnabledStatics = 0;
	selectActiveLeases = 0;
	updateLeaseEnd = 0;
	deactivateMACLeases = 0;
	insertLease = 0;
	selectInsertID = 0;
	expireLeaseByID = 0;
	getLock = 0;
	releaseLock = 0;

	if(conn)
	{
		try
		{
			conn->close();
		}
		catch(sql::SQLException &e)
		{
			syslog(LOG_WARNING, "SQL error on closing database(%d): %s", e.getErrorCode(), e.getSQLStateCStr());
		}
		delete conn;
		conn = 0;
	}
}

// Connects again when a previous reconnect failed. Called with connLock held.
void Database::ensureConnected()
{
	if(conn == 0)
		connect();
}

/*
 * Called with connLock held after an operation failed. Returns true when
 * the connection was lost and has been re-established, so the operation
 * may be retried once.
 */
bool Database::recover(sql::SQLException &e, int attempt)
{
	if(attempt > 0)
		return false;
	if(e.getErrorCode() != MYSQL_SERVER_GONE && e.getErrorCode() != MYSQL_SERVER_LOST)
		return false;

	syslog(LOG_WARNING, "Lost database connection(%d), reconnecting", e.getErrorCode());
	disconnect();
	try
	{
		connect();
	}
	catch(sql::SQLException &e2)
	{
		syslog(LOG_ERR, "SQL error on reconnecting database(%d): %s", e2.getErrorCode(), e2.getSQLStateCStr());
		return false;
	}
	syslog(LOG_INFO, "Reconnected to database %s on %s", dbName.c_str(), host.c_str());
	return true;
}

Database::~Database()
{
	disconnect();
	pthread_mutex_destroy(&this->connLock);
}

boost::optional<StaticIP> Database::getStaticByMac(const MacAddress& mac)
{
	ConnectionGuard guard(&this->connLock);
	for(int attempt = 0; ; attempt++)
	{
		try
		{
			ensureConnected();
			boost::optional<StaticIP> ret;
			selectStaticByMAC->clearParameters();
			selectStaticByMAC->setString(1, mac.toString());
			boost::scoped_ptr<ResultSet> result(selectStaticByMAC->executeQuery());
			StaticIP staticIP;
			if(result->next() && read_static(result.get(), &staticIP))
				ret = staticIP;
			return ret;
		}
		catch(sql::SQLException &e)
		{
			if(!recover(e, attempt))
				throw store_error("selecting static IP", e);
		}
	}
}

boost::optional<Lease> Database::getActiveLease(const MacAddress& mac)
{
	ConnectionGuard guard(&this->connLock);
	for(int attempt = 0; ; attempt++)
	{
		try
		{
			ensureConnected();
			boost::optional<Lease> ret;
			selectActiveLease->clearParameters();
			selectActiveLease->setString(1, mac.toString());
			selectActiveLease->setInt64(2, (int64_t)time(0));
			boost::scoped_ptr<ResultSet> result(selectActiveLease->executeQuery());
			Lease lease;
			if(result->next() && read_lease(result.get(), &lease))
				ret = lease;
			return ret;
		}
		catch(sql::SQLException &e)
		{
			if(!recover(e, attempt))
				throw store_error("selecting active lease", e);
		}
	}
}

boost::optional<Lease> Database::findLease(int64_t leaseId)
{
	boost::optional<Lease> ret;
	selectLeaseByID->clearParameters();
	selectLeaseByID->setInt64(1, leaseId);
	boost::scoped_ptr<ResultSet> result(selectLeaseByID->executeQuery());
	Lease lease;
	if(result->next() && read_lease(result.get(), &lease))
		ret = lease;
	return ret;
}

boost::optional<Lease> Database::createOrExtendLease(const MacAddress& mac, int64_t subnetId,
		struct in_addr address, time_t start, time_t end,
		const boost::optional<std::string>& hostname)
{
	ConnectionGuard guard(&this->connLock);
	for(int attempt = 0; ; attempt++)
	{
		try
		{
			ensureConnected();
			return writeLease(mac, subnetId, address, start, end, hostname);
		}
		catch(sql::SQLException &e)
		{
			if(!recover(e, attempt))
				throw store_error("creating lease", e);
		}
	}
}

/*
 * The conditional write under GET_LOCK('dhcp-lease-<ip>') and a
 * transaction. A dropped session releases both on the server side, so
 * a lost connection is rethrown untouched for the caller to retry.
 */
boost::optional<Lease> Database::writeLease(const MacAddress& mac, int64_t subnetId,
		struct in_addr address, time_t start, time_t end,
		const boost::optional<std::string>& hostname)
{
	std::string ip_str = IP::toString(address);
	std::string mac_str = mac.toString();
	std::string lockName = "dhcp-lease-" + ip_str;
	boost::optional<Lease> ret;

	getLock->clearParameters();
	getLock->setString(1, lockName);
	getLock->setInt(2, timeout);
	{
		boost::scoped_ptr<ResultSet> locked(getLock->executeQuery());
		if(!locked->next() || locked->isNull("locked") || locked->getInt("locked") != 1)
			throw StoreError("cannot lock " + lockName);
	}

	try
	{
		conn->setAutoCommit(false);

		int64_t ownID = 0;
		bool conflict = false;

		selectLeaseHolders->clearParameters();
		selectLeaseHolders->setString(1, ip_str);
		selectLeaseHolders->setInt64(2, (int64_t)time(0));
		{
			boost::scoped_ptr<ResultSet> holders(selectLeaseHolders->executeQuery());
			while(holders->next())
			{
				if(std::string(holders->getString("mac_address").c_str()) == mac_str)
					ownID = holders->getInt64("id");
				else
					conflict = true;
			}
		}

		if(!conflict && ownID)
		{
			updateLeaseEnd->clearParameters();
			updateLeaseEnd->setInt64(1, (int64_t)end);
			set_text(updateLeaseEnd, 2, hostname);
			updateLeaseEnd->setInt64(3, ownID);
			updateLeaseEnd->executeUpdate();
			ret = findLease(ownID);
		}
		else if(!conflict)
		{
			if(!mac.isZero())
			{
				deactivateMACLeases->clearParameters();
				deactivateMACLeases->setString(1, mac_str);
				deactivateMACLeases->executeUpdate();
			}

			insertLease->clearParameters();
			insertLease->setInt64(1, subnetId);
			insertLease->setString(2, mac_str);
			insertLease->setString(3, ip_str);
			insertLease->setInt64(4, (int64_t)start);
			insertLease->setInt64(5, (int64_t)end);
			set_text(insertLease, 6, hostname);
			insertLease->executeUpdate();

			boost::scoped_ptr<ResultSet> inserted(selectInsertID->executeQuery());
			if(inserted->next())
				ret = findLease(inserted->getInt64("id"));
		}

		conn->commit();
		conn->setAutoCommit(true);

		releaseLock->clearParameters();
		releaseLock->setString(1, lockName);
		boost::scoped_ptr<ResultSet> released(releaseLock->executeQuery());
	}
	catch(sql::SQLException &e)
	{
		if(e.getErrorCode() != MYSQL_SERVER_GONE && e.getErrorCode() != MYSQL_SERVER_LOST)
		{
			try
			{
				conn->rollback();
				conn->setAutoCommit(true);
				releaseLock->clearParameters();
				releaseLock->setString(1, lockName);
				boost::scoped_ptr<ResultSet> released(releaseLock->executeQuery());
			}
			catch(sql::SQLException &e2)
			{
				syslog(LOG_ERR, "SQL error on rolling back lease(%d): %s", e2.getErrorCode(), e2.getSQLStateCStr());
			}
		}
		throw;
	}

	return ret;
}

void Database::expireLease(int64_t leaseId)
{
	ConnectionGuard guard(&this->connLock);
	for(int attempt = 0; ; attempt++)
	{
		try
		{
			ensureConnected();
			expireLeaseByID->clearParameters();
			expireLeaseByID->setInt64(1, leaseId);
			expireLeaseByID->executeUpdate();
			return;
		}
		catch(sql::SQLException &e)
		{
			if(!recover(e, attempt))
				throw store_error("expiring lease", e);
		}
	}
}

boost::optional<Subnet> Database::getSubnet(int64_t subnetId)
{
	ConnectionGuard guard(&this->connLock);
	for(int attempt = 0; ; attempt++)
	{
		try
		{
			ensureConnected();
			boost::optional<Subnet> ret;
			selectSubnet->clearParameters();
			selectSubnet->setInt64(1, subnetId);
			boost::scoped_ptr<ResultSet> result(selectSubnet->executeQuery());
			if(result->next())
				ret = read_subnet(result.get());
			return ret;
		}
		catch(sql::SQLException &e)
		{
			if(!recover(e, attempt))
				throw store_error("selecting subnet", e);
		}
	}
}

vector<Subnet> Database::listSubnets()
{
	ConnectionGuard guard(&this->connLock);
	for(int attempt = 0; ; attempt++)
	{
		try
		{
			ensureConnected();
			vector<Subnet> ret;
			boost::scoped_ptr<ResultSet> result(selectAllSubnets->executeQuery());
			while(result->next())
				ret.push_back(read_subnet(result.get()));
			return ret;
		}
		catch(sql::SQLException &e)
		{
			if(!recover(e, attempt))
				throw store_error("listing subnets", e);
		}
	}
}

vector<DynamicRange> Database::listEnabledRanges(int64_t subnetId)
{
	ConnectionGuard guard(&this->connLock);
	for(int attempt = 0; ; attempt++)
	{
		try
		{
			ensureConnected();
			vector<DynamicRange> ret;
			selectEnabledRanges->clearParameters();
			selectEnabledRanges->setInt64(1, subnetId);
			boost::scoped_ptr<ResultSet> result(selectEnabledRanges->executeQuery());
			while(result->next())
				ret.push_back(read_range(result.get()));
			return ret;
		}
		catch(sql::SQLException &e)
		{
			if(!recover(e, attempt))
				throw store_error("listing ranges", e);
		}
	}
}

vector<StaticIP> Database::listEnabledStaticIPs(int64_t subnetId)
{
	ConnectionGuard guard(&this->connLock);
	for(int attempt = 0; ; attempt++)
	{
		try
		{
			ensureConnected();
			vector<StaticIP> ret;
			selectEnabledStatics->clearParameters();
			selectEnabledStatics->setInt64(1, subnetId);
			boost::scoped_ptr<ResultSet> result(selectEnabledStatics->executeQuery());
			while(result->next())
			{
				StaticIP staticIP;
				if(read_static(result.get(), &staticIP))
					ret.push_back(staticIP);
			}
			return ret;
		}
		catch(sql::SQLException &e)
		{
			if(!recover(e, attempt))
				throw store_error("listing static IPs", e);
		}
	}
}

vector<Lease> Database::listActiveLeasesForSubnet(int64_t subnetId)
{
	ConnectionGuard guard(&this->connLock);
	for(int attempt = 0; ; attempt++)
	{
		try
		{
			ensureConnected();
			vector<Lease> ret;
			selectActiveLeases->clearParameters();
			selectActiveLeases->setInt64(1, subnetId);
			selectActiveLeases->setInt64(2, (int64_t)time(0));
			boost::scoped_ptr<ResultSet> result(selectActiveLeases->executeQuery());
			while(result->next())
			{
				Lease lease;
				if(read_lease(result.get(), &lease))
					ret.push_back(lease);
			}
			return ret;
		}
		catch(sql::SQLException &e)
		{
			if(!recover(e, attempt))
				throw store_error("listing leases", e);
		}
	}
}
