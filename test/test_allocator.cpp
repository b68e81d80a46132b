/*
 * test_allocator.cpp
 *
 *  Created on: 2026. 10. 16.
 */

#include <catch2/catch.hpp>
#include "allocator.hh"
#include "memory_store.hh"
#include "test_util.hh"
#include <pthread.h>
#include <time.h>

// 192.168.1.0/24, gateway .1, dynamic range .100-.150
static int64_t add_test_subnet(MemoryStore* store)
{
	Subnet subnet;
	subnet.network = ip("192.168.1.0");
	subnet.prefix = 24;
	subnet.gateway = ip("192.168.1.1");
	subnet.dnsServers.push_back(ip("8.8.8.8"));
	subnet.dnsServers.push_back(ip("8.8.4.4"));
	subnet.domainName = std::string("test.local");
	int64_t id = store->addSubnet(subnet);

	DynamicRange range;
	range.subnetId = id;
	range.start = ip("192.168.1.100");
	range.end = ip("192.168.1.150");
	store->addRange(range);
	return id;
}

static void add_static(MemoryStore* store, int64_t subnetId, const char* client, const char* address)
{
	StaticIP staticIP;
	staticIP.subnetId = subnetId;
	staticIP.mac = mac(client);
	staticIP.address = ip(address);
	store->addStaticIP(staticIP);
}

static int64_t add_active_lease(MemoryStore* store, int64_t subnetId, const char* client, const char* address)
{
	time_t now = time(0);
	Lease lease;
	lease.subnetId = subnetId;
	lease.mac = mac(client);
	lease.address = ip(address);
	lease.start = now;
	lease.end = now + 3600;
	return store->addLease(lease);
}

static DHCPPacket make_request_for(const char* client, const char* address)
{
	DHCPPacket packet = make_request(DHCPREQUEST, mac(client), 0x1234);
	packet.options.push_back(RequestedIPOption(ip(address)));
	return packet;
}

static MessageType reply_type(const DHCPPacket& reply)
{
	const MessageTypeOption* option = find_option<MessageTypeOption>(reply);
	REQUIRE(option != 0);
	return option->type;
}

static std::vector<uint8_t> option_order(const DHCPPacket& packet)
{
	std::vector<uint8_t> codes;
	for(std::vector<DHCPOption>::const_iterator iter = packet.options.begin(); iter != packet.options.end(); ++iter)
		codes.push_back(optionCode(*iter));
	return codes;
}

// Throws on every call.
class BrokenStore : public LeaseStore
{
public:
	virtual boost::optional<StaticIP> getStaticByMac(const MacAddress&) { throw StoreError("down"); }
	virtual boost::optional<Lease> getActiveLease(const MacAddress&) { throw StoreError("down"); }
	virtual boost::optional<Lease> createOrExtendLease(const MacAddress&, int64_t,
			struct in_addr, time_t, time_t, const boost::optional<std::string>&) { throw StoreError("down"); }
	virtual void expireLease(int64_t) { throw StoreError("down"); }
	virtual boost::optional<Subnet> getSubnet(int64_t) { throw StoreError("down"); }
	virtual std::vector<Subnet> listSubnets() { throw StoreError("down"); }
	virtual std::vector<DynamicRange> listEnabledRanges(int64_t) { throw StoreError("down"); }
	virtual std::vector<StaticIP> listEnabledStaticIPs(int64_t) { throw StoreError("down"); }
	virtual std::vector<Lease> listActiveLeasesForSubnet(int64_t) { throw StoreError("down"); }
};

TEST_CASE("DISCOVER", "[allocator]") {
	MemoryStore store;
	int64_t subnetId = add_test_subnet(&store);
	Allocator allocator(&store, LeasePolicy());
	DHCPPacket reply;

	SECTION("Static assignment is offered") {
		add_static(&store, subnetId, "AA:BB:CC:DD:EE:FF", "192.168.1.50");
		DHCPPacket request = make_request(DHCPDISCOVER, mac("AA:BB:CC:DD:EE:FF"), 0xCAFE);
		request.flags = BOOTP_BROADCAST;

		REQUIRE(allocator.handle(request, IP::ANY, &reply));
		CHECK(reply_type(reply) == DHCPOFFER);
		CHECK(reply.op == BOOTREPLY);
		CHECK(reply.htype == HTYPE_ETHER);
		CHECK(reply.hlen == 6);
		CHECK(reply.xid == 0xCAFE);
		CHECK(reply.flags == BOOTP_BROADCAST);
		CHECK(reply.chaddr == request.chaddr);
		CHECK(reply.yiaddr == ip("192.168.1.50"));
		CHECK(reply.siaddr == ip("192.168.1.1"));
		CHECK(IP::isZero(reply.ciaddr));
		// static addresses get no lease record
		CHECK(store.listLeases().empty());
	}
	SECTION("Offer options come in a fixed order") {
		add_static(&store, subnetId, "AA:BB:CC:DD:EE:FF", "192.168.1.50");
		REQUIRE(allocator.handle(make_request(DHCPDISCOVER, mac("AA:BB:CC:DD:EE:FF"), 1), IP::ANY, &reply));

		std::vector<uint8_t> expected;
		expected.push_back(OPTION_MESSAGE_TYPE);
		expected.push_back(OPTION_SERVER_IDENTIFIER);
		expected.push_back(OPTION_LEASE_TIME);
		expected.push_back(OPTION_SUBNET_MASK);
		expected.push_back(OPTION_ROUTER);
		expected.push_back(OPTION_DNS_SERVER);
		expected.push_back(OPTION_DOMAIN_NAME);
		CHECK(option_order(reply) == expected);

		CHECK(find_option<ServerIdentifierOption>(reply)->address == ip("192.168.1.1"));
		CHECK(find_option<LeaseTimeOption>(reply)->seconds == DEFAULT_LEASE_TIME);
		CHECK(find_option<SubnetMaskOption>(reply)->address == ip("255.255.255.0"));
		CHECK(find_option<RouterOption>(reply)->addresses.size() == 1);
		CHECK(find_option<DNSServerOption>(reply)->addresses.size() == 2);
		CHECK(find_option<DomainNameOption>(reply)->name == "test.local");
	}
	SECTION("Expiring hold is extended by a repeated offer") {
		time_t now = time(0);
		Lease hold;
		hold.subnetId = subnetId;
		hold.mac = mac("11:22:33:44:55:66");
		hold.address = ip("192.168.1.100");
		hold.start = now - 55;
		hold.end = now + 5;
		store.addLease(hold);

		REQUIRE(allocator.handle(make_request(DHCPDISCOVER, mac("11:22:33:44:55:66"), 1), IP::ANY, &reply));
		CHECK(reply.yiaddr == ip("192.168.1.100"));
		boost::optional<Lease> lease = store.getActiveLease(mac("11:22:33:44:55:66"));
		REQUIRE(lease.is_initialized());
		CHECK(lease->end >= now + DEFAULT_OFFER_TIME);
		CHECK(store.listLeases().size() == 1);
	}
	SECTION("Active lease is offered again") {
		add_active_lease(&store, subnetId, "11:22:33:44:55:66", "192.168.1.100");
		REQUIRE(allocator.handle(make_request(DHCPDISCOVER, mac("11:22:33:44:55:66"), 1), IP::ANY, &reply));
		CHECK(reply_type(reply) == DHCPOFFER);
		CHECK(reply.yiaddr == ip("192.168.1.100"));
	}
	SECTION("New client gets a free address from the range") {
		MacAddress client = mac("99:88:77:66:55:44");
		REQUIRE(allocator.handle(make_request(DHCPDISCOVER, client, 1), IP::ANY, &reply));
		CHECK(reply_type(reply) == DHCPOFFER);
		CHECK(IP::toHost(reply.yiaddr) >= IP::toHost(ip("192.168.1.100")));
		CHECK(IP::toHost(reply.yiaddr) <= IP::toHost(ip("192.168.1.150")));
		CHECK(reply.yiaddr != ip("192.168.1.1"));

		// the offered address is held for the offer time
		boost::optional<Lease> hold = store.getActiveLease(client);
		REQUIRE(hold.is_initialized());
		CHECK(hold->address == reply.yiaddr);
		CHECK(hold->end - hold->start == DEFAULT_OFFER_TIME);
	}
	SECTION("Two clients are offered different addresses") {
		DHCPPacket second;
		REQUIRE(allocator.handle(make_request(DHCPDISCOVER, mac("02:00:00:00:00:01"), 1), IP::ANY, &reply));
		REQUIRE(allocator.handle(make_request(DHCPDISCOVER, mac("02:00:00:00:00:02"), 2), IP::ANY, &second));
		CHECK(reply.yiaddr != second.yiaddr);
	}
	SECTION("Static addresses and leases are skipped") {
		add_static(&store, subnetId, "AA:BB:CC:DD:EE:FF", "192.168.1.100");
		add_active_lease(&store, subnetId, "11:22:33:44:55:66", "192.168.1.101");
		REQUIRE(allocator.handle(make_request(DHCPDISCOVER, mac("99:88:77:66:55:44"), 1), IP::ANY, &reply));
		CHECK(reply.yiaddr == ip("192.168.1.102"));
	}
	SECTION("Network, gateway and broadcast are never offered") {
		MemoryStore edge;
		Subnet subnet;
		subnet.network = ip("10.0.0.0");
		subnet.prefix = 30;
		subnet.gateway = ip("10.0.0.1");
		int64_t id = edge.addSubnet(subnet);
		DynamicRange range;
		range.subnetId = id;
		range.start = ip("10.0.0.0");
		range.end = ip("10.0.0.3");
		edge.addRange(range);
		Allocator edgeAllocator(&edge, LeasePolicy());

		REQUIRE(edgeAllocator.handle(make_request(DHCPDISCOVER, mac("02:00:00:00:00:01"), 1), IP::ANY, &reply));
		CHECK(reply.yiaddr == ip("10.0.0.2"));
		CHECK_FALSE(edgeAllocator.handle(make_request(DHCPDISCOVER, mac("02:00:00:00:00:02"), 2), IP::ANY, &reply));
	}
	SECTION("Exhausted pool means no reply") {
		MemoryStore small;
		Subnet subnet;
		subnet.network = ip("192.168.2.0");
		subnet.prefix = 24;
		subnet.gateway = ip("192.168.2.1");
		int64_t id = small.addSubnet(subnet);
		DynamicRange range;
		range.subnetId = id;
		range.start = ip("192.168.2.10");
		range.end = ip("192.168.2.10");
		small.addRange(range);
		add_active_lease(&small, id, "11:22:33:44:55:66", "192.168.2.10");
		Allocator smallAllocator(&small, LeasePolicy());

		CHECK_FALSE(smallAllocator.handle(make_request(DHCPDISCOVER, mac("99:88:77:66:55:44"), 1), IP::ANY, &reply));
	}
	SECTION("Disabled subnets are not served") {
		MemoryStore disabled;
		Subnet subnet;
		subnet.network = ip("192.168.3.0");
		subnet.prefix = 24;
		subnet.gateway = ip("192.168.3.1");
		subnet.enabled = false;
		int64_t id = disabled.addSubnet(subnet);
		DynamicRange range;
		range.subnetId = id;
		range.start = ip("192.168.3.100");
		range.end = ip("192.168.3.110");
		disabled.addRange(range);
		Allocator disabledAllocator(&disabled, LeasePolicy());

		CHECK_FALSE(disabledAllocator.handle(make_request(DHCPDISCOVER, mac("99:88:77:66:55:44"), 1), IP::ANY, &reply));
	}
	SECTION("Listener address selects the subnet") {
		CHECK(allocator.handle(make_request(DHCPDISCOVER, mac("99:88:77:66:55:44"), 1), ip("192.168.1.1"), &reply));
		CHECK_FALSE(allocator.handle(make_request(DHCPDISCOVER, mac("99:88:77:66:55:43"), 2), ip("172.16.0.1"), &reply));
	}
}

TEST_CASE("REQUEST", "[allocator]") {
	MemoryStore store;
	int64_t subnetId = add_test_subnet(&store);
	LeasePolicy policy;
	Allocator allocator(&store, policy);
	DHCPPacket reply;

	SECTION("Free address in the range is acknowledged") {
		MacAddress client = mac("99:88:77:66:55:44");
		DHCPPacket request = make_request_for("99:88:77:66:55:44", "192.168.1.120");
		request.options.push_back(HostnameOption("laptop"));

		REQUIRE(allocator.handle(request, IP::ANY, &reply));
		CHECK(reply_type(reply) == DHCPACK);
		CHECK(reply.yiaddr == ip("192.168.1.120"));
		CHECK(reply.xid == 0x1234);
		CHECK(find_option<LeaseTimeOption>(reply)->seconds == DEFAULT_LEASE_TIME);
		CHECK(find_option<RenewalTimeOption>(reply)->seconds == DEFAULT_LEASE_TIME / 2);
		CHECK(find_option<RebindingTimeOption>(reply)->seconds == DEFAULT_LEASE_TIME * 7 / 8);

		boost::optional<Lease> lease = store.getActiveLease(client);
		REQUIRE(lease.is_initialized());
		CHECK(lease->address == ip("192.168.1.120"));
		CHECK(lease->subnetId == subnetId);
		REQUIRE(lease->hostname.is_initialized());
		CHECK(*lease->hostname == "laptop");
	}
	SECTION("Offer then request keeps one lease") {
		MacAddress client = mac("99:88:77:66:55:44");
		REQUIRE(allocator.handle(make_request(DHCPDISCOVER, client, 1), IP::ANY, &reply));
		struct in_addr offered = reply.yiaddr;

		DHCPPacket request = make_request(DHCPREQUEST, client, 2);
		request.options.push_back(RequestedIPOption(offered));
		request.options.push_back(ServerIdentifierOption(ip("192.168.1.1")));
		REQUIRE(allocator.handle(request, IP::ANY, &reply));
		CHECK(reply_type(reply) == DHCPACK);
		CHECK(reply.yiaddr == offered);
		CHECK(store.listLeases().size() == 1);
		CHECK(store.listLeases()[0].end - store.listLeases()[0].start >= DEFAULT_LEASE_TIME);
	}
	SECTION("Another client's static address is refused") {
		add_static(&store, subnetId, "AA:BB:CC:DD:EE:FF", "192.168.1.120");
		REQUIRE(allocator.handle(make_request_for("99:88:77:66:55:44", "192.168.1.120"), IP::ANY, &reply));
		CHECK(reply_type(reply) == DHCPNAK);
		CHECK(IP::isZero(reply.yiaddr));
		CHECK(store.listLeases().empty());
	}
	SECTION("Static client is acknowledged without a lease") {
		add_static(&store, subnetId, "AA:BB:CC:DD:EE:FF", "192.168.1.50");
		REQUIRE(allocator.handle(make_request_for("AA:BB:CC:DD:EE:FF", "192.168.1.50"), IP::ANY, &reply));
		CHECK(reply_type(reply) == DHCPACK);
		CHECK(reply.yiaddr == ip("192.168.1.50"));
		CHECK(store.listLeases().empty());
	}
	SECTION("Static client asking for a different address is refused") {
		add_static(&store, subnetId, "AA:BB:CC:DD:EE:FF", "192.168.1.50");
		REQUIRE(allocator.handle(make_request_for("AA:BB:CC:DD:EE:FF", "192.168.1.120"), IP::ANY, &reply));
		CHECK(reply_type(reply) == DHCPNAK);
	}
	SECTION("Address outside the ranges is refused") {
		REQUIRE(allocator.handle(make_request_for("99:88:77:66:55:44", "192.168.1.20"), IP::ANY, &reply));
		CHECK(reply_type(reply) == DHCPNAK);
	}
	SECTION("Address outside the subnet is refused") {
		REQUIRE(allocator.handle(make_request_for("99:88:77:66:55:44", "10.1.2.3"), IP::ANY, &reply));
		CHECK(reply_type(reply) == DHCPNAK);
		// the NAK names the context subnet's gateway
		CHECK(find_option<ServerIdentifierOption>(reply)->address == ip("192.168.1.1"));
	}
	SECTION("Address leased to another client is refused") {
		add_active_lease(&store, subnetId, "11:22:33:44:55:66", "192.168.1.100");
		REQUIRE(allocator.handle(make_request_for("99:88:77:66:55:44", "192.168.1.100"), IP::ANY, &reply));
		CHECK(reply_type(reply) == DHCPNAK);
	}
	SECTION("NAK carries only message type and server identifier") {
		DHCPPacket request = make_request_for("99:88:77:66:55:44", "192.168.1.20");
		request.flags = BOOTP_BROADCAST;
		REQUIRE(allocator.handle(request, IP::ANY, &reply));
		REQUIRE(reply.options.size() == 2);
		CHECK(reply_type(reply) == DHCPNAK);
		CHECK(find_option<ServerIdentifierOption>(reply) != 0);
		CHECK(reply.flags == BOOTP_BROADCAST);
		CHECK(reply.chaddr == request.chaddr);
		CHECK(IP::isZero(reply.siaddr));
	}
	SECTION("Request for another server is ignored") {
		DHCPPacket request = make_request_for("99:88:77:66:55:44", "192.168.1.120");
		request.options.push_back(ServerIdentifierOption(ip("192.168.1.254")));
		CHECK_FALSE(allocator.handle(request, IP::ANY, &reply));
		CHECK(store.listLeases().empty());
	}
	SECTION("Renewal names the address in ciaddr only") {
		add_active_lease(&store, subnetId, "11:22:33:44:55:66", "192.168.1.100");
		DHCPPacket renew = make_request(DHCPREQUEST, mac("11:22:33:44:55:66"), 9);
		renew.ciaddr = ip("192.168.1.100");

		REQUIRE(allocator.handle(renew, IP::ANY, &reply));
		CHECK(reply_type(reply) == DHCPACK);
		CHECK(reply.yiaddr == ip("192.168.1.100"));
		boost::optional<Lease> lease = store.getActiveLease(mac("11:22:33:44:55:66"));
		REQUIRE(lease.is_initialized());
		CHECK(lease->end - time(0) >= DEFAULT_LEASE_TIME - 1);
		CHECK(store.listLeases().size() == 1);
	}
	SECTION("Renewal of another client's address is refused") {
		add_active_lease(&store, subnetId, "11:22:33:44:55:66", "192.168.1.100");
		DHCPPacket renew = make_request(DHCPREQUEST, mac("99:88:77:66:55:44"), 9);
		renew.ciaddr = ip("192.168.1.100");

		REQUIRE(allocator.handle(renew, IP::ANY, &reply));
		CHECK(reply_type(reply) == DHCPNAK);
	}
	SECTION("Request without an address is ignored") {
		CHECK_FALSE(allocator.handle(make_request(DHCPREQUEST, mac("99:88:77:66:55:44"), 1), IP::ANY, &reply));
	}
	SECTION("Silent policy drops instead of refusing") {
		policy.silentNak = true;
		Allocator silent(&store, policy);
		CHECK_FALSE(silent.handle(make_request_for("99:88:77:66:55:44", "192.168.1.20"), IP::ANY, &reply));
	}
	SECTION("Requested lease time is honoured up to the maximum") {
		DHCPPacket request = make_request_for("99:88:77:66:55:44", "192.168.1.120");
		request.options.push_back(LeaseTimeOption(600));
		REQUIRE(allocator.handle(request, IP::ANY, &reply));
		CHECK(find_option<LeaseTimeOption>(reply)->seconds == 600);

		request = make_request_for("99:88:77:66:55:44", "192.168.1.120");
		request.options.push_back(LeaseTimeOption(10000000));
		REQUIRE(allocator.handle(request, IP::ANY, &reply));
		CHECK(find_option<LeaseTimeOption>(reply)->seconds == DEFAULT_MAX_LEASE_TIME);

		boost::optional<Lease> lease = store.getActiveLease(mac("99:88:77:66:55:44"));
		REQUIRE(lease.is_initialized());
		CHECK(lease->end - time(0) <= DEFAULT_MAX_LEASE_TIME);
	}
}

struct requester
{
	Allocator* allocator;
	MacAddress client;
	pthread_barrier_t* barrier;
	bool acked;
};

static void* request_address(void* arg)
{
	struct requester* r = (struct requester*)arg;
	DHCPPacket request = make_request(DHCPREQUEST, r->client, 7);
	request.options.push_back(RequestedIPOption(ip("192.168.1.130")));

	DHCPPacket reply;
	pthread_barrier_wait(r->barrier);
	if(r->allocator->handle(request, IP::ANY, &reply))
	{
		const MessageTypeOption* type = find_option<MessageTypeOption>(reply);
		r->acked = type && type->type == DHCPACK;
	}
	return 0;
}

TEST_CASE("Static assignments in several subnets", "[allocator]") {
	MemoryStore store;
	Subnet other;
	other.network = ip("10.0.0.0");
	other.prefix = 24;
	other.gateway = ip("10.0.0.1");
	int64_t otherId = store.addSubnet(other);
	add_static(&store, otherId, "AA:BB:CC:DD:EE:FF", "10.0.0.50");

	int64_t subnetId = add_test_subnet(&store);
	add_static(&store, subnetId, "AA:BB:CC:DD:EE:FF", "192.168.1.50");

	Allocator allocator(&store, LeasePolicy());
	DHCPPacket reply;

	SECTION("Offer uses the assignment of the listener's subnet") {
		REQUIRE(allocator.handle(make_request(DHCPDISCOVER, mac("AA:BB:CC:DD:EE:FF"), 1), ip("192.168.1.1"), &reply));
		CHECK(reply.yiaddr == ip("192.168.1.50"));
		CHECK(store.listLeases().empty());

		REQUIRE(allocator.handle(make_request(DHCPDISCOVER, mac("AA:BB:CC:DD:EE:FF"), 2), ip("10.0.0.1"), &reply));
		CHECK(reply.yiaddr == ip("10.0.0.50"));
	}
	SECTION("Request for that assignment is acknowledged without a lease") {
		REQUIRE(allocator.handle(make_request_for("AA:BB:CC:DD:EE:FF", "192.168.1.50"), ip("192.168.1.1"), &reply));
		CHECK(reply_type(reply) == DHCPACK);
		CHECK(reply.yiaddr == ip("192.168.1.50"));
		CHECK(store.listLeases().empty());
	}
	SECTION("Request for a pool address is refused") {
		REQUIRE(allocator.handle(make_request_for("AA:BB:CC:DD:EE:FF", "192.168.1.120"), ip("192.168.1.1"), &reply));
		CHECK(reply_type(reply) == DHCPNAK);
	}
}

TEST_CASE("Concurrent requests for one address", "[allocator]") {
	const int CLIENTS = 8;
	MemoryStore store;
	add_test_subnet(&store);
	Allocator allocator(&store, LeasePolicy());

	pthread_barrier_t barrier;
	pthread_barrier_init(&barrier, 0, CLIENTS);
	struct requester requesters[CLIENTS];
	pthread_t threads[CLIENTS];
	for(int k = 0; k < CLIENTS; k++)
	{
		uint8_t bytes[6] = {0x02, 0x00, 0x00, 0x00, 0x01, (uint8_t)(k + 1)};
		requesters[k].allocator = &allocator;
		requesters[k].client = MacAddress(bytes);
		requesters[k].barrier = &barrier;
		requesters[k].acked = false;
		REQUIRE(pthread_create(&threads[k], 0, request_address, &requesters[k]) == 0);
	}
	for(int k = 0; k < CLIENTS; k++)
		pthread_join(threads[k], 0);
	pthread_barrier_destroy(&barrier);

	int acks = 0;
	for(int k = 0; k < CLIENTS; k++)
		if(requesters[k].acked)
			acks++;
	CHECK(acks == 1);

	int holders = 0;
	std::vector<Lease> leases = store.listLeases();
	for(std::vector<Lease>::iterator iter = leases.begin(); iter != leases.end(); ++iter)
		if(iter->address == ip("192.168.1.130") && iter->isActive(time(0)))
			holders++;
	CHECK(holders == 1);
}

TEST_CASE("RELEASE and DECLINE", "[allocator]") {
	MemoryStore store;
	int64_t subnetId = add_test_subnet(&store);
	Allocator allocator(&store, LeasePolicy());
	DHCPPacket reply;

	SECTION("Release ends the lease") {
		add_active_lease(&store, subnetId, "11:22:33:44:55:66", "192.168.1.100");
		DHCPPacket release = make_request(DHCPRELEASE, mac("11:22:33:44:55:66"), 1);
		release.ciaddr = ip("192.168.1.100");

		CHECK_FALSE(allocator.handle(release, IP::ANY, &reply));
		CHECK_FALSE(store.getActiveLease(mac("11:22:33:44:55:66")).is_initialized());
		REQUIRE(store.listLeases().size() == 1);
		CHECK_FALSE(store.listLeases()[0].active);
	}
	SECTION("Release reporting another address still ends the lease") {
		add_active_lease(&store, subnetId, "11:22:33:44:55:66", "192.168.1.100");
		DHCPPacket release = make_request(DHCPRELEASE, mac("11:22:33:44:55:66"), 1);
		release.ciaddr = ip("192.168.1.200");
		CHECK_FALSE(allocator.handle(release, IP::ANY, &reply));
		CHECK_FALSE(store.getActiveLease(mac("11:22:33:44:55:66")).is_initialized());
	}
	SECTION("Released address is not offered back first") {
		add_active_lease(&store, subnetId, "11:22:33:44:55:66", "192.168.1.101");
		DHCPPacket release = make_request(DHCPRELEASE, mac("11:22:33:44:55:66"), 1);
		release.ciaddr = ip("192.168.1.101");
		CHECK_FALSE(allocator.handle(release, IP::ANY, &reply));

		REQUIRE(allocator.handle(make_request(DHCPDISCOVER, mac("11:22:33:44:55:66"), 2), IP::ANY, &reply));
		CHECK(reply_type(reply) == DHCPOFFER);
		CHECK(reply.yiaddr == ip("192.168.1.100"));
	}
	SECTION("Release without a lease does nothing") {
		CHECK_FALSE(allocator.handle(make_request(DHCPRELEASE, mac("11:22:33:44:55:66"), 1), IP::ANY, &reply));
		CHECK(store.listLeases().empty());
	}
	SECTION("Declined address is quarantined") {
		add_active_lease(&store, subnetId, "11:22:33:44:55:66", "192.168.1.100");
		DHCPPacket decline = make_request(DHCPDECLINE, mac("11:22:33:44:55:66"), 1);
		decline.options.push_back(RequestedIPOption(ip("192.168.1.100")));

		CHECK_FALSE(allocator.handle(decline, IP::ANY, &reply));
		CHECK_FALSE(store.getActiveLease(mac("11:22:33:44:55:66")).is_initialized());

		std::vector<Lease> active = store.listActiveLeasesForSubnet(subnetId);
		REQUIRE(active.size() == 1);
		CHECK(active[0].mac.isZero());
		CHECK(active[0].address == ip("192.168.1.100"));
		CHECK(active[0].end - active[0].start == DEFAULT_DECLINE_TIME);

		REQUIRE(allocator.handle(make_request(DHCPDISCOVER, mac("99:88:77:66:55:44"), 2), IP::ANY, &reply));
		CHECK(reply.yiaddr != ip("192.168.1.100"));
	}
}

TEST_CASE("INFORM", "[allocator]") {
	MemoryStore store;
	add_test_subnet(&store);
	LeasePolicy policy;
	DHCPPacket reply;

	DHCPPacket inform = make_request(DHCPINFORM, mac("99:88:77:66:55:44"), 1);
	inform.ciaddr = ip("192.168.1.77");

	SECTION("Answered with network parameters only") {
		Allocator allocator(&store, policy);
		REQUIRE(allocator.handle(inform, IP::ANY, &reply));
		CHECK(reply_type(reply) == DHCPACK);
		CHECK(reply.ciaddr == ip("192.168.1.77"));
		CHECK(IP::isZero(reply.yiaddr));
		CHECK(find_option<LeaseTimeOption>(reply) == 0);
		CHECK(find_option<SubnetMaskOption>(reply) != 0);
		CHECK(find_option<RouterOption>(reply) != 0);
		CHECK(store.listLeases().empty());
	}
	SECTION("Unknown client address is ignored") {
		Allocator allocator(&store, policy);
		inform.ciaddr = ip("10.9.8.7");
		CHECK_FALSE(allocator.handle(inform, IP::ANY, &reply));
	}
	SECTION("Disabled by policy") {
		policy.inform = false;
		Allocator allocator(&store, policy);
		CHECK_FALSE(allocator.handle(inform, IP::ANY, &reply));
	}
}

TEST_CASE("Packets that get no answer", "[allocator]") {
	MemoryStore store;
	add_test_subnet(&store);
	Allocator allocator(&store, LeasePolicy());
	DHCPPacket reply;
	DHCPPacket request = make_request(DHCPDISCOVER, mac("99:88:77:66:55:44"), 1);

	SECTION("Replies from other servers") {
		request.op = BOOTREPLY;
		CHECK_FALSE(allocator.handle(request, IP::ANY, &reply));
	}
	SECTION("Non-Ethernet hardware") {
		request.htype = 6;
		CHECK_FALSE(allocator.handle(request, IP::ANY, &reply));
		request.htype = HTYPE_ETHER;
		request.hlen = 8;
		CHECK_FALSE(allocator.handle(request, IP::ANY, &reply));
	}
	SECTION("No message type") {
		request.options.clear();
		CHECK_FALSE(allocator.handle(request, IP::ANY, &reply));
	}
	SECTION("Server-side message types") {
		request.options.clear();
		request.options.push_back(MessageTypeOption(DHCPOFFER));
		CHECK_FALSE(allocator.handle(request, IP::ANY, &reply));
	}
	SECTION("Empty hardware address") {
		request.chaddr = MacAddress::NONE;
		CHECK_FALSE(allocator.handle(request, IP::ANY, &reply));
	}
	SECTION("Store failures") {
		BrokenStore broken;
		Allocator brokenAllocator(&broken, LeasePolicy());
		CHECK_FALSE(brokenAllocator.handle(request, IP::ANY, &reply));
		CHECK_FALSE(brokenAllocator.handle(make_request_for("99:88:77:66:55:44", "192.168.1.120"), IP::ANY, &reply));
	}
}
