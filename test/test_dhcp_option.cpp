/*
 * test_dhcp_option.cpp
 *
 *  Created on: 2026. 10. 16.
 */

#include <catch2/catch.hpp>
#include "dhcp_option.hh"
#include "test_util.hh"

// Options are compared inside extra parentheses: Catch cannot print a variant.

static DHCPOption roundtrip(const DHCPOption& option)
{
	std::vector<uint8_t> payload = encodeOptionPayload(option);
	return parseOption(optionCode(option), payload.empty() ? 0 : &payload[0], (int)payload.size());
}

TEST_CASE("Known option shapes", "[option]") {
	std::vector<struct in_addr> dns;
	dns.push_back(ip("8.8.8.8"));
	dns.push_back(ip("8.8.4.4"));

	SECTION("Typed options survive encoding") {
		std::vector<DHCPOption> options;
		options.push_back(SubnetMaskOption(ip("255.255.255.0")));
		options.push_back(RouterOption(std::vector<struct in_addr>(1, ip("192.168.1.1"))));
		options.push_back(DNSServerOption(dns));
		options.push_back(HostnameOption("printer"));
		options.push_back(DomainNameOption("test.local"));
		options.push_back(RequestedIPOption(ip("192.168.1.100")));
		options.push_back(LeaseTimeOption(86400));
		options.push_back(MessageTypeOption(DHCPREQUEST));
		options.push_back(ServerIdentifierOption(ip("192.168.1.1")));
		options.push_back(RenewalTimeOption(43200));
		options.push_back(RebindingTimeOption(75600));

		for(size_t k = 0; k < options.size(); k++)
		{
			INFO("option code " << (int)optionCode(options[k]));
			CHECK((roundtrip(options[k]) == options[k]));
		}
	}
	SECTION("Codes") {
		CHECK(optionCode(SubnetMaskOption()) == OPTION_SUBNET_MASK);
		CHECK(optionCode(DNSServerOption()) == OPTION_DNS_SERVER);
		CHECK(optionCode(MessageTypeOption(DHCPACK)) == OPTION_MESSAGE_TYPE);
		CHECK(optionCode(UnknownOption(77, std::vector<uint8_t>())) == 77);
	}
	SECTION("Durations are big-endian") {
		std::vector<uint8_t> payload = encodeOptionPayload(LeaseTimeOption(0x01020304));
		REQUIRE(payload.size() == 4);
		CHECK(payload[0] == 1);
		CHECK(payload[3] == 4);
	}
}

TEST_CASE("Mismatched shapes stay opaque", "[option]") {
	uint8_t data[8] = {192, 168, 1, 1, 10, 0, 0, 1};

	SECTION("Subnet mask with 3 bytes") {
		DHCPOption option = parseOption(OPTION_SUBNET_MASK, data, 3);
		const UnknownOption* unknown = boost::get<UnknownOption>(&option);
		REQUIRE(unknown != 0);
		CHECK(unknown->code == OPTION_SUBNET_MASK);
		CHECK(unknown->data.size() == 3);
	}
	SECTION("Router list not a multiple of 4") {
		DHCPOption option = parseOption(OPTION_ROUTER, data, 6);
		CHECK(boost::get<UnknownOption>(&option) != 0);
	}
	SECTION("Empty DNS list") {
		DHCPOption option = parseOption(OPTION_DNS_SERVER, data, 0);
		CHECK(boost::get<UnknownOption>(&option) != 0);
	}
	SECTION("Empty hostname") {
		DHCPOption option = parseOption(OPTION_HOSTNAME, data, 0);
		CHECK(boost::get<UnknownOption>(&option) != 0);
	}
	SECTION("Message type out of range") {
		uint8_t nine = 9;
		DHCPOption option = parseOption(OPTION_MESSAGE_TYPE, &nine, 1);
		CHECK(boost::get<UnknownOption>(&option) != 0);
	}
	SECTION("Two routers") {
		DHCPOption option = parseOption(OPTION_ROUTER, data, 8);
		const RouterOption* router = boost::get<RouterOption>(&option);
		REQUIRE(router != 0);
		REQUIRE(router->addresses.size() == 2);
		CHECK(router->addresses[1] == ip("10.0.0.1"));
	}
	SECTION("Unknown codes keep their bytes") {
		DHCPOption option = parseOption(150, data, 5);
		CHECK((roundtrip(option) == option));
	}
}

TEST_CASE("Long payloads are truncated to one length byte", "[option]") {
	SECTION("Text") {
		std::vector<uint8_t> payload = encodeOptionPayload(HostnameOption(std::string(300, 'x')));
		CHECK(payload.size() == DHCP_OPTION_MAX_LEN);
	}
	SECTION("Address lists keep whole addresses") {
		std::vector<struct in_addr> many(70, ip("10.0.0.1"));
		std::vector<uint8_t> payload = encodeOptionPayload(DNSServerOption(many));
		CHECK(payload.size() == 252);
	}
	SECTION("Unknown data") {
		std::vector<uint8_t> data(400, 7);
		std::vector<uint8_t> payload = encodeOptionPayload(UnknownOption(200, data));
		CHECK(payload.size() == DHCP_OPTION_MAX_LEN);
	}
	SECTION("encodeOption writes code and length") {
		Packet packet(64);
		int written = encodeOption(MessageTypeOption(DHCPOFFER), &packet, 10);
		CHECK(written == 3);
		CHECK(packet.readByte(10) == OPTION_MESSAGE_TYPE);
		CHECK(packet.readByte(11) == 1);
		CHECK(packet.readByte(12) == DHCPOFFER);
	}
	SECTION("encodeOption fails past capacity") {
		Packet packet(4);
		CHECK(encodeOption(LeaseTimeOption(60), &packet, 0) == -1);
	}
}
