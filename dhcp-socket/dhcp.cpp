/*
 * dhcp.cpp
 *
 *  Created on: 2026. 10. 16.
 */

#include "dhcp.hh"
#include "ip.hh"
#include <memory.h>

const uint8_t DHCP::MAGIC_COOKIE[4] = {99, 130, 83, 99};

const char* decodeErrorName(DecodeError error)
{
	switch(error)
	{
	case DECODE_OK: return "ok";
	case DECODE_TOO_SMALL: return "packet too small";
	case DECODE_INVALID_HARDWARE_ADDRESS: return "invalid hardware address";
	}
	return "unknown error";
}

DHCPPacket::DHCPPacket()
{
	op = BOOTREQUEST;
	htype = HTYPE_ETHER;
	hlen = ETH_ALEN;
	hops = 0;
	xid = 0;
	secs = 0;
	flags = 0;
	ciaddr = IP::ANY;
	yiaddr = IP::ANY;
	siaddr = IP::ANY;
	giaddr = IP::ANY;
}

boost::optional<MessageType> DHCPPacket::getMessageType() const
{
	for(std::vector<DHCPOption>::const_iterator iter = options.begin(); iter != options.end(); ++iter)
	{
		const MessageTypeOption* option = boost::get<MessageTypeOption>(&*iter);
		if(option)
			return option->type;
	}
	return boost::none;
}

boost::optional<struct in_addr> DHCPPacket::getRequestedIP() const
{
	for(std::vector<DHCPOption>::const_iterator iter = options.begin(); iter != options.end(); ++iter)
	{
		const RequestedIPOption* option = boost::get<RequestedIPOption>(&*iter);
		if(option)
			return option->address;
	}
	return boost::none;
}

boost::optional<struct in_addr> DHCPPacket::getServerIdentifier() const
{
	for(std::vector<DHCPOption>::const_iterator iter = options.begin(); iter != options.end(); ++iter)
	{
		const ServerIdentifierOption* option = boost::get<ServerIdentifierOption>(&*iter);
		if(option)
			return option->address;
	}
	return boost::none;
}

boost::optional<uint32_t> DHCPPacket::getLeaseTime() const
{
	for(std::vector<DHCPOption>::const_iterator iter = options.begin(); iter != options.end(); ++iter)
	{
		const LeaseTimeOption* option = boost::get<LeaseTimeOption>(&*iter);
		if(option)
			return option->seconds;
	}
	return boost::none;
}

boost::optional<std::string> DHCPPacket::getHostname() const
{
	for(std::vector<DHCPOption>::const_iterator iter = options.begin(); iter != options.end(); ++iter)
	{
		const HostnameOption* option = boost::get<HostnameOption>(&*iter);
		if(option)
			return option->name;
	}
	return boost::none;
}

bool DHCPPacket::operator==(const DHCPPacket& other) const
{
	return op == other.op && htype == other.htype && hlen == other.hlen
			&& hops == other.hops && xid == other.xid
			&& secs == other.secs && flags == other.flags
			&& ciaddr == other.ciaddr && yiaddr == other.yiaddr
			&& siaddr == other.siaddr && giaddr == other.giaddr
			&& chaddr == other.chaddr && options == other.options;
}

DecodeError DHCP::decode(const Packet& packet, DHCPPacket* out)
{
	int length = packet.getLength();
	if(length < DHCP_HEADER_LEN)
		return DECODE_TOO_SMALL;

	DHCPPacket dhcp;
	bool ok = true;

	dhcp.op = (uint8_t)packet.readByte(0);
	dhcp.htype = (uint8_t)packet.readByte(1);
	dhcp.hlen = (uint8_t)packet.readByte(2);
	dhcp.hops = (uint8_t)packet.readByte(3);

	ok = ok && packet.readUInt32(4, &dhcp.xid);
	ok = ok && packet.readUInt16(8, &dhcp.secs);
	ok = ok && packet.readUInt16(10, &dhcp.flags);

	ok = ok && packet.readByteArray(12, 16, &dhcp.ciaddr);
	ok = ok && packet.readByteArray(16, 20, &dhcp.yiaddr);
	ok = ok && packet.readByteArray(20, 24, &dhcp.siaddr);
	ok = ok && packet.readByteArray(24, 28, &dhcp.giaddr);
	if(!ok)
		return DECODE_TOO_SMALL;

	uint8_t mac[ETH_ALEN];
	if(!packet.readByteArray(DHCP_CHADDR_OFFSET, DHCP_CHADDR_OFFSET + ETH_ALEN, mac))
		return DECODE_INVALID_HARDWARE_ADDRESS;
	dhcp.chaddr = MacAddress(mac);

	uint8_t cookie[4];
	if(packet.readByteArray(DHCP_MAGIC_OFFSET, DHCP_MAGIC_OFFSET + 4, cookie)
			&& memcmp(cookie, MAGIC_COOKIE, sizeof(cookie)) == 0)
	{
		uint8_t buffer[DHCP_OPTION_MAX_LEN];
		int current = DHCP_HEADER_LEN;
		while(current < length)
		{
			int code = packet.readByte(current);
			if(code == OPTION_END)
				break;
			if(code == OPTION_PAD)
			{
				current++;
				continue;
			}

			int optionLen = packet.readByte(current + 1);
			if(optionLen < 0)
				break; // no length byte
			if(!packet.readByteArray(current + 2, current + 2 + optionLen, buffer))
				break; // truncated payload

			dhcp.options.push_back(parseOption((uint8_t)code, buffer, optionLen));
			current += 2 + optionLen;
		}
	}

	*out = dhcp;
	return DECODE_OK;
}

int DHCP::encode(const DHCPPacket& dhcp, Packet* packet)
{
	if(packet->getCapacity() < DHCP_HEADER_LEN + 1)
		return -1;

	packet->setLength(0);
	bool ok = packet->fill(0, DHCP_HEADER_LEN, 0); // sname, file and chaddr padding stay zero

	ok = ok && packet->writeByte(0, dhcp.op);
	ok = ok && packet->writeByte(1, dhcp.htype);
	ok = ok && packet->writeByte(2, dhcp.hlen);
	ok = ok && packet->writeByte(3, dhcp.hops);

	ok = ok && packet->writeUInt32(4, dhcp.xid);
	ok = ok && packet->writeUInt16(8, dhcp.secs);
	ok = ok && packet->writeUInt16(10, dhcp.flags);

	ok = ok && packet->writeByteArray(12, 16, &dhcp.ciaddr);
	ok = ok && packet->writeByteArray(16, 20, &dhcp.yiaddr);
	ok = ok && packet->writeByteArray(20, 24, &dhcp.siaddr);
	ok = ok && packet->writeByteArray(24, 28, &dhcp.giaddr);

	ok = ok && packet->writeByteArray(DHCP_CHADDR_OFFSET, DHCP_CHADDR_OFFSET + ETH_ALEN, dhcp.chaddr.getBytes());
	ok = ok && packet->writeByteArray(DHCP_MAGIC_OFFSET, DHCP_MAGIC_OFFSET + 4, MAGIC_COOKIE);
	if(!ok)
		return -1;

	int current = DHCP_HEADER_LEN;
	for(std::vector<DHCPOption>::const_iterator iter = dhcp.options.begin(); iter != dhcp.options.end(); ++iter)
	{
		int written = encodeOption(*iter, packet, current);
		if(written < 0)
			return -1;
		current += written;
	}

	if(!packet->writeByte(current++, OPTION_END))
		return -1;

	packet->setLength(current);
	return current;
}
