/*
 * message_type.hh
 *
 *  Created on: 2026. 10. 16.
 */

#ifndef MESSAGE_TYPE_HH_
#define MESSAGE_TYPE_HH_

#include <boost/optional.hpp>
#include <stdint.h>

enum MessageType
{
	DHCPDISCOVER = 1,
	DHCPOFFER = 2,
	DHCPREQUEST = 3,
	DHCPDECLINE = 4,
	DHCPACK = 5,
	DHCPNAK = 6,
	DHCPRELEASE = 7,
	DHCPINFORM = 8
};

uint8_t messageTypeToU8(MessageType type);
boost::optional<MessageType> messageTypeFromU8(uint8_t value);
const char* messageTypeName(MessageType type);

#endif /* MESSAGE_TYPE_HH_ */
