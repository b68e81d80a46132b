/*
 * socket.hh
 *
 *  Created on: 2026. 10. 16.
 */

#ifndef SOCKET_HH_
#define SOCKET_HH_

#include <netinet/in.h>

class UDPSocket
{
private:
	int sock;
	struct in_addr localIP;

	UDPSocket(const UDPSocket&);
	UDPSocket& operator=(const UDPSocket&);
public:
	// Binds localIP:port; check isValid() afterwards.
	UDPSocket(struct in_addr localIP, int port);
	~UDPSocket();

	bool isValid() const;
	int getFD() const;
	struct in_addr getLocalIP() const;

	// Non-blocking; -1 when nothing is pending.
	int readPacket(void* buffer, int length);

	// Broadcast to 255.255.255.255:port.
	int writePacket(const void* buffer, int length, int port);
};

#endif /* SOCKET_HH_ */
