/*
 * listener.hh
 *
 *  Created on: 2026. 10. 16.
 */

#ifndef LISTENER_HH_
#define LISTENER_HH_

#include "socket.hh"
#include "packet.hh"
#include <event.h>
#include <pthread.h>
#include <queue>

#define IO_BURST 16

class Dispatcher;

class Listener
{
private:
	UDPSocket* sock;
	Dispatcher* dispatcher;

	struct event_base* evbase;
	struct event* termEvent;
	struct event* readEvent;
	struct event* sendEvent;

	int termEventFD;
	int sendPacketFD;

	pthread_mutex_t sendPacketLock;
	std::queue<Packet*> sendPacketRequestQueue;

	static void read_packet(int fd, short what, void *arg);
	static void send_packet(int fd, short what, void *arg);

	Listener(const Listener&);
	Listener& operator=(const Listener&);
public:
	Listener(struct in_addr localIP, Dispatcher* dispatcher);
	~Listener();

	// false when the socket could not be bound
	bool isValid() const;
	struct in_addr getLocalIP() const;

	void serve(void);

	void terminate();

	// Takes ownership of packet; it is broadcast from the listener thread.
	void sendPacketRequest(Packet* packet);
};

#endif /* LISTENER_HH_ */
