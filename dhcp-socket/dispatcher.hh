/*
 * dispatcher.hh
 *
 *  Created on: 2026. 10. 16.
 */

#ifndef DISPATCHER_HH_
#define DISPATCHER_HH_

#include "allocator.hh"
#include "packet.hh"
#include <event.h>
#include <pthread.h>
#include <time.h>
#include <queue>
#include <vector>

// Packets beyond this many waiting jobs are dropped.
#define MAX_PENDING_JOBS 1024

class Listener;

struct dhcp_job
{
	Listener* listener;
	Packet* packet;
};

class Dispatcher;

struct worker
{
	Dispatcher* dispatcher;
	struct event_base* evbase;
	struct event* termEvent;
	struct event* jobEvent;
	int termEventFD;
	pthread_t thread;
	bool running;
};

/*
 * Worker pool between the listeners and the allocator. Every worker
 * waits on the same semaphore eventfd and takes one job per wake-up.
 */
class Dispatcher
{
private:
	Allocator* allocator;

	int jobFD;
	std::queue<struct dhcp_job> jobQueue;
	pthread_mutex_t jobLock;
	unsigned long droppedJobs;
	time_t lastDropReport;

	std::vector<struct worker*> workers;

	static void take_job(int fd, short what, void *arg);
	static void* serve_worker(void* arg);

	void process(const struct dhcp_job& job);

	Dispatcher(const Dispatcher&);
	Dispatcher& operator=(const Dispatcher&);
public:
	Dispatcher(Allocator* allocator, int workerCount);
	~Dispatcher();

	// Returns the number of workers started.
	int start();

	void terminate();
	void join();

	// Takes ownership of packet. Dropped once MAX_PENDING_JOBS are waiting.
	void dispatch(Listener* listener, Packet* packet);

	size_t getPendingJobs();
};

#endif /* DISPATCHER_HH_ */
