/*
 * packet.hh
 *
 *  Created on: 2026. 10. 16.
 */

#ifndef PACKET_HH_
#define PACKET_HH_

#include <stdint.h>

#define MY_PACKET_LEN 1500

class Packet
{
private:
	int writtenByte;
	int capacity;
	unsigned char* memory;

	Packet(const Packet&);
	Packet& operator=(const Packet&);
public:
	Packet(int capacity);
	~Packet();

	int readByte(int index) const;
	bool writeByte(int index, uint8_t data);

	bool readByteArray(int from, int to, void* buffer) const;
	bool writeByteArray(int from, int to, const void* buffer);

	bool readUInt16(int index, uint16_t* value) const;
	bool readUInt32(int index, uint32_t* value) const;
	bool writeUInt16(int index, uint16_t value);
	bool writeUInt32(int index, uint32_t value);

	bool fill(int from, int to, uint8_t data);

	void setLength(int length);
	int getLength() const;
	int getCapacity() const;
	int setData(const void* data, int length);

	const unsigned char* getData() const;
	unsigned char* getData();
};

#endif /* PACKET_HH_ */
