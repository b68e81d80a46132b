/*
 * packet.cpp
 *
 *  Created on: 2026. 10. 16.
 */

#include "packet.hh"
#include <stdlib.h>
#include <memory.h>
#include <new>

Packet::Packet(int capacity)
{
	this->writtenByte = 0;
	this->capacity = capacity > 0 ? capacity : 0;
	this->memory = (unsigned char*)malloc(this->capacity > 0 ? this->capacity : 1);
	if(memory == 0)
		throw std::bad_alloc();
	memset(memory, 0, this->capacity);
}

Packet::~Packet()
{
	free(memory);
}

int Packet::setData(const void* data, int length)
{
	if(length < 0 || length > capacity)
		return -1;

	writtenByte = length;
	memcpy(memory, data, length);
	return length;
}

int Packet::readByte(int index) const
{
	if(index < 0 || index >= this->writtenByte)
		return -1;
	return memory[index];
}

bool Packet::writeByte(int index, uint8_t data)
{
	if(index < 0 || index >= this->capacity)
		return false;
	memory[index] = data;
	if(index >= writtenByte)
		writtenByte = index + 1;
	return true;
}

bool Packet::readByteArray(int from, int to, void* buffer) const
{
	if(from < 0 || to < from || to > this->writtenByte)
		return false;
	memcpy(buffer, memory+from, to-from);
	return true;
}

bool Packet::writeByteArray(int from, int to, const void* buffer)
{
	if(from < 0 || to < from || to > this->capacity)
		return false;
	memcpy(memory+from, buffer, to-from);
	if(to > writtenByte)
		writtenByte = to;
	return true;
}

bool Packet::readUInt16(int index, uint16_t* value) const
{
	unsigned char buf[2];
	if(!readByteArray(index, index+2, buf))
		return false;
	*value = (uint16_t)((buf[0] << 8) | buf[1]);
	return true;
}

bool Packet::readUInt32(int index, uint32_t* value) const
{
	unsigned char buf[4];
	if(!readByteArray(index, index+4, buf))
		return false;
	*value = ((uint32_t)buf[0] << 24) | ((uint32_t)buf[1] << 16)
			| ((uint32_t)buf[2] << 8) | (uint32_t)buf[3];
	return true;
}

bool Packet::writeUInt16(int index, uint16_t value)
{
	unsigned char buf[2];
	buf[0] = (value >> 8) & 0xFF;
	buf[1] = value & 0xFF;
	return writeByteArray(index, index+2, buf);
}

bool Packet::writeUInt32(int index, uint32_t value)
{
	unsigned char buf[4];
	buf[0] = (value >> 24) & 0xFF;
	buf[1] = (value >> 16) & 0xFF;
	buf[2] = (value >> 8) & 0xFF;
	buf[3] = value & 0xFF;
	return writeByteArray(index, index+4, buf);
}

bool Packet::fill(int from, int to, uint8_t data)
{
	if(from < 0 || to < from || to > this->capacity)
		return false;
	memset(memory+from, data, to-from);
	if(to > writtenByte)
		writtenByte = to;
	return true;
}

void Packet::setLength(int length)
{
	if(length < 0)
		length = 0;
	if(length > capacity)
		length = capacity;
	writtenByte = length;
}

int Packet::getLength() const
{
	return writtenByte;
}

int Packet::getCapacity() const
{
	return capacity;
}

const unsigned char* Packet::getData() const
{
	return memory;
}

unsigned char* Packet::getData()
{
	return memory;
}
