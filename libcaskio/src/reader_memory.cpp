#include <caskio_file.hpp>

#include <stdint.h>
#include <memory.h>
#include <utility>

#include <logging.hpp>

bool Cask::FileMemory::open(const uint8_t* data, size_t data_size, Endian endian) {
    this->close();
    if(!data && data_size)
        return false;

    _buffer = data;
    _size = data_size;
    _offset = 0;
    _endian = endian;

    return true;
}

bool Cask::FileMemory::open_owned(std::vector<uint8_t> data, Endian endian) {
    this->close();
    _owned = std::move(data);
    _buffer = _owned.data();
    _size = _owned.size();
    _offset = 0;
    _endian = endian;

    return true;
}

bool Cask::FileMemory::read(uint8_t* data, size_t size) {
    if(size == 0)
        return true;
    if(!_buffer)
        return false;

    if(_offset + size > _size) { return false; }
    memcpy(data, &_buffer[_offset], size);
    _offset += size;

    return true;
}

bool Cask::FileMemory::seek(int64_t pos, Cask::Seek mode) {
    int64_t target;
    if(mode == Cask::Seek_current) { target = (int64_t)_offset + pos; }
    else if(mode == Cask::Seek_end) { target = (int64_t)_size + pos; }
    else if(mode == Cask::Seek_start) { target = pos; }
    else { return false; }

    if(target < 0 || (uint64_t)target > _size) { return false; }
    _offset = (uint64_t)target;

    return true;
}

bool Cask::FileMemory::skip(int64_t length) {
    return this->seek(length, Cask::Seek_current);
}

bool Cask::FileMemory::close() {
    _owned.clear();
    _owned.shrink_to_fit();
    _buffer = nullptr;
    _size = 0;
    _offset = 0;
    return true;
}

Cask::FileMemory::~FileMemory() {
    this->close();
}
