#include <caskio_file.hpp>

#include <stdint.h>
#include <stdio.h>
#include <sys/types.h>

#include <logging.hpp>


bool Cask::FileDisk::open(const char* const path, Cask::Endian endian) {
    this->close();
    _endian = endian;
    _offset = 0;
    _size = 0;

    _fp = fopen(path, "rb");
    if(!_fp) { LOGVER("couldn't open %s for reading", path); return false; }

    //fseeko/ftello so containers over 2GB keep working
    if(fseeko(_fp, 0, SEEK_END) != 0) { this->close(); return false; }
    off_t end = ftello(_fp);
    if(end < 0 || fseeko(_fp, 0, SEEK_SET) != 0) { this->close(); return false; }
    _size = (uint64_t)end;

    return true;
}

bool Cask::FileDisk::close() {
    if(!_fp)
        return false;
    fclose(_fp);
    _fp = nullptr;
    return true;
}

bool Cask::FileDisk::read(uint8_t* data, size_t size) {
    if(!_fp)
        return false;
    if(size == 0)
        return true;
    if(_offset + size > _size)
        return false;

    size_t ret = fread((void*)data, 1, size, _fp);
    _offset += ret;

    return ret == size;
}

bool Cask::FileDisk::skip(int64_t length) {
    return this->seek(length, Cask::Seek_current);
}

bool Cask::FileDisk::seek(int64_t pos, Cask::Seek mode) {
    if(!_fp)
        return false;

    int64_t target;
    if(mode == Cask::Seek_current) { target = (int64_t)_offset + pos; }
    else if(mode == Cask::Seek_end) { target = (int64_t)_size + pos; }
    else if(mode == Cask::Seek_start) { target = pos; }
    else { return false; }

    if(target < 0 || (uint64_t)target > _size) { return false; }
    if(fseeko(_fp, (off_t)target, SEEK_SET) != 0) { return false; }
    _offset = (uint64_t)target;

    return true;
}

Cask::FileDisk::~FileDisk() {
    this->close();
}
