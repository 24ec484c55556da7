#include <caskio_file.hpp>

bool Cask::File::read_endian(uint8_t* data, size_t size, Endian endian) {
    if(!this->read(data, size))
        return false;

    //swap to endian
    if(endian == Cask::Endian::current) { endian = _endian; }

    //assume we're on little endian (x86)
    if(endian == Cask::Endian::big && size > 1) {
        for(size_t low = 0, high = size - 1; low < high; low++, high--) {
            uint8_t tmp = data[low];
            data[low] = data[high];
            data[high] = tmp;
        }
    }

    return true;
}
