#include <cask_stream.hpp>

Cask::Status Cask::Stream::read_exact(uint8_t* data, size_t size) {
	size_t got = 0;
	Status ret = read(data, size, got);
	if(ret != Status::ok) { return ret; }
	if(got != size) { return Status::out_of_bounds; }
	return Status::ok;
}

Cask::Status Cask::Stream::read_to_end(std::vector<uint8_t>& out) {
	out.clear();
	uint64_t remaining = size() > tell() ? size() - tell() : 0;
	if(remaining && remaining < ((uint64_t)1 << 31)) { out.reserve((size_t)remaining); }
	
	uint8_t buf[0x10000];
	while(true) {
		size_t got = 0;
		Status ret = read(buf, sizeof(buf), got);
		out.insert(out.end(), buf, buf + got);
		if(ret != Status::ok) { return ret; }
		if(got == 0) { break; }
	}
	return Status::ok;
}

Cask::Status Cask::Stream::peek(uint8_t* data, size_t size, size_t& read_count) {
	uint64_t pos = tell();
	read_count = 0;
	Status ret = read(data, size, read_count);
	Status restore = seek(pos);
	if(ret != Status::ok) { return ret; }
	return restore;
}
