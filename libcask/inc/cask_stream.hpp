#pragma once

#include <stdint.h>
#include <stddef.h>

#include <string>
#include <vector>

#include "cask_status.hpp"

namespace Cask {
	
	//read+seek view of one entry's bytes. instances belong to one consumer and
	//are not meant to be shared between threads.
	class Stream {
	public:
		virtual ~Stream() {}
		
		//fills as much of data as it can, fewer bytes only at the end or on error
		virtual Status read(uint8_t* data, size_t size, size_t& read_count) = 0;
		virtual Status seek(uint64_t pos) = 0;
		virtual uint64_t tell() const = 0;
		//for streams whose length is only known after decoding, this is the best guess so far
		virtual uint64_t size() const = 0;
		//false while size() is still a guess, reads then run until they come back empty
		virtual bool size_known() const { return true; }
		virtual const std::string& name() const = 0;
		
		Status rewind() { return seek(0); }
		Status read_exact(uint8_t* data, size_t size);
		Status read_to_end(std::vector<uint8_t>& out);
		//reads without moving the cursor
		Status peek(uint8_t* data, size_t size, size_t& read_count);
	};
}
