#pragma once

#include <stdint.h>

#include <string>
#include <vector>

#include "cask_status.hpp"

namespace Cask {
	
	struct Segment {
		uint64_t physical_offset = 0;
		uint64_t physical_size = 0;
		uint64_t logical_size = 0;
		bool compressed = false;
		
		Segment() {}
		Segment(uint64_t offset, uint64_t physical, uint64_t logical, bool is_compressed)
			: physical_offset(offset), physical_size(physical), logical_size(logical), compressed(is_compressed) {}
	};
	
	//one logical file inside a container. built once by the index parser,
	//never changed afterwards.
	class EntryDescriptor {
	public:
		static constexpr size_t npos = (size_t)-1;
		
		EntryDescriptor() {}
		EntryDescriptor(std::string name, std::vector<Segment> segments);
		
		//like the constructor, but rejects a declared size that differs from the
		//segment sum and raw segments that store fewer bytes than they claim
		static Status create(std::string name, uint64_t declared_size, std::vector<Segment> segments, EntryDescriptor& out);
		//single raw segment, the common case
		static EntryDescriptor raw(std::string name, uint64_t offset, uint64_t size);
		
		const std::string& name() const { return _name; }
		uint64_t size() const { return _size; }
		const std::vector<Segment>& segments() const { return _segments; }
		uint64_t segment_start(size_t index) const { return _starts[index]; }
		bool compressed() const;
		
		//index of the segment holding logical position pos; hint is tried first
		size_t locate(uint64_t pos, size_t hint = npos) const;
		//every physical range ends inside a container of this size
		bool fits(uint64_t container_size) const;
		
	private:
		std::string _name;
		uint64_t _size = 0;
		std::vector<Segment> _segments;
		std::vector<uint64_t> _starts; //cumulative logical start of each segment
	};
	
	//structural_corruption if any two entries share physical bytes
	Status check_disjoint(const std::vector<EntryDescriptor>& entries);
}
