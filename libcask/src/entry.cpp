#include <cask_entry.hpp>

#include <algorithm>
#include <utility>

#include <logging.hpp>

Cask::EntryDescriptor::EntryDescriptor(std::string name, std::vector<Segment> segments)
	: _name(std::move(name)), _segments(std::move(segments)) {
	_starts.resize(_segments.size());
	for(size_t i = 0; i < _segments.size(); i++) {
		_starts[i] = _size;
		_size += _segments[i].logical_size;
	}
}

Cask::Status Cask::EntryDescriptor::create(std::string name, uint64_t declared_size, std::vector<Segment> segments, EntryDescriptor& out) {
	uint64_t sum = 0;
	for(const auto& seg : segments) {
		if(seg.logical_size > UINT64_MAX - sum) {
			LOGVER("%s: segment sizes overflow", name.c_str());
			return Status::structural_corruption;
		}
		sum += seg.logical_size;
		if(!seg.compressed && seg.physical_size < seg.logical_size) {
			LOGVER("%s: raw segment stores 0x%llx bytes but claims 0x%llx", name.c_str(),
				(unsigned long long)seg.physical_size, (unsigned long long)seg.logical_size);
			return Status::structural_corruption;
		}
	}
	if(sum != declared_size) {
		LOGVER("%s: declared size 0x%llx, segments add up to 0x%llx", name.c_str(),
			(unsigned long long)declared_size, (unsigned long long)sum);
		return Status::structural_corruption;
	}
	
	out = EntryDescriptor(std::move(name), std::move(segments));
	return Status::ok;
}

Cask::EntryDescriptor Cask::EntryDescriptor::raw(std::string name, uint64_t offset, uint64_t size) {
	return EntryDescriptor(std::move(name), { Segment(offset, size, size, false) });
}

bool Cask::EntryDescriptor::compressed() const {
	for(const auto& seg : _segments) {
		if(seg.compressed) { return true; }
	}
	return false;
}

size_t Cask::EntryDescriptor::locate(uint64_t pos, size_t hint) const {
	if(_segments.empty()) { return npos; }
	
	if(hint < _segments.size() && _starts[hint] <= pos && pos - _starts[hint] < _segments[hint].logical_size) {
		return hint;
	}
	
	//last segment starting at or before pos; empty segments sharing a start are skipped over
	auto it = std::upper_bound(_starts.begin(), _starts.end(), pos);
	if(it == _starts.begin()) { return 0; }
	return (size_t)(it - _starts.begin()) - 1;
}

bool Cask::EntryDescriptor::fits(uint64_t container_size) const {
	for(const auto& seg : _segments) {
		if(seg.physical_offset > container_size) { return false; }
		if(seg.physical_size > container_size - seg.physical_offset) { return false; }
	}
	return true;
}

Cask::Status Cask::check_disjoint(const std::vector<EntryDescriptor>& entries) {
	struct Range {
		uint64_t start;
		uint64_t end;
		size_t entry;
	};
	std::vector<Range> ranges;
	for(size_t i = 0; i < entries.size(); i++) {
		for(const auto& seg : entries[i].segments()) {
			if(seg.physical_size == 0) { continue; }
			ranges.push_back({ seg.physical_offset, seg.physical_offset + seg.physical_size, i });
		}
	}
	
	std::sort(ranges.begin(), ranges.end(), [](const Range& a, const Range& b) { return a.start < b.start; });
	size_t furthest = 0;
	for(size_t i = 1; i < ranges.size(); i++) {
		if(ranges[i].start < ranges[furthest].end) {
			LOGVER("%s overlaps %s", entries[ranges[i].entry].name().c_str(), entries[ranges[furthest].entry].name().c_str());
			return Status::structural_corruption;
		}
		if(ranges[i].end > ranges[furthest].end) { furthest = i; }
	}
	return Status::ok;
}
