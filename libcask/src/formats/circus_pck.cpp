#include <cask_format.hpp>
#include <cask_text.hpp>

#include <algorithm>
#include <utility>

#include <logging.hpp>

#include "format_util.hpp"

static const size_t PCK_NAME_SIZE = 0x38;
static const uint32_t PCK_MAX_COUNT = 0x40000;

int Cask::Formats::circus_pck_sniff(const std::string& filename, const uint8_t* header, size_t size, const Options& options) {
	if(size < 12) { return NO_MATCH; }
	
	uint32_t count = peek_u32(header, 0);
	if(count == 0 || count >= PCK_MAX_COUNT) { return NO_MATCH; }
	//data starts after both tables
	if(peek_u32(header, 4) < 4 + (uint64_t)count * 8 + (uint64_t)count * (PCK_NAME_SIZE + 8)) { return NO_MATCH; }
	
	size_t visible = std::min<size_t>((size - 4) / 8, count);
	int score = 5 + (int)std::min<size_t>(visible / 2, 10);
	
	//the packer writes entries back to back
	uint64_t prev_end = (uint64_t)peek_u32(header, 4) + peek_u32(header, 8);
	for(size_t i = 1; i < visible; i++) {
		uint32_t offset = peek_u32(header, 4 + i * 8);
		uint32_t length = peek_u32(header, 8 + i * 8);
		if(offset != prev_end) { return NO_MATCH; }
		prev_end = (uint64_t)offset + length;
	}
	return score;
}

Cask::Status Cask::Formats::circus_pck_parse(Source& source, const std::string& filename, const Options& options, std::vector<EntryDescriptor>& entries) {
	uint32_t count = 0;
	if(!source.read_at(0, count)) { return Status::structural_corruption; }
	if(count == 0 || count >= PCK_MAX_COUNT) {
		LOGERR("implausible entry count %u", count);
		return Status::structural_corruption;
	}
	
	const uint64_t record_size = PCK_NAME_SIZE + 8;
	const uint64_t index_size = 4 + (uint64_t)count * 8 + (uint64_t)count * record_size;
	if(index_size > source.size()) {
		LOGERR("index of %u entries doesn't fit in the archive", count);
		return Status::structural_corruption;
	}
	
	std::vector<uint8_t> index((size_t)index_size);
	if(!source.read_at(0, index.data(), index.size())) { return Status::io_error; }
	
	std::vector<EntryDescriptor> found;
	found.reserve(count);
	const uint8_t* records = index.data() + 4 + (size_t)count * 8;
	uint64_t prev_end = 0;
	for(uint32_t i = 0; i < count; i++) {
		uint32_t offset = peek_u32(index.data(), 4 + (size_t)i * 8);
		uint32_t length = peek_u32(index.data(), 8 + (size_t)i * 8);
		const uint8_t* record = records + (size_t)i * record_size;
		
		if(peek_u32(record, PCK_NAME_SIZE) != offset || peek_u32(record, PCK_NAME_SIZE + 4) != length) {
			LOGERR("entry %u: name table disagrees with offset table", i);
			return Status::structural_corruption;
		}
		if(i && prev_end > offset) {
			LOGERR("entry %u starts at 0x%x, inside the previous entry (ends at 0x%llx)", i, offset, (unsigned long long)prev_end);
			return Status::structural_corruption;
		}
		if(offset < index_size || (uint64_t)offset + length > source.size()) {
			LOGERR("entry %u (0x%x+0x%x) is outside the data area", i, offset, length);
			return Status::structural_corruption;
		}
		prev_end = (uint64_t)offset + length;
		
		std::string name = decode_name(record, PCK_NAME_SIZE, options.name_encoding);
		found.push_back(EntryDescriptor::raw(name, offset, length));
	}
	
	Status ret = check_disjoint(found);
	if(ret != Status::ok) { return ret; }
	
	entries = std::move(found);
	return Status::ok;
}
