#include <cask_format.hpp>
#include <cask_text.hpp>

#include <algorithm>
#include <utility>

#include <logging.hpp>

#include "format_util.hpp"

//the name field width differs between games and isn't stored anywhere,
//so every width is tried in this order until one makes sense
static const size_t DAT_NAME_SIZES[] = { 0x24, 0x30, 0x3C };
static const uint32_t DAT_PLAUSIBLE_COUNT = 1000;

//the same checks as the parse below, limited to the records visible in header
static int sniff_variant(const uint8_t* header, size_t size, size_t name_size) {
	using namespace Cask::Formats;
	const size_t record = name_size + 4;
	
	uint32_t count = peek_u32(header, 0);
	if(count == 0) { return Cask::NO_MATCH; }
	uint64_t index_size = (uint64_t)record * count;
	
	size_t visible = std::min<size_t>((size - 4) / record, count - 1);
	if(visible == 0) { return Cask::NO_MATCH; }
	int score = (count < DAT_PLAUSIBLE_COUNT) ? 5 : 0;
	score += (int)std::min<size_t>(visible / 2, 10);
	
	if(8 + name_size * 2 + 4 > size) { return Cask::NO_MATCH; }
	uint32_t next = peek_u32(header, 4 + name_size);
	if(next < index_size + 4) { return Cask::NO_MATCH; }
	//a wider record layout would have a size field here
	uint32_t first_size = peek_u32(header, name_size);
	uint32_t second = peek_u32(header, 8 + name_size * 2);
	if((uint32_t)(second - next) == first_size) { return Cask::NO_MATCH; }
	
	for(size_t i = 0; i + 1 < visible; i++) {
		uint32_t offset = next;
		next = peek_u32(header, record * (i + 2));
		if(next < offset || offset < index_size) { return Cask::NO_MATCH; }
	}
	return score;
}

int Cask::Formats::circus_dat_sniff(const std::string& filename, const uint8_t* header, size_t size, const Options& options) {
	if(size < 8) { return NO_MATCH; }
	for(size_t name_size : DAT_NAME_SIZES) {
		int score = sniff_variant(header, size, name_size);
		if(score != NO_MATCH) { return score; }
	}
	return NO_MATCH;
}

static Cask::Status parse_variant(Cask::Source& source, size_t name_size, const Cask::Options& options, std::vector<Cask::EntryDescriptor>& entries) {
	using namespace Cask;
	using namespace Cask::Formats;
	const size_t record = name_size + 4;
	const uint64_t file_len = source.size();
	
	uint32_t count = 0;
	if(!source.read_at(0, count)) { return Status::structural_corruption; }
	if(count < 2) { return Status::structural_corruption; }
	uint64_t index_size = (uint64_t)record * count;
	if(index_size + 4 > file_len) { return Status::structural_corruption; }
	
	std::vector<uint8_t> index((size_t)index_size + 4);
	if(!source.read_at(0, index.data(), index.size())) { return Status::io_error; }
	
	uint32_t next = peek_u32(index.data(), 4 + name_size);
	if(next < index_size + 4) { return Status::structural_corruption; }
	uint32_t first_size = peek_u32(index.data(), name_size);
	uint32_t second = peek_u32(index.data(), 8 + name_size * 2);
	if((uint32_t)(second - next) == first_size) { return Status::structural_corruption; }
	
	//the last record only terminates the table, the final entry runs to the end of the file
	const uint32_t entry_count = count - 1;
	std::vector<EntryDescriptor> found;
	found.reserve(entry_count);
	uint64_t next_offset = next;
	for(uint32_t i = 0; i < entry_count; i++) {
		const uint8_t* name_field = index.data() + 4 + (size_t)i * record;
		if(name_field[0] == 0) {
			LOGVER("name width 0x%zx: entry %u has no name", name_size, i);
			return Status::structural_corruption;
		}
		
		uint64_t offset = next_offset;
		next_offset = (i + 1 == entry_count) ? file_len : peek_u32(index.data(), record * (i + 2));
		if(next_offset < offset) {
			LOGVER("name width 0x%zx: entry %u goes backwards", name_size, i);
			return Status::structural_corruption;
		}
		if(offset < index_size || next_offset > file_len) {
			LOGVER("name width 0x%zx: entry %u is outside the data area", name_size, i);
			return Status::structural_corruption;
		}
		
		found.push_back(EntryDescriptor::raw(decode_name(name_field, name_size, options.name_encoding), offset, next_offset - offset));
	}
	
	Status ret = check_disjoint(found);
	if(ret != Status::ok) { return ret; }
	
	entries = std::move(found);
	return Status::ok;
}

Cask::Status Cask::Formats::circus_dat_parse(Source& source, const std::string& filename, const Options& options, std::vector<EntryDescriptor>& entries) {
	for(size_t name_size : DAT_NAME_SIZES) {
		if(parse_variant(source, name_size, options, entries) == Status::ok) {
			LOGVER("index uses 0x%zx byte names, %zu entries", name_size, entries.size());
			return Status::ok;
		}
	}
	LOGERR("no name width gives a consistent index");
	return Status::structural_corruption;
}
