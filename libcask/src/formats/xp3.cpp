#include <cask_format.hpp>
#include <cask_text.hpp>

#include <ctype.h>
#include <string.h>
#include <algorithm>
#include <utility>
#include <zlib.h>

#include <logging.hpp>

#include "format_util.hpp"

static const uint8_t XP3_MAGIC[11] = { 'X', 'P', '3', '\r', '\n', ' ', '\n', 0x1A, 0x8B, 0x67, 0x01 };

static const uint8_t INDEX_ENCODE_MASK = 0x07;
static const uint8_t INDEX_ENCODE_RAW = 0;
static const uint8_t INDEX_ENCODE_ZLIB = 1;
static const uint8_t INDEX_CONTINUE = 0x80;

static const uint32_t SEGM_ENCODE_MASK = 0x07;
static const uint32_t SEGM_ENCODE_RAW = 0;
static const uint32_t SEGM_ENCODE_ZLIB = 1;

static const size_t SEGM_RECORD_SIZE = 28;
static const uint64_t MAX_INDEX_SIZE = (uint64_t)1 << 30;
static const int MAX_INDEX_HOPS = 16;

static const char* PROTECTION_NOTICE = "$$$ This is a protected archive. $$$";

int Cask::Formats::xp3_sniff(const std::string& filename, const uint8_t* header, size_t size, const Options& options) {
	if(size >= sizeof(XP3_MAGIC) && !memcmp(header, XP3_MAGIC, sizeof(XP3_MAGIC))) { return 255; }
	return NO_MATCH;
}

//follows the header (and any cushion blocks) to the index, inflating it if needed
static Cask::Status read_index(Cask::Source& source, std::vector<uint8_t>& index) {
	using Cask::Status;
	
	uint64_t offset = 0;
	if(!source.read_at(sizeof(XP3_MAGIC), offset)) { return Status::structural_corruption; }
	
	for(int hop = 0; hop < MAX_INDEX_HOPS; hop++) {
		uint8_t flag = 0;
		if(!source.read_at(offset, flag)) {
			LOGERR("index offset 0x%llx is outside the archive", (unsigned long long)offset);
			return Status::structural_corruption;
		}
		
		if(flag & INDEX_CONTINUE) {
			//cushion header: u64 we don't need, then the real index offset
			uint64_t next = 0;
			if(!source.read_at(offset + 9, next)) { return Status::structural_corruption; }
			LOGVER("index continues at 0x%llx", (unsigned long long)next);
			offset = next;
			continue;
		}
		
		uint8_t method = flag & INDEX_ENCODE_MASK;
		if(method == INDEX_ENCODE_RAW) {
			uint64_t size = 0;
			if(!source.read_at(offset + 1, size)) { return Status::structural_corruption; }
			if(size > MAX_INDEX_SIZE || size > source.size()) {
				LOGERR("index claims 0x%llx bytes", (unsigned long long)size);
				return Status::structural_corruption;
			}
			index.resize((size_t)size);
			if(!source.read_at(offset + 9, index.data(), index.size())) { return Status::structural_corruption; }
			return Status::ok;
		}
		if(method == INDEX_ENCODE_ZLIB) {
			uint64_t packed = 0, unpacked = 0;
			if(!source.read_at(offset + 1, packed) || !source.read_at(offset + 9, unpacked)) { return Status::structural_corruption; }
			if(packed > source.size() || unpacked > MAX_INDEX_SIZE) {
				LOGERR("index claims 0x%llx packed, 0x%llx unpacked bytes", (unsigned long long)packed, (unsigned long long)unpacked);
				return Status::structural_corruption;
			}
			std::vector<uint8_t> compressed((size_t)packed);
			if(!source.read_at(offset + 17, compressed.data(), compressed.size())) { return Status::structural_corruption; }
			
			index.resize((size_t)unpacked);
			uLongf dest_len = (uLongf)unpacked;
			int ret = uncompress(index.data(), &dest_len, compressed.data(), (uLong)compressed.size());
			if(ret != Z_OK || dest_len != unpacked) {
				LOGERR("couldn't inflate index (%d, got 0x%lx of 0x%llx bytes)", ret, (unsigned long)dest_len, (unsigned long long)unpacked);
				return Status::decode_failure;
			}
			return Status::ok;
		}
		
		LOGERR("unknown index encoding %u", method);
		return Status::unsupported;
	}
	
	LOGERR("index chain is longer than %d blocks", MAX_INDEX_HOPS);
	return Status::structural_corruption;
}

static Cask::Status parse_file_chunk(const uint8_t* data, uint64_t size, const Cask::Options& options, uint64_t container_size,
	std::vector<Cask::EntryDescriptor>& entries) {
	using namespace Cask;
	using namespace Cask::Formats;
	
	bool have_info = false, have_segm = false;
	std::string name;
	uint64_t original_size = 0;
	std::vector<Segment> segments;
	
	uint64_t pos = 0;
	while(pos + 12 <= size) {
		const uint8_t* tag = data + pos;
		uint64_t chunk_size = peek_u64(data, (size_t)pos + 4);
		pos += 12;
		if(chunk_size > size - pos) {
			LOGERR("'%.4s' chunk runs past its File chunk", (const char*)tag);
			return Status::structural_corruption;
		}
		const uint8_t* chunk = data + pos;
		
		if(!memcmp(tag, "info", 4)) {
			if(chunk_size < 22) { return Status::structural_corruption; }
			original_size = peek_u64(chunk, 4);
			uint16_t name_len = peek_u16(chunk, 20);
			if(22 + (uint64_t)name_len * 2 > chunk_size) {
				LOGERR("name of %u characters doesn't fit its info chunk", name_len);
				return Status::structural_corruption;
			}
			name = decode_name(chunk + 22, (size_t)name_len * 2, NameEncoding::utf16le);
			have_info = true;
		}
		else if(!memcmp(tag, "segm", 4)) {
			if(chunk_size % SEGM_RECORD_SIZE) {
				LOGERR("segm chunk of 0x%llx bytes isn't made of whole records", (unsigned long long)chunk_size);
				return Status::structural_corruption;
			}
			for(uint64_t i = 0; i < chunk_size; i += SEGM_RECORD_SIZE) {
				uint32_t flags = peek_u32(chunk, (size_t)i);
				uint32_t method = flags & SEGM_ENCODE_MASK;
				if(method != SEGM_ENCODE_RAW && method != SEGM_ENCODE_ZLIB) {
					LOGERR("unknown segment encoding %u", method);
					return Status::unsupported;
				}
				Segment seg;
				seg.compressed = (method == SEGM_ENCODE_ZLIB);
				seg.physical_offset = peek_u64(chunk, (size_t)i + 4);
				seg.logical_size = peek_u64(chunk, (size_t)i + 12);
				seg.physical_size = peek_u64(chunk, (size_t)i + 20);
				segments.push_back(seg);
			}
			have_segm = true;
		}
		//adlr and anything unknown are skipped
		pos += chunk_size;
	}
	
	if(!have_info || !have_segm) {
		LOGERR("File chunk without %s", have_info ? "segm" : "info");
		return Status::structural_corruption;
	}
	
	if(options.skip_garbage) {
		std::string lower = name;
		std::transform(lower.begin(), lower.end(), lower.begin(), [](unsigned char c) { return (char)tolower(c); });
		bool placeholder = original_size == 0 && lower.size() >= 5 && lower.compare(lower.size() - 5, 5, ".nene") == 0;
		if(name.find(PROTECTION_NOTICE) != std::string::npos || placeholder) {
			LOGVER("skipping %s", name.c_str());
			return Status::ok;
		}
	}
	
	EntryDescriptor entry;
	Status ret = EntryDescriptor::create(name, original_size, std::move(segments), entry);
	if(ret != Status::ok) { return ret; }
	if(!entry.fits(container_size)) {
		LOGERR("%s points outside the archive", entry.name().c_str());
		return Status::structural_corruption;
	}
	entries.push_back(std::move(entry));
	return Status::ok;
}

Cask::Status Cask::Formats::xp3_parse(Source& source, const std::string& filename, const Options& options, std::vector<EntryDescriptor>& entries) {
	uint8_t magic[sizeof(XP3_MAGIC)];
	if(!source.read_at(0, magic, sizeof(magic)) || memcmp(magic, XP3_MAGIC, sizeof(magic))) {
		return Status::format_mismatch;
	}
	
	std::vector<uint8_t> index;
	Status ret = read_index(source, index);
	if(ret != Status::ok) { return ret; }
	
	std::vector<EntryDescriptor> found;
	uint64_t pos = 0;
	while(pos + 12 <= index.size()) {
		const uint8_t* tag = index.data() + pos;
		uint64_t chunk_size = peek_u64(index.data(), (size_t)pos + 4);
		pos += 12;
		if(chunk_size > index.size() - pos) {
			LOGERR("'%.4s' chunk runs past the end of the index", (const char*)tag);
			return Status::structural_corruption;
		}
		if(!memcmp(tag, "File", 4)) {
			ret = parse_file_chunk(index.data() + pos, chunk_size, options, source.size(), found);
			if(ret != Status::ok) { return ret; }
		}
		else {
			LOGVER("skipping '%.4s' chunk", (const char*)tag);
		}
		pos += chunk_size;
	}
	
	entries = std::move(found);
	return Status::ok;
}
