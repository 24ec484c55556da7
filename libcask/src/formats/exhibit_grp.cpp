#include <cask_format.hpp>

#include <ctype.h>
#include <stdio.h>
#include <string.h>
#include <stdlib.h>
#include <strings.h>
#include <filesystem>
#include <utility>
namespace fs = std::filesystem;

#include <caskio_file.hpp>
#include <logging.hpp>

#include "format_util.hpp"

static const int32_t TOC_BLOCK_MARKER = 0x01000000;

struct GrpName {
	std::string prefix; //"res", in whatever case the file uses
	std::string suffix; //".grp"
	size_t digits = 0;
	uint32_t number = 0;
};

//res<digits>.grp, case-insensitive
static bool parse_grp_name(const std::string& name, GrpName& out) {
	if(name.size() < 8) { return false; }
	if(strncasecmp(name.c_str(), "res", 3)) { return false; }
	if(strcasecmp(name.c_str() + name.size() - 4, ".grp")) { return false; }
	
	std::string digits = name.substr(3, name.size() - 7);
	if(digits.empty() || digits.size() > 9) { return false; }
	for(char c : digits) {
		if(!isdigit((unsigned char)c)) { return false; }
	}
	
	out.prefix = name.substr(0, 3);
	out.suffix = name.substr(name.size() - 4);
	out.digits = digits.size();
	out.number = (uint32_t)strtoul(digits.c_str(), nullptr, 10);
	return true;
}

int Cask::Formats::exhibit_grp_sniff(const std::string& filename, const uint8_t* header, size_t size, const Options& options) {
	GrpName info;
	if(!parse_grp_name(base_name(filename), info)) { return NO_MATCH; }
	//that's the TOC itself
	if(size >= 4 && !memcmp(header, "AiFS", 4)) { return NO_MATCH; }
	return 10;
}

//walks back through res<n-1>.grp, res<n-2>.grp, ... until one starts with AiFS.
//arc_index counts how many steps that took.
static Cask::Status locate_toc(const fs::path& path, fs::path& toc_path, uint32_t& arc_index) {
	using Cask::Status;
	GrpName info;
	if(!parse_grp_name(path.filename().u8string(), info)) { return Status::format_mismatch; }
	if(info.number == 0) {
		LOGERR("%s is number 0, so no TOC can come before it", path.filename().u8string().c_str());
		return Status::not_found;
	}
	
	arc_index = 1;
	for(int64_t num = (int64_t)info.number - 1; num >= 0; num--, arc_index++) {
		char digits[16];
		snprintf(digits, sizeof(digits), "%0*lld", (int)info.digits, (long long)num);
		fs::path candidate = path.parent_path() / fs::u8path(info.prefix + digits + info.suffix);
		
		Cask::FileDisk file;
		if(!file.open(candidate.u8string().c_str())) {
			LOGERR("TOC candidate %s doesn't exist", candidate.u8string().c_str());
			return Status::not_found;
		}
		char magic[4] = {};
		if(file.read((uint8_t*)magic, 4) && !memcmp(magic, "AiFS", 4)) {
			LOGVER("TOC is %s, archive index %u", candidate.filename().u8string().c_str(), arc_index);
			toc_path = candidate;
			return Status::ok;
		}
	}
	
	LOGERR("no AiFS TOC before %s", path.filename().u8string().c_str());
	return Status::not_found;
}

Cask::Status Cask::Formats::exhibit_grp_parse(Source& source, const std::string& filename, const Options& options, std::vector<EntryDescriptor>& entries) {
	uint8_t magic[4] = {};
	if(source.size() >= 4 && source.read_at(0, magic, 4) && !memcmp(magic, "AiFS", 4)) {
		LOGERR("this is a TOC, open the res*.grp files that come after it instead");
		return Status::unsupported;
	}
	
	fs::path path = fs::u8path(source.path().empty() ? filename : source.path());
	fs::path toc_path;
	uint32_t arc_index = 0;
	Status ret = locate_toc(path, toc_path, arc_index);
	if(ret != Status::ok) { return ret; }
	
	FileDisk toc;
	if(!toc.open(toc_path.u8string().c_str())) { return Status::io_error; }
	const uint64_t toc_len = toc.size();
	if(toc_len < 0x10) {
		LOGERR("TOC is only %llu bytes", (unsigned long long)toc_len);
		return Status::structural_corruption;
	}
	
	int32_t res_count = 0;
	if(!toc.seek(0xC) || !toc.read(res_count)) { return Status::io_error; }
	if(res_count <= 0 || (int64_t)arc_index > res_count) {
		LOGERR("archive index %u, but the TOC lists %d resources", arc_index, res_count);
		return Status::structural_corruption;
	}
	
	//blocks: i32 archive number, i32 first index, 4 unknown bytes, u32 count, count * (u32 offset, u32 size)
	uint64_t block = 0x10;
	bool found = false;
	for(int32_t r = 0; r < res_count; r++) {
		if(block + 0x10 > toc_len) { break; }
		int32_t num = 0;
		if(!toc.seek((int64_t)block) || !toc.read(num)) { return Status::io_error; }
		if(num == TOC_BLOCK_MARKER) {
			block += 4;
			if(block + 0x10 > toc_len) { break; }
			if(!toc.seek((int64_t)block) || !toc.read(num)) { return Status::io_error; }
		}
		uint32_t count = 0;
		if(!toc.seek((int64_t)block + 0xC) || !toc.read(count)) { return Status::io_error; }
		if(num == (int32_t)arc_index) { found = true; break; }
		block += 0x10 + (uint64_t)count * 8;
	}
	if(!found) {
		LOGERR("TOC has no block for archive %u", arc_index);
		return Status::structural_corruption;
	}
	
	int32_t start_index = 0, count = 0;
	if(!toc.seek((int64_t)block + 4) || !toc.read(start_index)) { return Status::io_error; }
	if(!toc.seek((int64_t)block + 0xC) || !toc.read(count)) { return Status::io_error; }
	if(start_index < 0 || count < 0) {
		LOGERR("negative start index (%d) or count (%d)", start_index, count);
		return Status::structural_corruption;
	}
	if(block + 0x10 + (uint64_t)count * 8 > toc_len) {
		LOGERR("entry table of %d entries runs past the TOC", count);
		return Status::structural_corruption;
	}
	
	std::vector<EntryDescriptor> result;
	if(!toc.seek((int64_t)block + 0x10)) { return Status::io_error; }
	for(int32_t i = 0; i < count; i++) {
		uint32_t offset = 0, size = 0;
		if(!toc.read(offset) || !toc.read(size)) { return Status::io_error; }
		if(size == 0) { continue; }
		if((uint64_t)offset + size > source.size()) {
			LOGERR("entry %d (0x%x+0x%x) is past the end of the archive", i, offset, size);
			return Status::structural_corruption;
		}
		char name[32];
		snprintf(name, sizeof(name), "%05u.ogg", (uint32_t)start_index + (uint32_t)i);
		result.push_back(EntryDescriptor::raw(name, offset, size));
	}
	if(result.empty()) {
		LOGERR("archive %u has no entries", arc_index);
		return Status::structural_corruption;
	}
	
	ret = check_disjoint(result);
	if(ret != Status::ok) { return ret; }
	
	entries = std::move(result);
	return Status::ok;
}
