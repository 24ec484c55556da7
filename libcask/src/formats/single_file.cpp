#include <cask_format.hpp>

#include <string.h>

#include <logging.hpp>

#include "format_util.hpp"

//mdf and SimpleCrypt files are not archives, they become one entry that the
//filter chain unwraps when it is opened

int Cask::Formats::mdf_sniff(const std::string& filename, const uint8_t* header, size_t size, const Options& options) {
	if(!options.mdf_unwrap) { return NO_MATCH; }
	if(size >= 4 && !memcmp(header, "mdf\0", 4)) { return 10; }
	return NO_MATCH;
}

int Cask::Formats::simple_crypt_sniff(const std::string& filename, const uint8_t* header, size_t size, const Options& options) {
	if(!options.simple_crypt) { return NO_MATCH; }
	if(size >= 5 && header[0] == 0xFE && header[1] == 0xFE && header[2] <= 2 && header[3] == 0xFF && header[4] == 0xFE) { return 10; }
	return NO_MATCH;
}

Cask::Status Cask::Formats::single_file_parse(Source& source, const std::string& filename, const Options& options, std::vector<EntryDescriptor>& entries) {
	std::string name = base_name(filename);
	if(name.empty()) { name = "data"; }
	entries.clear();
	entries.push_back(EntryDescriptor::raw(name, 0, source.size()));
	return Status::ok;
}
