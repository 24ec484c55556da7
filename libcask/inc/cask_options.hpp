#pragma once

#include <stdint.h>

#include <string>
#include <vector>

namespace Cask {
	
	enum class NameEncoding {
		cp932,
		utf8,
		utf16le,
	};
	
	const char* encoding_string(NameEncoding encoding);
	bool parse_encoding(const std::string& text, NameEncoding& out);
	
	//everything detection, parsing and filter selection consults.
	//each field can also be reached by name, which is what the command line uses.
	struct Options {
		bool simple_crypt = true;   //SimpleCrypt cipher and compression transforms
		bool mdf_unwrap = true;     //"mdf\0" tagged zlib transform
		bool filters = true;        //master switch for filter selection
		int max_filters = 4;        //how many transforms may stack on one entry
		NameEncoding name_encoding = NameEncoding::cp932;
		bool skip_garbage = true;   //drop xp3 protection notices and empty .nene placeholders
		
		static const std::vector<std::string>& names();
		bool set(const std::string& name, const std::string& value);
		bool get(const std::string& name, std::string& value) const;
		std::string describe(const std::string& name) const;
	};
}
