#pragma once

#include <stdint.h>
#include <stddef.h>

#include <string>
#include <vector>

#include <caskio_source.hpp>

#include "cask_entry.hpp"
#include "cask_options.hpp"
#include "cask_status.hpp"

namespace Cask {
	
	enum class FormatId {
		xp3,
		kirikiri_mdf,
		kirikiri_simple_crypt,
		circus_pck,
		circus_dat,
		exhibit_grp,
		custom,
	};
	
	static const int NO_MATCH = -1;
	
	//confidence for this container, or NO_MATCH. only header (the first bytes of the
	//container) and the file name may be looked at.
	typedef int (*SniffFn)(const std::string& filename, const uint8_t* header, size_t size, const Options& options);
	//reads the index and fills entries, all or nothing
	typedef Status (*ParseFn)(Source& source, const std::string& filename, const Options& options, std::vector<EntryDescriptor>& entries);
	
	struct Format {
		FormatId id;
		const char* name;
		const char* description;
		SniffFn sniff;
		ParseFn parse;
	};
	
	class Registry {
	public:
		static constexpr size_t HEADER_PREFIX = 1024;
		
		void add(const Format& format);
		
		//highest score wins, ties go to whichever was added first.
		//nullptr when nothing matches.
		const Format* detect(const std::string& filename, const uint8_t* header, size_t size, const Options& options, int* score = nullptr) const;
		
		const Format* find(FormatId id) const;
		const Format* find(const std::string& name) const;
		const std::vector<Format>& formats() const { return _formats; }
		
		//every format this library knows, in priority order:
		//xp3, kirikiri_mdf, kirikiri_simple_crypt, circus_pck, circus_dat, exhibit_grp
		static const Registry& builtin();
		
	private:
		std::vector<Format> _formats;
	};
	
	namespace Formats {
		int xp3_sniff(const std::string& filename, const uint8_t* header, size_t size, const Options& options);
		Status xp3_parse(Source& source, const std::string& filename, const Options& options, std::vector<EntryDescriptor>& entries);
		
		int mdf_sniff(const std::string& filename, const uint8_t* header, size_t size, const Options& options);
		int simple_crypt_sniff(const std::string& filename, const uint8_t* header, size_t size, const Options& options);
		Status single_file_parse(Source& source, const std::string& filename, const Options& options, std::vector<EntryDescriptor>& entries);
		
		int circus_pck_sniff(const std::string& filename, const uint8_t* header, size_t size, const Options& options);
		Status circus_pck_parse(Source& source, const std::string& filename, const Options& options, std::vector<EntryDescriptor>& entries);
		
		int circus_dat_sniff(const std::string& filename, const uint8_t* header, size_t size, const Options& options);
		Status circus_dat_parse(Source& source, const std::string& filename, const Options& options, std::vector<EntryDescriptor>& entries);
		
		int exhibit_grp_sniff(const std::string& filename, const uint8_t* header, size_t size, const Options& options);
		Status exhibit_grp_parse(Source& source, const std::string& filename, const Options& options, std::vector<EntryDescriptor>& entries);
	}
}
