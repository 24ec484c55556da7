#include <cask_format.hpp>

#include <string.h>
#include <strings.h>

#include <logging.hpp>

void Cask::Registry::add(const Format& format) {
	_formats.push_back(format);
}

const Cask::Format* Cask::Registry::detect(const std::string& filename, const uint8_t* header, size_t size, const Options& options, int* score) const {
	const Format* best = nullptr;
	int best_score = NO_MATCH;
	
	for(const auto& format : _formats) {
		int s = format.sniff(filename, header, size, options);
		if(s < 0) { continue; }
		LOGVER("%s scored %d", format.name, s);
		//strictly greater, so on a tie the earlier format stays
		if(s > best_score) {
			best = &format;
			best_score = s;
		}
	}
	
	if(score) { *score = best_score; }
	return best;
}

const Cask::Format* Cask::Registry::find(FormatId id) const {
	for(const auto& format : _formats) {
		if(format.id == id) { return &format; }
	}
	return nullptr;
}

const Cask::Format* Cask::Registry::find(const std::string& name) const {
	for(const auto& format : _formats) {
		if(!strcasecmp(format.name, name.c_str())) { return &format; }
	}
	return nullptr;
}

const Cask::Registry& Cask::Registry::builtin() {
	static const Registry registry = []() {
		using namespace Formats;
		Registry r;
		r.add({ FormatId::xp3, "xp3", "Kirikiri XP3 archive", xp3_sniff, xp3_parse });
		r.add({ FormatId::kirikiri_mdf, "kirikiri_mdf", "Kirikiri mdf zlib-wrapped file", mdf_sniff, single_file_parse });
		r.add({ FormatId::kirikiri_simple_crypt, "kirikiri_simple_crypt", "Kirikiri SimpleCrypt text", simple_crypt_sniff, single_file_parse });
		r.add({ FormatId::circus_pck, "circus_pck", "Circus .pck archive", circus_pck_sniff, circus_pck_parse });
		r.add({ FormatId::circus_dat, "circus_dat", "Circus .dat archive", circus_dat_sniff, circus_dat_parse });
		r.add({ FormatId::exhibit_grp, "exhibit_grp", "ExHibit res*.grp archive (needs its AiFS TOC)", exhibit_grp_sniff, exhibit_grp_parse });
		return r;
	}();
	return registry;
}
