#include <cask_options.hpp>

#include <stdlib.h>
#include <string.h>
#include <strings.h>

#include <logging.hpp>

const char* Cask::encoding_string(NameEncoding encoding) {
	switch(encoding) {
		case NameEncoding::cp932: return "cp932";
		case NameEncoding::utf8: return "utf8";
		case NameEncoding::utf16le: return "utf16le";
	}
	return "unknown";
}

bool Cask::parse_encoding(const std::string& text, NameEncoding& out) {
	const char* t = text.c_str();
	if(!strcasecmp(t, "cp932") || !strcasecmp(t, "sjis") || !strcasecmp(t, "shift_jis")) { out = NameEncoding::cp932; return true; }
	if(!strcasecmp(t, "utf8") || !strcasecmp(t, "utf-8")) { out = NameEncoding::utf8; return true; }
	if(!strcasecmp(t, "utf16le") || !strcasecmp(t, "utf-16le")) { out = NameEncoding::utf16le; return true; }
	return false;
}

static bool parse_bool(const std::string& text, bool& out) {
	const char* t = text.c_str();
	if(!strcasecmp(t, "1") || !strcasecmp(t, "true") || !strcasecmp(t, "on") || !strcasecmp(t, "yes")) { out = true; return true; }
	if(!strcasecmp(t, "0") || !strcasecmp(t, "false") || !strcasecmp(t, "off") || !strcasecmp(t, "no")) { out = false; return true; }
	return false;
}

const std::vector<std::string>& Cask::Options::names() {
	static const std::vector<std::string> all = {
		"simple_crypt",
		"mdf_unwrap",
		"filters",
		"max_filters",
		"name_encoding",
		"skip_garbage",
	};
	return all;
}

bool Cask::Options::set(const std::string& name, const std::string& value) {
	bool ok = false;
	if(name == "simple_crypt") { ok = parse_bool(value, simple_crypt); }
	else if(name == "mdf_unwrap") { ok = parse_bool(value, mdf_unwrap); }
	else if(name == "filters") { ok = parse_bool(value, filters); }
	else if(name == "skip_garbage") { ok = parse_bool(value, skip_garbage); }
	else if(name == "name_encoding") { ok = parse_encoding(value, name_encoding); }
	else if(name == "max_filters") {
		char* end = nullptr;
		long parsed = strtol(value.c_str(), &end, 10);
		if(end && *end == '\0' && !value.empty() && parsed >= 0 && parsed <= 16) {
			max_filters = (int)parsed;
			ok = true;
		}
	}
	else {
		LOGERR("there is no option called '%s'", name.c_str());
		return false;
	}
	
	if(!ok) { LOGERR("'%s' is not a valid value for option '%s'", value.c_str(), name.c_str()); }
	else { LOGVER("set %s to %s", name.c_str(), value.c_str()); }
	return ok;
}

bool Cask::Options::get(const std::string& name, std::string& value) const {
	if(name == "simple_crypt") { value = simple_crypt ? "true" : "false"; }
	else if(name == "mdf_unwrap") { value = mdf_unwrap ? "true" : "false"; }
	else if(name == "filters") { value = filters ? "true" : "false"; }
	else if(name == "skip_garbage") { value = skip_garbage ? "true" : "false"; }
	else if(name == "name_encoding") { value = encoding_string(name_encoding); }
	else if(name == "max_filters") { value = std::to_string(max_filters); }
	else { return false; }
	return true;
}

std::string Cask::Options::describe(const std::string& name) const {
	if(name == "simple_crypt") { return "undo SimpleCrypt (FE FE xx FF FE) text protection"; }
	if(name == "mdf_unwrap") { return "inflate mdf-tagged zlib files"; }
	if(name == "filters") { return "apply any transforms at all when opening entries"; }
	if(name == "max_filters") { return "maximum number of transforms stacked on one entry (0-16)"; }
	if(name == "name_encoding") { return "encoding of entry names in legacy indexes (cp932, utf8, utf16le)"; }
	if(name == "skip_garbage") { return "hide xp3 protection notices and empty .nene placeholders"; }
	return "";
}
