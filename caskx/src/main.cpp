#include <map>
#include <string>
#include <filesystem>
#include <vector>
#include <chrono>
#include <thread>
#include <atomic>
#include <algorithm>
namespace fs = std::filesystem;

#include <stdio.h>
#include <stdlib.h>
#include <string.h>

#include <cask_archive.hpp>
#include <cask_format.hpp>
#include <cask_options.hpp>
#include "logging.hpp"

#ifdef CASK_ON_LINUX
#include <locale.h>
#endif

struct settings {
	std::string inpath = "";
	std::string outpath = "";
	std::string format = ""; //forced format name, empty means detect
	unsigned threads = 1;
	Cask::Options options;
};

static bool open_archive(settings& set, Cask::Archive& archive) {
	Cask::Status ret;
	if(!set.format.empty()) {
		const Cask::Format* format = Cask::Registry::builtin().find(set.format);
		if(!format) { LOGERR("there is no format called '%s' (see the formats command)", set.format.c_str()); return false; }
		std::shared_ptr<Cask::Source> source = Cask::Source::open_disk(set.inpath);
		if(!source) { return false; }
		ret = archive.open_as(*format, source, set.inpath, set.options);
	}
	else {
		ret = archive.open(set.inpath, set.options);
	}
	if(ret != Cask::Status::ok) {
		LOGERR("couldn't open %s: %s", set.inpath.c_str(), Cask::status_string(ret));
		return false;
	}
	return true;
}

//entry names come from the container, keep them inside the output folder
static bool safe_relative_path(const std::string& name, fs::path& out) {
	std::string clean = name;
	std::replace(clean.begin(), clean.end(), '\\', '/');
	fs::path rel = fs::u8path(clean).relative_path();
	if(rel.empty()) { return false; }
	for(const auto& part : rel) {
		if(part == "..") { return false; }
	}
	out = rel;
	return true;
}

static bool extract_entry(const Cask::Archive& archive, size_t index, const fs::path& outdir) {
	const Cask::EntryDescriptor& entry = archive.entries()[index];
	fs::path rel;
	if(!safe_relative_path(entry.name(), rel)) {
		LOGWAR("skipping entry with unusable name '%s'", entry.name().c_str());
		return false;
	}
	
	std::unique_ptr<Cask::Stream> stream;
	Cask::Status ret = archive.open_entry(index, stream);
	if(ret != Cask::Status::ok) { LOGERR("couldn't open %s: %s", entry.name().c_str(), Cask::status_string(ret)); return false; }
	
	fs::path outpath = outdir / rel;
	std::error_code ec;
	fs::create_directories(outpath.parent_path(), ec);
	FILE* fo = fopen(outpath.u8string().c_str(), "wb");
	if(!fo) { LOGERR("couldn't open %s for writing", outpath.u8string().c_str()); return false; }
	
	std::vector<uint8_t> buf(0x40000);
	bool okay = true;
	while(true) {
		size_t got = 0;
		ret = stream->read(buf.data(), buf.size(), got);
		if(got && fwrite(buf.data(), 1, got, fo) != got) {
			LOGERR("couldn't write %s", outpath.u8string().c_str());
			okay = false;
			break;
		}
		if(ret != Cask::Status::ok) {
			LOGERR("%s: %s", entry.name().c_str(), Cask::status_string(ret));
			okay = false;
			break;
		}
		if(got == 0) { break; }
	}
	fclose(fo);
	
	if(okay) { LOGOK("%s (%llu bytes)", entry.name().c_str(), (unsigned long long)stream->tell()); }
	return okay;
}

namespace proc {
	bool list(settings& set) {
		Cask::Archive archive;
		if(!open_archive(set, archive)) { return false; }
		
		LOGALWAYS("%s: %zu entries (%s)", fs::u8path(set.inpath).filename().u8string().c_str(), archive.count(), archive.format()->name);
		LOGBLK
		uint64_t total = 0;
		for(const auto& e : archive.list_entries()) {
			LOGALWAYS("%12llu  %s", (unsigned long long)e.size, e.name.c_str());
			total += e.size;
		}
		LOGALWAYS("%12llu  total", (unsigned long long)total);
		return true;
	}
	
	bool extract(settings& set) {
		Cask::Archive archive;
		if(!open_archive(set, archive)) { return false; }
		
		fs::path outdir = fs::u8path(set.outpath);
		std::error_code ec;
		fs::create_directories(outdir, ec);
		if(ec) { LOGERR("couldn't create %s: %s", set.outpath.c_str(), ec.message().c_str()); return false; }
		
		//every worker reads through its own streams, the source serializes the actual reads
		std::atomic<size_t> next(0);
		std::atomic<size_t> failed(0);
		auto worker = [&]() {
			for(size_t i = next++; i < archive.count(); i = next++) {
				if(!extract_entry(archive, i, outdir)) { failed++; }
			}
		};
		
		unsigned thread_count = std::max(1u, std::min<unsigned>(set.threads, (unsigned)std::max<size_t>(archive.count(), 1)));
		if(thread_count == 1) {
			worker();
		}
		else {
			std::vector<std::thread> pool;
			for(unsigned t = 0; t < thread_count; t++) { pool.emplace_back(worker); }
			for(auto& t : pool) { t.join(); }
		}
		
		uint64_t warnings = archive.diagnostics()->warnings();
		LOGINF("extracted %zu of %zu entries, %llu warnings", archive.count() - failed, archive.count(), (unsigned long long)warnings);
		return failed == 0;
	}
	
	bool detect(settings& set) {
		std::shared_ptr<Cask::Source> source = Cask::Source::open_disk(set.inpath);
		if(!source) { return false; }
		std::vector<uint8_t> header((size_t)std::min<uint64_t>(Cask::Registry::HEADER_PREFIX, source->size()));
		if(!source->read_at(0, header.data(), header.size())) { LOGERR("couldn't read %s", set.inpath.c_str()); return false; }
		
		const Cask::Registry& registry = Cask::Registry::builtin();
		for(const auto& format : registry.formats()) {
			int score = format.sniff(set.inpath, header.data(), header.size(), set.options);
			if(score == Cask::NO_MATCH) { LOGALWAYS("%-24s -", format.name); }
			else { LOGALWAYS("%-24s %d", format.name, score); }
		}
		
		const Cask::Format* best = registry.detect(set.inpath, header.data(), header.size(), set.options);
		LOGALWAYS("detected: %s", best ? best->name : "<nothing>");
		return best != nullptr;
	}
	
	bool options(settings& set) {
		for(const auto& name : Cask::Options::names()) {
			std::string value;
			set.options.get(name, value);
			LOGALWAYS("%-16s %-8s %s", name.c_str(), value.c_str(), set.options.describe(name).c_str());
		}
		return true;
	}
	
	bool formats(settings& set) {
		for(const auto& format : Cask::Registry::builtin().formats()) {
			LOGALWAYS("%-24s %s", format.name, format.description);
		}
		return true;
	}
}

typedef bool (*procfn)(settings& set);

struct comInfo {
    const char* const help_string;
    enum Required_type {
        Rno,
        Rfile,
        Rdir,
    };
    Required_type inpath_required;
    Required_type outpath_required;

    procfn fn;
};

static std::map<std::string, comInfo> infoMap{
	{"list", {"print every entry of a container with its size", comInfo::Rfile, comInfo::Rno, proc::list} },
	{"extract", {"write every entry of a container into the output folder", comInfo::Rfile, comInfo::Rdir, proc::extract} },
	{"detect", {"show how every known format scores the input", comInfo::Rfile, comInfo::Rno, proc::detect} },
	{"options", {"list the -c options with their current values", comInfo::Rno, comInfo::Rno, proc::options} },
	{"formats", {"list the known container formats (for -f)", comInfo::Rno, comInfo::Rno, proc::formats} },
};

bool func_handler(settings& set, procfn fn, std::string func_name){
    std::string short_in = fs::u8path(set.inpath).filename().u8string();
	std::string short_out = fs::u8path(set.outpath).filename().u8string();
	
    LOGNINF("%s (in %s, out %s)", "executing function", func_name.c_str(), short_in.c_str(), short_out.c_str());
	uint64_t count_before = logging::count();
	
	logging::indent();
	auto start_time = std::chrono::high_resolution_clock::now();
	bool ret = false;
	try {
		ret = fn(set);
	}
	catch(std::exception& e) {
		LOGERR("%s", e.what());
		ret = false;
	}
	auto stop_time = std::chrono::high_resolution_clock::now();
	logging::undent();
	
	auto duration = std::chrono::duration_cast<std::chrono::milliseconds>(stop_time - start_time);
	
	//only send ending message if the executed function sent any itself
	if(logging::count() - count_before >= 2) {
		LOGNINF("---- function returned: %s ----", "", (ret) ? "okay" : "error");
	}
	fprintf(stderr, "\r%dms\n", (int)duration.count());
	
	return ret;
}

void help_print() {
    LOGALWAYS("most basic interface: 'caskx <container>'. extracts everything into <container>_extracted next to it.");
    LOGALWAYS("");
    LOGALWAYS("advanced interface: 'caskx <command> -i=<input> -o=<output> (optional: -l<logging> -c=<option>:<value> -f=<format> -t=<threads>)'.");
    LOGALWAYS("    different commands use different parameters (see list at the bottom). order is irrelevant.");
    LOGALWAYS("");
    LOGALWAYS("option explanation:");
    {
        LOGBLK
        LOGALWAYS("-l, logging: there are five logging channels available. Error (e), Warning (w), Info (i), Ok (o), and Verbose (v). use + to turn on a channel, and - to turn one off.");
        LOGALWAYS("    by default, all channels except verbose and ok are enabled.");
        LOGALWAYS("    for example: -l+v turns on verbose.");
        LOGALWAYS("                 -l-ewi turns off error, warning, and info.");
        LOGALWAYS("                 -l+v-ewi turns off error, warning, and info, but turns verbose on.");
        LOGALWAYS("-c, configure: set one of the options listed by the options command.");
        LOGALWAYS("    for example: -c=name_encoding:utf8");
        LOGALWAYS("                 -c=simple_crypt:off");
        LOGALWAYS("-f, format: skip detection and read the input as this format (see the formats command).");
        LOGALWAYS("-t, threads: number of entries extracted at the same time.");
    }
    
    LOGALWAYS("");
    LOGALWAYS("here are all the currently implemented commands:");
    LOGALWAYS("D = directory, F = file, - = not required");
    LOGALWAYS("name / input required - output required / explanation");
    LOGBLK;
    for(const auto& a : infoMap) {
        char in_req = '-';
        char out_req = '-';
        if(a.second.inpath_required == comInfo::Rdir) { in_req = 'D'; }
        if(a.second.inpath_required == comInfo::Rfile) { in_req = 'F'; }
        if(a.second.outpath_required == comInfo::Rdir) { out_req = 'D'; }
        if(a.second.outpath_required == comInfo::Rfile) { out_req = 'F'; }
        LOGALWAYS("%-10s %c%c %s", a.first.c_str(), in_req, out_req, a.second.help_string);
    }
}

int main_executer(int argc, char* argv[], settings& set) {
	comInfo* cinf = nullptr;
	std::string found_func_name = "";
	bool options_ok = true;
	
	for(int i = 1; i < argc; i++){
		if(argv[i][0] == '-' && argv[i][1] != '\0'){
			std::string carg = argv[i];
			
			if(carg.size() > 2 && carg[2] == '=') { //for all commands that require an argument
				std::string value = carg.substr(3, std::string::npos);
				if(carg[1] == 'i') { set.inpath = value; }
				if(carg[1] == 'o') { set.outpath = value; }
				if(carg[1] == 'f') { set.format = value; }
				if(carg[1] == 't') {
					int t = atoi(value.c_str());
					if(t < 1) { LOGERR("'%s' is not a usable thread count", value.c_str()); options_ok = false; }
					else { set.threads = (unsigned)t; }
				}
				if(carg[1] == 'c') { //option name:value
					size_t separator = value.find_first_of(':');
					if(separator == std::string::npos) {
						LOGERR("argument \"%s\" needs the form -c=name:value", argv[i]);
						options_ok = false;
					}
					else if(!set.options.set(value.substr(0, separator), value.substr(separator + 1))) {
						options_ok = false;
					}
				}
			}
			
			if(carg[1] == 'l'){
				//Logging settings. use - to set mode to "turn off", use + to set mode to "turn on".
				//example: -l+vewi turns on all channels
				// -l-e+v turns error off (-e), and verbose on (+v)
				//default mode is "turn on".
				bool mode = true;
				for(size_t progress = 2; progress < carg.size(); progress++){
					bool known = true;
					switch(carg[progress]){
						case '-': mode = false; break;
						case '+': mode = true; break;
						case 'v': logging::set_channel(logging::Cverbose, mode); break;
						case 'e': logging::set_channel(logging::Cerror, mode); break;
						case 'w': logging::set_channel(logging::Cwarning, mode); break;
						case 'i': logging::set_channel(logging::Cinfo, mode); break;
						case 'o': logging::set_channel(logging::Cok, mode); break;
						default: known = false; break;
					}
					if(!known) {
						LOGERR("argument \"%s\" could not be parsed properly. char '%c' is unknown", argv[i], carg[progress]);
						break;
					}
				}
			}
		}else{
			auto found = infoMap.find(argv[i]);
			if (found != infoMap.end()) {
				cinf = &found->second;
				found_func_name = argv[i];
				LOGVER("found command %s in arguments", argv[i]);
			}
		}
	}
	
	if(!cinf){
		LOGERR("didn't find operation to do in the arguments supplied!");
		LOGERR("arguments are:");
		for(int i = 0; i < argc; i++) {
			LOGERR("%s", argv[i]);
		}
		return 1;
	}
	if(!options_ok) { LOGERR("aborting due to above errors"); return 1; }
	
	//do verbose logging of passed parameters
	LOGVER("input path:  %s", (set.inpath.length()) ? set.inpath.c_str() : "<not given>");
	LOGVER("output path: %s", (set.outpath.length()) ? set.outpath.c_str() : "<not given>");
	
	//check for required parameters
	auto check_parameters = [](comInfo::Required_type req_type, std::string path, const char* name, bool should_exist) -> bool {
		if(req_type == comInfo::Rno) { return true; }
		if(path.empty()) { LOGNERR("%s path is required", "check_parameters", name); return false; }
		if(req_type == comInfo::Rdir) {
			if(should_exist && !fs::is_directory(fs::u8path(path))) { LOGNERR("%s path is not a directory", "check_parameters", name); return false; }
			if(!should_exist && fs::exists(fs::u8path(path)) && !fs::is_directory(fs::u8path(path))) { LOGNERR("%s path exists, but is not a directory", "check_parameters", name); return false; }
			return true;
		}
		if(req_type == comInfo::Rfile) {
			if(should_exist && !fs::exists(fs::u8path(path))) { LOGNERR("%s file does not exist", "check_parameters", name); return false; }
			if(should_exist && !fs::is_regular_file(fs::u8path(path))) { LOGNERR("%s path is not a file", "check_parameters", name); return false; }
			return true;
		}
		return false;
	};
	
	bool should_die = false;
	should_die |= !check_parameters(cinf->inpath_required, set.inpath, "input", true);
	should_die |= !check_parameters(cinf->outpath_required, set.outpath, "output", false);
	if(should_die) { LOGERR("aborting due to above errors"); return 1; }
	
	return func_handler(set, cinf->fn, found_func_name) ? 0 : 1;
}

bool drag_drop_solver(char* char_argument_one, char* char_argument_two) {
	const std::string argument = char_argument_one;
	const fs::path path_argument = fs::u8path(argument);
	
	if(!fs::is_regular_file(path_argument)) {
		LOGERR("argument '%s' isn't a file on disk, so we can't do anything with it", argument.c_str());
		return false;
	}
	
	settings set;
	set.inpath = argument;
	if(char_argument_two) {
		set.outpath = char_argument_two;
	}
	else {
		fs::path out = path_argument.parent_path();
		out /= path_argument.stem();
		set.outpath = out.u8string() + "_extracted";
	}
	LOGVER("inpath: %s, outpath: %s", set.inpath.c_str(), set.outpath.c_str());
	
	return func_handler(set, proc::extract, "extract");
}

int main(int argc, char* argv[]) {
#ifdef CASK_ON_LINUX
	setlocale(LC_ALL, "C.utf8");
#endif
	
	logging::set_channel(logging::Cerror, true);
	logging::set_channel(logging::Cwarning, true);
	logging::set_channel(logging::Cinfo, true);
	logging::set_channel(logging::Cverbose, false);
	logging::set_channel(logging::Cok, false);
	
	if(argc < 2) {
		help_print();
		return 0;
	}
	
	bool try_drag_drop = argc <= 3 && infoMap.find(argv[1]) == infoMap.end();
	for(int i = 1; i < argc; i++) {
		if(argv[i][0] == '-') { //check if argument is "advanced" (like -i, -o, etc)
			try_drag_drop = false;
			break;
		}
	}
	
	if(try_drag_drop) { //check if we should try for the drag-n-drop interface
		LOGVER("using drag-n-drop-like interface");
		return drag_drop_solver(argv[1], (argc == 3) ? argv[2] : nullptr) ? 0 : 1;
	}
	
	settings set;
	return main_executer(argc, argv, set);
}
