#include <cask_archive.hpp>
#include <cask_entry_stream.hpp>

#include <algorithm>
#include <utility>

#include <logging.hpp>

Cask::Status Cask::Archive::open(const std::string& path, const Options& options, const Registry& registry) {
	std::shared_ptr<Source> source = Source::open_disk(path);
	if(!source) { return Status::io_error; }
	return open(source, path, options, registry);
}

Cask::Status Cask::Archive::open(std::shared_ptr<Source> source, const std::string& filename, const Options& options, const Registry& registry) {
	if(!source) { return Status::io_error; }
	
	std::vector<uint8_t> header((size_t)std::min<uint64_t>(Registry::HEADER_PREFIX, source->size()));
	if(!source->read_at(0, header.data(), header.size())) {
		LOGERR("couldn't read the header of %s", filename.c_str());
		return Status::io_error;
	}
	
	int score = NO_MATCH;
	const Format* format = registry.detect(filename, header.data(), header.size(), options, &score);
	if(!format) {
		LOGERR("%s isn't a container we know", filename.c_str());
		return Status::format_mismatch;
	}
	LOGVER("detected %s (score %d)", format->name, score);
	
	return open_as(*format, std::move(source), filename, options);
}

Cask::Status Cask::Archive::open_as(const Format& format, std::shared_ptr<Source> source, const std::string& filename, const Options& options) {
	if(!source) { return Status::io_error; }
	
	std::vector<EntryDescriptor> entries;
	Status ret = format.parse(*source, filename, options, entries);
	if(ret != Status::ok) {
		LOGERR("couldn't read %s as %s: %s", filename.c_str(), format.name, status_string(ret));
		return ret;
	}
	
	for(const auto& entry : entries) {
		if(!entry.fits(source->size())) {
			LOGERR("%s: %s points outside the container", format.name, entry.name().c_str());
			return Status::structural_corruption;
		}
	}
	
	//only now does the archive change
	_format = &format;
	_source = std::move(source);
	_diagnostics = std::make_shared<Diagnostics>();
	_entries = std::move(entries);
	_options = options;
	
	LOGOK("opened %s as %s, %zu entries", filename.c_str(), format.name, _entries.size());
	return Status::ok;
}

void Cask::Archive::close() {
	_format = nullptr;
	_source.reset();
	_diagnostics.reset();
	_entries.clear();
}

std::vector<Cask::Archive::EntryInfo> Cask::Archive::list_entries() const {
	std::vector<EntryInfo> list;
	list.reserve(_entries.size());
	for(const auto& entry : _entries) {
		list.push_back({ entry.name(), entry.size() });
	}
	return list;
}

Cask::Status Cask::Archive::find(const std::string& name, size_t& index) const {
	for(size_t i = 0; i < _entries.size(); i++) {
		if(_entries[i].name() == name) {
			index = i;
			return Status::ok;
		}
	}
	return Status::not_found;
}

Cask::Status Cask::Archive::open_raw_entry(size_t index, std::unique_ptr<Stream>& out) const {
	if(index >= _entries.size()) {
		LOGVER("no entry %zu, there are %zu", index, _entries.size());
		return Status::out_of_bounds;
	}
	out.reset(new EntryStream(_source, _entries[index]));
	return Status::ok;
}

Cask::Status Cask::Archive::open_entry(size_t index, std::unique_ptr<Stream>& out, FilterChain* chain) const {
	std::unique_ptr<Stream> stream;
	Status ret = open_raw_entry(index, stream);
	if(ret != Status::ok) { return ret; }
	
	FilterChain filters;
	ret = filters.apply(stream, _options, _diagnostics);
	if(ret != Status::ok) {
		LOGERR("%s: couldn't pick filters: %s", _entries[index].name().c_str(), status_string(ret));
		return ret;
	}
	
	if(chain) { *chain = std::move(filters); }
	out = std::move(stream);
	return Status::ok;
}

Cask::Status Cask::Archive::open_entry(const std::string& name, std::unique_ptr<Stream>& out, FilterChain* chain) const {
	size_t index = 0;
	Status ret = find(name, index);
	if(ret != Status::ok) {
		LOGVER("no entry called %s", name.c_str());
		return ret;
	}
	return open_entry(index, out, chain);
}
