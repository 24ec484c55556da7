#pragma once

#include <stdint.h>

#include <memory>
#include <string>
#include <vector>

#include <caskio_source.hpp>

#include "cask_diagnostics.hpp"
#include "cask_entry.hpp"
#include "cask_filter.hpp"
#include "cask_format.hpp"
#include "cask_options.hpp"
#include "cask_status.hpp"
#include "cask_stream.hpp"

namespace Cask {
	
	//an opened container: its format, its entry table and the source the entries
	//are read from. opening either fully succeeds or leaves the archive untouched.
	//streams handed out by open_entry borrow the entry table, close the archive
	//only once they are gone. the registry passed to open has to outlive it too.
	class Archive {
	public:
		struct EntryInfo {
			std::string name;
			uint64_t size;
		};
		
		Archive() {}
		Archive(const Archive&) = delete;
		Archive& operator=(const Archive&) = delete;
		
		Status open(const std::string& path, const Options& options = Options(), const Registry& registry = Registry::builtin());
		Status open(std::shared_ptr<Source> source, const std::string& filename, const Options& options = Options(), const Registry& registry = Registry::builtin());
		//skips detection
		Status open_as(const Format& format, std::shared_ptr<Source> source, const std::string& filename, const Options& options = Options());
		void close();
		
		bool is_open() const { return _format != nullptr; }
		const Format* format() const { return _format; }
		std::shared_ptr<Source> source() const { return _source; }
		std::shared_ptr<Diagnostics> diagnostics() const { return _diagnostics; }
		const Options& options() const { return _options; }
		
		size_t count() const { return _entries.size(); }
		const std::vector<EntryDescriptor>& entries() const { return _entries; }
		std::vector<EntryInfo> list_entries() const;
		Status find(const std::string& name, size_t& index) const;
		
		//out_of_bounds for an index past the end, not_found for an unknown name.
		//the stream comes with whatever filters the entry's first bytes call for.
		Status open_entry(size_t index, std::unique_ptr<Stream>& out, FilterChain* chain = nullptr) const;
		Status open_entry(const std::string& name, std::unique_ptr<Stream>& out, FilterChain* chain = nullptr) const;
		//stored bytes, no filters
		Status open_raw_entry(size_t index, std::unique_ptr<Stream>& out) const;
		
	private:
		const Format* _format = nullptr;
		std::shared_ptr<Source> _source;
		std::shared_ptr<Diagnostics> _diagnostics;
		std::vector<EntryDescriptor> _entries;
		Options _options;
	};
}
