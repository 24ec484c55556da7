#pragma once

#include <stdint.h>

#include <memory>
#include <string>
#include <vector>

#include <caskio_source.hpp>

#include "cask_entry.hpp"
#include "cask_inflater.hpp"
#include "cask_stream.hpp"

namespace Cask {
	
	//decoding cursor over one entry. raw segments are read straight from the source,
	//compressed ones go through a decoder that stays bound to its segment for as long
	//as access keeps moving forward inside it.
	//the descriptor is borrowed: the archive that owns it must outlive the stream.
	class EntryStream : public Stream {
	public:
		enum class State {
			idle,      //no decoder
			streaming, //decoder bound to one compressed segment
		};
		
		EntryStream(std::shared_ptr<Source> source, const EntryDescriptor& entry);
		
		Status read(uint8_t* data, size_t size, size_t& read_count) override;
		//bookkeeping only, the decoder is restarted (or fast-forwarded) by the next read
		Status seek(uint64_t pos) override;
		uint64_t tell() const override { return _pos; }
		uint64_t size() const override { return _entry.size(); }
		const std::string& name() const override { return _entry.name(); }
		
		State state() const { return _decoder ? State::streaming : State::idle; }
		const EntryDescriptor& entry() const { return _entry; }
		
	private:
		struct Decoder {
			size_t segment;
			uint64_t logical = 0;  //decoded bytes produced so far
			uint64_t consumed = 0; //physical bytes fed so far
			Inflater inflater;
			std::vector<uint8_t> input;
			
			explicit Decoder(size_t index);
		};
		
		Status bind(size_t index);
		Status pull(uint8_t* out, size_t size, size_t& produced);
		Status discard(uint64_t count);
		void drop() { _decoder.reset(); }
		
		std::shared_ptr<Source> _source;
		const EntryDescriptor& _entry;
		uint64_t _pos = 0;
		size_t _hint = 0;
		std::unique_ptr<Decoder> _decoder;
	};
}
