#include <cask_entry_stream.hpp>

#include <algorithm>
#include <utility>

#include <logging.hpp>

static const size_t INPUT_CHUNK = 0x10000;
static const size_t DISCARD_CHUNK = 0x1000;

Cask::EntryStream::Decoder::Decoder(size_t index)
	: segment(index), inflater(Inflater::WINDOW_ZLIB), input(INPUT_CHUNK) {}

Cask::EntryStream::EntryStream(std::shared_ptr<Source> source, const EntryDescriptor& entry)
	: _source(std::move(source)), _entry(entry) {}

Cask::Status Cask::EntryStream::bind(size_t index) {
	_decoder.reset(new Decoder(index));
	if(!_decoder->inflater.ready()) {
		drop();
		return Status::decode_failure;
	}
	return Status::ok;
}

Cask::Status Cask::EntryStream::pull(uint8_t* out, size_t size, size_t& produced) {
	produced = 0;
	const Segment& seg = _entry.segments()[_decoder->segment];
	Inflater& inf = _decoder->inflater;
	
	while(produced < size) {
		if(inf.pending_input() == 0) {
			uint64_t remaining = seg.physical_size - _decoder->consumed;
			if(remaining == 0) {
				LOGERR("%s: segment %zu ran out of input after 0x%llx of 0x%llx bytes", _entry.name().c_str(), _decoder->segment,
					(unsigned long long)_decoder->logical, (unsigned long long)seg.logical_size);
				return Status::decode_failure;
			}
			size_t n = (size_t)std::min<uint64_t>(remaining, _decoder->input.size());
			if(!_source->read_at(seg.physical_offset + _decoder->consumed, _decoder->input.data(), n)) {
				LOGERR("%s: couldn't read 0x%zx bytes at 0x%llx", _entry.name().c_str(), n,
					(unsigned long long)(seg.physical_offset + _decoder->consumed));
				return Status::io_error;
			}
			_decoder->consumed += n;
			inf.feed(_decoder->input.data(), n);
		}
		
		size_t got = 0;
		int ret = inf.inflate(out + produced, size - produced, got);
		produced += got;
		_decoder->logical += got;
		
		if(ret == Z_STREAM_END) {
			if(produced < size) {
				LOGERR("%s: segment %zu ended early at 0x%llx of 0x%llx bytes", _entry.name().c_str(), _decoder->segment,
					(unsigned long long)_decoder->logical, (unsigned long long)seg.logical_size);
				return Status::decode_failure;
			}
			break;
		}
		if(ret == Z_BUF_ERROR && inf.pending_input() == 0) { continue; } //wants more input
		if(ret != Z_OK) {
			LOGERR("%s: inflate failed in segment %zu (%d)", _entry.name().c_str(), _decoder->segment, ret);
			return Status::decode_failure;
		}
	}
	return Status::ok;
}

Cask::Status Cask::EntryStream::discard(uint64_t count) {
	uint8_t scratch[DISCARD_CHUNK];
	while(count) {
		size_t n = (size_t)std::min<uint64_t>(count, sizeof(scratch));
		size_t got = 0;
		Status ret = pull(scratch, n, got);
		if(ret != Status::ok) { return ret; }
		count -= got;
	}
	return Status::ok;
}

Cask::Status Cask::EntryStream::read(uint8_t* data, size_t size, size_t& read_count) {
	read_count = 0;
	
	while(read_count < size && _pos < _entry.size()) {
		size_t index = _entry.locate(_pos, _hint);
		_hint = index;
		const Segment& seg = _entry.segments()[index];
		uint64_t within = _pos - _entry.segment_start(index);
		size_t want = (size_t)std::min<uint64_t>(size - read_count, seg.logical_size - within);
		if(want == 0) { break; }
		
		size_t got = 0;
		Status ret = Status::ok;
		if(!seg.compressed) {
			drop();
			if(!_source->read_at(seg.physical_offset + within, data + read_count, want)) {
				LOGERR("%s: couldn't read 0x%zx bytes at 0x%llx", _entry.name().c_str(), want,
					(unsigned long long)(seg.physical_offset + within));
				return Status::io_error;
			}
			got = want;
		}
		else {
			if(!_decoder || _decoder->segment != index || _decoder->logical > within) {
				ret = bind(index);
			}
			if(ret == Status::ok && _decoder->logical < within) {
				//resuming after a seek into the middle of the segment
				ret = discard(within - _decoder->logical);
			}
			if(ret == Status::ok) {
				ret = pull(data + read_count, want, got);
			}
		}
		
		read_count += got;
		_pos += got;
		
		if(ret != Status::ok) {
			drop();
			return ret;
		}
		if(seg.compressed && within + got == seg.logical_size) { drop(); }
	}
	
	if(_pos >= _entry.size()) { drop(); }
	return Status::ok;
}

Cask::Status Cask::EntryStream::seek(uint64_t pos) {
	if(pos > _entry.size()) {
		LOGVER("%s: seek to 0x%llx is past the end (0x%llx)", _entry.name().c_str(),
			(unsigned long long)pos, (unsigned long long)_entry.size());
		return Status::out_of_bounds;
	}
	
	if(_decoder) {
		//a decoder survives only forward motion inside its own segment
		size_t index = _entry.locate(pos, _decoder->segment);
		bool keep = pos < _entry.size()
			&& index == _decoder->segment
			&& pos - _entry.segment_start(index) >= _decoder->logical;
		if(!keep) { drop(); }
	}
	
	_pos = pos;
	return Status::ok;
}
