#include <cask_filter.hpp>

#include <stdio.h>
#include <string.h>
#include <algorithm>
#include <utility>

#include <logging.hpp>

static const size_t INPUT_CHUNK = 0x10000;

Cask::InflateStream::InflateStream(std::unique_ptr<Stream> inner, FilterSpec spec, std::shared_ptr<Diagnostics> diagnostics)
	: _inner(std::move(inner)), _spec(std::move(spec)), _diagnostics(std::move(diagnostics)),
	  _inflater(_spec.window_bits), _input(INPUT_CHUNK) {}

uint64_t Cask::InflateStream::size() const {
	uint64_t body = _size_known ? _inflated_size : std::max(_spec.size_hint, _produced);
	return _spec.literal_prefix.size() + body;
}

Cask::Status Cask::InflateStream::restart() {
	if(!_inflater.reset()) { return Status::decode_failure; }
	Status ret = _inner->seek(_spec.header_skip);
	if(ret != Status::ok) {
		LOGERR("%s: payload starts at 0x%x, past the end of the entry", name().c_str(), _spec.header_skip);
		return Status::decode_failure;
	}
	_produced = 0;
	_finished = false;
	_started = true;
	return Status::ok;
}

void Cask::InflateStream::finish(bool clean) {
	_finished = true;
	if(!clean) { LOGVER("%s: %s payload is truncated, keeping 0x%llx bytes", name().c_str(), _spec.label, (unsigned long long)_produced); }
	if(_size_known) { return; }
	
	_size_known = true;
	_inflated_size = _produced;
	if(_spec.has_size_hint && _produced != _spec.size_hint) {
		char msg[256];
		snprintf(msg, sizeof(msg), "%s size mismatch: expected %llu, got %llu", _spec.label,
			(unsigned long long)_spec.size_hint, (unsigned long long)_produced);
		if(_diagnostics) { _diagnostics->warn_once(name(), msg); }
		else { LOGNWAR("%s", name().c_str(), msg); }
	}
}

Cask::Status Cask::InflateStream::decode(uint8_t* out, size_t size, size_t& produced) {
	produced = 0;
	while(produced < size && !_finished) {
		if(_inflater.pending_input() == 0) {
			size_t got = 0;
			Status ret = _inner->read(_input.data(), _input.size(), got);
			if(ret != Status::ok) {
				_started = false; //whatever got read is lost, next read starts over
				return ret;
			}
			if(got == 0) { finish(false); break; }
			_inflater.feed(_input.data(), got);
		}
		
		size_t got = 0;
		int ret = _inflater.inflate(out + produced, size - produced, got);
		produced += got;
		_produced += got;
		
		if(ret == Z_STREAM_END) { finish(true); break; }
		if(ret == Z_BUF_ERROR && _inflater.pending_input() == 0) { continue; }
		if(ret != Z_OK) {
			LOGERR("%s: inflate failed (%d) after 0x%llx bytes", name().c_str(), ret, (unsigned long long)_produced);
			_started = false; //next read starts over
			return Status::decode_failure;
		}
	}
	return Status::ok;
}

Cask::Status Cask::InflateStream::discard(uint64_t count) {
	uint8_t scratch[0x1000];
	while(count && !_finished) {
		size_t got = 0;
		Status ret = decode(scratch, (size_t)std::min<uint64_t>(count, sizeof(scratch)), got);
		if(ret != Status::ok) { return ret; }
		count -= got;
	}
	return Status::ok;
}

Cask::Status Cask::InflateStream::read(uint8_t* data, size_t size, size_t& read_count) {
	read_count = 0;
	const uint64_t prefix_len = _spec.literal_prefix.size();
	
	while(read_count < size) {
		if(_pos < prefix_len) {
			size_t n = (size_t)std::min<uint64_t>(prefix_len - _pos, size - read_count);
			memcpy(data + read_count, _spec.literal_prefix.data() + _pos, n);
			read_count += n;
			_pos += n;
			continue;
		}
		
		uint64_t target = _pos - prefix_len;
		Status ret = Status::ok;
		if(!_started || target < _produced) { ret = restart(); }
		if(ret == Status::ok && target > _produced) { ret = discard(target - _produced); }
		if(ret != Status::ok) { return ret; }
		if(_finished && target > _produced) {
			LOGVER("%s: position 0x%llx is past the end (0x%llx)", name().c_str(), (unsigned long long)_pos, (unsigned long long)this->size());
			return Status::out_of_bounds;
		}
		if(_finished) { break; }
		
		size_t got = 0;
		ret = decode(data + read_count, size - read_count, got);
		read_count += got;
		_pos += got;
		if(ret != Status::ok) { return ret; }
		if(got == 0) { break; }
	}
	return Status::ok;
}

Cask::Status Cask::InflateStream::seek(uint64_t pos) {
	if(_size_known && pos > size()) { return Status::out_of_bounds; }
	_pos = pos;
	return Status::ok;
}
