#include <cask_filter.hpp>

#include <string.h>
#include <algorithm>
#include <utility>

#include <logging.hpp>

static const uint8_t UTF16LE_BOM[2] = { 0xFF, 0xFE };

uint8_t Cask::simple_crypt_xor(uint8_t ch) {
	//control characters are stored as-is
	if(ch < 20) { return ch; }
	uint16_t wide = ch;
	return (uint8_t)(wide ^ (((wide & 0xfe) << 8) ^ 1));
}

uint8_t Cask::simple_crypt_swap(uint8_t ch) {
	return (uint8_t)(((ch & 0xaa) >> 1) | ((ch & 0x55) << 1));
}

Cask::CipherStream::CipherStream(std::unique_ptr<Stream> inner, FilterSpec spec)
	: _inner(std::move(inner)), _spec(std::move(spec)) {}

uint64_t Cask::CipherStream::size() const {
	uint64_t inner_size = _inner->size();
	uint64_t body = (inner_size > _spec.header_skip) ? inner_size - _spec.header_skip : 0;
	return _spec.literal_prefix.size() + body;
}

Cask::Status Cask::CipherStream::read(uint8_t* data, size_t size, size_t& read_count) {
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
		if(_inner->size_known() && _pos >= this->size()) { break; }
		
		uint64_t inner_pos = _spec.header_skip + (_pos - prefix_len);
		if(_inner->tell() != inner_pos) {
			Status ret = _inner->seek(inner_pos);
			if(ret != Status::ok) { return ret; }
		}
		
		size_t got = 0;
		Status ret = _inner->read(data + read_count, size - read_count, got);
		uint8_t* out = data + read_count;
		for(size_t i = 0; i < got; i++) {
			if(_spec.cipher == Cipher::simple_crypt_xor) { out[i] = simple_crypt_xor(out[i]); }
			else if(_spec.cipher == Cipher::simple_crypt_swap) { out[i] = simple_crypt_swap(out[i]); }
		}
		read_count += got;
		_pos += got;
		if(ret != Status::ok) { return ret; }
		if(got == 0) { break; }
	}
	return Status::ok;
}

Cask::Status Cask::CipherStream::seek(uint64_t pos) {
	if(_inner->size_known() && pos > this->size()) { return Status::out_of_bounds; }
	_pos = pos;
	return Status::ok;
}

bool Cask::FilterChain::match(const uint8_t* header, size_t size, const Options& options, FilterSpec& spec) {
	if(!options.filters) { return false; }
	
	if(options.simple_crypt && size >= 5
		&& header[0] == 0xFE && header[1] == 0xFE && header[2] <= 2
		&& header[3] == 0xFF && header[4] == 0xFE) {
		spec = FilterSpec();
		spec.header_skip = 5;
		spec.literal_prefix.assign(UTF16LE_BOM, UTF16LE_BOM + 2);
		
		if(header[2] == 0) {
			spec.label = "simple_crypt_xor";
			spec.kind = FilterKind::cipher;
			spec.cipher = Cipher::simple_crypt_xor;
			return true;
		}
		if(header[2] == 1) {
			spec.label = "simple_crypt_swap";
			spec.kind = FilterKind::cipher;
			spec.cipher = Cipher::simple_crypt_swap;
			return true;
		}
		
		//mode 2: u64 compressed size, u64 inflated size, raw deflate
		if(size < 21) { return false; }
		uint64_t inflated = 0;
		for(int i = 7; i >= 0; i--) { inflated = (inflated << 8) | header[13 + i]; }
		spec.label = "simple_crypt_deflate";
		spec.kind = FilterKind::inflate;
		spec.header_skip = 21;
		spec.has_size_hint = true;
		spec.size_hint = inflated;
		spec.window_bits = Inflater::WINDOW_RAW;
		return true;
	}
	
	if(options.mdf_unwrap && size >= 8 && !memcmp(header, "mdf\0", 4)) {
		spec = FilterSpec();
		spec.label = "mdf";
		spec.kind = FilterKind::inflate;
		spec.header_skip = 8;
		spec.has_size_hint = true;
		spec.size_hint = (uint32_t)header[4] | ((uint32_t)header[5] << 8) | ((uint32_t)header[6] << 16) | ((uint32_t)header[7] << 24);
		spec.window_bits = Inflater::WINDOW_ZLIB;
		return true;
	}
	
	return false;
}

std::unique_ptr<Cask::Stream> Cask::FilterChain::wrap(std::unique_ptr<Stream> inner, const FilterSpec& spec, std::shared_ptr<Diagnostics> diagnostics) {
	if(spec.kind == FilterKind::inflate) {
		return std::unique_ptr<Stream>(new InflateStream(std::move(inner), spec, std::move(diagnostics)));
	}
	return std::unique_ptr<Stream>(new CipherStream(std::move(inner), spec));
}

Cask::Status Cask::FilterChain::apply(std::unique_ptr<Stream>& stream, const Options& options, std::shared_ptr<Diagnostics> diagnostics) {
	if(!options.filters) { return Status::ok; }
	
	while((int)_specs.size() < options.max_filters) {
		uint8_t header[SNIFF_SIZE];
		size_t got = 0;
		Status ret = stream->peek(header, sizeof(header), got);
		if(ret == Status::decode_failure) {
			LOGVER("%s: first bytes don't decode, no more filters", stream->name().c_str());
			break;
		}
		if(ret != Status::ok) { return ret; }
		
		FilterSpec spec;
		if(!match(header, got, options, spec)) { break; }
		
		LOGVER("%s: applying %s", stream->name().c_str(), spec.label);
		stream = wrap(std::move(stream), spec, diagnostics);
		_specs.push_back(std::move(spec));
	}
	return Status::ok;
}
