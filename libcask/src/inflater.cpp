#include <cask_inflater.hpp>

#include <string.h>

#include <logging.hpp>

Cask::Inflater::Inflater(int window_bits) : _window_bits(window_bits) {
	memset(&_zs, 0, sizeof(_zs));
	_zs.zalloc = Z_NULL;
	_zs.zfree = Z_NULL;
	_zs.opaque = Z_NULL;
	_zs.avail_in = 0;
	_zs.next_in = Z_NULL;
	int ret = inflateInit2(&_zs, _window_bits);
	_ready = (ret == Z_OK);
	if(!_ready) { LOGERR("inflateInit2 failed (%d)", ret); }
}

Cask::Inflater::~Inflater() {
	if(_ready) { inflateEnd(&_zs); }
}

bool Cask::Inflater::reset() {
	if(!_ready) { return false; }
	_finished = false;
	_zs.avail_in = 0;
	_zs.next_in = Z_NULL;
	return inflateReset(&_zs) == Z_OK;
}

void Cask::Inflater::feed(const uint8_t* data, size_t size) {
	_zs.next_in = const_cast<Bytef*>(data);
	_zs.avail_in = (uInt)size;
}

int Cask::Inflater::inflate(uint8_t* out, size_t size, size_t& produced) {
	produced = 0;
	if(!_ready) { return Z_STREAM_ERROR; }
	if(_finished) { return Z_STREAM_END; }
	
	//avail_out is 32 bits wide
	size_t chunk = (size > 0x40000000) ? 0x40000000 : size;
	_zs.next_out = out;
	_zs.avail_out = (uInt)chunk;
	int ret = ::inflate(&_zs, Z_NO_FLUSH);
	produced = chunk - _zs.avail_out;
	
	if(ret == Z_STREAM_END) { _finished = true; }
	if(ret == Z_NEED_DICT) { ret = Z_DATA_ERROR; }
	return ret;
}
