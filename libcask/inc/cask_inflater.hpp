#pragma once

#include <stdint.h>
#include <stddef.h>

#include <zlib.h>

namespace Cask {
	
	//owns one z_stream. input is fed in caller-owned chunks and must stay alive
	//until pending_input() drops to zero.
	class Inflater {
	public:
		static constexpr int WINDOW_ZLIB = MAX_WBITS;
		static constexpr int WINDOW_RAW = -MAX_WBITS;
		
		explicit Inflater(int window_bits = WINDOW_ZLIB);
		~Inflater();
		Inflater(const Inflater&) = delete;
		Inflater& operator=(const Inflater&) = delete;
		
		bool ready() const { return _ready; }
		bool reset();
		
		void feed(const uint8_t* data, size_t size);
		size_t pending_input() const { return _zs.avail_in; }
		
		//returns the zlib code; produced is filled either way
		int inflate(uint8_t* out, size_t size, size_t& produced);
		bool finished() const { return _finished; }
		uint64_t total_out() const { return _zs.total_out; }
		
	private:
		z_stream _zs;
		int _window_bits;
		bool _ready = false;
		bool _finished = false;
	};
}
