#pragma once

#include <stdint.h>

#include <memory>
#include <string>
#include <vector>

#include "cask_diagnostics.hpp"
#include "cask_inflater.hpp"
#include "cask_options.hpp"
#include "cask_stream.hpp"

namespace Cask {
	
	enum class FilterKind {
		cipher,  //per-byte transform, seeks are free
		inflate, //deflate payload, seeking backwards restarts it
	};
	
	enum class Cipher {
		none,
		simple_crypt_xor,  //SimpleCrypt mode 0
		simple_crypt_swap, //SimpleCrypt mode 1, swaps neighbouring bits
	};
	
	//one layer: visible bytes are literal_prefix followed by the transformed
	//bytes of the layer below, starting header_skip bytes in
	struct FilterSpec {
		const char* label = "";
		FilterKind kind = FilterKind::cipher;
		Cipher cipher = Cipher::none;
		uint32_t header_skip = 0;
		std::vector<uint8_t> literal_prefix;
		bool has_size_hint = false;
		uint64_t size_hint = 0; //expected inflated size, mismatches only warn
		int window_bits = Inflater::WINDOW_ZLIB;
	};
	
	uint8_t simple_crypt_xor(uint8_t ch);
	uint8_t simple_crypt_swap(uint8_t ch);
	
	class CipherStream : public Stream {
	public:
		CipherStream(std::unique_ptr<Stream> inner, FilterSpec spec);
		
		Status read(uint8_t* data, size_t size, size_t& read_count) override;
		Status seek(uint64_t pos) override;
		uint64_t tell() const override { return _pos; }
		uint64_t size() const override;
		bool size_known() const override { return _inner->size_known(); }
		const std::string& name() const override { return _inner->name(); }
		
	private:
		std::unique_ptr<Stream> _inner;
		FilterSpec _spec;
		uint64_t _pos = 0;
	};
	
	class InflateStream : public Stream {
	public:
		InflateStream(std::unique_ptr<Stream> inner, FilterSpec spec, std::shared_ptr<Diagnostics> diagnostics);
		
		Status read(uint8_t* data, size_t size, size_t& read_count) override;
		//only checked against size() once that is known, otherwise a read
		//past the real end reports out_of_bounds
		Status seek(uint64_t pos) override;
		uint64_t tell() const override { return _pos; }
		//the size hint until the payload has been inflated to the end once
		uint64_t size() const override;
		bool size_known() const override { return _size_known; }
		const std::string& name() const override { return _inner->name(); }
		
	private:
		Status restart();
		Status decode(uint8_t* out, size_t size, size_t& produced);
		Status discard(uint64_t count);
		void finish(bool clean);
		
		std::unique_ptr<Stream> _inner;
		FilterSpec _spec;
		std::shared_ptr<Diagnostics> _diagnostics;
		Inflater _inflater;
		std::vector<uint8_t> _input;
		bool _started = false;
		bool _finished = false;
		bool _size_known = false;
		uint64_t _produced = 0; //inflated bytes so far in this pass
		uint64_t _inflated_size = 0;
		uint64_t _pos = 0;
	};
	
	//the transforms stacked on top of an entry, picked once when the entry is opened
	class FilterChain {
	public:
		static constexpr size_t SNIFF_SIZE = 32;
		
		//which transform, if any, the first bytes of a stream ask for
		static bool match(const uint8_t* header, size_t size, const Options& options, FilterSpec& spec);
		static std::unique_ptr<Stream> wrap(std::unique_ptr<Stream> inner, const FilterSpec& spec, std::shared_ptr<Diagnostics> diagnostics);
		
		//sniffs and wraps until nothing matches or max_filters layers are on.
		//a layer whose first bytes fail to decode is left unwrapped, its reads report the failure.
		Status apply(std::unique_ptr<Stream>& stream, const Options& options, std::shared_ptr<Diagnostics> diagnostics);
		
		const std::vector<FilterSpec>& specs() const { return _specs; }
		bool empty() const { return _specs.empty(); }
		
	private:
		std::vector<FilterSpec> _specs;
	};
}
