#pragma once

#include <stdint.h>
#include <stdio.h>

#include <string>
#include <vector>

#include <logging.hpp>

namespace Cask {
	
	enum class Endian {
		current = 0,
		little = 1,
		big = 2,
	};
	
	typedef int Seek;
	static const Seek Seek_start = 0;
	static const Seek Seek_current = 1;
	static const Seek Seek_end = 2;
	
	//read-only byte container; every archive sits on top of one of these
	class File {
	public:
		virtual bool close() = 0;
		
		virtual ~File() {}
		
		virtual uint64_t tell() { return _offset; }
		virtual bool skip(int64_t length) = 0;
		virtual bool seek(int64_t pos, Seek mode = Seek_start) = 0;
		virtual uint64_t size() { return _size; }
		
		//all-or-nothing: false when fewer than size bytes are available
		virtual bool read(uint8_t* data, size_t size) = 0;
		bool read_endian(uint8_t* data, size_t size, Endian endian = Endian::current);
		
		template<typename T>
		bool read(T& type, Endian endian = Endian::current) {
			return read_endian(reinterpret_cast<uint8_t*>(&type), sizeof(T), endian);
		}
		
		template<typename T>
		T read(Endian endian = Endian::current) {
			T type{};
			this->read_endian(reinterpret_cast<uint8_t*>(&type), sizeof(T), endian);
			return type;
		}
		
		Endian endian() { return _endian; }
		Endian endian(Endian new_endian) { _endian = new_endian; return _endian; }
		
	protected:
		uint64_t _offset = 0;
		uint64_t _size = 0;
		Endian _endian = Endian::little;
	};
	
	class FileDisk : public File {
	public:
		~FileDisk();
		
		bool open(const char* const path, Endian endian = Endian::little);
		bool close();
		
		bool skip(int64_t length);
		bool seek(int64_t pos, Seek mode = Seek_start);
		
		using File::read;
		bool read(uint8_t* data, size_t size);
		
	private:
		FILE* _fp = nullptr;
	};
	
	class FileMemory : public File {
	public:
		FileMemory() {}
		~FileMemory();
		
		bool open(const uint8_t* data, size_t data_size, Endian endian = Endian::little); //caller keeps the buffer alive
		bool open_owned(std::vector<uint8_t> data, Endian endian = Endian::little);
		bool close();
		
		bool skip(int64_t length);
		bool seek(int64_t pos, Seek mode = Seek_start);
		
		using File::read;
		bool read(uint8_t* data, size_t size);
		
		const uint8_t* unsafe_get_buffer() { return _buffer; }
		
	private:
		const uint8_t* _buffer = nullptr;
		std::vector<uint8_t> _owned;
	};
}
