#pragma once

#include <stdint.h>

#include <memory>
#include <mutex>
#include <string>
#include <vector>

#include "caskio_file.hpp"

namespace Cask {
	
	//the byte container behind one archive, shared by every stream opened from it.
	//each positioned read is one locked seek+read, so streams on different threads
	//never see each other's cursor.
	class Source {
	public:
		explicit Source(std::unique_ptr<File> file, std::string path = "");
		Source(const Source&) = delete;
		Source& operator=(const Source&) = delete;
		
		static std::shared_ptr<Source> open_disk(const std::string& path);
		static std::shared_ptr<Source> open_memory(std::vector<uint8_t> data, std::string path = "");
		
		//exactly size bytes at offset, or false
		bool read_at(uint64_t offset, uint8_t* data, size_t size);
		//up to size bytes at offset, stops at the end of the container
		size_t read_some_at(uint64_t offset, uint8_t* data, size_t size);
		
		template<typename T>
		bool read_at(uint64_t offset, T& type, Endian endian = Endian::little) {
			std::lock_guard<std::mutex> lock(_mutex);
			if(!_file->seek((int64_t)offset)) { return false; }
			return _file->read_endian(reinterpret_cast<uint8_t*>(&type), sizeof(T), endian);
		}
		
		uint64_t size() const { return _size; }
		const std::string& path() const { return _path; }
		
	private:
		std::mutex _mutex;
		std::unique_ptr<File> _file;
		uint64_t _size = 0;
		std::string _path;
	};
}
