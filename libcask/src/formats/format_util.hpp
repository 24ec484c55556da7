#pragma once

#include <stdint.h>
#include <stddef.h>

#include <string>

namespace Cask {
	namespace Formats {
		
		inline uint32_t peek_u32(const uint8_t* data, size_t offset) {
			return (uint32_t)data[offset] | ((uint32_t)data[offset+1] << 8) | ((uint32_t)data[offset+2] << 16) | ((uint32_t)data[offset+3] << 24);
		}
		
		inline uint64_t peek_u64(const uint8_t* data, size_t offset) {
			return (uint64_t)peek_u32(data, offset) | ((uint64_t)peek_u32(data, offset + 4) << 32);
		}
		
		inline uint16_t peek_u16(const uint8_t* data, size_t offset) {
			return (uint16_t)(data[offset] | (data[offset+1] << 8));
		}
		
		//file name part of a path, either separator
		inline std::string base_name(const std::string& path) {
			size_t pos = path.find_last_of("/\\");
			return (pos == std::string::npos) ? path : path.substr(pos + 1);
		}
	}
}
