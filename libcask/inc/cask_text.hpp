#pragma once

#include <stdint.h>
#include <stddef.h>

#include <string>

#include "cask_options.hpp"

namespace Cask {
	
	//turns a fixed-size name field into UTF-8. the field ends at the first NUL
	//(or NUL code unit for utf16le); undecodable bytes become '?'.
	std::string decode_name(const uint8_t* data, size_t size, NameEncoding encoding);
}
