#include <cask_text.hpp>

#include <errno.h>
#include <iconv.h>

#include <logging.hpp>

static const char* iconv_name(Cask::NameEncoding encoding) {
	switch(encoding) {
		case Cask::NameEncoding::cp932: return "CP932";
		case Cask::NameEncoding::utf16le: return "UTF-16LE";
		case Cask::NameEncoding::utf8: return "UTF-8";
	}
	return "UTF-8";
}

std::string Cask::decode_name(const uint8_t* data, size_t size, NameEncoding encoding) {
	//cut at the terminator
	size_t unit = (encoding == NameEncoding::utf16le) ? 2 : 1;
	size_t len = 0;
	bool ascii = true;
	while(len + unit <= size) {
		uint16_t ch = (unit == 2) ? (uint16_t)(data[len] | (data[len+1] << 8)) : data[len];
		if(ch == 0) { break; }
		if(ch >= 0x80) { ascii = false; }
		len += unit;
	}
	
	std::string out;
	if(ascii) {
		out.reserve(len / unit);
		for(size_t i = 0; i < len; i += unit) { out += (char)data[i]; }
		return out;
	}
	if(encoding == NameEncoding::utf8) {
		return std::string((const char*)data, len);
	}
	
	iconv_t cd = iconv_open("UTF-8", iconv_name(encoding));
	if(cd == (iconv_t)-1) {
		LOGERR("iconv can't convert from %s", iconv_name(encoding));
		return std::string((const char*)data, len);
	}
	
	char buf[512];
	char* in = (char*)data;
	size_t in_left = len;
	while(in_left) {
		char* outp = buf;
		size_t out_left = sizeof(buf);
		size_t ret = iconv(cd, &in, &in_left, &outp, &out_left);
		out.append(buf, outp - buf);
		if(ret == (size_t)-1) {
			if(errno == E2BIG) { continue; }
			//EILSEQ or a cut-off multibyte sequence at the end of the field
			out += '?';
			size_t step = (in_left < unit) ? in_left : unit;
			in += step;
			in_left -= step;
			iconv(cd, nullptr, nullptr, nullptr, nullptr);
		}
	}
	iconv_close(cd);
	return out;
}
