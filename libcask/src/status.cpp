#include <cask_status.hpp>

const char* Cask::status_string(Status status) {
	switch(status) {
		case Status::ok: return "ok";
		case Status::format_mismatch: return "format mismatch";
		case Status::structural_corruption: return "structural corruption";
		case Status::out_of_bounds: return "out of bounds";
		case Status::decode_failure: return "decode failure";
		case Status::not_found: return "not found";
		case Status::io_error: return "io error";
		case Status::unsupported: return "unsupported";
	}
	return "unknown";
}
