#pragma once

namespace Cask {
	
	enum class Status {
		ok = 0,
		format_mismatch,       //no candidate recognised the container
		structural_corruption, //index data contradicts itself or the container
		out_of_bounds,         //seek past the end, entry index past the count, or a short exact read
		decode_failure,        //compressed bytes could not be inflated
		not_found,             //no entry with that name
		io_error,              //the byte container refused a read
		unsupported,           //recognised, but not something we can open
	};
	
	const char* status_string(Status status);
	
	inline bool ok(Status status) { return status == Status::ok; }
}
