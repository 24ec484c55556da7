#pragma once

#include <stdint.h>

#include <mutex>
#include <set>
#include <string>
#include <vector>

namespace Cask {
	
	//non-fatal anomalies for one archive. streams opened from the archive share it,
	//so this one is locked.
	class Diagnostics {
	public:
		//counts and logs, but only the first time key is seen
		bool warn_once(const std::string& key, const std::string& message);
		void warn(const std::string& message);
		
		uint64_t warnings() const;
		std::vector<std::string> messages() const;
		void clear();
		
	private:
		mutable std::mutex _mutex;
		uint64_t _warnings = 0;
		std::set<std::string> _seen;
		std::vector<std::string> _messages;
	};
}
