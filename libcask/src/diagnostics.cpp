#include <cask_diagnostics.hpp>

#include <logging.hpp>

bool Cask::Diagnostics::warn_once(const std::string& key, const std::string& message) {
	{
		std::lock_guard<std::mutex> lock(_mutex);
		if(!_seen.insert(key).second) { return false; }
		_warnings++;
		_messages.push_back(message);
	}
	LOGNWAR("%s", key.c_str(), message.c_str());
	return true;
}

void Cask::Diagnostics::warn(const std::string& message) {
	{
		std::lock_guard<std::mutex> lock(_mutex);
		_warnings++;
		_messages.push_back(message);
	}
	LOGWAR("%s", message.c_str());
}

uint64_t Cask::Diagnostics::warnings() const {
	std::lock_guard<std::mutex> lock(_mutex);
	return _warnings;
}

std::vector<std::string> Cask::Diagnostics::messages() const {
	std::lock_guard<std::mutex> lock(_mutex);
	return _messages;
}

void Cask::Diagnostics::clear() {
	std::lock_guard<std::mutex> lock(_mutex);
	_warnings = 0;
	_seen.clear();
	_messages.clear();
}
