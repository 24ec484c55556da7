#include <caskio_source.hpp>

#include <algorithm>
#include <utility>

#include <logging.hpp>

Cask::Source::Source(std::unique_ptr<File> file, std::string path)
	: _file(std::move(file)), _path(std::move(path)) {
	_size = _file ? _file->size() : 0;
}

std::shared_ptr<Cask::Source> Cask::Source::open_disk(const std::string& path) {
	std::unique_ptr<FileDisk> file(new FileDisk());
	if(!file->open(path.c_str())) {
		LOGERR("couldn't open %s", path.c_str());
		return nullptr;
	}
	return std::make_shared<Source>(std::move(file), path);
}

std::shared_ptr<Cask::Source> Cask::Source::open_memory(std::vector<uint8_t> data, std::string path) {
	std::unique_ptr<FileMemory> file(new FileMemory());
	file->open_owned(std::move(data));
	return std::make_shared<Source>(std::move(file), std::move(path));
}

bool Cask::Source::read_at(uint64_t offset, uint8_t* data, size_t size) {
	if(size == 0) { return offset <= _size; }
	if(offset > _size || size > _size - offset) { return false; }
	
	std::lock_guard<std::mutex> lock(_mutex);
	if(!_file->seek((int64_t)offset)) { return false; }
	return _file->read(data, size);
}

size_t Cask::Source::read_some_at(uint64_t offset, uint8_t* data, size_t size) {
	if(offset >= _size) { return 0; }
	size_t available = (size_t)std::min<uint64_t>(size, _size - offset);
	if(!read_at(offset, data, available)) { return 0; }
	return available;
}
