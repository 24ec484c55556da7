#include "logging.hpp"
#include <string.h>
#include <stdarg.h>
#include <stdint.h>
#include <stdio.h>
#include <array>
#include <mutex>

static const int MAX_MSG_LENGTH = 2048;

static const int INDENT_STEP_SIZE = 2;

namespace logging{

	//entry streams log from worker threads, so everything below is guarded
	static std::mutex log_mutex;

	static uint64_t messages_sent = 0;
	
	static uint32_t indent_level = 0;

	static uint32_t prev_count = 0;
	static char prev_msg[MAX_MSG_LENGTH] = {};
	static char this_msg[MAX_MSG_LENGTH] = {};

	static std::array<bool, (size_t)LEVEL::LEVEL_ITEM_COUNT> channels = { true, true, true, false, false };

	uint64_t count() {
		std::lock_guard<std::mutex> lock(log_mutex);
		return messages_sent;
	}
	
	void indent(){
		std::lock_guard<std::mutex> lock(log_mutex);
		indent_level += INDENT_STEP_SIZE;
	}

	void undent(){
		std::lock_guard<std::mutex> lock(log_mutex);
		if(indent_level < INDENT_STEP_SIZE){ return; }
		indent_level -= INDENT_STEP_SIZE;
	}

	void set_channel(LEVEL lvl, bool state){
		std::lock_guard<std::mutex> lock(log_mutex);
		channels[(size_t)lvl] = state;
	}

	bool channel(LEVEL lvl){
		std::lock_guard<std::mutex> lock(log_mutex);
		return channels[(size_t)lvl];
	}

	static void log_basic_valist(const char* str, va_list all_varg){
		std::lock_guard<std::mutex> lock(log_mutex);
		messages_sent++;
		
		vsnprintf(this_msg, MAX_MSG_LENGTH, str, all_varg);

		if (strcmp(this_msg, prev_msg)) // mismatch
		{
			strncpy(prev_msg, this_msg, MAX_MSG_LENGTH - 1);
			fprintf(stderr, prev_count ? "\n" : "");
			fprintf(stderr, "%*s%s" COLRESET "\r", indent_level, "", this_msg);
			prev_count = 1;
		}
		else { // match; repeated message
			fprintf(stderr, "%*s%s   [x%u]" COLRESET "\r", indent_level, "", this_msg, ++prev_count);
		}
		fflush(stderr);
	}

	void log_basic(const char* str, ...){
		va_list all_varg;
		va_start(all_varg, str);
		log_basic_valist(str, all_varg);
		va_end(all_varg);
	}

	void log_advanced(LEVEL lvl, const char* str, ...){
		if(channel(lvl)){
			va_list all_varg;
			va_start(all_varg, str);
			log_basic_valist(str, all_varg);
			va_end(all_varg);
		}
	}
}
