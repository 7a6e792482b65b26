/*Copyright (c) 2024 The DarkMatter Project
Licensed under the GNU General Public License 2.0.

test_logger_thread_safety.cpp implementation.*/

#include "shared/logger.hpp"

#include <cassert>
#include <mutex>
#include <string>
#include <string_view>
#include <thread>
#include <vector>

namespace {
	std::mutex g_sinkMutex;
	std::vector<std::string> g_printMessages;
	std::vector<std::string> g_errorMessages;

/*
=============
CollectPrint

Store a print sink message for verification.
=============
*/
	void CollectPrint(std::string_view message)
{
		std::scoped_lock lock(g_sinkMutex);
		g_printMessages.emplace_back(message);
	}

/*
=============
CollectError

Store an error sink message for verification.
=============
*/
	void CollectError(std::string_view message)
{
		std::scoped_lock lock(g_sinkMutex);
		g_errorMessages.emplace_back(message);
	}

/*
=============
ToggleLevels

Repeatedly adjust the log level to exercise atomic coordination.
=============
*/
	void ToggleLevels()
{
		for (int i = 0; i < 200; ++i) {
			q3log::SetLogLevel((i % 2) == 0 ? q3log::LogLevel::Info : q3log::LogLevel::Trace);
	}
	}

/*
=============
LogMessages

Emit informational and error messages while configuration changes.
=============
*/
	void LogMessages()
{
		for (int i = 0; i < 200; ++i) {
			q3log::Log(q3log::LogLevel::Info, "concurrent-info");
			q3log::Logf(q3log::LogLevel::Error, "concurrent-error {}", i);
	}
	}
} // namespace

/*
=============
main

Verify concurrent logging preserves configuration integrity.
=============
*/
int main()
{
	q3log::InitLogger("threaded", &CollectPrint, &CollectError);

	std::thread levelThread(&ToggleLevels);
	std::thread logThreadA(&LogMessages);
	std::thread logThreadB(&LogMessages);

	levelThread.join();
	logThreadA.join();
	logThreadB.join();

	std::scoped_lock lock(g_sinkMutex);
	assert(!g_printMessages.empty());
	assert(g_errorMessages.size() == 400);

	const std::string prefix = "[Q3LOG][threaded]";
	for (const std::string& message : g_printMessages) {
		assert(message.rfind(prefix, 0) == 0);
		assert(message.find("[ERROR]") == std::string::npos);
	}
	for (const std::string& message : g_errorMessages) {
		assert(message.rfind(prefix, 0) == 0);
	}

	return 0;
}
