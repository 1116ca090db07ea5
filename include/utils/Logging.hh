/*
 * Copyright 2023-2026 Playlab/ACAL
 *
 * Licensed under the Apache License, Version 2.0 (the "License");
 * you may not use this file except in compliance with the License.
 * You may obtain a copy of the License at
 *
 * http://www.apache.org/licenses/LICENSE-2.0
 *
 * Unless required by applicable law or agreed to in writing, software
 * distributed under the License is distributed on an "AS IS" BASIS,
 * WITHOUT WARRANTIES OR CONDITIONS OF ANY KIND, either express or implied.
 * See the License for the specific language governing permissions and
 * limitations under the License.
 */

/**
 * @file Logging.hh
 * @brief Stream-style logging with severity prefixes and atomic line output
 *
 * Every logging macro creates a temporary LogOStream. Values are collected with
 * operator<< and the finished line is written to std::clog in one piece when the
 * temporary is destroyed at the end of the full expression, so lines emitted from
 * concurrent callers never interleave.
 *
 * ```cpp
 * INFO << "Loaded " << n << " entities";
 * LABELED_WARNING("ExperimentLoader") << "Unknown option '" << name << "'";
 * VERBOSE_LABELED_INFO(entity.getName()) << "compiled " << size << " bytes";
 * ```
 *
 * VERBOSE_* variants only produce output after LogOStream::setVerbose(true).
 * Logging never throws and never terminates; failures are reported to the caller
 * through exceptions (see errors/Errors.hh).
 */

#pragma once

#include <atomic>
#include <ostream>
#include <sstream>
#include <string>

namespace nettest {

enum class LoggingSeverity { L_DEBUG, L_INFO, L_WARNING, L_ERROR };

/**
 * @brief ANSI "Select Graphic Rendition" escape code helper
 */
class ANSI_SGR {
public:
	enum class PARAMETER : int { RESET = 0, FG_RED = 31, FG_GREEN = 32, FG_YELLOW = 33, FG_BLUE = 34, FG_MAGENTA = 35 };

	explicit ANSI_SGR(PARAMETER _param) : param(_param) {}

	std::string getCode() const { return "\033[" + std::to_string(static_cast<int>(this->param)) + "m"; }

private:
	PARAMETER param;
};

class LogOStream {
public:
	LogOStream(LoggingSeverity _level, const std::string& _label = "", bool _enabled = true);
	~LogOStream();

	LogOStream(const LogOStream&)            = delete;
	LogOStream& operator=(const LogOStream&) = delete;

	template <typename T>
	LogOStream& operator<<(const T& _value) {
		if (this->enabled) this->ss << _value;
		return *this;
	}

	LogOStream& operator<<(std::ostream& (*_manip)(std::ostream&)) {
		if (this->enabled) this->ss << _manip;
		return *this;
	}

	static void setVerbose(bool _verbose) { LogOStream::verbose.store(_verbose); }
	static bool isVerbose() { return LogOStream::verbose.load(); }

	/// @brief Disable colour codes, e.g. when the log is redirected to a file
	static void setColored(bool _colored) { LogOStream::colored.store(_colored); }

private:
	void setPrefix();

	LoggingSeverity   level;
	std::string       label;
	bool              enabled;
	std::stringstream ss;

	static std::atomic<bool> verbose;
	static std::atomic<bool> colored;
};

}  // namespace nettest

#define DEBUG_LOG                                                                                           \
	::nettest::LogOStream(::nettest::LoggingSeverity::L_DEBUG, "", ::nettest::LogOStream::isVerbose())
#define INFO    ::nettest::LogOStream(::nettest::LoggingSeverity::L_INFO)
#define WARNING ::nettest::LogOStream(::nettest::LoggingSeverity::L_WARNING)
#define ERROR   ::nettest::LogOStream(::nettest::LoggingSeverity::L_ERROR)

#define LABELED_INFO(label)    ::nettest::LogOStream(::nettest::LoggingSeverity::L_INFO, label)
#define LABELED_WARNING(label) ::nettest::LogOStream(::nettest::LoggingSeverity::L_WARNING, label)
#define LABELED_ERROR(label)   ::nettest::LogOStream(::nettest::LoggingSeverity::L_ERROR, label)

#define VERBOSE_INFO \
	::nettest::LogOStream(::nettest::LoggingSeverity::L_INFO, "", ::nettest::LogOStream::isVerbose())
#define VERBOSE_LABELED_INFO(label) \
	::nettest::LogOStream(::nettest::LoggingSeverity::L_INFO, label, ::nettest::LogOStream::isVerbose())
