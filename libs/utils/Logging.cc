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

#include "utils/Logging.hh"

#include <iostream>
#include <syncstream>

namespace nettest {

std::atomic<bool> LogOStream::verbose = false;
std::atomic<bool> LogOStream::colored = true;

LogOStream::LogOStream(LoggingSeverity _level, const std::string& _label, bool _enabled)
    : level(_level), label(_label), enabled(_enabled) {
	if (this->enabled) this->setPrefix();
}

LogOStream::~LogOStream() {
	if (!this->enabled) return;
	this->ss << '\n';
	std::osyncstream(std::clog) << this->ss.str();
}

void LogOStream::setPrefix() {
	const bool use_color = LogOStream::colored.load();

	if (!this->label.empty()) { this->ss << "[" << this->label << "] "; }

	switch (this->level) {
		case LoggingSeverity::L_DEBUG:
			if (use_color) this->ss << ANSI_SGR(ANSI_SGR::PARAMETER::FG_MAGENTA).getCode();
			this->ss << "Debug: ";
			break;
		case LoggingSeverity::L_INFO:
			if (use_color) this->ss << ANSI_SGR(ANSI_SGR::PARAMETER::FG_BLUE).getCode();
			this->ss << "Info: ";
			break;
		case LoggingSeverity::L_WARNING:
			if (use_color) this->ss << ANSI_SGR(ANSI_SGR::PARAMETER::FG_YELLOW).getCode();
			this->ss << "Warning: ";
			break;
		case LoggingSeverity::L_ERROR:
			if (use_color) this->ss << ANSI_SGR(ANSI_SGR::PARAMETER::FG_RED).getCode();
			this->ss << "Error: ";
			break;
	}

	if (use_color) this->ss << ANSI_SGR(ANSI_SGR::PARAMETER::RESET).getCode();
}

}  // namespace nettest
