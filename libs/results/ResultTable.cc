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

#include "results/ResultTable.hh"

#include <algorithm>
#include <sstream>
#include <stdexcept>
#include <type_traits>
#include <utility>

#include "experiment/Entity.hh"
#include "experiment/Flow.hh"
#include "experiment/Phase.hh"

namespace nettest {

namespace {

std::string quote(const std::string& _text, char _delimiter) {
	if (_text.find_first_of(std::string(1, _delimiter) + "\"\n") == std::string::npos) return _text;

	std::string quoted = "\"";
	for (char c : _text) {
		if (c == '"') quoted += '"';
		quoted += c;
	}
	return quoted + "\"";
}

}  // namespace

bool ResultTable::hasColumn(const std::string& _column) const {
	return std::find(this->columns.begin(), this->columns.end(), _column) != this->columns.end();
}

size_t ResultTable::getColumnIndex(const std::string& _column) const {
	auto iter = std::find(this->columns.begin(), this->columns.end(), _column);
	if (iter == this->columns.end()) throw std::out_of_range("Unknown column '" + _column + "'");
	return static_cast<size_t>(iter - this->columns.begin());
}

void ResultTable::addRow(std::vector<Cell> _row) {
	if (_row.size() != this->columns.size()) {
		throw std::invalid_argument("Row has " + std::to_string(_row.size()) + " cells but the table has " +
		                            std::to_string(this->columns.size()) + " columns");
	}
	this->rows.push_back(std::move(_row));
}

const Cell& ResultTable::at(size_t _row, const std::string& _column) const {
	return this->rows.at(_row).at(this->getColumnIndex(_column));
}

void ResultTable::writeCsv(std::ostream& _os, const std::string& _na, char _delimiter) const {
	for (size_t i = 0; i < this->columns.size(); ++i) {
		_os << (i ? std::string(1, _delimiter) : "") << quote(this->columns[i], _delimiter);
	}
	_os << "\n";

	for (const auto& row : this->rows) {
		for (size_t i = 0; i < row.size(); ++i) {
			_os << (i ? std::string(1, _delimiter) : "") << quote(formatCell(row[i], _na), _delimiter);
		}
		_os << "\n";
	}
}

std::string formatCell(const Cell& _cell, const std::string& _na) {
	return std::visit(
	    [&_na](const auto& _value) -> std::string {
		    using T = std::decay_t<decltype(_value)>;
		    if constexpr (std::is_same_v<T, std::monostate>) {
			    return _na;
		    } else if constexpr (std::is_same_v<T, bool>) {
			    return _value ? "True" : "False";
		    } else if constexpr (std::is_same_v<T, int64_t>) {
			    return std::to_string(_value);
		    } else if constexpr (std::is_same_v<T, double>) {
			    std::ostringstream ss;
			    ss.precision(12);
			    ss << _value;
			    return ss.str();
		    } else if constexpr (std::is_same_v<T, std::string>) {
			    return _value;
		    } else {
			    return _value->getName();
		    }
	    },
	    _cell);
}

}  // namespace nettest
