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

#pragma once

#include <cstddef>
#include <cstdint>
#include <ostream>
#include <string>
#include <variant>
#include <vector>

namespace nettest {

class Entity;
class Flow;
class Phase;

/// @brief One value of a result table; the empty alternative marks a missing value
using Cell = std::variant<std::monostate, bool, int64_t, double, std::string, const Entity*, const Flow*, const Phase*>;

/**
 * @brief Column-named table of Cells, one per row and column
 */
class ResultTable {
public:
	ResultTable() = default;
	explicit ResultTable(const std::vector<std::string>& _columns) : columns(_columns) {}

	const std::vector<std::string>& getColumns() const { return this->columns; }
	size_t                          getNumRows() const { return this->rows.size(); }
	bool                            hasColumn(const std::string& _column) const;

	/// @throws std::out_of_range for an unknown column
	size_t getColumnIndex(const std::string& _column) const;

	/// @throws std::invalid_argument if the row width does not match the columns
	void addRow(std::vector<Cell> _row);

	const std::vector<Cell>& getRow(size_t _row) const { return this->rows.at(_row); }
	const Cell&              at(size_t _row, const std::string& _column) const;

	/**
	 * @brief Write the table as delimited text with a header row
	 * @param _na Text written for missing values
	 */
	void writeCsv(std::ostream& _os, const std::string& _na = "NA", char _delimiter = ',') const;

private:
	std::vector<std::string>       columns;
	std::vector<std::vector<Cell>> rows;
};

/// @brief Text of a cell: names for entities, flows and phases, True/False for booleans
std::string formatCell(const Cell& _cell, const std::string& _na = "NA");

}  // namespace nettest
