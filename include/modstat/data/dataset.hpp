#pragma once

#include "modstat/data/column.hpp"

#include <cstddef>
#include <memory>
#include <string>
#include <unordered_map>
#include <utility>
#include <vector>

namespace modstat {
namespace data {

/// Dataset-level overview (row/column counts, missingness, type mix)
struct DatasetSummary {
	size_t total_rows = 0;
	size_t total_columns = 0;
	size_t missing_values = 0;

	/// missing_values / (rows * columns), 0 for an empty dataset
	double missing_rate = 0.0;

	/// NUMERIC and ORDINAL columns
	size_t numeric_columns = 0;

	/// CATEGORICAL and TEXT columns
	size_t categorical_columns = 0;
};

/**
 * Typed in-memory table
 *
 * Column types and statistics are inferred once at construction; a Dataset is
 * immutable afterwards and shared read-only (std::shared_ptr<const Dataset>)
 * by the jobs analysing it.
 */
class Dataset {
public:
	/**
	 * Build from raw string cells, inferring each column's type
	 *
	 * Cells that are empty or one of NA, N/A, NaN, nan, null, NULL, None
	 * (after trimming) are missing.
	 *
	 * @throws std::invalid_argument for duplicate names, empty names or
	 *         columns of different lengths
	 */
	static std::shared_ptr<const Dataset> FromRaw(const std::vector<RawColumn> &columns,
	                                              const TypeInferenceOptions &options = TypeInferenceOptions());

	/**
	 * Build from numeric cells (NaN = missing). Columns are NUMERIC or ORDINAL.
	 *
	 * @throws std::invalid_argument as FromRaw
	 */
	static std::shared_ptr<const Dataset>
	FromNumeric(const std::vector<std::pair<std::string, std::vector<double>>> &columns,
	            const TypeInferenceOptions &options = TypeInferenceOptions());

	size_t RowCount() const {
		return row_count_;
	}

	size_t ColumnCount() const {
		return columns_.size();
	}

	const std::vector<Column> &Columns() const {
		return columns_;
	}

	std::vector<std::string> ColumnNames() const;

	bool HasColumn(const std::string &name) const;

	/// @throws std::out_of_range for an unknown column name
	const Column &GetColumn(const std::string &name) const;

	/// True when the column is numeric and every non-missing value is 0 or 1
	bool IsBinaryCoded(const std::string &name) const;

	DatasetSummary Summary() const;

private:
	Dataset(std::vector<Column> columns, size_t row_count);

	std::vector<Column> columns_;
	std::unordered_map<std::string, size_t> index_;
	size_t row_count_;
};

} // namespace data
} // namespace modstat
