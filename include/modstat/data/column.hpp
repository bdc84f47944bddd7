#pragma once

#include <cstddef>
#include <set>
#include <string>
#include <vector>

namespace modstat {
namespace data {

enum class ColumnType { NUMERIC, CATEGORICAL, ORDINAL, TEXT };

inline const char *ColumnTypeName(ColumnType type) {
	switch (type) {
	case ColumnType::NUMERIC:
		return "numeric";
	case ColumnType::CATEGORICAL:
		return "categorical";
	case ColumnType::ORDINAL:
		return "ordinal";
	case ColumnType::TEXT:
		return "text";
	default:
		return "unknown";
	}
}

/// One column of raw cells as handed over by the ingestion layer
struct RawColumn {
	std::string name;
	std::vector<std::string> values;
};

/**
 * Thresholds for column type inference
 *
 * Defaults reproduce the Likert-scale heuristic: a numeric column with at most
 * seven distinct positive integer values is treated as ordinal.
 */
struct TypeInferenceOptions {
	/// Max distinct values for an integer column to be considered ordinal
	size_t ordinal_max_levels = 7;

	/// Max distinct labels for a non-numeric column to be categorical
	size_t categorical_max_levels = 10;

	/// Max unique/non-missing ratio for a non-numeric column to be categorical
	double categorical_max_ratio = 0.1;

	/// Number of non-missing values kept as a preview
	size_t sample_size = 5;

	/// Numeric columns declared ordinal regardless of cardinality
	std::set<std::string> declared_ordinal;
};

/**
 * A typed, immutable dataset column
 *
 * NUMERIC and ORDINAL columns keep their cells in numeric_values (NaN marks a
 * missing cell). CATEGORICAL and TEXT columns keep labels (empty when
 * missing). The missing mask is kept for every type.
 */
class Column {
public:
	Column(std::string name, ColumnType type, std::vector<double> numeric_values, std::vector<std::string> labels,
	       std::vector<bool> missing, size_t unique_count, std::vector<std::string> sample_values);

	const std::string &Name() const {
		return name_;
	}

	ColumnType Type() const {
		return type_;
	}

	/// True for NUMERIC and ORDINAL columns
	bool HasNumericStorage() const {
		return type_ == ColumnType::NUMERIC || type_ == ColumnType::ORDINAL;
	}

	size_t Size() const {
		return missing_.size();
	}

	bool IsMissing(size_t row) const {
		return missing_[row];
	}

	/// Cell value of a numeric column (NaN when missing)
	double NumericAt(size_t row) const {
		return numeric_values_[row];
	}

	const std::vector<double> &NumericValues() const {
		return numeric_values_;
	}

	const std::vector<std::string> &Labels() const {
		return labels_;
	}

	size_t UniqueCount() const {
		return unique_count_;
	}

	size_t MissingCount() const {
		return missing_count_;
	}

	/// missing_count / row_count, 0 for an empty column
	double MissingRate() const;

	const std::vector<std::string> &SampleValues() const {
		return sample_values_;
	}

private:
	std::string name_;
	ColumnType type_;
	std::vector<double> numeric_values_;
	std::vector<std::string> labels_;
	std::vector<bool> missing_;
	size_t unique_count_;
	size_t missing_count_;
	std::vector<std::string> sample_values_;
};

} // namespace data
} // namespace modstat
