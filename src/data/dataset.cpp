#include "modstat/data/dataset.hpp"
#include "modstat/utils/tracing.hpp"

#include <cctype>
#include <cerrno>
#include <cmath>
#include <cstdlib>
#include <limits>
#include <set>
#include <sstream>
#include <stdexcept>
#include <unordered_set>

namespace modstat {
namespace data {

// ============================================================================
// Column
// ============================================================================

Column::Column(std::string name, ColumnType type, std::vector<double> numeric_values, std::vector<std::string> labels,
               std::vector<bool> missing, size_t unique_count, std::vector<std::string> sample_values)
    : name_(std::move(name)), type_(type), numeric_values_(std::move(numeric_values)), labels_(std::move(labels)),
      missing_(std::move(missing)), unique_count_(unique_count), missing_count_(0),
      sample_values_(std::move(sample_values)) {
	for (bool m : missing_) {
		if (m) {
			missing_count_++;
		}
	}
}

double Column::MissingRate() const {
	if (missing_.empty()) {
		return 0.0;
	}
	return static_cast<double>(missing_count_) / static_cast<double>(missing_.size());
}

// ============================================================================
// Cell parsing helpers
// ============================================================================

static std::string Trim(const std::string &s) {
	size_t begin = 0;
	size_t end = s.size();
	while (begin < end && std::isspace(static_cast<unsigned char>(s[begin]))) {
		begin++;
	}
	while (end > begin && std::isspace(static_cast<unsigned char>(s[end - 1]))) {
		end--;
	}
	return s.substr(begin, end - begin);
}

static bool IsMissingToken(const std::string &cell) {
	static const std::unordered_set<std::string> tokens = {"", "NA", "N/A", "NaN", "nan", "null", "NULL", "None"};
	return tokens.count(cell) > 0;
}

// Full-string parse; rejects partial numbers like "12abc" and non-finite values
static bool TryParseDouble(const std::string &cell, double &out) {
	if (cell.empty()) {
		return false;
	}
	errno = 0;
	char *end = nullptr;
	const double value = std::strtod(cell.c_str(), &end);
	if (end != cell.c_str() + cell.size() || errno == ERANGE || !std::isfinite(value)) {
		return false;
	}
	out = value;
	return true;
}

static std::string FormatNumber(double value) {
	std::ostringstream oss;
	oss.precision(12);
	oss << value;
	return oss.str();
}

static void CheckNames(const std::vector<std::string> &names) {
	std::unordered_set<std::string> seen;
	for (const auto &name : names) {
		if (name.empty()) {
			throw std::invalid_argument("column names must not be empty");
		}
		if (!seen.insert(name).second) {
			throw std::invalid_argument("duplicate column name: '" + name + "'");
		}
	}
}

// Numeric column: ordinal when declared, or when every value is a positive
// integer and the number of levels stays within the Likert bound
static Column MakeNumericColumn(const std::string &name, std::vector<double> values, std::vector<bool> missing,
                                std::vector<std::string> samples, const TypeInferenceOptions &options) {
	std::set<double> distinct;
	bool integral_positive = true;
	for (size_t i = 0; i < values.size(); i++) {
		if (missing[i]) {
			continue;
		}
		distinct.insert(values[i]);
		if (values[i] <= 0.0 || std::floor(values[i]) != values[i]) {
			integral_positive = false;
		}
	}

	ColumnType type = ColumnType::NUMERIC;
	if (options.declared_ordinal.count(name) > 0) {
		type = ColumnType::ORDINAL;
	} else if (integral_positive && distinct.size() <= options.ordinal_max_levels) {
		type = ColumnType::ORDINAL;
	}

	return Column(name, type, std::move(values), {}, std::move(missing), distinct.size(), std::move(samples));
}

static Column MakeLabelColumn(const std::string &name, std::vector<std::string> labels, std::vector<bool> missing,
                              std::vector<std::string> samples, const TypeInferenceOptions &options) {
	std::set<std::string> distinct;
	size_t non_missing = 0;
	for (size_t i = 0; i < labels.size(); i++) {
		if (!missing[i]) {
			distinct.insert(labels[i]);
			non_missing++;
		}
	}

	ColumnType type = ColumnType::TEXT;
	if (non_missing > 0) {
		const double ratio = static_cast<double>(distinct.size()) / static_cast<double>(non_missing);
		if (ratio < options.categorical_max_ratio || distinct.size() <= options.categorical_max_levels) {
			type = ColumnType::CATEGORICAL;
		}
	}

	return Column(name, type, {}, std::move(labels), std::move(missing), distinct.size(), std::move(samples));
}

// ============================================================================
// Dataset
// ============================================================================

Dataset::Dataset(std::vector<Column> columns, size_t row_count) : columns_(std::move(columns)), row_count_(row_count) {
	for (size_t i = 0; i < columns_.size(); i++) {
		index_.emplace(columns_[i].Name(), i);
	}
}

std::shared_ptr<const Dataset> Dataset::FromRaw(const std::vector<RawColumn> &columns,
                                                const TypeInferenceOptions &options) {
	std::vector<std::string> names;
	names.reserve(columns.size());
	for (const auto &raw : columns) {
		names.push_back(raw.name);
	}
	CheckNames(names);

	const size_t row_count = columns.empty() ? 0 : columns.front().values.size();
	std::vector<Column> typed;
	typed.reserve(columns.size());

	for (const auto &raw : columns) {
		if (raw.values.size() != row_count) {
			throw std::invalid_argument("column '" + raw.name + "' has " + std::to_string(raw.values.size()) +
			                            " rows, expected " + std::to_string(row_count));
		}

		std::vector<std::string> cells(row_count);
		std::vector<bool> missing(row_count, false);
		std::vector<double> numbers(row_count, std::numeric_limits<double>::quiet_NaN());
		std::vector<std::string> samples;
		size_t non_missing = 0;
		bool all_numeric = true;

		for (size_t r = 0; r < row_count; r++) {
			cells[r] = Trim(raw.values[r]);
			if (IsMissingToken(cells[r])) {
				missing[r] = true;
				cells[r].clear();
				continue;
			}
			non_missing++;
			if (samples.size() < options.sample_size) {
				samples.push_back(cells[r]);
			}
			if (all_numeric && !TryParseDouble(cells[r], numbers[r])) {
				all_numeric = false;
			}
		}

		if (non_missing > 0 && all_numeric) {
			typed.push_back(MakeNumericColumn(raw.name, std::move(numbers), std::move(missing), std::move(samples),
			                                  options));
		} else {
			typed.push_back(
			    MakeLabelColumn(raw.name, std::move(cells), std::move(missing), std::move(samples), options));
		}
		MODSTAT_TRACE("column '" << raw.name << "' inferred as " << ColumnTypeName(typed.back().Type()));
	}

	MODSTAT_DEBUG("dataset ingested: " << row_count << " rows, " << typed.size() << " columns");
	return std::shared_ptr<const Dataset>(new Dataset(std::move(typed), row_count));
}

std::shared_ptr<const Dataset>
Dataset::FromNumeric(const std::vector<std::pair<std::string, std::vector<double>>> &columns,
                     const TypeInferenceOptions &options) {
	std::vector<std::string> names;
	names.reserve(columns.size());
	for (const auto &col : columns) {
		names.push_back(col.first);
	}
	CheckNames(names);

	const size_t row_count = columns.empty() ? 0 : columns.front().second.size();
	std::vector<Column> typed;
	typed.reserve(columns.size());

	for (const auto &col : columns) {
		const auto &values = col.second;
		if (values.size() != row_count) {
			throw std::invalid_argument("column '" + col.first + "' has " + std::to_string(values.size()) +
			                            " rows, expected " + std::to_string(row_count));
		}

		std::vector<bool> missing(row_count, false);
		std::vector<std::string> samples;
		size_t non_missing = 0;
		for (size_t r = 0; r < row_count; r++) {
			if (std::isnan(values[r])) {
				missing[r] = true;
				continue;
			}
			if (std::isinf(values[r])) {
				throw std::invalid_argument("column '" + col.first + "' contains an infinite value");
			}
			non_missing++;
			if (samples.size() < options.sample_size) {
				samples.push_back(FormatNumber(values[r]));
			}
		}

		if (non_missing == 0) {
			// Nothing observed: no basis for a numeric type
			typed.emplace_back(col.first, ColumnType::TEXT, std::vector<double>(),
			                   std::vector<std::string>(row_count), std::move(missing), 0, std::move(samples));
		} else {
			typed.push_back(MakeNumericColumn(col.first, values, std::move(missing), std::move(samples), options));
		}
	}

	return std::shared_ptr<const Dataset>(new Dataset(std::move(typed), row_count));
}

std::vector<std::string> Dataset::ColumnNames() const {
	std::vector<std::string> names;
	names.reserve(columns_.size());
	for (const auto &col : columns_) {
		names.push_back(col.Name());
	}
	return names;
}

bool Dataset::HasColumn(const std::string &name) const {
	return index_.count(name) > 0;
}

const Column &Dataset::GetColumn(const std::string &name) const {
	auto it = index_.find(name);
	if (it == index_.end()) {
		throw std::out_of_range("unknown column: '" + name + "'");
	}
	return columns_[it->second];
}

bool Dataset::IsBinaryCoded(const std::string &name) const {
	const Column &col = GetColumn(name);
	if (!col.HasNumericStorage()) {
		return false;
	}
	for (size_t r = 0; r < col.Size(); r++) {
		if (col.IsMissing(r)) {
			continue;
		}
		const double v = col.NumericAt(r);
		if (v != 0.0 && v != 1.0) {
			return false;
		}
	}
	return true;
}

DatasetSummary Dataset::Summary() const {
	DatasetSummary summary;
	summary.total_rows = row_count_;
	summary.total_columns = columns_.size();
	for (const auto &col : columns_) {
		summary.missing_values += col.MissingCount();
		if (col.HasNumericStorage()) {
			summary.numeric_columns++;
		} else {
			summary.categorical_columns++;
		}
	}
	const size_t cells = row_count_ * columns_.size();
	summary.missing_rate = cells == 0 ? 0.0 : static_cast<double>(summary.missing_values) / static_cast<double>(cells);
	return summary;
}

} // namespace data
} // namespace modstat
