#include "flexcal/config/parameter_database.hpp"
#include "flexcal/core/errors.hpp"
#include "flexcal/core/logging.hpp"

#include <algorithm>
#include <limits>
#include <set>

namespace flexcal::config {

std::string column_storage_to_string(ColumnStorage storage) {
    switch (storage) {
        case ColumnStorage::Float: return "float";
        case ColumnStorage::FixedArray: return "array";
        case ColumnStorage::FixedText: return "text";
        case ColumnStorage::Literal: return "literal";
        case ColumnStorage::Object: return "object";
    }
    return "unknown";
}

ParameterColumn::ParameterColumn(std::string key, ColumnStorage storage)
    : key_(std::move(key)), storage_(storage) {}

void ParameterColumn::require(ColumnStorage wanted) const {
    if (storage_ != wanted) {
        throw TypeError("Column " + key_ + " has " + column_storage_to_string(storage_) +
                        " storage, not " + column_storage_to_string(wanted));
    }
}

const VectorXd& ParameterColumn::floats() const {
    require(ColumnStorage::Float);
    return floats_;
}

const Matrix2Dd& ParameterColumn::arrays() const {
    require(ColumnStorage::FixedArray);
    return arrays_;
}

const std::vector<std::string>& ParameterColumn::text() const {
    require(ColumnStorage::FixedText);
    return text_;
}

const std::vector<Value>& ParameterColumn::literals() const {
    require(ColumnStorage::Literal);
    return literals_;
}

const std::vector<OptionalValue>& ParameterColumn::objects() const {
    require(ColumnStorage::Object);
    return objects_;
}

void ParameterColumn::append(const ParameterColumn& other) {
    if (other.storage_ != storage_) {
        throw SchemaMismatchError("Cannot append " + column_storage_to_string(other.storage_) +
                                  " column " + key_ + " to " +
                                  column_storage_to_string(storage_) + " storage");
    }

    switch (storage_) {
        case ColumnStorage::Float: {
            VectorXd merged(floats_.size() + other.floats_.size());
            merged.head(floats_.size()) = floats_;
            merged.tail(other.floats_.size()) = other.floats_;
            floats_ = std::move(merged);
            break;
        }
        case ColumnStorage::FixedArray: {
            if (other.width_ != width_) {
                throw SchemaMismatchError("Array column " + key_ + " has shape (" +
                                          std::to_string(width_) + ") but appended rows have (" +
                                          std::to_string(other.width_) + ")");
            }
            Matrix2Dd merged(arrays_.rows() + other.arrays_.rows(), arrays_.cols());
            merged.topRows(arrays_.rows()) = arrays_;
            merged.bottomRows(other.arrays_.rows()) = other.arrays_;
            arrays_ = std::move(merged);
            break;
        }
        case ColumnStorage::FixedText:
            text_.insert(text_.end(), other.text_.begin(), other.text_.end());
            width_ = std::max(width_, other.width_);
            break;
        case ColumnStorage::Literal:
            if (other.literal_kind_ != literal_kind_) {
                throw SchemaMismatchError("Column " + key_ + " holds " +
                                          value_kind_to_string(literal_kind_) +
                                          " values, cannot append " +
                                          value_kind_to_string(other.literal_kind_));
            }
            literals_.insert(literals_.end(), other.literals_.begin(), other.literals_.end());
            break;
        case ColumnStorage::Object:
            objects_.insert(objects_.end(), other.objects_.begin(), other.objects_.end());
            break;
    }
    size_ += other.size_;
}

ParameterDatabase::ParameterDatabase(const std::vector<ParameterSet>& sets,
                                     UnsetPolicy policy,
                                     core::Logger* logger)
    : policy_(policy), logger_(logger) {
    if (sets.empty()) {
        throw ValidationError("ParameterDatabase requires at least one parameter set");
    }

    const ParameterSet& first = sets.front();
    for (std::size_t i = 1; i < sets.size(); ++i) {
        if (sets[i].npar() != first.npar()) {
            throw SchemaMismatchError(
                "Not all parameter sets have the same number of parameters");
        }
        if (sets[i].keys() != first.keys()) {
            throw SchemaMismatchError("Not all parameter sets have the same keys");
        }
    }

    nsets_ = sets.size();
    keys_ = first.keys();
    for (std::size_t k = 0; k < keys_.size(); ++k) {
        columns_.push_back(build_column(sets, k));
        options_.push_back(first.options(keys_[k]));
        dtypes_.push_back(first.dtypes(keys_[k]));
        can_call_.push_back(first.can_call(keys_[k]));
    }
}

ParameterColumn ParameterDatabase::build_column(const std::vector<ParameterSet>& sets,
                                                std::size_t k) const {
    const std::string& key = keys_[k];
    const ParameterSet& first = sets.front();
    const auto& kinds = first.dtypes(key);
    const std::set<ValueKind> kind_set(kinds.begin(), kinds.end());
    const OptionalValue& first_value = first.get(key);
    core::Logger& log = logger_ ? *logger_ : core::default_logger();

    auto object_column = [&]() {
        ParameterColumn col(key, ColumnStorage::Object);
        for (const auto& s : sets) col.objects_.push_back(s.get(key));
        col.size_ = sets.size();
        return col;
    };

    if (kinds.empty()) {
        return object_column();
    }

    const bool scalar_numeric = kind_set.count(ValueKind::Int) || kind_set.count(ValueKind::Float);
    if (scalar_numeric && kind_set.count(ValueKind::NumericList)) {
        log.warn("Parameter set has elements that can be either individual ints/floats or "
                 "lists. Database column " + key + " will have object storage.");
        return object_column();
    }

    if (kind_set == std::set<ValueKind>{ValueKind::Int, ValueKind::Float}) {
        ParameterColumn col(key, ColumnStorage::Float);
        col.floats_.resize(static_cast<Eigen::Index>(sets.size()));
        std::size_t n_unset = 0;
        for (std::size_t i = 0; i < sets.size(); ++i) {
            const OptionalValue& v = sets[i].get(key);
            if (!v) {
                if (policy_ == UnsetPolicy::Reject) {
                    throw ValidationError("Parameter " + key + " is unset in set " +
                                          std::to_string(i) +
                                          " and cannot be stored as floating point");
                }
                col.floats_[static_cast<Eigen::Index>(i)] =
                    std::numeric_limits<double>::quiet_NaN();
                ++n_unset;
                continue;
            }
            col.floats_[static_cast<Eigen::Index>(i)] = v->as_double();
        }
        if (n_unset > 0) {
            log.warn("Column " + key + ": " + std::to_string(n_unset) +
                     " unset value(s) stored as NaN");
        }
        col.size_ = sets.size();
        return col;
    }

    if (kind_set == std::set<ValueKind>{ValueKind::NumericList}) {
        if (!first_value) return object_column();
        const std::size_t width = first_value->as_numeric_list().size();
        ParameterColumn col(key, ColumnStorage::FixedArray);
        col.width_ = width;
        col.arrays_.resize(static_cast<Eigen::Index>(sets.size()),
                           static_cast<Eigen::Index>(width));
        for (std::size_t i = 0; i < sets.size(); ++i) {
            const OptionalValue& v = sets[i].get(key);
            if (!v || v->as_numeric_list().size() != width) {
                throw SchemaMismatchError("Array column " + key + " requires every row to hold " +
                                          std::to_string(width) + " values");
            }
            const auto& list = v->as_numeric_list();
            for (std::size_t j = 0; j < width; ++j) {
                col.arrays_(static_cast<Eigen::Index>(i), static_cast<Eigen::Index>(j)) = list[j];
            }
        }
        col.size_ = sets.size();
        return col;
    }

    if (!first_value) {
        return object_column();
    }

    const ValueKind kind = first_value->kind();
    const bool same_kind_everywhere = std::all_of(sets.begin(), sets.end(),
        [&](const ParameterSet& s) { return s.get(key) && s.get(key)->kind() == kind; });
    if (!same_kind_everywhere) {
        return object_column();
    }

    if (kind == ValueKind::String) {
        ParameterColumn col(key, ColumnStorage::FixedText);
        for (const auto& s : sets) {
            col.text_.push_back(s.get(key)->as_string());
            col.width_ = std::max(col.width_, col.text_.back().size());
        }
        col.size_ = sets.size();
        return col;
    }

    if (kind == ValueKind::ParSet || kind == ValueKind::ParSetList ||
        kind == ValueKind::Callable) {
        return object_column();
    }

    ParameterColumn col(key, ColumnStorage::Literal);
    col.literal_kind_ = kind;
    for (const auto& s : sets) col.literals_.push_back(*s.get(key));
    col.size_ = sets.size();
    return col;
}

std::size_t ParameterDatabase::index_of(const std::string& key) const {
    auto it = std::find(keys_.begin(), keys_.end(), key);
    if (it == keys_.end()) {
        throw ValidationError("Unknown parameter: " + key);
    }
    return static_cast<std::size_t>(it - keys_.begin());
}

const ParameterColumn& ParameterDatabase::column(const std::string& key) const {
    return columns_[index_of(key)];
}

const std::vector<Value>& ParameterDatabase::options(const std::string& key) const {
    return options_[index_of(key)];
}

const std::vector<ValueKind>& ParameterDatabase::dtypes(const std::string& key) const {
    return dtypes_[index_of(key)];
}

bool ParameterDatabase::can_call(const std::string& key) const {
    return can_call_[index_of(key)];
}

void ParameterDatabase::append(const ParameterDatabase& other) {
    if (other.keys_ != keys_) {
        throw SchemaMismatchError("Cannot append a database with different keys");
    }

    // Validate every column before touching any of them
    std::vector<ParameterColumn> merged = columns_;
    for (std::size_t k = 0; k < merged.size(); ++k) {
        merged[k].append(other.columns_[k]);
    }
    columns_ = std::move(merged);
    nsets_ += other.nsets_;
}

} // namespace flexcal::config
