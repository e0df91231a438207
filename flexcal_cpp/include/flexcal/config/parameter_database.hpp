#pragma once

#include "flexcal/config/parameter_set.hpp"
#include "flexcal/core/types.hpp"

#include <string>
#include <vector>

namespace flexcal::core {
class Logger;
}

namespace flexcal::config {

// Handling of unset entries in floating point columns
enum class UnsetPolicy {
    ToNaN,   // store quiet NaN and warn
    Reject   // raise ValidationError
};

enum class ColumnStorage {
    Float,
    FixedArray,
    FixedText,
    Literal,
    Object
};

std::string column_storage_to_string(ColumnStorage storage);

/**
 * One column of a ParameterDatabase. Exactly one of the typed stores is
 * populated, selected by storage(); the typed accessors throw TypeError
 * when asked for a different one.
 */
class ParameterColumn {
public:
    ParameterColumn(std::string key, ColumnStorage storage);

    const std::string& key() const { return key_; }
    ColumnStorage storage() const { return storage_; }
    std::size_t size() const { return size_; }

    // FixedText: longest string; FixedArray: elements per row
    std::size_t width() const { return width_; }
    // Literal: kind shared by every row
    ValueKind literal_kind() const { return literal_kind_; }

    const VectorXd& floats() const;
    const Matrix2Dd& arrays() const;
    const std::vector<std::string>& text() const;
    const std::vector<Value>& literals() const;
    const std::vector<OptionalValue>& objects() const;

    void append(const ParameterColumn& other);

private:
    friend class ParameterDatabase;

    void require(ColumnStorage wanted) const;

    std::string key_;
    ColumnStorage storage_;
    ValueKind literal_kind_ = ValueKind::Bool;
    std::size_t size_ = 0;
    std::size_t width_ = 0;

    VectorXd floats_;
    Matrix2Dd arrays_;
    std::vector<std::string> text_;
    std::vector<Value> literals_;
    std::vector<OptionalValue> objects_;
};

/**
 * Columnar aggregation of parameter sets sharing one key schema. The
 * storage of each column is inferred from the declared kinds of the first
 * set; rows can only be added by append().
 */
class ParameterDatabase {
public:
    explicit ParameterDatabase(const std::vector<ParameterSet>& sets,
                               UnsetPolicy policy = UnsetPolicy::ToNaN,
                               core::Logger* logger = nullptr);

    std::size_t nsets() const { return nsets_; }
    std::size_t npar() const { return keys_.size(); }
    const std::vector<std::string>& keys() const { return keys_; }
    UnsetPolicy unset_policy() const { return policy_; }

    const ParameterColumn& column(const std::string& key) const;
    const ParameterColumn& operator[](const std::string& key) const { return column(key); }
    ColumnStorage storage(const std::string& key) const { return column(key).storage(); }

    const std::vector<Value>& options(const std::string& key) const;
    const std::vector<ValueKind>& dtypes(const std::string& key) const;
    bool can_call(const std::string& key) const;

    void append(const ParameterDatabase& other);

private:
    std::size_t index_of(const std::string& key) const;
    ParameterColumn build_column(const std::vector<ParameterSet>& sets, std::size_t k) const;

    UnsetPolicy policy_;
    core::Logger* logger_;
    std::size_t nsets_ = 0;
    std::vector<std::string> keys_;
    std::vector<ParameterColumn> columns_;
    std::vector<std::vector<Value>> options_;
    std::vector<std::vector<ValueKind>> dtypes_;
    std::vector<bool> can_call_;
};

} // namespace flexcal::config
