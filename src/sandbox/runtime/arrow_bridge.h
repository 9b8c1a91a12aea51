//
// NLytics Arrow Bridge
//
// Arrow compute calls and conversions between Arrow data and sandbox
// values. Every failing Arrow status surfaces as a RuntimeFaultError with a
// Python exception name.
//

#pragma once

#include "sandbox_error.h"
#include "value.h"
#include <arrow/api.h>
#include <arrow/compute/api.h>
#include <string>
#include <string_view>
#include <vector>

namespace nlytics::sandbox
{
    void CheckStatus(const arrow::Status& status, std::string_view operation);

    template <typename T>
    T Unwrap(arrow::Result<T> result, std::string_view operation)
    {
        CheckStatus(result.status(), operation);
        return std::move(result).ValueOrDie();
    }

    arrow::Datum CallCompute(const std::string& function,
                             const std::vector<arrow::Datum>& args,
                             const arrow::compute::FunctionOptions* options = nullptr);

    ArrayPtr CallComputeArray(const std::string& function,
                              const std::vector<arrow::Datum>& args,
                              const arrow::compute::FunctionOptions* options = nullptr);

    Value CallComputeScalar(const std::string& function,
                            const std::vector<arrow::Datum>& args,
                            const arrow::compute::FunctionOptions* options = nullptr);

    // ---- Scalars ----
    // Numeric nulls become NaN, other nulls None
    Value ScalarToValue(const arrow::Scalar& scalar);
    std::shared_ptr<arrow::Scalar> ValueToScalar(const Value& value);
    Value ArrayElement(const arrow::Array& array, int64_t index);

    // ---- Arrays ----
    ArrayPtr ValuesToArray(const ValueList& values);
    ValueList ArrayToValues(const arrow::Array& array);
    ArrayPtr RangeLabels(int64_t length);
    ArrayPtr MakeEmptyArray(const std::shared_ptr<arrow::DataType>& type);
    ArrayPtr TakeIndices(const ArrayPtr& array, const std::vector<int64_t>& indices);
    ArrayPtr TakeIndices(const ArrayPtr& array, const ArrayPtr& indices);
    ArrayPtr FilterArray(const ArrayPtr& array, const ArrayPtr& mask);
    ArrayPtr CastArray(const ArrayPtr& array, const std::shared_ptr<arrow::DataType>& type);
    ArrayPtr BroadcastScalar(const Value& value, int64_t length);
    ArrayPtr CombineChunks(const arrow::ChunkedArray& chunked);

    bool IsNumericType(const arrow::DataType& type);
    bool IsIntegerType(const arrow::DataType& type);
    bool IsDefaultLabels(const arrow::Array& labels);

    // pandas dtype name: int64, float64, bool, object, datetime64[ns]
    std::string DtypeName(const arrow::DataType& type);

    // Cell rendering for printed frames and series
    std::string CellText(const arrow::Array& array, int64_t index);

} // namespace nlytics::sandbox
