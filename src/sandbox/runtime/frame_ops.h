//
// NLytics Frame Operations
//
// Column algebra behind the DataFrame / Series / GroupBy surface. Every
// function returns new arrays; inputs are never modified. Missing values
// follow pandas: nulls and float NaN are both "missing".
//

#pragma once

#include "parser/ast_nodes.h"
#include "value.h"
#include <arrow/api.h>
#include <arrow/compute/api.h>
#include <string>
#include <vector>

namespace nlytics::sandbox
{
    // ---- Positional slicing (Python rules) ----
    struct SliceBounds
    {
        int64_t start;
        int64_t stop;
        int64_t step;

        int64_t Count() const;
        std::vector<int64_t> Indices() const;
    };

    SliceBounds ResolveSlice(const SliceValue& slice, int64_t length);

    // Python index normalisation; IndexError when out of range
    int64_t ResolveIndex(int64_t index, int64_t length, const char* what);

    // ---- Element-wise ----
    arrow::Datum ToDatum(const Value& value);
    ArrayPtr ArithmeticArrays(BinOpType op, const arrow::Datum& lhs, const arrow::Datum& rhs);
    ArrayPtr CompareArrays(CmpOpType op, const arrow::Datum& lhs, const arrow::Datum& rhs);
    ArrayPtr NegateArray(const ArrayPtr& array);
    ArrayPtr InvertArray(const ArrayPtr& array);
    ArrayPtr AbsArray(const ArrayPtr& array);
    ArrayPtr RoundArray(const ArrayPtr& array, int64_t digits);
    ArrayPtr UnaryMath(const std::string& function, const ArrayPtr& array); // sqrt, ln, exp

    // ---- Missing values ----
    ArrayPtr MissingMask(const ArrayPtr& array);
    ArrayPtr PresentMask(const ArrayPtr& array);
    ArrayPtr DropMissing(const ArrayPtr& array);
    ArrayPtr FillMissing(const ArrayPtr& array, const Value& fill);

    // ---- Reductions ----
    // sum mean min max count median std nunique first last size any all
    Value ReduceArray(const ArrayPtr& array, const std::string& reduction);
    bool IsNumericReduction(const std::string& reduction);

    ArrayPtr SortIndices(const ArrayPtr& array, bool ascending);
    ArrayPtr IsInArray(const ArrayPtr& array, const ValueList& candidates);
    ArrayPtr CastToDtype(const ArrayPtr& array, const Value& dtype);

    // ---- Series ----
    SeriesData TakeSeries(const SeriesData& series, const ArrayPtr& indices);
    SeriesData FilterSeries(const SeriesData& series, const ArrayPtr& mask);
    SeriesData SliceSeries(const SeriesData& series, const SliceBounds& bounds);
    SeriesData HeadSeries(const SeriesData& series, int64_t n);
    SeriesData TailSeries(const SeriesData& series, int64_t n);
    SeriesData ValueCounts(const SeriesData& series);
    // Position of the first label equal to `label`; KeyError when absent
    int64_t LabelPosition(const ArrayPtr& labels, const Value& label);

    // ---- Frames ----
    SeriesData ColumnSeries(const FrameData& frame, const std::string& column);
    FrameData SelectColumns(const FrameData& frame, const std::vector<std::string>& columns);
    FrameData TakeRows(const FrameData& frame, const ArrayPtr& indices);
    FrameData FilterRows(const FrameData& frame, const ArrayPtr& mask);
    FrameData SliceRows(const FrameData& frame, const SliceBounds& bounds);
    FrameData HeadRows(const FrameData& frame, int64_t n);
    FrameData TailRows(const FrameData& frame, int64_t n);
    FrameData SortRows(const FrameData& frame, const std::vector<std::string>& by, const std::vector<bool>& ascending);

    // Assignment value (series, list or scalar) as a column of `frame`'s length
    ArrayPtr ColumnFromValue(const FrameData& frame, const Value& value);
    void SetColumn(FrameData& frame, const std::string& column, ArrayPtr values);

    // Boolean mask from a series, list of bools or bool array; ValueError on length mismatch
    ArrayPtr MaskFromValue(const Value& value, int64_t length);

    // One value per column, labelled by column name
    SeriesData ReduceColumns(const FrameData& frame, const std::string& reduction);

    FrameData ResetIndex(const FrameData& frame, bool drop);

    // ---- Group by ----
    struct Groups
    {
        ArrayPtr keys;                          // sorted distinct non-missing keys
        std::vector<std::vector<int64_t>> rows; // row positions per key
    };

    Groups GroupRows(const ArrayPtr& keys);

    // Aggregated value per group for one column
    ArrayPtr AggregateGroups(const Groups& groups, const ArrayPtr& values, const std::string& reduction);

} // namespace nlytics::sandbox
