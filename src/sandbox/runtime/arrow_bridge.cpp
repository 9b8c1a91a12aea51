//
// NLytics Arrow Bridge Implementation
//

#include "arrow_bridge.h"
#include <arrow/array/concatenate.h>
#include <arrow/array/util.h>
#include <cmath>
#include <format>
#include <limits>

namespace nlytics::sandbox
{
    namespace
    {
        template <typename ScalarType>
        int64_t IntegerScalarValue(const arrow::Scalar& scalar)
        {
            return static_cast<int64_t>(static_cast<const ScalarType&>(scalar).value);
        }

        enum class InferredKind
        {
            Null,
            Boolean,
            Integer,
            Float,
            Text
        };
    } // namespace

    void CheckStatus(const arrow::Status& status, std::string_view operation)
    {
        if (status.ok())
        {
            return;
        }

        const std::string detail = std::format("{}: {}", operation, status.message());
        if (status.message().find("divide by zero") != std::string::npos)
        {
            ThrowFault("ZeroDivisionError", "division by zero");
        }
        if (status.IsNotImplemented() || status.IsTypeError())
        {
            ThrowTypeError(detail);
        }
        if (status.IsIndexError())
        {
            ThrowIndexError(detail);
        }
        if (status.IsKeyError())
        {
            ThrowFault("KeyError", detail);
        }
        if (status.IsInvalid() || status.IsCapacityError())
        {
            ThrowValueError(detail);
        }
        ThrowFault("RuntimeError", detail);
    }

    arrow::Datum CallCompute(const std::string& function,
                             const std::vector<arrow::Datum>& args,
                             const arrow::compute::FunctionOptions* options)
    {
        return Unwrap(arrow::compute::CallFunction(function, args, options), function);
    }

    ArrayPtr CallComputeArray(const std::string& function,
                              const std::vector<arrow::Datum>& args,
                              const arrow::compute::FunctionOptions* options)
    {
        auto datum = CallCompute(function, args, options);
        if (datum.is_chunked_array())
        {
            return CombineChunks(*datum.chunked_array());
        }
        return datum.make_array();
    }

    Value CallComputeScalar(const std::string& function,
                            const std::vector<arrow::Datum>& args,
                            const arrow::compute::FunctionOptions* options)
    {
        auto datum = CallCompute(function, args, options);
        if (!datum.is_scalar())
        {
            ThrowFault("RuntimeError", std::format("{} did not produce a scalar", function));
        }
        return ScalarToValue(*datum.scalar());
    }

    Value ScalarToValue(const arrow::Scalar& scalar)
    {
        if (!scalar.is_valid)
        {
            if (IsNumericType(*scalar.type))
            {
                return Value{std::numeric_limits<double>::quiet_NaN()};
            }
            return Value::None();
        }

        switch (scalar.type->id())
        {
        case arrow::Type::BOOL:
            return Value{static_cast<const arrow::BooleanScalar&>(scalar).value};
        case arrow::Type::INT8:
            return Value{IntegerScalarValue<arrow::Int8Scalar>(scalar)};
        case arrow::Type::INT16:
            return Value{IntegerScalarValue<arrow::Int16Scalar>(scalar)};
        case arrow::Type::INT32:
            return Value{IntegerScalarValue<arrow::Int32Scalar>(scalar)};
        case arrow::Type::INT64:
            return Value{IntegerScalarValue<arrow::Int64Scalar>(scalar)};
        case arrow::Type::UINT8:
            return Value{IntegerScalarValue<arrow::UInt8Scalar>(scalar)};
        case arrow::Type::UINT16:
            return Value{IntegerScalarValue<arrow::UInt16Scalar>(scalar)};
        case arrow::Type::UINT32:
            return Value{IntegerScalarValue<arrow::UInt32Scalar>(scalar)};
        case arrow::Type::UINT64:
            return Value{IntegerScalarValue<arrow::UInt64Scalar>(scalar)};
        case arrow::Type::FLOAT:
            return Value{static_cast<double>(static_cast<const arrow::FloatScalar&>(scalar).value)};
        case arrow::Type::DOUBLE:
            return Value{static_cast<const arrow::DoubleScalar&>(scalar).value};
        case arrow::Type::STRING:
            return Value{static_cast<const arrow::StringScalar&>(scalar).value->ToString()};
        case arrow::Type::LARGE_STRING:
            return Value{static_cast<const arrow::LargeStringScalar&>(scalar).value->ToString()};
        default:
            return Value{scalar.ToString()};
        }
    }

    std::shared_ptr<arrow::Scalar> ValueToScalar(const Value& value)
    {
        if (value.IsNone())
        {
            return arrow::MakeNullScalar(arrow::float64());
        }
        if (auto* b = value.TryAs<bool>())
        {
            return arrow::MakeScalar(*b);
        }
        if (auto* i = value.TryAs<int64_t>())
        {
            return arrow::MakeScalar(*i);
        }
        if (auto* d = value.TryAs<double>())
        {
            return arrow::MakeScalar(*d);
        }
        if (auto* s = value.TryAs<std::string>())
        {
            return std::make_shared<arrow::StringScalar>(*s);
        }
        ThrowTypeError(std::format("cannot use a '{}' as a column value", TypeName(value)));
    }

    Value ArrayElement(const arrow::Array& array, int64_t index)
    {
        auto scalar = Unwrap(array.GetScalar(index), "element access");
        return ScalarToValue(*scalar);
    }

    ArrayPtr ValuesToArray(const ValueList& values)
    {
        InferredKind kind = InferredKind::Null;
        bool hasNull = false;
        for (const auto& value : values)
        {
            InferredKind next;
            if (value.IsNone())
            {
                hasNull = true;
                continue;
            }
            if (value.Is<bool>())
                next = InferredKind::Boolean;
            else if (value.Is<int64_t>())
                next = InferredKind::Integer;
            else if (value.Is<double>())
                next = InferredKind::Float;
            else if (value.Is<std::string>())
                next = InferredKind::Text;
            else
                ThrowTypeError(std::format("cannot store a '{}' in a column", TypeName(value)));

            if (kind == InferredKind::Null)
            {
                kind = next;
            }
            else if (kind != next)
            {
                const bool numeric = kind != InferredKind::Text && next != InferredKind::Text;
                if (!numeric)
                {
                    ThrowTypeError("cannot build a column from mixed text and numeric values");
                }
                // bool widens to int, anything with a float widens to float
                kind = (kind == InferredKind::Float || next == InferredKind::Float) ? InferredKind::Float
                                                                                    : InferredKind::Integer;
            }
        }
        // pandas stores missing integers as NaN
        if (hasNull && kind == InferredKind::Integer)
        {
            kind = InferredKind::Float;
        }

        switch (kind)
        {
        case InferredKind::Boolean:
        {
            arrow::BooleanBuilder builder;
            for (const auto& value : values)
            {
                CheckStatus(value.IsNone() ? builder.AppendNull() : builder.Append(value.As<bool>()), "build");
            }
            return Unwrap(builder.Finish(), "build");
        }
        case InferredKind::Integer:
        {
            arrow::Int64Builder builder;
            for (const auto& value : values)
            {
                CheckStatus(builder.Append(ToInteger(value)), "build");
            }
            return Unwrap(builder.Finish(), "build");
        }
        case InferredKind::Text:
        {
            arrow::StringBuilder builder;
            for (const auto& value : values)
            {
                CheckStatus(value.IsNone() ? builder.AppendNull() : builder.Append(value.As<std::string>()), "build");
            }
            return Unwrap(builder.Finish(), "build");
        }
        case InferredKind::Null:
        case InferredKind::Float:
        {
            arrow::DoubleBuilder builder;
            for (const auto& value : values)
            {
                CheckStatus(value.IsNone() ? builder.AppendNull() : builder.Append(ToNumber(value)), "build");
            }
            return Unwrap(builder.Finish(), "build");
        }
        }
        ThrowFault("RuntimeError", "unreachable column kind");
    }

    ValueList ArrayToValues(const arrow::Array& array)
    {
        ValueList values;
        values.reserve(static_cast<size_t>(array.length()));
        for (int64_t i = 0; i < array.length(); ++i)
        {
            values.push_back(ArrayElement(array, i));
        }
        return values;
    }

    ArrayPtr RangeLabels(int64_t length)
    {
        arrow::Int64Builder builder;
        CheckStatus(builder.Reserve(length), "labels");
        for (int64_t i = 0; i < length; ++i)
        {
            builder.UnsafeAppend(i);
        }
        return Unwrap(builder.Finish(), "labels");
    }

    ArrayPtr MakeEmptyArray(const std::shared_ptr<arrow::DataType>& type)
    {
        return Unwrap(arrow::MakeEmptyArray(type), "empty array");
    }

    ArrayPtr TakeIndices(const ArrayPtr& array, const std::vector<int64_t>& indices)
    {
        arrow::Int64Builder builder;
        CheckStatus(builder.AppendValues(indices), "take");
        ArrayPtr indexArray = Unwrap(builder.Finish(), "take");
        return TakeIndices(array, indexArray);
    }

    ArrayPtr TakeIndices(const ArrayPtr& array, const ArrayPtr& indices)
    {
        return CallComputeArray("take", {array, indices});
    }

    ArrayPtr FilterArray(const ArrayPtr& array, const ArrayPtr& mask)
    {
        arrow::compute::FilterOptions options(arrow::compute::FilterOptions::DROP);
        return CallComputeArray("filter", {array, mask}, &options);
    }

    ArrayPtr CastArray(const ArrayPtr& array, const std::shared_ptr<arrow::DataType>& type)
    {
        if (array->type()->Equals(*type))
        {
            return array;
        }
        arrow::compute::CastOptions options = arrow::compute::CastOptions::Safe(type);
        return CallComputeArray("cast", {array}, &options);
    }

    ArrayPtr BroadcastScalar(const Value& value, int64_t length)
    {
        auto scalar = ValueToScalar(value);
        return Unwrap(arrow::MakeArrayFromScalar(*scalar, length), "broadcast");
    }

    ArrayPtr CombineChunks(const arrow::ChunkedArray& chunked)
    {
        if (chunked.num_chunks() == 0)
        {
            return MakeEmptyArray(chunked.type());
        }
        if (chunked.num_chunks() == 1)
        {
            return chunked.chunk(0);
        }
        return Unwrap(arrow::Concatenate(chunked.chunks()), "concatenate");
    }

    bool IsNumericType(const arrow::DataType& type)
    {
        return arrow::is_integer(type.id()) || arrow::is_floating(type.id());
    }

    bool IsIntegerType(const arrow::DataType& type)
    {
        return arrow::is_integer(type.id());
    }

    bool IsDefaultLabels(const arrow::Array& labels)
    {
        if (labels.type_id() != arrow::Type::INT64 || labels.null_count() != 0)
        {
            return false;
        }
        const auto& ints = static_cast<const arrow::Int64Array&>(labels);
        for (int64_t i = 0; i < ints.length(); ++i)
        {
            if (ints.Value(i) != i)
            {
                return false;
            }
        }
        return true;
    }

    std::string DtypeName(const arrow::DataType& type)
    {
        if (arrow::is_integer(type.id()))
        {
            return type.ToString();
        }
        switch (type.id())
        {
        case arrow::Type::FLOAT:
            return "float32";
        case arrow::Type::DOUBLE:
            return "float64";
        case arrow::Type::BOOL:
            return "bool";
        case arrow::Type::TIMESTAMP:
        case arrow::Type::DATE32:
        case arrow::Type::DATE64:
            return "datetime64[ns]";
        default:
            return "object";
        }
    }

    std::string CellText(const arrow::Array& array, int64_t index)
    {
        if (array.IsNull(index))
        {
            return IsNumericType(*array.type()) ? "NaN" : "None";
        }
        return Str(ArrayElement(array, index));
    }

} // namespace nlytics::sandbox
