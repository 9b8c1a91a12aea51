//
// NLytics Operators Implementation
//

#include "operators.h"
#include "arrow_bridge.h"
#include "execution_context.h"
#include "frame_ops.h"
#include "module_ops.h"
#include "object_model.h"
#include "sandbox_error.h"
#include <algorithm>
#include <cctype>
#include <charconv>
#include <cmath>
#include <format>
#include <limits>

namespace nlytics::sandbox
{
    namespace
    {
        bool IsScalarNumber(const Value& v)
        {
            return v.Is<int64_t>() || v.Is<bool>();
        }

        std::optional<std::string> CommonSeriesName(const Value& lhs, const Value& rhs)
        {
            auto* l = lhs.Object<SeriesObject>();
            auto* r = rhs.Object<SeriesObject>();
            if (l && r)
            {
                return l->data.name == r->data.name ? l->data.name : std::nullopt;
            }
            return l ? l->data.name : r->data.name;
        }

        const SeriesData& ShapeSource(const Value& lhs, const Value& rhs)
        {
            auto* l = lhs.Object<SeriesObject>();
            auto* r = rhs.Object<SeriesObject>();
            if (l && r && l->data.Size() != r->data.Size())
            {
                ThrowValueError(std::format("operands could not be broadcast together with shapes ({},) ({},)",
                                            l->data.Size(), r->data.Size()));
            }
            return l ? l->data : r->data;
        }

        Value SeriesResult(const Value& lhs, const Value& rhs, ArrayPtr values)
        {
            const SeriesData& shape = ShapeSource(lhs, rhs);
            return MakeSeries(SeriesData{std::move(values), shape.labels, CommonSeriesName(lhs, rhs), shape.indexName});
        }

        Value FrameArithmetic(BinOpType op, const Value& lhs, const Value& rhs)
        {
            const bool frameLeft = lhs.Object<FrameObject>() != nullptr;
            const FrameData& frame = frameLeft ? lhs.Object<FrameObject>()->data : rhs.Object<FrameObject>()->data;
            const Value& other = frameLeft ? rhs : lhs;
            if (!other.IsNumber())
            {
                ThrowTypeError(std::format("unsupported operand type(s) for {}: '{}' and '{}'", BinOpSymbol(op),
                                           TypeName(lhs), TypeName(rhs)));
            }
            FrameData result = frame;
            const arrow::Datum scalar = ToDatum(other);
            for (auto& array : result.arrays)
            {
                array = frameLeft ? ArithmeticArrays(op, array, scalar) : ArithmeticArrays(op, scalar, array);
            }
            return MakeFrame(std::move(result));
        }

        int64_t CheckedInt(bool overflow, int64_t value)
        {
            if (overflow)
            {
                ThrowFault("OverflowError", "integer result out of range");
            }
            return value;
        }

        Value IntegerArithmetic(BinOpType op, int64_t a, int64_t b)
        {
            int64_t out = 0;
            switch (op)
            {
            case BinOpType::Add:
                return Value{CheckedInt(__builtin_add_overflow(a, b, &out), out)};
            case BinOpType::Sub:
                return Value{CheckedInt(__builtin_sub_overflow(a, b, &out), out)};
            case BinOpType::Mult:
                return Value{CheckedInt(__builtin_mul_overflow(a, b, &out), out)};
            case BinOpType::Div:
                if (b == 0)
                {
                    ThrowFault("ZeroDivisionError", "division by zero");
                }
                return Value{static_cast<double>(a) / static_cast<double>(b)};
            case BinOpType::FloorDiv:
            case BinOpType::Mod:
            {
                if (b == 0)
                {
                    ThrowFault("ZeroDivisionError", "integer division or modulo by zero");
                }
                if (b == -1)
                {
                    // a / -1 traps for INT64_MIN; the remainder is always 0
                    return op == BinOpType::FloorDiv ? Value{CheckedInt(__builtin_sub_overflow(0, a, &out), out)}
                                                     : Value{int64_t{0}};
                }
                int64_t quotient = a / b;
                int64_t remainder = a % b;
                if (remainder != 0 && ((remainder < 0) != (b < 0)))
                {
                    quotient -= 1;
                    remainder += b;
                }
                return op == BinOpType::FloorDiv ? Value{quotient} : Value{remainder};
            }
            case BinOpType::Pow:
            {
                if (b < 0)
                {
                    if (a == 0)
                    {
                        ThrowFault("ZeroDivisionError", "0.0 cannot be raised to a negative power");
                    }
                    return Value{std::pow(static_cast<double>(a), static_cast<double>(b))};
                }
                int64_t result = 1;
                int64_t base = a;
                int64_t exponent = b;
                while (exponent > 0)
                {
                    if ((exponent & 1) && __builtin_mul_overflow(result, base, &result))
                    {
                        ThrowFault("OverflowError", "integer result out of range");
                    }
                    exponent >>= 1;
                    if (exponent > 0 && __builtin_mul_overflow(base, base, &base))
                    {
                        ThrowFault("OverflowError", "integer result out of range");
                    }
                }
                return Value{result};
            }
            case BinOpType::BitAnd:
                return Value{a & b};
            case BinOpType::BitOr:
                return Value{a | b};
            case BinOpType::BitXor:
                return Value{a ^ b};
            }
            ThrowTypeError("unsupported integer operation");
        }

        Value FloatArithmetic(BinOpType op, double a, double b)
        {
            switch (op)
            {
            case BinOpType::Add:
                return Value{a + b};
            case BinOpType::Sub:
                return Value{a - b};
            case BinOpType::Mult:
                return Value{a * b};
            case BinOpType::Div:
                if (b == 0.0)
                {
                    ThrowFault("ZeroDivisionError", "float division by zero");
                }
                return Value{a / b};
            case BinOpType::FloorDiv:
                if (b == 0.0)
                {
                    ThrowFault("ZeroDivisionError", "float floor division by zero");
                }
                return Value{std::floor(a / b)};
            case BinOpType::Mod:
            {
                if (b == 0.0)
                {
                    ThrowFault("ZeroDivisionError", "float modulo");
                }
                double remainder = std::fmod(a, b);
                if (remainder != 0.0 && ((remainder < 0) != (b < 0)))
                {
                    remainder += b;
                }
                return Value{remainder};
            }
            case BinOpType::Pow:
                if (a == 0.0 && b < 0)
                {
                    ThrowFault("ZeroDivisionError", "0.0 cannot be raised to a negative power");
                }
                return Value{std::pow(a, b)};
            default:
                ThrowTypeError(std::format("unsupported operand type(s) for {}: 'float' and 'float'", BinOpSymbol(op)));
            }
        }

        Value RepeatSequence(const ValueList& items, int64_t times, bool tuple)
        {
            ValueList out;
            const uint64_t length = RepeatedLength(items.size(), times);
            if (length > 0)
            {
                CheckSequenceLength(length);
                out.reserve(length);
                for (int64_t i = 0; i < times; ++i)
                {
                    PollPreemption();
                    out.insert(out.end(), items.begin(), items.end());
                }
            }
            return tuple ? MakeTuple(std::move(out)) : MakeList(std::move(out));
        }

        Value RepeatString(const std::string& text, int64_t times)
        {
            std::string out;
            const uint64_t length = RepeatedLength(text.size(), times);
            if (length > 0)
            {
                CheckSequenceLength(length);
                out.reserve(length);
                for (int64_t i = 0; i < times; ++i)
                {
                    PollPreemption();
                    out += text;
                }
            }
            return Value{std::move(out)};
        }

        bool SameObject(const Value& lhs, const Value& rhs)
        {
            if (lhs.Data().index() != rhs.Data().index())
            {
                return false;
            }
            if (lhs.IsNone() || lhs.Is<bool>())
            {
                return ValuesEqual(lhs, rhs);
            }
            return std::visit(
                [&](const auto& v) -> bool {
                    using T = std::decay_t<decltype(v)>;
                    if constexpr (requires { v.get(); })
                        return v.get() == std::get<T>(rhs.Data()).get();
                    else
                        return ValuesEqual(lhs, rhs);
                },
                lhs.Data());
        }

        Value SequenceItem(const ValueList& items, const Value& key, bool tuple)
        {
            if (auto* slice = key.TryAs<SliceValue>())
            {
                ValueList out;
                for (int64_t i : ResolveSlice(*slice, static_cast<int64_t>(items.size())).Indices())
                {
                    out.push_back(items[static_cast<size_t>(i)]);
                }
                return tuple ? MakeTuple(std::move(out)) : MakeList(std::move(out));
            }
            if (!IsScalarNumber(key))
            {
                ThrowTypeError(std::format("{} indices must be integers or slices, not {}", tuple ? "tuple" : "list",
                                           TypeName(key)));
            }
            const int64_t index =
                ResolveIndex(ToInteger(key), static_cast<int64_t>(items.size()), tuple ? "tuple" : "list");
            return items[static_cast<size_t>(index)];
        }

        std::string GroupDigits(const std::string& digits, char separator)
        {
            std::string out;
            const size_t count = digits.size();
            for (size_t i = 0; i < count; ++i)
            {
                if (i > 0 && (count - i) % 3 == 0)
                {
                    out += separator;
                }
                out += digits[i];
            }
            return out;
        }

        // Width or precision of a format spec; both size the output string
        size_t SpecLength(const std::string& digits)
        {
            uint64_t length = 0;
            const auto [end, ec] = std::from_chars(digits.data(), digits.data() + digits.size(), length);
            if (ec != std::errc{} || end != digits.data() + digits.size())
            {
                ThrowValueError("Too many decimal digits in format string");
            }
            CheckSequenceLength(length);
            return static_cast<size_t>(length);
        }

        // Python format-spec mini language on top of std::format
        std::string FormatWithSpec(const Value& value, const std::string& spec)
        {
            size_t pos = 0;
            std::string fill;
            char align = 0;
            auto isAlign = [](char c) { return c == '<' || c == '>' || c == '^' || c == '='; };
            if (spec.size() >= 2 && isAlign(spec[1]))
            {
                fill = spec.substr(0, 1);
                align = spec[1];
                pos = 2;
            }
            else if (!spec.empty() && isAlign(spec[0]))
            {
                align = spec[0];
                pos = 1;
            }
            std::string sign;
            if (pos < spec.size() && (spec[pos] == '+' || spec[pos] == '-' || spec[pos] == ' '))
            {
                sign = spec.substr(pos++, 1);
            }
            bool zero = false;
            if (pos < spec.size() && spec[pos] == '0')
            {
                zero = true;
                ++pos;
            }
            std::string width;
            while (pos < spec.size() && std::isdigit(static_cast<unsigned char>(spec[pos])))
            {
                width += spec[pos++];
            }
            char grouping = 0;
            if (pos < spec.size() && (spec[pos] == ',' || spec[pos] == '_'))
            {
                grouping = spec[pos++];
            }
            std::string precision;
            if (pos < spec.size() && spec[pos] == '.')
            {
                ++pos;
                while (pos < spec.size() && std::isdigit(static_cast<unsigned char>(spec[pos])))
                {
                    precision += spec[pos++];
                }
            }
            char type = pos < spec.size() ? spec[pos++] : 0;
            if (pos != spec.size())
            {
                ThrowValueError("Invalid format specifier");
            }

            std::string body;
            if (value.IsString())
            {
                if (type != 0 && type != 's')
                {
                    ThrowValueError(std::format("Unknown format code '{}' for object of type 'str'", type));
                }
                body = value.As<std::string>();
                if (!precision.empty())
                {
                    body = body.substr(0, SpecLength(precision));
                }
            }
            else if (value.IsNumber())
            {
                const bool integral = !value.Is<double>() && (type == 0 || type == 'd');
                bool percent = false;
                std::string inner = sign;
                if (integral)
                {
                    inner += "d";
                }
                else
                {
                    if (type == 'd')
                    {
                        ThrowValueError("Unknown format code 'd' for object of type 'float'");
                    }
                    if (type == '%')
                    {
                        percent = true;
                        type = 'f';
                    }
                    if (!precision.empty())
                    {
                        inner += "." + std::to_string(SpecLength(precision));
                    }
                    else if (type == 'f' || type == 'F' || type == 'e' || type == 'E')
                    {
                        inner += ".6";
                    }
                    if (type != 0 && type != 'n')
                    {
                        inner += type;
                    }
                }
                const std::string format = "{:" + inner + "}";
                if (integral)
                {
                    int64_t integer = ToInteger(value);
                    body = std::vformat(format, std::make_format_args(integer));
                }
                else
                {
                    double number = ToNumber(value) * (percent ? 100.0 : 1.0);
                    body = (type == 0 && precision.empty()) ? FormatFloat(number)
                                                            : std::vformat(format, std::make_format_args(number));
                }
                if (grouping)
                {
                    const size_t start = (body[0] == '-' || body[0] == '+' || body[0] == ' ') ? 1 : 0;
                    size_t end = start;
                    while (end < body.size() && std::isdigit(static_cast<unsigned char>(body[end])))
                    {
                        ++end;
                    }
                    body = body.substr(0, start) + GroupDigits(body.substr(start, end - start), grouping) +
                           body.substr(end);
                }
                if (percent)
                {
                    body += "%";
                }
                if (zero && !width.empty() && align == 0)
                {
                    fill = "0";
                    align = '=';
                }
            }
            else
            {
                body = Str(value);
            }

            if (width.empty())
            {
                return body;
            }
            const size_t target = SpecLength(width);
            if (body.size() >= target)
            {
                return body;
            }
            const size_t padding = target - body.size();
            const char fillChar = fill.empty() ? ' ' : fill[0];
            if (align == 0)
            {
                align = value.IsNumber() ? '>' : '<';
            }
            switch (align)
            {
            case '<':
                return body + std::string(padding, fillChar);
            case '^':
                return std::string(padding / 2, fillChar) + body + std::string(padding - padding / 2, fillChar);
            case '=':
            {
                const size_t signLength = (!body.empty() && (body[0] == '-' || body[0] == '+')) ? 1 : 0;
                return body.substr(0, signLength) + std::string(padding, fillChar) + body.substr(signLength);
            }
            default:
                return std::string(padding, fillChar) + body;
            }
        }
    } // namespace

    Value BinaryOperation(BinOpType op, const Value& lhs, const Value& rhs)
    {
        if (lhs.Object<SeriesObject>() || rhs.Object<SeriesObject>())
        {
            if (lhs.Object<FrameObject>() || rhs.Object<FrameObject>())
            {
                ThrowTypeError("arithmetic between a DataFrame and a Series is not supported");
            }
            return SeriesResult(lhs, rhs, ArithmeticArrays(op, ToDatum(lhs), ToDatum(rhs)));
        }
        if (lhs.Object<FrameObject>() || rhs.Object<FrameObject>())
        {
            return FrameArithmetic(op, lhs, rhs);
        }

        if (IsScalarNumber(lhs) && IsScalarNumber(rhs))
        {
            if (lhs.Is<bool>() && rhs.Is<bool>() &&
                (op == BinOpType::BitAnd || op == BinOpType::BitOr || op == BinOpType::BitXor))
            {
                return Value{IntegerArithmetic(op, ToInteger(lhs), ToInteger(rhs)).As<int64_t>() != 0};
            }
            return IntegerArithmetic(op, ToInteger(lhs), ToInteger(rhs));
        }
        if (lhs.IsNumber() && rhs.IsNumber())
        {
            return FloatArithmetic(op, ToNumber(lhs), ToNumber(rhs));
        }

        if (op == BinOpType::Add)
        {
            if (lhs.IsString() && rhs.IsString())
            {
                CheckSequenceLength(uint64_t{lhs.As<std::string>().size()} + rhs.As<std::string>().size());
                return Value{lhs.As<std::string>() + rhs.As<std::string>()};
            }
            if (lhs.Object<ListObject>() && rhs.Object<ListObject>())
            {
                const auto& more = rhs.Object<ListObject>()->items;
                CheckSequenceLength(uint64_t{lhs.Object<ListObject>()->items.size()} + more.size());
                ValueList items = lhs.Object<ListObject>()->items;
                items.insert(items.end(), more.begin(), more.end());
                return MakeList(std::move(items));
            }
            if (lhs.Object<TupleObject>() && rhs.Object<TupleObject>())
            {
                const auto& more = rhs.Object<TupleObject>()->items;
                CheckSequenceLength(uint64_t{lhs.Object<TupleObject>()->items.size()} + more.size());
                ValueList items = lhs.Object<TupleObject>()->items;
                items.insert(items.end(), more.begin(), more.end());
                return MakeTuple(std::move(items));
            }
        }
        if (op == BinOpType::Mult)
        {
            const Value& sequence = IsScalarNumber(lhs) ? rhs : lhs;
            const Value& count = IsScalarNumber(lhs) ? lhs : rhs;
            if (IsScalarNumber(count))
            {
                const int64_t times = std::max<int64_t>(0, ToInteger(count));
                if (sequence.IsString())
                {
                    return RepeatString(sequence.As<std::string>(), times);
                }
                if (auto* list = sequence.Object<ListObject>())
                {
                    return RepeatSequence(list->items, times, false);
                }
                if (auto* tuple = sequence.Object<TupleObject>())
                {
                    return RepeatSequence(tuple->items, times, true);
                }
            }
        }
        ThrowTypeError(std::format("unsupported operand type(s) for {}: '{}' and '{}'", BinOpSymbol(op), TypeName(lhs),
                                   TypeName(rhs)));
    }

    Value UnaryOperation(UnaryOpType op, const Value& operand)
    {
        if (op == UnaryOpType::Not)
        {
            return Value{!Truthy(operand)};
        }
        if (auto* series = operand.Object<SeriesObject>())
        {
            SeriesData result = series->data;
            if (op == UnaryOpType::USub)
                result.values = NegateArray(result.values);
            else if (op == UnaryOpType::Invert)
                result.values = InvertArray(result.values);
            return MakeSeries(std::move(result));
        }
        if (op == UnaryOpType::Invert && IsScalarNumber(operand))
        {
            return Value{~ToInteger(operand)};
        }
        if (IsScalarNumber(operand))
        {
            const int64_t v = ToInteger(operand);
            if (op == UnaryOpType::USub && v == std::numeric_limits<int64_t>::min())
            {
                ThrowFault("OverflowError", "integer result out of range");
            }
            return Value{op == UnaryOpType::USub ? -v : v};
        }
        if (auto* d = operand.TryAs<double>())
        {
            if (op == UnaryOpType::Invert)
            {
                ThrowTypeError("bad operand type for unary ~: 'float'");
            }
            return Value{op == UnaryOpType::USub ? -*d : *d};
        }
        ThrowTypeError(std::format("bad operand type for unary operator: '{}'", TypeName(operand)));
    }

    bool LessThan(const Value& lhs, const Value& rhs)
    {
        if (lhs.IsNumber() && rhs.IsNumber())
        {
            if (IsScalarNumber(lhs) && IsScalarNumber(rhs))
            {
                return ToInteger(lhs) < ToInteger(rhs);
            }
            return ToNumber(lhs) < ToNumber(rhs);
        }
        if (lhs.IsString() && rhs.IsString())
        {
            return lhs.As<std::string>() < rhs.As<std::string>();
        }
        const ValueList* a = nullptr;
        const ValueList* b = nullptr;
        if (lhs.Object<TupleObject>() && rhs.Object<TupleObject>())
        {
            a = &lhs.Object<TupleObject>()->items;
            b = &rhs.Object<TupleObject>()->items;
        }
        else if (lhs.Object<ListObject>() && rhs.Object<ListObject>())
        {
            a = &lhs.Object<ListObject>()->items;
            b = &rhs.Object<ListObject>()->items;
        }
        if (a && b)
        {
            for (size_t i = 0; i < std::min(a->size(), b->size()); ++i)
            {
                if (!ValuesEqual((*a)[i], (*b)[i]))
                {
                    return LessThan((*a)[i], (*b)[i]);
                }
            }
            return a->size() < b->size();
        }
        ThrowTypeError(
            std::format("'<' not supported between instances of '{}' and '{}'", TypeName(lhs), TypeName(rhs)));
    }

    Value CompareValues(CmpOpType op, const Value& lhs, const Value& rhs)
    {
        switch (op)
        {
        case CmpOpType::In:
            return Value{Contains(rhs, lhs)};
        case CmpOpType::NotIn:
            return Value{!Contains(rhs, lhs)};
        case CmpOpType::Is:
            return Value{SameObject(lhs, rhs)};
        case CmpOpType::IsNot:
            return Value{!SameObject(lhs, rhs)};
        default:
            break;
        }

        if (lhs.Object<SeriesObject>() || rhs.Object<SeriesObject>())
        {
            return SeriesResult(lhs, rhs, CompareArrays(op, ToDatum(lhs), ToDatum(rhs)));
        }

        switch (op)
        {
        case CmpOpType::Eq:
            return Value{ValuesEqual(lhs, rhs)};
        case CmpOpType::NotEq:
            return Value{!ValuesEqual(lhs, rhs)};
        case CmpOpType::Lt:
            return Value{LessThan(lhs, rhs)};
        case CmpOpType::Gt:
            return Value{LessThan(rhs, lhs)};
        case CmpOpType::LtE:
            return Value{LessThan(lhs, rhs) || ValuesEqual(lhs, rhs)};
        case CmpOpType::GtE:
            return Value{LessThan(rhs, lhs) || ValuesEqual(lhs, rhs)};
        default:
            ThrowTypeError("unsupported comparison");
        }
    }

    bool Contains(const Value& container, const Value& item)
    {
        if (auto* text = container.TryAs<std::string>())
        {
            if (!item.IsString())
            {
                ThrowTypeError(std::format("'in <string>' requires string as left operand, not {}", TypeName(item)));
            }
            return text->find(item.As<std::string>()) != std::string::npos;
        }
        if (auto* dict = container.Object<DictObject>())
        {
            return dict->Find(item) != nullptr;
        }
        if (auto* series = container.Object<SeriesObject>())
        {
            // pandas membership tests the index
            const auto& labels = series->data.labels;
            for (int64_t i = 0; i < labels->length(); ++i)
            {
                if (ValuesEqual(ArrayElement(*labels, i), item))
                {
                    return true;
                }
            }
            return false;
        }
        if (auto* frame = container.Object<FrameObject>())
        {
            return item.IsString() && frame->data.FindColumn(item.As<std::string>()).has_value();
        }
        if (auto* range = container.TryAs<RangeValue>())
        {
            if (!IsScalarNumber(item))
            {
                return false;
            }
            const int64_t v = ToInteger(item);
            const int64_t offset = v - range->start;
            const bool inside = range->step > 0 ? (v >= range->start && v < range->stop)
                                                : (v <= range->start && v > range->stop);
            return inside && offset % range->step == 0;
        }
        const ValueList items = Materialize(container);
        return std::ranges::any_of(items, [&](const Value& v) { return ValuesEqual(v, item); });
    }

    Value GetItem(const Value& object, const Value& key)
    {
        if (object.Object<FrameObject>())
        {
            return FrameGetItem(object, key);
        }
        if (object.Object<SeriesObject>())
        {
            return SeriesGetItem(object, key);
        }
        if (object.Object<IndexerObject>())
        {
            return IndexerGetItem(object, key);
        }
        if (object.Object<GroupByObject>())
        {
            return GroupByGetItem(object, key);
        }
        if (auto* list = object.Object<ListObject>())
        {
            return SequenceItem(list->items, key, false);
        }
        if (auto* tuple = object.Object<TupleObject>())
        {
            return SequenceItem(tuple->items, key, true);
        }
        if (auto* dict = object.Object<DictObject>())
        {
            const Value* found = dict->Find(key);
            if (found == nullptr)
            {
                ThrowFault("KeyError", Repr(key));
            }
            return *found;
        }
        if (auto* text = object.TryAs<std::string>())
        {
            if (auto* slice = key.TryAs<SliceValue>())
            {
                std::string out;
                for (int64_t i : ResolveSlice(*slice, static_cast<int64_t>(text->size())).Indices())
                {
                    out += (*text)[static_cast<size_t>(i)];
                }
                return Value{out};
            }
            const int64_t index = ResolveIndex(ToInteger(key), static_cast<int64_t>(text->size()), "string");
            return Value{std::string(1, (*text)[static_cast<size_t>(index)])};
        }
        if (auto* range = object.TryAs<RangeValue>())
        {
            return Value{range->At(ResolveIndex(ToInteger(key), range->Length(), "range object"))};
        }
        ThrowTypeError(std::format("'{}' object is not subscriptable", TypeName(object)));
    }

    void SetItem(const Value& object, const Value& key, const Value& value)
    {
        if (object.Object<FrameObject>())
        {
            FrameSetItem(object, key, value);
            return;
        }
        if (object.Object<IndexerObject>())
        {
            IndexerSetItem(object, key, value);
            return;
        }
        if (auto* list = object.Object<ListObject>())
        {
            const int64_t index = ResolveIndex(ToInteger(key), static_cast<int64_t>(list->items.size()), "list assignment");
            list->items[static_cast<size_t>(index)] = value;
            return;
        }
        if (auto* dict = object.Object<DictObject>())
        {
            dict->Set(key, value);
            return;
        }
        ThrowTypeError(std::format("'{}' object does not support item assignment", TypeName(object)));
    }

    Value GetAttribute(const Value& object, const std::string& name)
    {
        if (name.starts_with("__"))
        {
            ThrowDisallowed(name);
        }
        if (auto* module = object.Object<ModuleObject>())
        {
            return ModuleAttribute(*module, name);
        }
        if (object.Object<FrameObject>())
        {
            return FrameAttribute(object, name);
        }
        if (object.Object<SeriesObject>())
        {
            return SeriesAttribute(object, name);
        }
        if (object.Object<GroupByObject>())
        {
            return GroupByAttribute(object, name);
        }
        if (object.Object<ListObject>())
        {
            return ListAttribute(object, name);
        }
        if (object.Object<DictObject>())
        {
            return DictAttribute(object, name);
        }
        if (object.IsString())
        {
            return StringAttribute(object, name);
        }
        ThrowNoAttribute(object, name);
    }

    Value CallValue(ExecutionContext& context, const Value& callee, const CallArgs& args)
    {
        if (auto* builtin = callee.Object<BuiltinFunction>())
        {
            return builtin->fn(context, args);
        }
        if (auto* method = callee.Object<BoundMethod>())
        {
            return method->fn(context, method->self, args);
        }
        if (auto* stub = callee.Object<DisallowedStub>())
        {
            ThrowDisallowed(stub->name);
        }
        ThrowTypeError(std::format("'{}' object is not callable", TypeName(callee)));
    }

    std::string FormatField(const Value& value, char conversion, const std::string& spec)
    {
        Value subject = value;
        if (conversion == 'r' || conversion == 'a')
        {
            subject = Value{Repr(value)};
        }
        else if (conversion == 's')
        {
            subject = Value{Str(value)};
        }
        if (spec.empty())
        {
            return Str(subject);
        }
        try
        {
            return FormatWithSpec(subject, spec);
        }
        catch (const std::format_error& e)
        {
            ThrowValueError(std::format("Invalid format specifier '{}': {}", spec, e.what()));
        }
    }

} // namespace nlytics::sandbox
