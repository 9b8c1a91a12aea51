//
// NLytics Sandbox Values Implementation
//

#include "value.h"
#include "arrow_bridge.h"
#include "execution_context.h"
#include "sandbox_error.h"
#include <algorithm>
#include <cmath>
#include <format>
#include <limits>

namespace nlytics::sandbox
{
    namespace
    {
        constexpr int64_t kPrintRowLimit = 60;
        constexpr int64_t kPrintEdgeRows = 5;

        // Rows to print: all of them, or the head and tail with a gap marker (-1)
        std::vector<int64_t> PrintedRows(int64_t total)
        {
            std::vector<int64_t> rows;
            if (total <= kPrintRowLimit)
            {
                for (int64_t i = 0; i < total; ++i)
                {
                    rows.push_back(i);
                }
                return rows;
            }
            for (int64_t i = 0; i < kPrintEdgeRows; ++i)
            {
                rows.push_back(i);
            }
            rows.push_back(-1);
            for (int64_t i = total - kPrintEdgeRows; i < total; ++i)
            {
                rows.push_back(i);
            }
            return rows;
        }

        std::string PadLeft(const std::string& text, size_t width)
        {
            return text.size() >= width ? text : std::string(width - text.size(), ' ') + text;
        }

        std::string PadRight(const std::string& text, size_t width)
        {
            return text.size() >= width ? text : text + std::string(width - text.size(), ' ');
        }

        std::string FrameText(const FrameData& frame)
        {
            const int64_t rows = frame.NumRows();
            if (frame.columns.empty())
            {
                return std::format("Empty DataFrame\nColumns: []\nIndex: [{} rows]", rows);
            }
            if (rows == 0)
            {
                std::string names;
                for (size_t i = 0; i < frame.columns.size(); ++i)
                {
                    names += (i ? ", " : "") + frame.columns[i];
                }
                return std::format("Empty DataFrame\nColumns: [{}]\nIndex: []", names);
            }

            const auto printed = PrintedRows(rows);
            std::vector<std::string> labelCells;
            std::vector<std::vector<std::string>> cells(frame.columns.size());
            for (int64_t row : printed)
            {
                labelCells.push_back(row < 0 ? "..." : CellText(*frame.labels, row));
                for (size_t c = 0; c < frame.columns.size(); ++c)
                {
                    cells[c].push_back(row < 0 ? "..." : CellText(*frame.arrays[c], row));
                }
            }

            size_t labelWidth = frame.indexName.size();
            for (const auto& cell : labelCells)
            {
                labelWidth = std::max(labelWidth, cell.size());
            }
            std::vector<size_t> widths;
            for (size_t c = 0; c < frame.columns.size(); ++c)
            {
                size_t width = frame.columns[c].size();
                for (const auto& cell : cells[c])
                {
                    width = std::max(width, cell.size());
                }
                widths.push_back(width);
            }

            std::string out = std::string(labelWidth, ' ');
            for (size_t c = 0; c < frame.columns.size(); ++c)
            {
                out += "  " + PadLeft(frame.columns[c], widths[c]);
            }
            if (!frame.indexName.empty())
            {
                out += "\n" + PadRight(frame.indexName, labelWidth);
            }
            for (size_t r = 0; r < printed.size(); ++r)
            {
                out += "\n" + PadRight(labelCells[r], labelWidth);
                for (size_t c = 0; c < frame.columns.size(); ++c)
                {
                    out += "  " + PadLeft(cells[c][r], widths[c]);
                }
            }
            if (rows > kPrintRowLimit)
            {
                out += std::format("\n\n[{} rows x {} columns]", rows, frame.columns.size());
            }
            return out;
        }

        std::string SeriesText(const SeriesData& series)
        {
            const int64_t rows = series.Size();
            const auto printed = PrintedRows(rows);

            std::vector<std::string> labelCells;
            std::vector<std::string> valueCells;
            size_t labelWidth = 0;
            size_t valueWidth = 0;
            for (int64_t row : printed)
            {
                labelCells.push_back(row < 0 ? "..." : CellText(*series.labels, row));
                valueCells.push_back(row < 0 ? "..." : CellText(*series.values, row));
                labelWidth = std::max(labelWidth, labelCells.back().size());
                valueWidth = std::max(valueWidth, valueCells.back().size());
            }

            std::string out;
            if (!series.indexName.empty())
            {
                out += series.indexName + "\n";
            }
            for (size_t r = 0; r < printed.size(); ++r)
            {
                out += PadRight(labelCells[r], labelWidth) + "    " + PadLeft(valueCells[r], valueWidth) + "\n";
            }
            if (rows == 0)
            {
                out += "Series([], ";
            }

            std::vector<std::string> footer;
            if (rows > kPrintRowLimit)
            {
                footer.push_back(std::format("Length: {}", rows));
            }
            if (series.name)
            {
                footer.push_back("Name: " + *series.name);
            }
            footer.push_back("dtype: " + DtypeName(*series.values->type()));
            for (size_t i = 0; i < footer.size(); ++i)
            {
                out += (i ? ", " : "") + footer[i];
            }
            if (rows == 0)
            {
                out += ")";
            }
            return out;
        }

        std::string SequenceRepr(const ValueList& items, const char* open, const char* close, bool tuple)
        {
            std::string out = open;
            for (size_t i = 0; i < items.size(); ++i)
            {
                out += (i ? ", " : "") + Repr(items[i]);
            }
            if (tuple && items.size() == 1)
            {
                out += ",";
            }
            return out + close;
        }

        std::string StringRepr(const std::string& text)
        {
            const bool useDouble = text.find('\'') != std::string::npos && text.find('"') == std::string::npos;
            const char quote = useDouble ? '"' : '\'';
            std::string out(1, quote);
            for (char ch : text)
            {
                switch (ch)
                {
                case '\\':
                    out += "\\\\";
                    break;
                case '\n':
                    out += "\\n";
                    break;
                case '\t':
                    out += "\\t";
                    break;
                case '\r':
                    out += "\\r";
                    break;
                default:
                    if (ch == quote)
                    {
                        out += '\\';
                    }
                    out += ch;
                }
            }
            out += quote;
            return out;
        }
    } // namespace

    std::optional<size_t> FrameData::FindColumn(const std::string& name) const
    {
        auto it = std::ranges::find(columns, name);
        if (it == columns.end())
        {
            return std::nullopt;
        }
        return static_cast<size_t>(std::distance(columns.begin(), it));
    }

    int64_t RangeValue::Length() const
    {
        uint64_t span = 0;
        uint64_t stride = 0;
        if (step > 0 && start < stop)
        {
            span = static_cast<uint64_t>(stop) - static_cast<uint64_t>(start);
            stride = static_cast<uint64_t>(step);
        }
        else if (step < 0 && start > stop)
        {
            span = static_cast<uint64_t>(start) - static_cast<uint64_t>(stop);
            stride = uint64_t{0} - static_cast<uint64_t>(step);
        }
        else
        {
            return 0;
        }
        const uint64_t length = (span - 1) / stride + 1;
        if (length > static_cast<uint64_t>(std::numeric_limits<int64_t>::max()))
        {
            ThrowFault("OverflowError", "Python int too large to convert to C ssize_t");
        }
        return static_cast<int64_t>(length);
    }

    const Value* DictObject::Find(const Value& key) const
    {
        for (const auto& [k, v] : entries)
        {
            if (ValuesEqual(k, key))
            {
                return &v;
            }
        }
        return nullptr;
    }

    void DictObject::Set(const Value& key, Value value)
    {
        for (auto& [k, v] : entries)
        {
            if (ValuesEqual(k, key))
            {
                v = std::move(value);
                return;
            }
        }
        entries.emplace_back(key, std::move(value));
    }

    std::optional<Value> IteratorObject::Next()
    {
        if (auto* range = std::get_if<RangeValue>(&source))
        {
            if (position >= range->Length())
            {
                return std::nullopt;
            }
            return Value{range->At(position++)};
        }
        const auto& items = std::get<ValueList>(source);
        if (position >= static_cast<int64_t>(items.size()))
        {
            return std::nullopt;
        }
        return items[static_cast<size_t>(position++)];
    }

    Value MakeList(ValueList items)
    {
        return Value{std::make_shared<ListObject>(ListObject{std::move(items)})};
    }

    Value MakeTuple(ValueList items)
    {
        return Value{std::make_shared<TupleObject>(TupleObject{std::move(items)})};
    }

    Value MakeDict()
    {
        return Value{std::make_shared<DictObject>()};
    }

    Value MakeFrame(FrameData data)
    {
        if (!data.labels)
        {
            data.labels = RangeLabels(data.arrays.empty() ? 0 : data.arrays.front()->length());
        }
        return Value{std::make_shared<FrameObject>(FrameObject{std::move(data)})};
    }

    Value MakeSeries(SeriesData data)
    {
        if (!data.labels)
        {
            data.labels = RangeLabels(data.Size());
        }
        return Value{std::make_shared<SeriesObject>(SeriesObject{std::move(data)})};
    }

    std::string TypeName(const Value& value)
    {
        return std::visit(
            [](const auto& v) -> std::string {
                using T = std::decay_t<decltype(v)>;
                if constexpr (std::is_same_v<T, std::monostate>)
                    return "NoneType";
                else if constexpr (std::is_same_v<T, bool>)
                    return "bool";
                else if constexpr (std::is_same_v<T, int64_t>)
                    return "int";
                else if constexpr (std::is_same_v<T, double>)
                    return "float";
                else if constexpr (std::is_same_v<T, std::string>)
                    return "str";
                else if constexpr (std::is_same_v<T, std::shared_ptr<ListObject>>)
                    return "list";
                else if constexpr (std::is_same_v<T, std::shared_ptr<TupleObject>>)
                    return "tuple";
                else if constexpr (std::is_same_v<T, std::shared_ptr<DictObject>>)
                    return "dict";
                else if constexpr (std::is_same_v<T, SliceValue>)
                    return "slice";
                else if constexpr (std::is_same_v<T, std::shared_ptr<FrameObject>>)
                    return "DataFrame";
                else if constexpr (std::is_same_v<T, std::shared_ptr<SeriesObject>>)
                    return "Series";
                else if constexpr (std::is_same_v<T, std::shared_ptr<GroupByObject>>)
                    return "DataFrameGroupBy";
                else if constexpr (std::is_same_v<T, std::shared_ptr<IndexerObject>>)
                    return "_Indexer";
                else if constexpr (std::is_same_v<T, std::shared_ptr<ModuleObject>>)
                    return "module";
                else if constexpr (std::is_same_v<T, std::shared_ptr<BuiltinFunction>>)
                    return "builtin_function_or_method";
                else if constexpr (std::is_same_v<T, std::shared_ptr<BoundMethod>>)
                    return "method";
                else if constexpr (std::is_same_v<T, std::shared_ptr<DisallowedStub>>)
                    return "disallowed";
                else if constexpr (std::is_same_v<T, RangeValue>)
                    return "range";
                else
                    return "iterator";
            },
            value.Data());
    }

    std::string FormatFloat(double value)
    {
        if (std::isnan(value))
        {
            return "nan";
        }
        if (std::isinf(value))
        {
            return value > 0 ? "inf" : "-inf";
        }
        // Shortest round-trip form, then Python's trailing ".0" for integral values
        std::string text = std::format("{}", value);
        if (text.find_first_of(".eEn") == std::string::npos)
        {
            text += ".0";
        }
        return text;
    }

    std::string Repr(const Value& value)
    {
        if (auto* s = value.TryAs<std::string>())
        {
            return StringRepr(*s);
        }
        if (auto* list = value.Object<ListObject>())
        {
            return SequenceRepr(list->items, "[", "]", false);
        }
        if (auto* tuple = value.Object<TupleObject>())
        {
            return SequenceRepr(tuple->items, "(", ")", true);
        }
        if (auto* dict = value.Object<DictObject>())
        {
            std::string out = "{";
            for (size_t i = 0; i < dict->entries.size(); ++i)
            {
                out += (i ? ", " : "") + Repr(dict->entries[i].first) + ": " + Repr(dict->entries[i].second);
            }
            return out + "}";
        }
        return Str(value);
    }

    std::string Str(const Value& value)
    {
        return std::visit(
            [&](const auto& v) -> std::string {
                using T = std::decay_t<decltype(v)>;
                if constexpr (std::is_same_v<T, std::monostate>)
                    return "None";
                else if constexpr (std::is_same_v<T, bool>)
                    return v ? "True" : "False";
                else if constexpr (std::is_same_v<T, int64_t>)
                    return std::to_string(v);
                else if constexpr (std::is_same_v<T, double>)
                    return FormatFloat(v);
                else if constexpr (std::is_same_v<T, std::string>)
                    return v;
                else if constexpr (std::is_same_v<T, SliceValue>)
                {
                    auto part = [](const std::optional<int64_t>& p) {
                        return p ? std::to_string(*p) : std::string{"None"};
                    };
                    return std::format("slice({}, {}, {})", part(v.start), part(v.stop), part(v.step));
                }
                else if constexpr (std::is_same_v<T, RangeValue>)
                {
                    if (v.step == 1)
                        return std::format("range({}, {})", v.start, v.stop);
                    return std::format("range({}, {}, {})", v.start, v.stop, v.step);
                }
                else if constexpr (std::is_same_v<T, std::shared_ptr<FrameObject>>)
                    return FrameText(v->data);
                else if constexpr (std::is_same_v<T, std::shared_ptr<SeriesObject>>)
                    return SeriesText(v->data);
                else if constexpr (std::is_same_v<T, std::shared_ptr<ModuleObject>>)
                    return std::format("<module '{}'>", v->name);
                else if constexpr (std::is_same_v<T, std::shared_ptr<BuiltinFunction>>)
                    return std::format("<built-in function {}>", v->name);
                else if constexpr (std::is_same_v<T, std::shared_ptr<BoundMethod>>)
                    return std::format("<bound method {} of {} object>", v->name, TypeName(v->self));
                else if constexpr (std::is_same_v<T, std::shared_ptr<DisallowedStub>>)
                    return std::format("<disallowed {}>", v->name);
                else if constexpr (std::is_same_v<T, std::shared_ptr<ListObject>> ||
                                   std::is_same_v<T, std::shared_ptr<TupleObject>> ||
                                   std::is_same_v<T, std::shared_ptr<DictObject>>)
                    return Repr(value);
                else
                    return std::format("<{} object>", TypeName(value));
            },
            value.Data());
    }

    bool Truthy(const Value& value)
    {
        return std::visit(
            [&](const auto& v) -> bool {
                using T = std::decay_t<decltype(v)>;
                if constexpr (std::is_same_v<T, std::monostate>)
                    return false;
                else if constexpr (std::is_same_v<T, bool>)
                    return v;
                else if constexpr (std::is_same_v<T, int64_t>)
                    return v != 0;
                else if constexpr (std::is_same_v<T, double>)
                    return v != 0.0;
                else if constexpr (std::is_same_v<T, std::string>)
                    return !v.empty();
                else if constexpr (std::is_same_v<T, std::shared_ptr<ListObject>> ||
                                   std::is_same_v<T, std::shared_ptr<TupleObject>>)
                    return !v->items.empty();
                else if constexpr (std::is_same_v<T, std::shared_ptr<DictObject>>)
                    return !v->entries.empty();
                else if constexpr (std::is_same_v<T, RangeValue>)
                    return v.Length() > 0;
                else if constexpr (std::is_same_v<T, std::shared_ptr<FrameObject>>)
                {
                    ThrowValueError("The truth value of a DataFrame is ambiguous. "
                                    "Use a.empty, a.bool(), a.item(), a.any() or a.all().");
                }
                else if constexpr (std::is_same_v<T, std::shared_ptr<SeriesObject>>)
                {
                    ThrowValueError("The truth value of a Series is ambiguous. "
                                    "Use a.empty, a.bool(), a.item(), a.any() or a.all().");
                }
                else
                    return true;
            },
            value.Data());
    }

    bool ValuesEqual(const Value& a, const Value& b)
    {
        if (a.IsNumber() && b.IsNumber())
        {
            if (!a.Is<double>() && !b.Is<double>())
            {
                return ToInteger(a) == ToInteger(b);
            }
            return ToNumber(a) == ToNumber(b);
        }
        if (a.IsNone() || b.IsNone())
        {
            return a.IsNone() && b.IsNone();
        }
        if (a.IsString() && b.IsString())
        {
            return a.As<std::string>() == b.As<std::string>();
        }

        auto itemsEqual = [](const ValueList& x, const ValueList& y) {
            return x.size() == y.size() &&
                   std::equal(x.begin(), x.end(), y.begin(), [](const Value& l, const Value& r) { return ValuesEqual(l, r); });
        };
        if (a.Object<ListObject>() && b.Object<ListObject>())
        {
            return itemsEqual(a.Object<ListObject>()->items, b.Object<ListObject>()->items);
        }
        if (a.Object<TupleObject>() && b.Object<TupleObject>())
        {
            return itemsEqual(a.Object<TupleObject>()->items, b.Object<TupleObject>()->items);
        }
        if (auto* da = a.Object<DictObject>())
        {
            auto* db = b.Object<DictObject>();
            if (db == nullptr || da->entries.size() != db->entries.size())
            {
                return false;
            }
            return std::ranges::all_of(da->entries, [&](const auto& entry) {
                const Value* other = db->Find(entry.first);
                return other != nullptr && ValuesEqual(entry.second, *other);
            });
        }
        if (a.Is<RangeValue>() && b.Is<RangeValue>())
        {
            const auto& ra = a.As<RangeValue>();
            const auto& rb = b.As<RangeValue>();
            return ra.start == rb.start && ra.stop == rb.stop && ra.step == rb.step;
        }
        if (a.Data().index() != b.Data().index())
        {
            return false;
        }
        // Remaining boxed objects compare by identity
        return std::visit(
            [&](const auto& v) -> bool {
                using T = std::decay_t<decltype(v)>;
                if constexpr (std::is_same_v<T, SliceValue>)
                {
                    const auto& o = b.As<SliceValue>();
                    return v.start == o.start && v.stop == o.stop && v.step == o.step;
                }
                else if constexpr (requires { v.get(); })
                    return v.get() == std::get<T>(b.Data()).get();
                else
                    return false;
            },
            a.Data());
    }

    double ToNumber(const Value& value)
    {
        if (auto* d = value.TryAs<double>())
        {
            return *d;
        }
        if (auto* i = value.TryAs<int64_t>())
        {
            return static_cast<double>(*i);
        }
        if (auto* b = value.TryAs<bool>())
        {
            return *b ? 1.0 : 0.0;
        }
        ThrowTypeError(std::format("must be real number, not {}", TypeName(value)));
    }

    int64_t ToInteger(const Value& value)
    {
        if (auto* i = value.TryAs<int64_t>())
        {
            return *i;
        }
        if (auto* b = value.TryAs<bool>())
        {
            return *b ? 1 : 0;
        }
        ThrowTypeError(std::format("'{}' object cannot be interpreted as an integer", TypeName(value)));
    }

    ValueList Materialize(const Value& iterable)
    {
        if (auto* list = iterable.Object<ListObject>())
        {
            return list->items;
        }
        if (auto* tuple = iterable.Object<TupleObject>())
        {
            return tuple->items;
        }
        if (auto* dict = iterable.Object<DictObject>())
        {
            ValueList keys;
            for (const auto& entry : dict->entries)
            {
                keys.push_back(entry.first);
            }
            return keys;
        }
        if (auto* range = iterable.TryAs<RangeValue>())
        {
            const int64_t length = range->Length();
            CheckSequenceLength(static_cast<uint64_t>(length));
            ValueList items;
            items.reserve(static_cast<size_t>(length));
            for (int64_t i = 0; i < length; ++i)
            {
                PollPreemption();
                items.emplace_back(range->At(i));
            }
            return items;
        }
        if (auto* series = iterable.Object<SeriesObject>())
        {
            return ArrayToValues(*series->data.values);
        }
        if (auto* frame = iterable.Object<FrameObject>())
        {
            return ValueList(frame->data.columns.begin(), frame->data.columns.end());
        }
        if (auto* text = iterable.TryAs<std::string>())
        {
            ValueList chars;
            for (char ch : *text)
            {
                chars.emplace_back(std::string(1, ch));
            }
            return chars;
        }
        if (auto* iterator = iterable.Object<IteratorObject>())
        {
            ValueList items;
            while (auto next = iterator->Next())
            {
                items.push_back(std::move(*next));
            }
            return items;
        }
        ThrowTypeError(std::format("'{}' object is not iterable", TypeName(iterable)));
    }

    void ForEachItem(const Value& iterable, const std::function<bool(const Value&)>& visit)
    {
        if (auto* range = iterable.TryAs<RangeValue>())
        {
            const int64_t length = range->Length();
            for (int64_t i = 0; i < length; ++i)
            {
                PollPreemption();
                if (!visit(Value{range->At(i)}))
                {
                    return;
                }
            }
            return;
        }
        for (const auto& item : Materialize(iterable))
        {
            PollPreemption();
            if (!visit(item))
            {
                return;
            }
        }
    }

} // namespace nlytics::sandbox
