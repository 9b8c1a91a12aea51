//
// NLytics Sandbox Values
//
// Runtime values of the sandbox VM. Containers, frames and series are boxed
// in shared_ptr so that two names can refer to the same object, as they do
// in Python. Column data is held as immutable Arrow arrays, so replacing a
// column never touches the arrays another frame still references.
//

#pragma once

#include <arrow/api.h>
#include <cstdint>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <utility>
#include <variant>
#include <vector>

namespace nlytics::sandbox
{
    using ArrayPtr = std::shared_ptr<arrow::Array>;

    // Columns of equal length plus one array of row labels
    struct FrameData
    {
        std::vector<std::string> columns;
        std::vector<ArrayPtr> arrays;
        ArrayPtr labels;
        std::string indexName;

        int64_t NumRows() const { return labels ? labels->length() : 0; }
        std::optional<size_t> FindColumn(const std::string& name) const;
    };

    struct SeriesData
    {
        ArrayPtr values;
        ArrayPtr labels;
        std::optional<std::string> name;
        std::string indexName;

        int64_t Size() const { return values ? values->length() : 0; }
    };

    class Value;
    class ExecutionContext;
    struct CallArgs;

    struct ListObject;
    struct TupleObject;
    struct DictObject;
    struct FrameObject;
    struct SeriesObject;
    struct GroupByObject;
    struct IndexerObject;
    struct ModuleObject;
    struct BuiltinFunction;
    struct BoundMethod;
    struct DisallowedStub;
    struct IteratorObject;

    struct SliceValue
    {
        std::optional<int64_t> start;
        std::optional<int64_t> stop;
        std::optional<int64_t> step;
    };

    struct RangeValue
    {
        int64_t start{0};
        int64_t stop{0};
        int64_t step{1};

        int64_t Length() const;
        // Modular arithmetic: every in-range element fits even when i * step does not
        int64_t At(int64_t i) const
        {
            return static_cast<int64_t>(static_cast<uint64_t>(start) +
                                        static_cast<uint64_t>(i) * static_cast<uint64_t>(step));
        }
    };

    class Value
    {
    public:
        using Variant = std::variant<std::monostate,
                                     bool,
                                     int64_t,
                                     double,
                                     std::string,
                                     std::shared_ptr<ListObject>,
                                     std::shared_ptr<TupleObject>,
                                     std::shared_ptr<DictObject>,
                                     SliceValue,
                                     std::shared_ptr<FrameObject>,
                                     std::shared_ptr<SeriesObject>,
                                     std::shared_ptr<GroupByObject>,
                                     std::shared_ptr<IndexerObject>,
                                     std::shared_ptr<ModuleObject>,
                                     std::shared_ptr<BuiltinFunction>,
                                     std::shared_ptr<BoundMethod>,
                                     std::shared_ptr<DisallowedStub>,
                                     RangeValue,
                                     std::shared_ptr<IteratorObject>>;

        Value() = default;
        Value(bool v) : m_data(v) {}
        Value(int64_t v) : m_data(v) {}
        Value(int v) : m_data(static_cast<int64_t>(v)) {}
        Value(double v) : m_data(v) {}
        Value(std::string v) : m_data(std::move(v)) {}
        Value(const char* v) : m_data(std::string{v}) {}
        Value(SliceValue v) : m_data(v) {}
        Value(RangeValue v) : m_data(v) {}

        template <typename T>
        Value(std::shared_ptr<T> object) : m_data(std::move(object))
        {
        }

        template <typename T>
        bool Is() const
        {
            return std::holds_alternative<T>(m_data);
        }

        template <typename T>
        const T& As() const
        {
            return std::get<T>(m_data);
        }

        template <typename T>
        const T* TryAs() const
        {
            return std::get_if<T>(&m_data);
        }

        // Object payload of a boxed type, null when the value holds something else
        template <typename T>
        T* Object() const
        {
            auto* ptr = std::get_if<std::shared_ptr<T>>(&m_data);
            return ptr ? ptr->get() : nullptr;
        }

        bool IsNone() const { return Is<std::monostate>(); }
        bool IsNumber() const { return Is<bool>() || Is<int64_t>() || Is<double>(); }
        bool IsString() const { return Is<std::string>(); }

        const Variant& Data() const { return m_data; }

        static Value None() { return Value{}; }

    private:
        Variant m_data;
    };

    using ValueList = std::vector<Value>;

    struct ListObject
    {
        ValueList items;
    };

    struct TupleObject
    {
        ValueList items;
    };

    // Insertion ordered; keys compared with Python equality
    struct DictObject
    {
        std::vector<std::pair<Value, Value>> entries;

        const Value* Find(const Value& key) const;
        void Set(const Value& key, Value value);
    };

    struct FrameObject
    {
        FrameData data;
    };

    struct SeriesObject
    {
        SeriesData data;
    };

    struct GroupByObject
    {
        FrameData frame;
        std::string key;
        std::vector<std::string> selection; // empty selects every non-key column
        bool selectsSeries{false};          // gb['col'] rather than gb[['col']]
    };

    struct IndexerObject
    {
        bool positional; // iloc when true, loc otherwise
        Value target;    // frame or series
    };

    struct ModuleObject
    {
        std::string name; // canonical module name (pandas, numpy)
    };

    using NativeFunction = Value (*)(ExecutionContext&, const CallArgs&);
    using NativeMethod = Value (*)(ExecutionContext&, const Value& self, const CallArgs&);

    struct BuiltinFunction
    {
        std::string name;
        NativeFunction fn;
    };

    struct BoundMethod
    {
        Value self;
        std::string name;
        NativeMethod fn;
    };

    struct DisallowedStub
    {
        std::string name;
    };

    struct IteratorObject
    {
        std::variant<RangeValue, ValueList> source;
        int64_t position{0};

        std::optional<Value> Next();
    };

    // ---- Construction helpers ----
    Value MakeList(ValueList items);
    Value MakeTuple(ValueList items);
    Value MakeDict();
    Value MakeFrame(FrameData data);
    Value MakeSeries(SeriesData data);

    // ---- Python protocol ----
    std::string TypeName(const Value& value);
    std::string Repr(const Value& value);
    std::string Str(const Value& value);
    bool Truthy(const Value& value);
    bool ValuesEqual(const Value& a, const Value& b);
    double ToNumber(const Value& value);  // bool, int or float; TypeError otherwise
    int64_t ToInteger(const Value& value); // bool or int; TypeError otherwise

    // Python repr of a float: 60.0, 0.1, nan, inf
    std::string FormatFloat(double value);

    // Elements of a list, tuple, range, dict (keys), series or string
    ValueList Materialize(const Value& iterable);

    // Visits items in order without copying ranges; stops when visit returns false
    void ForEachItem(const Value& iterable, const std::function<bool(const Value&)>& visit);

} // namespace nlytics::sandbox
