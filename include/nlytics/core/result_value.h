#pragma once
//
// NLytics Result Value
//
// Tagged variant holding whatever a program bound to its result variable.
// Each admissible shape has its own strongly typed payload; the pipeline
// never interprets the payload, it only passes it to the insight consumer.
//

#include <epoch_frame/dataframe.h>
#include <epoch_frame/series.h>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <utility>
#include <variant>
#include <vector>

namespace nlytics
{
    struct ResultValue;

    // Whole table (possibly a filtered/sorted/aggregated view of the dataset)
    struct TabularFrame
    {
        epoch_frame::DataFrame frame;
    };

    // One column with its row labels (e.g. a group-by aggregate)
    struct LabeledSequence
    {
        epoch_frame::Series series;
        std::string name;
    };

    // Python-style scalar: None is represented by ResultValue::Empty instead
    using ScalarValue = std::variant<int64_t, double, std::string, bool>;

    // Insertion ordered key/value pairs; keys are rendered as text
    struct Mapping
    {
        std::vector<std::pair<std::string, ResultValue>> entries;
    };

    struct Sequence
    {
        std::vector<ResultValue> items;
    };

    struct Empty
    {
    };

    struct ResultValue
    {
        using Variant = std::variant<Empty, ScalarValue, TabularFrame, LabeledSequence, Mapping, Sequence>;

        Variant data{Empty{}};

        ResultValue() = default;
        ResultValue(Empty) {}
        ResultValue(ScalarValue scalar) : data(std::move(scalar)) {}
        ResultValue(TabularFrame frame) : data(std::move(frame)) {}
        ResultValue(LabeledSequence seq) : data(std::move(seq)) {}
        ResultValue(Mapping mapping) : data(std::move(mapping)) {}
        ResultValue(Sequence seq) : data(std::move(seq)) {}

        bool IsEmpty() const { return std::holds_alternative<Empty>(data); }
        bool IsScalar() const { return std::holds_alternative<ScalarValue>(data); }
        bool IsFrame() const { return std::holds_alternative<TabularFrame>(data); }
        bool IsLabeledSequence() const { return std::holds_alternative<LabeledSequence>(data); }
        bool IsMapping() const { return std::holds_alternative<Mapping>(data); }
        bool IsSequence() const { return std::holds_alternative<Sequence>(data); }

        const ScalarValue& GetScalar() const { return std::get<ScalarValue>(data); }
        const TabularFrame& GetFrame() const { return std::get<TabularFrame>(data); }
        const LabeledSequence& GetLabeledSequence() const { return std::get<LabeledSequence>(data); }
        const Mapping& GetMapping() const { return std::get<Mapping>(data); }
        const Sequence& GetSequence() const { return std::get<Sequence>(data); }

        // Numeric view of a scalar (int, float or bool); throws for anything else
        double AsNumber() const;

        // "TabularFrame", "LabeledSequence", "Scalar", "Mapping", "Sequence" or "Empty"
        std::string TypeName() const;
    };

    // Short single-line rendering used in feedback and display previews
    std::string ScalarToString(const ScalarValue& scalar);

    // Missing cells are nullopt
    using PreviewCell = std::optional<ScalarValue>;

    // Row-major head of a frame, shared by the display formatter and JSON output
    struct FramePreview
    {
        std::vector<std::string> columns;
        std::vector<PreviewCell> labels;
        std::vector<std::vector<PreviewCell>> rows;
        int64_t total_rows{0};
    };

    struct SequencePreview
    {
        std::string name;
        std::vector<PreviewCell> labels;
        std::vector<PreviewCell> values;
        int64_t total_items{0};
    };

    FramePreview PreviewFrame(const epoch_frame::DataFrame& frame, std::size_t maxRows);
    SequencePreview PreviewSequence(const LabeledSequence& sequence, std::size_t maxItems);

} // namespace nlytics
