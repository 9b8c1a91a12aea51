//
// NLytics Result Conversion
//
// Boundary between epoch_frame and the sandbox runtime. The dataset enters
// as a private FrameData sharing the caller's immutable Arrow buffers; the
// result binding leaves as a ResultValue.
//

#pragma once

#include "value.h"
#include <epoch_frame/dataframe.h>
#include <nlytics/core/result_value.h>

namespace nlytics::sandbox
{
    FrameData FrameFromDataFrame(const epoch_frame::DataFrame& frame);

    // TypeError for values that have no result shape (modules, functions, ...)
    ResultValue ToResultValue(const Value& value);

    epoch_frame::DataFrame ToDataFrame(const FrameData& frame);
    epoch_frame::Series ToSeries(const SeriesData& series);

} // namespace nlytics::sandbox
