#pragma once
//
// NLytics test fixtures: small in-memory datasets and the shipped config
//

#include <nlytics/config/pipeline_config.h>
#include <epoch_frame/factory/array_factory.h>
#include <epoch_frame/factory/dataframe_factory.h>
#include <epoch_frame/factory/index_factory.h>
#include <cstdint>
#include <string>
#include <vector>

namespace nlytics::test
{
    inline std::string ShippedConfigPath() { return std::string{NLYTICS_CONFIG_DIR} + "/nlytics.yaml"; }

    inline PipelineConfig ShippedConfig() { return LoadPipelineConfig(ShippedConfigPath()); }

    // {price: [10, 20, 30]}
    inline epoch_frame::DataFrame MakePriceDataset()
    {
        std::vector<arrow::ChunkedArrayPtr> arrays{
            epoch_frame::factory::array::make_array(std::vector<int64_t>{10, 20, 30})};
        return epoch_frame::make_dataframe(epoch_frame::factory::index::from_range(3), arrays, {"price"});
    }

    // Six sales rows over two regions and three products
    inline epoch_frame::DataFrame MakeSalesDataset()
    {
        std::vector<arrow::ChunkedArrayPtr> arrays{
            epoch_frame::factory::array::make_array(
                std::vector<std::string>{"north", "south", "north", "east", "south", "north"}),
            epoch_frame::factory::array::make_array(
                std::vector<std::string>{"widget", "gadget", "gizmo", "widget", "widget", "gadget"}),
            epoch_frame::factory::array::make_array(std::vector<double>{12.5, 30.0, 7.25, 12.5, 11.0, 28.0}),
            epoch_frame::factory::array::make_array(std::vector<int64_t>{4, 1, 10, 2, 6, 3}),
        };
        return epoch_frame::make_dataframe(epoch_frame::factory::index::from_range(6), arrays,
                                           {"region", "product", "price", "units"});
    }

} // namespace nlytics::test
