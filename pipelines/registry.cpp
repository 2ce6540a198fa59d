#include "sheetrun/pipeline.h"

namespace sheetrun {

std::unique_ptr<Pipeline> make_pipeline(const std::string& name) {
    if (name == "builtin.csv_mapper") return make_csv_mapper_pipeline();
    if (name == "command") return make_command_pipeline();
    return nullptr;
}

} // namespace sheetrun
