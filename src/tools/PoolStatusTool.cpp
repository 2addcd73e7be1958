#include "tools/PoolStatusTool.hpp"

namespace ada_mcp {

PoolStatusTool::PoolStatusTool(std::shared_ptr<Broker> broker)
    : broker_(std::move(broker)) {
}

ToolInfo PoolStatusTool::get_info() {
    ToolInfo info;
    info.name = "ada_pool_status";
    info.description = "Show running Ada Language Server instances, their state and response cache statistics";
    info.input_schema = {
        {"type", "object"},
        {"properties", json::object()}
    };
    return info;
}

json PoolStatusTool::execute(const json& /*args*/) {
    return broker_->stats();
}

} // namespace ada_mcp
