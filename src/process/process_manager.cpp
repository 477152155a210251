#include "process/process_manager.hpp"

#include "utils/common.hpp"

namespace execbox::process {

nlohmann::ordered_json ToJson(const ProcessInfo& info) {
    nlohmann::ordered_json json = {
        {"process_id", info.process_id},
        {"command", info.command},
        {"args", info.args},
        {"cwd", info.cwd},
        {"created_at", utils::FormatTimestamp(info.created_at)},
        {"is_running", info.is_running},
        {"exit_code", nullptr}
    };
    if (info.exit_code) {
        json["exit_code"] = *info.exit_code;
    }
    return json;
}

}  // namespace execbox::process
